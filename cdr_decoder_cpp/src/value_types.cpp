// Copyright 2026 The cdr_decoder_cpp Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#include "cdr_decoder_cpp/value_types.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace cdr_decoder_cpp
{
namespace
{
struct PrimitiveInfo
{
  PrimitiveKind kind;
  const char * name;
  size_t width;
  bool is_signed;
  bool is_float;
};

constexpr PrimitiveInfo primitive_infos[] = {
  {PrimitiveKind::INT8, "Int8", 1, true, false},
  {PrimitiveKind::UINT8, "UInt8", 1, false, false},
  {PrimitiveKind::INT16, "Int16", 2, true, false},
  {PrimitiveKind::UINT16, "UInt16", 2, false, false},
  {PrimitiveKind::INT32, "Int32", 4, true, false},
  {PrimitiveKind::UINT32, "UInt32", 4, false, false},
  {PrimitiveKind::INT64, "Int64", 8, true, false},
  {PrimitiveKind::UINT64, "UInt64", 8, false, false},
  {PrimitiveKind::FLOAT32, "Float32", 4, true, true},
  {PrimitiveKind::FLOAT64, "Float64", 8, true, true},
  {PrimitiveKind::BOOLEAN, "Bool", 1, false, false},
};

const PrimitiveInfo & info(PrimitiveKind kind)
{
  for (const auto & i : primitive_infos) {
    if (i.kind == kind) {
      return i;
    }
  }
  unreachable();
}
}  // namespace

size_t primitive_width(PrimitiveKind kind) {return info(kind).width;}
bool primitive_is_signed(PrimitiveKind kind) {return info(kind).is_signed;}
bool primitive_is_float(PrimitiveKind kind) {return info(kind).is_float;}
bool primitive_is_bool(PrimitiveKind kind) {return kind == PrimitiveKind::BOOLEAN;}
const char * to_string(PrimitiveKind kind) {return info(kind).name;}

bool primitive_kind_from_string(const std::string & name, PrimitiveKind * kind)
{
  for (const auto & i : primitive_infos) {
    if (name == i.name) {
      *kind = i.kind;
      return true;
    }
  }
  return false;
}

ArrayValueType::ArrayValueType(std::vector<const AnyValueType *> element_value_types)
: m_element_value_types(std::move(element_value_types)), m_min_wire_size(0)
{
  for (auto element_value_type : m_element_value_types) {
    if (!element_value_type) {
      throw std::invalid_argument("tuple element value type is null");
    }
    m_min_wire_size += element_value_type->min_wire_size();
  }
}

ArrayValueType::ArrayValueType(const AnyValueType * element_value_type, size_t size)
: ArrayValueType(std::vector<const AnyValueType *>(size, element_value_type))
{
}

SpanSequenceValueType::SpanSequenceValueType(const AnyValueType * element_value_type)
: m_element_value_type(element_value_type)
{
  if (!m_element_value_type) {
    throw std::invalid_argument("sequence element value type is null");
  }
}

StructValueType::StructValueType(std::string name)
: m_name(std::move(name)), m_members{}, m_inner_value_types{}, m_validator{},
  m_min_wire_size(0)
{
}

const Member * StructValueType::find_member(const std::string & name) const
{
  for (const auto & member : m_members) {
    if (member.name == name) {
      return &member;
    }
  }
  return nullptr;
}

const AnyValueType * StructValueType::adopt_value_type(
  std::unique_ptr<const AnyValueType> value_type)
{
  m_inner_value_types.push_back(std::move(value_type));
  return m_inner_value_types.back().get();
}

void StructValueType::add_member(std::string name, const AnyValueType * value_type)
{
  if (!value_type) {
    throw std::invalid_argument("member value type is null");
  }
  if (find_member(name)) {
    throw UnsupportedSchemaException(
            "record '" + m_name + "' declares member '" + name + "' more than once");
  }
  m_min_wire_size += value_type->min_wire_size();
  m_members.push_back(Member{std::move(name), value_type});
}

}  // namespace cdr_decoder_cpp
