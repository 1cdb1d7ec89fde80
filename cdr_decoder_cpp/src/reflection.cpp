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
#include "cdr_decoder_cpp/reflection.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "cdr_decoder_cpp/exceptions.hpp"
#include "cdr_decoder_cpp/options.hpp"
#include "rcutils/logging_macros.h"

namespace cdr_decoder_cpp
{

DeclaredType::DeclaredType(Kind kind)
: m_kind(kind), m_primitive_kind(PrimitiveKind::UINT8), m_elements{}, m_record{}, m_type_name{}
{
}

DeclaredType DeclaredType::primitive(PrimitiveKind kind)
{
  DeclaredType t(Kind::PRIMITIVE);
  t.m_primitive_kind = kind;
  return t;
}

DeclaredType DeclaredType::sequence_of(DeclaredType element)
{
  DeclaredType t(Kind::SEQUENCE);
  t.m_elements.push_back(std::move(element));
  return t;
}

DeclaredType DeclaredType::tuple_of(std::vector<DeclaredType> elements)
{
  DeclaredType t(Kind::TUPLE);
  t.m_elements = std::move(elements);
  return t;
}

DeclaredType DeclaredType::open_tuple_of(DeclaredType element)
{
  DeclaredType t(Kind::OPEN_TUPLE);
  t.m_elements.push_back(std::move(element));
  return t;
}

DeclaredType DeclaredType::optional(DeclaredType inner)
{
  DeclaredType t(Kind::OPTIONAL);
  t.m_elements.push_back(std::move(inner));
  return t;
}

DeclaredType DeclaredType::record(RecordSpec spec)
{
  DeclaredType t(Kind::RECORD);
  t.m_record = std::make_shared<const RecordSpec>(std::move(spec));
  return t;
}

DeclaredType DeclaredType::opaque(std::string type_name)
{
  DeclaredType t(Kind::OPAQUE);
  t.m_type_name = std::move(type_name);
  return t;
}

const RecordSpec & DeclaredType::record_spec() const
{
  if (m_kind != Kind::RECORD || !m_record) {
    throw std::logic_error("declared type is not a record");
  }
  return *m_record;
}

std::string DeclaredType::describe() const
{
  auto join = [this]() {
      std::string s;
      for (size_t i = 0; i < m_elements.size(); i++) {
        if (i != 0) {s += ", ";}
        s += m_elements[i].describe();
      }
      return s;
    };

  switch (m_kind) {
    case Kind::PRIMITIVE:
      return to_string(m_primitive_kind);
    case Kind::NATIVE_INT:
      return "int";
    case Kind::NATIVE_FLOAT:
      return "float";
    case Kind::NATIVE_BOOL:
      return "bool";
    case Kind::STRING:
      return "str";
    case Kind::BYTES:
      return "bytes";
    case Kind::BYTE_BUFFER:
      return "bytearray";
    case Kind::SEQUENCE:
      return "Sequence[" + join() + "]";
    case Kind::TUPLE:
      return "Tuple[" + join() + "]";
    case Kind::OPEN_TUPLE:
      return "Tuple[" + join() + ", ...]";
    case Kind::OPTIONAL:
      return "Optional[" + join() + "]";
    case Kind::RECORD:
      return m_record->name();
    case Kind::OPAQUE:
      return m_type_name;
  }
  unreachable();
}

RecordSpec::RecordSpec(std::string name)
: m_name(std::move(name)), m_fields{}, m_validator{}
{
}

RecordSpec & RecordSpec::field(std::string name, DeclaredType type)
{
  m_fields.emplace_back(std::move(name), std::move(type));
  return *this;
}

RecordSpec & RecordSpec::validate(StructValueType::Validator validator)
{
  m_validator = std::move(validator);
  return *this;
}

namespace
{
[[noreturn]] void unsupported(
  const StructValueType & owner, const std::string & field, const DeclaredType & type,
  const char * reason)
{
  throw UnsupportedSchemaException(
          "record '" + owner.name() + "' field '" + field + "': " + type.describe() + " " +
          reason);
}

const AnyValueType * describe_type(
  StructValueType & owner, const std::string & field, const DeclaredType & type,
  const ReflectionDefaults & defaults)
{
  switch (type.kind()) {
    case DeclaredType::Kind::PRIMITIVE:
      return owner.make_value_type<PrimitiveValueType>(type.primitive_kind());
    case DeclaredType::Kind::NATIVE_INT:
      return owner.make_value_type<PrimitiveValueType>(defaults.native_int);
    case DeclaredType::Kind::NATIVE_FLOAT:
      return owner.make_value_type<PrimitiveValueType>(defaults.native_float);
    case DeclaredType::Kind::NATIVE_BOOL:
      return owner.make_value_type<PrimitiveValueType>(PrimitiveKind::BOOLEAN);
    case DeclaredType::Kind::STRING:
      return owner.make_value_type<U8StringValueType>();
    case DeclaredType::Kind::BYTES:
    case DeclaredType::Kind::BYTE_BUFFER:
      return owner.make_value_type<ByteBlobValueType>();
    case DeclaredType::Kind::SEQUENCE:
      return owner.make_value_type<SpanSequenceValueType>(
        describe_type(owner, field, type.elements().front(), defaults));
    case DeclaredType::Kind::TUPLE: {
        std::vector<const AnyValueType *> element_value_types;
        element_value_types.reserve(type.elements().size());
        for (const auto & element : type.elements()) {
          element_value_types.push_back(describe_type(owner, field, element, defaults));
        }
        return owner.make_value_type<ArrayValueType>(std::move(element_value_types));
      }
    case DeclaredType::Kind::RECORD:
      return owner.adopt_value_type(reflect_record(type.record_spec()));
    case DeclaredType::Kind::OPEN_TUPLE:
      unsupported(owner, field, type, "has no CDR representation; use a Sequence");
    case DeclaredType::Kind::OPTIONAL:
      unsupported(
        owner, field, type,
        "is not supported by raw CDR; add an explicit presence flag");
    case DeclaredType::Kind::OPAQUE:
      unsupported(owner, field, type, "is not a supported field type");
  }
  unreachable();
}
}  // namespace

std::unique_ptr<StructValueType> reflect_record(const RecordSpec & spec)
{
  const ReflectionDefaults defaults = get_reflection_defaults();
  auto value_type = std::make_unique<StructValueType>(spec.name());
  for (const auto & field : spec.fields()) {
    value_type->add_member(
      field.first, describe_type(*value_type, field.first, field.second, defaults));
  }
  value_type->set_validator(spec.validator());
  RCUTILS_LOG_DEBUG_NAMED(
    "cdr_decoder_cpp", "reflected record '%s' with %zu members",
    spec.name().c_str(), value_type->n_members());
  return value_type;
}

}  // namespace cdr_decoder_cpp
