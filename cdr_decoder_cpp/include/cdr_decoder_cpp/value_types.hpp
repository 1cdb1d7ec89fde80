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
#ifndef CDR_DECODER_CPP__VALUE_TYPES_HPP_
#define CDR_DECODER_CPP__VALUE_TYPES_HPP_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "cdr_decoder_cpp/exceptions.hpp"

namespace cdr_decoder_cpp
{
class DynamicValue;

/// Fixed-width wire types. Alignment always equals width.
enum class PrimitiveKind : uint8_t
{
  INT8,
  UINT8,
  INT16,
  UINT16,
  INT32,
  UINT32,
  INT64,
  UINT64,
  FLOAT32,
  FLOAT64,
  BOOLEAN,
};

size_t primitive_width(PrimitiveKind kind);
bool primitive_is_signed(PrimitiveKind kind);
bool primitive_is_float(PrimitiveKind kind);
bool primitive_is_bool(PrimitiveKind kind);

/// Name as written in schemas and configuration, e.g. "UInt32", "Float64".
const char * to_string(PrimitiveKind kind);
/// Inverse of to_string(PrimitiveKind). Returns false for unknown names.
bool primitive_kind_from_string(const std::string & name, PrimitiveKind * kind);

enum class EValueType
{
  PrimitiveValueType,
  U8StringValueType,
  ByteBlobValueType,
  ArrayValueType,
  SpanSequenceValueType,
  StructValueType,
};

struct AnyValueType
{
  // represents the wire encoding of one value, independent of any host type
  virtual ~AnyValueType() = default;

  // represents the logical value type
  virtual EValueType e_value_type() const = 0;

  // fewest bytes an encoded value can occupy, not counting leading alignment
  virtual size_t min_wire_size() const = 0;
};

class PrimitiveValueType : public AnyValueType
{
  const PrimitiveKind m_kind;

public:
  explicit PrimitiveValueType(PrimitiveKind kind)
  : m_kind(kind) {}

  PrimitiveKind kind() const {return m_kind;}
  size_t width() const {return primitive_width(m_kind);}
  size_t alignment() const {return width();}
  bool is_signed() const {return primitive_is_signed(m_kind);}
  bool is_float() const {return primitive_is_float(m_kind);}
  bool is_bool() const {return primitive_is_bool(m_kind);}

  size_t min_wire_size() const final {return width();}
  EValueType e_value_type() const final {return EValueType::PrimitiveValueType;}
};

/// Length-prefixed, NUL-terminated UTF-8 text.
class U8StringValueType : public AnyValueType
{
public:
  size_t min_wire_size() const final {return sizeof(uint32_t);}
  EValueType e_value_type() const final {return EValueType::U8StringValueType;}
};

/// Length-prefixed opaque bytes, no terminator.
class ByteBlobValueType : public AnyValueType
{
public:
  size_t min_wire_size() const final {return sizeof(uint32_t);}
  EValueType e_value_type() const final {return EValueType::ByteBlobValueType;}
};

/// Fixed tuple: elements back to back, arity known from the schema.
class ArrayValueType : public AnyValueType
{
protected:
  std::vector<const AnyValueType *> m_element_value_types;
  size_t m_min_wire_size;

public:
  explicit ArrayValueType(std::vector<const AnyValueType *> element_value_types);
  ArrayValueType(const AnyValueType * element_value_type, size_t size);

  size_t array_size() const {return m_element_value_types.size();}
  const AnyValueType * element_value_type(size_t index) const
  {
    return m_element_value_types.at(index);
  }
  size_t min_wire_size() const final {return m_min_wire_size;}
  EValueType e_value_type() const final {return EValueType::ArrayValueType;}
};

class SpanSequenceValueType : public AnyValueType
{
protected:
  const AnyValueType * m_element_value_type;

public:
  explicit SpanSequenceValueType(const AnyValueType * element_value_type);

  const AnyValueType * element_value_type() const {return m_element_value_type;}
  size_t min_wire_size() const final {return sizeof(uint32_t);}
  EValueType e_value_type() const final {return EValueType::SpanSequenceValueType;}
};

struct Member
{
  std::string name;
  const AnyValueType * value_type;
};

/// A record: named members in declared (= wire) order.
/// Owns every value type reachable from its members.
class StructValueType : public AnyValueType
{
public:
  /// Runs once the record's fields are decoded; throws ValueRejectedException to refuse them.
  using Validator = std::function<void (const DynamicValue &)>;

  explicit StructValueType(std::string name);
  StructValueType(const StructValueType &) = delete;
  StructValueType & operator=(const StructValueType &) = delete;

  const std::string & name() const {return m_name;}
  size_t n_members() const {return m_members.size();}
  const Member * get_member(size_t index) const {return &m_members.at(index);}
  const Member * find_member(const std::string & name) const;

  const Validator & validator() const {return m_validator;}
  void set_validator(Validator validator) {m_validator = std::move(validator);}

  size_t min_wire_size() const final {return m_min_wire_size;}
  EValueType e_value_type() const final {return EValueType::StructValueType;}

  template<typename ConstructedType, typename ... Args>
  ConstructedType * make_value_type(Args && ... args)
  {
    auto unique_ptr = std::make_unique<ConstructedType>(std::forward<Args>(args)...);
    auto ptr = unique_ptr.get();
    m_inner_value_types.push_back(std::move(unique_ptr));
    return ptr;
  }

  const AnyValueType * adopt_value_type(std::unique_ptr<const AnyValueType> value_type);

  /// Appends a member. Duplicate names are an UnsupportedSchemaException.
  void add_member(std::string name, const AnyValueType * value_type);

protected:
  std::string m_name;
  std::vector<Member> m_members;
  std::vector<std::unique_ptr<const AnyValueType>> m_inner_value_types;
  Validator m_validator;
  size_t m_min_wire_size;
};

}  // namespace cdr_decoder_cpp

#endif  // CDR_DECODER_CPP__VALUE_TYPES_HPP_
