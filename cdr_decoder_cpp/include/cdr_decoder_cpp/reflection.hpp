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
#ifndef CDR_DECODER_CPP__REFLECTION_HPP_
#define CDR_DECODER_CPP__REFLECTION_HPP_

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "cdr_decoder_cpp/value_types.hpp"

namespace cdr_decoder_cpp
{
class RecordSpec;

/// The declared type of a record field, before it is mapped to a wire encoding.
///
/// Not every declarable type has a CDR encoding: optional fields, open-ended tuples
/// and opaque host types are accepted here and rejected by reflect_record().
class DeclaredType
{
public:
  enum class Kind
  {
    /// explicitly annotated fixed-width type
    PRIMITIVE,
    /// bare native integer, floating point or boolean; wire type from ReflectionDefaults
    NATIVE_INT,
    NATIVE_FLOAT,
    NATIVE_BOOL,
    STRING,
    BYTES,
    BYTE_BUFFER,
    SEQUENCE,
    TUPLE,
    /// zero or more elements of one type, with no length prefix
    OPEN_TUPLE,
    OPTIONAL,
    RECORD,
    /// a host type with no mapping at all
    OPAQUE,
  };

  static DeclaredType primitive(PrimitiveKind kind);
  static DeclaredType native_int() {return DeclaredType(Kind::NATIVE_INT);}
  static DeclaredType native_float() {return DeclaredType(Kind::NATIVE_FLOAT);}
  static DeclaredType native_bool() {return DeclaredType(Kind::NATIVE_BOOL);}
  static DeclaredType string() {return DeclaredType(Kind::STRING);}
  static DeclaredType bytes() {return DeclaredType(Kind::BYTES);}
  static DeclaredType byte_buffer() {return DeclaredType(Kind::BYTE_BUFFER);}
  static DeclaredType sequence_of(DeclaredType element);
  static DeclaredType tuple_of(std::vector<DeclaredType> elements);
  static DeclaredType open_tuple_of(DeclaredType element);
  static DeclaredType optional(DeclaredType inner);
  static DeclaredType record(RecordSpec spec);
  static DeclaredType opaque(std::string type_name);

  Kind kind() const {return m_kind;}
  PrimitiveKind primitive_kind() const {return m_primitive_kind;}
  const std::vector<DeclaredType> & elements() const {return m_elements;}
  const RecordSpec & record_spec() const;

  /// Human readable form used in error messages, e.g. "Sequence[UInt32]".
  std::string describe() const;

private:
  explicit DeclaredType(Kind kind);

  Kind m_kind;
  PrimitiveKind m_primitive_kind;
  std::vector<DeclaredType> m_elements;
  std::shared_ptr<const RecordSpec> m_record;
  std::string m_type_name;
};

/// Declarative description of a record: field names and types in wire order.
class RecordSpec
{
public:
  explicit RecordSpec(std::string name);

  RecordSpec & field(std::string name, DeclaredType type);
  RecordSpec & validate(StructValueType::Validator validator);

  const std::string & name() const {return m_name;}
  const std::vector<std::pair<std::string, DeclaredType>> & fields() const {return m_fields;}
  const StructValueType::Validator & validator() const {return m_validator;}

private:
  std::string m_name;
  std::vector<std::pair<std::string, DeclaredType>> m_fields;
  StructValueType::Validator m_validator;
};

/// Map a record declaration to its wire description.
/// Throws UnsupportedSchemaException naming the first field with no CDR encoding.
std::unique_ptr<StructValueType> reflect_record(const RecordSpec & spec);

/// Shorthands for field declarations.
namespace cdr
{
inline DeclaredType Int8() {return DeclaredType::primitive(PrimitiveKind::INT8);}
inline DeclaredType UInt8() {return DeclaredType::primitive(PrimitiveKind::UINT8);}
inline DeclaredType Int16() {return DeclaredType::primitive(PrimitiveKind::INT16);}
inline DeclaredType UInt16() {return DeclaredType::primitive(PrimitiveKind::UINT16);}
inline DeclaredType Int32() {return DeclaredType::primitive(PrimitiveKind::INT32);}
inline DeclaredType UInt32() {return DeclaredType::primitive(PrimitiveKind::UINT32);}
inline DeclaredType Int64() {return DeclaredType::primitive(PrimitiveKind::INT64);}
inline DeclaredType UInt64() {return DeclaredType::primitive(PrimitiveKind::UINT64);}
inline DeclaredType Float32() {return DeclaredType::primitive(PrimitiveKind::FLOAT32);}
inline DeclaredType Float64() {return DeclaredType::primitive(PrimitiveKind::FLOAT64);}
inline DeclaredType Bool() {return DeclaredType::primitive(PrimitiveKind::BOOLEAN);}
inline DeclaredType Str() {return DeclaredType::string();}
inline DeclaredType Bytes() {return DeclaredType::bytes();}
inline DeclaredType Sequence(DeclaredType element)
{
  return DeclaredType::sequence_of(std::move(element));
}
inline DeclaredType Tuple(std::vector<DeclaredType> elements)
{
  return DeclaredType::tuple_of(std::move(elements));
}
inline DeclaredType Optional(DeclaredType inner) {return DeclaredType::optional(std::move(inner));}
inline DeclaredType Record(RecordSpec spec) {return DeclaredType::record(std::move(spec));}
}  // namespace cdr

}  // namespace cdr_decoder_cpp

#endif  // CDR_DECODER_CPP__REFLECTION_HPP_
