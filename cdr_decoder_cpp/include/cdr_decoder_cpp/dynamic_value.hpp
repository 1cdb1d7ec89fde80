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
#ifndef CDR_DECODER_CPP__DYNAMIC_VALUE_HPP_
#define CDR_DECODER_CPP__DYNAMIC_VALUE_HPP_

#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "cdr_decoder_cpp/exceptions.hpp"
#include "cdr_decoder_cpp/value_types.hpp"

namespace cdr_decoder_cpp
{

/// A decoded value: scalar, text, bytes, ordered collection or record.
///
/// Records keep their fields in declared order. Accessors throw ValueRejectedException
/// when the value is not of the requested kind or does not fit the requested type.
class DynamicValue
{
public:
  enum class Kind
  {
    BOOLEAN,
    INTEGER,
    UNSIGNED,
    FLOAT,
    STRING,
    BYTES,
    SEQUENCE,
    TUPLE,
    RECORD,
  };

  /// An empty record.
  DynamicValue();

  static DynamicValue make_bool(bool value);
  static DynamicValue make_signed(PrimitiveKind kind, int64_t value);
  static DynamicValue make_unsigned(PrimitiveKind kind, uint64_t value);
  static DynamicValue make_float(PrimitiveKind kind, double value);
  static DynamicValue make_string(std::string value);
  static DynamicValue make_bytes(std::vector<uint8_t> value);
  static DynamicValue make_sequence(std::vector<DynamicValue> elements);
  static DynamicValue make_tuple(std::vector<DynamicValue> elements);
  static DynamicValue make_record(
    std::vector<std::string> field_names, std::vector<DynamicValue> field_values);

  Kind kind() const {return m_kind;}
  bool is_scalar() const;
  /// Wire type the scalar was read as.
  PrimitiveKind primitive_kind() const;

  bool as_bool() const;
  int64_t as_int64() const;
  uint64_t as_uint64() const;
  double as_double() const;
  const std::string & as_string() const;
  const std::vector<uint8_t> & as_bytes() const;

  /// Elements of a SEQUENCE or TUPLE, or field values of a RECORD.
  const std::vector<DynamicValue> & elements() const;
  size_t size() const {return elements().size();}
  const DynamicValue & operator[](size_t index) const;

  const std::vector<std::string> & field_names() const;
  bool has_field(const std::string & name) const;
  const DynamicValue & at(const std::string & name) const;

  /// Checked conversion to a host type.
  template<typename T>
  T as() const
  {
    return convert(static_cast<T *>(nullptr));
  }

  bool operator==(const DynamicValue & other) const;
  bool operator!=(const DynamicValue & other) const {return !(*this == other);}

private:
  const char * kind_name() const;
  [[noreturn]] void reject(const char * wanted) const;

  template<typename T>
  typename std::enable_if<std::is_integral<T>::value && !std::is_same<T, bool>::value, T>::type
  convert(T *) const
  {
    if (m_kind == Kind::INTEGER) {
      const int64_t v = m_scalar.i;
      const bool fits = std::is_signed<T>::value ?
        (v >= static_cast<int64_t>(std::numeric_limits<T>::min()) &&
        v <= static_cast<int64_t>(std::numeric_limits<T>::max())) :
        (v >= 0 &&
        static_cast<uint64_t>(v) <= static_cast<uint64_t>(std::numeric_limits<T>::max()));
      if (!fits) {
        throw ValueRejectedException(std::to_string(v) + " is out of range for the target type");
      }
      return static_cast<T>(v);
    }
    if (m_kind == Kind::UNSIGNED) {
      const uint64_t v = m_scalar.u;
      if (v > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
        throw ValueRejectedException(std::to_string(v) + " is out of range for the target type");
      }
      return static_cast<T>(v);
    }
    reject("integer");
  }

  template<typename T>
  typename std::enable_if<std::is_floating_point<T>::value, T>::type
  convert(T *) const
  {
    return static_cast<T>(as_double());
  }

  bool convert(bool *) const {return as_bool();}
  std::string convert(std::string *) const {return as_string();}
  std::vector<uint8_t> convert(std::vector<uint8_t> *) const {return as_bytes();}

  Kind m_kind;
  PrimitiveKind m_primitive_kind;
  union Scalar
  {
    bool b;
    int64_t i;
    uint64_t u;
    double f;
  } m_scalar;
  std::string m_string;
  std::vector<uint8_t> m_bytes;
  std::vector<DynamicValue> m_elements;
  std::vector<std::string> m_field_names;
};

/// Compact single-line rendering, e.g. {sec: 1, nsec: 2, frame_id: "cam"}.
std::string to_string(const DynamicValue & value);

}  // namespace cdr_decoder_cpp

#endif  // CDR_DECODER_CPP__DYNAMIC_VALUE_HPP_
