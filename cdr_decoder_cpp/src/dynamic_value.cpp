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
#include "cdr_decoder_cpp/dynamic_value.hpp"

#include <cinttypes>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

namespace cdr_decoder_cpp
{

DynamicValue::DynamicValue()
: m_kind(Kind::RECORD), m_primitive_kind(PrimitiveKind::UINT8), m_scalar{}
{
}

DynamicValue DynamicValue::make_bool(bool value)
{
  DynamicValue v;
  v.m_kind = Kind::BOOLEAN;
  v.m_primitive_kind = PrimitiveKind::BOOLEAN;
  v.m_scalar.b = value;
  return v;
}

DynamicValue DynamicValue::make_signed(PrimitiveKind kind, int64_t value)
{
  DynamicValue v;
  v.m_kind = Kind::INTEGER;
  v.m_primitive_kind = kind;
  v.m_scalar.i = value;
  return v;
}

DynamicValue DynamicValue::make_unsigned(PrimitiveKind kind, uint64_t value)
{
  DynamicValue v;
  v.m_kind = Kind::UNSIGNED;
  v.m_primitive_kind = kind;
  v.m_scalar.u = value;
  return v;
}

DynamicValue DynamicValue::make_float(PrimitiveKind kind, double value)
{
  DynamicValue v;
  v.m_kind = Kind::FLOAT;
  v.m_primitive_kind = kind;
  v.m_scalar.f = value;
  return v;
}

DynamicValue DynamicValue::make_string(std::string value)
{
  DynamicValue v;
  v.m_kind = Kind::STRING;
  v.m_string = std::move(value);
  return v;
}

DynamicValue DynamicValue::make_bytes(std::vector<uint8_t> value)
{
  DynamicValue v;
  v.m_kind = Kind::BYTES;
  v.m_bytes = std::move(value);
  return v;
}

DynamicValue DynamicValue::make_sequence(std::vector<DynamicValue> elements)
{
  DynamicValue v;
  v.m_kind = Kind::SEQUENCE;
  v.m_elements = std::move(elements);
  return v;
}

DynamicValue DynamicValue::make_tuple(std::vector<DynamicValue> elements)
{
  DynamicValue v;
  v.m_kind = Kind::TUPLE;
  v.m_elements = std::move(elements);
  return v;
}

DynamicValue DynamicValue::make_record(
  std::vector<std::string> field_names, std::vector<DynamicValue> field_values)
{
  if (field_names.size() != field_values.size()) {
    throw std::invalid_argument("record field names and values differ in count");
  }
  DynamicValue v;
  v.m_kind = Kind::RECORD;
  v.m_field_names = std::move(field_names);
  v.m_elements = std::move(field_values);
  return v;
}

bool DynamicValue::is_scalar() const
{
  switch (m_kind) {
    case Kind::BOOLEAN:
    case Kind::INTEGER:
    case Kind::UNSIGNED:
    case Kind::FLOAT:
      return true;
    case Kind::STRING:
    case Kind::BYTES:
    case Kind::SEQUENCE:
    case Kind::TUPLE:
    case Kind::RECORD:
      return false;
  }
  unreachable();
}

PrimitiveKind DynamicValue::primitive_kind() const
{
  if (!is_scalar()) {
    reject("scalar");
  }
  return m_primitive_kind;
}

bool DynamicValue::as_bool() const
{
  if (m_kind != Kind::BOOLEAN) {
    reject("boolean");
  }
  return m_scalar.b;
}

int64_t DynamicValue::as_int64() const
{
  return as<int64_t>();
}

uint64_t DynamicValue::as_uint64() const
{
  return as<uint64_t>();
}

double DynamicValue::as_double() const
{
  switch (m_kind) {
    case Kind::FLOAT:
      return m_scalar.f;
    case Kind::INTEGER:
      return static_cast<double>(m_scalar.i);
    case Kind::UNSIGNED:
      return static_cast<double>(m_scalar.u);
    default:
      reject("number");
  }
}

const std::string & DynamicValue::as_string() const
{
  if (m_kind != Kind::STRING) {
    reject("string");
  }
  return m_string;
}

const std::vector<uint8_t> & DynamicValue::as_bytes() const
{
  if (m_kind != Kind::BYTES) {
    reject("bytes");
  }
  return m_bytes;
}

const std::vector<DynamicValue> & DynamicValue::elements() const
{
  if (m_kind != Kind::SEQUENCE && m_kind != Kind::TUPLE && m_kind != Kind::RECORD) {
    reject("collection");
  }
  return m_elements;
}

const DynamicValue & DynamicValue::operator[](size_t index) const
{
  const auto & e = elements();
  if (index >= e.size()) {
    throw ValueRejectedException(
            "index " + std::to_string(index) + " is out of range for " + kind_name() +
            " of size " + std::to_string(e.size()));
  }
  return e[index];
}

const std::vector<std::string> & DynamicValue::field_names() const
{
  if (m_kind != Kind::RECORD) {
    reject("record");
  }
  return m_field_names;
}

bool DynamicValue::has_field(const std::string & name) const
{
  for (const auto & field_name : field_names()) {
    if (field_name == name) {
      return true;
    }
  }
  return false;
}

const DynamicValue & DynamicValue::at(const std::string & name) const
{
  const auto & names = field_names();
  for (size_t i = 0; i < names.size(); i++) {
    if (names[i] == name) {
      return m_elements[i];
    }
  }
  throw ValueRejectedException("record has no field '" + name + "'");
}

bool DynamicValue::operator==(const DynamicValue & other) const
{
  if (m_kind != other.m_kind) {
    return false;
  }
  switch (m_kind) {
    case Kind::BOOLEAN:
      return m_scalar.b == other.m_scalar.b;
    case Kind::INTEGER:
      return m_scalar.i == other.m_scalar.i;
    case Kind::UNSIGNED:
      return m_scalar.u == other.m_scalar.u;
    case Kind::FLOAT:
      return m_scalar.f == other.m_scalar.f;
    case Kind::STRING:
      return m_string == other.m_string;
    case Kind::BYTES:
      return m_bytes == other.m_bytes;
    case Kind::SEQUENCE:
    case Kind::TUPLE:
      return m_elements == other.m_elements;
    case Kind::RECORD:
      return m_field_names == other.m_field_names && m_elements == other.m_elements;
  }
  unreachable();
}

const char * DynamicValue::kind_name() const
{
  switch (m_kind) {
    case Kind::BOOLEAN:
      return "boolean";
    case Kind::INTEGER:
      return "signed integer";
    case Kind::UNSIGNED:
      return "unsigned integer";
    case Kind::FLOAT:
      return "float";
    case Kind::STRING:
      return "string";
    case Kind::BYTES:
      return "bytes";
    case Kind::SEQUENCE:
      return "sequence";
    case Kind::TUPLE:
      return "tuple";
    case Kind::RECORD:
      return "record";
  }
  unreachable();
}

void DynamicValue::reject(const char * wanted) const
{
  throw ValueRejectedException(std::string("expected ") + wanted + " but got " + kind_name());
}

namespace
{
void print(std::string & out, const DynamicValue & value)
{
  char buf[64];
  switch (value.kind()) {
    case DynamicValue::Kind::BOOLEAN:
      out += value.as_bool() ? "true" : "false";
      return;
    case DynamicValue::Kind::INTEGER:
      std::snprintf(buf, sizeof(buf), "%" PRId64, value.as_int64());
      out += buf;
      return;
    case DynamicValue::Kind::UNSIGNED:
      std::snprintf(buf, sizeof(buf), "%" PRIu64, value.as_uint64());
      out += buf;
      return;
    case DynamicValue::Kind::FLOAT:
      std::snprintf(buf, sizeof(buf), "%g", value.as_double());
      out += buf;
      return;
    case DynamicValue::Kind::STRING:
      out += '"';
      out += value.as_string();
      out += '"';
      return;
    case DynamicValue::Kind::BYTES:
      out += "<" + std::to_string(value.as_bytes().size()) + " bytes>";
      return;
    case DynamicValue::Kind::SEQUENCE:
    case DynamicValue::Kind::TUPLE: {
        const bool is_tuple = value.kind() == DynamicValue::Kind::TUPLE;
        out += is_tuple ? '(' : '[';
        for (size_t i = 0; i < value.size(); i++) {
          if (i != 0) {out += ", ";}
          print(out, value[i]);
        }
        out += is_tuple ? ')' : ']';
      }
      return;
    case DynamicValue::Kind::RECORD: {
        out += '{';
        const auto & names = value.field_names();
        for (size_t i = 0; i < names.size(); i++) {
          if (i != 0) {out += ", ";}
          out += names[i];
          out += ": ";
          print(out, value[i]);
        }
        out += '}';
      }
      return;
  }
}
}  // namespace

std::string to_string(const DynamicValue & value)
{
  std::string out;
  print(out, value);
  return out;
}

}  // namespace cdr_decoder_cpp
