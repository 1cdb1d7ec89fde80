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
#include "cdr_decoder_cpp/Deserialization.hpp"

#include <exception>
#include <string>
#include <utility>
#include <vector>

#include "cdr_decoder_cpp/primitive_codec.hpp"
#include "rcutils/logging_macros.h"
#include "rmw/error_handling.h"

namespace cdr_decoder_cpp
{

CDRReader::CDRReader(DecoderOptions options)
: m_options(options)
{
}

DynamicValue CDRReader::deserialize_top_level(
  const StructValueType & value_type, const void * data, size_t size) const
{
  CDRReadCursor cursor(data, size, m_options.strict_encapsulation);
  if (!cursor.encapsulation().m_present) {
    RCUTILS_LOG_DEBUG_NAMED(
      "cdr_decoder_cpp", "'%s': no plain CDR encapsulation header, reading %zu bytes as raw "
      "little-endian", value_type.name().c_str(), size);
  }
  return deserialize(cursor, value_type);
}

DynamicValue CDRReader::deserialize(
  CDRReadCursor & cursor, const PrimitiveValueType & value_type) const
{
  return read_primitive(cursor, value_type);
}

DynamicValue CDRReader::deserialize(CDRReadCursor & cursor, const U8StringValueType &) const
{
  const uint32_t size = read_length(cursor);
  cursor.require(size);
  const uint8_t * start = cursor.position();
  size_t n_chars = size;
  if (n_chars > 0 && start[n_chars - 1] == '\0') {
    n_chars--;
  }
  if (!is_valid_utf8(start, n_chars)) {
    throw InvalidEncodingException(
            "string at offset " + std::to_string(cursor.offset()) + " is not valid UTF-8");
  }
  std::string value(reinterpret_cast<const char *>(start), n_chars);
  cursor.advance(size);
  return DynamicValue::make_string(std::move(value));
}

DynamicValue CDRReader::deserialize(CDRReadCursor & cursor, const ByteBlobValueType &) const
{
  const uint32_t size = read_length(cursor);
  cursor.require(size);
  std::vector<uint8_t> value(cursor.position(), cursor.position() + size);
  cursor.advance(size);
  return DynamicValue::make_bytes(std::move(value));
}

DynamicValue CDRReader::deserialize(CDRReadCursor & cursor, const ArrayValueType & value_type) const
{
  std::vector<DynamicValue> elements;
  elements.reserve(value_type.array_size());
  for (size_t i = 0; i < value_type.array_size(); i++) {
    elements.push_back(deserialize(cursor, *value_type.element_value_type(i)));
  }
  return DynamicValue::make_tuple(std::move(elements));
}

DynamicValue CDRReader::deserialize(
  CDRReadCursor & cursor, const SpanSequenceValueType & value_type) const
{
  const uint32_t size = read_length(cursor);
  auto element_value_type = value_type.element_value_type();
  // reject a bogus count before allocating anything for it
  cursor.require_many(size, element_value_type->min_wire_size());
  std::vector<DynamicValue> elements;
  elements.reserve(size);
  for (uint32_t i = 0; i < size; i++) {
    elements.push_back(deserialize(cursor, *element_value_type));
  }
  return DynamicValue::make_sequence(std::move(elements));
}

DynamicValue CDRReader::deserialize(
  CDRReadCursor & cursor, const StructValueType & value_type) const
{
  std::vector<std::string> names;
  std::vector<DynamicValue> values;
  names.reserve(value_type.n_members());
  values.reserve(value_type.n_members());
  for (size_t i = 0; i < value_type.n_members(); i++) {
    auto member = value_type.get_member(i);
    values.push_back(deserialize(cursor, *member->value_type));
    names.push_back(member->name);
  }
  DynamicValue record = DynamicValue::make_record(std::move(names), std::move(values));

  if (value_type.validator()) {
    try {
      value_type.validator()(record);
    } catch (const DeserializationException &) {
      throw;
    } catch (const std::exception & e) {
      throw ValueRejectedException(
              "record '" + value_type.name() + "' rejected its values: " + e.what());
    }
  }
  return record;
}

DynamicValue CDRReader::deserialize(CDRReadCursor & cursor, const AnyValueType & value_type) const
{
  switch (value_type.e_value_type()) {
    case EValueType::PrimitiveValueType:
      return deserialize(cursor, static_cast<const PrimitiveValueType &>(value_type));
    case EValueType::U8StringValueType:
      return deserialize(cursor, static_cast<const U8StringValueType &>(value_type));
    case EValueType::ByteBlobValueType:
      return deserialize(cursor, static_cast<const ByteBlobValueType &>(value_type));
    case EValueType::ArrayValueType:
      return deserialize(cursor, static_cast<const ArrayValueType &>(value_type));
    case EValueType::SpanSequenceValueType:
      return deserialize(cursor, static_cast<const SpanSequenceValueType &>(value_type));
    case EValueType::StructValueType:
      return deserialize(cursor, static_cast<const StructValueType &>(value_type));
  }
  unreachable();
}

DynamicValue deserialize_top_level(
  const StructValueType & value_type, const void * data, size_t size)
{
  return CDRReader().deserialize_top_level(value_type, data, size);
}

bool is_valid_utf8(const uint8_t * data, size_t size)
{
  size_t i = 0;
  while (i < size) {
    const uint8_t c = data[i];
    if (c < 0x80) {
      i++;
      continue;
    }
    size_t n_continuation;
    uint32_t code_point;
    if ((c & 0xe0) == 0xc0) {
      n_continuation = 1;
      code_point = c & 0x1f;
    } else if ((c & 0xf0) == 0xe0) {
      n_continuation = 2;
      code_point = c & 0x0f;
    } else if ((c & 0xf8) == 0xf0) {
      n_continuation = 3;
      code_point = c & 0x07;
    } else {
      return false;
    }
    if (n_continuation > size - i - 1) {
      return false;
    }
    for (size_t k = 1; k <= n_continuation; k++) {
      const uint8_t cc = data[i + k];
      if ((cc & 0xc0) != 0x80) {
        return false;
      }
      code_point = (code_point << 6) | (cc & 0x3f);
    }
    static const uint32_t min_code_point[] = {0, 0x80, 0x800, 0x10000};
    if (code_point < min_code_point[n_continuation] || code_point > 0x10ffff ||
      (code_point >= 0xd800 && code_point <= 0xdfff))
    {
      return false;
    }
    i += n_continuation + 1;
  }
  return true;
}

cdr_decoder_ret_t convert_error_kind_to_ret(DecodeErrorKind kind)
{
  switch (kind) {
    case DecodeErrorKind::BufferUnderrun:
      return CDR_DECODER_RET_BUFFER_UNDERRUN;
    case DecodeErrorKind::InvalidEncoding:
      return CDR_DECODER_RET_INVALID_ENCODING;
    case DecodeErrorKind::UnsupportedSchema:
      return CDR_DECODER_RET_UNSUPPORTED_SCHEMA;
    case DecodeErrorKind::ValueRejected:
      return CDR_DECODER_RET_VALUE_REJECTED;
  }
  unreachable();
}

cdr_decoder_ret_t deserialize_serialized_message(
  const rmw_serialized_message_t * serialized_message,
  const StructValueType * value_type,
  DynamicValue * result,
  const DecoderOptions & options)
{
  if (!serialized_message) {
    RMW_SET_ERROR_MSG("serialized message handle is null");
    return CDR_DECODER_RET_INVALID_ARGUMENT;
  }
  if (!value_type) {
    RMW_SET_ERROR_MSG("value type is null");
    return CDR_DECODER_RET_INVALID_ARGUMENT;
  }
  if (!result) {
    RMW_SET_ERROR_MSG("result is null");
    return CDR_DECODER_RET_INVALID_ARGUMENT;
  }
  try {
    *result = CDRReader(options).deserialize_top_level(
      *value_type, serialized_message->buffer, serialized_message->buffer_length);
    return CDR_DECODER_RET_OK;
  } catch (const DeserializationException & e) {
    RMW_SET_ERROR_MSG_WITH_FORMAT_STRING(
      "deserialize_serialized_message: %s: %s", to_string(e.kind()), e.what());
    return convert_error_kind_to_ret(e.kind());
  } catch (const std::exception & e) {
    RMW_SET_ERROR_MSG_WITH_FORMAT_STRING("deserialize_serialized_message: %s", e.what());
    return CDR_DECODER_RET_ERROR;
  }
}

}  // namespace cdr_decoder_cpp
