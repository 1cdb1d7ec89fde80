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
#ifndef CDR_DECODER_CPP__DESERIALIZATION_HPP_
#define CDR_DECODER_CPP__DESERIALIZATION_HPP_

#include <cstddef>
#include <cstdint>

#include "cdr_decoder_cpp/CDRCursor.hpp"
#include "cdr_decoder_cpp/dynamic_value.hpp"
#include "cdr_decoder_cpp/options.hpp"
#include "cdr_decoder_cpp/ret_types.h"
#include "cdr_decoder_cpp/value_types.hpp"
#include "rmw/serialized_message.h"

namespace cdr_decoder_cpp
{

/// Walks a value type over a CDR payload and builds the decoded value.
///
/// Members are read strictly in declared order since CDR carries no field tags.
/// All failures are DeserializationException subclasses; nothing partially decoded
/// escapes a failed call.
class CDRReader
{
public:
  explicit CDRReader(DecoderOptions options = DecoderOptions{});

  /// Parse the encapsulation header of data and decode one record. Bytes after the
  /// record are ignored.
  DynamicValue deserialize_top_level(
    const StructValueType & value_type, const void * data, size_t size) const;

  DynamicValue deserialize(CDRReadCursor & cursor, const AnyValueType & value_type) const;

  const DecoderOptions & options() const {return m_options;}

protected:
  DynamicValue deserialize(CDRReadCursor & cursor, const PrimitiveValueType & value_type) const;
  DynamicValue deserialize(CDRReadCursor & cursor, const U8StringValueType & value_type) const;
  DynamicValue deserialize(CDRReadCursor & cursor, const ByteBlobValueType & value_type) const;
  DynamicValue deserialize(CDRReadCursor & cursor, const ArrayValueType & value_type) const;
  DynamicValue deserialize(
    CDRReadCursor & cursor, const SpanSequenceValueType & value_type) const;
  DynamicValue deserialize(CDRReadCursor & cursor, const StructValueType & value_type) const;

private:
  DecoderOptions m_options;
};

/// Decode with default options.
DynamicValue deserialize_top_level(
  const StructValueType & value_type, const void * data, size_t size);

/// True if the bytes are well-formed UTF-8 (no overlongs, surrogates or values past U+10FFFF).
bool is_valid_utf8(const uint8_t * data, size_t size);

cdr_decoder_ret_t convert_error_kind_to_ret(DecodeErrorKind kind);

/// Non-throwing entry point for serialized messages handed over by a log reader.
///
/// On success the decoded record is stored in *result. On failure *result is left
/// untouched, the error message is set (see rcutils_get_error_string()) and the
/// returned code tells the kind of failure apart.
cdr_decoder_ret_t deserialize_serialized_message(
  const rmw_serialized_message_t * serialized_message,
  const StructValueType * value_type,
  DynamicValue * result,
  const DecoderOptions & options = DecoderOptions{});

}  // namespace cdr_decoder_cpp

#endif  // CDR_DECODER_CPP__DESERIALIZATION_HPP_
