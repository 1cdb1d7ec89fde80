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
#ifndef CDR_DECODER_CPP__PRIMITIVE_CODEC_HPP_
#define CDR_DECODER_CPP__PRIMITIVE_CODEC_HPP_

#include <cstdint>

#include "cdr_decoder_cpp/CDRCursor.hpp"
#include "cdr_decoder_cpp/dynamic_value.hpp"
#include "cdr_decoder_cpp/value_types.hpp"

namespace cdr_decoder_cpp
{

/// Align to the primitive's width, read it in the stream byte order and advance.
/// Booleans are a single byte where any nonzero value is true.
DynamicValue read_primitive(CDRReadCursor & cursor, PrimitiveKind kind);

inline DynamicValue read_primitive(CDRReadCursor & cursor, const PrimitiveValueType & value_type)
{
  return read_primitive(cursor, value_type.kind());
}

/// The 4-byte aligned uint32 prefix of strings, byte blobs and sequences.
uint32_t read_length(CDRReadCursor & cursor);

uint8_t read_u8(CDRReadCursor & cursor);
uint16_t read_u16(CDRReadCursor & cursor);
uint32_t read_u32(CDRReadCursor & cursor);
uint64_t read_u64(CDRReadCursor & cursor);

}  // namespace cdr_decoder_cpp

#endif  // CDR_DECODER_CPP__PRIMITIVE_CODEC_HPP_
