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
#include "cdr_decoder_cpp/primitive_codec.hpp"

#include <cstdint>
#include <cstring>
#include <limits>

#include "cdr_decoder_cpp/bytewise.hpp"

namespace cdr_decoder_cpp
{

#define DESER8(T, name) DESER(T, name, )
#define DESER(T, name, fn_swap) T name(CDRReadCursor & cursor) \
  { \
    T x; \
    cursor.align(sizeof(x)); \
    cursor.get_bytes(&x, sizeof(x)); \
    if (cursor.swap_bytes()) {x = fn_swap(x);} \
    return x; \
  }
DESER8(uint8_t, read_u8)
DESER(uint16_t, read_u16, bswap2u)
DESER(uint32_t, read_u32, bswap4u)
DESER(uint64_t, read_u64, bswap8u)
#undef DESER
#undef DESER8

uint32_t read_length(CDRReadCursor & cursor)
{
  return read_u32(cursor);
}

DynamicValue read_primitive(CDRReadCursor & cursor, PrimitiveKind kind)
{
  static_assert(std::numeric_limits<float>::is_iec559, "float is not IEEE 754");
  static_assert(std::numeric_limits<double>::is_iec559, "double is not IEEE 754");

  switch (kind) {
    case PrimitiveKind::BOOLEAN:
      return DynamicValue::make_bool(read_u8(cursor) != 0);
    case PrimitiveKind::UINT8:
      return DynamicValue::make_unsigned(kind, read_u8(cursor));
    case PrimitiveKind::INT8:
      return DynamicValue::make_signed(kind, static_cast<int8_t>(read_u8(cursor)));
    case PrimitiveKind::UINT16:
      return DynamicValue::make_unsigned(kind, read_u16(cursor));
    case PrimitiveKind::INT16:
      return DynamicValue::make_signed(kind, static_cast<int16_t>(read_u16(cursor)));
    case PrimitiveKind::UINT32:
      return DynamicValue::make_unsigned(kind, read_u32(cursor));
    case PrimitiveKind::INT32:
      return DynamicValue::make_signed(kind, static_cast<int32_t>(read_u32(cursor)));
    case PrimitiveKind::UINT64:
      return DynamicValue::make_unsigned(kind, read_u64(cursor));
    case PrimitiveKind::INT64:
      return DynamicValue::make_signed(kind, static_cast<int64_t>(read_u64(cursor)));
    case PrimitiveKind::FLOAT32: {
        uint32_t bits = read_u32(cursor);
        float f;
        std::memcpy(&f, &bits, sizeof(f));
        return DynamicValue::make_float(kind, f);
      }
    case PrimitiveKind::FLOAT64: {
        uint64_t bits = read_u64(cursor);
        double d;
        std::memcpy(&d, &bits, sizeof(d));
        return DynamicValue::make_float(kind, d);
      }
  }
  unreachable();
}

}  // namespace cdr_decoder_cpp
