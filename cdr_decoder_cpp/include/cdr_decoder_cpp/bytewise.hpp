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
#ifndef CDR_DECODER_CPP__BYTEWISE_HPP_
#define CDR_DECODER_CPP__BYTEWISE_HPP_

#include <cstddef>
#include <cstdint>

#include "dds/ddsrt/endian.h"

namespace cdr_decoder_cpp
{
using std::size_t;

enum class endian
{
  little = DDSRT_LITTLE_ENDIAN,
  big = DDSRT_BIG_ENDIAN,
};

constexpr endian native_endian() {return endian(DDSRT_ENDIAN);}

inline uint16_t bswap2u(uint16_t x)
{
  return (uint16_t) ((x >> 8) | (x << 8));
}
inline uint32_t bswap4u(uint32_t x)
{
  return (x >> 24) | ((x >> 8) & 0xff00) | ((x << 8) & 0xff0000) | (x << 24);
}
inline uint64_t bswap8u(uint64_t x)
{
  const uint32_t newhi = bswap4u((uint32_t) x);
  const uint32_t newlo = bswap4u((uint32_t) (x >> 32));
  return ((uint64_t) newhi << 32) | (uint64_t) newlo;
}

}  // namespace cdr_decoder_cpp

#endif  // CDR_DECODER_CPP__BYTEWISE_HPP_
