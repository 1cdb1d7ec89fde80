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
#ifndef CDR_TEST_BUFFER_HPP_
#define CDR_TEST_BUFFER_HPP_

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include "cdr_decoder_cpp/bytewise.hpp"

namespace cdr_decoder_cpp
{
namespace test
{

/// Assembles CDR payloads byte by byte, padding each value the way a CDR writer would.
class CDRTestBuffer
{
public:
  explicit CDRTestBuffer(endian e = endian::little, bool with_header = true)
  : m_endian(e), m_origin(with_header ? 4 : 0)
  {
    if (with_header) {
      raw({0x00, static_cast<uint8_t>(e == endian::big ? 0x00 : 0x01), 0x00, 0x00});
    }
  }

  CDRTestBuffer & raw(std::vector<uint8_t> bytes)
  {
    m_bytes.insert(m_bytes.end(), bytes.begin(), bytes.end());
    return *this;
  }

  CDRTestBuffer & align(size_t n)
  {
    while ((m_bytes.size() - m_origin) % n != 0) {
      m_bytes.push_back(0);
    }
    return *this;
  }

  CDRTestBuffer & u8(uint8_t x) {return put(x, 1);}
  CDRTestBuffer & i8(int8_t x) {return put(static_cast<uint8_t>(x), 1);}
  CDRTestBuffer & boolean(bool x) {return put(x ? 1 : 0, 1);}
  CDRTestBuffer & u16(uint16_t x) {return put(x, 2);}
  CDRTestBuffer & i16(int16_t x) {return put(static_cast<uint16_t>(x), 2);}
  CDRTestBuffer & u32(uint32_t x) {return put(x, 4);}
  CDRTestBuffer & i32(int32_t x) {return put(static_cast<uint32_t>(x), 4);}
  CDRTestBuffer & u64(uint64_t x) {return put(x, 8);}
  CDRTestBuffer & i64(int64_t x) {return put(static_cast<uint64_t>(x), 8);}

  CDRTestBuffer & f32(float x)
  {
    uint32_t bits;
    std::memcpy(&bits, &x, sizeof(bits));
    return put(bits, 4);
  }

  CDRTestBuffer & f64(double x)
  {
    uint64_t bits;
    std::memcpy(&bits, &x, sizeof(bits));
    return put(bits, 8);
  }

  /// length includes the terminating NUL
  CDRTestBuffer & string(const std::string & s)
  {
    u32(static_cast<uint32_t>(s.size() + 1));
    m_bytes.insert(m_bytes.end(), s.begin(), s.end());
    m_bytes.push_back(0);
    return *this;
  }

  CDRTestBuffer & blob(const std::vector<uint8_t> & b)
  {
    u32(static_cast<uint32_t>(b.size()));
    return raw(b);
  }

  const std::vector<uint8_t> & bytes() const {return m_bytes;}
  const uint8_t * data() const {return m_bytes.data();}
  size_t size() const {return m_bytes.size();}

private:
  CDRTestBuffer & put(uint64_t x, size_t width)
  {
    align(width);
    for (size_t i = 0; i < width; i++) {
      size_t shift = 8 * (m_endian == endian::little ? i : width - 1 - i);
      m_bytes.push_back(static_cast<uint8_t>(x >> shift));
    }
    return *this;
  }

  endian m_endian;
  size_t m_origin;
  std::vector<uint8_t> m_bytes;
};

}  // namespace test
}  // namespace cdr_decoder_cpp

#endif  // CDR_TEST_BUFFER_HPP_
