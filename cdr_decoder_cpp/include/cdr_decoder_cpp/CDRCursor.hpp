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
#ifndef CDR_DECODER_CPP__CDRCURSOR_HPP_
#define CDR_DECODER_CPP__CDRCURSOR_HPP_

#include <array>
#include <cstdint>
#include <cstring>
#include <string>

#include "cdr_decoder_cpp/bytewise.hpp"
#include "cdr_decoder_cpp/exceptions.hpp"

namespace cdr_decoder_cpp
{

/// aka ENC_HEADER
struct EncapsulationHeader
{
  /// whether the payload started with a recognised header
  bool m_present = false;
  /// first two bytes, read big-endian
  uint16_t m_identifier = 0;
  /// stream endianness
  endian m_endian = endian::little;
  /// encoding options, ignored
  std::array<uint8_t, 2> m_options{{0, 0}};
};

/// Identifiers of the plain CDR encapsulations we accept.
constexpr uint16_t ENCAPSULATION_CDR_BE = 0x0000;
constexpr uint16_t ENCAPSULATION_CDR_LE = 0x0001;
constexpr size_t ENCAPSULATION_HEADER_SIZE = 4;

/// Inspect the start of a payload. Anything other than a plain CDR header is reported as absent.
EncapsulationHeader read_encapsulation_header(const void * data, size_t size);

/// Read position over a borrowed, immutable CDR payload.
///
/// Alignment is measured from the origin, which sits just past the encapsulation header
/// when there is one. The offset never leaves [0, size]; any read or padding that would
/// move it past the end throws BufferUnderrunException and leaves the offset unchanged.
class CDRReadCursor
{
public:
  /// Parses the encapsulation header. Without one the payload is taken as raw little-endian
  /// data, unless strict_encapsulation is set, in which case InvalidEncodingException is thrown.
  CDRReadCursor(const void * data, size_t size, bool strict_encapsulation = false);

  // don't want to accidentally copy
  CDRReadCursor(CDRReadCursor const &) = delete;
  void operator=(CDRReadCursor const & x) = delete;

  size_t offset() const {return m_offset;}
  size_t size() const {return m_size;}
  size_t remaining() const {return m_size - m_offset;}
  size_t origin() const {return m_origin;}
  const EncapsulationHeader & encapsulation() const {return m_header;}
  endian stream_endian() const {return m_header.m_endian;}
  bool swap_bytes() const {return m_header.m_endian != native_endian();}
  const uint8_t * position() const {return m_data + m_offset;}

  /// Throws unless n_bytes more bytes can be read.
  void require(size_t n_bytes) const
  {
    if (n_bytes > remaining()) {
      throw BufferUnderrunException(
              "need " + std::to_string(n_bytes) + " bytes at offset " +
              std::to_string(m_offset) + " but only " + std::to_string(remaining()) +
              " remain");
    }
  }

  /// Throws unless count elements of at least el_size bytes each can still fit.
  void require_many(size_t count, size_t el_size) const
  {
    if (el_size == 0) {
      el_size = 1;
    }
    if (count > remaining() / el_size) {
      throw BufferUnderrunException(
              "length prefix " + std::to_string(count) + " at offset " +
              std::to_string(m_offset) + " exceeds the " + std::to_string(remaining()) +
              " remaining bytes");
    }
  }

  void advance(size_t n_bytes)
  {
    require(n_bytes);
    m_offset += n_bytes;
  }

  void align(size_t n_bytes)
  {
    if (n_bytes <= 1) {
      return;
    }
    size_t misalignment = (m_offset - m_origin) % n_bytes;
    if (misalignment != 0) {
      advance(n_bytes - misalignment);
    }
  }

  void get_bytes(void * dest, size_t n_bytes)
  {
    if (n_bytes == 0) {
      return;
    }
    require(n_bytes);
    std::memcpy(dest, position(), n_bytes);
    m_offset += n_bytes;
  }

private:
  const uint8_t * m_data;
  size_t m_size;
  size_t m_offset;
  size_t m_origin;
  EncapsulationHeader m_header;
};

}  // namespace cdr_decoder_cpp

#endif  // CDR_DECODER_CPP__CDRCURSOR_HPP_
