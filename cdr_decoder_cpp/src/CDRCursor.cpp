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
#include "cdr_decoder_cpp/CDRCursor.hpp"

#include <cinttypes>
#include <cstdio>

namespace cdr_decoder_cpp
{

EncapsulationHeader read_encapsulation_header(const void * data, size_t size)
{
  EncapsulationHeader header;
  if (data == nullptr || size < ENCAPSULATION_HEADER_SIZE) {
    return header;
  }
  auto bytes = static_cast<const uint8_t *>(data);
  header.m_identifier = static_cast<uint16_t>((bytes[0] << 8) | bytes[1]);
  header.m_options = {{bytes[2], bytes[3]}};
  switch (header.m_identifier) {
    case ENCAPSULATION_CDR_BE:
      header.m_present = true;
      header.m_endian = endian::big;
      break;
    case ENCAPSULATION_CDR_LE:
      header.m_present = true;
      header.m_endian = endian::little;
      break;
    default:
      // PL_CDR, XCDR2 and friends are not understood; treat the payload as raw
      header.m_present = false;
      header.m_endian = endian::little;
      break;
  }
  return header;
}

CDRReadCursor::CDRReadCursor(const void * data, size_t size, bool strict_encapsulation)
: m_data(static_cast<const uint8_t *>(data)), m_size(data ? size : 0), m_offset(0), m_origin(0),
  m_header(read_encapsulation_header(data, size))
{
  if (m_header.m_present) {
    m_offset = ENCAPSULATION_HEADER_SIZE;
    m_origin = ENCAPSULATION_HEADER_SIZE;
  } else if (strict_encapsulation) {
    if (m_size < ENCAPSULATION_HEADER_SIZE) {
      throw InvalidEncodingException(
              "payload of " + std::to_string(m_size) +
              " bytes is too short for an encapsulation header");
    }
    char identifier[8];
    std::snprintf(identifier, sizeof(identifier), "0x%04" PRIx16, m_header.m_identifier);
    throw InvalidEncodingException(
            std::string("unsupported encapsulation identifier ") + identifier);
  }
}

}  // namespace cdr_decoder_cpp
