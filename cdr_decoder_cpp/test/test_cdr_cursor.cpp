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
#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <vector>

#include "cdr_decoder_cpp/CDRCursor.hpp"
#include "cdr_decoder_cpp/primitive_codec.hpp"
#include "cdr_test_buffer.hpp"

using cdr_decoder_cpp::BufferUnderrunException;
using cdr_decoder_cpp::CDRReadCursor;
using cdr_decoder_cpp::InvalidEncodingException;
using cdr_decoder_cpp::endian;
using cdr_decoder_cpp::test::CDRTestBuffer;

TEST(CDRCursor, little_endian_header) {
  std::vector<uint8_t> payload{0x00, 0x01, 0x00, 0x00, 0x2a, 0x00, 0x00, 0x00};
  CDRReadCursor cursor(payload.data(), payload.size());
  EXPECT_TRUE(cursor.encapsulation().m_present);
  EXPECT_EQ(cursor.stream_endian(), endian::little);
  EXPECT_EQ(cursor.offset(), 4u);
  EXPECT_EQ(cursor.origin(), 4u);
  EXPECT_EQ(cdr_decoder_cpp::read_u32(cursor), 42u);
  EXPECT_EQ(cursor.remaining(), 0u);
}

TEST(CDRCursor, big_endian_header) {
  std::vector<uint8_t> payload{0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x2a};
  CDRReadCursor cursor(payload.data(), payload.size());
  EXPECT_TRUE(cursor.encapsulation().m_present);
  EXPECT_EQ(cursor.stream_endian(), endian::big);
  EXPECT_EQ(cdr_decoder_cpp::read_u32(cursor), 42u);
}

TEST(CDRCursor, options_bytes_are_ignored) {
  std::vector<uint8_t> payload{0x00, 0x01, 0xab, 0xcd, 0x07, 0x00};
  CDRReadCursor cursor(payload.data(), payload.size());
  EXPECT_TRUE(cursor.encapsulation().m_present);
  EXPECT_EQ(cursor.encapsulation().m_options[0], 0xab);
  EXPECT_EQ(cursor.encapsulation().m_options[1], 0xcd);
  EXPECT_EQ(cdr_decoder_cpp::read_u16(cursor), 7u);
}

TEST(CDRCursor, unknown_identifier_is_raw_little_endian) {
  std::vector<uint8_t> payload{0x2a, 0x00, 0x00, 0x00};
  CDRReadCursor cursor(payload.data(), payload.size());
  EXPECT_FALSE(cursor.encapsulation().m_present);
  EXPECT_EQ(cursor.encapsulation().m_identifier, 0x2a00);
  EXPECT_EQ(cursor.stream_endian(), endian::little);
  EXPECT_EQ(cursor.offset(), 0u);
  EXPECT_EQ(cursor.origin(), 0u);
  EXPECT_EQ(cdr_decoder_cpp::read_u32(cursor), 42u);
}

TEST(CDRCursor, short_payload_is_raw) {
  std::vector<uint8_t> payload{0x00, 0x01};
  CDRReadCursor cursor(payload.data(), payload.size());
  EXPECT_FALSE(cursor.encapsulation().m_present);
  EXPECT_EQ(cursor.offset(), 0u);
  EXPECT_EQ(cdr_decoder_cpp::read_u16(cursor), 0x0100u);
}

TEST(CDRCursor, strict_encapsulation) {
  std::vector<uint8_t> unknown{0x00, 0x02, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
  EXPECT_THROW(CDRReadCursor(unknown.data(), unknown.size(), true), InvalidEncodingException);

  std::vector<uint8_t> too_short{0x00};
  EXPECT_THROW(
    CDRReadCursor(too_short.data(), too_short.size(), true), InvalidEncodingException);

  std::vector<uint8_t> plain{0x00, 0x01, 0x00, 0x00};
  EXPECT_NO_THROW(CDRReadCursor(plain.data(), plain.size(), true));
}

TEST(CDRCursor, alignment_is_relative_to_origin) {
  auto buf = CDRTestBuffer().u8(1).u32(42);
  ASSERT_EQ(buf.size(), 12u);
  CDRReadCursor cursor(buf.data(), buf.size());
  EXPECT_EQ(cdr_decoder_cpp::read_u8(cursor), 1u);
  EXPECT_EQ(cursor.offset(), 5u);
  cursor.align(4);
  EXPECT_EQ(cursor.offset(), 8u);
  cursor.align(4);
  EXPECT_EQ(cursor.offset(), 8u);
  EXPECT_EQ(cdr_decoder_cpp::read_u32(cursor), 42u);
}

TEST(CDRCursor, padding_past_end_is_underrun) {
  std::vector<uint8_t> payload{0x00, 0x01, 0x00, 0x00, 0x01, 0x00};
  CDRReadCursor cursor(payload.data(), payload.size());
  cursor.advance(1);
  EXPECT_THROW(cursor.align(4), BufferUnderrunException);
  EXPECT_EQ(cursor.offset(), 5u);
}

TEST(CDRCursor, failed_read_leaves_offset) {
  std::vector<uint8_t> payload{0x00, 0x01, 0x00, 0x00, 0x01, 0x02};
  CDRReadCursor cursor(payload.data(), payload.size());
  EXPECT_THROW(cdr_decoder_cpp::read_u32(cursor), BufferUnderrunException);
  EXPECT_EQ(cursor.offset(), 4u);
  EXPECT_EQ(cdr_decoder_cpp::read_u16(cursor), 0x0201u);
}

TEST(CDRCursor, require_many) {
  // leading 0xff keeps the payload from reading as an encapsulation header
  std::vector<uint8_t> payload(16, 0);
  payload[0] = 0xff;
  CDRReadCursor cursor(payload.data(), payload.size());
  ASSERT_FALSE(cursor.encapsulation().m_present);
  EXPECT_NO_THROW(cursor.require_many(4, 4));
  EXPECT_THROW(cursor.require_many(5, 4), BufferUnderrunException);
  EXPECT_NO_THROW(cursor.require_many(16, 0));
  EXPECT_THROW(cursor.require_many(17, 0), BufferUnderrunException);
  EXPECT_THROW(
    cursor.require_many(std::numeric_limits<size_t>::max(), 8), BufferUnderrunException);
  EXPECT_EQ(cursor.offset(), 0u);
}

TEST(CDRCursor, zero_bytes_look_like_big_endian_header) {
  std::vector<uint8_t> payload(16, 0);
  CDRReadCursor cursor(payload.data(), payload.size());
  EXPECT_TRUE(cursor.encapsulation().m_present);
  EXPECT_EQ(cursor.stream_endian(), endian::big);
  EXPECT_EQ(cursor.remaining(), 12u);
  EXPECT_NO_THROW(cursor.require_many(12, 0));
  EXPECT_THROW(cursor.require_many(13, 0), BufferUnderrunException);
}

TEST(CDRCursor, byte_swapping) {
  auto big = CDRTestBuffer(endian::big).u16(0x1234).u64(0x0102030405060708ull);
  CDRReadCursor cursor(big.data(), big.size());
  EXPECT_EQ(cdr_decoder_cpp::read_u16(cursor), 0x1234u);
  EXPECT_EQ(cdr_decoder_cpp::read_u64(cursor), 0x0102030405060708ull);
  EXPECT_EQ(cursor.remaining(), 0u);
}
