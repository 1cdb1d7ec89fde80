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
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "cdr_decoder_cpp/record_traits.hpp"
#include "cdr_decoder_cpp/schema_registry.hpp"
#include "cdr_test_buffer.hpp"

using cdr_decoder_cpp::DynamicValue;
using cdr_decoder_cpp::RecordSpec;
using cdr_decoder_cpp::RecordTraits;
using cdr_decoder_cpp::SchemaRegistry;
using cdr_decoder_cpp::StructValueType;
using cdr_decoder_cpp::UnsupportedSchemaException;
using cdr_decoder_cpp::ValueRejectedException;
using cdr_decoder_cpp::test::CDRTestBuffer;
namespace cdr = cdr_decoder_cpp::cdr;

namespace
{
struct Reading
{
  uint16_t sensor;
  double value;
  std::vector<int32_t> history;
};

struct Percentage
{
  uint8_t percent;
};
}  // namespace

namespace cdr_decoder_cpp
{
template<>
struct RecordTraits<Reading>
{
  static RecordSpec spec()
  {
    return RecordSpec("Reading")
           .field("sensor", cdr::UInt16())
           .field("value", cdr::Float64())
           .field("history", cdr::Sequence(cdr::Int32()));
  }

  static Reading materialize(const DynamicValue & v)
  {
    Reading r;
    r.sensor = v.at("sensor").as<uint16_t>();
    r.value = v.at("value").as<double>();
    for (const auto & x : v.at("history").elements()) {
      r.history.push_back(x.as<int32_t>());
    }
    return r;
  }
};

template<>
struct RecordTraits<Percentage>
{
  static RecordSpec spec()
  {
    return RecordSpec("Percentage").field("percent", cdr::UInt8());
  }

  static Percentage materialize(const DynamicValue & v)
  {
    Percentage p;
    p.percent = v.at("percent").as<uint8_t>();
    if (p.percent > 100) {
      throw std::out_of_range("percent above 100");
    }
    return p;
  }
};
}  // namespace cdr_decoder_cpp

TEST(RecordTraits, value_type_is_reflected_once) {
  const StructValueType & first = cdr_decoder_cpp::value_type_of<Reading>();
  const StructValueType & second = cdr_decoder_cpp::value_type_of<Reading>();
  EXPECT_EQ(&first, &second);
  EXPECT_EQ(first.name(), "Reading");
  EXPECT_EQ(first.n_members(), 3u);
}

TEST(RecordTraits, deserialize_as) {
  auto buf = CDRTestBuffer().u16(12).f64(0.25).u32(2).i32(-1).i32(4);
  Reading r = cdr_decoder_cpp::deserialize_as<Reading>(buf.data(), buf.size());
  EXPECT_EQ(r.sensor, 12);
  EXPECT_EQ(r.value, 0.25);
  EXPECT_EQ(r.history, (std::vector<int32_t>{-1, 4}));
}

TEST(RecordTraits, materialize_failures_are_value_rejected) {
  auto ok = CDRTestBuffer().u8(99);
  EXPECT_EQ(cdr_decoder_cpp::deserialize_as<Percentage>(ok.data(), ok.size()).percent, 99);

  auto bad = CDRTestBuffer().u8(101);
  try {
    cdr_decoder_cpp::deserialize_as<Percentage>(bad.data(), bad.size());
    FAIL() << "expected ValueRejectedException";
  } catch (const ValueRejectedException & e) {
    EXPECT_NE(std::string(e.what()).find("percent above 100"), std::string::npos);
  }
}

TEST(RecordTraits, decode_errors_pass_through) {
  auto truncated = CDRTestBuffer().u16(12);
  EXPECT_THROW(
    cdr_decoder_cpp::deserialize_as<Reading>(truncated.data(), truncated.size()),
    cdr_decoder_cpp::BufferUnderrunException);
}

TEST(SchemaRegistry, register_and_find) {
  SchemaRegistry registry;
  EXPECT_EQ(registry.size(), 0u);
  EXPECT_EQ(registry.find("demo.Reading"), nullptr);

  const StructValueType & vt = registry.register_record<Reading>("demo.Reading");
  EXPECT_EQ(vt.name(), "Reading");
  EXPECT_TRUE(registry.contains("demo.Reading"));
  EXPECT_EQ(registry.find("demo.Reading"), &vt);

  // already registered: the first reflection is kept
  const StructValueType & again = registry.register_schema(
    "demo.Reading", RecordSpec("Other").field("x", cdr::UInt8()));
  EXPECT_EQ(&again, &vt);
  EXPECT_EQ(registry.size(), 1u);

  registry.register_record<Percentage>("demo.Percentage");
  EXPECT_EQ(
    registry.schema_names(), (std::vector<std::string>{"demo.Percentage", "demo.Reading"}));
}

TEST(SchemaRegistry, unsupported_schema_is_not_registered) {
  SchemaRegistry registry;
  EXPECT_THROW(
    registry.register_schema(
      "demo.Maybe", RecordSpec("Maybe").field("x", cdr::Optional(cdr::Str()))),
    UnsupportedSchemaException);
  EXPECT_FALSE(registry.contains("demo.Maybe"));
}

TEST(SchemaRegistry, concurrent_lookups) {
  SchemaRegistry registry;
  const StructValueType * expected = &registry.register_record<Reading>("demo.Reading");

  std::vector<std::thread> threads;
  std::vector<const StructValueType *> found(8, nullptr);
  for (size_t i = 0; i < found.size(); i++) {
    threads.emplace_back(
      [&registry, &found, i]() {
        if (i % 2 == 0) {
          registry.register_record<Percentage>("demo.Percentage");
        }
        found[i] = registry.find("demo.Reading");
      });
  }
  for (auto & t : threads) {
    t.join();
  }
  for (auto vt : found) {
    EXPECT_EQ(vt, expected);
  }
  EXPECT_EQ(registry.size(), 2u);
}
