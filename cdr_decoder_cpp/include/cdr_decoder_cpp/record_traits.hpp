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
#ifndef CDR_DECODER_CPP__RECORD_TRAITS_HPP_
#define CDR_DECODER_CPP__RECORD_TRAITS_HPP_

#include <exception>
#include <memory>
#include <string>

#include "cdr_decoder_cpp/Deserialization.hpp"
#include "cdr_decoder_cpp/exceptions.hpp"
#include "cdr_decoder_cpp/reflection.hpp"

namespace cdr_decoder_cpp
{

/// Specialize for each host record type:
///
///   template<>
///   struct RecordTraits<Point>
///   {
///     static RecordSpec spec();
///     static Point materialize(const DynamicValue & value);
///   };
template<typename T>
struct RecordTraits;

/// The wire description of T, reflected on first use.
/// If reflection throws, the next call tries again.
template<typename T>
const StructValueType & value_type_of()
{
  static const std::unique_ptr<StructValueType> value_type =
    reflect_record(RecordTraits<T>::spec());
  return *value_type;
}

/// Build a T from an already decoded record.
/// Failures other than DeserializationException are reported as ValueRejectedException.
template<typename T>
T materialize_as(const DynamicValue & value)
{
  try {
    return RecordTraits<T>::materialize(value);
  } catch (const DeserializationException &) {
    throw;
  } catch (const std::exception & e) {
    throw ValueRejectedException(
            "record '" + value_type_of<T>().name() + "' rejected: " + e.what());
  }
}

template<typename T>
T deserialize_as(const void * data, size_t size, const DecoderOptions & options = DecoderOptions{})
{
  CDRReader reader(options);
  return materialize_as<T>(reader.deserialize_top_level(value_type_of<T>(), data, size));
}

}  // namespace cdr_decoder_cpp

#endif  // CDR_DECODER_CPP__RECORD_TRAITS_HPP_
