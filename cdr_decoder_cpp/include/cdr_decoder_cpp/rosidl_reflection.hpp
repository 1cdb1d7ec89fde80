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
#ifndef CDR_DECODER_CPP__ROSIDL_REFLECTION_HPP_
#define CDR_DECODER_CPP__ROSIDL_REFLECTION_HPP_

#include <memory>

#include "cdr_decoder_cpp/value_types.hpp"
#include "rosidl_runtime_c/message_type_support_struct.h"

namespace cdr_decoder_cpp
{

/// Describe a ROS 2 message from its introspection type support (C or C++ generator).
///
/// Fixed arrays become tuples, sequences of octets/uint8 become byte blobs and other
/// sequences become sequences. wstring and long double members, and type supports from
/// neither introspection generator, are an UnsupportedSchemaException.
std::unique_ptr<StructValueType> make_message_value_type(const rosidl_message_type_support_t * mts);

}  // namespace cdr_decoder_cpp

#endif  // CDR_DECODER_CPP__ROSIDL_REFLECTION_HPP_
