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
#ifndef CDR_DECODER_CPP__OPTIONS_HPP_
#define CDR_DECODER_CPP__OPTIONS_HPP_

#include "cdr_decoder_cpp/value_types.hpp"

namespace cdr_decoder_cpp
{

/// Per-reader decoding behaviour.
struct DecoderOptions
{
  /// Reject payloads that do not start with a plain CDR encapsulation header
  /// instead of reading them as raw little-endian data.
  bool strict_encapsulation = false;

  /// Defaults overridden by CDR_DECODER_STRICT_ENCAPSULATION.
  static DecoderOptions from_environment();
};

/// Wire types assumed for fields declared with a bare native type.
struct ReflectionDefaults
{
  PrimitiveKind native_int = PrimitiveKind::UINT32;
  PrimitiveKind native_float = PrimitiveKind::FLOAT32;
};

/// Process-wide; only the schema reflector reads these.
ReflectionDefaults get_reflection_defaults();

/// Throws std::invalid_argument if native_int is not an integer kind or native_float
/// is not a floating point kind.
void set_reflection_defaults(const ReflectionDefaults & defaults);

/// Apply CDR_DECODER_DEFAULT_INT and CDR_DECODER_DEFAULT_FLOAT, if set. Unknown kind
/// names are logged and ignored.
void load_reflection_defaults_from_environment();

}  // namespace cdr_decoder_cpp

#endif  // CDR_DECODER_CPP__OPTIONS_HPP_
