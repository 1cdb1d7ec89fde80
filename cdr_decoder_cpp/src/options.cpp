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
#include "cdr_decoder_cpp/options.hpp"

#include <atomic>
#include <cctype>
#include <stdexcept>
#include <string>

#include "rcutils/env.h"
#include "rcutils/logging_macros.h"

namespace cdr_decoder_cpp
{
namespace
{
std::atomic<PrimitiveKind> g_native_int{PrimitiveKind::UINT32};
std::atomic<PrimitiveKind> g_native_float{PrimitiveKind::FLOAT32};

/// Returns false if the variable is unset or could not be read.
bool get_env(const char * name, std::string & value)
{
  const char * env_value = nullptr;
  const char * error = rcutils_get_env(name, &env_value);
  if (error != nullptr) {
    RCUTILS_LOG_ERROR_NAMED(
      "cdr_decoder_cpp", "failed to read environment variable %s: %s", name, error);
    return false;
  }
  if (env_value == nullptr || *env_value == '\0') {
    return false;
  }
  value = env_value;
  return true;
}

bool is_integer_kind(PrimitiveKind kind)
{
  return !primitive_is_float(kind) && !primitive_is_bool(kind);
}
}  // namespace

DecoderOptions DecoderOptions::from_environment()
{
  DecoderOptions options;
  std::string value;
  if (get_env("CDR_DECODER_STRICT_ENCAPSULATION", value)) {
    for (auto & c : value) {
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    options.strict_encapsulation = (value == "1" || value == "true" || value == "yes");
  }
  return options;
}

ReflectionDefaults get_reflection_defaults()
{
  ReflectionDefaults defaults;
  defaults.native_int = g_native_int.load();
  defaults.native_float = g_native_float.load();
  return defaults;
}

void set_reflection_defaults(const ReflectionDefaults & defaults)
{
  if (!is_integer_kind(defaults.native_int)) {
    throw std::invalid_argument(
            std::string("default integer kind must be an integer, got ") +
            to_string(defaults.native_int));
  }
  if (!primitive_is_float(defaults.native_float)) {
    throw std::invalid_argument(
            std::string("default float kind must be a floating point kind, got ") +
            to_string(defaults.native_float));
  }
  g_native_int.store(defaults.native_int);
  g_native_float.store(defaults.native_float);
}

void load_reflection_defaults_from_environment()
{
  ReflectionDefaults defaults = get_reflection_defaults();
  std::string value;
  PrimitiveKind kind;
  if (get_env("CDR_DECODER_DEFAULT_INT", value)) {
    if (primitive_kind_from_string(value, &kind) && is_integer_kind(kind)) {
      defaults.native_int = kind;
    } else {
      RCUTILS_LOG_WARN_NAMED(
        "cdr_decoder_cpp", "ignoring CDR_DECODER_DEFAULT_INT='%s': not an integer kind",
        value.c_str());
    }
  }
  if (get_env("CDR_DECODER_DEFAULT_FLOAT", value)) {
    if (primitive_kind_from_string(value, &kind) && primitive_is_float(kind)) {
      defaults.native_float = kind;
    } else {
      RCUTILS_LOG_WARN_NAMED(
        "cdr_decoder_cpp", "ignoring CDR_DECODER_DEFAULT_FLOAT='%s': not a float kind",
        value.c_str());
    }
  }
  set_reflection_defaults(defaults);
}

}  // namespace cdr_decoder_cpp
