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

#ifndef CDR_DECODER_CPP__EXCEPTIONS_HPP_
#define CDR_DECODER_CPP__EXCEPTIONS_HPP_

#include <stdexcept>
#include <string>

namespace cdr_decoder_cpp
{

/// Categories of decode failure. Each maps to one cdr_decoder_ret_t code.
enum class DecodeErrorKind
{
  /// fewer bytes remain than a read requires
  BufferUnderrun,
  /// string bytes are not valid UTF-8, or the encapsulation is not accepted
  InvalidEncoding,
  /// a field type has no wire representation
  UnsupportedSchema,
  /// the record's own construction refused the decoded values
  ValueRejected,
};

const char * to_string(DecodeErrorKind kind);

class Exception : public std::runtime_error
{
public:
  explicit Exception(const std::string & what_arg)
  : std::runtime_error(what_arg) {}
  explicit Exception(const char * what_arg)
  : std::runtime_error(what_arg) {}
};

class DeserializationException : public Exception
{
public:
  DeserializationException(DecodeErrorKind kind, const std::string & what_arg)
  : Exception(what_arg), m_kind(kind) {}

  DecodeErrorKind kind() const {return m_kind;}

private:
  DecodeErrorKind m_kind;
};

class BufferUnderrunException : public DeserializationException
{
public:
  explicit BufferUnderrunException(const std::string & what_arg)
  : DeserializationException(DecodeErrorKind::BufferUnderrun, what_arg) {}
};

class InvalidEncodingException : public DeserializationException
{
public:
  explicit InvalidEncodingException(const std::string & what_arg)
  : DeserializationException(DecodeErrorKind::InvalidEncoding, what_arg) {}
};

class UnsupportedSchemaException : public DeserializationException
{
public:
  explicit UnsupportedSchemaException(const std::string & what_arg)
  : DeserializationException(DecodeErrorKind::UnsupportedSchema, what_arg) {}
};

class ValueRejectedException : public DeserializationException
{
public:
  explicit ValueRejectedException(const std::string & what_arg)
  : DeserializationException(DecodeErrorKind::ValueRejected, what_arg) {}
};

/// Stub for code that should never be reachable by design.
/// If it is possible to reach the code due to bad data or other runtime conditions,
/// use a runtime_error instead
[[noreturn]] inline void unreachable()
{
#if defined(__has_builtin)
#if __has_builtin(__builtin_unreachable)
  __builtin_unreachable();
#endif
#elif (__GNUC__ > 4 || (__GNUC__ == 4 && __GNUC_MINOR__ >= 5))
  __builtin_unreachable();
#endif
  throw std::logic_error("This code should be unreachable.");
}

}  // namespace cdr_decoder_cpp

#endif  // CDR_DECODER_CPP__EXCEPTIONS_HPP_
