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
#include "cdr_decoder_cpp/exceptions.hpp"

namespace cdr_decoder_cpp
{

const char * to_string(DecodeErrorKind kind)
{
  switch (kind) {
    case DecodeErrorKind::BufferUnderrun:
      return "BufferUnderrun";
    case DecodeErrorKind::InvalidEncoding:
      return "InvalidEncoding";
    case DecodeErrorKind::UnsupportedSchema:
      return "UnsupportedSchema";
    case DecodeErrorKind::ValueRejected:
      return "ValueRejected";
  }
  unreachable();
}

}  // namespace cdr_decoder_cpp
