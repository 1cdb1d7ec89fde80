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

#ifndef CDR_DECODER_CPP__RET_TYPES_H_
#define CDR_DECODER_CPP__RET_TYPES_H_

#ifdef __cplusplus
extern "C"
{
#endif

#include <stdint.h>

/// Return code type used at the library boundary.
typedef int32_t cdr_decoder_ret_t;

/// The operation ran as expected
#define CDR_DECODER_RET_OK 0
/// Generic error to indicate operation could not complete successfully
#define CDR_DECODER_RET_ERROR 1
/// Argument to function was invalid
#define CDR_DECODER_RET_INVALID_ARGUMENT 11

/// The payload ended before a read completed
#define CDR_DECODER_RET_BUFFER_UNDERRUN 100
/// String bytes or the encapsulation header were not acceptable
#define CDR_DECODER_RET_INVALID_ENCODING 101
/// The record type contains a field with no wire representation
#define CDR_DECODER_RET_UNSUPPORTED_SCHEMA 102
/// The record refused the decoded field values
#define CDR_DECODER_RET_VALUE_REJECTED 103

#ifdef __cplusplus
}
#endif

#endif  // CDR_DECODER_CPP__RET_TYPES_H_
