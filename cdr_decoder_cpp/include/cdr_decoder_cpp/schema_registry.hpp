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
#ifndef CDR_DECODER_CPP__SCHEMA_REGISTRY_HPP_
#define CDR_DECODER_CPP__SCHEMA_REGISTRY_HPP_

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "cdr_decoder_cpp/record_traits.hpp"
#include "cdr_decoder_cpp/reflection.hpp"
#include "cdr_decoder_cpp/value_types.hpp"

namespace cdr_decoder_cpp
{

/// Maps the schema names found in a log to reflected record types.
///
/// Each name is reflected once; returned references stay valid for the lifetime of
/// the registry. All members may be called concurrently.
class SchemaRegistry
{
public:
  SchemaRegistry() = default;
  SchemaRegistry(const SchemaRegistry &) = delete;
  SchemaRegistry & operator=(const SchemaRegistry &) = delete;

  /// Reflect spec and store it under schema_name. If the name is already registered the
  /// existing type is returned and spec is not reflected.
  /// Throws UnsupportedSchemaException if spec has no wire encoding.
  const StructValueType & register_schema(const std::string & schema_name, const RecordSpec & spec);

  template<typename T>
  const StructValueType & register_record(const std::string & schema_name)
  {
    return register_schema(schema_name, RecordTraits<T>::spec());
  }

  /// nullptr if schema_name was never registered
  const StructValueType * find(const std::string & schema_name) const;

  bool contains(const std::string & schema_name) const {return find(schema_name) != nullptr;}

  /// Sorted.
  std::vector<std::string> schema_names() const;

  size_t size() const;

private:
  mutable std::mutex m_mutex;
  std::map<std::string, std::unique_ptr<StructValueType>> m_types;
};

}  // namespace cdr_decoder_cpp

#endif  // CDR_DECODER_CPP__SCHEMA_REGISTRY_HPP_
