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
#include "cdr_decoder_cpp/schema_registry.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "rcutils/logging_macros.h"

namespace cdr_decoder_cpp
{

const StructValueType & SchemaRegistry::register_schema(
  const std::string & schema_name, const RecordSpec & spec)
{
  std::lock_guard<std::mutex> guard(m_mutex);
  auto it = m_types.find(schema_name);
  if (it != m_types.end()) {
    return *it->second;
  }
  auto value_type = reflect_record(spec);
  RCUTILS_LOG_DEBUG_NAMED(
    "cdr_decoder_cpp", "registered schema '%s' as record '%s'",
    schema_name.c_str(), value_type->name().c_str());
  auto & stored = m_types[schema_name];
  stored = std::move(value_type);
  return *stored;
}

const StructValueType * SchemaRegistry::find(const std::string & schema_name) const
{
  std::lock_guard<std::mutex> guard(m_mutex);
  auto it = m_types.find(schema_name);
  if (it == m_types.end()) {
    return nullptr;
  }
  return it->second.get();
}

std::vector<std::string> SchemaRegistry::schema_names() const
{
  std::lock_guard<std::mutex> guard(m_mutex);
  std::vector<std::string> names;
  names.reserve(m_types.size());
  for (auto & entry : m_types) {
    names.push_back(entry.first);
  }
  return names;
}

size_t SchemaRegistry::size() const
{
  std::lock_guard<std::mutex> guard(m_mutex);
  return m_types.size();
}

}  // namespace cdr_decoder_cpp
