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
#include "cdr_decoder_cpp/rosidl_reflection.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "cdr_decoder_cpp/exceptions.hpp"
#include "rcutils/error_handling.h"
#include "rcutils/logging_macros.h"
#include "rosidl_typesupport_introspection_c/field_types.h"
#include "rosidl_typesupport_introspection_c/identifier.h"
#include "rosidl_typesupport_introspection_c/message_introspection.h"
#include "rosidl_typesupport_introspection_cpp/field_types.hpp"
#include "rosidl_typesupport_introspection_cpp/identifier.hpp"
#include "rosidl_typesupport_introspection_cpp/message_introspection.hpp"

namespace cdr_decoder_cpp
{
namespace
{
enum class TypeGenerator
{
  ROSIDL_C,
  ROSIDL_Cpp,
};

template<TypeGenerator>
struct TypeGeneratorInfo;

template<>
struct TypeGeneratorInfo<TypeGenerator::ROSIDL_C>
{
  static const auto & get_identifier() {return rosidl_typesupport_introspection_c__identifier;}
  static const char * separator() {return "__";}
  using MetaMessage = rosidl_typesupport_introspection_c__MessageMembers;
  using MetaMember = rosidl_typesupport_introspection_c__MessageMember;
};

template<>
struct TypeGeneratorInfo<TypeGenerator::ROSIDL_Cpp>
{
  static const auto & get_identifier()
  {
    return rosidl_typesupport_introspection_cpp::typesupport_identifier;
  }
  static const char * separator() {return "::";}
  using MetaMessage = rosidl_typesupport_introspection_cpp::MessageMembers;
  using MetaMember = rosidl_typesupport_introspection_cpp::MessageMember;
};

template<TypeGenerator g>
using MetaMessage = typename TypeGeneratorInfo<g>::MetaMessage;
template<TypeGenerator g>
using MetaMember = typename TypeGeneratorInfo<g>::MetaMember;

namespace tsi_enum = rosidl_typesupport_introspection_cpp;

// these are shared between c and cpp
enum class ROSIDL_TypeKind : uint8_t
{
  FLOAT = tsi_enum::ROS_TYPE_FLOAT,
  DOUBLE = tsi_enum::ROS_TYPE_DOUBLE,
  LONG_DOUBLE = tsi_enum::ROS_TYPE_LONG_DOUBLE,
  CHAR = tsi_enum::ROS_TYPE_CHAR,
  WCHAR = tsi_enum::ROS_TYPE_WCHAR,
  BOOLEAN = tsi_enum::ROS_TYPE_BOOLEAN,
  OCTET = tsi_enum::ROS_TYPE_OCTET,
  UINT8 = tsi_enum::ROS_TYPE_UINT8,
  INT8 = tsi_enum::ROS_TYPE_INT8,
  UINT16 = tsi_enum::ROS_TYPE_UINT16,
  INT16 = tsi_enum::ROS_TYPE_INT16,
  UINT32 = tsi_enum::ROS_TYPE_UINT32,
  INT32 = tsi_enum::ROS_TYPE_INT32,
  UINT64 = tsi_enum::ROS_TYPE_UINT64,
  INT64 = tsi_enum::ROS_TYPE_INT64,
  STRING = tsi_enum::ROS_TYPE_STRING,
  WSTRING = tsi_enum::ROS_TYPE_WSTRING,

  MESSAGE = tsi_enum::ROS_TYPE_MESSAGE,
};

/// Returns false for type kinds that are not fixed-width primitives.
bool to_primitive_kind(ROSIDL_TypeKind tk, PrimitiveKind * kind)
{
  switch (tk) {
    case ROSIDL_TypeKind::BOOLEAN:
      *kind = PrimitiveKind::BOOLEAN;
      return true;
    case ROSIDL_TypeKind::OCTET:
    case ROSIDL_TypeKind::UINT8:
    case ROSIDL_TypeKind::CHAR:
      *kind = PrimitiveKind::UINT8;
      return true;
    case ROSIDL_TypeKind::INT8:
      *kind = PrimitiveKind::INT8;
      return true;
    case ROSIDL_TypeKind::UINT16:
    case ROSIDL_TypeKind::WCHAR:
      *kind = PrimitiveKind::UINT16;
      return true;
    case ROSIDL_TypeKind::INT16:
      *kind = PrimitiveKind::INT16;
      return true;
    case ROSIDL_TypeKind::UINT32:
      *kind = PrimitiveKind::UINT32;
      return true;
    case ROSIDL_TypeKind::INT32:
      *kind = PrimitiveKind::INT32;
      return true;
    case ROSIDL_TypeKind::UINT64:
      *kind = PrimitiveKind::UINT64;
      return true;
    case ROSIDL_TypeKind::INT64:
      *kind = PrimitiveKind::INT64;
      return true;
    case ROSIDL_TypeKind::FLOAT:
      *kind = PrimitiveKind::FLOAT32;
      return true;
    case ROSIDL_TypeKind::DOUBLE:
      *kind = PrimitiveKind::FLOAT64;
      return true;
    default:
      return false;
  }
}

template<TypeGenerator g>
class ROSIDL_StructValueType : public StructValueType
{
public:
  explicit ROSIDL_StructValueType(const MetaMessage<g> * impl);

private:
  const AnyValueType * make_element_value_type(const MetaMember<g> & member_impl);
};

template<TypeGenerator g>
std::string qualified_name(const MetaMessage<g> * impl)
{
  std::string name = impl->message_namespace_ ? impl->message_namespace_ : "";
  if (!name.empty()) {
    name += TypeGeneratorInfo<g>::separator();
  }
  return name + (impl->message_name_ ? impl->message_name_ : "");
}

template<TypeGenerator g>
ROSIDL_StructValueType<g>::ROSIDL_StructValueType(const MetaMessage<g> * impl)
: StructValueType(qualified_name<g>(impl))
{
  for (size_t index = 0; index < impl->member_count_; index++) {
    auto & member_impl = impl->members_[index];
    auto element_value_type = make_element_value_type(member_impl);
    auto tk = ROSIDL_TypeKind(member_impl.type_id_);

    const AnyValueType * member_value_type;
    if (!member_impl.is_array_) {
      member_value_type = element_value_type;
    } else if (member_impl.array_size_ != 0 && !member_impl.is_upper_bound_) {
      member_value_type = make_value_type<ArrayValueType>(
        element_value_type, member_impl.array_size_);
    } else if (tk == ROSIDL_TypeKind::OCTET || tk == ROSIDL_TypeKind::UINT8) {
      member_value_type = make_value_type<ByteBlobValueType>();
    } else {
      member_value_type = make_value_type<SpanSequenceValueType>(element_value_type);
    }
    add_member(member_impl.name_, member_value_type);
  }
}

template<TypeGenerator g>
const AnyValueType * ROSIDL_StructValueType<g>::make_element_value_type(
  const MetaMember<g> & member_impl)
{
  auto tk = ROSIDL_TypeKind(member_impl.type_id_);
  PrimitiveKind kind;
  switch (tk) {
    case ROSIDL_TypeKind::MESSAGE:
      return adopt_value_type(make_message_value_type(member_impl.members_));
    case ROSIDL_TypeKind::STRING:
      return make_value_type<U8StringValueType>();
    case ROSIDL_TypeKind::WSTRING:
    case ROSIDL_TypeKind::LONG_DOUBLE:
      throw UnsupportedSchemaException(
              "message '" + name() + "' member '" + member_impl.name_ +
              "': wstring and long double members are not supported");
    default:
      if (!to_primitive_kind(tk, &kind)) {
        throw UnsupportedSchemaException(
                "message '" + name() + "' member '" + member_impl.name_ +
                "': unknown type id " + std::to_string(member_impl.type_id_));
      }
      return make_value_type<PrimitiveValueType>(kind);
  }
}
}  // namespace

std::unique_ptr<StructValueType> make_message_value_type(const rosidl_message_type_support_t * mts)
{
  if (!mts) {
    throw std::invalid_argument("message type support is null");
  }
  std::unique_ptr<StructValueType> value_type;
  if (auto ts_c =
    get_message_typesupport_handle(
      mts,
      TypeGeneratorInfo<TypeGenerator::ROSIDL_C>::get_identifier()))
  {
    auto members = static_cast<const MetaMessage<TypeGenerator::ROSIDL_C> *>(ts_c->data);
    value_type = std::make_unique<ROSIDL_StructValueType<TypeGenerator::ROSIDL_C>>(members);
  } else {
    rcutils_error_string_t prev_error_string = rcutils_get_error_string();
    rcutils_reset_error();

    if (auto ts_cpp =
      get_message_typesupport_handle(
        mts,
        TypeGeneratorInfo<TypeGenerator::ROSIDL_Cpp>::get_identifier()))
    {
      auto members = static_cast<const MetaMessage<TypeGenerator::ROSIDL_Cpp> *>(ts_cpp->data);
      value_type = std::make_unique<ROSIDL_StructValueType<TypeGenerator::ROSIDL_Cpp>>(members);
    } else {
      rcutils_error_string_t error_string = rcutils_get_error_string();
      rcutils_reset_error();

      throw UnsupportedSchemaException(
              std::string("Type support is not an introspection type support.  Got:\n") +
              "    " + prev_error_string.str + "\n" +
              "    " + error_string.str + "\n" +
              "while fetching it");
    }
  }
  RCUTILS_LOG_DEBUG_NAMED(
    "cdr_decoder_cpp", "reflected message '%s' with %zu members",
    value_type->name().c_str(), value_type->n_members());
  return value_type;
}

}  // namespace cdr_decoder_cpp
