#include "core/type_descriptor.hpp"

#include <format>

namespace iid::core {

auto identifier_carrier(const TypeProvider& provider, const TypeDescriptor& desc)
    -> Expected<const TypeDescriptor*> {
  if (!desc.guid_type) {
    return &desc;
  }
  const auto* target = provider.describe(*desc.guid_type);
  if (!target) {
    return tl::unexpected(make_error(
        ErrorKind::UnknownType,
        std::format("guid type of '{}' is not known to the provider", desc.full_name)));
  }
  return target;
}

auto to_string(TypeKind kind) -> std::string_view {
  switch (kind) {
    case TypeKind::Primitive:
      return "primitive";
    case TypeKind::Enum:
      return "enum";
    case TypeKind::Struct:
      return "struct";
    case TypeKind::String:
      return "string";
    case TypeKind::Delegate:
      return "delegate";
    case TypeKind::ParameterizedInterface:
      return "pinterface";
    case TypeKind::ProjectedClass:
      return "runtimeclass";
    case TypeKind::Interface:
      return "interface";
    case TypeKind::Object:
      return "object";
  }
  return "unknown";
}

auto primitive_code(PrimitiveType type) -> std::string_view {
  switch (type) {
    case PrimitiveType::Int8: return "i1";
    case PrimitiveType::UInt8: return "u1";
    case PrimitiveType::Int16: return "i2";
    case PrimitiveType::UInt16: return "u2";
    case PrimitiveType::Int32: return "i4";
    case PrimitiveType::UInt32: return "u4";
    case PrimitiveType::Int64: return "i8";
    case PrimitiveType::UInt64: return "u8";
    case PrimitiveType::Float32: return "f4";
    case PrimitiveType::Float64: return "f8";
    case PrimitiveType::Boolean: return "b1";
    case PrimitiveType::Char16: return "c2";
    case PrimitiveType::Guid: return "g16";
    case PrimitiveType::NativeInt:
    case PrimitiveType::NativeUInt:
      return {};
  }
  return {};
}

auto primitive_name(PrimitiveType type) -> std::string_view {
  switch (type) {
    case PrimitiveType::Int8: return "Int8";
    case PrimitiveType::UInt8: return "UInt8";
    case PrimitiveType::Int16: return "Int16";
    case PrimitiveType::UInt16: return "UInt16";
    case PrimitiveType::Int32: return "Int32";
    case PrimitiveType::UInt32: return "UInt32";
    case PrimitiveType::Int64: return "Int64";
    case PrimitiveType::UInt64: return "UInt64";
    case PrimitiveType::Float32: return "Single";
    case PrimitiveType::Float64: return "Double";
    case PrimitiveType::Boolean: return "Boolean";
    case PrimitiveType::Char16: return "Char16";
    case PrimitiveType::Guid: return "Guid";
    case PrimitiveType::NativeInt: return "IntPtr";
    case PrimitiveType::NativeUInt: return "UIntPtr";
  }
  return "unknown";
}

}  // namespace iid::core
