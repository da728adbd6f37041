#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/guid.hpp"

namespace iid::core {

enum class TypeKind : std::uint8_t {
  Primitive,
  Enum,
  Struct,
  String,
  Delegate,
  ParameterizedInterface,
  ProjectedClass,
  Interface,
  Object,
};

enum class PrimitiveType : std::uint8_t {
  Int8,
  UInt8,
  Int16,
  UInt16,
  Int32,
  UInt32,
  Int64,
  UInt64,
  Float32,
  Float64,
  Boolean,
  Char16,
  Guid,
  // Pointer-sized integers have no signature code.
  NativeInt,
  NativeUInt,
};

/// Opaque handle into a TypeProvider. Zero is never a valid handle.
struct TypeHandle {
  std::uint32_t value = 0;

  auto valid() const -> bool { return value != 0; }
  auto operator<=>(const TypeHandle&) const = default;
};

/// Hand-written signature that bypasses the generic algorithm.
using SignatureOverride = std::function<std::string()>;

struct TypeDescriptor {
  TypeKind kind = TypeKind::Object;
  std::string full_name;
  std::optional<Guid> declared_id;
  std::vector<TypeHandle> generic_arguments;
  std::vector<TypeHandle> fields;
  PrimitiveType primitive = PrimitiveType::Int32;
  bool is_flags_enum = false;
  /// ProjectedClass: the interface the class projects to.
  std::optional<TypeHandle> default_interface;
  /// Interface: the higher-level type this interface stands in for.
  std::optional<TypeHandle> authoring_alias;
  /// Type that carries the identifiers of this one (an ABI helper).
  std::optional<TypeHandle> guid_type;
  /// Precomputed identifier of a closed generic instantiation.
  std::optional<Guid> published_iid;
  SignatureOverride signature_override;

  auto is_generic() const -> bool { return !generic_arguments.empty(); }
};

/// Structural queries the signature builder and lookups rely on.
class TypeProvider {
 public:
  virtual ~TypeProvider() = default;

  /// Returns nullptr for handles the provider does not know.
  virtual auto describe(TypeHandle type) const -> const TypeDescriptor* = 0;
  virtual auto find(std::string_view full_name) const -> std::optional<TypeHandle> = 0;
};

auto to_string(TypeKind kind) -> std::string_view;

/// Descriptor that carries the identifiers of `desc`: its guid type when one
/// is set, otherwise `desc` itself. The redirect is followed a single step.
auto identifier_carrier(const TypeProvider& provider, const TypeDescriptor& desc)
    -> Expected<const TypeDescriptor*>;

/// Signature code of a primitive ("i4"), empty for pointer-sized integers.
auto primitive_code(PrimitiveType type) -> std::string_view;

/// Qualified name the built-in table registers a primitive under ("Int32").
auto primitive_name(PrimitiveType type) -> std::string_view;

}  // namespace iid::core

template <>
struct std::hash<iid::core::TypeHandle> {
  auto operator()(const iid::core::TypeHandle& h) const -> std::size_t {
    return std::hash<std::uint32_t>{}(h.value);
  }
};
