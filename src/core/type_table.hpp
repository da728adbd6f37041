#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "core/type_descriptor.hpp"

namespace iid::core {

/// Explicit descriptor table. Every reference a descriptor holds must name a
/// handle registered earlier, which keeps struct field graphs acyclic.
class TypeTable : public TypeProvider {
 public:
  /// Registers the primitives, String and Object.
  TypeTable();

  auto primitive(PrimitiveType type) const -> TypeHandle;
  auto string_type() const -> TypeHandle { return string_; }
  auto object_type() const -> TypeHandle { return object_; }

  auto add_enum(std::string name, bool flags) -> TypeHandle;
  auto add_struct(std::string name, std::vector<TypeHandle> fields) -> TypeHandle;
  auto add_interface(std::string name, Guid id) -> TypeHandle;
  auto add_delegate(std::string name, Guid id) -> TypeHandle;
  /// Open generic definitions; `arity` arguments are required to close them.
  auto add_generic_interface(std::string name, Guid id, std::size_t arity) -> TypeHandle;
  auto add_generic_delegate(std::string name, Guid id, std::size_t arity) -> TypeHandle;
  auto add_runtime_class(std::string name, std::optional<TypeHandle> default_interface,
                         std::optional<Guid> id = std::nullopt) -> TypeHandle;

  /// Close a generic definition over `arguments`. Instantiations are interned
  /// by name, so the same closure always yields the same handle.
  auto instantiate(TypeHandle definition, std::vector<TypeHandle> arguments,
                   std::optional<Guid> published_iid = std::nullopt) -> TypeHandle;

  /// Register a fully populated descriptor.
  auto add(TypeDescriptor descriptor) -> TypeHandle;

  auto set_signature_override(TypeHandle type, SignatureOverride override_fn) -> void;
  auto set_authoring_alias(TypeHandle interface_type, TypeHandle alias) -> void;
  auto set_guid_type(TypeHandle type, TypeHandle guid_type) -> void;
  auto set_published_iid(TypeHandle type, Guid iid) -> void;
  /// Extra lookup name for an existing type.
  auto add_alias(std::string name, TypeHandle type) -> void;

  auto generic_arity(TypeHandle definition) const -> std::optional<std::size_t>;
  auto size() const -> std::size_t { return types_.size(); }

  auto describe(TypeHandle type) const -> const TypeDescriptor* override;
  auto find(std::string_view full_name) const -> std::optional<TypeHandle> override;

 private:
  auto mutable_descriptor(TypeHandle type) -> TypeDescriptor&;
  auto require_known(TypeHandle type, std::string_view context) const -> void;
  auto add_generic_definition(std::string name, TypeKind kind, Guid id,
                              std::size_t arity) -> TypeHandle;

  std::vector<TypeDescriptor> types_;
  std::unordered_map<std::string, TypeHandle> names_;
  std::unordered_map<TypeHandle, std::size_t> generic_arity_;
  std::unordered_map<PrimitiveType, TypeHandle> primitives_;
  TypeHandle string_{};
  TypeHandle object_{};
};

}  // namespace iid::core
