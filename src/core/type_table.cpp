#include "core/type_table.hpp"

#include <array>
#include <format>
#include <stdexcept>
#include <utility>

namespace iid::core {
namespace {

constexpr std::array kBuiltinPrimitives = {
    PrimitiveType::Int8,    PrimitiveType::UInt8,   PrimitiveType::Int16,
    PrimitiveType::UInt16,  PrimitiveType::Int32,   PrimitiveType::UInt32,
    PrimitiveType::Int64,   PrimitiveType::UInt64,  PrimitiveType::Float32,
    PrimitiveType::Float64, PrimitiveType::Boolean, PrimitiveType::Char16,
    PrimitiveType::Guid,    PrimitiveType::NativeInt, PrimitiveType::NativeUInt,
};

}  // namespace

TypeTable::TypeTable() {
  for (auto type : kBuiltinPrimitives) {
    TypeDescriptor desc;
    desc.kind = TypeKind::Primitive;
    desc.primitive = type;
    desc.full_name = std::string(primitive_name(type));
    auto handle = add(std::move(desc));
    primitives_[type] = handle;
    if (auto code = primitive_code(type); !code.empty()) {
      names_.emplace(std::string(code), handle);
    }
  }

  TypeDescriptor str;
  str.kind = TypeKind::String;
  str.full_name = "String";
  string_ = add(std::move(str));
  names_.emplace("string", string_);

  TypeDescriptor obj;
  obj.kind = TypeKind::Object;
  obj.full_name = "Object";
  object_ = add(std::move(obj));
  names_.emplace("object", object_);
}

auto TypeTable::primitive(PrimitiveType type) const -> TypeHandle {
  return primitives_.at(type);
}

auto TypeTable::add_enum(std::string name, bool flags) -> TypeHandle {
  TypeDescriptor desc;
  desc.kind = TypeKind::Enum;
  desc.full_name = std::move(name);
  desc.is_flags_enum = flags;
  return add(std::move(desc));
}

auto TypeTable::add_struct(std::string name, std::vector<TypeHandle> fields) -> TypeHandle {
  TypeDescriptor desc;
  desc.kind = TypeKind::Struct;
  desc.full_name = std::move(name);
  desc.fields = std::move(fields);
  return add(std::move(desc));
}

auto TypeTable::add_interface(std::string name, Guid id) -> TypeHandle {
  TypeDescriptor desc;
  desc.kind = TypeKind::Interface;
  desc.full_name = std::move(name);
  desc.declared_id = id;
  return add(std::move(desc));
}

auto TypeTable::add_delegate(std::string name, Guid id) -> TypeHandle {
  TypeDescriptor desc;
  desc.kind = TypeKind::Delegate;
  desc.full_name = std::move(name);
  desc.declared_id = id;
  return add(std::move(desc));
}

auto TypeTable::add_generic_interface(std::string name, Guid id, std::size_t arity)
    -> TypeHandle {
  return add_generic_definition(std::move(name), TypeKind::ParameterizedInterface, id, arity);
}

auto TypeTable::add_generic_delegate(std::string name, Guid id, std::size_t arity)
    -> TypeHandle {
  return add_generic_definition(std::move(name), TypeKind::Delegate, id, arity);
}

auto TypeTable::add_generic_definition(std::string name, TypeKind kind, Guid id,
                                       std::size_t arity) -> TypeHandle {
  if (arity == 0) {
    throw std::invalid_argument(std::format("generic definition '{}' needs arity > 0", name));
  }
  TypeDescriptor desc;
  desc.kind = kind;
  desc.full_name = std::move(name);
  desc.declared_id = id;
  auto handle = add(std::move(desc));
  generic_arity_[handle] = arity;
  return handle;
}

auto TypeTable::add_runtime_class(std::string name, std::optional<TypeHandle> default_interface,
                                  std::optional<Guid> id) -> TypeHandle {
  TypeDescriptor desc;
  desc.kind = TypeKind::ProjectedClass;
  desc.full_name = std::move(name);
  desc.default_interface = default_interface;
  desc.declared_id = id;
  return add(std::move(desc));
}

auto TypeTable::instantiate(TypeHandle definition, std::vector<TypeHandle> arguments,
                            std::optional<Guid> published_iid) -> TypeHandle {
  auto arity = generic_arity(definition);
  if (!arity) {
    throw std::invalid_argument("instantiate: handle is not an open generic definition");
  }
  const auto& def = types_[definition.value - 1];
  if (arguments.size() != *arity) {
    throw std::invalid_argument(std::format("instantiate: '{}' takes {} arguments, got {}",
                                            def.full_name, *arity, arguments.size()));
  }

  std::string name = def.full_name + "<";
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    require_known(arguments[i], "instantiate");
    if (i > 0) {
      name += ", ";
    }
    name += types_[arguments[i].value - 1].full_name;
  }
  name += ">";

  if (auto it = names_.find(name); it != names_.end()) {
    if (published_iid) {
      set_published_iid(it->second, *published_iid);
    }
    return it->second;
  }

  TypeDescriptor desc;
  desc.kind = def.kind;
  desc.full_name = std::move(name);
  desc.declared_id = def.declared_id;
  desc.generic_arguments = std::move(arguments);
  desc.published_iid = published_iid;
  return add(std::move(desc));
}

auto TypeTable::add(TypeDescriptor descriptor) -> TypeHandle {
  if (descriptor.full_name.empty()) {
    throw std::invalid_argument("type descriptor needs a full name");
  }
  if (names_.contains(descriptor.full_name)) {
    throw std::invalid_argument(std::format("type '{}' already registered", descriptor.full_name));
  }
  for (auto field : descriptor.fields) {
    require_known(field, descriptor.full_name);
  }
  for (auto arg : descriptor.generic_arguments) {
    require_known(arg, descriptor.full_name);
  }
  if (descriptor.default_interface) {
    require_known(*descriptor.default_interface, descriptor.full_name);
  }
  if (descriptor.authoring_alias) {
    require_known(*descriptor.authoring_alias, descriptor.full_name);
  }
  if (descriptor.guid_type) {
    require_known(*descriptor.guid_type, descriptor.full_name);
  }

  TypeHandle handle{static_cast<std::uint32_t>(types_.size() + 1)};
  names_.emplace(descriptor.full_name, handle);
  types_.push_back(std::move(descriptor));
  return handle;
}

auto TypeTable::set_signature_override(TypeHandle type, SignatureOverride override_fn) -> void {
  mutable_descriptor(type).signature_override = std::move(override_fn);
}

auto TypeTable::set_authoring_alias(TypeHandle interface_type, TypeHandle alias) -> void {
  require_known(alias, "set_authoring_alias");
  auto& desc = mutable_descriptor(interface_type);
  if (desc.kind != TypeKind::Interface && desc.kind != TypeKind::ParameterizedInterface) {
    throw std::invalid_argument(
        std::format("authoring alias on non-interface type '{}'", desc.full_name));
  }
  // The alias must already exist, so it cannot point back through this type.
  if (alias.value >= interface_type.value) {
    throw std::invalid_argument(
        std::format("authoring alias of '{}' must be registered before it", desc.full_name));
  }
  desc.authoring_alias = alias;
}

auto TypeTable::set_guid_type(TypeHandle type, TypeHandle guid_type) -> void {
  require_known(guid_type, "set_guid_type");
  mutable_descriptor(type).guid_type = guid_type;
}

auto TypeTable::set_published_iid(TypeHandle type, Guid iid) -> void {
  mutable_descriptor(type).published_iid = iid;
}

auto TypeTable::add_alias(std::string name, TypeHandle type) -> void {
  require_known(type, "add_alias");
  if (names_.contains(name)) {
    throw std::invalid_argument(std::format("type '{}' already registered", name));
  }
  names_.emplace(std::move(name), type);
}

auto TypeTable::generic_arity(TypeHandle definition) const -> std::optional<std::size_t> {
  auto it = generic_arity_.find(definition);
  if (it == generic_arity_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto TypeTable::describe(TypeHandle type) const -> const TypeDescriptor* {
  if (!type.valid() || type.value > types_.size()) {
    return nullptr;
  }
  return &types_[type.value - 1];
}

auto TypeTable::find(std::string_view full_name) const -> std::optional<TypeHandle> {
  auto it = names_.find(std::string(full_name));
  if (it == names_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto TypeTable::mutable_descriptor(TypeHandle type) -> TypeDescriptor& {
  require_known(type, "update");
  return types_[type.value - 1];
}

auto TypeTable::require_known(TypeHandle type, std::string_view context) const -> void {
  if (!type.valid() || type.value > types_.size()) {
    throw std::invalid_argument(
        std::format("{}: reference to unregistered type handle {}", context, type.value));
  }
}

}  // namespace iid::core
