#include "core/type_table_json.hpp"

#include <format>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace iid::core {
namespace {

auto descriptor_error(std::string message) -> CoreError {
  return make_error(ErrorKind::InvalidDescriptor, std::move(message));
}

auto get_string_field(const Json& obj, std::string_view field, std::string_view context)
    -> Expected<std::string> {
  auto it = obj.find(std::string(field));
  if (it == obj.end() || !it->is_string()) {
    return tl::unexpected(descriptor_error(
        std::format("{}: missing or invalid field '{}'", context, field)));
  }
  return it->get<std::string>();
}

auto get_optional_string(const Json& obj, std::string_view field, std::string_view context)
    -> Expected<std::optional<std::string>> {
  auto it = obj.find(std::string(field));
  if (it == obj.end()) {
    return std::optional<std::string>{};
  }
  if (!it->is_string()) {
    return tl::unexpected(descriptor_error(std::format("{}: '{}' must be a string", context, field)));
  }
  return std::optional<std::string>{it->get<std::string>()};
}

auto get_guid_field(const Json& obj, std::string_view field, std::string_view context)
    -> Expected<std::optional<Guid>> {
  auto text = get_optional_string(obj, field, context);
  if (!text) {
    return tl::unexpected(text.error());
  }
  if (!*text) {
    return std::optional<Guid>{};
  }
  auto id = Guid::parse(**text);
  if (!id) {
    return tl::unexpected(make_error(ErrorKind::InvalidIdentifier,
                                     std::format("{}: {}", context, id.error().message)));
  }
  return std::optional<Guid>{*id};
}

auto resolve_ref(const TypeTable& table, std::string_view name, std::string_view context)
    -> Expected<TypeHandle> {
  auto handle = table.find(name);
  if (!handle) {
    return tl::unexpected(descriptor_error(
        std::format("{}: unknown type '{}' (types must be declared before use)", context, name)));
  }
  return *handle;
}

auto resolve_ref_list(const TypeTable& table, const Json& obj, std::string_view field,
                      std::string_view context) -> Expected<std::vector<TypeHandle>> {
  auto it = obj.find(std::string(field));
  if (it == obj.end() || !it->is_array()) {
    return tl::unexpected(descriptor_error(std::format("{}: '{}' must be an array", context, field)));
  }
  std::vector<TypeHandle> handles;
  handles.reserve(it->size());
  for (const auto& item : *it) {
    if (!item.is_string()) {
      return tl::unexpected(descriptor_error(
          std::format("{}: '{}' entries must be type names", context, field)));
    }
    auto handle = resolve_ref(table, item.get<std::string>(), context);
    if (!handle) {
      return tl::unexpected(handle.error());
    }
    handles.push_back(*handle);
  }
  return handles;
}

auto parse_declared_type(TypeTable& table, const Json& entry, const std::string& name,
                         const std::string& kind) -> Expected<TypeHandle> {
  if (table.find(name)) {
    return tl::unexpected(descriptor_error(std::format("duplicate type name: {}", name)));
  }

  if (kind == "enum") {
    bool flags = false;
    if (auto it = entry.find("flags"); it != entry.end()) {
      if (!it->is_boolean()) {
        return tl::unexpected(descriptor_error(std::format("{}: 'flags' must be a boolean", name)));
      }
      flags = it->get<bool>();
    }
    return table.add_enum(name, flags);
  }

  if (kind == "struct") {
    auto fields = resolve_ref_list(table, entry, "fields", name);
    if (!fields) {
      return tl::unexpected(fields.error());
    }
    return table.add_struct(name, std::move(*fields));
  }

  if (kind == "interface" || kind == "delegate") {
    auto id = get_guid_field(entry, "id", name);
    if (!id) {
      return tl::unexpected(id.error());
    }
    std::size_t arity = 0;
    if (auto it = entry.find("generic_parameters"); it != entry.end()) {
      if (!it->is_number_unsigned() || it->get<std::size_t>() == 0) {
        return tl::unexpected(descriptor_error(
            std::format("{}: 'generic_parameters' must be a positive integer", name)));
      }
      arity = it->get<std::size_t>();
    }
    if (!*id) {
      if (arity > 0) {
        return tl::unexpected(descriptor_error(
            std::format("{}: generic definitions need an 'id'", name)));
      }
      // Declared without an identifier; lookups report MissingIdentifier.
      TypeDescriptor desc;
      desc.kind = kind == "interface" ? TypeKind::Interface : TypeKind::Delegate;
      desc.full_name = name;
      return table.add(std::move(desc));
    }
    if (kind == "interface") {
      return arity > 0 ? table.add_generic_interface(name, **id, arity)
                       : table.add_interface(name, **id);
    }
    return arity > 0 ? table.add_generic_delegate(name, **id, arity)
                     : table.add_delegate(name, **id);
  }

  if (kind == "runtimeclass") {
    auto id = get_guid_field(entry, "id", name);
    if (!id) {
      return tl::unexpected(id.error());
    }
    auto iface_name = get_optional_string(entry, "default_interface", name);
    if (!iface_name) {
      return tl::unexpected(iface_name.error());
    }
    std::optional<TypeHandle> iface;
    if (*iface_name) {
      auto handle = resolve_ref(table, **iface_name, name);
      if (!handle) {
        return tl::unexpected(handle.error());
      }
      iface = *handle;
    }
    return table.add_runtime_class(name, iface, *id);
  }

  return tl::unexpected(descriptor_error(std::format("{}: unknown kind '{}'", name, kind)));
}

auto parse_instance(TypeTable& table, const Json& entry, std::string_view context)
    -> Expected<TypeHandle> {
  auto def_name = get_string_field(entry, "definition", context);
  if (!def_name) {
    return tl::unexpected(def_name.error());
  }
  auto definition = resolve_ref(table, *def_name, context);
  if (!definition) {
    return tl::unexpected(definition.error());
  }
  auto arity = table.generic_arity(*definition);
  if (!arity) {
    return tl::unexpected(descriptor_error(
        std::format("{}: '{}' is not a generic definition", context, *def_name)));
  }
  auto args = resolve_ref_list(table, entry, "arguments", context);
  if (!args) {
    return tl::unexpected(args.error());
  }
  if (args->size() != *arity) {
    return tl::unexpected(descriptor_error(std::format(
        "{}: '{}' takes {} arguments, got {}", context, *def_name, *arity, args->size())));
  }
  return table.instantiate(*definition, std::move(*args));
}

auto apply_common_fields(TypeTable& table, TypeHandle handle, const Json& entry,
                         std::string_view context) -> Expected<void> {
  if (auto it = entry.find("signature"); it != entry.end()) {
    if (!it->is_string()) {
      return tl::unexpected(descriptor_error(std::format("{}: 'signature' must be a string", context)));
    }
    table.set_signature_override(handle, [signature = it->get<std::string>()]() {
      return signature;
    });
  }

  auto alias = get_optional_string(entry, "alias", context);
  if (!alias) {
    return tl::unexpected(alias.error());
  }
  if (*alias) {
    auto target = resolve_ref(table, **alias, context);
    if (!target) {
      return tl::unexpected(target.error());
    }
    const auto kind = table.describe(handle)->kind;
    if (kind != TypeKind::Interface && kind != TypeKind::ParameterizedInterface) {
      return tl::unexpected(descriptor_error(
          std::format("{}: 'alias' is only valid on interfaces", context)));
    }
    if (target->value >= handle.value) {
      return tl::unexpected(descriptor_error(
          std::format("{}: alias '{}' must be declared before the interface", context, **alias)));
    }
    table.set_authoring_alias(handle, *target);
  }

  auto guid_type = get_optional_string(entry, "guid_type", context);
  if (!guid_type) {
    return tl::unexpected(guid_type.error());
  }
  if (*guid_type) {
    auto target = resolve_ref(table, **guid_type, context);
    if (!target) {
      return tl::unexpected(target.error());
    }
    table.set_guid_type(handle, *target);
  }

  auto piid = get_guid_field(entry, "piid", context);
  if (!piid) {
    return tl::unexpected(piid.error());
  }
  if (*piid) {
    if (!table.describe(handle)->is_generic()) {
      return tl::unexpected(descriptor_error(
          std::format("{}: 'piid' is only valid on generic instances", context)));
    }
    table.set_published_iid(handle, **piid);
  }
  return {};
}

}  // namespace

auto parse_type_table_json(const Json& json) -> Expected<TypeTable> {
  if (!json.is_object()) {
    return tl::unexpected(descriptor_error("type table json must be an object"));
  }
  auto types_it = json.find("types");
  if (types_it == json.end() || !types_it->is_array()) {
    return tl::unexpected(descriptor_error("types must be an array"));
  }

  TypeTable table;
  std::size_t index = 0;
  for (const auto& entry : *types_it) {
    if (!entry.is_object()) {
      return tl::unexpected(descriptor_error("type entry must be an object"));
    }
    auto kind = get_string_field(entry, "kind", "type");
    if (!kind) {
      return tl::unexpected(kind.error());
    }

    auto name = get_optional_string(entry, "name", "type");
    if (!name) {
      return tl::unexpected(name.error());
    }
    if (*name && (*name)->empty()) {
      return tl::unexpected(descriptor_error(
          std::format("types[{}]: 'name' must not be empty", index)));
    }
    const auto context = *name ? **name : std::format("types[{}]", index);

    Expected<TypeHandle> handle = tl::unexpected(descriptor_error(""));
    if (*kind == "instance") {
      handle = parse_instance(table, entry, context);
      if (handle && *name) {
        if (table.find(**name)) {
          // An instance may be listed under the name it interns to.
          if (*table.find(**name) != *handle) {
            return tl::unexpected(descriptor_error(std::format("duplicate type name: {}", **name)));
          }
        } else {
          table.add_alias(**name, *handle);
        }
      }
    } else {
      if (!*name) {
        return tl::unexpected(descriptor_error(std::format("{}: missing or invalid field 'name'", context)));
      }
      handle = parse_declared_type(table, entry, **name, *kind);
    }
    if (!handle) {
      return tl::unexpected(handle.error());
    }

    auto common = apply_common_fields(table, *handle, entry, context);
    if (!common) {
      return tl::unexpected(common.error());
    }
    ++index;
  }
  return table;
}

auto parse_type_table_text(std::string_view text) -> Expected<TypeTable> {
  auto json = Json::parse(std::string(text), nullptr, false);
  if (json.is_discarded()) {
    return tl::unexpected(descriptor_error("type table is not valid json"));
  }
  return parse_type_table_json(json);
}

}  // namespace iid::core
