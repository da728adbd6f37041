#include "core/signature.hpp"

#include <format>
#include <span>
#include <string_view>

namespace iid::core {
namespace {

auto append_signature(const TypeProvider& provider, TypeHandle type, std::string& out)
    -> Expected<void>;

auto unknown_type(TypeHandle type) -> CoreError {
  return make_error(ErrorKind::UnknownType,
                    std::format("type handle {} is not known to the provider", type.value));
}

auto missing_id(const TypeDescriptor& desc) -> CoreError {
  return make_error(ErrorKind::MissingIdentifier,
                    std::format("{} '{}' has no declared identifier", to_string(desc.kind),
                                desc.full_name));
}

auto append_guid(const Guid& id, std::string& out) -> void {
  out += '{';
  out += id.to_string();
  out += '}';
}

// Braced identifier of `desc`, read through its guid-type redirect.
auto append_identifier(const TypeProvider& provider, const TypeDescriptor& desc,
                       std::string& out) -> Expected<void> {
  auto carrier = identifier_carrier(provider, desc);
  if (!carrier) {
    return tl::unexpected(carrier.error());
  }
  if (!(*carrier)->declared_id) {
    return tl::unexpected(missing_id(**carrier));
  }
  append_guid(*(*carrier)->declared_id, out);
  return {};
}

auto append_list(const TypeProvider& provider, std::span<const TypeHandle> types,
                 std::string& out) -> Expected<void> {
  for (std::size_t i = 0; i < types.size(); ++i) {
    if (i > 0) {
      out += ';';
    }
    auto res = append_signature(provider, types[i], out);
    if (!res) {
      return res;
    }
  }
  return {};
}

auto append_primitive(const TypeDescriptor& desc, std::string& out) -> Expected<void> {
  auto code = primitive_code(desc.primitive);
  if (code.empty()) {
    return tl::unexpected(make_error(
        ErrorKind::UnsupportedTypeShape,
        std::format("value type '{}' has no signature code", desc.full_name)));
  }
  out += code;
  return {};
}

auto append_signature(const TypeProvider& provider, TypeHandle type, std::string& out)
    -> Expected<void> {
  const auto* desc = provider.describe(type);
  if (!desc) {
    return tl::unexpected(unknown_type(type));
  }

  if (desc->signature_override) {
    out += desc->signature_override();
    return {};
  }

  if (desc->kind == TypeKind::Interface || desc->kind == TypeKind::ParameterizedInterface) {
    if (desc->authoring_alias) {
      const auto* alias = provider.describe(*desc->authoring_alias);
      if (!alias) {
        return tl::unexpected(unknown_type(*desc->authoring_alias));
      }
      desc = alias;
    }
  }

  if (desc->kind == TypeKind::Object) {
    out += "cinterface(IInspectable)";
    return {};
  }

  if (desc->is_generic()) {
    out += "pinterface(";
    auto res = append_identifier(provider, *desc, out);
    if (!res) {
      return res;
    }
    out += ';';
    res = append_list(provider, desc->generic_arguments, out);
    if (!res) {
      return res;
    }
    out += ')';
    return {};
  }

  switch (desc->kind) {
    case TypeKind::Primitive:
      return append_primitive(*desc, out);

    case TypeKind::Enum:
      out += "enum(";
      out += desc->full_name;
      out += desc->is_flags_enum ? ";u4)" : ";i4)";
      return {};

    case TypeKind::Struct: {
      out += "struct(";
      out += desc->full_name;
      out += ';';
      auto res = append_list(provider, desc->fields, out);
      if (!res) {
        return res;
      }
      out += ')';
      return {};
    }

    case TypeKind::String:
      out += "string";
      return {};

    case TypeKind::ProjectedClass:
      if (desc->default_interface) {
        out += "rc(";
        out += desc->full_name;
        out += ';';
        auto res = append_signature(provider, *desc->default_interface, out);
        if (!res) {
          return res;
        }
        out += ')';
        return {};
      }
      // No default interface: identified like a plain interface.
      break;

    case TypeKind::Delegate: {
      out += "delegate(";
      auto res = append_identifier(provider, *desc, out);
      if (!res) {
        return res;
      }
      out += ')';
      return {};
    }

    case TypeKind::ParameterizedInterface:
    case TypeKind::Interface:
    case TypeKind::Object:
      break;
  }

  return append_identifier(provider, *desc, out);
}

}  // namespace

auto build_signature(const TypeProvider& provider, TypeHandle type) -> Expected<std::string> {
  std::string signature;
  auto res = append_signature(provider, type, signature);
  if (!res) {
    return tl::unexpected(res.error());
  }
  return signature;
}

}  // namespace iid::core
