#include "core/guid_lookup.hpp"

#include <format>

#include <spdlog/spdlog.h>

#include "core/iid_encoder.hpp"
#include "core/signature.hpp"

namespace iid::core {
namespace {

auto unknown_type(TypeHandle type) -> CoreError {
  return make_error(ErrorKind::UnknownType,
                    std::format("type handle {} is not known to the provider", type.value));
}

auto resolve_guid_type(const TypeProvider& provider, TypeHandle type)
    -> Expected<const TypeDescriptor*> {
  const auto* desc = provider.describe(type);
  if (!desc) {
    return tl::unexpected(unknown_type(type));
  }
  return identifier_carrier(provider, *desc);
}

}  // namespace

auto get_guid(const TypeProvider& provider, TypeHandle type) -> Expected<Guid> {
  auto desc = resolve_guid_type(provider, type);
  if (!desc) {
    return tl::unexpected(desc.error());
  }
  if (!(*desc)->declared_id) {
    return tl::unexpected(make_error(
        ErrorKind::MissingIdentifier,
        std::format("{} '{}' has no declared identifier", to_string((*desc)->kind),
                    (*desc)->full_name)));
  }
  return *(*desc)->declared_id;
}

auto get_iid(const TypeProvider& provider, TypeHandle type) -> Expected<Guid> {
  auto desc = resolve_guid_type(provider, type);
  if (!desc) {
    return tl::unexpected(desc.error());
  }
  if (!(*desc)->is_generic()) {
    return get_guid(provider, type);
  }
  if ((*desc)->published_iid) {
    return *(*desc)->published_iid;
  }
  return create_iid(provider, provider.describe(type)->guid_type.value_or(type));
}

auto create_iid(const TypeProvider& provider, TypeHandle type) -> Expected<Guid> {
  const auto* desc = provider.describe(type);
  if (!desc) {
    return tl::unexpected(unknown_type(type));
  }

  auto sig = build_signature(provider, type);
  if (!sig) {
    return tl::unexpected(sig.error());
  }

  if (!desc->is_generic()) {
    auto parsed = Guid::parse(*sig);
    if (!parsed) {
      return tl::unexpected(make_error(
          ErrorKind::InvalidIdentifier,
          std::format("signature '{}' of non-generic '{}' is not an identifier", *sig,
                      desc->full_name)));
    }
    return *parsed;
  }

  auto iid = encode_iid(*sig);
  spdlog::debug("derived iid {} for {} from {}", iid.to_string(), desc->full_name, *sig);
  return iid;
}

}  // namespace iid::core
