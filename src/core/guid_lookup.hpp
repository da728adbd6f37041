#pragma once

#include "core/error.hpp"
#include "core/guid.hpp"
#include "core/type_descriptor.hpp"

namespace iid::core {

/// Declared identifier of `type` (after its guid-type redirect). For a closed
/// generic instantiation this is the open definition's identifier.
auto get_guid(const TypeProvider& provider, TypeHandle type) -> Expected<Guid>;

/// Interface identifier of `type`. Non-generic types return get_guid; closed
/// generic types return their published identifier or compute one.
auto get_iid(const TypeProvider& provider, TypeHandle type) -> Expected<Guid>;

/// Always derives the identifier from the signature, ignoring any published
/// value. Only interface signatures of non-generic types parse as identifiers.
auto create_iid(const TypeProvider& provider, TypeHandle type) -> Expected<Guid>;

}  // namespace iid::core
