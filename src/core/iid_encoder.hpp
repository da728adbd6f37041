#pragma once

#include <array>
#include <cstdint>
#include <string_view>

#include "core/guid.hpp"
#include "core/type_hash.hpp"

namespace iid::core {

/// Namespace for every parameterized interface identifier,
/// {11f47ad5-7b73-42c0-abae-878b1e16adee}. Frozen.
inline constexpr Guid kPinterfaceNamespace{
    0x11f47ad5, 0x7b73, 0x42c0, {0xab, 0xae, 0x87, 0x8b, 0x1e, 0x16, 0xad, 0xee}};

/// Turn a SHA-1 digest into a version 5 identifier. The first 16 bytes are
/// normalized to the native GUID layout and the version/variant bits are
/// patched in place.
auto encode_guid(const TypeDigest& digest) -> Guid;

/// Derive the identifier of `signature` within `ns`.
auto encode_iid(const Guid& ns, std::string_view signature) -> Guid;

inline auto encode_iid(std::string_view signature) -> Guid {
  return encode_iid(kPinterfaceNamespace, signature);
}

}  // namespace iid::core
