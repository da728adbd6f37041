#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <format>
#include <functional>
#include <string>
#include <string_view>

#include "core/error.hpp"

namespace iid::core {

/// 128-bit identifier with the platform GUID memory layout.
struct Guid {
  std::uint32_t data1 = 0;
  std::uint16_t data2 = 0;
  std::uint16_t data3 = 0;
  std::array<std::uint8_t, 8> data4{};

  constexpr Guid() = default;
  constexpr Guid(std::uint32_t d1, std::uint16_t d2, std::uint16_t d3,
                 std::array<std::uint8_t, 8> d4)
      : data1(d1), data2(d2), data3(d3), data4(d4) {}

  auto operator<=>(const Guid&) const = default;

  /// Canonical RFC 4122 byte order (all fields big-endian).
  auto to_bytes() const -> std::array<std::uint8_t, 16>;
  static auto from_bytes(const std::array<std::uint8_t, 16>& bytes) -> Guid;

  /// Lowercase 8-4-4-4-12 form without braces.
  auto to_string() const -> std::string;

  /// Accepts the 8-4-4-4-12 form, optionally wrapped in braces, any case.
  static auto parse(std::string_view text) -> Expected<Guid>;

  auto version() const -> int { return data3 >> 12; }
  auto variant_bits() const -> int { return data4[0] >> 6; }
};

static_assert(sizeof(Guid) == 16, "Guid must match the 16-byte GUID layout");

}  // namespace iid::core

template <>
struct std::hash<iid::core::Guid> {
  auto operator()(const iid::core::Guid& g) const -> std::size_t {
    std::size_t h = std::hash<std::uint32_t>{}(g.data1);
    h ^= std::hash<std::uint32_t>{}((std::uint32_t{g.data2} << 16) | g.data3) << 1;
    std::uint64_t tail = 0;
    for (auto b : g.data4) {
      tail = (tail << 8) | b;
    }
    h ^= std::hash<std::uint64_t>{}(tail) << 2;
    return h;
  }
};

template <>
struct std::formatter<iid::core::Guid> : std::formatter<std::string> {
  auto format(const iid::core::Guid& g, std::format_context& ctx) const {
    return formatter<std::string>::format(g.to_string(), ctx);
  }
};
