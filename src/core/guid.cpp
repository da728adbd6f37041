#include "core/guid.hpp"

#include <charconv>

namespace iid::core {
namespace {

constexpr std::size_t kGuidTextLength = 36;

auto parse_hex(std::string_view text, std::uint64_t& out) -> bool {
  if (text.empty()) {
    return false;
  }
  for (char c : text) {
    const bool digit = c >= '0' && c <= '9';
    const bool lower = c >= 'a' && c <= 'f';
    const bool upper = c >= 'A' && c <= 'F';
    if (!digit && !lower && !upper) {
      return false;
    }
  }
  auto res = std::from_chars(text.data(), text.data() + text.size(), out, 16);
  return res.ec == std::errc{} && res.ptr == text.data() + text.size();
}

}  // namespace

auto Guid::to_bytes() const -> std::array<std::uint8_t, 16> {
  std::array<std::uint8_t, 16> bytes{};
  bytes[0] = static_cast<std::uint8_t>((data1 >> 24) & 0xFFu);
  bytes[1] = static_cast<std::uint8_t>((data1 >> 16) & 0xFFu);
  bytes[2] = static_cast<std::uint8_t>((data1 >> 8) & 0xFFu);
  bytes[3] = static_cast<std::uint8_t>(data1 & 0xFFu);
  bytes[4] = static_cast<std::uint8_t>((data2 >> 8) & 0xFFu);
  bytes[5] = static_cast<std::uint8_t>(data2 & 0xFFu);
  bytes[6] = static_cast<std::uint8_t>((data3 >> 8) & 0xFFu);
  bytes[7] = static_cast<std::uint8_t>(data3 & 0xFFu);
  for (std::size_t i = 0; i < data4.size(); ++i) {
    bytes[8 + i] = data4[i];
  }
  return bytes;
}

auto Guid::from_bytes(const std::array<std::uint8_t, 16>& bytes) -> Guid {
  Guid g;
  g.data1 = (std::uint32_t{bytes[0]} << 24) | (std::uint32_t{bytes[1]} << 16) |
            (std::uint32_t{bytes[2]} << 8) | std::uint32_t{bytes[3]};
  g.data2 = static_cast<std::uint16_t>((bytes[4] << 8) | bytes[5]);
  g.data3 = static_cast<std::uint16_t>((bytes[6] << 8) | bytes[7]);
  for (std::size_t i = 0; i < g.data4.size(); ++i) {
    g.data4[i] = bytes[8 + i];
  }
  return g;
}

auto Guid::to_string() const -> std::string {
  return std::format("{:08x}-{:04x}-{:04x}-{:02x}{:02x}-{:02x}{:02x}{:02x}{:02x}{:02x}{:02x}",
                     data1, data2, data3, data4[0], data4[1], data4[2], data4[3],
                     data4[4], data4[5], data4[6], data4[7]);
}

auto Guid::parse(std::string_view text) -> Expected<Guid> {
  const std::string input(text);
  if (text.size() == kGuidTextLength + 2 && text.front() == '{' && text.back() == '}') {
    text = text.substr(1, kGuidTextLength);
  }
  if (text.size() != kGuidTextLength || text[8] != '-' || text[13] != '-' ||
      text[18] != '-' || text[23] != '-') {
    return tl::unexpected(make_error(ErrorKind::InvalidIdentifier,
                                     std::format("malformed identifier '{}'", input)));
  }

  std::uint64_t d1 = 0;
  std::uint64_t d2 = 0;
  std::uint64_t d3 = 0;
  std::uint64_t clock = 0;
  std::uint64_t node = 0;
  if (!parse_hex(text.substr(0, 8), d1) || !parse_hex(text.substr(9, 4), d2) ||
      !parse_hex(text.substr(14, 4), d3) || !parse_hex(text.substr(19, 4), clock) ||
      !parse_hex(text.substr(24, 12), node)) {
    return tl::unexpected(make_error(ErrorKind::InvalidIdentifier,
                                     std::format("non-hex digit in identifier '{}'", input)));
  }

  Guid g;
  g.data1 = static_cast<std::uint32_t>(d1);
  g.data2 = static_cast<std::uint16_t>(d2);
  g.data3 = static_cast<std::uint16_t>(d3);
  g.data4[0] = static_cast<std::uint8_t>((clock >> 8) & 0xFFu);
  g.data4[1] = static_cast<std::uint8_t>(clock & 0xFFu);
  for (int i = 0; i < 6; ++i) {
    g.data4[2 + i] = static_cast<std::uint8_t>((node >> (8 * (5 - i))) & 0xFFu);
  }
  return g;
}

}  // namespace iid::core
