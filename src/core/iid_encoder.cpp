#include "core/iid_encoder.hpp"

#include <bit>
#include <cstring>
#include <utility>

namespace iid::core {

auto encode_guid(const TypeDigest& digest) -> Guid {
  std::array<std::uint8_t, 16> data{};
  std::memcpy(data.data(), digest.bytes.data(), data.size());

  if constexpr (std::endian::native == std::endian::little) {
    // data1
    std::swap(data[0], data[3]);
    std::swap(data[1], data[2]);
    // data2
    std::swap(data[4], data[5]);
    // data3, with the version in its high nibble
    const auto t = data[6];
    data[6] = data[7];
    data[7] = static_cast<std::uint8_t>((t & 0x0F) | (5 << 4));
  } else {
    data[6] = static_cast<std::uint8_t>((data[6] & 0x0F) | (5 << 4));
  }
  // variant
  data[8] = static_cast<std::uint8_t>((data[8] & 0x3F) | 0x80);

  Guid guid;
  std::memcpy(&guid, data.data(), sizeof(guid));
  return guid;
}

auto encode_iid(const Guid& ns, std::string_view signature) -> Guid {
  const auto prefix = ns.to_bytes();
  return encode_guid(hash_type_bytes(prefix, signature));
}

}  // namespace iid::core
