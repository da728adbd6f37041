#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>

struct evp_md_ctx_st;

namespace iid::core {

/// 160-bit SHA-1 digest used for namespace-derived identifiers.
struct TypeDigest {
  std::array<std::uint8_t, 20> bytes{};
};

/// Incremental SHA-1 over OpenSSL's EVP interface.
class TypeHasher {
 public:
  TypeHasher();
  ~TypeHasher();

  TypeHasher(const TypeHasher&) = delete;
  auto operator=(const TypeHasher&) -> TypeHasher& = delete;

  auto update(std::span<const std::uint8_t> bytes) -> void;
  auto update(std::string_view text) -> void;
  auto finalize() -> TypeDigest;

 private:
  struct CtxDeleter {
    auto operator()(evp_md_ctx_st* ctx) const -> void;
  };
  std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
};

/// Hash the namespace bytes followed by the UTF-8 signature.
auto hash_type_bytes(std::span<const std::uint8_t> prefix, std::string_view payload) -> TypeDigest;

}  // namespace iid::core
