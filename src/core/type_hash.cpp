#include "core/type_hash.hpp"

#include <stdexcept>

#include <openssl/evp.h>

namespace iid::core {

auto TypeHasher::CtxDeleter::operator()(evp_md_ctx_st* ctx) const -> void {
  EVP_MD_CTX_free(ctx);
}

TypeHasher::TypeHasher() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx_.get(), EVP_sha1(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex(sha1) failed");
  }
}

TypeHasher::~TypeHasher() = default;

auto TypeHasher::update(std::span<const std::uint8_t> bytes) -> void {
  if (bytes.empty()) {
    return;
  }
  if (EVP_DigestUpdate(ctx_.get(), bytes.data(), bytes.size()) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
}

auto TypeHasher::update(std::string_view text) -> void {
  update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text.data()),
                                       text.size()));
}

auto TypeHasher::finalize() -> TypeDigest {
  TypeDigest digest{};
  unsigned int size = 0;
  if (EVP_DigestFinal_ex(ctx_.get(), digest.bytes.data(), &size) != 1 ||
      size != digest.bytes.size()) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  return digest;
}

auto hash_type_bytes(std::span<const std::uint8_t> prefix, std::string_view payload) -> TypeDigest {
  TypeHasher hasher;
  hasher.update(prefix);
  hasher.update(payload);
  return hasher.finalize();
}

}  // namespace iid::core
