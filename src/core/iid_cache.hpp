#pragma once

#include <cstddef>
#include <shared_mutex>
#include <unordered_map>

#include "core/error.hpp"
#include "core/guid.hpp"
#include "core/type_descriptor.hpp"

namespace iid::core {

/// Memoizes get_iid per type handle. Safe for concurrent callers: a first
/// computation runs outside the lock and the first inserted value wins.
/// Failures are not cached.
class IidCache {
 public:
  explicit IidCache(const TypeProvider& provider) : provider_(provider) {}

  auto get(TypeHandle type) -> Expected<Guid>;
  auto size() const -> std::size_t;
  auto clear() -> void;

 private:
  const TypeProvider& provider_;
  mutable std::shared_mutex mutex_;
  std::unordered_map<TypeHandle, Guid> entries_;
};

}  // namespace iid::core
