#include "core/iid_cache.hpp"

#include <mutex>

#include <spdlog/spdlog.h>

#include "core/guid_lookup.hpp"

namespace iid::core {

auto IidCache::get(TypeHandle type) -> Expected<Guid> {
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(type);
    if (it != entries_.end()) {
      return it->second;
    }
  }

  auto iid = get_iid(provider_, type);
  if (!iid) {
    return iid;
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto [it, inserted] = entries_.try_emplace(type, *iid);
  if (inserted) {
    spdlog::trace("iid cache miss: handle={} iid={}", type.value, it->second.to_string());
  }
  return it->second;
}

auto IidCache::size() const -> std::size_t {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_.size();
}

auto IidCache::clear() -> void {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  entries_.clear();
}

}  // namespace iid::core
