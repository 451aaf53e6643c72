#include "frontdoor/cache_store.hpp"

#include <mutex>

namespace frontdoor {

std::string InMemoryCacheStore::makeKey(const std::string& ns,
                                        const std::string& key) {
  std::string composite;
  composite.reserve(ns.size() + key.size() + 1);
  composite.append(ns).push_back('\0');
  composite.append(key);
  return composite;
}

std::optional<std::string> InMemoryCacheStore::get(const std::string& ns,
                                                   const std::string& key) {
  auto composite = makeKey(ns, key);
  {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(composite);
    if (it == entries_.end()) {
      return std::nullopt;
    }
    if (Clock::now() < it->second.expiresAt) {
      return it->second.value;
    }
  }

  // Expired: evict unless a writer refreshed it in the meantime
  std::unique_lock lock(mutex_);
  auto it = entries_.find(composite);
  if (it != entries_.end() && Clock::now() >= it->second.expiresAt) {
    entries_.erase(it);
  }
  return std::nullopt;
}

void InMemoryCacheStore::set(const std::string& ns, const std::string& key,
                             const std::string& value,
                             std::chrono::seconds ttl) {
  if (ttl.count() <= 0) {
    throw CacheError("TTL must be positive");
  }
  std::unique_lock lock(mutex_);
  entries_[makeKey(ns, key)] = Entry{value, Clock::now() + ttl};
}

size_t InMemoryCacheStore::size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

}  // namespace frontdoor
