/**
 * @file cache_store.hpp
 * @brief Namespaced key/value cache with per-entry expiry
 */

#pragma once

#include <chrono>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "error.hpp"

namespace frontdoor {

/**
 * @brief Abstract namespaced cache backend
 *
 * Entries are replaced wholesale on write, so concurrent writers for the
 * same key leave whichever value was written last.
 */
class CacheStore {
 public:
  virtual ~CacheStore() = default;

  /**
   * @brief Look up a cached value
   * @return The value, or nullopt on a miss (absent or expired)
   * @throws CacheError if the backend itself failed
   */
  virtual std::optional<std::string> get(const std::string& ns,
                                         const std::string& key) = 0;

  /**
   * @brief Store a value for @p ttl
   * @throws CacheError if the backend rejected the write
   */
  virtual void set(const std::string& ns, const std::string& key,
                   const std::string& value, std::chrono::seconds ttl) = 0;
};

/**
 * @brief Process-local CacheStore guarded by a shared mutex
 */
class InMemoryCacheStore : public CacheStore {
 public:
  using Clock = std::chrono::steady_clock;

  std::optional<std::string> get(const std::string& ns,
                                 const std::string& key) override;
  void set(const std::string& ns, const std::string& key,
           const std::string& value, std::chrono::seconds ttl) override;

  /**
   * @brief Number of stored entries, including expired ones not yet evicted
   */
  [[nodiscard]] size_t size() const;

 private:
  struct Entry {
    std::string value;
    Clock::time_point expiresAt;
  };

  static std::string makeKey(const std::string& ns, const std::string& key);

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, Entry> entries_;
};

}  // namespace frontdoor
