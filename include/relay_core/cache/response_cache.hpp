#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "relay_core/cache/cache_store.hpp"
#include "relay_core/cache/memory_cache_store.hpp"

namespace relay_core {

struct CacheOptions {
  bool enabled = true;
  std::chrono::seconds ttl{3600};
  std::size_t fallback_capacity = MemoryCacheStore::kDefaultCapacity;
  std::string key_prefix = "chat:";
};

struct CachedAnswer {
  std::string answer;
  nlohmann::json sources = nlohmann::json::array();
};

struct CacheStats {
  long long hits = 0;
  long long misses = 0;
  long long sets = 0;
  long long deletes = 0;
  long long errors = 0;
  std::size_t fallback_size = 0;
  bool enabled = true;
  bool durable = false;

  double hit_rate() const {
    const long long lookups = hits + misses;
    return lookups > 0 ? (100.0 * hits) / lookups : 0.0;
  }
};

/**
 * @class ResponseCache
 * @brief Answers keyed by a fingerprint of the normalized query text.
 *
 * Reads try the primary (durable) store first and fall back to a bounded
 * in-process store. Writes always land in the fallback so a primary outage
 * degrades hit rate rather than correctness. Store failures never escape:
 * they are logged, counted and treated as a miss or a no-op.
 *
 * Callers must not use the cache for queries that carry conversation
 * context; the same text can mean different things in different threads.
 */
class ResponseCache {
 public:
  explicit ResponseCache(CacheOptions options, std::unique_ptr<ICacheStore> primary = nullptr);

  // Lowercases, collapses whitespace runs to one space and trims. Unicode
  // whitespace counts as whitespace. Case folding covers Latin (through
  // Extended-A), Greek and Cyrillic; other scripts pass through unchanged.
  // Invalid UTF-8 is replaced with U+FFFD first.
  static std::string normalize(const std::string &text);

  // key_prefix + hex MD5 of normalize(text).
  std::string fingerprint(const std::string &text) const;

  std::optional<CachedAnswer> get(const std::string &key);
  void set(const std::string &key, const CachedAnswer &value,
           std::optional<std::chrono::seconds> ttl = std::nullopt);
  bool remove(const std::string &key);
  std::size_t clear();
  std::size_t size();

  // Drops expired entries from both stores. Expired entries are already
  // invisible to get(); this only reclaims their space.
  std::size_t purge_expired();

  // Round-trips a marker entry through the active store.
  bool health_check();

  CacheStats get_stats() const;
  void reset_stats();

  bool enabled() const {
    return options_.enabled;
  }
  bool durable() const {
    return primary_ != nullptr;
  }
  std::chrono::seconds ttl() const {
    return options_.ttl;
  }

  ResponseCache(const ResponseCache &) = delete;
  ResponseCache &operator=(const ResponseCache &) = delete;

 private:
  void record_error(const std::string &operation, const std::exception &e);

  CacheOptions options_;
  std::unique_ptr<ICacheStore> primary_;
  mutable MemoryCacheStore fallback_;

  mutable std::mutex stats_mutex_;
  CacheStats stats_;
};

}  // namespace relay_core
