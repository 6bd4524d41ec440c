#pragma once

#include <chrono>
#include <list>
#include <mutex>
#include <unordered_map>

#include "relay_core/cache/cache_store.hpp"

namespace relay_core {

// Bounded in-process store. Evicts the least recently used entry when full
// and drops expired entries when they are touched or purged.
class MemoryCacheStore : public ICacheStore {
 public:
  static constexpr std::size_t kDefaultCapacity = 100;

  explicit MemoryCacheStore(std::size_t capacity = kDefaultCapacity);

  std::optional<std::string> get(const std::string &key) override;
  void set(const std::string &key, const std::string &value, std::chrono::seconds ttl) override;
  bool remove(const std::string &key) override;
  std::size_t clear(const std::string &prefix) override;
  std::size_t size(const std::string &prefix) override;
  std::size_t purge_expired() override;
  bool is_available() override {
    return true;
  }

  std::size_t capacity() const {
    return capacity_;
  }

 private:
  using Clock = std::chrono::steady_clock;

  struct Entry {
    std::string value;
    Clock::time_point expires_at;
    std::list<std::string>::iterator lru_position;
  };

  void erase_locked(std::unordered_map<std::string, Entry>::iterator it);

  std::size_t capacity_;
  std::mutex mtx_;
  std::unordered_map<std::string, Entry> entries_;
  std::list<std::string> lru_;  // front = most recently used
};

}  // namespace relay_core
