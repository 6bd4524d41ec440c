#include "relay_core/cache/memory_cache_store.hpp"

#include <vector>

namespace relay_core {

namespace {

bool has_prefix(const std::string &key, const std::string &prefix) {
  return key.compare(0, prefix.size(), prefix) == 0;
}

}  // namespace

MemoryCacheStore::MemoryCacheStore(std::size_t capacity) : capacity_(capacity > 0 ? capacity : 1) {}

std::optional<std::string> MemoryCacheStore::get(const std::string &key) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  if (Clock::now() >= it->second.expires_at) {
    erase_locked(it);
    return std::nullopt;
  }
  lru_.splice(lru_.begin(), lru_, it->second.lru_position);
  return it->second.value;
}

void MemoryCacheStore::set(const std::string &key, const std::string &value,
                           std::chrono::seconds ttl) {
  std::lock_guard<std::mutex> lock(mtx_);
  const auto expires_at = Clock::now() + ttl;

  auto it = entries_.find(key);
  if (it != entries_.end()) {
    it->second.value = value;
    it->second.expires_at = expires_at;
    lru_.splice(lru_.begin(), lru_, it->second.lru_position);
    return;
  }

  while (entries_.size() >= capacity_ && !lru_.empty()) {
    erase_locked(entries_.find(lru_.back()));
  }
  lru_.push_front(key);
  entries_.emplace(key, Entry{value, expires_at, lru_.begin()});
}

bool MemoryCacheStore::remove(const std::string &key) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return false;
  }
  erase_locked(it);
  return true;
}

std::size_t MemoryCacheStore::clear(const std::string &prefix) {
  std::lock_guard<std::mutex> lock(mtx_);
  std::vector<std::string> doomed;
  for (const auto &[key, entry] : entries_) {
    if (has_prefix(key, prefix)) {
      doomed.push_back(key);
    }
  }
  for (const auto &key : doomed) {
    erase_locked(entries_.find(key));
  }
  return doomed.size();
}

std::size_t MemoryCacheStore::size(const std::string &prefix) {
  std::lock_guard<std::mutex> lock(mtx_);
  const auto now = Clock::now();
  std::size_t count = 0;
  for (const auto &[key, entry] : entries_) {
    if (now < entry.expires_at && has_prefix(key, prefix)) {
      ++count;
    }
  }
  return count;
}

std::size_t MemoryCacheStore::purge_expired() {
  std::lock_guard<std::mutex> lock(mtx_);
  const auto now = Clock::now();
  std::size_t purged = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (now >= it->second.expires_at) {
      lru_.erase(it->second.lru_position);
      it = entries_.erase(it);
      ++purged;
    } else {
      ++it;
    }
  }
  return purged;
}

void MemoryCacheStore::erase_locked(std::unordered_map<std::string, Entry>::iterator it) {
  lru_.erase(it->second.lru_position);
  entries_.erase(it);
}

}  // namespace relay_core
