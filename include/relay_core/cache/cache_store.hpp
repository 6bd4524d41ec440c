#pragma once

#include <chrono>
#include <cstddef>
#include <exception>
#include <optional>
#include <string>

namespace relay_core {

class CacheStoreError : public std::exception {
 public:
  explicit CacheStoreError(const std::string &message) : message_(message) {}
  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class ICacheStore
 * @brief Key/value storage with per-entry time-to-live.
 *
 * Implementations report failures by throwing CacheStoreError; expired
 * entries behave as if they were never stored.
 */
class ICacheStore {
 public:
  virtual ~ICacheStore() = default;

  virtual std::optional<std::string> get(const std::string &key) = 0;
  virtual void set(const std::string &key, const std::string &value,
                   std::chrono::seconds ttl) = 0;
  virtual bool remove(const std::string &key) = 0;

  // Removes every entry whose key starts with prefix; returns how many.
  virtual std::size_t clear(const std::string &prefix) = 0;

  // Live (unexpired) entries whose key starts with prefix.
  virtual std::size_t size(const std::string &prefix) = 0;

  // Deletes every expired entry; returns how many were removed.
  virtual std::size_t purge_expired() = 0;

  virtual bool is_available() = 0;
};

}  // namespace relay_core
