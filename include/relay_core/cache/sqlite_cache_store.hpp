#pragma once

#include "relay_core/cache/cache_store.hpp"
#include "relay_core/db/database_manager.hpp"

namespace relay_core {

// Durable store backed by the response_cache table of the shared database.
class SqliteCacheStore : public ICacheStore {
 public:
  explicit SqliteCacheStore(DatabaseManager &db_manager);

  std::optional<std::string> get(const std::string &key) override;
  void set(const std::string &key, const std::string &value, std::chrono::seconds ttl) override;
  bool remove(const std::string &key) override;
  std::size_t clear(const std::string &prefix) override;
  std::size_t size(const std::string &prefix) override;
  std::size_t purge_expired() override;
  bool is_available() override;

 private:
  DatabaseManager &db_manager_;
};

}  // namespace relay_core
