#include "relay_core/cache/sqlite_cache_store.hpp"

#include <sqlite_modern_cpp.h>

#include "relay_core/db/pooled_connection.hpp"
#include "relay_core/db/sqlite_error_utils.hpp"
#include "relay_core/util/time_utils.hpp"

namespace relay_core {

SqliteCacheStore::SqliteCacheStore(DatabaseManager &db_manager) : db_manager_(db_manager) {}

std::optional<std::string> SqliteCacheStore::get(const std::string &key) {
  try {
    PooledConnection conn(db_manager_);
    std::optional<std::string> value;
    long long expires_at = 0;
    *conn << "SELECT value, expires_at FROM response_cache WHERE key = ?" << key >>
        [&](std::string stored, long long stored_expires_at) {
          value = std::move(stored);
          expires_at = stored_expires_at;
        };
    if (!value) {
      return std::nullopt;
    }
    const long long now = now_epoch_ms();
    if (expires_at <= now) {
      *conn << "DELETE FROM response_cache WHERE key = ? AND expires_at <= ?" << key << now;
      return std::nullopt;
    }
    return value;
  } catch (const sqlite::sqlite_exception &e) {
    throw CacheStoreError(format_db_error("cache get", e));
  } catch (const std::runtime_error &e) {
    throw CacheStoreError(std::string("cache get failed: ") + e.what());
  }
}

void SqliteCacheStore::set(const std::string &key, const std::string &value,
                           std::chrono::seconds ttl) {
  try {
    PooledConnection conn(db_manager_);
    const long long expires_at =
        now_epoch_ms() + std::chrono::duration_cast<std::chrono::milliseconds>(ttl).count();
    *conn << "INSERT OR REPLACE INTO response_cache (key, value, expires_at) VALUES (?, ?, ?)"
          << key << value << expires_at;
  } catch (const sqlite::sqlite_exception &e) {
    throw CacheStoreError(format_db_error("cache set", e));
  } catch (const std::runtime_error &e) {
    throw CacheStoreError(std::string("cache set failed: ") + e.what());
  }
}

bool SqliteCacheStore::remove(const std::string &key) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM response_cache WHERE key = ?" << key;
    return conn->rows_modified() > 0;
  } catch (const sqlite::sqlite_exception &e) {
    throw CacheStoreError(format_db_error("cache remove", e));
  } catch (const std::runtime_error &e) {
    throw CacheStoreError(std::string("cache remove failed: ") + e.what());
  }
}

std::size_t SqliteCacheStore::clear(const std::string &prefix) {
  try {
    PooledConnection conn(db_manager_);
    // substr() instead of LIKE so '%' and '_' in the prefix stay literal.
    *conn << "DELETE FROM response_cache WHERE substr(key, 1, ?) = ?"
          << static_cast<int>(prefix.size()) << prefix;
    return static_cast<std::size_t>(conn->rows_modified());
  } catch (const sqlite::sqlite_exception &e) {
    throw CacheStoreError(format_db_error("cache clear", e));
  } catch (const std::runtime_error &e) {
    throw CacheStoreError(std::string("cache clear failed: ") + e.what());
  }
}

std::size_t SqliteCacheStore::size(const std::string &prefix) {
  try {
    PooledConnection conn(db_manager_);
    long long count = 0;
    *conn << "SELECT COUNT(*) FROM response_cache WHERE substr(key, 1, ?) = ? AND expires_at > ?"
          << static_cast<int>(prefix.size()) << prefix << now_epoch_ms() >>
        count;
    return static_cast<std::size_t>(count);
  } catch (const sqlite::sqlite_exception &e) {
    throw CacheStoreError(format_db_error("cache size", e));
  } catch (const std::runtime_error &e) {
    throw CacheStoreError(std::string("cache size failed: ") + e.what());
  }
}

bool SqliteCacheStore::is_available() {
  if (!db_manager_.is_initialized()) {
    return false;
  }
  try {
    PooledConnection conn(db_manager_);
    int one = 0;
    *conn << "SELECT 1" >> one;
    return one == 1;
  } catch (const sqlite::sqlite_exception &e) {
    // A busy database is contended, not down.
    return is_transient(classify_sqlite_code(e.get_code()));
  } catch (const std::runtime_error &) {
    return false;
  }
}

std::size_t SqliteCacheStore::purge_expired() {
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM response_cache WHERE expires_at <= ?" << now_epoch_ms();
    return static_cast<std::size_t>(conn->rows_modified());
  } catch (const sqlite::sqlite_exception &e) {
    throw CacheStoreError(format_db_error("cache purge", e));
  } catch (const std::runtime_error &e) {
    throw CacheStoreError(std::string("cache purge failed: ") + e.what());
  }
}

}  // namespace relay_core
