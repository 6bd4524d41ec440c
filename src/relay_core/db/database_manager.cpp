#include "relay_core/db/database_manager.hpp"

#include <sqlite3.h>

#include <iostream>
#include <stdexcept>

namespace relay_core {

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::initialize(const std::filesystem::path& db_path, int pool_size) {
  if (is_initialized_) {
    return;
  }

  if (db_path.has_parent_path()) {
    std::filesystem::create_directories(db_path.parent_path());
  }

  // 1. Perform one-time schema setup before creating the pool
  setup_schema(db_path);

  // 2. Create the connection pool for the stores to use
  pool_ = std::make_unique<ConnectionPool>(db_path.string(), pool_size);

  db_path_ = db_path;
  is_initialized_ = true;
  std::cout << "[Database] Opened " << db_path.string() << " (pool size " << pool_size << ")"
            << std::endl;
}

void DatabaseManager::shutdown() {
  if (!is_initialized_) {
    return;
  }
  pool_->shutdown();
  is_initialized_ = false;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (!is_initialized_) {
    throw std::runtime_error("DatabaseManager has not been initialized.");
  }
  return pool_->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (!is_initialized_) {
    return;
  }
  pool_->return_connection(std::move(conn));
}

void DatabaseManager::setup_schema(const std::filesystem::path& db_path) {
  // Use a temporary, single-use connection just for schema setup.
  sqlite::database db(db_path.string());
  if (!db.connection()) {
    throw std::runtime_error("Setup: Failed to get native database handle.");
  }
  db << "PRAGMA journal_mode = WAL;";

  db << R"(
      CREATE TABLE IF NOT EXISTS response_cache (
          key TEXT PRIMARY KEY,
          value TEXT NOT NULL,
          expires_at INTEGER NOT NULL
      )
    )";

  db << R"(
      CREATE TABLE IF NOT EXISTS jobs (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          state TEXT NOT NULL DEFAULT 'WAITING',
          priority INTEGER NOT NULL DEFAULT 10,
          payload TEXT NOT NULL,
          attempts_made INTEGER NOT NULL DEFAULT 0,
          stalled_count INTEGER NOT NULL DEFAULT 0,
          progress_percent INTEGER NOT NULL DEFAULT 0,
          progress_message TEXT NOT NULL DEFAULT '',
          result TEXT NULL,
          failure_kind TEXT NULL,
          failure_reason TEXT NULL,
          created_at INTEGER NOT NULL,
          updated_at INTEGER NOT NULL,
          processed_at INTEGER NULL,
          finished_at INTEGER NULL,
          delayed_until INTEGER NULL
      )
    )";

  // Databases created before stalled jobs were delayed lack the column.
  int has_delayed_until = 0;
  db << "SELECT COUNT(*) FROM pragma_table_info('jobs') WHERE name = 'delayed_until'" >>
      has_delayed_until;
  if (has_delayed_until == 0) {
    db << "ALTER TABLE jobs ADD COLUMN delayed_until INTEGER NULL";
  }

  db << R"(
      CREATE INDEX IF NOT EXISTS idx_jobs_state_priority
      ON jobs(state, priority, id)
    )";

  db << R"(
      CREATE INDEX IF NOT EXISTS idx_response_cache_expires
      ON response_cache(expires_at)
    )";
}

}  // namespace relay_core
