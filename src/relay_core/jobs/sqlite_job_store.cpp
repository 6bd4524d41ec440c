#include "relay_core/jobs/sqlite_job_store.hpp"

#include <sqlite_modern_cpp.h>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "relay_core/db/pooled_connection.hpp"
#include "relay_core/db/sqlite_error_utils.hpp"
#include "relay_core/db/transaction.hpp"
#include "relay_core/util/time_utils.hpp"

namespace relay_core {

namespace {

const char *const kSelectJobColumns =
    "SELECT id, state, payload, attempts_made, stalled_count, progress_percent, "
    "progress_message, result, failure_kind, failure_reason, created_at, updated_at, "
    "processed_at, finished_at, delayed_until FROM jobs ";

std::optional<Job> select_job(sqlite::database &db, long long id) {
  std::optional<Job> result;
  db << std::string(kSelectJobColumns) + "WHERE id = ?" << id >>
      [&](long long job_id, std::string state, std::string payload, int attempts_made,
          int stalled_count, int progress_percent, std::string progress_message,
          std::optional<std::string> result_json, std::optional<std::string> failure_kind,
          std::optional<std::string> failure_reason, long long created_at, long long updated_at,
          std::optional<long long> processed_at, std::optional<long long> finished_at,
          std::optional<long long> delayed_until) {
        Job job;
        job.id = job_id;
        job.state = job_state_from_string(state);
        job.payload = nlohmann::json::parse(payload).get<JobPayload>();
        job.attempts_made = attempts_made;
        job.stalled_count = stalled_count;
        job.progress_percent = progress_percent;
        job.progress_message = std::move(progress_message);
        if (result_json)
          job.result = nlohmann::json::parse(*result_json).get<QueryResult>();
        if (failure_kind)
          job.failure_kind = error_kind_from_string(*failure_kind);
        if (failure_reason)
          job.failure_reason = *failure_reason;
        job.created_at = from_epoch_ms(created_at);
        job.updated_at = from_epoch_ms(updated_at);
        if (processed_at)
          job.processed_at = from_epoch_ms(*processed_at);
        if (finished_at)
          job.finished_at = from_epoch_ms(*finished_at);
        if (delayed_until)
          job.delayed_until = from_epoch_ms(*delayed_until);
        result = std::move(job);
      };
  return result;
}

const std::string kActive = to_string(JobState::ACTIVE);

}  // namespace

SqliteJobStore::SqliteJobStore(DatabaseManager &db_manager) : db_manager_(db_manager) {}

long long SqliteJobStore::create_job(const JobPayload &payload) {
  try {
    PooledConnection conn(db_manager_);
    const long long now = now_epoch_ms();
    const std::string payload_json = nlohmann::json(payload).dump();
    *conn << "INSERT INTO jobs (state, priority, payload, created_at, updated_at) "
             "VALUES (?, ?, ?, ?, ?)"
          << to_string(JobState::WAITING) << payload.priority << payload_json << now << now;
    return static_cast<long long>(conn->last_insert_rowid());
  } catch (const sqlite::sqlite_exception &e) {
    throw JobStoreError(format_db_error("create_job", e));
  } catch (const std::runtime_error &e) {
    throw JobStoreError(std::string("create_job failed: ") + e.what());
  }
}

std::optional<Job> SqliteJobStore::claim_next_job() {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, true);
    const long long now = now_epoch_ms();
    std::optional<long long> next_id;
    *conn << "SELECT id FROM jobs WHERE state = ? AND (delayed_until IS NULL OR delayed_until <= ?) "
             "ORDER BY priority ASC, id ASC LIMIT 1"
          << to_string(JobState::WAITING) << now >>
        [&](long long id) { next_id = id; };

    std::optional<Job> claimed;
    if (next_id) {
      *conn << "UPDATE jobs SET state = ?, attempts_made = attempts_made + 1, "
               "delayed_until = NULL, processed_at = ?, updated_at = ? WHERE id = ?"
            << kActive << now << now << *next_id;
      claimed = select_job(*conn, *next_id);
    }
    tx.commit();
    return claimed;
  } catch (const sqlite::sqlite_exception &e) {
    throw JobStoreError(format_db_error("claim_next_job", e));
  } catch (const std::runtime_error &e) {
    throw JobStoreError(std::string("claim_next_job failed: ") + e.what());
  } catch (const nlohmann::json::exception &e) {
    throw JobStoreError(std::string("claim_next_job failed: corrupt job row: ") + e.what());
  }
}

bool SqliteJobStore::update_progress(long long id, int claim, int percent,
                                     const std::string &message) {
  try {
    PooledConnection conn(db_manager_);
    const int clamped = percent > 100 ? 100 : percent;
    *conn << "UPDATE jobs SET progress_percent = ?, progress_message = ?, updated_at = ? "
             "WHERE id = ? AND state = ? AND attempts_made = ? AND progress_percent <= ?"
          << clamped << message << now_epoch_ms() << id << kActive << claim << clamped;
    return conn->rows_modified() > 0;
  } catch (const sqlite::sqlite_exception &e) {
    throw JobStoreError(format_db_error("update_progress", e));
  } catch (const std::runtime_error &e) {
    throw JobStoreError(std::string("update_progress failed: ") + e.what());
  }
}

bool SqliteJobStore::heartbeat(long long id, int claim) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE jobs SET updated_at = ? WHERE id = ? AND state = ? AND attempts_made = ?"
          << now_epoch_ms() << id << kActive << claim;
    return conn->rows_modified() > 0;
  } catch (const sqlite::sqlite_exception &e) {
    throw JobStoreError(format_db_error("heartbeat", e));
  } catch (const std::runtime_error &e) {
    throw JobStoreError(std::string("heartbeat failed: ") + e.what());
  }
}

bool SqliteJobStore::complete_job(long long id, int claim, const QueryResult &result) {
  try {
    PooledConnection conn(db_manager_);
    const long long now = now_epoch_ms();
    const std::string result_json = nlohmann::json(result).dump();
    *conn << "UPDATE jobs SET state = ?, result = ?, finished_at = ?, updated_at = ? "
             "WHERE id = ? AND state = ? AND attempts_made = ?"
          << to_string(JobState::COMPLETED) << result_json << now << now << id << kActive
          << claim;
    return conn->rows_modified() > 0;
  } catch (const sqlite::sqlite_exception &e) {
    throw JobStoreError(format_db_error("complete_job", e));
  } catch (const std::runtime_error &e) {
    throw JobStoreError(std::string("complete_job failed: ") + e.what());
  }
}

bool SqliteJobStore::fail_job(long long id, int claim, ErrorKind kind, const std::string &reason) {
  try {
    PooledConnection conn(db_manager_);
    const long long now = now_epoch_ms();
    *conn << "UPDATE jobs SET state = ?, failure_kind = ?, failure_reason = ?, finished_at = ?, "
             "updated_at = ? WHERE id = ? AND state = ? AND attempts_made = ?"
          << to_string(JobState::FAILED) << to_string(kind) << reason << now << now << id
          << kActive << claim;
    return conn->rows_modified() > 0;
  } catch (const sqlite::sqlite_exception &e) {
    throw JobStoreError(format_db_error("fail_job", e));
  } catch (const std::runtime_error &e) {
    throw JobStoreError(std::string("fail_job failed: ") + e.what());
  }
}

std::optional<Job> SqliteJobStore::get_job(long long id) {
  try {
    PooledConnection conn(db_manager_);
    return select_job(*conn, id);
  } catch (const sqlite::sqlite_exception &e) {
    throw JobStoreError(format_db_error("get_job", e));
  } catch (const std::runtime_error &e) {
    throw JobStoreError(std::string("get_job failed: ") + e.what());
  } catch (const nlohmann::json::exception &e) {
    throw JobStoreError(std::string("get_job failed: corrupt job row: ") + e.what());
  }
}

JobCounts SqliteJobStore::count_jobs() {
  try {
    PooledConnection conn(db_manager_);
    JobCounts counts;
    *conn << "SELECT state, COUNT(*) FROM jobs GROUP BY state" >>
        [&](std::string state, long long count) {
          switch (job_state_from_string(state)) {
            case JobState::WAITING: counts.waiting = count; break;
            case JobState::ACTIVE: counts.active = count; break;
            case JobState::COMPLETED: counts.completed = count; break;
            case JobState::FAILED: counts.failed = count; break;
          }
        };
    return counts;
  } catch (const sqlite::sqlite_exception &e) {
    throw JobStoreError(format_db_error("count_jobs", e));
  } catch (const std::runtime_error &e) {
    throw JobStoreError(std::string("count_jobs failed: ") + e.what());
  }
}

StalledRecovery SqliteJobStore::recover_stalled_jobs(std::chrono::milliseconds lock_duration,
                                                     int max_stalled_count,
                                                     std::chrono::milliseconds backoff_base) {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, true);
    const long long now = now_epoch_ms();
    const long long cutoff = now - lock_duration.count();

    std::vector<std::pair<long long, int>> stalled;
    *conn << "SELECT id, stalled_count FROM jobs WHERE state = ? AND updated_at <= ? ORDER BY id"
          << kActive << cutoff >>
        [&](long long id, int stalled_count) { stalled.emplace_back(id, stalled_count); };

    StalledRecovery recovery;
    for (const auto &[id, stalled_count] : stalled) {
      if (stalled_count < max_stalled_count) {
        const long long delayed_until =
            now + stalled_retry_delay(backoff_base, stalled_count + 1).count();
        *conn << "UPDATE jobs SET state = ?, stalled_count = stalled_count + 1, "
                 "progress_percent = 0, progress_message = '', delayed_until = ?, "
                 "updated_at = ? WHERE id = ?"
              << to_string(JobState::WAITING) << delayed_until << now << id;
        recovery.requeued.push_back(id);
      } else {
        *conn << "UPDATE jobs SET state = ?, failure_kind = ?, failure_reason = ?, "
                 "finished_at = ?, updated_at = ? WHERE id = ?"
              << to_string(JobState::FAILED) << to_string(ErrorKind::QueueStalled)
              << std::string(kStalledJobReason) << now << now << id;
        recovery.failed.push_back(id);
      }
    }
    tx.commit();
    return recovery;
  } catch (const sqlite::sqlite_exception &e) {
    throw JobStoreError(format_db_error("recover_stalled_jobs", e));
  } catch (const std::runtime_error &e) {
    throw JobStoreError(std::string("recover_stalled_jobs failed: ") + e.what());
  }
}

std::size_t SqliteJobStore::purge_finished_jobs(std::chrono::milliseconds completed_grace,
                                                std::chrono::milliseconds failed_grace) {
  try {
    PooledConnection conn(db_manager_);
    const long long now = now_epoch_ms();
    *conn << "DELETE FROM jobs WHERE (state = ? AND finished_at <= ?) OR "
             "(state = ? AND finished_at <= ?)"
          << to_string(JobState::COMPLETED) << now - completed_grace.count()
          << to_string(JobState::FAILED) << now - failed_grace.count();
    return static_cast<std::size_t>(conn->rows_modified());
  } catch (const sqlite::sqlite_exception &e) {
    throw JobStoreError(format_db_error("purge_finished_jobs", e));
  } catch (const std::runtime_error &e) {
    throw JobStoreError(std::string("purge_finished_jobs failed: ") + e.what());
  }
}

}  // namespace relay_core
