#pragma once

#include "relay_core/db/database_manager.hpp"
#include "relay_core/jobs/job_store.hpp"

namespace relay_core {

// Jobs in the shared database; waiting jobs survive a restart and jobs left
// ACTIVE by a dead process are picked up by stalled-job recovery.
class SqliteJobStore : public IJobStore {
 public:
  explicit SqliteJobStore(DatabaseManager &db_manager);

  long long create_job(const JobPayload &payload) override;
  std::optional<Job> claim_next_job() override;
  bool update_progress(long long id, int claim, int percent, const std::string &message) override;
  bool heartbeat(long long id, int claim) override;
  bool complete_job(long long id, int claim, const QueryResult &result) override;
  bool fail_job(long long id, int claim, ErrorKind kind, const std::string &reason) override;
  std::optional<Job> get_job(long long id) override;
  JobCounts count_jobs() override;
  StalledRecovery recover_stalled_jobs(std::chrono::milliseconds lock_duration,
                                       int max_stalled_count,
                                       std::chrono::milliseconds backoff_base) override;
  std::size_t purge_finished_jobs(std::chrono::milliseconds completed_grace,
                                  std::chrono::milliseconds failed_grace) override;

 private:
  DatabaseManager &db_manager_;
};

}  // namespace relay_core
