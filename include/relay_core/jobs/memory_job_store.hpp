#pragma once

#include <map>
#include <mutex>

#include "relay_core/jobs/job_store.hpp"

namespace relay_core {

// Job records held by the queue itself; lost when the process exits.
class MemoryJobStore : public IJobStore {
 public:
  MemoryJobStore() = default;

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
  Job *find_claimed_locked(long long id, int claim);

  std::mutex mtx_;
  std::map<long long, Job> jobs_;
  long long next_id_ = 1;
};

}  // namespace relay_core
