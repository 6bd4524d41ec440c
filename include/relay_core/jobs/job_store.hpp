#pragma once

#include <algorithm>
#include <chrono>
#include <optional>
#include <string>

#include "relay_core/jobs/job.hpp"

namespace relay_core {

class JobStoreError : public std::exception {
 public:
  explicit JobStoreError(const std::string &message) : message_(message) {}
  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class IJobStore
 * @brief Storage for job records and their state transitions.
 *
 * Every mutation of an ACTIVE job takes the claim token returned by
 * claim_next_job() (the job's attempts_made at claim time). A mutation whose
 * token no longer matches, or whose job is no longer ACTIVE, is refused and
 * reported by a false return, which is how terminal state is set at most once.
 */
class IJobStore {
 public:
  virtual ~IJobStore() = default;

  virtual long long create_job(const JobPayload &payload) = 0;

  // Moves the best WAITING job (priority ASC, then id ASC) whose delay, if
  // any, has passed to ACTIVE and bumps attempts_made. Returns std::nullopt
  // when nothing is ready.
  virtual std::optional<Job> claim_next_job() = 0;

  // Refuses to move progress backwards.
  virtual bool update_progress(long long id, int claim, int percent,
                               const std::string &message) = 0;

  // Refreshes the job's lock without touching its progress.
  virtual bool heartbeat(long long id, int claim) = 0;

  virtual bool complete_job(long long id, int claim, const QueryResult &result) = 0;
  virtual bool fail_job(long long id, int claim, ErrorKind kind, const std::string &reason) = 0;

  virtual std::optional<Job> get_job(long long id) = 0;
  virtual JobCounts count_jobs() = 0;

  // ACTIVE jobs whose last heartbeat is at least lock_duration old go back to
  // WAITING while stalled_count < max_stalled_count, otherwise to FAILED.
  // A requeued job is delayed by stalled_retry_delay(backoff_base, new count).
  virtual StalledRecovery recover_stalled_jobs(std::chrono::milliseconds lock_duration,
                                               int max_stalled_count,
                                               std::chrono::milliseconds backoff_base) = 0;

  // Deletes finished jobs older than their grace period; returns how many.
  virtual std::size_t purge_finished_jobs(std::chrono::milliseconds completed_grace,
                                          std::chrono::milliseconds failed_grace) = 0;
};

inline const char *const kStalledJobReason = "Job stalled more than allowable limit";

// Exponential: base for the first stall, doubling for each one after.
inline std::chrono::milliseconds stalled_retry_delay(std::chrono::milliseconds base,
                                                     int stalled_count) {
  const int shift = std::min(std::max(stalled_count - 1, 0), 16);
  return base * (1LL << shift);
}

}  // namespace relay_core
