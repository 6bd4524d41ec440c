#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "relay_core/cache/response_cache.hpp"
#include "relay_core/jobs/job_store.hpp"
#include "relay_core/worker/query_executor.hpp"

namespace relay_core {

namespace async {
class ProcessorPool;
}

struct QueueOptions {
  int concurrency = 3;
  std::chrono::milliseconds idle_poll_interval{500};
  std::chrono::milliseconds lock_duration{30000};
  std::chrono::milliseconds stalled_check_interval{30000};
  int max_stalled_count = 1;
  // First delay before a stalled job runs again; doubles per stall.
  std::chrono::milliseconds stalled_backoff{2000};
  std::chrono::milliseconds completed_retention{std::chrono::hours(1)};
  std::chrono::milliseconds failed_retention{std::chrono::hours(24)};
};

struct SubmitRequest {
  std::string query;
  std::string caller_id;   // empty means anonymous
  std::string session_id;  // empty means one is generated
  ConversationContext context;
  int priority = kDefaultJobPriority;
};

struct JobHandle {
  long long id = 0;
  std::shared_future<QueryResult> result;
};

struct QueueStats {
  JobCounts counts;
  std::string health;
  bool processing = false;
  bool paused = false;
  int concurrency = 0;
};

/**
 * @class JobQueue
 * @brief Bounded-concurrency asynchronous processing of submitted queries.
 *
 * Jobs are persisted in an IJobStore and processed by a pool of processor
 * threads. Each job consults the response cache (only when it carries no
 * conversation context), invokes the query executor on a miss, and writes
 * the answer back. Submitters get a JobHandle whose future is resolved
 * exactly once, when the store accepts the job's terminal transition.
 *
 * A maintenance thread renews the lock of jobs this queue is processing,
 * recovers stalled jobs, purges finished jobs past their retention and
 * sweeps expired answers out of the response cache.
 */
class JobQueue {
 public:
  JobQueue(QueueOptions options, std::unique_ptr<IJobStore> store, ResponseCache &cache,
           IQueryExecutor &executor);
  ~JobQueue();

  /**
   * @brief Recovers jobs left ACTIVE by a previous run, then starts the
   * processor pool and the maintenance thread.
   */
  void start();

  /**
   * @brief Stops taking new jobs and waits for in-progress jobs to finish.
   */
  void stop();

  void pause();
  void resume();

  // Enqueues the query and returns immediately.
  JobHandle submit(const SubmitRequest &request);

  // Throws QueueTimeoutError if the job has not finished within timeout. The
  // job itself keeps running. Rethrows the job's RelayError on failure.
  QueryResult await_result(const JobHandle &handle, std::chrono::milliseconds timeout) const;

  // Claims and processes one job on the calling thread. Returns false when
  // nothing was claimed.
  bool run_one_job(int processor_id = 0);

  std::optional<Job> get_job(long long id);
  QueueStats get_stats();

  // Purges finished jobs older than the given grace periods.
  std::size_t clean(std::chrono::milliseconds completed_grace,
                    std::chrono::milliseconds failed_grace);

  // Runs one stalled-job check immediately.
  StalledRecovery check_stalled_jobs();

  // Blocks a processor until work is signalled, the queue stops or timeout.
  void wait_for_work(std::chrono::milliseconds timeout);

  bool is_running() const {
    return running_.load();
  }
  bool is_paused() const {
    return paused_.load();
  }
  const QueueOptions &options() const {
    return options_;
  }

  JobQueue(const JobQueue &) = delete;
  JobQueue &operator=(const JobQueue &) = delete;

 private:
  void process_job(const Job &job, int processor_id);
  void finish_success(const Job &job, const QueryResult &result);
  void finish_failure(const Job &job, ErrorKind kind, const std::string &reason);
  void report_progress(const Job &job, int percent, const std::string &message);

  void resolve_waiter(long long id, const QueryResult &result);
  void reject_waiter(long long id, const RelayError &error);
  StalledRecovery recover_stalled(std::chrono::milliseconds lock_duration,
                                  std::chrono::milliseconds backoff_base);

  void notify_work(int count = 1);
  void maintenance_loop();
  void run_maintenance();

  QueueOptions options_;
  std::unique_ptr<IJobStore> store_;
  ResponseCache &cache_;
  IQueryExecutor &executor_;

  std::mutex waiters_mutex_;
  std::map<long long, std::promise<QueryResult>> waiters_;

  std::mutex claims_mutex_;
  std::map<long long, int> active_claims_;  // job id -> claim token

  std::mutex work_mutex_;
  std::condition_variable work_cv_;
  long long pending_work_ = 0;

  std::mutex maintenance_mutex_;
  std::condition_variable maintenance_cv_;
  std::thread maintenance_thread_;

  std::unique_ptr<async::ProcessorPool> pool_;
  std::atomic<bool> running_{false};
  std::atomic<bool> paused_{false};
};

}  // namespace relay_core
