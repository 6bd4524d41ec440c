#include "relay_core/jobs/job_queue.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

#include "relay_core/async/processor_pool.hpp"
#include "relay_core/util/time_utils.hpp"

namespace relay_core {

namespace {

constexpr long long kUnhealthyFailedThreshold = 10;
constexpr long long kDegradedWaitingThreshold = 50;
constexpr long long kDegradedActiveThreshold = 10;

std::string queue_health(const JobCounts &counts) {
  if (counts.failed > kUnhealthyFailedThreshold) {
    return "unhealthy";
  }
  if (counts.waiting > kDegradedWaitingThreshold || counts.active > kDegradedActiveThreshold) {
    return "degraded";
  }
  return "healthy";
}

}  // namespace

JobQueue::JobQueue(QueueOptions options, std::unique_ptr<IJobStore> store, ResponseCache &cache,
                   IQueryExecutor &executor)
    : options_(std::move(options)), store_(std::move(store)), cache_(cache), executor_(executor) {
  if (!store_) {
    throw std::invalid_argument("JobQueue requires a job store.");
  }
  if (options_.concurrency < 1) {
    throw std::invalid_argument("JobQueue concurrency must be at least 1.");
  }
}

JobQueue::~JobQueue() {
  stop();
  std::lock_guard<std::mutex> lock(waiters_mutex_);
  for (auto &[id, promise] : waiters_) {
    promise.set_exception(std::make_exception_ptr(
        RelayError(ErrorKind::Unavailable, "Job queue shut down before job " +
                                               std::to_string(id) + " finished")));
  }
  waiters_.clear();
}

void JobQueue::start() {
  if (running_.exchange(true)) {
    std::cerr << "[JobQueue] start() called while already running" << std::endl;
    return;
  }
  paused_.store(false);

  // Nothing in this process holds a claim yet, so every ACTIVE job is left
  // over from a previous run and may run again right away.
  try {
    recover_stalled(std::chrono::milliseconds(0), std::chrono::milliseconds(0));
  } catch (const JobStoreError &e) {
    std::cerr << "[JobQueue] Startup recovery failed: " << e.what() << std::endl;
  }

  pool_ = std::make_unique<async::ProcessorPool>(static_cast<size_t>(options_.concurrency), *this);
  pool_->start();
  maintenance_thread_ = std::thread(&JobQueue::maintenance_loop, this);
  std::cout << "[JobQueue] Started with concurrency " << options_.concurrency << std::endl;
}

void JobQueue::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  std::cout << "[JobQueue] Stopping..." << std::endl;
  if (pool_) {
    pool_->stop();
  }
  {
    std::lock_guard<std::mutex> lock(work_mutex_);
  }
  work_cv_.notify_all();
  {
    std::lock_guard<std::mutex> lock(maintenance_mutex_);
  }
  maintenance_cv_.notify_all();

  pool_.reset();
  if (maintenance_thread_.joinable()) {
    maintenance_thread_.join();
  }
  std::cout << "[JobQueue] Stopped" << std::endl;
}

void JobQueue::pause() {
  paused_.store(true);
  std::cout << "[JobQueue] Paused" << std::endl;
}

void JobQueue::resume() {
  paused_.store(false);
  std::cout << "[JobQueue] Resumed" << std::endl;
  notify_work(options_.concurrency);
}

JobHandle JobQueue::submit(const SubmitRequest &request) {
  JobPayload payload;
  payload.query = request.query;
  payload.caller_id = request.caller_id.empty() ? kAnonymousCaller : request.caller_id;
  payload.session_id = request.session_id.empty()
                           ? "session-" + std::to_string(now_epoch_ms())
                           : request.session_id;
  payload.context = request.context;
  payload.priority = request.priority;

  std::promise<QueryResult> promise;
  JobHandle handle;
  handle.result = promise.get_future().share();
  {
    // Held across create_job so a fast processor cannot finish the job
    // before its waiter is registered.
    std::lock_guard<std::mutex> lock(waiters_mutex_);
    try {
      handle.id = store_->create_job(payload);
    } catch (const JobStoreError &e) {
      throw RelayError(ErrorKind::Internal, std::string("Failed to enqueue job: ") + e.what());
    }
    waiters_.emplace(handle.id, std::move(promise));
  }

  std::cout << "[JobQueue] Job " << handle.id << " queued (caller " << payload.caller_id
            << ", session " << payload.session_id << ")" << std::endl;
  notify_work();
  return handle;
}

QueryResult JobQueue::await_result(const JobHandle &handle,
                                   std::chrono::milliseconds timeout) const {
  if (handle.result.wait_for(timeout) != std::future_status::ready) {
    nlohmann::json details;
    details["jobId"] = handle.id;
    details["timeoutMs"] = timeout.count();
    throw QueueTimeoutError("Request processing timeout", details);
  }
  return handle.result.get();
}

bool JobQueue::run_one_job(int processor_id) {
  if (paused_.load()) {
    return false;
  }

  std::optional<Job> job;
  try {
    job = store_->claim_next_job();
  } catch (const JobStoreError &e) {
    std::cerr << "Processor [" << processor_id << "] failed to claim a job: " << e.what()
              << std::endl;
    return false;
  }
  if (!job) {
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(claims_mutex_);
    active_claims_[job->id] = job->attempts_made;
  }
  process_job(*job, processor_id);
  {
    std::lock_guard<std::mutex> lock(claims_mutex_);
    active_claims_.erase(job->id);
  }
  return true;
}

void JobQueue::process_job(const Job &job, int processor_id) {
  std::cout << "Processor [" << processor_id << "] processing job " << job.id << " (attempt "
            << job.attempts_made << ")" << std::endl;
  const auto started = std::chrono::steady_clock::now();
  const JobPayload &payload = job.payload;

  QueryResult result;
  result.job_id = job.id;
  result.caller_id = payload.caller_id;
  result.session_id = payload.session_id;

  try {
    report_progress(job, 10, "Job started");

    // Answers for a query with conversation context depend on that context,
    // so they are neither served from nor written to the cache.
    const bool cacheable = cache_.enabled() && payload.context.empty();
    std::string cache_key;
    if (cacheable) {
      report_progress(job, 20, "Checking cache");
      cache_key = cache_.fingerprint(payload.query);
      if (auto hit = cache_.get(cache_key)) {
        result.answer = hit->answer;
        result.sources = hit->sources;
        result.cached = true;
        result.elapsed_ms = elapsed_ms_since(started);
        report_progress(job, 100, "Complete (cached)");
        std::cout << "Processor [" << processor_id << "] job " << job.id << " served from cache"
                  << std::endl;
        finish_success(job, result);
        return;
      }
    }

    report_progress(job, 40, "Invoking worker");
    QueryRequest request;
    request.query = payload.query;
    request.caller_id = payload.caller_id;
    request.context = payload.context;
    WorkerAnswer answer = executor_.execute_query(request);

    if (cacheable) {
      report_progress(job, 80, "Caching result");
      CachedAnswer entry;
      entry.answer = answer.answer;
      entry.sources = answer.sources;
      cache_.set(cache_key, entry);
    }

    result.answer = std::move(answer.answer);
    result.sources = std::move(answer.sources);
    result.usage = std::move(answer.usage);
    result.cached = false;
    result.elapsed_ms = elapsed_ms_since(started);
    report_progress(job, 100, "Complete");
    finish_success(job, result);
  } catch (const RelayError &e) {
    std::cerr << "Processor [" << processor_id << "] job " << job.id << " failed ("
              << to_string(e.kind()) << "): " << e.what() << std::endl;
    finish_failure(job, e.kind(), e.what());
  } catch (const std::exception &e) {
    std::cerr << "Processor [" << processor_id << "] ERROR processing job " << job.id << ": "
              << e.what() << std::endl;
    finish_failure(job, ErrorKind::Internal, e.what());
  }
}

void JobQueue::finish_success(const Job &job, const QueryResult &result) {
  bool accepted = false;
  try {
    accepted = store_->complete_job(job.id, job.attempts_made, result);
  } catch (const JobStoreError &e) {
    // The answer exists even if recording it failed; the caller still gets it.
    std::cerr << "[JobQueue] Failed to record completion of job " << job.id << ": " << e.what()
              << std::endl;
    accepted = true;
  }
  if (!accepted) {
    std::cerr << "[JobQueue] Dropping result for job " << job.id
              << ": claim was superseded" << std::endl;
    return;
  }
  resolve_waiter(job.id, result);
}

void JobQueue::finish_failure(const Job &job, ErrorKind kind, const std::string &reason) {
  bool accepted = false;
  try {
    accepted = store_->fail_job(job.id, job.attempts_made, kind, reason);
  } catch (const JobStoreError &e) {
    std::cerr << "[JobQueue] Failed to record failure of job " << job.id << ": " << e.what()
              << std::endl;
    accepted = true;
  }
  if (!accepted) {
    std::cerr << "[JobQueue] Dropping failure for job " << job.id
              << ": claim was superseded" << std::endl;
    return;
  }
  nlohmann::json details;
  details["jobId"] = job.id;
  reject_waiter(job.id, RelayError(kind, reason, details));
}

void JobQueue::report_progress(const Job &job, int percent, const std::string &message) {
  try {
    store_->update_progress(job.id, job.attempts_made, percent, message);
  } catch (const JobStoreError &e) {
    std::cerr << "[JobQueue] Failed to report progress for job " << job.id << ": " << e.what()
              << std::endl;
  }
}

void JobQueue::resolve_waiter(long long id, const QueryResult &result) {
  std::lock_guard<std::mutex> lock(waiters_mutex_);
  auto it = waiters_.find(id);
  if (it == waiters_.end()) {
    return;
  }
  it->second.set_value(result);
  waiters_.erase(it);
}

void JobQueue::reject_waiter(long long id, const RelayError &error) {
  std::lock_guard<std::mutex> lock(waiters_mutex_);
  auto it = waiters_.find(id);
  if (it == waiters_.end()) {
    return;
  }
  it->second.set_exception(std::make_exception_ptr(error));
  waiters_.erase(it);
}

std::optional<Job> JobQueue::get_job(long long id) {
  try {
    return store_->get_job(id);
  } catch (const JobStoreError &e) {
    throw RelayError(ErrorKind::Internal, std::string("Failed to load job: ") + e.what());
  }
}

QueueStats JobQueue::get_stats() {
  QueueStats stats;
  try {
    stats.counts = store_->count_jobs();
  } catch (const JobStoreError &e) {
    throw RelayError(ErrorKind::Internal, std::string("Failed to count jobs: ") + e.what());
  }
  stats.health = queue_health(stats.counts);
  stats.processing = running_.load();
  stats.paused = paused_.load();
  stats.concurrency = options_.concurrency;
  return stats;
}

std::size_t JobQueue::clean(std::chrono::milliseconds completed_grace,
                            std::chrono::milliseconds failed_grace) {
  std::size_t purged = 0;
  try {
    purged = store_->purge_finished_jobs(completed_grace, failed_grace);
  } catch (const JobStoreError &e) {
    throw RelayError(ErrorKind::Internal, std::string("Failed to clean jobs: ") + e.what());
  }
  if (purged > 0) {
    std::cout << "[JobQueue] Cleaned " << purged << " finished jobs" << std::endl;
  }
  return purged;
}

StalledRecovery JobQueue::check_stalled_jobs() {
  return recover_stalled(options_.lock_duration, options_.stalled_backoff);
}

StalledRecovery JobQueue::recover_stalled(std::chrono::milliseconds lock_duration,
                                          std::chrono::milliseconds backoff_base) {
  StalledRecovery recovery =
      store_->recover_stalled_jobs(lock_duration, options_.max_stalled_count, backoff_base);
  for (long long id : recovery.requeued) {
    std::cerr << "[JobQueue] Job " << id << " stalled, moved back to waiting (retry after "
              << backoff_base.count() << "ms or more)" << std::endl;
  }
  for (long long id : recovery.failed) {
    std::cerr << "[JobQueue] Job " << id << " stalled too many times, failing" << std::endl;
    nlohmann::json details;
    details["jobId"] = id;
    reject_waiter(id, RelayError(ErrorKind::QueueStalled, kStalledJobReason, details));
  }
  if (!recovery.requeued.empty()) {
    notify_work(static_cast<int>(recovery.requeued.size()));
  }
  return recovery;
}

void JobQueue::wait_for_work(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(work_mutex_);
  work_cv_.wait_for(lock, timeout, [this] { return !running_.load() || pending_work_ > 0; });
  if (pending_work_ > 0) {
    --pending_work_;
  }
}

void JobQueue::notify_work(int count) {
  {
    std::lock_guard<std::mutex> lock(work_mutex_);
    pending_work_ += count;
  }
  if (count > 1) {
    work_cv_.notify_all();
  } else {
    work_cv_.notify_one();
  }
}

void JobQueue::maintenance_loop() {
  while (running_.load()) {
    {
      std::unique_lock<std::mutex> lock(maintenance_mutex_);
      maintenance_cv_.wait_for(lock, options_.stalled_check_interval,
                               [this] { return !running_.load(); });
    }
    if (!running_.load()) {
      break;
    }
    run_maintenance();
  }
}

void JobQueue::run_maintenance() {
  std::vector<std::pair<long long, int>> claims;
  {
    std::lock_guard<std::mutex> lock(claims_mutex_);
    claims.assign(active_claims_.begin(), active_claims_.end());
  }
  try {
    // Jobs this queue is still working on are alive, however long the worker takes.
    for (const auto &[id, claim] : claims) {
      store_->heartbeat(id, claim);
    }
    recover_stalled(options_.lock_duration, options_.stalled_backoff);
    clean(options_.completed_retention, options_.failed_retention);
  } catch (const JobStoreError &e) {
    std::cerr << "[JobQueue] Maintenance failed: " << e.what() << std::endl;
  } catch (const RelayError &e) {
    std::cerr << "[JobQueue] Maintenance failed: " << e.what() << std::endl;
  }
  cache_.purge_expired();
}

}  // namespace relay_core
