#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "relay_core/errors.hpp"
#include "relay_core/validation.hpp"
#include "relay_core/worker/query_executor.hpp"
#include "relay_core/worker/worker_process.hpp"

namespace relay_core {

enum class WorkerState { Starting, Ready, Processing, Crashed, Stopped };

std::string to_string(WorkerState state);

struct BridgeOptions {
  std::chrono::milliseconds request_timeout{30000};
  int max_attempts = 2;
  std::chrono::milliseconds backoff_base{1000};
  std::chrono::milliseconds backoff_cap{5000};
  std::chrono::milliseconds restart_delay{1000};
  std::chrono::milliseconds startup_timeout{120000};
  std::chrono::milliseconds max_queue_wait{120000};
  std::size_t max_query_length = kDefaultMaxQueryLength;
  std::string health_check_query = "health check";
  std::chrono::milliseconds health_check_timeout{5000};
};

// Per-call overrides; unset fields fall back to BridgeOptions.
struct QueryOptions {
  std::optional<std::chrono::milliseconds> timeout;
  std::optional<int> max_attempts;
  // How long the request may sit in the queue, including while the worker
  // is starting or busy with someone else's request.
  std::optional<std::chrono::milliseconds> max_queue_wait;
};

struct BridgeStats {
  long long total_executions = 0;
  long long successful_executions = 0;
  long long failed_executions = 0;
  long long total_elapsed_ms = 0;
  long long avg_elapsed_ms = 0;
  long long restarts = 0;
  long long timeouts = 0;
  long long crashes = 0;

  double success_rate() const {
    return total_executions > 0 ? (100.0 * successful_executions) / total_executions : 0.0;
  }
};

/**
 * @class WorkerBridge
 * @brief Request/response contract over a single external worker process.
 *
 * The bridge owns exactly one worker process at a time and never has more
 * than one request in flight to it. Callers of execute_query() are queued in
 * FIFO order and block until their own request is answered, fails or times
 * out. A dedicated dispatcher thread runs the worker state machine:
 *
 *   Starting -> Ready -> {Processing -> Ready}* -> Crashed -> Starting
 *
 * Exits, write failures, startup stalls and request timeouts all move the
 * process to Crashed, which kills it and launches a fresh instance after
 * restart_delay. The in-flight request, if any, is failed rather than
 * replayed against the new process.
 */
class WorkerBridge : public IQueryExecutor {
 public:
  using ProcessFactory = std::function<std::unique_ptr<IWorkerProcess>()>;

  WorkerBridge(BridgeOptions options, ProcessFactory factory);

  /**
   * @brief Destructor. Stops the dispatcher and kills the worker.
   */
  ~WorkerBridge() override;

  /**
   * @brief Launches the dispatcher thread and the first worker process.
   *
   * Requests submitted before the worker reports ready wait in the queue.
   */
  void start();

  /**
   * @brief Stops the dispatcher, kills the worker and rejects every queued
   * or in-flight request with an Unavailable error. Blocks until done.
   */
  void stop();

  WorkerAnswer execute_query(const QueryRequest &request) override;
  WorkerAnswer execute_query(const QueryRequest &request, const QueryOptions &options);

  // Runs the configured synthetic query with one attempt. health_check_timeout
  // bounds both the wait for the worker and the query itself, so a busy or
  // still-starting worker reports unhealthy instead of blocking the caller.
  bool health_check();

  BridgeStats get_stats() const;
  void reset_stats();

  WorkerState state() const {
    return state_.load();
  }
  std::size_t queue_depth() const;
  bool is_running() const {
    return running_.load();
  }

  WorkerBridge(const WorkerBridge &) = delete;
  WorkerBridge &operator=(const WorkerBridge &) = delete;
  WorkerBridge(WorkerBridge &&) = delete;
  WorkerBridge &operator=(WorkerBridge &&) = delete;

 private:
  using Clock = std::chrono::steady_clock;

  struct PendingRequest {
    QueryRequest request;
    std::chrono::milliseconds timeout{0};
    Clock::time_point enqueued_at;
    Clock::time_point expires_at;
    std::promise<nlohmann::json> promise;
  };

  std::future<nlohmann::json> enqueue(const QueryRequest &request,
                                      std::chrono::milliseconds timeout,
                                      std::chrono::milliseconds max_queue_wait);

  // Dispatcher thread only.
  void run_loop();
  void launch_process();
  void handle_event(const ProcessEvent &event);
  void handle_line(const std::string &line);
  void handle_process_death(const std::string &reason);
  void dispatch_next();
  void check_deadlines();
  void expire_queued_requests();
  void fail_in_flight(ErrorKind kind, const std::string &message,
                      nlohmann::json details = nlohmann::json());
  void drain_on_stop();
  Clock::time_point next_wakeup() const;

  void record_execution(bool success, long long elapsed_ms);
  bool sleep_backoff(std::chrono::milliseconds delay);

  BridgeOptions options_;
  ProcessFactory factory_;
  std::shared_ptr<ProcessEventChannel> events_;

  mutable std::mutex queue_mutex_;
  std::deque<PendingRequest> queue_;

  // Owned by the dispatcher thread.
  std::unique_ptr<IWorkerProcess> process_;
  unsigned generation_ = 0;
  bool has_launched_ = false;
  std::optional<PendingRequest> in_flight_;
  Clock::time_point in_flight_deadline_{};
  Clock::time_point started_at_{};
  Clock::time_point restart_at_{};

  std::atomic<WorkerState> state_{WorkerState::Stopped};
  std::atomic<bool> running_{false};
  std::thread dispatcher_;

  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;

  mutable std::mutex stats_mutex_;
  BridgeStats stats_;
};

}  // namespace relay_core
