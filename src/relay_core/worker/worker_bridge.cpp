#include "relay_core/worker/worker_bridge.hpp"

#include <algorithm>
#include <iostream>
#include <vector>

#include "relay_core/util/time_utils.hpp"
#include "relay_core/worker/worker_protocol.hpp"

namespace relay_core {

namespace {

constexpr std::chrono::milliseconds kIdleWakeup{1000};
constexpr std::size_t kLoggedOutputLimit = 200;

std::string truncate_for_log(const std::string &text) {
  if (text.size() <= kLoggedOutputLimit) {
    return text;
  }
  return text.substr(0, kLoggedOutputLimit) + "...";
}

}  // namespace

std::string to_string(WorkerState state) {
  switch (state) {
    case WorkerState::Starting: return "starting";
    case WorkerState::Ready: return "ready";
    case WorkerState::Processing: return "processing";
    case WorkerState::Crashed: return "crashed";
    case WorkerState::Stopped: return "stopped";
  }
  return "unknown";
}

WorkerBridge::WorkerBridge(BridgeOptions options, ProcessFactory factory)
    : options_(std::move(options)),
      factory_(std::move(factory)),
      events_(std::make_shared<ProcessEventChannel>()) {
  if (options_.max_attempts < 1) {
    options_.max_attempts = 1;
  }
}

WorkerBridge::~WorkerBridge() {
  stop();
}

void WorkerBridge::start() {
  if (running_.exchange(true)) {
    std::cerr << "[WorkerBridge] start() called while already running" << std::endl;
    return;
  }
  std::cout << "[WorkerBridge] Starting dispatcher (timeout " << options_.request_timeout.count()
            << "ms, max attempts " << options_.max_attempts << ")" << std::endl;
  dispatcher_ = std::thread(&WorkerBridge::run_loop, this);
}

void WorkerBridge::stop() {
  if (!running_.exchange(false)) {
    if (dispatcher_.joinable()) {
      dispatcher_.join();
    }
    return;
  }
  std::cout << "[WorkerBridge] Stopping..." << std::endl;
  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
  }
  stop_cv_.notify_all();
  events_->push(ProcessEvent{});
  if (dispatcher_.joinable()) {
    dispatcher_.join();
  }
  std::cout << "[WorkerBridge] Stopped" << std::endl;
}

WorkerAnswer WorkerBridge::execute_query(const QueryRequest &request) {
  return execute_query(request, QueryOptions{});
}

WorkerAnswer WorkerBridge::execute_query(const QueryRequest &request,
                                         const QueryOptions &options) {
  validate_query(request.query, options_.max_query_length);

  const auto timeout = options.timeout.value_or(options_.request_timeout);
  const int max_attempts = std::max(1, options.max_attempts.value_or(options_.max_attempts));
  const auto queue_wait = options.max_queue_wait.value_or(options_.max_queue_wait);
  const auto start = Clock::now();

  std::optional<WorkerError> last_error;
  int attempt = 0;
  while (attempt < max_attempts) {
    ++attempt;
    std::cout << "[WorkerBridge] Executing query (attempt " << attempt << "/" << max_attempts
              << ", caller " << request.caller_id << ", " << request.query.size() << " bytes, "
              << request.context.size() << " context turns)" << std::endl;
    try {
      nlohmann::json payload = enqueue(request, timeout, queue_wait).get();
      WorkerAnswer answer = worker_protocol::to_answer(payload);
      answer.elapsed_ms = elapsed_ms_since(start);
      record_execution(true, answer.elapsed_ms);
      std::cout << "[WorkerBridge] Query completed in " << answer.elapsed_ms << "ms" << std::endl;
      return answer;
    } catch (const WorkerError &e) {
      last_error = e;
      std::cerr << "[WorkerBridge] Attempt " << attempt << " failed (" << to_string(e.kind())
                << "): " << e.what() << std::endl;
      if (!e.is_retryable() || attempt >= max_attempts) {
        break;
      }
      const long long shifted = options_.backoff_base.count() << (attempt - 1);
      const std::chrono::milliseconds delay(std::min<long long>(shifted, options_.backoff_cap.count()));
      std::cout << "[WorkerBridge] Retrying in " << delay.count() << "ms" << std::endl;
      if (!sleep_backoff(delay)) {
        last_error = WorkerError(ErrorKind::Unavailable, "Worker bridge is stopped");
        break;
      }
    }
  }

  const long long elapsed = elapsed_ms_since(start);
  record_execution(false, elapsed);

  nlohmann::json details;
  details["attempts"] = attempt;
  details["lastError"] = last_error->what();
  details["elapsedMs"] = elapsed;
  throw WorkerError(last_error->kind(),
                    "Worker execution failed after " + std::to_string(attempt) +
                        (attempt == 1 ? " attempt: " : " attempts: ") + last_error->what(),
                    details);
}

bool WorkerBridge::health_check() {
  QueryRequest health_request;
  health_request.query = options_.health_check_query;
  health_request.caller_id = "health-check";

  QueryOptions health_options;
  health_options.timeout = options_.health_check_timeout;
  health_options.max_attempts = 1;
  health_options.max_queue_wait = options_.health_check_timeout;

  try {
    return execute_query(health_request, health_options).success;
  } catch (const RelayError &e) {
    std::cerr << "[WorkerBridge] Health check failed: " << e.what() << std::endl;
    return false;
  }
}

BridgeStats WorkerBridge::get_stats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return stats_;
}

void WorkerBridge::reset_stats() {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  stats_ = BridgeStats{};
}

std::size_t WorkerBridge::queue_depth() const {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  return queue_.size();
}

std::future<nlohmann::json> WorkerBridge::enqueue(const QueryRequest &request,
                                                  std::chrono::milliseconds timeout,
                                                  std::chrono::milliseconds max_queue_wait) {
  PendingRequest pending;
  pending.request = request;
  pending.timeout = timeout;
  pending.enqueued_at = Clock::now();
  pending.expires_at = pending.enqueued_at + max_queue_wait;
  auto future = pending.promise.get_future();
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    // Checked under the queue lock so a concurrent stop() drains this entry.
    if (!running_.load()) {
      throw WorkerError(ErrorKind::Unavailable, "Worker bridge is not running");
    }
    queue_.push_back(std::move(pending));
  }
  events_->push(ProcessEvent{});
  return future;
}

void WorkerBridge::run_loop() {
  launch_process();
  while (running_.load()) {
    auto event = events_->pop_until(next_wakeup());
    if (event) {
      handle_event(*event);
    }
    check_deadlines();
    expire_queued_requests();
    dispatch_next();
  }
  drain_on_stop();
}

void WorkerBridge::launch_process() {
  ++generation_;
  if (has_launched_) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.restarts;
  }
  has_launched_ = true;
  state_.store(WorkerState::Starting);
  started_at_ = Clock::now();

  try {
    process_ = factory_();
    if (!process_) {
      throw WorkerProcessError("Process factory returned no process");
    }
    process_->start(ProcessEventSink(generation_, events_));
    std::cout << "[WorkerBridge] Worker launched (generation " << generation_
              << "), waiting for ready signal" << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "[WorkerBridge] Failed to launch worker: " << e.what() << std::endl;
    handle_process_death(std::string("launch failed: ") + e.what());
  }
}

void WorkerBridge::handle_event(const ProcessEvent &event) {
  if (event.type == ProcessEventType::Wake) {
    return;
  }
  if (event.generation != generation_ || !process_) {
    return;
  }

  switch (event.type) {
    case ProcessEventType::Line:
      handle_line(event.data);
      break;
    case ProcessEventType::Stderr:
      std::cerr << "[WorkerBridge] worker: " << event.data << std::endl;
      break;
    case ProcessEventType::Exited: {
      {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.crashes;
      }
      std::cerr << "[WorkerBridge] Worker process exited with code " << event.exit_code
                << std::endl;
      handle_process_death("exit code " + std::to_string(event.exit_code));
      break;
    }
    case ProcessEventType::Wake:
      break;
  }
}

void WorkerBridge::handle_line(const std::string &line) {
  worker_protocol::WorkerResponse response;
  try {
    response = worker_protocol::parse_response(line);
  } catch (const ProtocolError &e) {
    std::cerr << "[WorkerBridge] Ignoring worker output (" << e.what()
              << "): " << truncate_for_log(line) << std::endl;
    return;
  }

  if (state_.load() == WorkerState::Starting) {
    if (response.kind == worker_protocol::ResponseKind::Ready) {
      state_.store(WorkerState::Ready);
      std::cout << "[WorkerBridge] Worker ready (generation " << generation_ << ")" << std::endl;
    } else {
      std::cerr << "[WorkerBridge] Unexpected message before ready: " << truncate_for_log(line)
                << std::endl;
    }
    return;
  }

  if (!in_flight_) {
    std::cerr << "[WorkerBridge] Ignoring worker output with no request in flight: "
              << truncate_for_log(line) << std::endl;
    return;
  }
  if (response.kind == worker_protocol::ResponseKind::Ready) {
    std::cerr << "[WorkerBridge] Ignoring repeated ready signal" << std::endl;
    return;
  }

  PendingRequest pending = std::move(*in_flight_);
  in_flight_.reset();
  state_.store(WorkerState::Ready);

  if (response.kind == worker_protocol::ResponseKind::Success) {
    pending.promise.set_value(std::move(response.payload));
  } else {
    nlohmann::json details;
    if (response.payload.contains("error")) {
      details = response.payload["error"];
    }
    pending.promise.set_exception(std::make_exception_ptr(
        WorkerError(ErrorKind::WorkerExecution,
                    worker_protocol::failure_message(response.payload), details)));
  }
}

void WorkerBridge::handle_process_death(const std::string &reason) {
  fail_in_flight(ErrorKind::WorkerCrashed, "Worker process crashed: " + reason);
  if (process_) {
    process_->terminate();
    process_.reset();
  }
  state_.store(WorkerState::Crashed);
  restart_at_ = Clock::now() + options_.restart_delay;
  std::cerr << "[WorkerBridge] Worker unavailable (" << reason << "), restarting in "
            << options_.restart_delay.count() << "ms" << std::endl;
}

void WorkerBridge::dispatch_next() {
  if (state_.load() != WorkerState::Ready || in_flight_ || !process_) {
    return;
  }

  PendingRequest next;
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (queue_.empty()) {
      return;
    }
    next = std::move(queue_.front());
    queue_.pop_front();
  }

  try {
    process_->send_line(worker_protocol::encode_request(next.request));
  } catch (const std::exception &e) {
    std::cerr << "[WorkerBridge] Failed to send request: " << e.what() << std::endl;
    next.promise.set_exception(std::make_exception_ptr(WorkerError(
        ErrorKind::WorkerCrashed, std::string("Failed to send request to worker: ") + e.what())));
    handle_process_death("write failed");
    return;
  }

  in_flight_deadline_ = Clock::now() + next.timeout;
  in_flight_ = std::move(next);
  state_.store(WorkerState::Processing);
}

void WorkerBridge::check_deadlines() {
  const auto now = Clock::now();

  if (in_flight_ && now >= in_flight_deadline_) {
    const long long timeout_ms = in_flight_->timeout.count();
    {
      std::lock_guard<std::mutex> lock(stats_mutex_);
      ++stats_.timeouts;
    }
    std::cerr << "[WorkerBridge] Request timed out after " << timeout_ms
              << "ms, killing worker" << std::endl;
    nlohmann::json details;
    details["timeoutMs"] = timeout_ms;
    fail_in_flight(ErrorKind::WorkerTimeout,
                   "Worker execution timeout after " + std::to_string(timeout_ms) + "ms",
                   details);
    handle_process_death("request timeout");
    return;
  }

  if (state_.load() == WorkerState::Starting && now >= started_at_ + options_.startup_timeout) {
    std::cerr << "[WorkerBridge] Worker did not report ready within "
              << options_.startup_timeout.count() << "ms" << std::endl;
    handle_process_death("startup timeout");
    return;
  }

  if (state_.load() == WorkerState::Crashed && now >= restart_at_) {
    launch_process();
  }
}

void WorkerBridge::expire_queued_requests() {
  const auto now = Clock::now();
  std::vector<PendingRequest> expired;
  {
    // Waits differ per request, so an expired entry can sit behind a live one.
    std::lock_guard<std::mutex> lock(queue_mutex_);
    for (auto it = queue_.begin(); it != queue_.end();) {
      if (now >= it->expires_at) {
        expired.push_back(std::move(*it));
        it = queue_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto &pending : expired) {
    const long long waited =
        std::chrono::duration_cast<std::chrono::milliseconds>(now - pending.enqueued_at).count();
    std::cerr << "[WorkerBridge] Request expired after waiting " << waited << "ms for the worker"
              << std::endl;
    nlohmann::json details;
    details["waitedMs"] = waited;
    pending.promise.set_exception(std::make_exception_ptr(
        WorkerError(ErrorKind::WorkerTimeout, "Timed out waiting for the worker", details)));
  }
}

void WorkerBridge::fail_in_flight(ErrorKind kind, const std::string &message,
                                  nlohmann::json details) {
  if (!in_flight_) {
    return;
  }
  PendingRequest pending = std::move(*in_flight_);
  in_flight_.reset();
  pending.promise.set_exception(
      std::make_exception_ptr(WorkerError(kind, message, std::move(details))));
}

void WorkerBridge::drain_on_stop() {
  fail_in_flight(ErrorKind::Unavailable, "Worker bridge is stopped");
  if (process_) {
    process_->terminate();
    process_.reset();
  }
  state_.store(WorkerState::Stopped);

  std::deque<PendingRequest> remaining;
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    remaining.swap(queue_);
  }
  for (auto &pending : remaining) {
    pending.promise.set_exception(std::make_exception_ptr(
        WorkerError(ErrorKind::Unavailable, "Worker bridge is stopped")));
  }
  if (!remaining.empty()) {
    std::cerr << "[WorkerBridge] Rejected " << remaining.size() << " queued request(s) on stop"
              << std::endl;
  }
}

WorkerBridge::Clock::time_point WorkerBridge::next_wakeup() const {
  auto wake = Clock::now() + kIdleWakeup;
  if (in_flight_) {
    wake = std::min(wake, in_flight_deadline_);
  }
  const WorkerState state = state_.load();
  if (state == WorkerState::Crashed) {
    wake = std::min(wake, restart_at_);
  } else if (state == WorkerState::Starting) {
    wake = std::min(wake, started_at_ + options_.startup_timeout);
  }
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    for (const auto &pending : queue_) {
      wake = std::min(wake, pending.expires_at);
    }
  }
  return wake;
}

void WorkerBridge::record_execution(bool success, long long elapsed_ms) {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  ++stats_.total_executions;
  if (success) {
    ++stats_.successful_executions;
  } else {
    ++stats_.failed_executions;
  }
  stats_.total_elapsed_ms += elapsed_ms;
  stats_.avg_elapsed_ms = stats_.total_elapsed_ms / stats_.total_executions;
}

bool WorkerBridge::sleep_backoff(std::chrono::milliseconds delay) {
  std::unique_lock<std::mutex> lock(stop_mutex_);
  return !stop_cv_.wait_for(lock, delay, [this] { return !running_.load(); });
}

}  // namespace relay_core
