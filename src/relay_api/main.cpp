#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "relay_api/config.hpp"
#include "relay_api/routes.hpp"
#include "relay_api/server.hpp"
#include "relay_core/cache/response_cache.hpp"
#include "relay_core/cache/sqlite_cache_store.hpp"
#include "relay_core/db/database_manager.hpp"
#include "relay_core/jobs/job_queue.hpp"
#include "relay_core/jobs/memory_job_store.hpp"
#include "relay_core/jobs/sqlite_job_store.hpp"
#include "relay_core/services/chat_service.hpp"
#include "relay_core/worker/posix_worker_process.hpp"
#include "relay_core/worker/worker_bridge.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();
}

namespace {

relay_core::BridgeOptions bridge_options_from(const Config& config) {
  relay_core::BridgeOptions options;
  options.request_timeout = std::chrono::milliseconds(config.worker_timeout_ms);
  options.max_attempts = config.worker_max_attempts;
  options.restart_delay = std::chrono::milliseconds(config.worker_restart_delay_ms);
  options.startup_timeout = std::chrono::milliseconds(config.worker_startup_timeout_ms);
  options.max_query_length = static_cast<std::size_t>(config.max_query_length);
  options.health_check_query = config.health_check_query;
  return options;
}

relay_core::CacheOptions cache_options_from(const Config& config) {
  relay_core::CacheOptions options;
  options.enabled = config.cache_enabled;
  options.ttl = std::chrono::seconds(config.cache_ttl_seconds);
  options.fallback_capacity = static_cast<std::size_t>(config.cache_memory_capacity);
  return options;
}

relay_core::QueueOptions queue_options_from(const Config& config) {
  relay_core::QueueOptions options;
  options.concurrency = config.queue_concurrency;
  // A job may legitimately wait for every attempt of the worker plus backoff.
  options.lock_duration =
      std::max(options.lock_duration,
               std::chrono::milliseconds(static_cast<long long>(config.worker_timeout_ms) *
                                         (config.worker_max_attempts + 1)));
  return options;
}

}  // namespace

int main(int argc, char** argv) {
  try {
    const std::string config_path = argc > 1 ? argv[1] : "relayrc.json";
    Config config = Config::from_file(config_path);

    std::cout << "Starting query-relay API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Worker command: " << config.worker_command.front() << " ("
              << config.worker_command.size() - 1 << " args)" << std::endl;
    std::cout << "Queue: concurrency " << config.queue_concurrency << ", "
              << (config.queue_persistent ? "persistent" : "in-memory") << std::endl;
    std::cout << "Cache: " << (config.cache_enabled ? "enabled" : "disabled")
              << (config.cache_enabled && config.cache_durable ? " (durable)" : "") << std::endl;

    // --- 1. BUILD COMPONENTS ---
    relay_core::DatabaseManager db_manager;
    if (config.needs_database()) {
      std::cout << "Database Path: " << config.database_path << std::endl;
      db_manager.initialize(config.database_path, config.database_pool_size);
    }

    std::unique_ptr<relay_core::ICacheStore> primary_store;
    if (config.cache_enabled && config.cache_durable) {
      primary_store = std::make_unique<relay_core::SqliteCacheStore>(db_manager);
    }
    auto response_cache = std::make_shared<relay_core::ResponseCache>(cache_options_from(config),
                                                                      std::move(primary_store));

    const std::vector<std::string> worker_command = config.worker_command;
    auto worker_bridge = std::make_shared<relay_core::WorkerBridge>(
        bridge_options_from(config), [worker_command]() -> std::unique_ptr<relay_core::IWorkerProcess> {
          return std::make_unique<relay_core::PosixWorkerProcess>(worker_command);
        });

    std::unique_ptr<relay_core::IJobStore> job_store;
    if (config.queue_persistent) {
      job_store = std::make_unique<relay_core::SqliteJobStore>(db_manager);
    } else {
      job_store = std::make_unique<relay_core::MemoryJobStore>();
    }
    auto job_queue = std::make_shared<relay_core::JobQueue>(
        queue_options_from(config), std::move(job_store), *response_cache, *worker_bridge);
    auto chat_service = std::make_shared<relay_core::ChatService>(
        *job_queue, static_cast<std::size_t>(config.max_query_length));

    std::string host = config.api_base_url.substr(0, config.api_base_url.find(':'));
    int port = std::stoi(config.api_base_url.substr(config.api_base_url.find(':') + 1));
    relay_api::Server server(host, port);
    relay_api::Routes routes(chat_service, job_queue, worker_bridge, response_cache,
                             std::chrono::milliseconds(config.await_timeout_ms));
    routes.register_routes(server);

    // --- 2. START BACKGROUND SERVICES ---
    std::cout << "Disabling Crow's internal signal handling..." << std::endl;
    server.get_app().signal_clear();

    worker_bridge->start();
    job_queue->start();
    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    // --- 3. WAIT FOR SHUTDOWN SIGNAL ---
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    // --- 4. GRACEFUL SHUTDOWN SEQUENCE ---
    std::cout << "[1/4] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[2/4] Stopping worker bridge..." << std::endl;
    job_queue->pause();
    worker_bridge->stop();  // Fails in-flight requests so processors return promptly

    std::cout << "[3/4] Stopping job queue..." << std::endl;
    job_queue->stop();  // Blocks until all processors are done

    std::cout << "[4/4] Shutting down database connections..." << std::endl;
    db_manager.shutdown();

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
