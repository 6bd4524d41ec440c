#pragma once

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

class Config {
 public:
  std::string api_base_url;
  std::string database_path;
  int database_pool_size;

  // Worker bridge
  std::vector<std::string> worker_command;
  int worker_timeout_ms;
  int worker_max_attempts;
  int worker_restart_delay_ms;
  int worker_startup_timeout_ms;
  std::string health_check_query;
  int max_query_length;

  // Job queue
  int queue_concurrency;
  bool queue_persistent;
  int await_timeout_ms;

  // Response cache
  bool cache_enabled;
  bool cache_durable;
  int cache_ttl_seconds;
  int cache_memory_capacity;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    Config config;

    config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:3030"));
    config.database_path = json_config.value("database_path", std::string("./data/relay.db"));
    config.database_pool_size = json_config.value("database_pool_size", 4);

    try {
      if (json_config.contains("worker_command")) {
        config.worker_command = json_config.at("worker_command").get<std::vector<std::string>>();
      } else {
        config.worker_command = default_worker_command();
      }
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("worker_command must be an array of strings: ") + e.what());
    }
    config.worker_timeout_ms = json_config.value("worker_timeout_ms", 30000);
    config.worker_max_attempts = json_config.value("worker_max_attempts", 2);
    config.worker_restart_delay_ms = json_config.value("worker_restart_delay_ms", 1000);
    config.worker_startup_timeout_ms = json_config.value("worker_startup_timeout_ms", 120000);
    config.health_check_query = json_config.value("health_check_query", std::string("health check"));
    config.max_query_length = json_config.value("max_query_length", 2000);

    config.queue_concurrency = json_config.value("queue_concurrency", 3);
    config.queue_persistent = json_config.value("queue_persistent", false);
    config.await_timeout_ms = json_config.value("await_timeout_ms", 35000);

    config.cache_enabled = json_config.value("cache_enabled", true);
    config.cache_durable = json_config.value("cache_durable", true);
    config.cache_ttl_seconds = json_config.value("cache_ttl_seconds", 3600);
    config.cache_memory_capacity = json_config.value("cache_memory_capacity", 100);

    config.validate();
    return config;
  }

  static std::vector<std::string> default_worker_command() {
    return {"python3", "-u", "python_rag/orchestrator_wrapper.py", "--interactive"};
  }

  // The database is only opened when something stores data in it.
  bool needs_database() const {
    return queue_persistent || (cache_enabled && cache_durable);
  }

 private:
  void validate() const {
    if (api_base_url.empty() || api_base_url.find(':') == std::string::npos) {
      throw std::runtime_error("api_base_url must be in host:port form");
    }
    if (database_path.empty()) {
      throw std::runtime_error("database_path cannot be empty");
    }
    if (database_pool_size <= 0) {
      throw std::runtime_error("database_pool_size must be greater than 0");
    }
    if (worker_command.empty() || worker_command.front().empty()) {
      throw std::runtime_error("worker_command cannot be empty");
    }
    if (worker_timeout_ms < 100) {
      throw std::runtime_error("worker_timeout_ms must be at least 100ms");
    }
    if (worker_max_attempts < 1) {
      throw std::runtime_error("worker_max_attempts must be at least 1");
    }
    if (worker_restart_delay_ms < 0) {
      throw std::runtime_error("worker_restart_delay_ms cannot be negative");
    }
    if (worker_startup_timeout_ms < 100) {
      throw std::runtime_error("worker_startup_timeout_ms must be at least 100ms");
    }
    if (max_query_length <= 0) {
      throw std::runtime_error("max_query_length must be greater than 0");
    }
    if (queue_concurrency <= 0) {
      throw std::runtime_error("queue_concurrency must be greater than 0");
    }
    if (await_timeout_ms < 100) {
      throw std::runtime_error("await_timeout_ms must be at least 100ms");
    }
    if (cache_ttl_seconds <= 0) {
      throw std::runtime_error("cache_ttl_seconds must be greater than 0");
    }
    if (cache_memory_capacity <= 0) {
      throw std::runtime_error("cache_memory_capacity must be greater than 0");
    }
  }
};
