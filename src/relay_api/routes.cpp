#include "relay_api/routes.hpp"

#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

#include "relay_api/http_mapping.hpp"
#include "relay_core/cache/response_cache.hpp"
#include "relay_core/errors.hpp"
#include "relay_core/jobs/job_queue.hpp"
#include "relay_core/services/chat_service.hpp"
#include "relay_core/worker/worker_bridge.hpp"

namespace relay_api {

namespace {

constexpr long long kDefaultCompletedGraceMs = 60LL * 60 * 1000;
constexpr long long kDefaultFailedGraceMs = 24LL * 60 * 60 * 1000;

long long grace_ms(const nlohmann::json &body, const char *key, long long fallback) {
  if (!body.is_object() || !body.contains(key)) {
    return fallback;
  }
  const auto &value = body[key];
  const bool too_large =
      value.is_number_unsigned() &&
      value.get<unsigned long long>() >
          static_cast<unsigned long long>(std::numeric_limits<long long>::max());
  if (!value.is_number_integer() || too_large) {
    throw relay_core::ValidationError(std::string(key) + " must be an integer");
  }
  return value.get<long long>();
}

nlohmann::json bridge_stats_json(const relay_core::WorkerBridge &bridge) {
  const relay_core::BridgeStats stats = bridge.get_stats();
  nlohmann::json j;
  j["state"] = relay_core::to_string(bridge.state());
  j["queueDepth"] = bridge.queue_depth();
  j["totalExecutions"] = stats.total_executions;
  j["successfulExecutions"] = stats.successful_executions;
  j["failedExecutions"] = stats.failed_executions;
  j["averageElapsedMs"] = stats.avg_elapsed_ms;
  j["successRate"] = stats.success_rate();
  j["restarts"] = stats.restarts;
  j["timeouts"] = stats.timeouts;
  j["crashes"] = stats.crashes;
  return j;
}

nlohmann::json cache_stats_json(const relay_core::CacheStats &stats) {
  nlohmann::json j;
  j["enabled"] = stats.enabled;
  j["durable"] = stats.durable;
  j["hits"] = stats.hits;
  j["misses"] = stats.misses;
  j["sets"] = stats.sets;
  j["deletes"] = stats.deletes;
  j["errors"] = stats.errors;
  j["hitRate"] = stats.hit_rate();
  j["fallbackSize"] = stats.fallback_size;
  return j;
}

nlohmann::json queue_stats_json(const relay_core::QueueStats &stats) {
  nlohmann::json j;
  j["waiting"] = stats.counts.waiting;
  j["active"] = stats.counts.active;
  j["completed"] = stats.counts.completed;
  j["failed"] = stats.counts.failed;
  j["total"] = stats.counts.total();
  j["health"] = stats.health;
  j["processing"] = stats.processing;
  j["paused"] = stats.paused;
  j["concurrency"] = stats.concurrency;
  return j;
}

}  // namespace

Routes::Routes(std::shared_ptr<relay_core::ChatService> chat_service,
               std::shared_ptr<relay_core::JobQueue> job_queue,
               std::shared_ptr<relay_core::WorkerBridge> worker_bridge,
               std::shared_ptr<relay_core::ResponseCache> response_cache,
               std::chrono::milliseconds await_timeout)
    : chat_service_(std::move(chat_service)),
      job_queue_(std::move(job_queue)),
      worker_bridge_(std::move(worker_bridge)),
      response_cache_(std::move(response_cache)),
      await_timeout_(await_timeout) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  CROW_ROUTE(app, "/health")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/chat").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_chat(req);
  });

  CROW_ROUTE(app, "/jobs").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_submit_job(req);
  });

  CROW_ROUTE(app, "/jobs/<string>")
  ([this](const crow::request &req, const std::string &job_id) {
    return handle_get_job(req, job_id);
  });

  CROW_ROUTE(app, "/stats")
  ([this](const crow::request &req) { return handle_stats(req); });

  CROW_ROUTE(app, "/cache/clear").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_clear_cache(req);
  });

  CROW_ROUTE(app, "/queue/clean").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_clean_queue(req);
  });

  std::cout << "All routes registered successfully" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request &) {
  try {
    const bool worker_healthy = worker_bridge_->health_check();
    const bool cache_healthy = response_cache_->health_check();
    const relay_core::QueueStats queue_stats = job_queue_->get_stats();
    const std::string status = overall_health(worker_healthy, cache_healthy, queue_stats.health);

    nlohmann::json data;
    data["status"] = status;
    data["worker"] = {{"healthy", worker_healthy},
                      {"state", relay_core::to_string(worker_bridge_->state())}};
    data["cache"] = {{"healthy", cache_healthy},
                     {"enabled", response_cache_->enabled()},
                     {"durable", response_cache_->durable()}};
    data["queue"] = queue_stats_json(queue_stats);

    nlohmann::json response = create_success_response("query-relay is running", data);
    response["success"] = status != "unhealthy";
    return create_json_response(response, status == "unhealthy" ? 503 : 200);
  } catch (const relay_core::RelayError &e) {
    std::cerr << "Exception in handle_health_check: " << e.what() << std::endl;
    return error_response_for(e);
  }
}

crow::response Routes::handle_chat(const crow::request &req) {
  nlohmann::json body;
  try {
    body = parse_json_body(req.body);
  } catch (const nlohmann::json::parse_error &) {
    return create_json_response(create_error_response("VALIDATION_ERROR", "Request body must be JSON"),
                                400);
  }

  try {
    relay_core::SubmitRequest request = parse_submit_request(body);
    const auto timeout = parse_await_timeout(body, await_timeout_);
    relay_core::QueryResult result = chat_service_->submit_and_await(request, timeout);

    nlohmann::json response = create_success_response("Query answered", result);
    return create_json_response(response);
  } catch (const relay_core::RelayError &e) {
    std::cerr << "Chat request failed (" << relay_core::to_string(e.kind()) << "): " << e.what()
              << std::endl;
    return error_response_for(e);
  }
}

crow::response Routes::handle_submit_job(const crow::request &req) {
  nlohmann::json body;
  try {
    body = parse_json_body(req.body);
  } catch (const nlohmann::json::parse_error &) {
    return create_json_response(create_error_response("VALIDATION_ERROR", "Request body must be JSON"),
                                400);
  }

  try {
    relay_core::JobHandle handle = chat_service_->submit(parse_submit_request(body));
    nlohmann::json data;
    data["jobId"] = handle.id;
    data["state"] = relay_core::to_string(relay_core::JobState::WAITING);
    return create_json_response(create_success_response("Job queued", data), 202);
  } catch (const relay_core::RelayError &e) {
    return error_response_for(e);
  }
}

crow::response Routes::handle_get_job(const crow::request &, const std::string &job_id) {
  long long id = 0;
  try {
    std::size_t consumed = 0;
    id = std::stoll(job_id, &consumed);
    if (consumed != job_id.size()) {
      throw std::invalid_argument(job_id);
    }
  } catch (const std::logic_error &) {
    // std::invalid_argument and std::out_of_range
    return create_json_response(create_error_response("VALIDATION_ERROR", "Invalid job ID format"),
                                400);
  }

  try {
    auto job = job_queue_->get_job(id);
    if (!job) {
      return create_json_response(create_error_response("NOT_FOUND", "Job not found"), 404);
    }
    return create_json_response(
        create_success_response("Job retrieved successfully", relay_core::job_to_json(*job)));
  } catch (const relay_core::RelayError &e) {
    return error_response_for(e);
  }
}

crow::response Routes::handle_stats(const crow::request &) {
  try {
    nlohmann::json data;
    data["worker"] = bridge_stats_json(*worker_bridge_);
    data["cache"] = cache_stats_json(response_cache_->get_stats());
    data["cache"]["size"] = response_cache_->size();
    data["queue"] = queue_stats_json(job_queue_->get_stats());
    return create_json_response(create_success_response("Statistics retrieved", data));
  } catch (const relay_core::RelayError &e) {
    return error_response_for(e);
  }
}

crow::response Routes::handle_clear_cache(const crow::request &) {
  const std::size_t cleared = response_cache_->clear();
  nlohmann::json data;
  data["cleared"] = cleared;
  return create_json_response(create_success_response("Cache cleared", data));
}

crow::response Routes::handle_clean_queue(const crow::request &req) {
  nlohmann::json body = nlohmann::json::object();
  if (!req.body.empty()) {
    try {
      body = parse_json_body(req.body);
    } catch (const nlohmann::json::parse_error &) {
      return create_json_response(
          create_error_response("VALIDATION_ERROR", "Request body must be JSON"), 400);
    }
  }

  try {
    const std::chrono::milliseconds completed_grace(
        grace_ms(body, "completed_grace_ms", kDefaultCompletedGraceMs));
    const std::chrono::milliseconds failed_grace(
        grace_ms(body, "failed_grace_ms", kDefaultFailedGraceMs));
    const std::size_t purged = job_queue_->clean(completed_grace, failed_grace);
    nlohmann::json data;
    data["purged"] = purged;
    return create_json_response(create_success_response("Queue cleaned", data));
  } catch (const relay_core::RelayError &e) {
    return error_response_for(e);
  }
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

nlohmann::json Routes::create_success_response(const std::string &message,
                                               const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &code, const std::string &message) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = {{"code", code}, {"message", message}};
  return response;
}

crow::response Routes::error_response_for(const relay_core::RelayError &error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error.to_json();
  return create_json_response(response, http_status_for(error.kind()));
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  return nlohmann::json::parse(body);
}

}  // namespace relay_api
