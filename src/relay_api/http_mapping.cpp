#include "relay_api/http_mapping.hpp"

#include <algorithm>
#include <limits>
#include <string>

namespace relay_api {

using relay_core::ErrorKind;

int http_status_for(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Validation: return 400;
    case ErrorKind::WorkerExecution: return 500;
    case ErrorKind::WorkerCrashed: return 502;
    case ErrorKind::Unavailable: return 503;
    case ErrorKind::WorkerTimeout: return 504;
    case ErrorKind::QueueTimeout: return 504;
    case ErrorKind::QueueStalled: return 500;
    case ErrorKind::Internal: return 500;
  }
  return 500;
}

relay_core::SubmitRequest parse_submit_request(const nlohmann::json &body) {
  relay_core::SubmitRequest request;
  if (!body.is_object()) {
    return request;
  }
  if (body.contains("query") && body["query"].is_string()) {
    request.query = body["query"].get<std::string>();
  }
  if (body.contains("userId") && body["userId"].is_string()) {
    request.caller_id = body["userId"].get<std::string>();
  }
  if (body.contains("sessionId") && body["sessionId"].is_string()) {
    request.session_id = body["sessionId"].get<std::string>();
  }
  if (body.contains("conversationHistory") && body["conversationHistory"].is_array()) {
    for (const auto &turn : body["conversationHistory"]) {
      if (!turn.is_object()) {
        continue;
      }
      for (const char *field : {"role", "content"}) {
        if (turn.contains(field) && !turn[field].is_string()) {
          throw relay_core::ValidationError(
              std::string("conversationHistory ") + field + " must be a string",
              {{"field", "conversationHistory"}});
        }
      }
      request.context.push_back(turn.get<relay_core::ContextTurn>());
    }
  }
  if (body.contains("priority") && body["priority"].is_number_integer()) {
    request.priority = body["priority"].get<int>();
  }
  return request;
}

std::chrono::milliseconds parse_await_timeout(const nlohmann::json &body,
                                              std::chrono::milliseconds max_timeout) {
  if (!body.is_object() || !body.contains("timeoutMs")) {
    return max_timeout;
  }
  // Floats are rejected; converting one past the range of long long is undefined.
  const auto &value = body["timeoutMs"];
  if (!value.is_number_integer()) {
    return max_timeout;
  }
  if (value.is_number_unsigned() &&
      value.get<unsigned long long>() >
          static_cast<unsigned long long>(std::numeric_limits<long long>::max())) {
    return max_timeout;
  }
  const long long requested = value.get<long long>();
  const long long floor_ms = std::min<long long>(1000, max_timeout.count());
  return std::chrono::milliseconds(std::clamp<long long>(requested, floor_ms, max_timeout.count()));
}

std::string overall_health(bool worker_healthy, bool cache_healthy,
                           const std::string &queue_health) {
  if (!worker_healthy || queue_health == "unhealthy") {
    return "unhealthy";
  }
  if (!cache_healthy || queue_health != "healthy") {
    return "degraded";
  }
  return "healthy";
}

}  // namespace relay_api
