#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "relay_core/errors.hpp"
#include "relay_core/jobs/job_queue.hpp"

namespace relay_api {

int http_status_for(relay_core::ErrorKind kind);

// Builds a SubmitRequest from a /chat or /jobs body. Missing or mistyped
// optional fields fall back to defaults; a missing or non-string query is
// left empty so validation reports it uniformly. Throws ValidationError when
// a conversationHistory entry carries a non-string role or content.
relay_core::SubmitRequest parse_submit_request(const nlohmann::json &body);

// Per-request await timeout from "timeoutMs", clamped to [1s, max_timeout].
// Anything but an integer yields max_timeout.
std::chrono::milliseconds parse_await_timeout(const nlohmann::json &body,
                                              std::chrono::milliseconds max_timeout);

// Overall status from the component checks: unhealthy when the worker or
// the queue is, degraded when only the cache is or the queue is degraded.
std::string overall_health(bool worker_healthy, bool cache_healthy,
                           const std::string &queue_health);

}  // namespace relay_api
