#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "relay_core/errors.hpp"
#include "relay_core/types/query.hpp"

namespace relay_core {

enum class JobState { WAITING, ACTIVE, COMPLETED, FAILED };

inline std::string to_string(JobState state) {
  switch (state) {
    case JobState::WAITING: return "WAITING";
    case JobState::ACTIVE: return "ACTIVE";
    case JobState::COMPLETED: return "COMPLETED";
    case JobState::FAILED: return "FAILED";
  }
  return "UNKNOWN";
}

inline JobState job_state_from_string(const std::string &str) {
  if (str == "WAITING") return JobState::WAITING;
  if (str == "ACTIVE") return JobState::ACTIVE;
  if (str == "COMPLETED") return JobState::COMPLETED;
  if (str == "FAILED") return JobState::FAILED;
  throw std::invalid_argument("Invalid JobState string: " + str);
}

constexpr int kDefaultJobPriority = 10;

struct JobPayload {
  std::string query;
  std::string caller_id = kAnonymousCaller;
  std::string session_id;
  ConversationContext context;
  int priority = kDefaultJobPriority;  // lower runs first
};

inline void to_json(nlohmann::json &j, const JobPayload &payload) {
  j = nlohmann::json{{"query", payload.query},
                     {"userId", payload.caller_id},
                     {"sessionId", payload.session_id},
                     {"conversationHistory", payload.context},
                     {"priority", payload.priority}};
}

inline void from_json(const nlohmann::json &j, JobPayload &payload) {
  payload.query = j.value("query", std::string());
  payload.caller_id = j.value("userId", kAnonymousCaller);
  payload.session_id = j.value("sessionId", std::string());
  payload.context.clear();
  if (j.contains("conversationHistory") && j["conversationHistory"].is_array()) {
    payload.context = j["conversationHistory"].get<ConversationContext>();
  }
  payload.priority = j.value("priority", kDefaultJobPriority);
}

// Immutable snapshot of a job as stored.
struct Job {
  long long id = 0;
  JobPayload payload;
  JobState state = JobState::WAITING;
  int attempts_made = 0;  // incremented on every claim; doubles as the claim token
  int stalled_count = 0;
  int progress_percent = 0;
  std::string progress_message;
  std::optional<QueryResult> result;
  std::optional<ErrorKind> failure_kind;
  std::string failure_reason;
  std::chrono::system_clock::time_point created_at;
  std::chrono::system_clock::time_point updated_at;
  std::optional<std::chrono::system_clock::time_point> processed_at;
  std::optional<std::chrono::system_clock::time_point> finished_at;
  // A requeued stalled job is not claimed before this.
  std::optional<std::chrono::system_clock::time_point> delayed_until;

  bool is_finished() const {
    return state == JobState::COMPLETED || state == JobState::FAILED;
  }
};

nlohmann::json job_to_json(const Job &job);

struct JobCounts {
  long long waiting = 0;
  long long active = 0;
  long long completed = 0;
  long long failed = 0;

  long long total() const {
    return waiting + active + completed + failed;
  }
};

struct StalledRecovery {
  std::vector<long long> requeued;
  std::vector<long long> failed;
};

}  // namespace relay_core
