#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace relay_core {

inline const std::string kAnonymousCaller = "anonymous";

struct ContextTurn {
  std::string role;
  std::string content;
};

using ConversationContext = std::vector<ContextTurn>;

struct QueryRequest {
  std::string query;
  std::string caller_id = kAnonymousCaller;
  ConversationContext context;
};

// What the worker produced for a single query.
struct WorkerAnswer {
  std::string answer;
  nlohmann::json sources = nlohmann::json::array();
  nlohmann::json usage;
  long long elapsed_ms = 0;
  bool success = false;
};

// What a caller receives once its job finished.
struct QueryResult {
  long long job_id = 0;
  std::string answer;
  nlohmann::json sources = nlohmann::json::array();
  nlohmann::json usage;
  bool cached = false;
  long long elapsed_ms = 0;
  std::string caller_id;
  std::string session_id;
};

inline void to_json(nlohmann::json &j, const ContextTurn &turn) {
  j = nlohmann::json{{"role", turn.role}, {"content", turn.content}};
}

inline void from_json(const nlohmann::json &j, ContextTurn &turn) {
  turn.role = j.value("role", std::string());
  turn.content = j.value("content", std::string());
}

inline void to_json(nlohmann::json &j, const QueryResult &result) {
  j = nlohmann::json{{"jobId", result.job_id},
                     {"answer", result.answer},
                     {"sources", result.sources},
                     {"cached", result.cached},
                     {"elapsedMs", result.elapsed_ms},
                     {"userId", result.caller_id},
                     {"sessionId", result.session_id}};
  if (!result.usage.is_null()) {
    j["usage"] = result.usage;
  }
}

inline void from_json(const nlohmann::json &j, QueryResult &result) {
  result.job_id = j.value("jobId", 0LL);
  result.answer = j.value("answer", std::string());
  result.sources = j.contains("sources") ? j.at("sources") : nlohmann::json::array();
  result.usage = j.contains("usage") ? j.at("usage") : nlohmann::json();
  result.cached = j.value("cached", false);
  result.elapsed_ms = j.value("elapsedMs", 0LL);
  result.caller_id = j.value("userId", std::string());
  result.session_id = j.value("sessionId", std::string());
}

}  // namespace relay_core
