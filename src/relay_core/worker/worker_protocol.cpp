#include "relay_core/worker/worker_protocol.hpp"

namespace relay_core {
namespace worker_protocol {

std::string encode_request(const QueryRequest &request) {
  nlohmann::json payload;
  payload["query"] = request.query;
  payload["userId"] = request.caller_id;
  payload["conversationHistory"] = request.context;
  // dump() never emits raw newlines, so the request stays on one line.
  return payload.dump();
}

WorkerResponse parse_response(const std::string &line) {
  nlohmann::json data;
  try {
    data = nlohmann::json::parse(line);
  } catch (const nlohmann::json::parse_error &e) {
    throw ProtocolError(std::string("Invalid JSON from worker: ") + e.what());
  }
  if (!data.is_object()) {
    throw ProtocolError("Worker message is not a JSON object");
  }

  WorkerResponse response;
  const bool success = data.value("success", false);
  if (success && data.contains("message") && data["message"] == "Ready" &&
      !data.contains("answer")) {
    response.kind = ResponseKind::Ready;
  } else if (success) {
    response.kind = ResponseKind::Success;
  } else {
    response.kind = ResponseKind::Failure;
  }
  response.payload = std::move(data);
  return response;
}

WorkerAnswer to_answer(const nlohmann::json &payload) {
  WorkerAnswer answer;
  answer.success = true;
  if (payload.contains("answer") && payload["answer"].is_string()) {
    answer.answer = payload["answer"].get<std::string>();
  }
  if (payload.contains("sources") && payload["sources"].is_array()) {
    answer.sources = payload["sources"];
  } else if (payload.contains("contexts") && payload["contexts"].is_array()) {
    answer.sources = payload["contexts"];
  }
  if (payload.contains("usage")) {
    answer.usage = payload["usage"];
  }
  return answer;
}

std::string failure_message(const nlohmann::json &payload) {
  if (payload.contains("error")) {
    const auto &error = payload["error"];
    if (error.is_object() && error.contains("message") && error["message"].is_string()) {
      return error["message"].get<std::string>();
    }
    if (error.is_string()) {
      return error.get<std::string>();
    }
  }
  return "Unknown worker error";
}

}  // namespace worker_protocol
}  // namespace relay_core
