#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "relay_core/types/query.hpp"

namespace relay_core {

class ProtocolError : public std::exception {
 public:
  explicit ProtocolError(const std::string &message) : message_(message) {}
  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Line protocol spoken with the worker. Exactly one request is outstanding at
// a time, so responses carry no request id and are matched in FIFO order.
namespace worker_protocol {

enum class ResponseKind { Ready, Success, Failure };

struct WorkerResponse {
  ResponseKind kind = ResponseKind::Failure;
  nlohmann::json payload;
};

std::string encode_request(const QueryRequest &request);

// Throws ProtocolError if the line is not a JSON object.
WorkerResponse parse_response(const std::string &line);

// Builds an answer from a Success payload. Accepts "sources" or the older
// "contexts" key for source references.
WorkerAnswer to_answer(const nlohmann::json &payload);

// Message from a Failure payload's error object, or a generic fallback.
std::string failure_message(const nlohmann::json &payload);

}  // namespace worker_protocol
}  // namespace relay_core
