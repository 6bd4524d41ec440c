#pragma once

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace relay_core {

enum class ErrorKind {
  Validation,
  WorkerExecution,
  WorkerTimeout,
  WorkerCrashed,
  QueueStalled,
  QueueTimeout,
  Unavailable,
  Internal
};

inline std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Validation: return "VALIDATION_ERROR";
    case ErrorKind::WorkerExecution: return "WORKER_EXECUTION_ERROR";
    case ErrorKind::WorkerTimeout: return "WORKER_TIMEOUT";
    case ErrorKind::WorkerCrashed: return "WORKER_CRASHED";
    case ErrorKind::QueueStalled: return "QUEUE_STALLED";
    case ErrorKind::QueueTimeout: return "QUEUE_TIMEOUT";
    case ErrorKind::Unavailable: return "UNAVAILABLE";
    case ErrorKind::Internal: return "INTERNAL_ERROR";
  }
  return "INTERNAL_ERROR";
}

inline ErrorKind error_kind_from_string(const std::string &str) {
  if (str == "VALIDATION_ERROR") return ErrorKind::Validation;
  if (str == "WORKER_EXECUTION_ERROR") return ErrorKind::WorkerExecution;
  if (str == "WORKER_TIMEOUT") return ErrorKind::WorkerTimeout;
  if (str == "WORKER_CRASHED") return ErrorKind::WorkerCrashed;
  if (str == "QUEUE_STALLED") return ErrorKind::QueueStalled;
  if (str == "QUEUE_TIMEOUT") return ErrorKind::QueueTimeout;
  if (str == "UNAVAILABLE") return ErrorKind::Unavailable;
  if (str == "INTERNAL_ERROR") return ErrorKind::Internal;
  throw std::invalid_argument("Invalid ErrorKind string: " + str);
}

/**
 * @brief Structured failure carried from the pipeline to its callers.
 *
 * Every failure that leaves the pipeline is a RelayError with a
 * machine-readable kind and a human-readable message. Optional details are
 * kept as JSON so they can be returned verbatim by the HTTP layer.
 */
class RelayError : public std::exception {
 public:
  RelayError(ErrorKind kind, const std::string &message,
             nlohmann::json details = nlohmann::json())
      : kind_(kind), message_(message), details_(std::move(details)) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

  ErrorKind kind() const {
    return kind_;
  }
  const nlohmann::json &details() const {
    return details_;
  }

  nlohmann::json to_json() const {
    nlohmann::json j;
    j["code"] = to_string(kind_);
    j["message"] = message_;
    if (!details_.is_null()) {
      j["details"] = details_;
    }
    return j;
  }

 private:
  ErrorKind kind_;
  std::string message_;
  nlohmann::json details_;
};

class ValidationError : public RelayError {
 public:
  explicit ValidationError(const std::string &message, nlohmann::json details = nlohmann::json())
      : RelayError(ErrorKind::Validation, message, std::move(details)) {}
};

class WorkerError : public RelayError {
 public:
  WorkerError(ErrorKind kind, const std::string &message,
              nlohmann::json details = nlohmann::json())
      : RelayError(kind, message, std::move(details)) {}

  // A crash already restarted the worker and a stopped bridge will not come
  // back, so only explicit failures and timeouts are worth another attempt.
  bool is_retryable() const {
    return kind() == ErrorKind::WorkerExecution || kind() == ErrorKind::WorkerTimeout;
  }
};

class QueueTimeoutError : public RelayError {
 public:
  explicit QueueTimeoutError(const std::string &message = "Request processing timeout",
                             nlohmann::json details = nlohmann::json())
      : RelayError(ErrorKind::QueueTimeout, message, std::move(details)) {}
};

}  // namespace relay_core
