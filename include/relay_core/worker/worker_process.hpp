#pragma once

#include <memory>
#include <string>

#include "relay_core/util/channel.hpp"

namespace relay_core {

class WorkerProcessError : public std::exception {
 public:
  explicit WorkerProcessError(const std::string &message) : message_(message) {}
  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

enum class ProcessEventType {
  Line,    // one complete line from the worker's stdout
  Stderr,  // one line from the worker's stderr
  Exited,  // the process exited or its stdout closed
  Wake     // no payload, only wakes the dispatcher
};

struct ProcessEvent {
  ProcessEventType type = ProcessEventType::Wake;
  unsigned generation = 0;
  std::string data;
  int exit_code = 0;
};

using ProcessEventChannel = Channel<ProcessEvent>;

// Handed to a process on start; stamps every event with the launch
// generation so the bridge can drop events from a process it already killed.
class ProcessEventSink {
 public:
  ProcessEventSink() = default;
  ProcessEventSink(unsigned generation, std::shared_ptr<ProcessEventChannel> channel)
      : generation_(generation), channel_(std::move(channel)) {}

  void post(ProcessEventType type, std::string data = std::string(), int exit_code = 0) const {
    if (!channel_) {
      return;
    }
    ProcessEvent event;
    event.type = type;
    event.generation = generation_;
    event.data = std::move(data);
    event.exit_code = exit_code;
    channel_->push(std::move(event));
  }

  unsigned generation() const {
    return generation_;
  }

 private:
  unsigned generation_ = 0;
  std::shared_ptr<ProcessEventChannel> channel_;
};

/**
 * @class IWorkerProcess
 * @brief One launch of the external worker, reachable through a line channel.
 *
 * Instances are single-use: the bridge creates a fresh one for every
 * (re)start and calls terminate() before dropping it.
 */
class IWorkerProcess {
 public:
  virtual ~IWorkerProcess() = default;

  // Launches the process. Output lines and exit are reported through sink.
  virtual void start(const ProcessEventSink &sink) = 0;

  // Writes one request line. Throws WorkerProcessError if the write fails.
  virtual void send_line(const std::string &line) = 0;

  // Kills the process and releases its resources. Safe to call twice.
  virtual void terminate() = 0;
};

}  // namespace relay_core
