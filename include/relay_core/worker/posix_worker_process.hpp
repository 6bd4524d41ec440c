#pragma once

#include <sys/types.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "relay_core/worker/worker_process.hpp"

namespace relay_core {

/**
 * @class PosixWorkerProcess
 * @brief Runs the worker as a child process connected through pipes.
 *
 * stdin receives request lines, stdout is split into response lines and
 * stderr is relayed as log lines. Reader threads poll their descriptors so
 * terminate() can always join them, even if a grandchild keeps a pipe open.
 */
class PosixWorkerProcess : public IWorkerProcess {
 public:
  explicit PosixWorkerProcess(std::vector<std::string> command);
  ~PosixWorkerProcess() override;

  PosixWorkerProcess(const PosixWorkerProcess &) = delete;
  PosixWorkerProcess &operator=(const PosixWorkerProcess &) = delete;

  void start(const ProcessEventSink &sink) override;
  void send_line(const std::string &line) override;
  void terminate() override;

  pid_t pid() const {
    return pid_;
  }

 private:
  void read_loop(int fd, ProcessEventType type);
  void reap_and_report();
  void close_fd(int &fd);

  std::vector<std::string> command_;
  ProcessEventSink sink_;
  pid_t pid_ = -1;
  int stdin_fd_ = -1;
  int stdout_fd_ = -1;
  int stderr_fd_ = -1;
  std::atomic<bool> stopping_{false};
  std::atomic<bool> reaped_{false};
  std::thread stdout_thread_;
  std::thread stderr_thread_;
};

}  // namespace relay_core
