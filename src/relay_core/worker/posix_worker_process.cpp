#include "relay_core/worker/posix_worker_process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <mutex>

namespace relay_core {

namespace {

constexpr int kPollIntervalMs = 200;

void ignore_sigpipe_once() {
  static std::once_flag flag;
  std::call_once(flag, [] { std::signal(SIGPIPE, SIG_IGN); });
}

std::string errno_message(const std::string &what) {
  return what + ": " + std::strerror(errno);
}

}  // namespace

PosixWorkerProcess::PosixWorkerProcess(std::vector<std::string> command)
    : command_(std::move(command)) {}

PosixWorkerProcess::~PosixWorkerProcess() {
  terminate();
}

void PosixWorkerProcess::start(const ProcessEventSink &sink) {
  if (pid_ > 0) {
    throw WorkerProcessError("Worker process is already running.");
  }
  if (command_.empty()) {
    throw WorkerProcessError("Worker command is empty.");
  }
  ignore_sigpipe_once();
  sink_ = sink;

  int in_pipe[2];
  int out_pipe[2];
  int err_pipe[2];
  if (pipe2(in_pipe, O_CLOEXEC) != 0) {
    throw WorkerProcessError(errno_message("pipe failed"));
  }
  if (pipe2(out_pipe, O_CLOEXEC) != 0) {
    ::close(in_pipe[0]);
    ::close(in_pipe[1]);
    throw WorkerProcessError(errno_message("pipe failed"));
  }
  if (pipe2(err_pipe, O_CLOEXEC) != 0) {
    for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1]}) ::close(fd);
    throw WorkerProcessError(errno_message("pipe failed"));
  }

  // argv is built before fork so the child only calls async-signal-safe functions.
  std::vector<char *> argv;
  argv.reserve(command_.size() + 1);
  for (auto &arg : command_) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);

  pid_t pid = fork();
  if (pid < 0) {
    for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) {
      ::close(fd);
    }
    throw WorkerProcessError(errno_message("fork failed"));
  }

  if (pid == 0) {
    ::dup2(in_pipe[0], STDIN_FILENO);
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    execvp(argv[0], argv.data());
    _exit(127);
  }

  ::close(in_pipe[0]);
  ::close(out_pipe[1]);
  ::close(err_pipe[1]);
  pid_ = pid;
  stdin_fd_ = in_pipe[1];
  stdout_fd_ = out_pipe[0];
  stderr_fd_ = err_pipe[0];
  stopping_.store(false);
  reaped_.store(false);

  std::cout << "[WorkerProcess] Launched '" << command_.front() << "' (pid " << pid_
            << ", generation " << sink_.generation() << ")" << std::endl;

  stdout_thread_ = std::thread(&PosixWorkerProcess::read_loop, this, stdout_fd_,
                               ProcessEventType::Line);
  stderr_thread_ = std::thread(&PosixWorkerProcess::read_loop, this, stderr_fd_,
                               ProcessEventType::Stderr);
}

void PosixWorkerProcess::send_line(const std::string &line) {
  if (stdin_fd_ < 0) {
    throw WorkerProcessError("Worker stdin is closed.");
  }
  const std::string data = line + "\n";
  std::size_t written = 0;
  while (written < data.size()) {
    ssize_t n = ::write(stdin_fd_, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR) continue;
      throw WorkerProcessError(errno_message("Failed to write to worker"));
    }
    written += static_cast<std::size_t>(n);
  }
}

void PosixWorkerProcess::terminate() {
  if (pid_ <= 0 && !stdout_thread_.joinable() && !stderr_thread_.joinable()) {
    return;
  }
  stopping_.store(true);
  close_fd(stdin_fd_);

  if (pid_ > 0 && !reaped_.load()) {
    ::kill(pid_, SIGKILL);
  }
  if (stdout_thread_.joinable()) stdout_thread_.join();
  if (stderr_thread_.joinable()) stderr_thread_.join();

  if (pid_ > 0 && !reaped_.exchange(true)) {
    int status = 0;
    while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
    }
  }
  close_fd(stdout_fd_);
  close_fd(stderr_fd_);
  pid_ = -1;
}

void PosixWorkerProcess::read_loop(int fd, ProcessEventType type) {
  std::string partial;
  char buf[4096];

  while (!stopping_.load()) {
    pollfd pfd{fd, POLLIN, 0};
    int rc = ::poll(&pfd, 1, kPollIntervalMs);
    if (rc < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (rc == 0) continue;

    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) {
      partial.append(buf, static_cast<std::size_t>(n));
      std::size_t pos = 0;
      while (true) {
        auto nl = partial.find('\n', pos);
        if (nl == std::string::npos) break;
        std::string line = partial.substr(pos, nl - pos);
        pos = nl + 1;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) sink_.post(type, std::move(line));
      }
      if (pos > 0) partial.erase(0, pos);
      continue;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) continue;
    break;  // EOF or read error
  }

  if (stopping_.load()) {
    return;
  }
  if (!partial.empty()) {
    sink_.post(type, std::move(partial));
  }
  if (type == ProcessEventType::Line) {
    reap_and_report();
  }
}

void PosixWorkerProcess::reap_and_report() {
  int status = 0;
  pid_t rc;
  while ((rc = waitpid(pid_, &status, 0)) < 0 && errno == EINTR) {
  }
  reaped_.store(true);

  int exit_code = -1;
  if (rc == pid_) {
    if (WIFEXITED(status)) {
      exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
      exit_code = 128 + WTERMSIG(status);
    }
  }
  sink_.post(ProcessEventType::Exited, std::string(), exit_code);
}

void PosixWorkerProcess::close_fd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

}  // namespace relay_core
