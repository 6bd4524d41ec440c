#include "relay_core/async/job_processor.hpp"

#include <iostream>
#include <stdexcept>

#include "relay_core/jobs/job_queue.hpp"

namespace relay_core {
namespace async {

JobProcessor::JobProcessor(int processor_id, JobQueue &queue)
    : processor_id_(processor_id), queue_(queue) {}

JobProcessor::~JobProcessor() {
  stop();
  // Blocks until the current job, if any, has finished.
  if (thread_.joinable()) {
    thread_.join();
  }
}

void JobProcessor::start() {
  if (thread_.joinable()) {
    throw std::runtime_error("Processor is already running.");
  }
  should_stop_.store(false);
  thread_ = std::thread(&JobProcessor::run_loop, this);
}

void JobProcessor::stop() {
  should_stop_.store(true);
}

void JobProcessor::run_loop() {
  std::cout << "Processor [" << processor_id_ << "] starting run loop." << std::endl;

  while (!should_stop_.load()) {
    if (!queue_.run_one_job(processor_id_)) {
      queue_.wait_for_work(queue_.options().idle_poll_interval);
    }
  }
  std::cout << "Processor [" << processor_id_ << "] run loop terminated." << std::endl;
}

}  // namespace async
}  // namespace relay_core
