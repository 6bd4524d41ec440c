#pragma once

#include <atomic>
#include <thread>

namespace relay_core {
class JobQueue;
}

namespace relay_core {
namespace async {

/**
 * @class JobProcessor
 * @brief A single background thread that processes jobs from a JobQueue.
 *
 * A JobProcessor is a long-lived object that keeps claiming jobs from the
 * queue. When none is waiting it sleeps until the queue signals new work or
 * the idle poll interval passes.
 *
 * This class is designed to be managed by a ProcessorPool. It is non-copyable
 * and non-movable to ensure clear ownership of the underlying thread.
 */
class JobProcessor {
 public:
  /**
   * @brief Constructs a JobProcessor instance.
   * @param processor_id A unique identifier for this processor, used for logging.
   * @param queue The queue to claim jobs from. Must outlive the processor.
   */
  JobProcessor(int processor_id, JobQueue &queue);

  /**
   * @brief Destructor. Ensures the processor thread is stopped and joined.
   */
  ~JobProcessor();

  /**
   * @brief Starts the processing loop in a new background thread.
   *
   * Throws std::runtime_error if the processor is already running.
   */
  void start();

  /**
   * @brief Signals the processor to stop after its current job.
   *
   * Does not block; the destructor waits for the thread.
   */
  void stop();

  int id() const {
    return processor_id_;
  }

  JobProcessor(const JobProcessor &) = delete;
  JobProcessor &operator=(const JobProcessor &) = delete;
  JobProcessor(JobProcessor &&) = delete;
  JobProcessor &operator=(JobProcessor &&) = delete;

 private:
  void run_loop();

  int processor_id_;
  JobQueue &queue_;
  std::atomic<bool> should_stop_{false};
  std::thread thread_;
};

}  // namespace async
}  // namespace relay_core
