#pragma once

#include "relay_core/async/job_processor.hpp"
#include <memory>
#include <vector>

namespace relay_core::async {

/**
 * @class ProcessorPool
 * @brief Owns the JobProcessor threads that give a JobQueue its concurrency.
 *
 * Processors are created up front and joined when the pool is destroyed.
 */
class ProcessorPool {
public:
    /**
     * @param num_processors Number of processor threads; must be positive.
     * @param queue The queue every processor claims jobs from.
     */
    ProcessorPool(size_t num_processors, JobQueue& queue);

    /**
     * @brief Destructor. Stops and joins all processor threads.
     */
    ~ProcessorPool();

    void start();

    /**
     * @brief Signals every processor to stop after its current job.
     *
     * Does not block. The destructor waits for the threads.
     */
    void stop();

    size_t size() const { return m_processors.size(); }

    ProcessorPool(const ProcessorPool&) = delete;
    ProcessorPool& operator=(const ProcessorPool&) = delete;
    ProcessorPool(ProcessorPool&&) = delete;
    ProcessorPool& operator=(ProcessorPool&&) = delete;

private:
    std::vector<std::unique_ptr<JobProcessor>> m_processors;
    bool m_is_running = false;
};

} // namespace relay_core::async
