#include "relay_core/async/processor_pool.hpp"
#include <iostream>
#include <stdexcept>

namespace relay_core::async {

ProcessorPool::ProcessorPool(size_t num_processors, JobQueue& queue) {
    if (num_processors == 0) {
        throw std::invalid_argument("ProcessorPool must have at least one processor.");
    }

    m_processors.reserve(num_processors);
    for (size_t i = 0; i < num_processors; ++i) {
        m_processors.emplace_back(std::make_unique<JobProcessor>(static_cast<int>(i), queue));
    }
    std::cout << "ProcessorPool created with " << num_processors << " processors." << std::endl;
}

ProcessorPool::~ProcessorPool() {
    if (m_is_running) {
        stop();
    }
    // Each JobProcessor joins its thread on destruction.
    m_processors.clear();
}

void ProcessorPool::start() {
    if (m_is_running) {
        std::cerr << "Warning: ProcessorPool is already running." << std::endl;
        return;
    }
    for (const auto& processor : m_processors) {
        processor->start();
    }
    m_is_running = true;
}

void ProcessorPool::stop() {
    if (!m_is_running) {
        return;
    }
    std::cout << "Stopping all processors in the pool..." << std::endl;
    for (const auto& processor : m_processors) {
        processor->stop();
    }
    m_is_running = false;
}

} // namespace relay_core::async
