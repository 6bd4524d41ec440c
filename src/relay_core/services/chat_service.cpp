#include "relay_core/services/chat_service.hpp"

#include <iostream>

namespace relay_core {

ChatService::ChatService(JobQueue &queue, std::size_t max_query_length)
    : queue_(queue), max_query_length_(max_query_length) {}

QueryResult ChatService::submit_and_await(const SubmitRequest &request,
                                          std::chrono::milliseconds timeout) {
  JobHandle handle = submit(request);
  try {
    return queue_.await_result(handle, timeout);
  } catch (const QueueTimeoutError &) {
    std::cerr << "[ChatService] Job " << handle.id << " did not finish within " << timeout.count()
              << "ms; it keeps running in the background" << std::endl;
    throw;
  }
}

JobHandle ChatService::submit(const SubmitRequest &request) {
  validate_query(request.query, max_query_length_);
  return queue_.submit(request);
}

}  // namespace relay_core
