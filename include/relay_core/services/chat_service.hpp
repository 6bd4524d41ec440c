#pragma once

#include <chrono>

#include "relay_core/jobs/job_queue.hpp"
#include "relay_core/validation.hpp"

namespace relay_core {

// Entry point used by the HTTP layer: validates a query, then hands it to
// the job queue.
class ChatService {
 public:
  ChatService(JobQueue &queue, std::size_t max_query_length = kDefaultMaxQueryLength);

  // Throws ValidationError before anything is queued, QueueTimeoutError if
  // the job does not finish in time, or the job's own RelayError.
  QueryResult submit_and_await(const SubmitRequest &request, std::chrono::milliseconds timeout);

  JobHandle submit(const SubmitRequest &request);

 private:
  JobQueue &queue_;
  std::size_t max_query_length_;
};

}  // namespace relay_core
