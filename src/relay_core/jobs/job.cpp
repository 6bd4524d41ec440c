#include "relay_core/jobs/job.hpp"

#include "relay_core/util/time_utils.hpp"

namespace relay_core {

nlohmann::json job_to_json(const Job &job) {
  nlohmann::json j;
  j["jobId"] = job.id;
  j["state"] = to_string(job.state);
  j["query"] = job.payload.query;
  j["userId"] = job.payload.caller_id;
  j["sessionId"] = job.payload.session_id;
  j["priority"] = job.payload.priority;
  j["attemptsMade"] = job.attempts_made;
  j["stalledCount"] = job.stalled_count;
  j["progress"] = {{"percent", job.progress_percent}, {"message", job.progress_message}};
  j["createdAt"] = to_epoch_ms(job.created_at);
  j["updatedAt"] = to_epoch_ms(job.updated_at);
  j["processedAt"] = job.processed_at ? nlohmann::json(to_epoch_ms(*job.processed_at))
                                      : nlohmann::json();
  j["finishedAt"] = job.finished_at ? nlohmann::json(to_epoch_ms(*job.finished_at))
                                    : nlohmann::json();
  if (job.delayed_until) {
    j["delayedUntil"] = to_epoch_ms(*job.delayed_until);
  }
  if (job.result) {
    j["result"] = *job.result;
  }
  if (job.failure_kind) {
    j["error"] = {{"code", to_string(*job.failure_kind)}, {"message", job.failure_reason}};
  }
  return j;
}

}  // namespace relay_core
