#include "relay_core/jobs/memory_job_store.hpp"

#include <algorithm>
#include <tuple>

namespace relay_core {

long long MemoryJobStore::create_job(const JobPayload &payload) {
  std::lock_guard<std::mutex> lock(mtx_);
  Job job;
  job.id = next_id_++;
  job.payload = payload;
  job.state = JobState::WAITING;
  job.created_at = std::chrono::system_clock::now();
  job.updated_at = job.created_at;
  const long long id = job.id;
  jobs_.emplace(id, std::move(job));
  return id;
}

std::optional<Job> MemoryJobStore::claim_next_job() {
  std::lock_guard<std::mutex> lock(mtx_);
  const auto now = std::chrono::system_clock::now();
  Job *best = nullptr;
  for (auto &[id, job] : jobs_) {
    if (job.state != JobState::WAITING || (job.delayed_until && *job.delayed_until > now)) {
      continue;
    }
    if (!best || std::tie(job.payload.priority, job.id) < std::tie(best->payload.priority, best->id)) {
      best = &job;
    }
  }
  if (!best) {
    return std::nullopt;
  }
  best->state = JobState::ACTIVE;
  best->delayed_until.reset();
  best->attempts_made += 1;
  best->processed_at = now;
  best->updated_at = now;
  return *best;
}

bool MemoryJobStore::update_progress(long long id, int claim, int percent,
                                     const std::string &message) {
  std::lock_guard<std::mutex> lock(mtx_);
  Job *job = find_claimed_locked(id, claim);
  if (!job || percent < job->progress_percent) {
    return false;
  }
  job->progress_percent = std::min(percent, 100);
  job->progress_message = message;
  job->updated_at = std::chrono::system_clock::now();
  return true;
}

bool MemoryJobStore::heartbeat(long long id, int claim) {
  std::lock_guard<std::mutex> lock(mtx_);
  Job *job = find_claimed_locked(id, claim);
  if (!job) {
    return false;
  }
  job->updated_at = std::chrono::system_clock::now();
  return true;
}

bool MemoryJobStore::complete_job(long long id, int claim, const QueryResult &result) {
  std::lock_guard<std::mutex> lock(mtx_);
  Job *job = find_claimed_locked(id, claim);
  if (!job) {
    return false;
  }
  const auto now = std::chrono::system_clock::now();
  job->state = JobState::COMPLETED;
  job->result = result;
  job->finished_at = now;
  job->updated_at = now;
  return true;
}

bool MemoryJobStore::fail_job(long long id, int claim, ErrorKind kind, const std::string &reason) {
  std::lock_guard<std::mutex> lock(mtx_);
  Job *job = find_claimed_locked(id, claim);
  if (!job) {
    return false;
  }
  const auto now = std::chrono::system_clock::now();
  job->state = JobState::FAILED;
  job->failure_kind = kind;
  job->failure_reason = reason;
  job->finished_at = now;
  job->updated_at = now;
  return true;
}

std::optional<Job> MemoryJobStore::get_job(long long id) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = jobs_.find(id);
  if (it == jobs_.end()) {
    return std::nullopt;
  }
  return it->second;
}

JobCounts MemoryJobStore::count_jobs() {
  std::lock_guard<std::mutex> lock(mtx_);
  JobCounts counts;
  for (const auto &[id, job] : jobs_) {
    switch (job.state) {
      case JobState::WAITING: ++counts.waiting; break;
      case JobState::ACTIVE: ++counts.active; break;
      case JobState::COMPLETED: ++counts.completed; break;
      case JobState::FAILED: ++counts.failed; break;
    }
  }
  return counts;
}

StalledRecovery MemoryJobStore::recover_stalled_jobs(std::chrono::milliseconds lock_duration,
                                                     int max_stalled_count,
                                                     std::chrono::milliseconds backoff_base) {
  std::lock_guard<std::mutex> lock(mtx_);
  StalledRecovery recovery;
  const auto now = std::chrono::system_clock::now();
  const auto cutoff = now - lock_duration;
  for (auto &[id, job] : jobs_) {
    if (job.state != JobState::ACTIVE || job.updated_at > cutoff) {
      continue;
    }
    if (job.stalled_count < max_stalled_count) {
      job.state = JobState::WAITING;
      job.stalled_count += 1;
      job.progress_percent = 0;
      job.progress_message.clear();
      job.delayed_until = now + stalled_retry_delay(backoff_base, job.stalled_count);
      job.updated_at = now;
      recovery.requeued.push_back(id);
    } else {
      job.state = JobState::FAILED;
      job.failure_kind = ErrorKind::QueueStalled;
      job.failure_reason = kStalledJobReason;
      job.finished_at = now;
      job.updated_at = now;
      recovery.failed.push_back(id);
    }
  }
  return recovery;
}

std::size_t MemoryJobStore::purge_finished_jobs(std::chrono::milliseconds completed_grace,
                                                std::chrono::milliseconds failed_grace) {
  std::lock_guard<std::mutex> lock(mtx_);
  const auto now = std::chrono::system_clock::now();
  std::size_t purged = 0;
  for (auto it = jobs_.begin(); it != jobs_.end();) {
    const Job &job = it->second;
    bool expired = false;
    if (job.finished_at && job.state == JobState::COMPLETED) {
      expired = *job.finished_at <= now - completed_grace;
    } else if (job.finished_at && job.state == JobState::FAILED) {
      expired = *job.finished_at <= now - failed_grace;
    }
    if (expired) {
      it = jobs_.erase(it);
      ++purged;
    } else {
      ++it;
    }
  }
  return purged;
}

Job *MemoryJobStore::find_claimed_locked(long long id, int claim) {
  auto it = jobs_.find(id);
  if (it == jobs_.end() || it->second.state != JobState::ACTIVE ||
      it->second.attempts_made != claim) {
    return nullptr;
  }
  return &it->second;
}

}  // namespace relay_core
