#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "relay_core/jobs/memory_job_store.hpp"
#include "relay_core/jobs/sqlite_job_store.hpp"
#include "utilities_test.hpp"

namespace relay_tests {

using namespace relay_core;
using namespace std::chrono_literals;

enum class StoreBackend { Memory, Sqlite };

std::string backend_name(const ::testing::TestParamInfo<StoreBackend>& info) {
  return info.param == StoreBackend::Memory ? "Memory" : "Sqlite";
}

// Runs the same contract against both job store implementations.
class JobStoreTest : public ::testing::TestWithParam<StoreBackend> {
 protected:
  void SetUp() override {
    if (GetParam() == StoreBackend::Sqlite) {
      temp_db_path_ = TestUtilities::create_temp_test_db();
      db_manager_ = std::make_unique<DatabaseManager>();
      db_manager_->initialize(temp_db_path_, 2);
      store_ = std::make_unique<SqliteJobStore>(*db_manager_);
    } else {
      store_ = std::make_unique<MemoryJobStore>();
    }
  }

  void TearDown() override {
    store_.reset();
    if (db_manager_) {
      db_manager_->shutdown();
      db_manager_.reset();
      TestUtilities::cleanup_temp_db(temp_db_path_);
    }
  }

  long long create(const std::string& query, int priority = kDefaultJobPriority) {
    return store_->create_job(TestUtilities::create_test_payload(query, priority));
  }

  std::filesystem::path temp_db_path_;
  std::unique_ptr<DatabaseManager> db_manager_;
  std::unique_ptr<IJobStore> store_;
};

TEST_P(JobStoreTest, CreatedJobIsWaitingWithPayload) {
  JobPayload payload = TestUtilities::create_test_payload("hello", 3, "alice");
  payload.context = {{"user", "earlier question"}};
  const long long id = store_->create_job(payload);

  auto job = store_->get_job(id);
  ASSERT_TRUE(job.has_value());
  EXPECT_EQ(job->id, id);
  EXPECT_EQ(job->state, JobState::WAITING);
  EXPECT_EQ(job->payload.query, "hello");
  EXPECT_EQ(job->payload.caller_id, "alice");
  EXPECT_EQ(job->payload.priority, 3);
  ASSERT_EQ(job->payload.context.size(), 1u);
  EXPECT_EQ(job->payload.context[0].content, "earlier question");
  EXPECT_EQ(job->attempts_made, 0);
  EXPECT_EQ(job->progress_percent, 0);
  EXPECT_FALSE(job->is_finished());
  EXPECT_FALSE(job->processed_at.has_value());
}

TEST_P(JobStoreTest, IdsAreUniqueAndIncreasing) {
  const long long a = create("a");
  const long long b = create("b");
  EXPECT_GT(b, a);
  EXPECT_FALSE(store_->get_job(b + 100).has_value());
}

TEST_P(JobStoreTest, ClaimsByPriorityThenCreationOrder) {
  const long long low_first = create("low-1", 10);
  const long long urgent = create("urgent", 1);
  const long long low_second = create("low-2", 10);

  EXPECT_EQ(store_->claim_next_job()->id, urgent);
  EXPECT_EQ(store_->claim_next_job()->id, low_first);
  EXPECT_EQ(store_->claim_next_job()->id, low_second);
  EXPECT_FALSE(store_->claim_next_job().has_value());
}

TEST_P(JobStoreTest, ClaimMarksActiveAndBumpsAttempts) {
  const long long id = create("q");

  auto claimed = store_->claim_next_job();
  ASSERT_TRUE(claimed.has_value());
  EXPECT_EQ(claimed->state, JobState::ACTIVE);
  EXPECT_EQ(claimed->attempts_made, 1);
  EXPECT_TRUE(claimed->processed_at.has_value());

  JobCounts counts = store_->count_jobs();
  EXPECT_EQ(counts.active, 1);
  EXPECT_EQ(counts.waiting, 0);
  EXPECT_EQ(store_->get_job(id)->state, JobState::ACTIVE);
}

TEST_P(JobStoreTest, ProgressNeverMovesBackwards) {
  const long long id = create("q");
  const int claim = store_->claim_next_job()->attempts_made;

  EXPECT_TRUE(store_->update_progress(id, claim, 20, "Checking cache"));
  EXPECT_TRUE(store_->update_progress(id, claim, 40, "Invoking worker"));
  EXPECT_FALSE(store_->update_progress(id, claim, 30, "late update"));

  auto job = store_->get_job(id);
  EXPECT_EQ(job->progress_percent, 40);
  EXPECT_EQ(job->progress_message, "Invoking worker");
}

TEST_P(JobStoreTest, CompleteStoresResultOnce) {
  const long long id = create("q");
  const int claim = store_->claim_next_job()->attempts_made;

  EXPECT_TRUE(store_->complete_job(id, claim, TestUtilities::create_test_result(id, "first")));
  // Terminal state is set at most once
  EXPECT_FALSE(store_->complete_job(id, claim, TestUtilities::create_test_result(id, "second")));
  EXPECT_FALSE(store_->fail_job(id, claim, ErrorKind::Internal, "too late"));
  EXPECT_FALSE(store_->update_progress(id, claim, 100, "after the fact"));

  auto job = store_->get_job(id);
  EXPECT_EQ(job->state, JobState::COMPLETED);
  ASSERT_TRUE(job->result.has_value());
  EXPECT_EQ(job->result->answer, "first");
  EXPECT_EQ(job->result->sources, nlohmann::json::array({"doc-1.md"}));
  EXPECT_TRUE(job->finished_at.has_value());
  EXPECT_TRUE(job->is_finished());
}

TEST_P(JobStoreTest, FailRecordsKindAndReason) {
  const long long id = create("q");
  const int claim = store_->claim_next_job()->attempts_made;

  EXPECT_TRUE(store_->fail_job(id, claim, ErrorKind::WorkerTimeout, "Worker execution timeout"));

  auto job = store_->get_job(id);
  EXPECT_EQ(job->state, JobState::FAILED);
  ASSERT_TRUE(job->failure_kind.has_value());
  EXPECT_EQ(*job->failure_kind, ErrorKind::WorkerTimeout);
  EXPECT_EQ(job->failure_reason, "Worker execution timeout");
  EXPECT_EQ(store_->count_jobs().failed, 1);
}

TEST_P(JobStoreTest, MutationsWithStaleClaimAreRefused) {
  const long long id = create("q");
  const int first_claim = store_->claim_next_job()->attempts_made;

  // Lock expired: the job goes back to waiting and is claimed again
  StalledRecovery recovery = store_->recover_stalled_jobs(0ms, 1, 0ms);
  ASSERT_EQ(recovery.requeued.size(), 1u);
  const int second_claim = store_->claim_next_job()->attempts_made;
  EXPECT_EQ(second_claim, first_claim + 1);

  EXPECT_FALSE(store_->complete_job(id, first_claim, TestUtilities::create_test_result(id, "old")));
  EXPECT_FALSE(store_->heartbeat(id, first_claim));
  EXPECT_TRUE(store_->heartbeat(id, second_claim));
  EXPECT_TRUE(store_->complete_job(id, second_claim, TestUtilities::create_test_result(id, "new")));
  EXPECT_EQ(store_->get_job(id)->result->answer, "new");
}

TEST_P(JobStoreTest, StalledJobIsRequeuedThenFailed) {
  const long long id = create("q");
  store_->claim_next_job();

  StalledRecovery first = store_->recover_stalled_jobs(0ms, 1, 0ms);
  EXPECT_EQ(first.requeued, std::vector<long long>{id});
  EXPECT_TRUE(first.failed.empty());

  auto requeued = store_->get_job(id);
  EXPECT_EQ(requeued->state, JobState::WAITING);
  EXPECT_EQ(requeued->stalled_count, 1);
  EXPECT_EQ(requeued->progress_percent, 0);

  store_->claim_next_job();
  StalledRecovery second = store_->recover_stalled_jobs(0ms, 1, 0ms);
  EXPECT_TRUE(second.requeued.empty());
  EXPECT_EQ(second.failed, std::vector<long long>{id});

  auto failed = store_->get_job(id);
  EXPECT_EQ(failed->state, JobState::FAILED);
  EXPECT_EQ(*failed->failure_kind, ErrorKind::QueueStalled);
  EXPECT_EQ(failed->failure_reason, kStalledJobReason);
}

TEST_P(JobStoreTest, StalledRequeueWaitsOutItsBackoff) {
  const long long stalled = create("stalled");
  store_->claim_next_job();

  StalledRecovery recovery = store_->recover_stalled_jobs(0ms, 3, 150ms);
  ASSERT_EQ(recovery.requeued, std::vector<long long>{stalled});

  auto requeued = store_->get_job(stalled);
  ASSERT_TRUE(requeued->delayed_until.has_value());
  EXPECT_EQ(std::chrono::duration_cast<std::chrono::milliseconds>(*requeued->delayed_until -
                                                                  requeued->updated_at),
            150ms);
  // Still waiting, just not claimable yet
  EXPECT_EQ(store_->count_jobs().waiting, 1);
  EXPECT_FALSE(store_->claim_next_job().has_value());

  // Work submitted later is not held up behind it
  const long long fresh = create("fresh");
  auto next = store_->claim_next_job();
  ASSERT_TRUE(next.has_value());
  EXPECT_EQ(next->id, fresh);

  std::this_thread::sleep_for(200ms);
  auto retried = store_->claim_next_job();
  ASSERT_TRUE(retried.has_value());
  EXPECT_EQ(retried->id, stalled);
  EXPECT_FALSE(retried->delayed_until.has_value());
}

TEST_P(JobStoreTest, SecondStallDoublesTheDelay) {
  const long long id = create("q");
  store_->claim_next_job();
  store_->recover_stalled_jobs(0ms, 3, 0ms);
  store_->claim_next_job();

  store_->recover_stalled_jobs(0ms, 3, 100ms);

  auto job = store_->get_job(id);
  EXPECT_EQ(job->stalled_count, 2);
  ASSERT_TRUE(job->delayed_until.has_value());
  EXPECT_EQ(
      std::chrono::duration_cast<std::chrono::milliseconds>(*job->delayed_until - job->updated_at),
      200ms);
}

TEST_P(JobStoreTest, FreshLockIsNotStalled) {
  create("q");
  store_->claim_next_job();

  StalledRecovery recovery = store_->recover_stalled_jobs(60s, 1, 0ms);
  EXPECT_TRUE(recovery.requeued.empty());
  EXPECT_TRUE(recovery.failed.empty());
  EXPECT_EQ(store_->count_jobs().active, 1);
}

TEST_P(JobStoreTest, WaitingJobsAreNeverStalled) {
  create("q");
  StalledRecovery recovery = store_->recover_stalled_jobs(0ms, 1, 0ms);
  EXPECT_TRUE(recovery.requeued.empty());
  EXPECT_EQ(store_->count_jobs().waiting, 1);
}

TEST_P(JobStoreTest, PurgeHonorsSeparateGracePeriods) {
  const long long done = create("done");
  const long long broken = create("broken");
  const long long pending = create("pending");

  auto first = store_->claim_next_job();
  store_->complete_job(first->id, first->attempts_made,
                       TestUtilities::create_test_result(first->id, "ok"));
  auto second = store_->claim_next_job();
  store_->fail_job(second->id, second->attempts_made, ErrorKind::Internal, "boom");
  std::this_thread::sleep_for(5ms);

  // Completed jobs expire immediately, failed ones are kept for an hour
  EXPECT_EQ(store_->purge_finished_jobs(0ms, 1h), 1u);
  EXPECT_FALSE(store_->get_job(done).has_value());
  EXPECT_TRUE(store_->get_job(broken).has_value());

  EXPECT_EQ(store_->purge_finished_jobs(0ms, 0ms), 1u);
  EXPECT_FALSE(store_->get_job(broken).has_value());
  // Unfinished jobs are never purged
  EXPECT_TRUE(store_->get_job(pending).has_value());
}

TEST_P(JobStoreTest, CountsCoverEveryState) {
  create("w");
  create("a");
  create("c");
  create("f");
  store_->claim_next_job();  // "w" stays active
  auto a = store_->claim_next_job();
  store_->complete_job(a->id, a->attempts_made, TestUtilities::create_test_result(a->id, "x"));
  auto c = store_->claim_next_job();
  store_->fail_job(c->id, c->attempts_made, ErrorKind::Internal, "y");

  JobCounts counts = store_->count_jobs();
  EXPECT_EQ(counts.waiting, 1);
  EXPECT_EQ(counts.active, 1);
  EXPECT_EQ(counts.completed, 1);
  EXPECT_EQ(counts.failed, 1);
  EXPECT_EQ(counts.total(), 4);
}

INSTANTIATE_TEST_SUITE_P(Backends, JobStoreTest,
                         ::testing::Values(StoreBackend::Memory, StoreBackend::Sqlite),
                         backend_name);

class SqliteJobStorePersistenceTest : public DatabaseTestBase {};

TEST_F(SqliteJobStorePersistenceTest, WaitingJobsSurviveReopen) {
  long long id = 0;
  {
    SqliteJobStore store(*db_manager_);
    id = store.create_job(TestUtilities::create_test_payload("survivor"));
  }
  db_manager_->shutdown();

  DatabaseManager reopened;
  reopened.initialize(temp_db_path_, 2);
  SqliteJobStore store(reopened);
  auto job = store.claim_next_job();
  ASSERT_TRUE(job.has_value());
  EXPECT_EQ(job->id, id);
  EXPECT_EQ(job->payload.query, "survivor");
  reopened.shutdown();
}

TEST(JobModelTest, JobToJsonShape) {
  Job job;
  job.id = 9;
  job.state = JobState::FAILED;
  job.payload = TestUtilities::create_test_payload("q");
  job.progress_percent = 40;
  job.progress_message = "Invoking worker";
  job.failure_kind = ErrorKind::WorkerCrashed;
  job.failure_reason = "Worker process crashed";

  nlohmann::json j = job_to_json(job);
  EXPECT_EQ(j["jobId"], 9);
  EXPECT_EQ(j["state"], "FAILED");
  EXPECT_EQ(j["progress"]["percent"], 40);
  EXPECT_EQ(j["progress"]["message"], "Invoking worker");
  EXPECT_EQ(j["error"]["code"], "WORKER_CRASHED");
  EXPECT_TRUE(j["finishedAt"].is_null());
}

TEST(JobModelTest, StalledRetryDelayIsExponential) {
  EXPECT_EQ(stalled_retry_delay(2000ms, 1), 2000ms);
  EXPECT_EQ(stalled_retry_delay(2000ms, 2), 4000ms);
  EXPECT_EQ(stalled_retry_delay(2000ms, 3), 8000ms);
  EXPECT_EQ(stalled_retry_delay(2000ms, 0), 2000ms);
  EXPECT_EQ(stalled_retry_delay(0ms, 5), 0ms);
  // The exponent is capped so large counts cannot overflow
  EXPECT_EQ(stalled_retry_delay(1ms, 1000), 65536ms);
}

TEST(JobModelTest, DelayedJobReportsWhenItMayRun) {
  Job job;
  job.payload = TestUtilities::create_test_payload("q");
  EXPECT_FALSE(job_to_json(job).contains("delayedUntil"));

  job.delayed_until = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000000));
  EXPECT_EQ(job_to_json(job)["delayedUntil"], 1700000000000LL);
}

TEST(JobModelTest, StateNamesRoundTrip) {
  for (JobState state : {JobState::WAITING, JobState::ACTIVE, JobState::COMPLETED, JobState::FAILED}) {
    EXPECT_EQ(job_state_from_string(to_string(state)), state);
  }
  EXPECT_THROW(job_state_from_string("PAUSED"), std::invalid_argument);
}

}  // namespace relay_tests
