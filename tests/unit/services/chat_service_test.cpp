#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "relay_core/jobs/memory_job_store.hpp"
#include "relay_core/services/chat_service.hpp"
#include "mocks_test.hpp"

namespace relay_tests {

using namespace relay_core;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::Return;
using ::testing::StrictMock;

class ChatServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    cache_ = std::make_unique<ResponseCache>(CacheOptions{});
    executor_ = std::make_unique<StrictMock<MockQueryExecutor>>();
    QueueOptions options;
    options.concurrency = 1;
    options.idle_poll_interval = 20ms;
    queue_ = std::make_unique<JobQueue>(options, std::make_unique<MemoryJobStore>(), *cache_,
                                        *executor_);
    service_ = std::make_unique<ChatService>(*queue_, 50);
  }

  void TearDown() override {
    service_.reset();
    queue_.reset();
    executor_.reset();
    cache_.reset();
  }

  static SubmitRequest request(const std::string &query) {
    SubmitRequest req;
    req.query = query;
    return req;
  }

  std::unique_ptr<ResponseCache> cache_;
  std::unique_ptr<StrictMock<MockQueryExecutor>> executor_;
  std::unique_ptr<JobQueue> queue_;
  std::unique_ptr<ChatService> service_;
};

TEST_F(ChatServiceTest, InvalidQueryIsRejectedBeforeQueueing) {
  EXPECT_THROW(service_->submit(request("   ")), ValidationError);
  EXPECT_THROW(service_->submit(request(std::string(51, 'a'))), ValidationError);
  EXPECT_THROW(service_->submit(request("bad \xC3\x28 bytes")), ValidationError);

  EXPECT_EQ(queue_->get_stats().counts.total(), 0);
}

TEST_F(ChatServiceTest, SubmitReturnsHandleWithoutWaiting) {
  JobHandle handle = service_->submit(request("hello"));
  EXPECT_GT(handle.id, 0);
  EXPECT_EQ(handle.result.wait_for(0ms), std::future_status::timeout);
  EXPECT_EQ(queue_->get_job(handle.id)->state, JobState::WAITING);
}

TEST_F(ChatServiceTest, SubmitAndAwaitReturnsAnswer) {
  EXPECT_CALL(*executor_, execute_query(_)).WillOnce(Return(MockUtilities::make_answer("world")));
  queue_->start();

  QueryResult result = service_->submit_and_await(request("hello"), 2000ms);
  queue_->stop();

  EXPECT_EQ(result.answer, "world");
  EXPECT_EQ(result.caller_id, "anonymous");
  EXPECT_FALSE(result.cached);
}

TEST_F(ChatServiceTest, SubmitAndAwaitPropagatesJobFailure) {
  EXPECT_CALL(*executor_, execute_query(_))
      .WillOnce(::testing::Throw(WorkerError(ErrorKind::WorkerCrashed, "Worker exited")));
  queue_->start();

  try {
    service_->submit_and_await(request("hello"), 2000ms);
    FAIL() << "Expected RelayError";
  } catch (const RelayError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::WorkerCrashed);
  }
  queue_->stop();
}

TEST_F(ChatServiceTest, AwaitTimeoutDoesNotCancelJob) {
  // Not started, so the job stays queued past the deadline.
  EXPECT_THROW(service_->submit_and_await(request("hello"), 30ms), QueueTimeoutError);
  EXPECT_EQ(queue_->get_stats().counts.waiting, 1);

  EXPECT_CALL(*executor_, execute_query(_)).WillOnce(Return(MockUtilities::make_answer("late")));
  EXPECT_TRUE(queue_->run_one_job());
  EXPECT_EQ(queue_->get_stats().counts.completed, 1);
}

}  // namespace relay_tests
