#include <gtest/gtest.h>

#include <string>

#include "relay_core/errors.hpp"
#include "relay_core/validation.hpp"

namespace relay_tests {

using relay_core::ErrorKind;
using relay_core::ValidationError;
using relay_core::validate_query;

TEST(ValidationTest, AcceptsOrdinaryQuery) {
  EXPECT_NO_THROW(validate_query("What is the refund policy?"));
}

TEST(ValidationTest, RejectsEmptyAndBlankQueries) {
  EXPECT_THROW(validate_query(""), ValidationError);
  EXPECT_THROW(validate_query("   \t\n"), ValidationError);
}

TEST(ValidationTest, LengthLimitCountsCodePointsNotBytes) {
  // Each "é" is two bytes in UTF-8
  std::string accented;
  for (int i = 0; i < 10; ++i) {
    accented += "\xC3\xA9";
  }
  EXPECT_NO_THROW(validate_query(accented, 10));
  EXPECT_THROW(validate_query(accented + "x", 10), ValidationError);
}

TEST(ValidationTest, DefaultLimitIsTwoThousand) {
  EXPECT_NO_THROW(validate_query(std::string(relay_core::kDefaultMaxQueryLength, 'a')));

  try {
    validate_query(std::string(relay_core::kDefaultMaxQueryLength + 1, 'a'));
    FAIL() << "Expected ValidationError";
  } catch (const ValidationError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::Validation);
    EXPECT_EQ(e.details()["length"], 2001);
    EXPECT_EQ(e.details()["maxLength"], 2000);
  }
}

TEST(ValidationTest, RejectsInvalidUtf8) {
  EXPECT_THROW(validate_query(std::string("abc\xFF\xFE")), ValidationError);
}

TEST(ErrorsTest, KindCodesRoundTrip) {
  for (ErrorKind kind : {ErrorKind::Validation, ErrorKind::WorkerExecution, ErrorKind::WorkerTimeout,
                         ErrorKind::WorkerCrashed, ErrorKind::QueueStalled, ErrorKind::QueueTimeout,
                         ErrorKind::Unavailable, ErrorKind::Internal}) {
    EXPECT_EQ(relay_core::error_kind_from_string(relay_core::to_string(kind)), kind);
  }
  EXPECT_THROW(relay_core::error_kind_from_string("NOPE"), std::invalid_argument);
}

TEST(ErrorsTest, OnlyExecutionFailuresAndTimeoutsAreRetryable) {
  EXPECT_TRUE(relay_core::WorkerError(ErrorKind::WorkerExecution, "x").is_retryable());
  EXPECT_TRUE(relay_core::WorkerError(ErrorKind::WorkerTimeout, "x").is_retryable());
  EXPECT_FALSE(relay_core::WorkerError(ErrorKind::WorkerCrashed, "x").is_retryable());
  EXPECT_FALSE(relay_core::WorkerError(ErrorKind::Unavailable, "x").is_retryable());
}

TEST(ErrorsTest, ToJsonOmitsEmptyDetails) {
  relay_core::RelayError plain(ErrorKind::Internal, "boom");
  EXPECT_FALSE(plain.to_json().contains("details"));

  relay_core::QueueTimeoutError timeout("Request processing timeout", {{"jobId", 7}});
  auto j = timeout.to_json();
  EXPECT_EQ(j["code"], "QUEUE_TIMEOUT");
  EXPECT_EQ(j["details"]["jobId"], 7);
}

}  // namespace relay_tests
