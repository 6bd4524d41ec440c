#include <gtest/gtest.h>

#include "relay_core/worker/worker_protocol.hpp"

namespace relay_tests {

using namespace relay_core;
using namespace relay_core::worker_protocol;

TEST(WorkerProtocolTest, EncodesRequestOnOneLine) {
  QueryRequest request;
  request.query = "line one\nline two";
  request.caller_id = "alice";
  request.context = {{"user", "hi"}, {"assistant", "hello"}};

  std::string line = encode_request(request);
  EXPECT_EQ(line.find('\n'), std::string::npos);

  auto j = nlohmann::json::parse(line);
  EXPECT_EQ(j["query"], "line one\nline two");
  EXPECT_EQ(j["userId"], "alice");
  ASSERT_EQ(j["conversationHistory"].size(), 2u);
  EXPECT_EQ(j["conversationHistory"][1]["role"], "assistant");
}

TEST(WorkerProtocolTest, RecognizesReadySignal) {
  auto response = parse_response(R"({"success": true, "message": "Ready"})");
  EXPECT_EQ(response.kind, ResponseKind::Ready);
}

TEST(WorkerProtocolTest, AnswerWithReadyMessageIsStillSuccess) {
  auto response = parse_response(R"({"success": true, "message": "Ready", "answer": "42"})");
  EXPECT_EQ(response.kind, ResponseKind::Success);
}

TEST(WorkerProtocolTest, ParsesSuccessAndFailure) {
  auto ok = parse_response(R"({"success": true, "answer": "Paris", "sources": ["geo.md"]})");
  EXPECT_EQ(ok.kind, ResponseKind::Success);

  WorkerAnswer answer = to_answer(ok.payload);
  EXPECT_TRUE(answer.success);
  EXPECT_EQ(answer.answer, "Paris");
  EXPECT_EQ(answer.sources, nlohmann::json::array({"geo.md"}));

  auto failed = parse_response(R"({"success": false, "error": {"message": "model offline"}})");
  EXPECT_EQ(failed.kind, ResponseKind::Failure);
  EXPECT_EQ(failure_message(failed.payload), "model offline");
}

TEST(WorkerProtocolTest, MissingSuccessFlagIsFailure) {
  auto response = parse_response(R"({"answer": "orphan"})");
  EXPECT_EQ(response.kind, ResponseKind::Failure);
  EXPECT_EQ(failure_message(response.payload), "Unknown worker error");
}

TEST(WorkerProtocolTest, AcceptsContextsAsSourceAlias) {
  WorkerAnswer answer = to_answer(nlohmann::json::parse(
      R"({"success": true, "answer": "x", "contexts": ["a", "b"], "usage": {"tokens": 9}})"));
  EXPECT_EQ(answer.sources.size(), 2u);
  EXPECT_EQ(answer.usage["tokens"], 9);
}

TEST(WorkerProtocolTest, FailureMessageAcceptsPlainString) {
  EXPECT_EQ(failure_message(nlohmann::json::parse(R"({"success": false, "error": "bad input"})")),
            "bad input");
}

TEST(WorkerProtocolTest, RejectsNonObjectLines) {
  EXPECT_THROW(parse_response("Loading model weights..."), ProtocolError);
  EXPECT_THROW(parse_response("[1, 2, 3]"), ProtocolError);
}

}  // namespace relay_tests
