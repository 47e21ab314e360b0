#include <gtest/gtest.h>

#include "emit/turn_accumulator.hpp"

using namespace bridge;

class TurnAccumulatorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    accumulator_ = std::make_shared<TurnAccumulator>(io_ctx_.get_executor(), "chatcmpl-acc", "sgr_agent",
                                                     [this](json response) { response_ = std::move(response); }, 1700000000);
  }

  asio::io_context io_ctx_;
  std::shared_ptr<TurnAccumulator> accumulator_;
  std::optional<json> response_;
};

TEST_F(TurnAccumulatorTest, AssemblesCompletion) {
  accumulator_->begin(nullptr);
  accumulator_->emit(OutputFragment{FragmentKind::ToolAnnotation, "\n\n> **Tool:** search\n"}, nullptr);
  accumulator_->emit(OutputFragment{FragmentKind::Text, "Found "}, nullptr);
  accumulator_->emit(OutputFragment{FragmentKind::Text, "3 results", true}, nullptr);

  TurnSummary summary;
  summary.session_id = "s1";
  summary.phase = SessionPhase::Completed;
  ToolActivity record;
  record.call_id = "1";
  record.tool_name = "search";
  record.result = "3 hits";
  record.status = ToolActivity::Status::Completed;
  summary.tool_activity.push_back(record);

  bool done = false;
  accumulator_->finish(summary, [&](const asio::error_code& ec) { done = !ec; });
  io_ctx_.run();

  EXPECT_TRUE(done);
  ASSERT_TRUE(response_.has_value());
  const auto& r = *response_;
  EXPECT_EQ(r["id"], "chatcmpl-acc");
  EXPECT_EQ(r["object"], "chat.completion");
  EXPECT_EQ(r["choices"][0]["message"]["role"], "assistant");
  EXPECT_EQ(r["choices"][0]["message"]["content"], "Found 3 results");
  EXPECT_EQ(r["choices"][0]["finish_reason"], "stop");
  ASSERT_EQ(r["tool_activity"].size(), 1u);
  EXPECT_EQ(r["tool_activity"][0]["tool"], "search");
  EXPECT_EQ(r["x_session"]["state"], "completed");
}

TEST_F(TurnAccumulatorTest, ErrorTextIsIncluded) {
  accumulator_->emit(OutputFragment{FragmentKind::Text, "Partial"}, nullptr);
  accumulator_->emit(OutputFragment{FragmentKind::Control, "\n\n**Error:** interrupted", true, FinishReason::Error}, nullptr);

  TurnSummary summary;
  summary.session_id = "s2";
  summary.phase = SessionPhase::Failed;
  summary.error = ErrorKind::Truncated;
  summary.finish_reason = FinishReason::Error;
  accumulator_->finish(summary, nullptr);
  io_ctx_.run();

  ASSERT_TRUE(response_.has_value());
  EXPECT_EQ((*response_)["choices"][0]["message"]["content"], "Partial\n\n**Error:** interrupted");
  EXPECT_EQ((*response_)["choices"][0]["finish_reason"], "error");
  EXPECT_EQ((*response_)["x_session"]["error"], "truncated");
}

TEST_F(TurnAccumulatorTest, HandlersAreNotInline) {
  bool done = false;
  accumulator_->emit(OutputFragment{FragmentKind::Text, "x"}, [&](const asio::error_code&) { done = true; });
  EXPECT_FALSE(done);
  io_ctx_.run();
  EXPECT_TRUE(done);
}

TEST_F(TurnAccumulatorTest, CompletesOnce) {
  int calls = 0;
  auto accumulator = std::make_shared<TurnAccumulator>(io_ctx_.get_executor(), "id", "m", [&](json) { calls++; });
  accumulator->finish(TurnSummary{}, nullptr);
  accumulator->finish(TurnSummary{}, nullptr);
  io_ctx_.run();
  EXPECT_EQ(calls, 1);
}
