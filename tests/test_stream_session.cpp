#include <gtest/gtest.h>

#include "session/stream_session.hpp"

using namespace bridge;

class StreamSessionTest : public ::testing::Test {
 protected:
  void SetUp() override {
    session_ = std::make_unique<StreamSession>("session-1", "sgr_agent");
    ASSERT_TRUE(session_->begin_turn());
  }

  std::vector<OutputFragment> apply_all(const std::vector<AgentEvent>& events) {
    std::vector<OutputFragment> out;
    for (const auto& event : events) {
      auto fragments = session_->apply(event);
      out.insert(out.end(), fragments.begin(), fragments.end());
    }
    return out;
  }

  std::unique_ptr<StreamSession> session_;
};

TEST_F(StreamSessionTest, StartsIdle) {
  StreamSession session("s", "a");
  EXPECT_EQ(session.phase(), SessionPhase::Idle);
  EXPECT_FALSE(session.is_terminal());

  // Events before the turn starts are violations and produce nothing
  EXPECT_TRUE(session.apply(TextDelta{"early"}).empty());
  EXPECT_EQ(session.protocol_violations(), 1u);
  EXPECT_TRUE(session.text().empty());
}

TEST_F(StreamSessionTest, TextDeltasAppendInOrder) {
  auto fragments = apply_all({TextDelta{"Hello"}, TextDelta{", "}, TextDelta{"world"}});
  ASSERT_EQ(fragments.size(), 3u);
  EXPECT_EQ(fragments[0].payload, "Hello");
  EXPECT_EQ(fragments[2].payload, "world");
  EXPECT_FALSE(fragments[2].is_final);
  EXPECT_EQ(session_->text(), "Hello, world");
  EXPECT_EQ(session_->phase(), SessionPhase::Streaming);
}

TEST_F(StreamSessionTest, EmptyDeltaProducesNothing) {
  EXPECT_TRUE(session_->apply(TextDelta{""}).empty());
}

TEST_F(StreamSessionTest, ToolCallThenAnswer) {
  auto fragments = apply_all({
      ToolCallStarted{"1", "search", json{{"query", "fusion"}}},
      ToolCallFinished{"1", "3 hits"},
      TextDelta{"Found 3 results"},
      TurnCompleted{"Found 3 results"},
  });

  ASSERT_EQ(fragments.size(), 4u);
  EXPECT_EQ(fragments[0].kind, FragmentKind::ToolAnnotation);
  EXPECT_NE(fragments[0].payload.find("**Tool:** search"), std::string::npos);
  EXPECT_EQ(fragments[1].kind, FragmentKind::ToolAnnotation);
  EXPECT_NE(fragments[1].payload.find("3 hits"), std::string::npos);
  EXPECT_EQ(fragments[2].kind, FragmentKind::Text);
  EXPECT_EQ(fragments[2].payload, "Found 3 results");

  // Final marker repeats nothing
  EXPECT_TRUE(fragments[3].is_final);
  EXPECT_EQ(fragments[3].finish_reason, FinishReason::Stop);
  EXPECT_TRUE(fragments[3].payload.empty());

  EXPECT_EQ(session_->phase(), SessionPhase::Completed);
  EXPECT_EQ(session_->text(), "Found 3 results");
  ASSERT_EQ(session_->tool_activity().size(), 1u);
  EXPECT_EQ(session_->tool_activity()[0].status, ToolActivity::Status::Completed);
  EXPECT_EQ(session_->tool_activity()[0].result, "3 hits");
  EXPECT_TRUE(session_->open_tool_calls().empty());
}

TEST_F(StreamSessionTest, ToolAnnotationsSuppressed) {
  StreamSession quiet("s", "a", SessionOptions{false});
  quiet.begin_turn();
  EXPECT_TRUE(quiet.apply(ToolCallStarted{"1", "search", json::object()}).empty());
  EXPECT_TRUE(quiet.apply(ToolCallFinished{"1", "ok"}).empty());
  ASSERT_EQ(quiet.tool_activity().size(), 1u);
  EXPECT_EQ(quiet.tool_activity()[0].status, ToolActivity::Status::Completed);
}

TEST_F(StreamSessionTest, DuplicateToolCallIdIsIgnored) {
  session_->apply(ToolCallStarted{"1", "search", json::object()});
  EXPECT_TRUE(session_->apply(ToolCallStarted{"1", "search", json::object()}).empty());
  EXPECT_EQ(session_->protocol_violations(), 1u);
  EXPECT_EQ(session_->open_tool_calls().size(), 1u);
  EXPECT_EQ(session_->phase(), SessionPhase::Streaming);
}

TEST_F(StreamSessionTest, UnknownToolResultIsIgnored) {
  EXPECT_TRUE(session_->apply(ToolCallFinished{"ghost", "x"}).empty());
  EXPECT_EQ(session_->protocol_violations(), 1u);
  EXPECT_EQ(session_->phase(), SessionPhase::Streaming);
}

TEST_F(StreamSessionTest, CompletionWithoutStreamedText) {
  auto fragments = session_->apply(TurnCompleted{"The whole answer"});
  ASSERT_EQ(fragments.size(), 1u);
  EXPECT_EQ(fragments[0].payload, "The whole answer");
  EXPECT_TRUE(fragments[0].is_final);
  EXPECT_EQ(session_->text(), "The whole answer");
}

TEST_F(StreamSessionTest, CompletionExtendsStreamedText) {
  session_->apply(TextDelta{"Part one"});
  auto fragments = session_->apply(TurnCompleted{"Part one, part two"});
  ASSERT_EQ(fragments.size(), 1u);
  EXPECT_EQ(fragments[0].payload, ", part two");
  EXPECT_EQ(session_->text(), "Part one, part two");
}

TEST_F(StreamSessionTest, StreamedTextWinsOverDivergentCompletion) {
  session_->apply(TextDelta{"Streamed"});
  auto fragments = session_->apply(TurnCompleted{"Something else"});
  ASSERT_EQ(fragments.size(), 1u);
  EXPECT_TRUE(fragments[0].payload.empty());
  EXPECT_EQ(session_->text(), "Streamed");
}

TEST_F(StreamSessionTest, OpenToolCallsAtCompletion) {
  session_->apply(ToolCallStarted{"1", "search", json::object()});
  auto fragments = session_->apply(TurnCompleted{"Answer"});
  ASSERT_EQ(fragments.size(), 1u);
  EXPECT_EQ(fragments[0].payload, "Answer\n\n> **Incomplete tool activity:** search\n");
  EXPECT_EQ(session_->phase(), SessionPhase::Completed);
  EXPECT_TRUE(session_->open_tool_calls().empty());
  EXPECT_EQ(session_->tool_activity()[0].status, ToolActivity::Status::Incomplete);
  EXPECT_EQ(session_->protocol_violations(), 1u);
}

TEST_F(StreamSessionTest, ClarificationPausesTurn) {
  auto fragments = session_->apply(ClarificationRequested{"Which year?"});
  ASSERT_EQ(fragments.size(), 1u);
  EXPECT_EQ(fragments[0].kind, FragmentKind::Control);
  EXPECT_EQ(fragments[0].payload, "Which year?");
  EXPECT_FALSE(fragments[0].is_final);
  EXPECT_EQ(session_->phase(), SessionPhase::AwaitingClarification);
  EXPECT_FALSE(session_->is_terminal());

  // Nothing more until the caller continues
  EXPECT_TRUE(session_->apply(TextDelta{"late"}).empty());
  EXPECT_EQ(session_->text(), "");

  ASSERT_TRUE(session_->begin_turn());
  EXPECT_EQ(session_->phase(), SessionPhase::Streaming);
  auto resumed = apply_all({TextDelta{"In 2024"}, TurnCompleted{}});
  ASSERT_EQ(resumed.size(), 2u);
  EXPECT_EQ(resumed[0].payload, "In 2024");
  EXPECT_EQ(session_->phase(), SessionPhase::Completed);
}

TEST_F(StreamSessionTest, TurnTextIsPerTurn) {
  session_->apply(TextDelta{"Before "});
  session_->apply(ClarificationRequested{"?"});
  session_->begin_turn();
  session_->apply(TextDelta{"after"});
  EXPECT_EQ(session_->text(), "Before after");
  EXPECT_EQ(session_->turn_text(), "after");

  // Completion text is compared with the current turn only
  auto fragments = session_->apply(TurnCompleted{"after all"});
  EXPECT_EQ(fragments[0].payload, " all");
}

TEST_F(StreamSessionTest, TruncationKeepsEmittedText) {
  auto first = session_->apply(TextDelta{"Partial"});
  ASSERT_EQ(first.size(), 1u);

  auto fragments = session_->apply(StreamError{ErrorKind::Truncated, "connection reset"});
  ASSERT_EQ(fragments.size(), 1u);
  EXPECT_EQ(fragments[0].kind, FragmentKind::Control);
  EXPECT_TRUE(fragments[0].is_final);
  EXPECT_EQ(fragments[0].finish_reason, FinishReason::Error);
  EXPECT_NE(fragments[0].payload.find("**Error:**"), std::string::npos);
  // Internal detail stays in the log
  EXPECT_EQ(fragments[0].payload.find("connection reset"), std::string::npos);

  EXPECT_EQ(session_->phase(), SessionPhase::Failed);
  EXPECT_EQ(session_->error(), ErrorKind::Truncated);
  EXPECT_EQ(session_->text(), "Partial");
}

TEST_F(StreamSessionTest, CancelIsTerminalAndIdempotent) {
  session_->apply(ToolCallStarted{"1", "fetch", json::object()});
  auto fragments = session_->fail(ErrorKind::Cancelled, "caller disconnected");
  ASSERT_EQ(fragments.size(), 1u);
  EXPECT_EQ(fragments[0].finish_reason, FinishReason::Cancelled);
  EXPECT_NE(fragments[0].payload.find("Incomplete tool activity:** fetch"), std::string::npos);
  EXPECT_EQ(session_->phase(), SessionPhase::Failed);
  EXPECT_EQ(session_->error(), ErrorKind::Cancelled);

  EXPECT_TRUE(session_->fail(ErrorKind::TimedOut, "late").empty());
  EXPECT_EQ(session_->error(), ErrorKind::Cancelled);
  EXPECT_TRUE(session_->apply(TextDelta{"more"}).empty());
}

TEST_F(StreamSessionTest, TerminalSessionCannotRestart) {
  session_->apply(TurnCompleted{"done"});
  EXPECT_FALSE(session_->begin_turn());
  EXPECT_TRUE(session_->apply(TextDelta{"extra"}).empty());
  EXPECT_EQ(session_->text(), "done");
}

TEST_F(StreamSessionTest, ParkedSessionCanFail) {
  session_->apply(ClarificationRequested{"?"});
  auto fragments = session_->fail(ErrorKind::TimedOut, "expired");
  ASSERT_EQ(fragments.size(), 1u);
  EXPECT_EQ(session_->phase(), SessionPhase::Failed);
}

TEST_F(StreamSessionTest, ToolActivityJson) {
  session_->apply(ToolCallStarted{"c1", "search", json{{"q", "x"}}});
  session_->apply(ToolCallFinished{"c1", "ok"});
  auto j = session_->tool_activity()[0].to_json();
  EXPECT_EQ(j["call_id"], "c1");
  EXPECT_EQ(j["tool"], "search");
  EXPECT_EQ(j["status"], "completed");
  EXPECT_EQ(j["arguments"]["q"], "x");
}
