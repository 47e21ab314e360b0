#include <gtest/gtest.h>

#include <deque>

#include "server/turn_runner.hpp"

using namespace bridge;
using namespace std::chrono_literals;

namespace {

// Replays scripted steps. When the script runs out the pending next() waits
// until close(), like a backend that keeps the connection open.
class ScriptedSource : public EventSource {
 public:
  ScriptedSource(asio::any_io_executor executor, std::deque<SourceStep> script, bool hang_at_end)
      : executor_(std::move(executor)), script_(std::move(script)), hang_at_end_(hang_at_end) {}

  void next(NextHandler handler) override {
    nexts++;
    if (closed) {
      asio::post(executor_, [handler = std::move(handler)]() { handler(SourceStep::failed(ErrorKind::Cancelled, "closed")); });
      return;
    }
    if (script_.empty()) {
      if (hang_at_end_) {
        pending_ = std::move(handler);
        return;
      }
      asio::post(executor_, [handler = std::move(handler)]() { handler(SourceStep::end()); });
      return;
    }
    auto step = std::move(script_.front());
    script_.pop_front();
    asio::post(executor_, [handler = std::move(handler), step = std::move(step)]() mutable { handler(std::move(step)); });
  }

  void close() override {
    if (closed) return;
    closed = true;
    if (pending_) {
      auto handler = std::move(pending_);
      pending_ = nullptr;
      asio::post(executor_, [handler = std::move(handler)]() { handler(SourceStep::failed(ErrorKind::Cancelled, "closed")); });
    }
  }

  std::optional<AgentId> backend_agent_id() const override {
    return agent_id;
  }

  bool closed = false;
  int nexts = 0;
  std::optional<AgentId> agent_id;

 private:
  asio::any_io_executor executor_;
  std::deque<SourceStep> script_;
  bool hang_at_end_;
  NextHandler pending_;
};

class ScriptedConnector : public BackendConnector {
 public:
  std::shared_ptr<EventSource> open(const std::string& model, const ChatTurnRequest&, asio::any_io_executor executor) override {
    opened_model = model;
    source = std::make_shared<ScriptedSource>(executor, script, hang_at_end);
    source->agent_id = agent_id;
    return source;
  }

  std::deque<SourceStep> script;
  bool hang_at_end = false;
  std::optional<AgentId> agent_id;
  std::string opened_model;
  std::shared_ptr<ScriptedSource> source;
};

class RecordingOutput : public TurnOutput {
 public:
  explicit RecordingOutput(asio::any_io_executor executor) : executor_(std::move(executor)) {}

  void begin(WriteHandler handler) override {
    began = true;
    complete(std::move(handler), {});
  }

  void emit(const OutputFragment& fragment, WriteHandler handler) override {
    if (fail_writes) {
      complete(std::move(handler), asio::error::broken_pipe);
      return;
    }
    fragments.push_back(fragment);
    complete(std::move(handler), {});
  }

  void finish(const TurnSummary& s, WriteHandler handler) override {
    finishes++;
    summary = s;
    complete(std::move(handler), {});
  }

  bool began = false;
  bool fail_writes = false;
  int finishes = 0;
  std::vector<OutputFragment> fragments;
  std::optional<TurnSummary> summary;

 private:
  void complete(WriteHandler handler, asio::error_code ec) {
    asio::post(executor_, [handler = std::move(handler), ec]() {
      if (handler) handler(ec);
    });
  }

  asio::any_io_executor executor_;
};

SourceStep event(const json& payload) {
  return SourceStep::of(RawEvent{"", payload.dump()});
}

}  // namespace

class TurnRunnerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    strand_ = asio::make_strand(io_ctx_);
    connector_ = std::make_shared<ScriptedConnector>();
    store_ = std::make_shared<SessionStore>(60s);
    output_ = std::make_shared<RecordingOutput>(strand_);

    deps_.connector = connector_;
    deps_.decoder = std::make_shared<const EventDecoder>();
    deps_.store = store_;
  }

  std::shared_ptr<TurnRunner> make_runner(std::chrono::milliseconds timeout = 10s,
                                          std::unique_ptr<StreamSession> session = nullptr) {
    if (!session) {
      session = std::make_unique<StreamSession>("session-1", "sgr_agent");
    }
    ChatTurnRequest request;
    request.agent_id = "sgr_agent";
    request.conversation_history = {{Role::User, "question"}};
    request.timeout = timeout;
    return std::make_shared<TurnRunner>(strand_, deps_, std::move(session), request, "sgr_agent", output_);
  }

  std::optional<TurnSummary> run(const std::shared_ptr<TurnRunner>& runner) {
    std::optional<TurnSummary> done;
    runner->start([&done](const TurnSummary& summary) { done = summary; });
    io_ctx_.run_for(5s);
    return done;
  }

  asio::io_context io_ctx_;
  asio::any_io_executor strand_;
  std::shared_ptr<ScriptedConnector> connector_;
  std::shared_ptr<SessionStore> store_;
  std::shared_ptr<RecordingOutput> output_;
  TurnRunner::Dependencies deps_;
};

TEST_F(TurnRunnerTest, ToolCallThenAnswerInOrder) {
  connector_->script = {
      event({{"type", "tool_call_started"}, {"call_id", "1"}, {"tool_name", "search"}, {"arguments", {{"query", "q"}}}}),
      event({{"type", "tool_call_finished"}, {"call_id", "1"}, {"result", "3 hits"}}),
      event({{"type", "text_delta"}, {"text", "Found 3 results"}}),
      event({{"type", "turn_completed"}, {"final_text", "Found 3 results"}}),
  };

  auto done = run(make_runner());

  ASSERT_TRUE(done.has_value());
  EXPECT_TRUE(output_->began);
  ASSERT_EQ(output_->fragments.size(), 4u);
  EXPECT_EQ(output_->fragments[0].kind, FragmentKind::ToolAnnotation);
  EXPECT_EQ(output_->fragments[1].kind, FragmentKind::ToolAnnotation);
  EXPECT_EQ(output_->fragments[2].payload, "Found 3 results");
  EXPECT_TRUE(output_->fragments[3].is_final);
  EXPECT_TRUE(output_->fragments[3].payload.empty());

  EXPECT_EQ(done->phase, SessionPhase::Completed);
  EXPECT_EQ(done->finish_reason, FinishReason::Stop);
  EXPECT_EQ(done->text, "Found 3 results");
  EXPECT_EQ(done->tool_activity.size(), 1u);
  EXPECT_EQ(output_->finishes, 1);

  // Drained to the end of the backend stream, then released
  EXPECT_TRUE(connector_->source->closed);
  EXPECT_EQ(connector_->opened_model, "sgr_agent");
}

TEST_F(TurnRunnerTest, EndWithoutCompletionIsTruncated) {
  connector_->script = {
      event({{"type", "text_delta"}, {"text", "Partial"}}),
  };

  auto done = run(make_runner());

  ASSERT_TRUE(done.has_value());
  ASSERT_EQ(output_->fragments.size(), 2u);
  EXPECT_EQ(output_->fragments[0].payload, "Partial");
  EXPECT_EQ(output_->fragments[1].kind, FragmentKind::Control);
  EXPECT_TRUE(output_->fragments[1].is_final);
  EXPECT_EQ(done->phase, SessionPhase::Failed);
  EXPECT_EQ(done->error, ErrorKind::Truncated);
  EXPECT_EQ(done->finish_reason, FinishReason::Error);
  EXPECT_TRUE(connector_->source->closed);
}

TEST_F(TurnRunnerTest, SourceFailureEndsTurn) {
  connector_->script = {
      SourceStep::failed(ErrorKind::Unreachable, "connection refused"),
  };

  auto done = run(make_runner());

  ASSERT_TRUE(done.has_value());
  EXPECT_EQ(done->error, ErrorKind::Unreachable);
  ASSERT_EQ(output_->fragments.size(), 1u);
  EXPECT_NE(output_->fragments[0].payload.find("unreachable"), std::string::npos);
  EXPECT_TRUE(connector_->source->closed);
}

TEST_F(TurnRunnerTest, UndecodableEventIsSkipped) {
  connector_->script = {
      SourceStep::of(RawEvent{"", "{broken"}),
      event({{"type", "text_delta"}, {"text", "ok"}}),
      SourceStep::of(RawEvent{"", "[DONE]"}),
  };

  auto done = run(make_runner());

  ASSERT_TRUE(done.has_value());
  EXPECT_EQ(done->phase, SessionPhase::Completed);
  EXPECT_EQ(done->text, "ok");
}

TEST_F(TurnRunnerTest, ClarificationParksSession) {
  connector_->script = {
      event({{"type", "clarification_requested"}, {"prompt", "Which year?"}}),
  };
  connector_->hang_at_end = true;
  connector_->agent_id = "agent-instance-7";

  // The backend keeps the connection open; the deadline releases it
  auto done = run(make_runner(200ms));

  ASSERT_TRUE(done.has_value());
  EXPECT_EQ(done->phase, SessionPhase::AwaitingClarification);
  EXPECT_EQ(done->finish_reason, FinishReason::Stop);
  ASSERT_EQ(output_->fragments.size(), 1u);
  EXPECT_EQ(output_->fragments[0].kind, FragmentKind::Control);
  EXPECT_EQ(output_->fragments[0].payload, "Which year?");
  EXPECT_FALSE(output_->fragments[0].is_final);
  EXPECT_TRUE(connector_->source->closed);

  auto parked = store_->take("session-1");
  ASSERT_NE(parked, nullptr);
  EXPECT_EQ(parked->phase(), SessionPhase::AwaitingClarification);
  ASSERT_TRUE(parked->backend_agent_id().has_value());
  EXPECT_EQ(*parked->backend_agent_id(), "agent-instance-7");
}

TEST_F(TurnRunnerTest, StreamedClarificationToolReachesCaller) {
  connector_->script = {
      SourceStep::of(RawEvent{"", R"({"choices":[{"index":0,"delta":{"tool_calls":[{"index":0,"id":"call_A","type":"function","function":{"name":"clarificationtool","arguments":""}}]}}]})"}),
      SourceStep::of(RawEvent{"", R"({"choices":[{"index":0,"delta":{"tool_calls":[{"index":0,"function":{"arguments":"{\"questions\":[\"Which year?\"]}"}}]}}]})"}),
      SourceStep::of(RawEvent{"", R"({"choices":[{"index":0,"delta":{"tool_calls":[{"id":"1-action","type":"function","function":{"name":"clarificationtool","arguments":"{\"questions\":[\"Which year?\"]}"}}]}}]})"}),
      SourceStep::of(RawEvent{"", "[DONE]"}),
  };

  auto done = run(make_runner());

  ASSERT_TRUE(done.has_value());
  EXPECT_EQ(done->phase, SessionPhase::AwaitingClarification);
  ASSERT_EQ(output_->fragments.size(), 1u);
  EXPECT_EQ(output_->fragments[0].kind, FragmentKind::Control);
  EXPECT_EQ(output_->fragments[0].payload, "Which year?");
  EXPECT_FALSE(output_->fragments[0].is_final);
  EXPECT_NE(store_->take("session-1"), nullptr);
}

TEST_F(TurnRunnerTest, ContinuationResumesParkedSession) {
  auto session = std::make_unique<StreamSession>("session-9", "sgr_agent");
  session->begin_turn();
  session->apply(TextDelta{"Earlier text. "});
  session->apply(ClarificationRequested{"Which year?"});

  connector_->script = {
      event({{"type", "text_delta"}, {"text", "In 2024."}}),
      event({{"type", "turn_completed"}}),
  };

  auto done = run(make_runner(10s, std::move(session)));

  ASSERT_TRUE(done.has_value());
  EXPECT_EQ(done->phase, SessionPhase::Completed);
  EXPECT_EQ(done->session_id, "session-9");
  EXPECT_EQ(done->text, "In 2024.");
}

TEST_F(TurnRunnerTest, CallerDisconnectClosesBackend) {
  connector_->script = {
      event({{"type", "text_delta"}, {"text", "Working"}}),
  };
  connector_->hang_at_end = true;

  auto runner = make_runner();
  asio::steady_timer disconnect(io_ctx_, 50ms);
  disconnect.async_wait([runner](const asio::error_code&) { runner->cancel(ErrorKind::Cancelled); });

  auto done = run(runner);

  ASSERT_TRUE(done.has_value());
  EXPECT_EQ(done->phase, SessionPhase::Failed);
  EXPECT_EQ(done->error, ErrorKind::Cancelled);
  EXPECT_EQ(done->finish_reason, FinishReason::Cancelled);
  ASSERT_EQ(output_->fragments.size(), 2u);
  EXPECT_EQ(output_->fragments[0].payload, "Working");
  EXPECT_EQ(output_->fragments[1].finish_reason, FinishReason::Cancelled);
  EXPECT_TRUE(connector_->source->closed);
  EXPECT_EQ(output_->finishes, 1);

  // Late cancels are no-ops
  runner->cancel(ErrorKind::TimedOut);
  io_ctx_.restart();
  io_ctx_.run_for(100ms);
  EXPECT_EQ(output_->finishes, 1);
}

TEST_F(TurnRunnerTest, DeadlineTimesOut) {
  connector_->hang_at_end = true;

  auto done = run(make_runner(50ms));

  ASSERT_TRUE(done.has_value());
  EXPECT_EQ(done->phase, SessionPhase::Failed);
  EXPECT_EQ(done->error, ErrorKind::TimedOut);
  EXPECT_TRUE(connector_->source->closed);
}

TEST_F(TurnRunnerTest, WriteFailureCancelsTurn) {
  connector_->script = {
      event({{"type", "text_delta"}, {"text", "lost"}}),
  };
  connector_->hang_at_end = true;
  output_->fail_writes = true;

  auto done = run(make_runner());

  ASSERT_TRUE(done.has_value());
  EXPECT_EQ(done->error, ErrorKind::Cancelled);
  EXPECT_TRUE(connector_->source->closed);
}

TEST_F(TurnRunnerTest, NextRequestedOnlyAfterWrite) {
  connector_->script = {
      event({{"type", "text_delta"}, {"text", "a"}}),
      event({{"type", "text_delta"}, {"text", "b"}}),
      event({{"type", "turn_completed"}}),
  };

  auto done = run(make_runner());

  ASSERT_TRUE(done.has_value());
  // Three events, the End seen while draining, and nothing more
  EXPECT_EQ(connector_->source->nexts, 4);
}
