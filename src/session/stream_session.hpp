#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "backend/agent_event.hpp"
#include "core/types.hpp"
#include "session/output_fragment.hpp"

namespace bridge {

// Session phase
enum class SessionPhase { Idle, Streaming, AwaitingClarification, Completed, Failed };

std::string to_string(SessionPhase phase);

// Tool call that has started and not yet finished
struct OpenToolCall {
  std::string tool_name;
  ordered_json arguments;
  std::chrono::steady_clock::time_point started_at;
};

// Record of one tool invocation, in start order
struct ToolActivity {
  enum class Status { Running, Completed, Incomplete };

  CallId call_id;
  std::string tool_name;
  ordered_json arguments;
  std::string result;
  Status status = Status::Running;
  std::chrono::milliseconds duration{0};

  json to_json() const;
};

std::string to_string(ToolActivity::Status status);

struct SessionOptions {
  bool emit_tool_calls = true;
};

// State machine for one conversational turn (and its continuations after clarification).
// Processes exactly one AgentEvent at a time; not thread-safe.
class StreamSession {
 public:
  StreamSession(SessionId id, AgentId agent_id, SessionOptions options = {});

  const SessionId& id() const {
    return id_;
  }

  const AgentId& agent_id() const {
    return agent_id_;
  }

  SessionPhase phase() const {
    return phase_;
  }

  bool is_terminal() const {
    return phase_ == SessionPhase::Completed || phase_ == SessionPhase::Failed;
  }

  // Idle -> Streaming, or AwaitingClarification -> Streaming for a continuation.
  // Returns false in any other phase.
  bool begin_turn();

  // Apply one backend event; returns the fragments it produces, in order
  std::vector<OutputFragment> apply(const AgentEvent& event);

  // Force Failed (cancellation or deadline). No-op on a terminal session.
  std::vector<OutputFragment> fail(ErrorKind kind, const std::string& detail);

  // Everything appended by text deltas (and completion fallbacks) so far
  const std::string& text() const {
    return text_;
  }

  // Text of the current turn only
  std::string turn_text() const;

  const std::map<CallId, OpenToolCall>& open_tool_calls() const {
    return open_calls_;
  }

  const std::vector<ToolActivity>& tool_activity() const {
    return activity_;
  }

  // Tool activity recorded since the current turn began
  std::vector<ToolActivity> turn_tool_activity() const;

  std::optional<ErrorKind> error() const {
    return error_;
  }

  size_t protocol_violations() const {
    return violations_;
  }

  // Backend agent instance serving this session, reused for continuations
  const std::optional<AgentId>& backend_agent_id() const {
    return backend_agent_id_;
  }

  void set_backend_agent_id(AgentId id) {
    backend_agent_id_ = std::move(id);
  }

  std::chrono::steady_clock::time_point last_active() const {
    return last_active_;
  }

 private:
  std::vector<OutputFragment> on_text(const TextDelta& event);
  std::vector<OutputFragment> on_tool_started(const ToolCallStarted& event);
  std::vector<OutputFragment> on_tool_finished(const ToolCallFinished& event);
  std::vector<OutputFragment> on_clarification(const ClarificationRequested& event);
  std::vector<OutputFragment> on_completed(const TurnCompleted& event);
  std::vector<OutputFragment> on_error(const StreamError& event);

  // Log and mark pending tool calls; returns the annotation for the final fragment
  std::string close_open_calls();

  void violation(const std::string& what);

  SessionId id_;
  AgentId agent_id_;
  SessionOptions options_;

  SessionPhase phase_ = SessionPhase::Idle;
  std::string text_;
  size_t turn_text_start_ = 0;
  size_t turn_activity_start_ = 0;
  std::map<CallId, OpenToolCall> open_calls_;
  std::vector<ToolActivity> activity_;
  std::optional<ErrorKind> error_;
  std::optional<AgentId> backend_agent_id_;
  size_t violations_ = 0;
  std::chrono::steady_clock::time_point last_active_;
};

}  // namespace bridge
