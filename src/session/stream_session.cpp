#include "session/stream_session.hpp"

#include <spdlog/spdlog.h>

#include "session/tool_format.hpp"

namespace bridge {

namespace {

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace

std::string to_string(SessionPhase phase) {
  switch (phase) {
    case SessionPhase::Idle:
      return "idle";
    case SessionPhase::Streaming:
      return "streaming";
    case SessionPhase::AwaitingClarification:
      return "awaiting_clarification";
    case SessionPhase::Completed:
      return "completed";
    case SessionPhase::Failed:
      return "failed";
  }
  return "unknown";
}

std::string to_string(FragmentKind kind) {
  switch (kind) {
    case FragmentKind::Text:
      return "text";
    case FragmentKind::ToolAnnotation:
      return "tool_annotation";
    case FragmentKind::Control:
      return "control";
  }
  return "unknown";
}

std::string to_string(ToolActivity::Status status) {
  switch (status) {
    case ToolActivity::Status::Running:
      return "running";
    case ToolActivity::Status::Completed:
      return "completed";
    case ToolActivity::Status::Incomplete:
      return "incomplete";
  }
  return "unknown";
}

json ToolActivity::to_json() const {
  return {{"call_id", call_id},     {"tool", tool_name},
          {"arguments", json(arguments)}, {"result", result},
          {"status", bridge::to_string(status)}, {"duration_ms", duration.count()}};
}

StreamSession::StreamSession(SessionId id, AgentId agent_id, SessionOptions options)
    : id_(std::move(id)), agent_id_(std::move(agent_id)), options_(options), last_active_(std::chrono::steady_clock::now()) {}

bool StreamSession::begin_turn() {
  if (phase_ != SessionPhase::Idle && phase_ != SessionPhase::AwaitingClarification) {
    return false;
  }
  spdlog::debug("[{}] {} -> streaming", id_, to_string(phase_));
  phase_ = SessionPhase::Streaming;
  turn_text_start_ = text_.size();
  turn_activity_start_ = activity_.size();
  last_active_ = std::chrono::steady_clock::now();
  return true;
}

std::vector<OutputFragment> StreamSession::apply(const AgentEvent& event) {
  if (phase_ != SessionPhase::Streaming) {
    if (phase_ == SessionPhase::Idle) {
      violation("event " + event_name(event) + " before the turn started");
    } else {
      spdlog::debug("[{}] Dropping {} in phase {}", id_, event_name(event), to_string(phase_));
    }
    return {};
  }

  last_active_ = std::chrono::steady_clock::now();
  spdlog::trace("[{}] {}", id_, event_name(event));

  return std::visit(overloaded{
                        [this](const TextDelta& e) { return on_text(e); },
                        [this](const ToolCallStarted& e) { return on_tool_started(e); },
                        [this](const ToolCallFinished& e) { return on_tool_finished(e); },
                        [this](const ClarificationRequested& e) { return on_clarification(e); },
                        [this](const TurnCompleted& e) { return on_completed(e); },
                        [this](const StreamError& e) { return on_error(e); },
                    },
                    event);
}

std::vector<OutputFragment> StreamSession::fail(ErrorKind kind, const std::string& detail) {
  if (is_terminal()) {
    return {};
  }
  // A parked session has no turn in progress, but still ends here
  phase_ = SessionPhase::Streaming;
  return on_error(StreamError{kind, detail});
}

std::string StreamSession::turn_text() const {
  return text_.substr(turn_text_start_);
}

std::vector<ToolActivity> StreamSession::turn_tool_activity() const {
  return std::vector<ToolActivity>(activity_.begin() + static_cast<std::ptrdiff_t>(turn_activity_start_), activity_.end());
}

std::vector<OutputFragment> StreamSession::on_text(const TextDelta& event) {
  if (event.text.empty()) {
    return {};
  }
  text_ += event.text;
  return {OutputFragment{FragmentKind::Text, event.text}};
}

std::vector<OutputFragment> StreamSession::on_tool_started(const ToolCallStarted& event) {
  if (open_calls_.count(event.call_id)) {
    violation("duplicate tool call id " + event.call_id);
    return {};
  }

  spdlog::debug("[{}] Tool call {} started: {}", id_, event.call_id, event.tool_name);
  auto now = std::chrono::steady_clock::now();
  open_calls_[event.call_id] = OpenToolCall{event.tool_name, event.arguments, now};

  ToolActivity record;
  record.call_id = event.call_id;
  record.tool_name = event.tool_name;
  record.arguments = event.arguments;
  activity_.push_back(std::move(record));

  if (!options_.emit_tool_calls) {
    return {};
  }
  return {OutputFragment{FragmentKind::ToolAnnotation, format_tool_call(event.tool_name, event.arguments)}};
}

std::vector<OutputFragment> StreamSession::on_tool_finished(const ToolCallFinished& event) {
  auto it = open_calls_.find(event.call_id);
  if (it == open_calls_.end()) {
    violation("result for unknown tool call id " + event.call_id);
    return {};
  }

  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - it->second.started_at);
  spdlog::debug("[{}] Tool call {} finished after {}ms", id_, event.call_id, elapsed.count());
  open_calls_.erase(it);

  for (auto record = activity_.rbegin(); record != activity_.rend(); ++record) {
    if (record->call_id == event.call_id && record->status == ToolActivity::Status::Running) {
      record->status = ToolActivity::Status::Completed;
      record->result = event.result;
      record->duration = elapsed;
      break;
    }
  }

  if (!options_.emit_tool_calls) {
    return {};
  }
  return {OutputFragment{FragmentKind::ToolAnnotation, format_tool_result(event.result)}};
}

std::vector<OutputFragment> StreamSession::on_clarification(const ClarificationRequested& event) {
  spdlog::info("[{}] Backend requested clarification", id_);
  phase_ = SessionPhase::AwaitingClarification;
  // Not final: the conversation stays open for the caller's answer
  return {OutputFragment{FragmentKind::Control, event.prompt, false}};
}

std::vector<OutputFragment> StreamSession::on_completed(const TurnCompleted& event) {
  std::string turn = turn_text();
  std::string trailing;

  if (!event.final_text.empty()) {
    if (turn.empty()) {
      trailing = event.final_text;
    } else if (event.final_text.size() > turn.size() && event.final_text.compare(0, turn.size(), turn) == 0) {
      trailing = event.final_text.substr(turn.size());
    } else if (event.final_text != turn) {
      spdlog::debug("[{}] Completion text differs from streamed text; keeping streamed text", id_);
    }
  }
  text_ += trailing;

  std::string payload = trailing + close_open_calls();
  phase_ = SessionPhase::Completed;
  spdlog::info("[{}] Turn completed ({} chars)", id_, turn.size() + trailing.size());

  return {OutputFragment{FragmentKind::Text, payload, true, FinishReason::Stop}};
}

std::vector<OutputFragment> StreamSession::on_error(const StreamError& event) {
  spdlog::error("[{}] Turn failed ({}): {}", id_, to_string(event.kind), event.message);

  error_ = event.kind;
  std::string payload = close_open_calls();
  payload += "\n\n**Error:** " + user_message(event.kind);
  phase_ = SessionPhase::Failed;

  return {OutputFragment{FragmentKind::Control, payload, true, finish_reason_for(event.kind)}};
}

std::string StreamSession::close_open_calls() {
  if (open_calls_.empty()) {
    return "";
  }

  std::vector<std::string> names;
  for (auto& record : activity_) {
    if (record.status != ToolActivity::Status::Running) continue;
    record.status = ToolActivity::Status::Incomplete;
    names.push_back(record.tool_name);
  }
  violation(std::to_string(open_calls_.size()) + " tool call(s) still open at end of turn");
  open_calls_.clear();

  return format_incomplete_tools(names);
}

void StreamSession::violation(const std::string& what) {
  violations_++;
  spdlog::warn("[{}] Protocol violation: {}", id_, what);
}

}  // namespace bridge
