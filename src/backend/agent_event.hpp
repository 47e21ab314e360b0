#pragma once

#include <string>
#include <variant>

#include "core/types.hpp"

namespace bridge {

// One raw event payload as delivered by the backend stream
struct RawEvent {
  std::string event;  // SSE event name, empty for the default
  std::string data;
};

// Typed backend events
struct TextDelta {
  std::string text;
};

struct ToolCallStarted {
  CallId call_id;
  std::string tool_name;
  ordered_json arguments;  // parsed object in backend key order, else the raw string
};

struct ToolCallFinished {
  CallId call_id;
  std::string result;
};

struct ClarificationRequested {
  std::string prompt;
};

struct TurnCompleted {
  std::string final_text;
};

struct StreamError {
  ErrorKind kind = ErrorKind::BackendError;
  std::string message;  // backend detail, for logs only
};

using AgentEvent = std::variant<TextDelta, ToolCallStarted, ToolCallFinished, ClarificationRequested, TurnCompleted, StreamError>;

// Short name for logging
std::string event_name(const AgentEvent& event);

}  // namespace bridge
