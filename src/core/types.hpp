#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace bridge {

using json = nlohmann::json;
// Keeps object keys in the order they were parsed
using ordered_json = nlohmann::ordered_json;

// Type aliases
using SessionId = std::string;
using AgentId = std::string;
using CallId = std::string;

// Result type for operations that can fail
template <typename T>
struct Result {
  std::optional<T> value;
  std::optional<std::string> error;

  bool ok() const {
    return value.has_value();
  }

  bool failed() const {
    return error.has_value();
  }

  static Result success(T val) {
    return Result{std::move(val), std::nullopt};
  }

  static Result failure(std::string err) {
    return Result{std::nullopt, std::move(err)};
  }
};

// Error taxonomy shared by every stage of a turn
enum class ErrorKind {
  Unreachable,          // No connection could be established
  Truncated,            // Connection dropped mid-stream
  DecodeError,          // Malformed backend payload
  ProtocolViolation,    // Well-formed but inconsistent event
  Cancelled,            // Caller went away
  TimedOut,             // Turn deadline expired
  RegistryUnavailable,  // Agent list could not be fetched
  BackendError          // Backend reported an error event
};

std::string to_string(ErrorKind kind);

ErrorKind error_kind_from_string(const std::string& str);

// Stable, user-safe text for a failure category
std::string user_message(ErrorKind kind);

// Finish reason reported to the caller on the last chunk of a turn
enum class FinishReason {
  Stop,      // Completed, or paused for clarification
  Error,     // Backend or transport failure
  Cancelled  // Caller disconnect or deadline
};

std::string to_string(FinishReason reason);

FinishReason finish_reason_for(ErrorKind kind);

enum class Role { System, User, Assistant, Tool };

std::string to_string(Role role);

Role role_from_string(const std::string& str);

struct ChatMessage {
  Role role = Role::User;
  std::string content;
};

// One caller request for a conversational turn. Immutable once accepted.
struct ChatTurnRequest {
  AgentId agent_id;
  std::vector<ChatMessage> conversation_history;
  bool stream = true;
  std::chrono::milliseconds timeout{300000};

  // Set when the request continues a session paused for clarification
  std::optional<SessionId> session_id;

  json to_backend_body(const std::string& model) const;
};

struct AgentCapabilities {
  bool tool_calls = true;  // false: the agent's tool activity is tracked but never annotated
};

struct AgentDescriptor {
  AgentId id;
  std::string display_name;
  std::string owned_by = "research-backend";
  AgentCapabilities capabilities;
  bool advertised = true;  // false when synthesized for an id the backend did not list
};

// "sgr_tool_calling_agent" -> "Sgr Tool Calling Agent"
std::string display_name_for(const AgentId& id);

// Replace invalid UTF-8 sequences with U+FFFD so JSON serialization never throws
std::string sanitize_utf8(const std::string& input);

}  // namespace bridge
