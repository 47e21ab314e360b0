#pragma once

#include <string>
#include <vector>

#include "backend/agent_event.hpp"

namespace bridge {

struct DecoderOptions {
  // Tool names (case-insensitive) that carry a clarification request or the final answer
  std::vector<std::string> clarification_tools = {"clarificationtool"};
  std::vector<std::string> final_answer_tools = {"finalanswertool"};
};

// Maps one raw backend payload to exactly one AgentEvent.
//
// Accepted shapes:
// - "[DONE]"
// - typed events: {"type": "text_delta" | "tool_call_started" | "tool_call_finished" |
//   "clarification_requested" | "turn_completed" | "error", ...}; the SSE event name
//   stands in for a missing "type"
// - OpenAI-style chunks with choices[0].delta
//
// Unknown fields are ignored. Pure: no I/O and no state between calls.
class EventDecoder {
 public:
  explicit EventDecoder(DecoderOptions options = {});

  // On failure the error describes why the payload is a DecodeError
  Result<AgentEvent> decode(const RawEvent& raw) const;

 private:
  Result<AgentEvent> decode_typed(const std::string& type, const ordered_json& j) const;
  Result<AgentEvent> decode_chunk(const ordered_json& j) const;
  Result<AgentEvent> decode_tool_call(const ordered_json& tool_call) const;

  bool is_clarification_tool(const std::string& name) const;
  bool is_final_answer_tool(const std::string& name) const;

  DecoderOptions options_;
};

}  // namespace bridge
