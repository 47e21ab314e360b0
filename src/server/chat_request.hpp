#pragma once

#include <optional>
#include <string>

#include "core/types.hpp"

namespace bridge {

// Inbound /v1/chat/completions body, normalized
struct ChatRequest {
  std::string model;  // as sent, echoed back in responses
  ChatTurnRequest turn;
  bool title_task = false;  // "task": "title_generation"
  bool title_flag = false;  // "title": true
  bool has_user_message = false;
};

// Throws nothing; errors describe why the body is unusable (HTTP 400)
Result<ChatRequest> parse_chat_request(const std::string& body, const AgentId& default_agent);

// "pipeline.sgr_agent" -> "sgr_agent"; empty -> default_agent
AgentId agent_id_from_model(const std::string& model, const AgentId& default_agent);

// String content as is; multi-part content has its text parts joined
std::string message_text(const json& content);

}  // namespace bridge
