#include "server/chat_request.hpp"

namespace bridge {

AgentId agent_id_from_model(const std::string& model, const AgentId& default_agent) {
  auto dot = model.rfind('.');
  std::string id = dot == std::string::npos ? model : model.substr(dot + 1);
  return id.empty() ? default_agent : id;
}

std::string message_text(const json& content) {
  if (content.is_string()) {
    return content.get<std::string>();
  }
  if (!content.is_array()) {
    return "";
  }

  std::string text;
  for (const auto& part : content) {
    std::string piece;
    if (part.is_string()) {
      piece = part.get<std::string>();
    } else if (part.is_object() && part.value("type", "") == "text" && part.contains("text") && part["text"].is_string()) {
      piece = part["text"].get<std::string>();
    } else {
      continue;
    }
    if (!text.empty()) text += "\n";
    text += piece;
  }
  return text;
}

Result<ChatRequest> parse_chat_request(const std::string& body, const AgentId& default_agent) {
  auto j = json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    return Result<ChatRequest>::failure("request body is not a JSON object");
  }

  try {
    ChatRequest request;
    request.model = j.contains("model") && j["model"].is_string() ? j["model"].get<std::string>() : "";
    request.turn.agent_id = agent_id_from_model(request.model, default_agent);
    request.turn.stream = j.value("stream", false);

    if (!j.contains("messages") || !j["messages"].is_array()) {
      return Result<ChatRequest>::failure("'messages' must be an array");
    }
    for (const auto& msg : j["messages"]) {
      if (!msg.is_object()) {
        return Result<ChatRequest>::failure("each message must be an object");
      }
      ChatMessage message;
      message.role = role_from_string(msg.value("role", "user"));
      message.content = sanitize_utf8(message_text(msg.value("content", json())));
      if (message.role == Role::User && !message.content.empty()) {
        request.has_user_message = true;
      }
      request.turn.conversation_history.push_back(std::move(message));
    }

    request.title_task = j.value("task", "") == "title_generation";
    request.title_flag = j.contains("title") && j["title"].is_boolean() && j["title"].get<bool>();

    if (j.contains("session_id") && j["session_id"].is_string() && !j["session_id"].get<std::string>().empty()) {
      request.turn.session_id = j["session_id"].get<std::string>();
    }

    return Result<ChatRequest>::success(std::move(request));
  } catch (const json::exception& e) {
    return Result<ChatRequest>::failure(std::string("invalid request: ") + e.what());
  }
}

}  // namespace bridge
