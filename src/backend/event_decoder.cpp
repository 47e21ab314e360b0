#include "backend/event_decoder.hpp"

#include <algorithm>
#include <cctype>

namespace bridge {

namespace {

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string trim(const std::string& s) {
  auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return "";
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

// Strings stay as they are, anything else is rendered as JSON
std::string as_text(const ordered_json& value) {
  if (value.is_null()) return "";
  if (value.is_string()) return value.get<std::string>();
  return value.dump();
}

// Tool arguments arrive as a JSON-encoded string in OpenAI chunks
ordered_json parse_arguments(const ordered_json& value) {
  if (!value.is_string()) return value.is_null() ? ordered_json::object() : value;
  const auto& text = value.get_ref<const std::string&>();
  if (text.empty()) return ordered_json::object();
  auto parsed = ordered_json::parse(text, nullptr, false);
  if (parsed.is_discarded()) return value;
  return parsed;
}

std::string join_questions(const ordered_json& questions) {
  std::string prompt;
  for (const auto& q : questions) {
    if (!prompt.empty()) prompt += "\n";
    prompt += as_text(q);
  }
  return prompt;
}

Result<std::string> required_string(const ordered_json& j, const char* key) {
  if (!j.contains(key) || !j[key].is_string()) {
    return Result<std::string>::failure(std::string("missing string field '") + key + "'");
  }
  return Result<std::string>::success(j[key].get<std::string>());
}

Result<AgentEvent> fail(std::string reason) {
  return Result<AgentEvent>::failure(std::move(reason));
}

Result<AgentEvent> ok(AgentEvent event) {
  return Result<AgentEvent>::success(std::move(event));
}

}  // namespace

EventDecoder::EventDecoder(DecoderOptions options) : options_(std::move(options)) {}

Result<AgentEvent> EventDecoder::decode(const RawEvent& raw) const {
  std::string data = trim(sanitize_utf8(raw.data));
  if (data == "[DONE]") {
    return ok(TurnCompleted{});
  }
  if (data.empty()) {
    return fail("empty payload");
  }

  auto j = ordered_json::parse(data, nullptr, false);
  if (j.is_discarded()) {
    return fail("payload is not valid JSON");
  }
  if (!j.is_object()) {
    return fail("payload is not a JSON object");
  }

  try {
    if (j.contains("choices") || (j.contains("error") && !j.contains("type"))) {
      return decode_chunk(j);
    }

    std::string type = j.contains("type") && j["type"].is_string() ? j["type"].get<std::string>() : raw.event;
    if (type.empty() || type == "message") {
      return fail("payload has neither 'type' nor 'choices'");
    }
    return decode_typed(type, j);
  } catch (const json::exception& e) {
    return fail(std::string("unexpected payload shape: ") + e.what());
  }
}

Result<AgentEvent> EventDecoder::decode_typed(const std::string& type, const ordered_json& j) const {
  if (type == "text_delta") {
    auto text = required_string(j, "text");
    if (!text.ok()) return fail(*text.error);
    return ok(TextDelta{*text.value});
  }

  if (type == "tool_call_started") {
    auto call_id = required_string(j, "call_id");
    if (!call_id.ok() || call_id.value->empty()) return fail("tool_call_started without call_id");
    auto name = required_string(j, "tool_name");
    if (!name.ok()) return fail(*name.error);
    return ok(ToolCallStarted{*call_id.value, *name.value, parse_arguments(j.value("arguments", ordered_json()))});
  }

  if (type == "tool_call_finished") {
    auto call_id = required_string(j, "call_id");
    if (!call_id.ok() || call_id.value->empty()) return fail("tool_call_finished without call_id");
    return ok(ToolCallFinished{*call_id.value, as_text(j.value("result", ordered_json()))});
  }

  if (type == "clarification_requested") {
    if (j.contains("prompt") && j["prompt"].is_string()) {
      return ok(ClarificationRequested{j["prompt"].get<std::string>()});
    }
    if (j.contains("questions") && j["questions"].is_array()) {
      return ok(ClarificationRequested{join_questions(j["questions"])});
    }
    return fail("clarification_requested without prompt");
  }

  if (type == "turn_completed") {
    return ok(TurnCompleted{as_text(j.value("final_text", ordered_json()))});
  }

  if (type == "error") {
    StreamError error;
    if (j.contains("kind") && j["kind"].is_string()) {
      error.kind = error_kind_from_string(j["kind"].get<std::string>());
    }
    error.message = as_text(j.value("message", ordered_json()));
    return ok(error);
  }

  return fail("unknown event type '" + type + "'");
}

Result<AgentEvent> EventDecoder::decode_chunk(const ordered_json& j) const {
  if (j.contains("error") && !j["error"].is_null()) {
    const auto& err = j["error"];
    std::string message = err.is_object() ? as_text(err.value("message", err)) : as_text(err);
    return ok(StreamError{ErrorKind::BackendError, message});
  }

  if (!j.contains("choices")) {
    return fail("chunk without 'choices'");
  }
  const auto& choices = j["choices"];
  if (!choices.is_array()) {
    return fail("'choices' is not an array");
  }
  if (choices.empty()) {
    // Usage-only chunk
    return ok(TextDelta{});
  }

  const auto& choice = choices[0];
  ordered_json delta = choice.is_object() ? choice.value("delta", ordered_json::object()) : ordered_json::object();
  if (!delta.is_object()) {
    return fail("'delta' is not an object");
  }

  if (delta.contains("tool_calls") && delta["tool_calls"].is_array() && !delta["tool_calls"].empty()) {
    return decode_tool_call(delta["tool_calls"][0]);
  }

  if (delta.value("role", "") == "tool" && delta.contains("tool_call_id")) {
    auto call_id = as_text(delta["tool_call_id"]);
    if (call_id.empty()) return fail("tool result without tool_call_id");
    return ok(ToolCallFinished{call_id, as_text(delta.value("content", ordered_json()))});
  }

  return ok(TextDelta{as_text(delta.value("content", ordered_json()))});
}

Result<AgentEvent> EventDecoder::decode_tool_call(const ordered_json& tool_call) const {
  if (!tool_call.is_object()) {
    return fail("tool call is not an object");
  }
  std::string id = as_text(tool_call.value("id", ordered_json()));
  if (id.empty()) {
    return fail("tool call fragment without id");
  }

  ordered_json function = tool_call.value("function", ordered_json::object());
  std::string name = function.is_object() ? as_text(function.value("name", ordered_json())) : "";
  ordered_json raw_arguments = function.is_object() ? function.value("arguments", ordered_json()) : ordered_json();
  ordered_json arguments = parse_arguments(raw_arguments);

  if (is_clarification_tool(name)) {
    if (arguments.is_object() && arguments.contains("questions") && arguments["questions"].is_array()) {
      return ok(ClarificationRequested{join_questions(arguments["questions"])});
    }
    return ok(ClarificationRequested{as_text(raw_arguments)});
  }

  if (is_final_answer_tool(name)) {
    if (arguments.is_object() && arguments.contains("answer")) {
      return ok(TurnCompleted{as_text(arguments["answer"])});
    }
    return ok(TurnCompleted{as_text(raw_arguments)});
  }

  return ok(ToolCallStarted{id, name, arguments});
}

bool EventDecoder::is_clarification_tool(const std::string& name) const {
  auto key = lower(name);
  return std::any_of(options_.clarification_tools.begin(), options_.clarification_tools.end(),
                     [&](const std::string& tool) { return lower(tool) == key; });
}

bool EventDecoder::is_final_answer_tool(const std::string& name) const {
  auto key = lower(name);
  return std::any_of(options_.final_answer_tools.begin(), options_.final_answer_tools.end(),
                     [&](const std::string& tool) { return lower(tool) == key; });
}

}  // namespace bridge
