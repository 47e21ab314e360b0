#include "backend/tool_call_assembler.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace bridge {

namespace {

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
  return s;
}

bool is_complete_object(const std::string& arguments) {
  auto parsed = ordered_json::parse(arguments, nullptr, false);
  return !parsed.is_discarded() && parsed.is_object();
}

std::string string_or_empty(const ordered_json& j, const char* key) {
  if (!j.is_object() || !j.contains(key) || !j[key].is_string()) return "";
  return j[key].get<std::string>();
}

}  // namespace

std::vector<RawEvent> ToolCallAssembler::feed(const RawEvent& raw) {
  std::vector<RawEvent> out;

  std::string data = sanitize_utf8(raw.data);
  if (data.find("[DONE]") != std::string::npos && data.find('{') == std::string::npos) {
    flush(raw.event, out);
    out.push_back(raw);
    return out;
  }
  if (data.find("\"choices\"") == std::string::npos) {
    out.push_back(raw);
    return out;
  }

  auto j = ordered_json::parse(data, nullptr, false);
  if (j.is_discarded() || !j.is_object() || !j.contains("choices")) {
    out.push_back(raw);
    return out;
  }
  const auto& choices = j["choices"];
  if (!choices.is_array() || choices.empty() || !choices[0].is_object()) {
    out.push_back(raw);
    return out;
  }

  const auto& choice = choices[0];
  bool finished = choice.contains("finish_reason") && !choice["finish_reason"].is_null();
  const ordered_json* tool_calls = nullptr;
  if (choice.contains("delta") && choice["delta"].is_object() && choice["delta"].contains("tool_calls")) {
    tool_calls = &choice["delta"]["tool_calls"];
  }

  if (tool_calls == nullptr || !tool_calls->is_array() || tool_calls->empty()) {
    if (finished) flush(raw.event, out);
    out.push_back(raw);
    return out;
  }

  bool orphaned = false;
  for (const auto& tool_call : *tool_calls) {
    absorb(tool_call, raw, out, orphaned);
  }
  if (orphaned) {
    // Let the decoder reject the fragment that belongs to no call
    out.push_back(raw);
  }
  if (finished) flush(raw.event, out);
  return out;
}

void ToolCallAssembler::absorb(const ordered_json& tool_call, const RawEvent& raw, std::vector<RawEvent>& out, bool& orphaned) {
  if (!tool_call.is_object()) {
    orphaned = true;
    return;
  }

  int index = tool_call.contains("index") && tool_call["index"].is_number_integer() ? tool_call["index"].get<int>() : 0;
  std::string id = string_or_empty(tool_call, "id");
  ordered_json function = tool_call.contains("function") ? tool_call["function"] : ordered_json::object();
  std::string name = string_or_empty(function, "name");

  std::string arguments;
  if (function.is_object() && function.contains("arguments")) {
    const auto& value = function["arguments"];
    if (value.is_string()) {
      arguments = value.get<std::string>();
    } else if (!value.is_null()) {
      arguments = value.dump();
    }
  }

  auto it = pending_.find(index);
  if (!id.empty()) {
    if (it != pending_.end() && it->second.id != id) {
      spdlog::debug("Dropping unfinished tool call {} ({}), superseded by {}", it->second.name, it->second.id, id);
      pending_.erase(it);
      it = pending_.end();
    }
    if (it == pending_.end()) {
      it = pending_.emplace(index, PendingCall{id, name, arguments}).first;
    } else {
      it->second.name += name;
      it->second.arguments += arguments;
    }
  } else {
    if (it == pending_.end()) {
      orphaned = true;
      return;
    }
    it->second.name += name;
    it->second.arguments += arguments;
  }

  if (is_complete_object(it->second.arguments)) {
    PendingCall call = std::move(it->second);
    pending_.erase(it);
    release(index, call, raw.event, out);
  }
}

void ToolCallAssembler::release(int index, const PendingCall& call, const std::string& event, std::vector<RawEvent>& out) {
  std::string arguments = call.arguments.empty() ? "{}" : call.arguments;

  // Compare arguments independent of key order and whitespace
  auto canonical = json::parse(arguments, nullptr, false);
  std::string key = lower(call.name) + "\n" + (canonical.is_discarded() ? arguments : canonical.dump());
  if (!released_.insert(key).second) {
    spdlog::debug("Dropping repeated tool call {} ({})", call.name, call.id);
    return;
  }

  ordered_json function = {{"name", call.name}, {"arguments", arguments}};
  ordered_json tool_call = {{"index", index}, {"id", call.id}, {"type", "function"}, {"function", function}};
  ordered_json tool_calls = ordered_json::array();
  tool_calls.push_back(tool_call);

  ordered_json delta = ordered_json::object();
  delta["tool_calls"] = tool_calls;
  ordered_json choice = {{"index", 0}, {"delta", delta}};
  ordered_json choices = ordered_json::array();
  choices.push_back(choice);

  ordered_json chunk = {{"object", "chat.completion.chunk"}, {"choices", choices}};
  out.push_back(RawEvent{event, chunk.dump()});
}

void ToolCallAssembler::flush(const std::string& event, std::vector<RawEvent>& out) {
  auto pending = std::move(pending_);
  pending_.clear();
  for (const auto& [index, call] : pending) {
    spdlog::debug("Releasing tool call {} ({}) at end of message", call.name, call.id);
    release(index, call, event, out);
  }
}

}  // namespace bridge
