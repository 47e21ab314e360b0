#include "session/tool_format.hpp"

#include <algorithm>
#include <array>

namespace bridge {

namespace {

constexpr size_t kMaxArguments = 3;
constexpr size_t kMaxArgumentChars = 100;
constexpr size_t kMaxResultChars = 300;

bool is_hidden_argument(const std::string& key) {
  static const std::array<const char*, 4> hidden = {"reasoning", "thought", "plan", "analysis"};
  return std::any_of(hidden.begin(), hidden.end(), [&](const char* name) { return key == name; });
}

}  // namespace

std::string truncate_text(const std::string& text, size_t max_chars) {
  size_t chars = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    // Count lead bytes only, so a cut never splits a UTF-8 sequence
    if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80) {
      if (chars == max_chars) {
        return text.substr(0, i) + "...";
      }
      chars++;
    }
  }
  return text;
}

std::string format_tool_arguments(const ordered_json& arguments) {
  if (!arguments.is_object()) return "";

  std::string out;
  size_t count = 0;
  for (const auto& [key, value] : arguments.items()) {
    if (is_hidden_argument(key)) continue;
    if (count == kMaxArguments) break;

    std::string rendered = value.is_string() ? truncate_text(value.get<std::string>(), kMaxArgumentChars) : value.dump();
    if (count > 0) out += " | ";
    out += "**" + key + "**: " + rendered;
    count++;
  }
  return out;
}

std::string format_tool_call(const std::string& tool_name, const ordered_json& arguments) {
  std::string out = "\n\n> **Tool:** " + tool_name + "\n";
  auto args = format_tool_arguments(arguments);
  if (!args.empty()) {
    out += "> " + args + "\n\n";
  }
  return out;
}

std::string format_tool_result(const std::string& result) {
  return "> **Result:** " + truncate_text(result, kMaxResultChars) + "\n\n";
}

std::string format_incomplete_tools(const std::vector<std::string>& tool_names) {
  std::string out = "\n\n> **Incomplete tool activity:** ";
  for (size_t i = 0; i < tool_names.size(); ++i) {
    if (i > 0) out += ", ";
    out += tool_names[i];
  }
  return out + "\n";
}

}  // namespace bridge
