#pragma once

#include <string>
#include <vector>

#include "core/types.hpp"

namespace bridge {

// Markdown annotations for tool activity shown inline in the answer stream

// "\n\n> **Tool:** name\n> **key**: value | ...\n\n"
std::string format_tool_call(const std::string& tool_name, const ordered_json& arguments);

// "> **Result:** text\n\n", result cut to 300 characters
std::string format_tool_result(const std::string& result);

// "\n\n> **Incomplete tool activity:** a, b\n"
std::string format_incomplete_tools(const std::vector<std::string>& tool_names);

// The first three arguments, in backend order, as "**key**: value" joined by " | ". Reasoning-style fields are skipped
// and string values cut to 100 characters.
std::string format_tool_arguments(const ordered_json& arguments);

// First max_chars code points of text, with "..." appended when cut
std::string truncate_text(const std::string& text, size_t max_chars);

}  // namespace bridge
