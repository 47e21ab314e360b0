#pragma once

#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace bridge {

struct ListenConfig {
  std::string host = "0.0.0.0";
  int port = 9099;
};

// Application configuration
struct BridgeConfig {
  // Research backend
  std::string backend_url = "http://localhost:8010";
  AgentId default_agent = "sgr_tool_calling_agent";
  int64_t request_timeout_seconds = 300;
  int64_t connect_timeout_seconds = 10;

  // Show tool invocations and results in the caller's stream
  bool emit_tool_calls = true;

  // Caller-facing server
  ListenConfig listen;
  int worker_threads = 4;

  // Agent registry cache lifetime
  int64_t registry_ttl_seconds = 30;

  // Advertised while the backend agent list cannot be fetched
  std::vector<AgentId> fallback_agents = {"sgr_tool_calling_agent", "sgr_research_agent"};

  // Backend tool names with special meaning in OpenAI-style chunks
  std::vector<std::string> clarification_tools = {"clarificationtool"};
  std::vector<std::string> final_answer_tools = {"finalanswertool"};

  // How long a session paused for clarification may wait for its continuation
  int64_t clarification_ttl_seconds = 1800;

  // Fixed answers for front-end title requests: "task": "title_generation", and "title": true
  std::string title_response = "Research Session";
  std::string title_flag_response = "SGR Research";

  // Logging
  std::string log_level = "info";
  std::optional<std::filesystem::path> log_file;

  std::chrono::seconds request_timeout() const {
    return std::chrono::seconds(request_timeout_seconds);
  }

  // Returns a description of the first invalid setting, if any
  std::optional<std::string> validate() const;

  // Load from file; missing keys keep their defaults. Throws on unreadable or malformed JSON.
  static BridgeConfig load(const std::filesystem::path& path);

  // Load default config from the working directory or the user config directory
  static BridgeConfig load_default();

  // Apply environment overrides on top of this config
  // Reads: BRIDGE_BACKEND_URL, BRIDGE_DEFAULT_AGENT, BRIDGE_REQUEST_TIMEOUT,
  //        BRIDGE_EMIT_TOOL_CALLS, BRIDGE_LISTEN_HOST, BRIDGE_LISTEN_PORT, BRIDGE_LOG_LEVEL
  void apply_env();

  json to_json() const;
};

// Configuration paths
namespace config_paths {
std::filesystem::path home_dir();

std::filesystem::path config_dir();

std::filesystem::path default_config_file();

std::filesystem::path project_config_file();
}  // namespace config_paths

}  // namespace bridge
