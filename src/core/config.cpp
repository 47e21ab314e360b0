#include "config.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include "net/http_client.hpp"

namespace bridge {

namespace fs = std::filesystem;

namespace {

std::vector<std::string> string_list(const json& j, const char* key, std::vector<std::string> fallback) {
  if (!j.contains(key)) return fallback;
  std::vector<std::string> out;
  for (const auto& item : j.at(key)) {
    out.push_back(item.get<std::string>());
  }
  return out;
}

std::optional<bool> parse_bool(const std::string& value) {
  if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
  if (value == "false" || value == "0" || value == "no" || value == "off") return false;
  return std::nullopt;
}

const char* env(const char* name) {
  const char* value = std::getenv(name);
  return (value && *value) ? value : nullptr;
}

}  // namespace

BridgeConfig BridgeConfig::load(const fs::path& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("cannot open config file " + path.string());
  }

  BridgeConfig config;
  json j;
  try {
    j = json::parse(file);
  } catch (const json::parse_error& e) {
    throw std::runtime_error("malformed config file " + path.string() + ": " + e.what());
  }

  try {
    config.backend_url = j.value("backend_url", config.backend_url);
    config.default_agent = j.value("default_agent", config.default_agent);
    config.request_timeout_seconds = j.value("request_timeout_seconds", config.request_timeout_seconds);
    config.connect_timeout_seconds = j.value("connect_timeout_seconds", config.connect_timeout_seconds);
    config.emit_tool_calls = j.value("emit_tool_calls", config.emit_tool_calls);

    if (j.contains("listen")) {
      const auto& listen = j["listen"];
      config.listen.host = listen.value("host", config.listen.host);
      config.listen.port = listen.value("port", config.listen.port);
    }

    config.worker_threads = j.value("worker_threads", config.worker_threads);
    config.registry_ttl_seconds = j.value("registry_ttl_seconds", config.registry_ttl_seconds);
    config.clarification_ttl_seconds = j.value("clarification_ttl_seconds", config.clarification_ttl_seconds);
    config.fallback_agents = string_list(j, "fallback_agents", config.fallback_agents);
    config.clarification_tools = string_list(j, "clarification_tools", config.clarification_tools);
    config.final_answer_tools = string_list(j, "final_answer_tools", config.final_answer_tools);
    config.title_response = j.value("title_response", config.title_response);
    config.title_flag_response = j.value("title_flag_response", config.title_flag_response);

    config.log_level = j.value("log_level", config.log_level);
    if (j.contains("log_file")) {
      config.log_file = j["log_file"].get<std::string>();
    }
  } catch (const json::exception& e) {
    throw std::runtime_error("invalid value in config file " + path.string() + ": " + e.what());
  }

  return config;
}

BridgeConfig BridgeConfig::load_default() {
  auto project_config = config_paths::project_config_file();
  if (fs::exists(project_config)) {
    return load(project_config);
  }

  auto global_config = config_paths::default_config_file();
  if (fs::exists(global_config)) {
    return load(global_config);
  }

  return BridgeConfig{};
}

void BridgeConfig::apply_env() {
  if (const char* url = env("BRIDGE_BACKEND_URL")) {
    backend_url = url;
  }
  if (const char* agent = env("BRIDGE_DEFAULT_AGENT")) {
    default_agent = agent;
  }
  if (const char* timeout = env("BRIDGE_REQUEST_TIMEOUT")) {
    try {
      request_timeout_seconds = std::stoll(timeout);
    } catch (const std::exception&) {
      spdlog::warn("Ignoring BRIDGE_REQUEST_TIMEOUT={}: not a number", timeout);
    }
  }
  if (const char* emit = env("BRIDGE_EMIT_TOOL_CALLS")) {
    if (auto parsed = parse_bool(emit)) {
      emit_tool_calls = *parsed;
    } else {
      spdlog::warn("Ignoring BRIDGE_EMIT_TOOL_CALLS={}: not a boolean", emit);
    }
  }
  if (const char* host = env("BRIDGE_LISTEN_HOST")) {
    listen.host = host;
  }
  if (const char* port = env("BRIDGE_LISTEN_PORT")) {
    try {
      listen.port = std::stoi(port);
    } catch (const std::exception&) {
      spdlog::warn("Ignoring BRIDGE_LISTEN_PORT={}: not a number", port);
    }
  }
  if (const char* level = env("BRIDGE_LOG_LEVEL")) {
    log_level = level;
  }
}

std::optional<std::string> BridgeConfig::validate() const {
  auto parsed = net::ParsedUrl::parse(backend_url);
  if (!parsed) {
    return "backend_url is not an http(s) URL: " + backend_url;
  }
  if (default_agent.empty()) {
    return "default_agent must not be empty";
  }
  if (request_timeout_seconds <= 0) {
    return "request_timeout_seconds must be positive";
  }
  if (connect_timeout_seconds <= 0) {
    return "connect_timeout_seconds must be positive";
  }
  if (listen.port < 0 || listen.port > 65535) {
    return "listen.port out of range: " + std::to_string(listen.port);
  }
  if (worker_threads < 1) {
    return "worker_threads must be at least 1";
  }
  if (registry_ttl_seconds < 0) {
    return "registry_ttl_seconds must not be negative";
  }
  if (clarification_ttl_seconds <= 0) {
    return "clarification_ttl_seconds must be positive";
  }
  static const std::vector<std::string> levels = {"trace", "debug", "info", "warn", "err", "critical", "off"};
  if (std::find(levels.begin(), levels.end(), log_level) == levels.end()) {
    return "unknown log_level: " + log_level;
  }
  return std::nullopt;
}

json BridgeConfig::to_json() const {
  json j;
  j["backend_url"] = backend_url;
  j["default_agent"] = default_agent;
  j["request_timeout_seconds"] = request_timeout_seconds;
  j["connect_timeout_seconds"] = connect_timeout_seconds;
  j["emit_tool_calls"] = emit_tool_calls;
  j["listen"] = {{"host", listen.host}, {"port", listen.port}};
  j["worker_threads"] = worker_threads;
  j["registry_ttl_seconds"] = registry_ttl_seconds;
  j["clarification_ttl_seconds"] = clarification_ttl_seconds;
  j["fallback_agents"] = fallback_agents;
  j["clarification_tools"] = clarification_tools;
  j["final_answer_tools"] = final_answer_tools;
  j["title_response"] = title_response;
  j["title_flag_response"] = title_flag_response;
  j["log_level"] = log_level;
  if (log_file) {
    j["log_file"] = log_file->string();
  }
  return j;
}

namespace config_paths {

fs::path home_dir() {
  const char* home = std::getenv("HOME");
  if (home) {
    return fs::path(home);
  }
  return fs::current_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "research-bridge";
}

fs::path default_config_file() {
  return config_dir() / "config.json";
}

fs::path project_config_file() {
  return fs::current_path() / "research_bridge.json";
}

}  // namespace config_paths

}  // namespace bridge
