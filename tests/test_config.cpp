#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

#include "core/config.hpp"

using namespace bridge;

namespace fs = std::filesystem;

// --- ConfigTest ---

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() / ("research_bridge_config_" + std::to_string(::getpid()));
    fs::create_directories(dir_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
    for (const char* name : {"BRIDGE_BACKEND_URL", "BRIDGE_REQUEST_TIMEOUT", "BRIDGE_EMIT_TOOL_CALLS", "BRIDGE_LISTEN_PORT"}) {
      ::unsetenv(name);
    }
  }

  fs::path write_file(const std::string& name, const std::string& content) {
    auto path = dir_ / name;
    std::ofstream(path) << content;
    return path;
  }

  fs::path dir_;
};

TEST_F(ConfigTest, Defaults) {
  BridgeConfig config;

  EXPECT_EQ(config.backend_url, "http://localhost:8010");
  EXPECT_EQ(config.listen.port, 9099);
  EXPECT_TRUE(config.emit_tool_calls);
  EXPECT_EQ(config.request_timeout(), std::chrono::seconds(300));
  EXPECT_EQ(config.log_level, "info");
  EXPECT_FALSE(config.validate().has_value());
}

TEST_F(ConfigTest, LoadKeepsDefaultsForMissingKeys) {
  auto path = write_file("partial.json", R"({
    "backend_url": "https://research.example.com:8443",
    "emit_tool_calls": false,
    "listen": {"port": 8080},
    "clarification_tools": ["askuser"]
  })");

  auto config = BridgeConfig::load(path);
  EXPECT_EQ(config.backend_url, "https://research.example.com:8443");
  EXPECT_FALSE(config.emit_tool_calls);
  EXPECT_EQ(config.listen.port, 8080);
  EXPECT_EQ(config.listen.host, "0.0.0.0");
  ASSERT_EQ(config.clarification_tools.size(), 1u);
  EXPECT_EQ(config.clarification_tools[0], "askuser");
  EXPECT_EQ(config.default_agent, "sgr_tool_calling_agent");
}

TEST_F(ConfigTest, LoadMalformedThrows) {
  auto path = write_file("broken.json", "{ not json");
  EXPECT_THROW(BridgeConfig::load(path), std::runtime_error);
  EXPECT_THROW(BridgeConfig::load(dir_ / "missing.json"), std::runtime_error);
}

TEST_F(ConfigTest, LoadWrongTypeThrows) {
  auto path = write_file("typed.json", R"({"request_timeout_seconds": "long"})");
  EXPECT_THROW(BridgeConfig::load(path), std::runtime_error);
}

TEST_F(ConfigTest, ValidateRejectsBadSettings) {
  BridgeConfig config;
  config.backend_url = "ftp://nowhere";
  EXPECT_TRUE(config.validate().has_value());

  config = BridgeConfig{};
  config.request_timeout_seconds = 0;
  EXPECT_TRUE(config.validate().has_value());

  config = BridgeConfig{};
  config.listen.port = 70000;
  EXPECT_TRUE(config.validate().has_value());

  config = BridgeConfig{};
  config.log_level = "verbose";
  EXPECT_TRUE(config.validate().has_value());
}

TEST_F(ConfigTest, EnvironmentOverrides) {
  ::setenv("BRIDGE_BACKEND_URL", "http://backend:9000", 1);
  ::setenv("BRIDGE_REQUEST_TIMEOUT", "42", 1);
  ::setenv("BRIDGE_EMIT_TOOL_CALLS", "false", 1);
  ::setenv("BRIDGE_LISTEN_PORT", "not-a-port", 1);

  BridgeConfig config;
  config.apply_env();

  EXPECT_EQ(config.backend_url, "http://backend:9000");
  EXPECT_EQ(config.request_timeout(), std::chrono::seconds(42));
  EXPECT_FALSE(config.emit_tool_calls);
  EXPECT_EQ(config.listen.port, 9099);
}

TEST_F(ConfigTest, ToJsonRoundTrip) {
  BridgeConfig config;
  config.title_response = "Deep Dive";
  config.title_flag_response = "Short";
  config.log_file = dir_ / "bridge.log";

  auto path = write_file("saved.json", config.to_json().dump(2));
  auto loaded = BridgeConfig::load(path);
  EXPECT_EQ(loaded.title_response, "Deep Dive");
  EXPECT_EQ(loaded.title_flag_response, "Short");
  ASSERT_TRUE(loaded.log_file.has_value());
  EXPECT_EQ(*loaded.log_file, dir_ / "bridge.log");
}

// --- ConfigPathsTest ---

TEST(ConfigPathsTest, ConfigDir) {
  auto config_dir = config_paths::config_dir();
  EXPECT_EQ(config_dir.filename(), "research-bridge");
  EXPECT_EQ(config_paths::default_config_file().filename(), "config.json");
  EXPECT_EQ(config_paths::project_config_file().filename(), "research_bridge.json");
}
