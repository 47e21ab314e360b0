#include <asio.hpp>
#include <csignal>
#include <optional>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "research_bridge/research_bridge.hpp"
#include "log/log.h"
#include "spdlog/spdlog.h"

using namespace bridge;

static void print_usage(const char* argv0) {
  std::cout << "Usage: " << argv0 << " [options]\n"
            << "  --config <path>     config file (default: ./research_bridge.json, then "
            << config_paths::default_config_file().string() << ")\n"
            << "  --port <port>       listen port\n"
            << "  --log-level <level> trace|debug|info|warn|err|critical|off\n"
            << "  --version           print version and exit\n"
            << "  --help              show this help\n";
}

int main(int argc, char* argv[]) {
  // ----- Command line -----
  std::optional<std::string> config_path;
  std::optional<int> port;
  std::optional<std::string> log_level;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto value = [&](const char* name) -> std::optional<std::string> {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << name << "\n";
        return std::nullopt;
      }
      return std::string(argv[++i]);
    };

    if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      return 0;
    } else if (arg == "--version") {
      std::cout << "research_bridge " << version() << "\n";
      return 0;
    } else if (arg == "--config") {
      config_path = value("--config");
      if (!config_path) return 1;
    } else if (arg == "--port") {
      auto v = value("--port");
      if (!v) return 1;
      try {
        port = std::stoi(*v);
      } catch (const std::exception&) {
        std::cerr << "Invalid port: " << *v << "\n";
        return 1;
      }
    } else if (arg == "--log-level") {
      log_level = value("--log-level");
      if (!log_level) return 1;
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      print_usage(argv[0]);
      return 1;
    }
  }

  // ----- Configuration -----
  BridgeConfig config;
  try {
    config = config_path ? BridgeConfig::load(*config_path) : BridgeConfig::load_default();
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
  config.apply_env();
  if (port) config.listen.port = *port;
  if (log_level) config.log_level = *log_level;

  // ----- Logging -----
  auto problem = config.validate();
  // An unusable level still needs a logger to report it
  init_log(config.log_file ? config.log_file->string() : "", 10, problem ? "info" : config.log_level);

  if (problem) {
    spdlog::error("Invalid configuration: {}", *problem);
    return 1;
  }
  spdlog::debug("Effective configuration: {}", config.to_json().dump());

  // ----- Server -----
  asio::io_context io_ctx;
  Bridge bridge(io_ctx, config);

  try {
    bridge.start();
  } catch (const asio::system_error& e) {
    spdlog::error("Cannot listen on {}:{}: {}", config.listen.host, config.listen.port, e.what());
    return 1;
  }

  asio::signal_set signals(io_ctx, SIGINT, SIGTERM);
  signals.async_wait([&](const asio::error_code& ec, int signo) {
    if (ec) return;
    spdlog::info("Received signal {}, shutting down", signo);
    bridge.stop();
    io_ctx.stop();
  });

  std::vector<std::thread> workers;
  for (int i = 1; i < config.worker_threads; ++i) {
    workers.emplace_back([&io_ctx]() { io_ctx.run(); });
  }
  io_ctx.run();

  for (auto& worker : workers) {
    if (worker.joinable()) worker.join();
  }
  spdlog::info("research_bridge stopped");
  return 0;
}
