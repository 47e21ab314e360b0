#include "log/log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>

namespace bridge {

namespace {

// Rotate on startup: <stem>.log -> <stem>.0.log -> ... -> <stem>.{max_files-1}.log (oldest dropped)
void rotate_logs_on_startup(const std::filesystem::path& current_log, size_t max_files) {
  namespace fs = std::filesystem;

  if (max_files == 0 || !fs::exists(current_log)) {
    return;
  }

  auto dir = current_log.parent_path();
  auto stem = current_log.stem().string();
  auto numbered = [&](size_t i) {
    return dir / (stem + "." + std::to_string(i) + ".log");
  };

  std::error_code ec;
  fs::remove(numbered(max_files - 1), ec);

  for (int i = static_cast<int>(max_files) - 2; i >= 0; --i) {
    auto from = numbered(static_cast<size_t>(i));
    if (fs::exists(from)) {
      fs::rename(from, numbered(static_cast<size_t>(i) + 1), ec);
    }
  }

  fs::rename(current_log, numbered(0), ec);
}

}  // namespace

void init_log(const std::string& log_path, size_t max_files, const std::string& level) {
  try {
    namespace fs = std::filesystem;

    std::shared_ptr<spdlog::logger> logger;

    if (log_path.empty()) {
      auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      logger = std::make_shared<spdlog::logger>("research_bridge", console_sink);
    } else {
      fs::path actual_path = log_path;

      std::error_code ec;
      if (actual_path.has_parent_path()) {
        fs::create_directories(actual_path.parent_path(), ec);
        if (ec) {
          std::cerr << "Failed to create log directory: " << ec.message() << "\n";
        }
      }

      rotate_logs_on_startup(actual_path, max_files);

      // Truncate: every start gets a clean file
      auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(actual_path.string(), true);
      logger = std::make_shared<spdlog::logger>("research_bridge", file_sink);
    }

    logger->set_level(spdlog::level::from_str(level));

    // [time] [level] [thread id] message
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");

    logger->flush_on(spdlog::level::info);

    spdlog::set_default_logger(logger);

    spdlog::info("=== research_bridge logging started (level: {}, sink: {}) ===", level, log_path.empty() ? "stderr" : log_path);
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Failed to init logger: " << ex.what() << "\n";
  }
}

std::shared_ptr<spdlog::logger> get_logger() {
  return spdlog::default_logger();
}

}  // namespace bridge
