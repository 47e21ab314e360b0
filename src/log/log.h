#ifndef BRIDGE_LOG_H
#define BRIDGE_LOG_H

#include <memory>
#include <string>

namespace spdlog {
class logger;
}

namespace bridge {

/**
 * Initialize logging.
 *
 * With an empty log_path, log lines go to stderr.
 * Otherwise the file is rotated once per process start:
 * - the previous research_bridge.log becomes research_bridge.0.log
 * - older files shift up: research_bridge.0.log -> research_bridge.1.log -> ...
 * - the file numbered max_files - 1 is deleted
 *
 * @param log_path log file path (optional)
 * @param max_files number of rotated files to keep
 * @param level trace|debug|info|warn|err|critical|off
 */
void init_log(const std::string& log_path = "", size_t max_files = 10, const std::string& level = "info");

/**
 * Default logger
 */
std::shared_ptr<spdlog::logger> get_logger();

}  // namespace bridge

#endif  // BRIDGE_LOG_H
