#ifndef OAUTH_BROKER_LOG_H
#define OAUTH_BROKER_LOG_H

#include <memory>
#include <string>

namespace spdlog {
class logger;
}

namespace oauth {

/**
 * Initialize logging
 *
 * Rotation happens once per start:
 * - the previous oauth_broker.log becomes oauth_broker.0.log
 * - older files shift: oauth_broker.0.log -> oauth_broker.1.log -> ... -> oauth_broker.{max_files-1}.log
 * - the oldest file is deleted
 *
 * @param log_path log file path (optional, default ~/.config/oauth-broker/log/oauth_broker.log)
 * @param max_files number of rotated files kept, default 10
 * @param level log level name (trace, debug, info, warn, err, critical, off), default info
 * @param console also log to stdout
 */
void init_log(const std::string& log_path = "", size_t max_files = 10, const std::string& level = "info", bool console = false);

/**
 * Get the default logger
 */
std::shared_ptr<spdlog::logger> get_logger();

}  // namespace oauth

#endif  // OAUTH_BROKER_LOG_H
