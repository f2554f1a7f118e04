#include "log/log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <vector>

#include "core/config.hpp"

namespace oauth {

namespace {

constexpr const char* LOG_NAME = "oauth_broker";

// Rotate on every start: oauth_broker.log -> oauth_broker.0.log -> ... (the oldest is deleted)
void rotate_logs_on_startup(const std::filesystem::path& log_dir, const std::string& stem, size_t max_files) {
  namespace fs = std::filesystem;

  fs::path current_log = log_dir / (stem + ".log");
  if (!fs::exists(current_log) || max_files == 0) {
    return;
  }

  std::error_code ec;
  fs::path oldest = log_dir / (stem + "." + std::to_string(max_files - 1) + ".log");
  if (fs::exists(oldest)) {
    fs::remove(oldest, ec);
  }

  for (int i = static_cast<int>(max_files) - 2; i >= 0; --i) {
    fs::path old_name = log_dir / (stem + "." + std::to_string(i) + ".log");
    fs::path new_name = log_dir / (stem + "." + std::to_string(i + 1) + ".log");
    if (fs::exists(old_name)) {
      fs::rename(old_name, new_name, ec);
    }
  }

  fs::rename(current_log, log_dir / (stem + ".0.log"), ec);
}

}  // namespace

void init_log(const std::string& log_path, size_t max_files, const std::string& level, bool console) {
  try {
    namespace fs = std::filesystem;

    fs::path actual_path = log_path.empty() ? config_paths::config_dir() / "log" / (std::string(LOG_NAME) + ".log") : fs::path(log_path);
    fs::path log_dir = actual_path.parent_path();

    std::error_code ec;
    if (!log_dir.empty()) {
      fs::create_directories(log_dir, ec);
      if (ec) {
        std::cerr << "Failed to create log directory: " << ec.message() << "\n";
      }
    }

    rotate_logs_on_startup(log_dir, actual_path.stem().string(), max_files);

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(actual_path.string(), true));
    if (console) {
      sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    auto logger = std::make_shared<spdlog::logger>(LOG_NAME, sinks.begin(), sinks.end());

    // Unknown names fall back to info
    auto log_level = spdlog::level::from_str(level);
    if (log_level == spdlog::level::off && level != "off") {
      log_level = spdlog::level::info;
    }
    logger->set_level(log_level);

    // [time] [level] [thread id] message
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
    logger->flush_on(spdlog::level::trace);

    spdlog::drop(LOG_NAME);
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    spdlog::info("=== oauth broker started (log: {}) ===", actual_path.string());
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Failed to init logger: " << ex.what() << "\n";
  }
}

std::shared_ptr<spdlog::logger> get_logger() {
  return spdlog::default_logger();
}

}  // namespace oauth
