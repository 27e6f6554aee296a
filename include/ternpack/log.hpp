#pragma once

/**
 * TernPack: Logging
 *
 * Process-wide logger. Configure once at startup; until then messages go to
 * the console only.
 *
 * Console: DEBUG/INFO -> stdout, WARN/ERROR -> stderr.
 * File:    every message at or above the level, appended with a timestamp.
 */

#include <string>

namespace ternpack {

enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

struct LogConfig {
  LogLevel log_level = LogLevel::INFO;
  bool log_to_console = true;
  std::string log_file_path; // Empty = no log file
};

/**
 * Apply a logging configuration. Fails if the log file cannot be opened.
 */
bool configure_logging(const LogConfig &config, std::string &error);

/**
 * Flush and close the log file, if any.
 */
void shutdown_logging();

void log_message(LogLevel level, const std::string &message);

inline void log_debug(const std::string &message) {
  log_message(LogLevel::DEBUG, message);
}
inline void log_info(const std::string &message) {
  log_message(LogLevel::INFO, message);
}
inline void log_warn(const std::string &message) {
  log_message(LogLevel::WARN, message);
}
inline void log_error(const std::string &message) {
  log_message(LogLevel::ERROR, message);
}

const char *log_level_name(LogLevel level);

} // namespace ternpack
