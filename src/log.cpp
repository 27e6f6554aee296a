/**
 * TernPack: Logging Implementation
 */

#include "ternpack/log.hpp"
#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>

namespace ternpack {

namespace {

struct LoggerState {
  std::mutex mutex;
  LogConfig config;
  std::ofstream file;
};

LoggerState &state() {
  static LoggerState s;
  return s;
}

std::string timestamp() {
  auto now = std::chrono::system_clock::now();
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm_buf{};
#if defined(_MSC_VER)
  localtime_s(&tm_buf, &t);
#else
  localtime_r(&t, &tm_buf);
#endif
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
  return buf;
}

} // namespace

const char *log_level_name(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::ERROR:
    return "ERROR";
  }
  return "UNKNOWN";
}

bool configure_logging(const LogConfig &config, std::string &error) {
  LoggerState &s = state();
  std::lock_guard<std::mutex> lock(s.mutex);

  if (s.file.is_open())
    s.file.close();
  s.config = config;

  if (!config.log_file_path.empty()) {
    s.file.open(config.log_file_path, std::ios::out | std::ios::app);
    if (!s.file) {
      error = "cannot open log file: " + config.log_file_path;
      s.config.log_file_path.clear();
      return false;
    }
  }
  return true;
}

void shutdown_logging() {
  LoggerState &s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  if (s.file.is_open()) {
    s.file.flush();
    s.file.close();
  }
}

void log_message(LogLevel level, const std::string &message) {
  LoggerState &s = state();
  std::lock_guard<std::mutex> lock(s.mutex);

  if (static_cast<int>(level) < static_cast<int>(s.config.log_level))
    return;

  if (s.config.log_to_console) {
    if (level >= LogLevel::WARN) {
      std::cerr << (level == LogLevel::ERROR ? "Error: " : "Warning: ")
                << message << "\n";
    } else {
      std::cout << message << "\n";
    }
  }

  if (s.file.is_open()) {
    s.file << timestamp() << " [" << log_level_name(level) << "] " << message
           << "\n";
    if (level >= LogLevel::WARN)
      s.file.flush();
  }
}

} // namespace ternpack
