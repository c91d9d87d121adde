#pragma once

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace ringsum::logging {

// Optional mirror of every log line, debug levels included.
inline std::ofstream &logFile() {
  static std::ofstream file;
  return file;
}

inline bool openLogFile(const std::string &path) {
  auto &file = logFile();
  if (file.is_open()) {
    file.close();
  }
  if (path.empty()) {
    return false;
  }
  file.open(path, std::ios::app);
  return file.is_open();
}

inline void closeLogFile() {
  if (logFile().is_open()) {
    logFile().close();
  }
}

inline std::string timestamp() {
  auto now = std::chrono::system_clock::now();
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm_buf{};
  localtime_r(&t, &tm_buf);
  std::ostringstream ss;
  ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

inline void writeToFile(const char *tag, const std::string &line) {
  auto &file = logFile();
  if (file.is_open()) {
    file << timestamp() << " " << tag << " " << line << std::endl;
  }
}

} // namespace ringsum::logging

#define RINGSUM_LOG_LINE(tag, console, msg) do { \
  std::ostringstream ringsum_log_ss_; \
  ringsum_log_ss_ << msg; \
  console << tag << " " << ringsum_log_ss_.str() << std::endl; \
  ::ringsum::logging::writeToFile(tag, ringsum_log_ss_.str()); \
} while(0)

#define RINGSUM_LOG_FILE_ONLY(tag, msg) do { \
  if (::ringsum::logging::logFile().is_open()) { \
    std::ostringstream ringsum_log_ss_; \
    ringsum_log_ss_ << msg; \
    ::ringsum::logging::writeToFile(tag, ringsum_log_ss_.str()); \
  } \
} while(0)

// Always-on logging for important messages (works in release too)
#define LOG(msg) RINGSUM_LOG_LINE("[LOG]", std::cout, msg)

// Debug logging levels
#ifdef DEBUG_BUILD
  #define DEBUG_INFO(msg) RINGSUM_LOG_LINE("[INFO]", std::cout, msg)
  #define DEBUG_DEBUG(msg) RINGSUM_LOG_LINE("[DEBUG]", std::cout, msg)
  #define DEBUG_WARN(msg) RINGSUM_LOG_LINE("[WARN]", std::cerr, msg)
  #define DEBUG_ERROR(msg) RINGSUM_LOG_LINE("[ERROR]", std::cerr, msg)
#else
  // Release builds keep the console quiet; the log file still gets everything
  #define DEBUG_INFO(msg) RINGSUM_LOG_FILE_ONLY("[INFO]", msg)
  #define DEBUG_DEBUG(msg) RINGSUM_LOG_FILE_ONLY("[DEBUG]", msg)
  #define DEBUG_WARN(msg) RINGSUM_LOG_FILE_ONLY("[WARN]", msg)
  #define DEBUG_ERROR(msg) RINGSUM_LOG_FILE_ONLY("[ERROR]", msg)
#endif

// Always log errors and exit (even in release)
#define LOG_AND_EXIT(msg, code) do { \
  RINGSUM_LOG_LINE("[FATAL]", std::cerr, msg); \
  std::exit(code); \
} while(0)
