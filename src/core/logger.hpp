#ifndef LOGGER_HPP
#define LOGGER_HPP

#include "config.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>

// Enum for standard log severity levels
enum class LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

// Enum for all granular application components
enum class LogComponent {
  // Top-level components
  CORE,
  CONFIG,

  // IO sub-components
  IO_READER,
  IO_WRITER,
  IO_WALKER,

  // Search sub-components
  SEARCH_BUILD,
  SEARCH_INSERT,
  SEARCH_MATCH
};

class LogManager {
public:
  static LogManager &instance() {
    static LogManager instance;
    return instance;
  }

  inline void configure(const Config::LoggingConfig &config) {
    std::lock_guard<std::mutex> lock(mutex_);
    log_levels_ = config.log_levels;
  }

  bool should_log(LogLevel level, LogComponent component) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = log_levels_.find(component);
    if (it == log_levels_.end())
      return level >= LogLevel::WARN;

    return level >= it->second;
  }

  // Serializes whole lines from the search workers
  void write(const std::string &line) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::clog << line << std::endl;
  }

private:
  LogManager() = default; // Private constructor for singleton
  std::map<LogComponent, LogLevel> log_levels_;
  mutable std::mutex mutex_;
};

// --- The Core Logging Macro ---
// It's a macro so that if `should_log` returns false, the message and its
// arguments are never even evaluated. Lines go to stderr so that results
// written to stdout stay machine-readable.
#define LOG(level, component, message)                                         \
  do {                                                                         \
    if (LogManager::instance().should_log(level, component)) {                 \
      auto now = std::chrono::system_clock::now();                             \
      auto time_t_now = std::chrono::system_clock::to_time_t(now);             \
      auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(         \
                    now.time_since_epoch()) %                                  \
                1000;                                                          \
      std::ostringstream oss;                                                  \
      oss << std::put_time(std::gmtime(&time_t_now), "%Y-%m-%dT%H:%M:%S")      \
          << '.' << std::setw(3) << std::setfill('0') << ms.count() << "Z ";   \
      oss << "[" << level_to_string(level) << "] ";                            \
      oss << "[" << component_to_string(component) << "] ";                    \
      oss << "[" << __FILE__ << ":" << __LINE__ << "] ";                       \
      oss << message;                                                          \
      LogManager::instance().write(oss.str());                                 \
    }                                                                          \
  } while (0)

// --- Helper Functions to Convert Enums to Strings for Printing ---

inline const char *level_to_string(LogLevel level) {
  switch (level) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::FATAL:
    return "FATAL";
  }
  return "UNKNOWN";
}

inline const char *component_to_string(LogComponent component) {
  switch (component) {
  case LogComponent::CORE:
    return "CORE";
  case LogComponent::CONFIG:
    return "CONFIG";
  case LogComponent::IO_READER:
    return "IO.READER";
  case LogComponent::IO_WRITER:
    return "IO.WRITER";
  case LogComponent::IO_WALKER:
    return "IO.WALKER";
  case LogComponent::SEARCH_BUILD:
    return "SEARCH.BUILD";
  case LogComponent::SEARCH_INSERT:
    return "SEARCH.INSERT";
  case LogComponent::SEARCH_MATCH:
    return "SEARCH.MATCH";
  }
  return "GENERAL";
}

#endif // LOGGER_HPP
