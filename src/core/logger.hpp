#ifndef LOGGER_HPP
#define LOGGER_HPP

#include "config.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>

// Enum for standard log severity levels
enum class LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

// Enum for all granular application components
enum class LogComponent {
  // Top-level components
  CORE,
  CONFIG,

  // Archive handling
  IO_VERIFY,
  IO_EXTRACT,

  // Dataset assembly
  DATA_LOADER,
  DATA_SPLIT,

  // Model building
  PREPROCESS,
  TRAIN,
  EVAL,

  // Artifacts written for reporting tools
  OUTPUT
};

class LogManager {
public:
  static LogManager &instance() {
    static LogManager instance;
    return instance;
  }

  inline void configure(const Config::LoggingConfig &config) {
    log_levels_ = config.log_levels;
  }

  bool should_log(LogLevel level, LogComponent component) const {
    auto it = log_levels_.find(component);
    if (it == log_levels_.end())
      return level >= LogLevel::WARN;

    return level >= it->second;
  }

private:
  LogManager() = default; // Private constructor for singleton
  std::map<LogComponent, LogLevel> log_levels_;
};

// --- The Core Logging Macro ---
// It's a macro so that if `should_log` returns false, the message and its
// arguments are never evaluated.
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
      std::cout << oss.str() << std::endl;                                     \
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
  case LogComponent::IO_VERIFY:
    return "IO.VERIFY";
  case LogComponent::IO_EXTRACT:
    return "IO.EXTRACT";
  case LogComponent::DATA_LOADER:
    return "DATA.LOADER";
  case LogComponent::DATA_SPLIT:
    return "DATA.SPLIT";
  case LogComponent::PREPROCESS:
    return "PREPROCESS";
  case LogComponent::TRAIN:
    return "TRAIN";
  case LogComponent::EVAL:
    return "EVAL";
  case LogComponent::OUTPUT:
    return "OUTPUT";
  }
  return "GENERAL";
}

#endif // LOGGER_HPP
