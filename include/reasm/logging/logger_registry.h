#pragma once

#include <memory>
#include <mutex>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

#include "reasm/logging/logger.h"

namespace reasm {
namespace logging {

// Glob pattern ('*' and '?') bound to a level
struct LogPattern {
  std::regex pattern;
  LogLevel level;

  LogPattern(const std::string& glob, LogLevel lvl)
      : pattern(globToRegex(glob)), level(lvl) {}

 private:
  static std::string globToRegex(const std::string& glob) {
    std::string regex;
    for (char c : glob) {
      switch (c) {
        case '*':
          regex += ".*";
          break;
        case '?':
          regex += ".";
          break;
        case '.':
          regex += "\\.";
          break;
        default:
          regex += c;
          break;
      }
    }
    return regex;
  }
};

class LoggerRegistry {
 public:
  static LoggerRegistry& instance();

  // Get or create a named logger sharing the default sink
  std::shared_ptr<Logger> getOrCreateLogger(const std::string& name);

  std::shared_ptr<Logger> getDefaultLogger();

  void setGlobalLevel(LogLevel level);
  LogLevel getGlobalLevel() const;

  // Applies to every logger named "<Component>.*"
  void setComponentLevel(Component component, LogLevel level);

  void setPattern(const std::string& pattern, LogLevel level);

  // Replaces the sink of every registered logger
  void setDefaultSink(std::shared_ptr<LogSink> sink);

  bool shouldLog(const std::string& logger_name, LogLevel level);

  LogLevel getEffectiveLevel(const std::string& name);

  std::vector<std::string> getLoggerNames() const;

  static std::string getComponentPath(Component comp, const std::string& name);

 private:
  LoggerRegistry();

  LogLevel getEffectiveLevelLocked(const std::string& name) const;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Logger>> loggers_;
  std::unordered_map<int, LogLevel> component_levels_;
  std::vector<LogPattern> patterns_;

  LogLevel global_level_{LogLevel::Info};
  std::shared_ptr<Logger> default_logger_;
  std::shared_ptr<LogSink> default_sink_;
};

// Logger bound to "<Component>.<name>"
class ComponentLogger {
 public:
  ComponentLogger(Component component, const std::string& name)
      : component_(component),
        logger_(LoggerRegistry::instance().getOrCreateLogger(
            LoggerRegistry::getComponentPath(component, name))) {}

  template <typename... Args>
  void log(LogLevel level, const char* fmt, Args&&... args) {
    if (logger_->shouldLog(level)) {
      logger_->logWithComponent(level, component_, fmt,
                                std::forward<Args>(args)...);
    }
  }

  bool shouldLog(LogLevel level) const { return logger_->shouldLog(level); }

  const std::shared_ptr<Logger>& logger() const { return logger_; }

 private:
  Component component_;
  std::shared_ptr<Logger> logger_;
};

}  // namespace logging
}  // namespace reasm
