#pragma once

#include <chrono>
#include <map>
#include <string>
#include <thread>
#include <unistd.h>

#include "reasm/logging/log_level.h"

namespace reasm {
namespace logging {

// Log record with the metadata the formatters know how to render
struct LogMessage {
  LogLevel level{LogLevel::Info};
  std::string message;
  std::chrono::system_clock::time_point timestamp;

  // Component information
  Component component{Component::Root};
  std::string component_name;

  // Source location
  const char* file{nullptr};
  int line{0};
  const char* function{nullptr};

  // Process and thread info
  pid_t process_id{0};
  std::thread::id thread_id;

  // Reassembler throughput at the time of the record
  size_t bytes_processed{0};
  size_t messages_processed{0};

  std::map<std::string, std::string> key_values;

  // Logger information
  std::string logger_name;

  LogMessage()
      : timestamp(std::chrono::system_clock::now()),
        process_id(getpid()),
        thread_id(std::this_thread::get_id()) {}
};

// Context carried by a caller into a log call
class LogContext {
 public:
  Component component{Component::Root};
  std::string component_name;

  std::map<std::string, std::string> metadata;

  size_t bytes_processed{0};
  size_t messages_processed{0};

  std::chrono::system_clock::time_point timestamp;

  void setLocation(const char* file, int line, const char* func) {
    source_file = file;
    source_line = line;
    source_function = func;
  }

  const char* getFile() const { return source_file; }
  int getLine() const { return source_line; }
  const char* getFunction() const { return source_function; }

  LogMessage toLogMessage(LogLevel level, const std::string& msg) const {
    LogMessage log_msg;
    log_msg.level = level;
    log_msg.message = msg;
    log_msg.timestamp = timestamp;

    log_msg.component = component;
    log_msg.component_name = component_name;

    log_msg.file = source_file;
    log_msg.line = source_line;
    log_msg.function = source_function;

    log_msg.bytes_processed = bytes_processed;
    log_msg.messages_processed = messages_processed;
    log_msg.key_values = metadata;

    return log_msg;
  }

  LogContext() : timestamp(std::chrono::system_clock::now()) {}

 private:
  const char* source_file{nullptr};
  int source_line{0};
  const char* source_function{nullptr};
};

}  // namespace logging
}  // namespace reasm
