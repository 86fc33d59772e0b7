#include "reasm/logging/log_sink.h"

#include <iostream>

namespace reasm {
namespace logging {

std::ostream& StdioSink::stream() const {
  return (target_ == Stdout) ? std::cout : std::cerr;
}

void StdioSink::log(const LogMessage& msg) {
  std::lock_guard<std::mutex> lock(mutex_);
  stream() << formatter_->format(msg) << '\n';
}

void StdioSink::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  stream().flush();
}

void ExternalSink::log(const LogMessage& msg) {
  if (callback_) {
    callback_(msg.level, msg.logger_name, formatter_->format(msg));
  }
}

std::unique_ptr<LogSink> SinkFactory::createStdioSink(bool use_stderr) {
  return std::make_unique<StdioSink>(use_stderr ? StdioSink::Stderr
                                                : StdioSink::Stdout);
}

std::unique_ptr<LogSink> SinkFactory::createNullSink() {
  return std::make_unique<NullSink>();
}

std::unique_ptr<LogSink> SinkFactory::createExternalSink(
    ExternalSink::LogCallback callback) {
  return std::make_unique<ExternalSink>(std::move(callback));
}

}  // namespace logging
}  // namespace reasm
