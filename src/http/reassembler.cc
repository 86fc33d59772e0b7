#include "reasm/http/reassembler.h"

#include <utility>

#include "reasm/http/llhttp_parser.h"
#include "reasm/http/parse_error.h"

#define REASM_LOG_COMPONENT "Reassembler.core"
#include "reasm/logging/log_macros.h"

namespace reasm {
namespace http {

HttpParserFactory& defaultHttpParserFactory() {
  static LLHttpParserFactory factory;
  return factory;
}

Reassembler::Reassembler(HttpParserType type,
                         std::unique_ptr<MessageAssembler> assembler,
                         const config::ReassemblerConfig& config,
                         HttpParserFactory& factory)
    : config_(config), assembler_(std::move(assembler)) {
  config_.validate();

  HttpParserOptions options;
  options.lenient_keep_alive = config_.lenient_keep_alive;
  parser_ = factory.createParser(type, assembler_.get(), options);
}

size_t Reassembler::feed(const char* data, size_t length) {
  bytes_fed_ += length;
  size_t consumed = parser_->execute(data, length);
  if (consumed != length || parser_->getStatus() == ParserStatus::Error) {
    failParse();
  }
  return consumed;
}

void Reassembler::finishInput() {
  if (parser_->finish() != ParserStatus::Ok) {
    failParse();
  }
}

void Reassembler::reset() {
  assembler_->reset();
  parser_->reset();
}

const char* Reassembler::direction() const {
  return parser_->type() == HttpParserType::REQUEST ? "request" : "response";
}

void Reassembler::recordCompleted(const std::string& summary) {
  ++messages_completed_;

  auto logger = logging::LoggerRegistry::instance().getOrCreateLogger(
      std::string("Reassembler.") + direction());
  if (!logger->shouldLog(logging::LogLevel::Debug)) {
    return;
  }

  logging::LogContext ctx;
  ctx.component = logging::Component::Reassembler;
  ctx.setLocation(__FILE__, __LINE__, __FUNCTION__);
  ctx.bytes_processed = bytes_fed_;
  ctx.messages_processed = messages_completed_;
  logger->logWithContext(logging::LogLevel::Debug, ctx, "{}", summary);
}

void Reassembler::failParse() {
  int code = parser_->errorCode();
  std::string name = parser_->errorName();
  std::string reason = assembler_->failureReason().empty()
                           ? parser_->getError()
                           : assembler_->failureReason();
  optional<UriError> uri_error = assembler_->uriError();

  reset();

  if (uri_error) {
    REASM_LOG(Warning, "Discarding {}: {}", direction(), uri_error->what());
    throw *uri_error;
  }

  REASM_LOG(Warning, "Discarding {} after {} ({}): {}", direction(), name,
            code, reason);
  throw ParseError(code, name, reason);
}

}  // namespace http
}  // namespace reasm
