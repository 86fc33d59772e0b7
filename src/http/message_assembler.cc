#include "reasm/http/message_assembler.h"

#include <utility>

#include "reasm/http/header_folding.h"

#define REASM_LOG_COMPONENT "Http.assembler"
#include "reasm/logging/log_macros.h"

namespace reasm {
namespace http {

MessageAssembler::MessageAssembler(bool divert_cookies)
    : divert_cookies_(divert_cookies) {}

ParserCallbackResult MessageAssembler::onText(const char* data,
                                              size_t length) {
  context_.building_text.append(data, length);
  return ParserCallbackResult::Success;
}

ParserCallbackResult MessageAssembler::onHeaderField(const char* data,
                                                     size_t length) {
  // A name after a value starts a new field
  if (!context_.committed_header_name.empty()) {
    context_.committed_header_name.clear();
  }

  if (divert_cookies_) {
    flushCookieValue(context_);
  }

  context_.building_header_name.append(data, length);
  return ParserCallbackResult::Success;
}

ParserCallbackResult MessageAssembler::onHeaderValue(const char* data,
                                                     size_t length) {
  if (context_.committed_header_name.empty()) {
    commitHeaderName(context_, divert_cookies_);
  }

  appendHeaderValue(context_, data, length, divert_cookies_);
  return ParserCallbackResult::Success;
}

ParserCallbackResult MessageAssembler::onHeaderValueComplete() {
  commitEmptyHeader(context_, divert_cookies_);
  return ParserCallbackResult::Success;
}

ParserCallbackResult MessageAssembler::onHeadersComplete(
    const MessageHead& head) {
  if (divert_cookies_) {
    flushCookieValue(context_);
  }

  context_.building_header_name.clear();
  context_.committed_header_name.clear();

  return recordHead(head);
}

ParserCallbackResult MessageAssembler::onBody(const char* data,
                                              size_t length) {
  context_.body.append(data, length);
  return ParserCallbackResult::Success;
}

ParserCallbackResult MessageAssembler::onMessageComplete() {
  ParserCallbackResult result = emitMessage();
  context_.reset();
  return result;
}

void MessageAssembler::reset() {
  context_.reset();
  failure_reason_.clear();
  uri_error_ = nullopt;
}

// RequestAssembler

RequestAssembler::RequestAssembler(RequestSink sink)
    : MessageAssembler(false), sink_(std::move(sink)) {}

ParserCallbackResult RequestAssembler::recordHead(const MessageHead& head) {
  context_.method = head.method;
  context_.method_name = head.method_name;
  context_.version = head.version;

  std::string target = std::move(context_.building_text);
  context_.building_text.clear();

  try {
    context_.uri = Uri::parse(target);
  } catch (const UriError& e) {
    REASM_LOG(Debug, "Rejecting request-target: {}", e.what());
    failure_reason_ = e.what();
    uri_error_ = e;
    return ParserCallbackResult::Error;
  }

  return ParserCallbackResult::Success;
}

ParserCallbackResult RequestAssembler::emitMessage() {
  if (!context_.method || !context_.uri) {
    failure_reason_ = "request completed without a request line";
    return ParserCallbackResult::Error;
  }

  Request request;
  request.method = *context_.method;
  request.method_name = std::move(context_.method_name);
  request.uri = std::move(*context_.uri);
  request.version = context_.version;
  request.headers = std::move(context_.headers);
  request.body = std::move(context_.body);

  if (sink_) {
    sink_(std::move(request));
  }
  return ParserCallbackResult::Success;
}

// ResponseAssembler

ResponseAssembler::ResponseAssembler(ResponseSink sink)
    : MessageAssembler(true), sink_(std::move(sink)) {}

ParserCallbackResult ResponseAssembler::recordHead(const MessageHead& head) {
  context_.status = head.status;
  context_.version = head.version;
  context_.reason_phrase = std::move(context_.building_text);
  context_.building_text.clear();
  return ParserCallbackResult::Success;
}

ParserCallbackResult ResponseAssembler::emitMessage() {
  if (!context_.status) {
    failure_reason_ = "response completed without a status line";
    return ParserCallbackResult::Error;
  }

  // A Set-Cookie trailer has no later header name to flush it
  flushCookieValue(context_);

  Response response;
  response.version = context_.version;
  response.status = *context_.status;
  response.reason_phrase = std::move(context_.reason_phrase);
  response.headers = std::move(context_.headers);
  response.cookies = std::move(context_.cookies);
  response.body = std::move(context_.body);

  if (sink_) {
    sink_(std::move(response));
  }
  return ParserCallbackResult::Success;
}

}  // namespace http
}  // namespace reasm
