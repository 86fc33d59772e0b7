#ifndef REASM_HTTP_MESSAGE_ASSEMBLER_H
#define REASM_HTTP_MESSAGE_ASSEMBLER_H

#include <cstddef>
#include <functional>
#include <string>

#include "reasm/core/compat.h"
#include "reasm/http/http_message.h"
#include "reasm/http/http_parser.h"
#include "reasm/http/message_context.h"
#include "reasm/http/uri.h"

namespace reasm {
namespace http {

/**
 * Folds tokenizer events into one message at a time.
 *
 * Every event may arrive split into any number of fragments. When the
 * tokenizer reports message-complete, the subclass builds the finished
 * message from the context and hands it to its completion sink, after
 * which the context is cleared for the next message on the connection.
 */
class MessageAssembler : public HttpParserCallbacks {
 public:
  ~MessageAssembler() override = default;

  // HttpParserCallbacks interface
  ParserCallbackResult onText(const char* data, size_t length) override;
  ParserCallbackResult onHeaderField(const char* data, size_t length) override;
  ParserCallbackResult onHeaderValue(const char* data, size_t length) override;
  ParserCallbackResult onHeaderValueComplete() override;
  ParserCallbackResult onHeadersComplete(const MessageHead& head) override;
  ParserCallbackResult onBody(const char* data, size_t length) override;
  ParserCallbackResult onMessageComplete() override;

  // Drops everything recorded for the in-flight message
  virtual void reset();

  const MessageContext& context() const { return context_; }

  // Why the last callback returned Error, empty otherwise
  const std::string& failureReason() const { return failure_reason_; }

  // Request-target rejected by the last header block (requests only)
  const optional<UriError>& uriError() const { return uri_error_; }

 protected:
  explicit MessageAssembler(bool divert_cookies);

  // Record start-line data once the header block is complete
  virtual ParserCallbackResult recordHead(const MessageHead& head) = 0;

  // Build the finished message from context_ and pass it to the sink
  virtual ParserCallbackResult emitMessage() = 0;

  MessageContext context_;
  std::string failure_reason_;
  optional<UriError> uri_error_;

 private:
  const bool divert_cookies_;
};

using RequestSink = std::function<void(Request&&)>;
using ResponseSink = std::function<void(Response&&)>;

/**
 * Request direction: the text is the request-target, parsed as a Uri when
 * the header block completes.
 */
class RequestAssembler : public MessageAssembler {
 public:
  explicit RequestAssembler(RequestSink sink);

 protected:
  ParserCallbackResult recordHead(const MessageHead& head) override;
  ParserCallbackResult emitMessage() override;

 private:
  RequestSink sink_;
};

/**
 * Response direction: the text is the reason phrase, and Set-Cookie
 * fields are collected into the cookie set instead of the headers.
 */
class ResponseAssembler : public MessageAssembler {
 public:
  explicit ResponseAssembler(ResponseSink sink);

 protected:
  ParserCallbackResult recordHead(const MessageHead& head) override;
  ParserCallbackResult emitMessage() override;

 private:
  ResponseSink sink_;
};

}  // namespace http
}  // namespace reasm

#endif  // REASM_HTTP_MESSAGE_ASSEMBLER_H
