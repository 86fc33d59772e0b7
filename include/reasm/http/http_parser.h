#ifndef REASM_HTTP_HTTP_PARSER_H
#define REASM_HTTP_HTTP_PARSER_H

#include <cstddef>
#include <memory>
#include <string>

#include "reasm/http/http_types.h"

namespace reasm {
namespace http {

// Parser type enum
enum class HttpParserType { REQUEST, RESPONSE };

// Parser callback results
enum class ParserCallbackResult {
  Success = 0,
  Error = -1,
};

// Parser status
enum class ParserStatus { Ok, Error };

// Start-line data available once the header block is complete
struct MessageHead {
  HttpMethod method{HttpMethod::UNKNOWN};  // requests
  std::string method_name;                 // requests, token as sent
  HttpStatusCode status{HttpStatusCode::OK};  // responses
  HttpVersion version;
};

// Forward declarations
class HttpParser;
class HttpParserCallbacks;

using HttpParserPtr = std::unique_ptr<HttpParser>;

/**
 * HTTP parser callbacks interface
 *
 * Implemented by whatever turns tokenizer events into messages. The
 * tokenizer invokes these synchronously from inside HttpParser::execute();
 * a single logical field may arrive split over any number of calls.
 * Returning Error stops the current execute() call at that byte.
 */
class HttpParserCallbacks {
 public:
  virtual ~HttpParserCallbacks() = default;

  /**
   * Request URL (request parser) or reason phrase (response parser)
   */
  virtual ParserCallbackResult onText(const char* data, size_t length) = 0;

  /**
   * Part of a header field name
   */
  virtual ParserCallbackResult onHeaderField(const char* data,
                                             size_t length) = 0;

  /**
   * Part of a header field value
   */
  virtual ParserCallbackResult onHeaderValue(const char* data,
                                             size_t length) = 0;

  /**
   * Called once a header value ends, including empty values that never
   * produced an onHeaderValue() call
   */
  virtual ParserCallbackResult onHeaderValueComplete() {
    return ParserCallbackResult::Success;
  }

  /**
   * Called when headers are complete
   */
  virtual ParserCallbackResult onHeadersComplete(const MessageHead& head) = 0;

  /**
   * Called for body data, already de-chunked
   */
  virtual ParserCallbackResult onBody(const char* data, size_t length) = 0;

  /**
   * Called when message is complete
   */
  virtual ParserCallbackResult onMessageComplete() = 0;
};

/**
 * Abstract HTTP/1.x tokenizer
 *
 * One instance per connection and direction. Not thread-safe.
 */
class HttpParser {
 public:
  virtual ~HttpParser() = default;

  /**
   * Execute parser on input data
   * Returns number of bytes consumed; less than length means an error
   */
  virtual size_t execute(const char* data, size_t length) = 0;

  /**
   * Signal end of input. Completes a message whose body is delimited by
   * the connection closing.
   */
  virtual ParserStatus finish() = 0;

  virtual ParserStatus getStatus() const = 0;

  /**
   * Numeric error of the last failed call, 0 when Ok
   */
  virtual int errorCode() const = 0;

  /**
   * Symbolic name of errorCode()
   */
  virtual std::string errorName() const = 0;

  /**
   * Human readable reason, empty when Ok
   */
  virtual std::string getError() const = 0;

  /**
   * Return to the start state, keeping type and callbacks
   */
  virtual void reset() = 0;

  virtual HttpParserType type() const = 0;
};

// Tokenizer behaviour switches
struct HttpParserOptions {
  // Keep accepting bytes after a "Connection: close" message
  bool lenient_keep_alive{true};
};

/**
 * HTTP parser factory interface
 */
class HttpParserFactory {
 public:
  virtual ~HttpParserFactory() = default;

  virtual HttpParserPtr createParser(HttpParserType type,
                                     HttpParserCallbacks* callbacks,
                                     const HttpParserOptions& options) = 0;

  /**
   * Get parser implementation name
   */
  virtual std::string name() const = 0;
};

using HttpParserFactoryPtr = std::unique_ptr<HttpParserFactory>;

}  // namespace http
}  // namespace reasm

#endif  // REASM_HTTP_HTTP_PARSER_H
