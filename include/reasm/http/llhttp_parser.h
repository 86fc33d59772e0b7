#ifndef REASM_HTTP_LLHTTP_PARSER_H
#define REASM_HTTP_LLHTTP_PARSER_H

#include <memory>

#include "reasm/http/http_parser.h"

// Forward declare llhttp types to avoid including llhttp.h in header
typedef struct llhttp__internal_s llhttp_t;
typedef struct llhttp_settings_s llhttp_settings_t;

namespace reasm {
namespace http {

/**
 * llhttp-based HTTP/1.x parser implementation
 *
 * Bridges llhttp's C callbacks to an HttpParserCallbacks instance; llhttp's
 * user data pointer holds only `this`. The same class serves both
 * directions, selected by HttpParserType.
 * A CONNECT or Upgrade message completes normally. Any input after it is
 * left unconsumed and puts the parser in error until reset().
 * Thread-safety: Parser instances are not thread-safe, create one per
 * connection
 */
class LLHttpParser : public HttpParser {
 public:
  LLHttpParser(HttpParserType type,
               HttpParserCallbacks* callbacks,
               const HttpParserOptions& options = HttpParserOptions());
  ~LLHttpParser() override;

  LLHttpParser(const LLHttpParser&) = delete;
  LLHttpParser& operator=(const LLHttpParser&) = delete;

  // HttpParser interface
  size_t execute(const char* data, size_t length) override;
  ParserStatus finish() override;
  ParserStatus getStatus() const override { return status_; }
  int errorCode() const override;
  std::string errorName() const override;
  std::string getError() const override;
  void reset() override;
  HttpParserType type() const override { return type_; }

 private:
  // Static callbacks for llhttp (bridge to HttpParserCallbacks)
  static int onUrl(llhttp_t* parser, const char* data, size_t length);
  static int onStatus(llhttp_t* parser, const char* data, size_t length);
  static int onHeaderField(llhttp_t* parser, const char* data, size_t length);
  static int onHeaderValue(llhttp_t* parser, const char* data, size_t length);
  static int onHeaderValueComplete(llhttp_t* parser);
  static int onHeadersComplete(llhttp_t* parser);
  static int onBody(llhttp_t* parser, const char* data, size_t length);
  static int onMessageComplete(llhttp_t* parser);

  // Convert callback result to llhttp's return convention
  static int toCallbackResult(ParserCallbackResult result);

  void applyOptions();

  std::unique_ptr<llhttp_t> parser_;
  std::unique_ptr<llhttp_settings_t> settings_;
  HttpParserCallbacks* callbacks_;
  HttpParserType type_;
  HttpParserOptions options_;
  ParserStatus status_;
  // A CONNECT/Upgrade message completed; no further HTTP until reset()
  bool upgraded_{false};
  // Input arrived after that message
  bool data_after_upgrade_{false};
};

/**
 * Factory for creating llhttp parsers
 */
class LLHttpParserFactory : public HttpParserFactory {
 public:
  LLHttpParserFactory() = default;
  ~LLHttpParserFactory() override = default;

  HttpParserPtr createParser(HttpParserType type,
                             HttpParserCallbacks* callbacks,
                             const HttpParserOptions& options) override;
  std::string name() const override { return "llhttp"; }
};

inline HttpParserFactoryPtr createLLHttpParserFactory() {
  return std::make_unique<LLHttpParserFactory>();
}

}  // namespace http
}  // namespace reasm

#endif  // REASM_HTTP_LLHTTP_PARSER_H
