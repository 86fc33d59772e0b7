#ifndef REASM_HTTP_REASSEMBLER_H
#define REASM_HTTP_REASSEMBLER_H

#include <cstddef>
#include <memory>
#include <string>

#include "reasm/config/reassembler_config.h"
#include "reasm/http/http_parser.h"
#include "reasm/http/message_assembler.h"

namespace reasm {
namespace http {

/**
 * Process-wide llhttp factory used when no factory is injected
 */
HttpParserFactory& defaultHttpParserFactory();

/**
 * Shared core of RequestReassembler and ResponseReassembler.
 *
 * Owns one tokenizer and one assembler for the lifetime of a connection.
 * Both are reset, never recreated, after a parse error. Not thread-safe;
 * calls for one connection must be serialized by the caller.
 */
class Reassembler {
 public:
  virtual ~Reassembler() = default;

  // Non-copyable, non-movable: the tokenizer holds a pointer to assembler_
  Reassembler(const Reassembler&) = delete;
  Reassembler& operator=(const Reassembler&) = delete;

  /**
   * Run bytes through the tokenizer. Completed messages are queued by the
   * subclass sink. Returns the number of bytes consumed, which is always
   * length: on a shortfall or tokenizer error the in-flight message is
   * dropped, both halves are reset, and UriError or ParseError is thrown.
   * Messages completed earlier in the same call stay queued.
   */
  size_t feed(const char* data, size_t length);
  size_t feed(const std::string& data) {
    return feed(data.data(), data.size());
  }

  /**
   * Drop the in-flight message and return the tokenizer to its start
   * state. Queued messages are kept.
   */
  void reset();

  const config::ReassemblerConfig& config() const { return config_; }
  const MessageAssembler& assembler() const { return *assembler_; }

  // Totals for the connection, kept across parse errors
  size_t bytesFed() const { return bytes_fed_; }
  size_t messagesCompleted() const { return messages_completed_; }

 protected:
  Reassembler(HttpParserType type,
              std::unique_ptr<MessageAssembler> assembler,
              const config::ReassemblerConfig& config,
              HttpParserFactory& factory);

  /**
   * Signal end of input to the tokenizer. Throws ParseError when the
   * message in flight cannot be completed.
   */
  void finishInput();

  const char* direction() const;

  /**
   * Called by the subclass sink for each queued message. Logs the summary
   * at debug level on "Reassembler.<direction>" with the running totals.
   */
  void recordCompleted(const std::string& summary);

 private:
  [[noreturn]] void failParse();

  config::ReassemblerConfig config_;
  std::unique_ptr<MessageAssembler> assembler_;
  HttpParserPtr parser_;
  size_t bytes_fed_{0};
  size_t messages_completed_{0};
};

}  // namespace http
}  // namespace reasm

#endif  // REASM_HTTP_REASSEMBLER_H
