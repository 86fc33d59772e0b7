#ifndef REASM_HTTP_RESPONSE_REASSEMBLER_H
#define REASM_HTTP_RESPONSE_REASSEMBLER_H

#include <deque>
#include <vector>

#include "reasm/http/http_message.h"
#include "reasm/http/reassembler.h"
#include "reasm/network/stream.h"

namespace reasm {
namespace http {

/**
 * Pulls response bytes from a Stream until a complete Response exists.
 *
 * The stream must outlive the reassembler. A response whose body runs to
 * the end of the connection is completed when the stream reports end of
 * stream.
 */
class ResponseReassembler : public Reassembler {
 public:
  explicit ResponseReassembler(
      network::Stream& stream,
      const config::ReassemblerConfig& config = config::ReassemblerConfig());
  ResponseReassembler(network::Stream& stream,
                      const config::ReassemblerConfig& config,
                      HttpParserFactory& factory);

  /**
   * Return the oldest completed response, reading from the stream as
   * needed. Blocks while the stream blocks.
   *
   * Throws ParseError for malformed input (the reassembler stays usable),
   * StreamError from the stream, and StreamError::closed() once the
   * stream has ended with no response left to return.
   */
  Response parse();

  // Completed responses not yet returned
  size_t pending() const { return responses_.size(); }

  bool endOfStream() const { return end_of_stream_; }

 private:
  network::Stream& stream_;
  std::vector<char> read_buffer_;
  std::deque<Response> responses_;
  bool end_of_stream_{false};
};

}  // namespace http
}  // namespace reasm

#endif  // REASM_HTTP_RESPONSE_REASSEMBLER_H
