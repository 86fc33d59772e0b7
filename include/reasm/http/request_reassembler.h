#ifndef REASM_HTTP_REQUEST_REASSEMBLER_H
#define REASM_HTTP_REQUEST_REASSEMBLER_H

#include <deque>
#include <string>

#include "reasm/core/compat.h"
#include "reasm/http/http_message.h"
#include "reasm/http/reassembler.h"

namespace reasm {
namespace http {

/**
 * Turns request bytes pushed by the caller into Request values.
 *
 * Never blocks. Pipelined requests arriving in one buffer are queued and
 * handed out one per parse() call, oldest first.
 */
class RequestReassembler : public Reassembler {
 public:
  explicit RequestReassembler(
      const config::ReassemblerConfig& config = config::ReassemblerConfig());
  RequestReassembler(const config::ReassemblerConfig& config,
                     HttpParserFactory& factory);

  /**
   * Feed bytes, then return the oldest completed request, if any.
   * Throws ParseError or UriError for malformed input; the next call
   * starts a fresh request.
   */
  optional<Request> parse(const char* data, size_t length);
  optional<Request> parse(const std::string& data) {
    return parse(data.data(), data.size());
  }

  // Return the oldest queued request without feeding anything
  optional<Request> parse();

  // Completed requests not yet returned
  size_t pending() const { return requests_.size(); }

 private:
  std::deque<Request> requests_;
};

}  // namespace http
}  // namespace reasm

#endif  // REASM_HTTP_REQUEST_REASSEMBLER_H
