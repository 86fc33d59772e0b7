#include "reasm/http/response_reassembler.h"

#include <utility>

#include <fmt/format.h>

#define REASM_LOG_COMPONENT "Reassembler.response"
#include "reasm/logging/log_macros.h"

namespace reasm {
namespace http {

ResponseReassembler::ResponseReassembler(
    network::Stream& stream, const config::ReassemblerConfig& config)
    : ResponseReassembler(stream, config, defaultHttpParserFactory()) {}

ResponseReassembler::ResponseReassembler(
    network::Stream& stream,
    const config::ReassemblerConfig& config,
    HttpParserFactory& factory)
    : Reassembler(HttpParserType::RESPONSE,
                  std::make_unique<ResponseAssembler>(
                      [this](Response&& response) {
                        recordCompleted(fmt::format(
                            "Response complete: {} ({} body bytes)",
                            statusCodeValue(response.status),
                            response.body.size()));
                        responses_.push_back(std::move(response));
                      }),
                  config,
                  factory),
      stream_(stream),
      read_buffer_(this->config().buffer_size) {}

Response ResponseReassembler::parse() {
  while (responses_.empty()) {
    if (end_of_stream_) {
      REASM_LOG(Warning, "Stream closed with no response pending");
      throw network::StreamError::closed();
    }

    size_t received = stream_.receive(read_buffer_.data(), read_buffer_.size());
    if (received == 0) {
      REASM_LOG(Debug, "End of stream");
      end_of_stream_ = true;
      finishInput();
      continue;
    }

    feed(read_buffer_.data(), received);
  }

  Response response = std::move(responses_.front());
  responses_.pop_front();
  return response;
}

}  // namespace http
}  // namespace reasm
