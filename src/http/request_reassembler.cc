#include "reasm/http/request_reassembler.h"

#include <utility>

#include <fmt/format.h>

namespace reasm {
namespace http {

RequestReassembler::RequestReassembler(const config::ReassemblerConfig& config)
    : RequestReassembler(config, defaultHttpParserFactory()) {}

RequestReassembler::RequestReassembler(const config::ReassemblerConfig& config,
                                       HttpParserFactory& factory)
    : Reassembler(HttpParserType::REQUEST,
                  std::make_unique<RequestAssembler>([this](Request&& request) {
                    recordCompleted(fmt::format(
                        "Request complete: {} {} ({} body bytes)",
                        request.method_name, request.uri.toString(),
                        request.body.size()));
                    requests_.push_back(std::move(request));
                  }),
                  config,
                  factory) {}

optional<Request> RequestReassembler::parse(const char* data, size_t length) {
  if (length > 0) {
    feed(data, length);
  }
  return parse();
}

optional<Request> RequestReassembler::parse() {
  if (requests_.empty()) {
    return nullopt;
  }

  Request request = std::move(requests_.front());
  requests_.pop_front();
  return request;
}

}  // namespace http
}  // namespace reasm
