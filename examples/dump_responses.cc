/**
 * Response Dump Tool
 *
 * Reads a captured stream of HTTP/1.x responses (standard input or a file)
 * and prints one summary per response: status line, headers, cookies and
 * body size. Useful for inspecting pipelined or keep-alive captures.
 */

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <string>

#include "reasm/config/reassembler_config.h"
#include "reasm/http/parse_error.h"
#include "reasm/http/response_reassembler.h"
#include "reasm/logging/log_macros.h"
#include "reasm/network/fd_stream.h"

namespace reasm {
namespace examples {

void printResponse(size_t index, const http::Response& response) {
  // HTTP/1.1 allows an empty reason phrase
  std::string reason = response.reason_phrase.empty()
                           ? http::httpStatusCodeToString(response.status)
                           : response.reason_phrase;
  std::cout << "#" << index << " " << response.version.toString() << " "
            << http::statusCodeValue(response.status) << " " << reason
            << "\n";

  for (const auto& header : response.headers) {
    std::cout << "  " << header.first << ": " << header.second << "\n";
  }
  for (const auto& cookie : response.cookies) {
    std::cout << "  cookie: " << cookie << "\n";
  }
  std::cout << "  body: " << response.body.size() << " bytes\n";
}

int dumpResponses(network::Stream& stream,
                  const config::ReassemblerConfig& config) {
  http::ResponseReassembler reassembler(stream, config);
  size_t count = 0;
  int parse_errors = 0;

  while (true) {
    try {
      http::Response response = reassembler.parse();
      printResponse(++count, response);
    } catch (const http::ParseError& e) {
      ++parse_errors;
      std::cerr << "Skipping malformed response: " << e.what() << "\n";
    } catch (const network::StreamError& e) {
      if (e.code() != 0) {
        std::cerr << "Read failed: " << e.what() << "\n";
        return 1;
      }
      break;
    }
  }

  std::cout << count << " responses, " << parse_errors
            << " parse errors\n";
  return parse_errors == 0 ? 0 : 2;
}

}  // namespace examples
}  // namespace reasm

int main(int argc, char* argv[]) {
  std::string input_path;
  std::string config_path;
  std::string log_level;

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      log_level = argv[++i];
    } else if (arg == "--help") {
      std::cout << "Usage: " << argv[0] << " [options] [file]\n"
                << "Options:\n"
                << "  --config <path>     JSON reassembler configuration\n"
                << "  --log-level <lvl>   Override the configured log level\n"
                << "  --help              Show this help message\n"
                << "Reads standard input when no file is given.\n";
      return 0;
    } else {
      input_path = arg;
    }
  }

  reasm::config::ReassemblerConfig config;
  try {
    if (!config_path.empty()) {
      config = reasm::config::ReassemblerConfig::loadFromFile(config_path);
    }
    if (!log_level.empty()) {
      nlohmann::json overrides = config.toJson();
      overrides["log_level"] = log_level;
      config = reasm::config::ReassemblerConfig::fromJson(overrides);
    }
  } catch (const reasm::config::ConfigValidationError& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }
  config.applyLogLevel();

  int fd = STDIN_FILENO;
  bool owns_fd = false;
  if (!input_path.empty()) {
    fd = ::open(input_path.c_str(), O_RDONLY);
    if (fd < 0) {
      std::cerr << "Cannot open " << input_path << ": " << strerror(errno)
                << "\n";
      return 1;
    }
    owns_fd = true;
  }

  LOG_INFO("Reading responses from {}",
           input_path.empty() ? "standard input" : input_path);

  reasm::network::FdStream stream(fd, owns_fd);
  return reasm::examples::dumpResponses(stream, config);
}
