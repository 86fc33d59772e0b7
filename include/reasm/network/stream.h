#ifndef REASM_NETWORK_STREAM_H
#define REASM_NETWORK_STREAM_H

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>

namespace reasm {
namespace network {

/**
 * Failure of the byte source underneath a reassembler.
 *
 * code is the errno value for I/O failures and 0 when the peer closed the
 * connection before a message completed.
 */
class StreamError : public std::runtime_error {
 public:
  StreamError(int code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  int code() const { return code_; }

  static StreamError closed() { return StreamError(0, "connection closed"); }

 private:
  int code_;
};

/**
 * Blocking source of raw bytes for one connection
 */
class Stream {
 public:
  virtual ~Stream() = default;

  /**
   * Read up to max_bytes into buffer, blocking until at least one byte is
   * available. Returns the number of bytes read, 0 at end of stream.
   * Throws StreamError on I/O failure.
   */
  virtual size_t receive(char* buffer, size_t max_bytes) = 0;
};

using StreamPtr = std::unique_ptr<Stream>;

}  // namespace network
}  // namespace reasm

#endif  // REASM_NETWORK_STREAM_H
