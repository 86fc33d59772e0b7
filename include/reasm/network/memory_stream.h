#ifndef REASM_NETWORK_MEMORY_STREAM_H
#define REASM_NETWORK_MEMORY_STREAM_H

#include <string>

#include "reasm/network/stream.h"

namespace reasm {
namespace network {

/**
 * Stream over bytes held in memory, handed out at most max_chunk bytes
 * per receive() call. Reports end of stream once everything is read.
 */
class MemoryStream : public Stream {
 public:
  explicit MemoryStream(std::string data, size_t max_chunk = 0);

  size_t receive(char* buffer, size_t max_bytes) override;

  // Append more bytes behind the unread ones
  void append(const std::string& data) { data_ += data; }

  size_t remaining() const { return data_.size() - offset_; }
  size_t receiveCalls() const { return receive_calls_; }

 private:
  std::string data_;
  size_t offset_{0};
  size_t max_chunk_;
  size_t receive_calls_{0};
};

}  // namespace network
}  // namespace reasm

#endif  // REASM_NETWORK_MEMORY_STREAM_H
