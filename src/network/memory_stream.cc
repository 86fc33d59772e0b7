#include "reasm/network/memory_stream.h"

#include <algorithm>
#include <cstring>
#include <utility>

namespace reasm {
namespace network {

MemoryStream::MemoryStream(std::string data, size_t max_chunk)
    : data_(std::move(data)), max_chunk_(max_chunk) {}

size_t MemoryStream::receive(char* buffer, size_t max_bytes) {
  ++receive_calls_;

  size_t length = std::min(max_bytes, remaining());
  if (max_chunk_ > 0) {
    length = std::min(length, max_chunk_);
  }

  if (length > 0) {
    std::memcpy(buffer, data_.data() + offset_, length);
    offset_ += length;
  }
  return length;
}

}  // namespace network
}  // namespace reasm
