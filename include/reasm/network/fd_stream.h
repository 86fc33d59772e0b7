#ifndef REASM_NETWORK_FD_STREAM_H
#define REASM_NETWORK_FD_STREAM_H

#include "reasm/network/stream.h"

namespace reasm {
namespace network {

/**
 * Stream over a POSIX descriptor (socket, pipe or file).
 *
 * Non-blocking descriptors are waited on with poll(), so receive() keeps
 * its blocking contract either way.
 */
class FdStream : public Stream {
 public:
  explicit FdStream(int fd, bool owns_fd = false);
  ~FdStream() override;

  // Non-copyable
  FdStream(const FdStream&) = delete;
  FdStream& operator=(const FdStream&) = delete;

  size_t receive(char* buffer, size_t max_bytes) override;

  int fd() const { return fd_; }
  bool isOpen() const { return fd_ >= 0; }

  // Close the descriptor if owned; a no-op otherwise
  void close();

 private:
  // Block until fd_ is readable
  void waitReadable();

  int fd_;
  bool owns_fd_;
};

}  // namespace network
}  // namespace reasm

#endif  // REASM_NETWORK_FD_STREAM_H
