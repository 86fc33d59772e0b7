#include "reasm/network/fd_stream.h"

#include <errno.h>
#include <poll.h>
#include <unistd.h>

#include <cstring>
#include <string>

#include "reasm/logging/logger_registry.h"

namespace reasm {
namespace network {

namespace {

logging::ComponentLogger& streamLog() {
  static logging::ComponentLogger logger(logging::Component::Network,
                                         "stream");
  return logger;
}

StreamError errnoError(const char* operation, int error) {
  return StreamError(error,
                     std::string(operation) + " failed: " + strerror(error));
}

}  // namespace

FdStream::FdStream(int fd, bool owns_fd) : fd_(fd), owns_fd_(owns_fd) {}

FdStream::~FdStream() { close(); }

void FdStream::close() {
  if (owns_fd_ && fd_ >= 0) {
    ::close(fd_);
  }
  fd_ = -1;
}

size_t FdStream::receive(char* buffer, size_t max_bytes) {
  if (fd_ < 0) {
    throw StreamError(EBADF, "receive on closed descriptor");
  }
  if (max_bytes == 0) {
    return 0;
  }

  while (true) {
    ssize_t result = ::read(fd_, buffer, max_bytes);
    if (result >= 0) {
      if (result == 0) {
        streamLog().log(logging::LogLevel::Debug, "End of stream on fd {}",
                        fd_);
      }
      return static_cast<size_t>(result);
    }

    int error = errno;
    if (error == EINTR) {
      continue;
    }
    if (error == EAGAIN || error == EWOULDBLOCK) {
      waitReadable();
      continue;
    }

    streamLog().log(logging::LogLevel::Error, "Read on fd {} failed: {}", fd_,
                    strerror(error));
    throw errnoError("read", error);
  }
}

void FdStream::waitReadable() {
  pollfd pfd;
  pfd.fd = fd_;
  pfd.events = POLLIN;
  pfd.revents = 0;

  while (::poll(&pfd, 1, -1) < 0) {
    int error = errno;
    if (error != EINTR) {
      throw errnoError("poll", error);
    }
  }
}

}  // namespace network
}  // namespace reasm
