#include <gtest/gtest.h>

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <string>
#include <thread>

#include "reasm/http/response_reassembler.h"
#include "reasm/logging/logger_registry.h"
#include "reasm/network/fd_stream.h"
#include "reasm/network/memory_stream.h"

#include "../logging/capture_sink.h"

namespace reasm {
namespace network {
namespace {

class FdStreamTest : public ::testing::Test {
 protected:
  void SetUp() override { ASSERT_EQ(0, ::pipe(fds_)); }

  void TearDown() override {
    closeWriter();
    if (fds_[0] >= 0) {
      ::close(fds_[0]);
    }
  }

  void write(const std::string& data) {
    ASSERT_EQ(static_cast<ssize_t>(data.size()),
              ::write(fds_[1], data.data(), data.size()));
  }

  void closeWriter() {
    if (fds_[1] >= 0) {
      ::close(fds_[1]);
      fds_[1] = -1;
    }
  }

  // Hand the read end to an owning stream
  int releaseReader() {
    int fd = fds_[0];
    fds_[0] = -1;
    return fd;
  }

  int fds_[2] = {-1, -1};
};

TEST_F(FdStreamTest, ReceivesAvailableBytes) {
  FdStream stream(fds_[0]);
  write("hello");

  char buffer[16];
  size_t received = stream.receive(buffer, sizeof(buffer));
  EXPECT_EQ("hello", std::string(buffer, received));
}

TEST_F(FdStreamTest, RespectsMaxBytes) {
  FdStream stream(fds_[0]);
  write("abcdef");

  char buffer[16];
  EXPECT_EQ(4u, stream.receive(buffer, 4));
  EXPECT_EQ("abcd", std::string(buffer, 4));
  EXPECT_EQ(2u, stream.receive(buffer, sizeof(buffer)));
}

TEST_F(FdStreamTest, ZeroAtEndOfStream) {
  FdStream stream(fds_[0]);
  closeWriter();

  char buffer[16];
  EXPECT_EQ(0u, stream.receive(buffer, sizeof(buffer)));
}

TEST_F(FdStreamTest, WaitsOnNonBlockingDescriptor) {
  int flags = ::fcntl(fds_[0], F_GETFL, 0);
  ASSERT_EQ(0, ::fcntl(fds_[0], F_SETFL, flags | O_NONBLOCK));
  FdStream stream(fds_[0]);

  std::thread writer([this]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    write("late");
  });

  char buffer[16];
  size_t received = stream.receive(buffer, sizeof(buffer));
  writer.join();
  EXPECT_EQ("late", std::string(buffer, received));
}

TEST_F(FdStreamTest, ReadFailureThrowsWithErrno) {
  FdStream stream(fds_[1]);

  char buffer[16];
  try {
    stream.receive(buffer, sizeof(buffer));
    FAIL() << "Expected StreamError";
  } catch (const StreamError& e) {
    EXPECT_EQ(EBADF, e.code());
  }
}

TEST_F(FdStreamTest, ReadFailureIsLoggedOnNetworkComponent) {
  auto logger =
      logging::LoggerRegistry::instance().getOrCreateLogger("Network.stream");
  auto previous_sink = logger->getSink();
  auto sink = std::make_shared<test::CapturingSink>();
  logger->setSink(sink);

  FdStream stream(fds_[1]);
  char buffer[16];
  EXPECT_THROW(stream.receive(buffer, sizeof(buffer)), StreamError);

  logger->setSink(previous_sink);

  auto messages = sink->getMessages();
  ASSERT_EQ(messages.size(), 1u);
  EXPECT_EQ(messages[0].level, logging::LogLevel::Error);
  EXPECT_EQ(messages[0].component, logging::Component::Network);
  EXPECT_NE(messages[0].message.find("failed"), std::string::npos);
}

TEST_F(FdStreamTest, OwnedDescriptorIsClosed) {
  int fd = releaseReader();
  {
    FdStream stream(fd, true);
    EXPECT_TRUE(stream.isOpen());
  }
  EXPECT_EQ(-1, ::fcntl(fd, F_GETFD));
}

TEST_F(FdStreamTest, ReceiveAfterCloseThrows) {
  FdStream stream(releaseReader(), true);
  stream.close();
  EXPECT_FALSE(stream.isOpen());

  char buffer[4];
  EXPECT_THROW(stream.receive(buffer, sizeof(buffer)), StreamError);
}

TEST_F(FdStreamTest, FeedsResponseReassembler) {
  FdStream stream(fds_[0]);
  write("HTTP/1.1 200 OK\r\nSet-Cookie: id=1\r\nContent-Length: 2\r\n\r\nok");
  write("HTTP/1.1 500 Internal Server Error\r\n\r\nfailed");
  closeWriter();

  http::ResponseReassembler reassembler(stream);

  http::Response first = reassembler.parse();
  EXPECT_EQ("ok", first.body);
  EXPECT_EQ(1u, first.cookies.count("id=1"));

  http::Response second = reassembler.parse();
  EXPECT_EQ(http::HttpStatusCode::InternalServerError, second.status);
  EXPECT_EQ("failed", second.body);

  EXPECT_THROW(reassembler.parse(), StreamError);
}

TEST(MemoryStreamTest, HandsOutSlices) {
  MemoryStream stream("abcdefg", 3);

  char buffer[16];
  EXPECT_EQ(3u, stream.receive(buffer, sizeof(buffer)));
  EXPECT_EQ("abc", std::string(buffer, 3));
  EXPECT_EQ(2u, stream.receive(buffer, 2));
  EXPECT_EQ("de", std::string(buffer, 2));
  EXPECT_EQ(2u, stream.receive(buffer, sizeof(buffer)));
  EXPECT_EQ(0u, stream.receive(buffer, sizeof(buffer)));
  EXPECT_EQ(4u, stream.receiveCalls());
}

TEST(MemoryStreamTest, AppendExtendsData) {
  MemoryStream stream("ab");
  stream.append("cd");

  char buffer[16];
  EXPECT_EQ(4u, stream.receive(buffer, sizeof(buffer)));
  EXPECT_EQ(0u, stream.remaining());
}

}  // namespace
}  // namespace network
}  // namespace reasm
