#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>

#include "reasm/http/parse_error.h"
#include "reasm/http/response_reassembler.h"
#include "reasm/network/memory_stream.h"

#include "../mocks/http_mocks.h"

namespace reasm {
namespace http {
namespace {

using ::testing::_;
using ::testing::InSequence;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::Throw;
using network::MemoryStream;
using network::StreamError;
using test::MockStream;

const std::string kHello =
    "HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nhello";

const std::string kWithCookies =
    "HTTP/1.1 302 Found\r\n"
    "Location: /home\r\n"
    "Set-Cookie: a=1\r\n"
    "Cache-Control: no-cache\r\n"
    "Set-Cookie: b=2; HttpOnly\r\n"
    "Cache-Control: no-store\r\n"
    "Content-Length: 0\r\n"
    "\r\n";

// Copies data into the reassembler's read buffer
auto deliver(const std::string& data) {
  return Invoke([data](char* buffer, size_t max_bytes) {
    size_t length = std::min(max_bytes, data.size());
    std::memcpy(buffer, data.data(), length);
    return length;
  });
}

TEST(ResponseReassemblerTest, ParsesSimpleResponse) {
  MemoryStream stream(kHello);
  ResponseReassembler reassembler(stream);

  Response response = reassembler.parse();

  EXPECT_EQ(HttpVersion(1, 1), response.version);
  EXPECT_EQ(HttpStatusCode::OK, response.status);
  EXPECT_EQ("OK", response.reason_phrase);
  EXPECT_EQ((Headers{{"Content-Length", "5"}}), response.headers);
  EXPECT_TRUE(response.cookies.empty());
  EXPECT_EQ("hello", response.body);
}

TEST(ResponseReassemblerTest, CookiesAreKeptOutOfHeaders) {
  MemoryStream stream(kWithCookies);
  ResponseReassembler reassembler(stream);

  Response response = reassembler.parse();

  EXPECT_EQ(HttpStatusCode::Found, response.status);
  EXPECT_EQ((CookieSet{"a=1", "b=2; HttpOnly"}), response.cookies);
  EXPECT_FALSE(response.headers.has("Set-Cookie"));
  EXPECT_EQ("no-cache, no-store", response.headers.get("Cache-Control").value());
  EXPECT_EQ("/home", response.headers.get("Location").value());
}

TEST(ResponseReassemblerTest, LastHeaderCookieIsCaptured) {
  MemoryStream stream(
      "HTTP/1.1 200 OK\r\nContent-Length: 0\r\nSet-Cookie: last=1\r\n\r\n");
  ResponseReassembler reassembler(stream);

  EXPECT_EQ((CookieSet{"last=1"}), reassembler.parse().cookies);
}

TEST(ResponseReassemblerTest, BackToBackResponsesInOrder) {
  MemoryStream stream(kHello + kWithCookies +
                      "HTTP/1.1 204 No Content\r\n\r\n");
  ResponseReassembler reassembler(stream);

  EXPECT_EQ(HttpStatusCode::OK, reassembler.parse().status);
  EXPECT_EQ(2u, reassembler.pending());
  EXPECT_EQ(HttpStatusCode::Found, reassembler.parse().status);

  Response last = reassembler.parse();
  EXPECT_EQ(HttpStatusCode::NoContent, last.status);
  EXPECT_EQ("No Content", last.reason_phrase);
  EXPECT_EQ(0u, reassembler.pending());
}

TEST(ResponseReassemblerTest, SmallReadsGiveSameResponse) {
  for (size_t chunk : {1u, 2u, 7u, 64u}) {
    SCOPED_TRACE("chunk " + std::to_string(chunk));
    MemoryStream stream(kWithCookies + kHello, chunk);
    ResponseReassembler reassembler(stream);

    Response first = reassembler.parse();
    EXPECT_EQ((CookieSet{"a=1", "b=2; HttpOnly"}), first.cookies);
    EXPECT_EQ("no-cache, no-store", first.headers.get("Cache-Control").value());

    Response second = reassembler.parse();
    EXPECT_EQ("hello", second.body);
  }
}

TEST(ResponseReassemblerTest, ReadsUseConfiguredBufferSize) {
  MockStream stream;
  config::ReassemblerConfig config;
  config.buffer_size = 16;
  ResponseReassembler reassembler(stream, config);

  {
    InSequence seq;
    EXPECT_CALL(stream, receive(_, 16))
        .WillOnce(deliver(kHello.substr(0, 16)))
        .WillOnce(deliver(kHello.substr(16, 16)))
        .WillOnce(deliver(kHello.substr(32)));
  }

  EXPECT_EQ("hello", reassembler.parse().body);
}

TEST(ResponseReassemblerTest, DoesNotReadWhileResponsesAreQueued) {
  MockStream stream;
  ResponseReassembler reassembler(stream);

  EXPECT_CALL(stream, receive(_, _)).WillOnce(deliver(kHello + kHello));

  reassembler.parse();
  EXPECT_EQ(1u, reassembler.pending());
  reassembler.parse();
}

TEST(ResponseReassemblerTest, CloseDelimitedBodyCompletesAtEndOfStream) {
  MemoryStream stream("HTTP/1.0 200 OK\r\nServer: old\r\n\r\nuntil the end",
                      8);
  ResponseReassembler reassembler(stream);

  Response response = reassembler.parse();
  EXPECT_EQ("until the end", response.body);
  EXPECT_EQ(HttpVersion(1, 0), response.version);
  EXPECT_TRUE(reassembler.endOfStream());

  EXPECT_THROW(reassembler.parse(), StreamError);
}

TEST(ResponseReassemblerTest, SwitchingProtocolsResponseIsReturned) {
  MemoryStream stream(
      "HTTP/1.1 101 Switching Protocols\r\n"
      "Upgrade: websocket\r\n"
      "Connection: Upgrade\r\n"
      "\r\n");
  ResponseReassembler reassembler(stream);

  Response response = reassembler.parse();
  EXPECT_EQ(HttpStatusCode::SwitchingProtocols, response.status);
  EXPECT_EQ("Switching Protocols", response.reason_phrase);
  EXPECT_EQ("websocket", response.headers.get("Upgrade").value());
  EXPECT_EQ("", response.body);

  try {
    reassembler.parse();
    FAIL() << "Expected StreamError";
  } catch (const StreamError& e) {
    EXPECT_EQ(0, e.code());
  }
}

TEST(ResponseReassemblerTest, TunnelBytesAfterSwitchingProtocolsAreParseError) {
  MemoryStream stream(
      "HTTP/1.1 101 Switching Protocols\r\n"
      "Upgrade: websocket\r\n"
      "Connection: Upgrade\r\n"
      "\r\n"
      "\x81\x02hi");
  ResponseReassembler reassembler(stream);

  try {
    reassembler.parse();
    FAIL() << "Expected ParseError";
  } catch (const ParseError& e) {
    EXPECT_EQ("HPE_PAUSED_UPGRADE", e.name());
  }

  EXPECT_EQ(1u, reassembler.pending());
  EXPECT_EQ(HttpStatusCode::SwitchingProtocols, reassembler.parse().status);
}

TEST(ResponseReassemblerTest, EndOfStreamWithoutResponse) {
  MemoryStream stream("");
  ResponseReassembler reassembler(stream);

  try {
    reassembler.parse();
    FAIL() << "Expected StreamError";
  } catch (const StreamError& e) {
    EXPECT_EQ(0, e.code());
  }
  EXPECT_EQ(1u, stream.receiveCalls());

  // No further reads once the stream has ended
  EXPECT_THROW(reassembler.parse(), StreamError);
  EXPECT_EQ(1u, stream.receiveCalls());
}

TEST(ResponseReassemblerTest, TruncatedBodyIsParseError) {
  MemoryStream stream("HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nabc");
  ResponseReassembler reassembler(stream);

  try {
    reassembler.parse();
    FAIL() << "Expected ParseError";
  } catch (const ParseError& e) {
    EXPECT_EQ("HPE_INVALID_EOF_STATE", e.name());
  }

  EXPECT_TRUE(reassembler.assembler().context().empty());
  EXPECT_THROW(reassembler.parse(), StreamError);
}

TEST(ResponseReassemblerTest, RecoversAfterMalformedResponse) {
  MockStream stream;
  ResponseReassembler reassembler(stream);

  {
    InSequence seq;
    EXPECT_CALL(stream, receive(_, _))
        .WillOnce(deliver("HTTP/1.1 2x0 Broken\r\n\r\n"));
    EXPECT_CALL(stream, receive(_, _)).WillOnce(deliver(kHello));
  }

  EXPECT_THROW(reassembler.parse(), ParseError);

  Response response = reassembler.parse();
  EXPECT_EQ("hello", response.body);
  EXPECT_EQ((Headers{{"Content-Length", "5"}}), response.headers);
}

TEST(ResponseReassemblerTest, StreamErrorPropagates) {
  MockStream stream;
  ResponseReassembler reassembler(stream);

  {
    InSequence seq;
    EXPECT_CALL(stream, receive(_, _))
        .WillOnce(deliver("HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nhe"));
    EXPECT_CALL(stream, receive(_, _))
        .WillOnce(Throw(StreamError(ECONNRESET, "connection reset")));
  }

  try {
    reassembler.parse();
    FAIL() << "Expected StreamError";
  } catch (const StreamError& e) {
    EXPECT_EQ(ECONNRESET, e.code());
  }

  // Parser state is left as it was
  EXPECT_EQ("he", reassembler.assembler().context().body);
  EXPECT_FALSE(reassembler.endOfStream());
}

}  // namespace
}  // namespace http
}  // namespace reasm
