#ifndef REASM_HTTP_HTTP_TYPES_H
#define REASM_HTTP_HTTP_TYPES_H

#include <cstdint>
#include <string>

namespace reasm {
namespace http {

// HTTP status codes
// Any three-digit code read off the wire is representable; the named
// values are the ones callers commonly compare against.
enum class HttpStatusCode : uint16_t {
  // 1xx Informational
  Continue = 100,
  SwitchingProtocols = 101,

  // 2xx Success
  OK = 200,
  Created = 201,
  Accepted = 202,
  NoContent = 204,

  // 3xx Redirection
  MovedPermanently = 301,
  Found = 302,
  NotModified = 304,

  // 4xx Client Error
  BadRequest = 400,
  Unauthorized = 401,
  Forbidden = 403,
  NotFound = 404,
  MethodNotAllowed = 405,
  RequestTimeout = 408,

  // 5xx Server Error
  InternalServerError = 500,
  NotImplemented = 501,
  BadGateway = 502,
  ServiceUnavailable = 503,
  GatewayTimeout = 504
};

// HTTP methods
enum class HttpMethod {
  GET,
  POST,
  PUT,
  DELETE,
  HEAD,
  OPTIONS,
  PATCH,
  CONNECT,
  TRACE,
  UNKNOWN
};

// HTTP protocol version as read from the start line
struct HttpVersion {
  uint8_t major_version{0};
  uint8_t minor_version{0};

  HttpVersion() = default;
  HttpVersion(uint8_t major_v, uint8_t minor_v)
      : major_version(major_v), minor_version(minor_v) {}

  bool operator==(const HttpVersion& other) const {
    return major_version == other.major_version &&
           minor_version == other.minor_version;
  }
  bool operator!=(const HttpVersion& other) const { return !(*this == other); }

  // "HTTP/1.1"
  std::string toString() const;
};

// Raw message body bytes
using Body = std::string;

const char* httpMethodToString(HttpMethod method);

HttpMethod httpMethodFromString(const std::string& method);

// Canonical reason phrase, "Unknown" for unnamed codes
const char* httpStatusCodeToString(HttpStatusCode code);

inline uint16_t statusCodeValue(HttpStatusCode code) {
  return static_cast<uint16_t>(code);
}

}  // namespace http
}  // namespace reasm

#endif  // REASM_HTTP_HTTP_TYPES_H
