#ifndef REASM_HTTP_HTTP_MESSAGE_H
#define REASM_HTTP_HTTP_MESSAGE_H

#include <string>

#include "reasm/http/headers.h"
#include "reasm/http/http_types.h"
#include "reasm/http/uri.h"

namespace reasm {
namespace http {

// A complete request as read off the connection
struct Request {
  HttpMethod method{HttpMethod::UNKNOWN};
  // Method token as sent, kept for methods with no HttpMethod value
  std::string method_name;
  Uri uri;
  HttpVersion version;
  Headers headers;
  Body body;
};

// A complete response as read off the connection
struct Response {
  HttpVersion version;
  HttpStatusCode status{HttpStatusCode::OK};
  std::string reason_phrase;
  Headers headers;
  // Set-Cookie values, never present in headers
  CookieSet cookies;
  Body body;
};

}  // namespace http
}  // namespace reasm

#endif  // REASM_HTTP_HTTP_MESSAGE_H
