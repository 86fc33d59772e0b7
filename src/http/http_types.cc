#include "reasm/http/http_types.h"

#include <algorithm>
#include <cctype>

namespace reasm {
namespace http {

std::string HttpVersion::toString() const {
  return "HTTP/" + std::to_string(major_version) + "." +
         std::to_string(minor_version);
}

const char* httpMethodToString(HttpMethod method) {
  switch (method) {
    case HttpMethod::GET:
      return "GET";
    case HttpMethod::POST:
      return "POST";
    case HttpMethod::PUT:
      return "PUT";
    case HttpMethod::DELETE:
      return "DELETE";
    case HttpMethod::HEAD:
      return "HEAD";
    case HttpMethod::OPTIONS:
      return "OPTIONS";
    case HttpMethod::PATCH:
      return "PATCH";
    case HttpMethod::CONNECT:
      return "CONNECT";
    case HttpMethod::TRACE:
      return "TRACE";
    default:
      return "UNKNOWN";
  }
}

HttpMethod httpMethodFromString(const std::string& method) {
  std::string upper = method;
  std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);

  if (upper == "GET")
    return HttpMethod::GET;
  if (upper == "POST")
    return HttpMethod::POST;
  if (upper == "PUT")
    return HttpMethod::PUT;
  if (upper == "DELETE")
    return HttpMethod::DELETE;
  if (upper == "HEAD")
    return HttpMethod::HEAD;
  if (upper == "OPTIONS")
    return HttpMethod::OPTIONS;
  if (upper == "PATCH")
    return HttpMethod::PATCH;
  if (upper == "CONNECT")
    return HttpMethod::CONNECT;
  if (upper == "TRACE")
    return HttpMethod::TRACE;

  return HttpMethod::UNKNOWN;
}

const char* httpStatusCodeToString(HttpStatusCode code) {
  switch (code) {
    case HttpStatusCode::Continue:
      return "Continue";
    case HttpStatusCode::SwitchingProtocols:
      return "Switching Protocols";
    case HttpStatusCode::OK:
      return "OK";
    case HttpStatusCode::Created:
      return "Created";
    case HttpStatusCode::Accepted:
      return "Accepted";
    case HttpStatusCode::NoContent:
      return "No Content";
    case HttpStatusCode::MovedPermanently:
      return "Moved Permanently";
    case HttpStatusCode::Found:
      return "Found";
    case HttpStatusCode::NotModified:
      return "Not Modified";
    case HttpStatusCode::BadRequest:
      return "Bad Request";
    case HttpStatusCode::Unauthorized:
      return "Unauthorized";
    case HttpStatusCode::Forbidden:
      return "Forbidden";
    case HttpStatusCode::NotFound:
      return "Not Found";
    case HttpStatusCode::MethodNotAllowed:
      return "Method Not Allowed";
    case HttpStatusCode::RequestTimeout:
      return "Request Timeout";
    case HttpStatusCode::InternalServerError:
      return "Internal Server Error";
    case HttpStatusCode::NotImplemented:
      return "Not Implemented";
    case HttpStatusCode::BadGateway:
      return "Bad Gateway";
    case HttpStatusCode::ServiceUnavailable:
      return "Service Unavailable";
    case HttpStatusCode::GatewayTimeout:
      return "Gateway Timeout";
    default:
      return "Unknown";
  }
}

}  // namespace http
}  // namespace reasm
