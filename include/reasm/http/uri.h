#ifndef REASM_HTTP_URI_H
#define REASM_HTTP_URI_H

#include <cstdint>
#include <stdexcept>
#include <string>

#include "reasm/core/compat.h"

namespace reasm {
namespace http {

/**
 * Thrown when a request-target is not a well-formed URI reference.
 */
class UriError : public std::runtime_error {
 public:
  UriError(const std::string& text, const std::string& reason)
      : std::runtime_error("Invalid URI '" + text + "': " + reason),
        text_(text),
        reason_(reason) {}

  const std::string& text() const { return text_; }
  const std::string& reason() const { return reason_; }

 private:
  std::string text_;
  std::string reason_;
};

/**
 * Request-target of an HTTP/1.x request line, split into components.
 *
 * Accepts the four request-target forms: origin-form ("/a?b"),
 * absolute-form ("http://h:80/a"), authority-form ("h:443", CONNECT only)
 * and asterisk-form ("*"). Components are kept percent-encoded.
 */
class Uri {
 public:
  enum class Form { Origin, Absolute, Authority, Asterisk };

  Uri() = default;

  // Throws UriError on malformed input
  static Uri parse(const std::string& text);

  Form form() const { return form_; }
  const std::string& scheme() const { return scheme_; }
  const std::string& userInfo() const { return user_info_; }
  const std::string& host() const { return host_; }
  optional<uint16_t> port() const { return port_; }
  const std::string& path() const { return path_; }
  const std::string& query() const { return query_; }
  const std::string& fragment() const { return fragment_; }

  // The text the Uri was parsed from
  const std::string& toString() const { return raw_; }

  bool operator==(const Uri& other) const { return raw_ == other.raw_; }
  bool operator!=(const Uri& other) const { return raw_ != other.raw_; }

 private:
  void parseAuthority(const std::string& authority, bool require_port);
  void parsePathQueryFragment(const std::string& rest);

  std::string raw_;
  Form form_{Form::Origin};
  std::string scheme_;
  std::string user_info_;
  std::string host_;
  optional<uint16_t> port_;
  std::string path_;
  std::string query_;
  std::string fragment_;
};

}  // namespace http
}  // namespace reasm

#endif  // REASM_HTTP_URI_H
