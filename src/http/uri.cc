#include "reasm/http/uri.h"

#include <algorithm>
#include <cctype>

namespace reasm {
namespace http {

namespace {

bool isSchemeName(const std::string& scheme) {
  if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme[0]))) {
    return false;
  }
  return std::all_of(scheme.begin(), scheme.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' ||
           c == '-' || c == '.';
  });
}

void validateCharacters(const std::string& text) {
  for (size_t i = 0; i < text.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(text[i]);
    if (c <= 0x20 || c == 0x7f) {
      throw UriError(text, "contains whitespace or control character");
    }
    if (c == '%') {
      if (i + 2 >= text.size() ||
          !std::isxdigit(static_cast<unsigned char>(text[i + 1])) ||
          !std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
        throw UriError(text, "malformed percent-encoding");
      }
    }
  }
}

}  // namespace

Uri Uri::parse(const std::string& text) {
  if (text.empty()) {
    throw UriError(text, "empty request-target");
  }
  validateCharacters(text);

  Uri uri;
  uri.raw_ = text;

  if (text == "*") {
    uri.form_ = Form::Asterisk;
    return uri;
  }

  if (text[0] == '/') {
    uri.form_ = Form::Origin;
    uri.parsePathQueryFragment(text);
    return uri;
  }

  size_t colon = text.find(':');
  if (colon != std::string::npos && isSchemeName(text.substr(0, colon)) &&
      text.compare(colon + 1, 2, "//") == 0) {
    uri.form_ = Form::Absolute;
    uri.scheme_ = text.substr(0, colon);
    std::transform(uri.scheme_.begin(), uri.scheme_.end(), uri.scheme_.begin(),
                   ::tolower);

    std::string rest = text.substr(colon + 3);
    size_t authority_end = rest.find_first_of("/?#");
    uri.parseAuthority(rest.substr(0, authority_end), false);
    if (authority_end != std::string::npos) {
      uri.parsePathQueryFragment(rest.substr(authority_end));
    }
    return uri;
  }

  // CONNECT target
  uri.form_ = Form::Authority;
  uri.parseAuthority(text, true);
  return uri;
}

void Uri::parseAuthority(const std::string& authority, bool require_port) {
  std::string host_port = authority;

  size_t at = authority.rfind('@');
  if (at != std::string::npos) {
    if (require_port) {
      throw UriError(raw_, "user info not allowed in authority-form");
    }
    user_info_ = authority.substr(0, at);
    host_port = authority.substr(at + 1);
  }

  std::string port_text;
  bool has_port = false;

  if (!host_port.empty() && host_port[0] == '[') {
    size_t close = host_port.find(']');
    if (close == std::string::npos) {
      throw UriError(raw_, "unterminated IPv6 literal");
    }
    host_ = host_port.substr(0, close + 1);
    std::string after = host_port.substr(close + 1);
    if (!after.empty()) {
      if (after[0] != ':') {
        throw UriError(raw_, "unexpected text after IPv6 literal");
      }
      has_port = true;
      port_text = after.substr(1);
    }
  } else {
    size_t port_colon = host_port.rfind(':');
    if (port_colon != std::string::npos) {
      has_port = true;
      port_text = host_port.substr(port_colon + 1);
      host_ = host_port.substr(0, port_colon);
    } else {
      host_ = host_port;
    }
  }

  if (host_.empty()) {
    throw UriError(raw_, "missing host");
  }

  if (has_port && !port_text.empty()) {
    if (port_text.size() > 5 ||
        !std::all_of(port_text.begin(), port_text.end(), [](char c) {
          return std::isdigit(static_cast<unsigned char>(c));
        })) {
      throw UriError(raw_, "invalid port");
    }
    unsigned long value = std::stoul(port_text);
    if (value > 65535) {
      throw UriError(raw_, "port out of range");
    }
    port_ = static_cast<uint16_t>(value);
  }

  if (require_port && !port_) {
    throw UriError(raw_, "authority-form requires a port");
  }
}

void Uri::parsePathQueryFragment(const std::string& rest) {
  std::string remaining = rest;

  size_t hash = remaining.find('#');
  if (hash != std::string::npos) {
    fragment_ = remaining.substr(hash + 1);
    remaining.erase(hash);
  }

  size_t question = remaining.find('?');
  if (question != std::string::npos) {
    query_ = remaining.substr(question + 1);
    remaining.erase(question);
  }

  path_ = remaining;
}

}  // namespace http
}  // namespace reasm
