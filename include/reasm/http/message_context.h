#ifndef REASM_HTTP_MESSAGE_CONTEXT_H
#define REASM_HTTP_MESSAGE_CONTEXT_H

#include <string>

#include "reasm/core/compat.h"
#include "reasm/http/headers.h"
#include "reasm/http/http_types.h"
#include "reasm/http/uri.h"

namespace reasm {
namespace http {

/**
 * Fields of the one message currently being assembled on a connection.
 *
 * Lives as long as the reassembler and is cleared in place after every
 * completed message and after every parse error.
 *
 * committed_header_name is empty while a field name is still arriving and
 * holds the name once its value has started; building_header_name is empty
 * from that point on.
 */
struct MessageContext {
  // URL (requests) or reason phrase (responses) assembled across fragments
  std::string building_text;
  std::string building_header_name;
  std::string committed_header_name;
  // Set-Cookie value being assembled (responses only)
  std::string building_cookie_value;

  Headers headers;
  CookieSet cookies;
  Body body;

  // Unset until the header block is complete
  optional<HttpMethod> method;
  std::string method_name;
  optional<Uri> uri;
  optional<HttpStatusCode> status;
  std::string reason_phrase;
  HttpVersion version;

  void reset() {
    building_text.clear();
    building_header_name.clear();
    committed_header_name.clear();
    building_cookie_value.clear();
    headers.clear();
    cookies.clear();
    body.clear();
    method = nullopt;
    method_name.clear();
    uri = nullopt;
    status = nullopt;
    reason_phrase.clear();
    version = HttpVersion();
  }

  // True when nothing of a message has been recorded
  bool empty() const {
    return building_text.empty() && building_header_name.empty() &&
           committed_header_name.empty() && building_cookie_value.empty() &&
           headers.empty() && cookies.empty() && body.empty() && !method &&
           method_name.empty() && !uri && !status && reason_phrase.empty() &&
           version == HttpVersion();
  }
};

}  // namespace http
}  // namespace reasm

#endif  // REASM_HTTP_MESSAGE_CONTEXT_H
