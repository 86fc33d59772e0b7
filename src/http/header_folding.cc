#include "reasm/http/header_folding.h"

#include <utility>

namespace reasm {
namespace http {

const char kSetCookieHeader[] = "Set-Cookie";

bool isSetCookieHeader(const std::string& name) {
  return equalsIgnoreCase(name, kSetCookieHeader);
}

void commitHeaderName(MessageContext& ctx, bool divert_cookies) {
  ctx.committed_header_name = std::move(ctx.building_header_name);
  ctx.building_header_name.clear();

  if (divert_cookies && isSetCookieHeader(ctx.committed_header_name)) {
    return;
  }

  if (ctx.headers.has(ctx.committed_header_name)) {
    ctx.headers[ctx.committed_header_name] += ", ";
  }
}

void appendHeaderValue(MessageContext& ctx,
                       const char* data,
                       size_t length,
                       bool divert_cookies) {
  if (divert_cookies && isSetCookieHeader(ctx.committed_header_name)) {
    ctx.building_cookie_value.append(data, length);
  } else {
    ctx.headers[ctx.committed_header_name].append(data, length);
  }
}

void commitEmptyHeader(MessageContext& ctx, bool divert_cookies) {
  if (!ctx.committed_header_name.empty() || ctx.building_header_name.empty()) {
    return;
  }

  ctx.committed_header_name = std::move(ctx.building_header_name);
  ctx.building_header_name.clear();

  if (divert_cookies && isSetCookieHeader(ctx.committed_header_name)) {
    return;
  }
  // Creates the entry if absent; an existing value is left unchanged
  ctx.headers[ctx.committed_header_name];
}

bool flushCookieValue(MessageContext& ctx) {
  if (ctx.building_cookie_value.empty()) {
    return false;
  }
  ctx.cookies.insert(std::move(ctx.building_cookie_value));
  ctx.building_cookie_value.clear();
  return true;
}

}  // namespace http
}  // namespace reasm
