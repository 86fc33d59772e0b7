#ifndef REASM_HTTP_HEADER_FOLDING_H
#define REASM_HTTP_HEADER_FOLDING_H

#include <cstddef>
#include <string>

#include "reasm/http/message_context.h"

namespace reasm {
namespace http {

// Field name whose values are collected separately on responses
extern const char kSetCookieHeader[];

bool isSetCookieHeader(const std::string& name);

/**
 * Starts the value of the field whose name has been accumulated in
 * building_header_name: moves it to committed_header_name and, when the
 * name already has a value, appends ", " so the new value folds onto it.
 * Cookie fields on a response are never folded.
 */
void commitHeaderName(MessageContext& ctx, bool divert_cookies);

/**
 * Appends a value fragment for the committed field, to the pending cookie
 * value when divert_cookies is set and the field is Set-Cookie, to the
 * folded header value otherwise.
 */
void appendHeaderValue(MessageContext& ctx,
                       const char* data,
                       size_t length,
                       bool divert_cookies);

/**
 * Records a field whose value was empty, so that no value fragment ever
 * committed it. No effect when the field is already committed.
 */
void commitEmptyHeader(MessageContext& ctx, bool divert_cookies);

/**
 * Moves a non-empty pending Set-Cookie value into the cookie set.
 * Returns true if a value was moved.
 */
bool flushCookieValue(MessageContext& ctx);

}  // namespace http
}  // namespace reasm

#endif  // REASM_HTTP_HEADER_FOLDING_H
