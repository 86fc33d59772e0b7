#ifndef REASM_HTTP_PARSE_ERROR_H
#define REASM_HTTP_PARSE_ERROR_H

#include <sstream>
#include <stdexcept>
#include <string>

namespace reasm {
namespace http {

/**
 * Malformed input reported by the tokenizer.
 *
 * code() is the tokenizer's numeric error (llhttp_errno_t); name() its
 * symbolic form, e.g. "HPE_INVALID_METHOD".
 */
class ParseError : public std::runtime_error {
 public:
  ParseError(int code, const std::string& name, const std::string& reason)
      : std::runtime_error(formatError(code, name, reason)),
        code_(code),
        name_(name),
        reason_(reason) {}

  int code() const { return code_; }
  const std::string& name() const { return name_; }
  const std::string& reason() const { return reason_; }

 private:
  static std::string formatError(int code,
                                 const std::string& name,
                                 const std::string& reason) {
    std::ostringstream oss;
    oss << "HTTP parse error " << name << " (" << code << ")";
    if (!reason.empty()) {
      oss << ": " << reason;
    }
    return oss.str();
  }

  int code_;
  std::string name_;
  std::string reason_;
};

}  // namespace http
}  // namespace reasm

#endif  // REASM_HTTP_PARSE_ERROR_H
