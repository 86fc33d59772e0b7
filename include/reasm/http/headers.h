#ifndef REASM_HTTP_HEADERS_H
#define REASM_HTTP_HEADERS_H

#include <initializer_list>
#include <map>
#include <set>
#include <string>

#include "reasm/core/compat.h"

namespace reasm {
namespace http {

// ASCII case-insensitive comparison of header field names
bool equalsIgnoreCase(const std::string& a, const std::string& b);

struct CaseInsensitiveLess {
  bool operator()(const std::string& a, const std::string& b) const;
};

/**
 * Header fields of one message.
 *
 * Names compare case-insensitively and map to a single value; repeated
 * fields are folded into that value before they get here. The spelling of
 * the first insertion is kept for iteration.
 */
class Headers {
 public:
  using Map = std::map<std::string, std::string, CaseInsensitiveLess>;
  using const_iterator = Map::const_iterator;

  Headers() = default;
  Headers(std::initializer_list<Map::value_type> init) : headers_(init) {}

  optional<std::string> get(const std::string& name) const;

  bool has(const std::string& name) const;

  // Replaces any existing value
  void set(const std::string& name, const std::string& value);

  // Returns the value for name, inserting an empty one if absent
  std::string& operator[](const std::string& name) { return headers_[name]; }

  void remove(const std::string& name);

  void clear() { headers_.clear(); }
  bool empty() const { return headers_.empty(); }
  size_t size() const { return headers_.size(); }

  const_iterator begin() const { return headers_.begin(); }
  const_iterator end() const { return headers_.end(); }

  bool operator==(const Headers& other) const;
  bool operator!=(const Headers& other) const { return !(*this == other); }

 private:
  Map headers_;
};

// Raw Set-Cookie field values, one entry per field
using CookieSet = std::set<std::string>;

}  // namespace http
}  // namespace reasm

#endif  // REASM_HTTP_HEADERS_H
