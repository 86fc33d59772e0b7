#include "reasm/http/headers.h"

#include <algorithm>
#include <cctype>

namespace reasm {
namespace http {

namespace {

inline unsigned char lowerAscii(char c) {
  return static_cast<unsigned char>(
      std::tolower(static_cast<unsigned char>(c)));
}

}  // namespace

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (lowerAscii(a[i]) != lowerAscii(b[i])) {
      return false;
    }
  }
  return true;
}

bool CaseInsensitiveLess::operator()(const std::string& a,
                                     const std::string& b) const {
  return std::lexicographical_compare(
      a.begin(), a.end(), b.begin(), b.end(),
      [](char x, char y) { return lowerAscii(x) < lowerAscii(y); });
}

optional<std::string> Headers::get(const std::string& name) const {
  auto it = headers_.find(name);
  if (it != headers_.end()) {
    return it->second;
  }
  return nullopt;
}

bool Headers::has(const std::string& name) const {
  return headers_.find(name) != headers_.end();
}

void Headers::set(const std::string& name, const std::string& value) {
  headers_[name] = value;
}

void Headers::remove(const std::string& name) { headers_.erase(name); }

bool Headers::operator==(const Headers& other) const {
  if (headers_.size() != other.headers_.size()) {
    return false;
  }
  for (const auto& header : headers_) {
    auto it = other.headers_.find(header.first);
    if (it == other.headers_.end() || it->second != header.second) {
      return false;
    }
  }
  return true;
}

}  // namespace http
}  // namespace reasm
