#ifndef REASM_COMPAT_H
#define REASM_COMPAT_H

// Vocabulary types used across the library. The build requires C++17, so
// these resolve to the standard library versions.

#include <cstddef>
#include <optional>
#include <type_traits>

namespace reasm {

template <typename T>
using optional = std::optional<T>;

using nullopt_t = std::nullopt_t;
inline constexpr auto nullopt = std::nullopt;

using bad_optional_access = std::bad_optional_access;

using std::make_optional;

}  // namespace reasm

#endif  // REASM_COMPAT_H
