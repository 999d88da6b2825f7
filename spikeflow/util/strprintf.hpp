#pragma once

// printf-like routines that return std::string.

#include <string>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace spf {
namespace util {

// Substitute instances of '{}' in the format string with the following parameters,
// using {fmt} formatting. Ranges such as shapes print as "[2, 3]".

template <typename... Args>
std::string pprintf(const char* s, Args&&... args) {
    return fmt::format(fmt::runtime(s), std::forward<Args>(args)...);
}

} // namespace util
} // namespace spf
