#pragma once

#include <type_traits>
#include <utility>

namespace spf {
namespace util {

// Detect an optional `reset()` member: present on stateful components only.

template <typename Impl, typename = void>
struct has_reset: std::false_type {};

template <typename Impl>
struct has_reset<Impl, std::void_t<decltype(std::declval<Impl&>().reset())>>: std::true_type {};

template <typename Impl>
inline constexpr bool has_reset_v = has_reset<Impl>::value;

} // namespace util
} // namespace spf
