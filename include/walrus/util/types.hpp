#ifndef WALRUS_UTIL_TYPES_HPP
#define WALRUS_UTIL_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <optional>

namespace walrus::util {

using TimePoint = std::chrono::steady_clock::time_point;
using Duration = std::chrono::milliseconds;

// absent means "never expires"
using Expiration = std::optional<TimePoint>;

}  // namespace walrus::util

#endif
