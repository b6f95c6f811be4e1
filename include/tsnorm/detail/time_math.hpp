// include/tsnorm/detail/time_math.hpp
#pragma once

#include <utility>

#include <cstdint>

namespace tsnorm::detail {

/**
 * Centralized integer arithmetic shared by the calendar, the decimal type
 * and the format engines.
 *
 * - Single source of truth for floor division (no divergence between types)
 * - Native tick counts are widened to 128-bit before scaling so that
 *   unsigned 64-bit counters never overflow during conversion
 */

using int128_t = __int128_t;
using uint128_t = __uint128_t;

/**
 * Floor division with a non-negative remainder.
 *
 * Mirrors mathematical divmod: -1 / 86400 -> {-1, 86399}.
 *
 * @param value Dividend (may be negative)
 * @param divisor Divisor (must be positive)
 * @return Pair of (quotient, remainder) where remainder is in [0, divisor)
 */
constexpr auto floor_divmod(int64_t value, int64_t divisor) noexcept
    -> std::pair<int64_t, int64_t> {
    int64_t quotient = value / divisor;
    int64_t remainder = value % divisor;
    if (remainder < 0) {
        remainder += divisor;
        --quotient;
    }
    return {quotient, remainder};
}

/// 128-bit variant of floor_divmod() for widened tick counts
constexpr auto floor_divmod(int128_t value, int128_t divisor) noexcept
    -> std::pair<int128_t, int128_t> {
    int128_t quotient = value / divisor;
    int128_t remainder = value % divisor;
    if (remainder < 0) {
        remainder += divisor;
        --quotient;
    }
    return {quotient, remainder};
}

/// 10^exponent for exponent in [0, 19]
constexpr uint64_t pow10(int exponent) noexcept {
    uint64_t result = 1;
    for (int i = 0; i < exponent; ++i) {
        result *= 10;
    }
    return result;
}

/**
 * Decimal exponent of an exact power of ten.
 *
 * @param value Candidate power of ten
 * @return Exponent, or -1 when value is not a power of ten
 */
constexpr int exact_log10(uint64_t value) noexcept {
    if (value == 0) {
        return -1;
    }
    int exponent = 0;
    while (value % 10 == 0) {
        value /= 10;
        ++exponent;
    }
    return value == 1 ? exponent : -1;
}

/**
 * Convert a fraction of second in nanoseconds to native ticks.
 *
 * Truncates when the format is coarser than a nanosecond.
 *
 * @param nanoseconds Nanoseconds in [0, 10^9)
 * @param ticks_per_second Native resolution of the format
 */
constexpr int128_t nanoseconds_to_ticks(int64_t nanoseconds,
                                        uint64_t ticks_per_second) noexcept {
    return static_cast<int128_t>(nanoseconds) * static_cast<int128_t>(ticks_per_second) /
           1'000'000'000;
}

} // namespace tsnorm::detail
