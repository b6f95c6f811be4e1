#pragma once

#include "tsnorm/detail/time_math.hpp"

#include <algorithm>
#include <compare>
#include <string>

#include <cstdint>

namespace tsnorm {

/**
 * Exact signed decimal number.
 *
 * ## Storage
 * 128-bit integer units plus a power-of-ten scale:
 * value = units / 10^scale.
 *
 * ## Exactness
 * Every normalized timestamp is a native tick count divided by a power of
 * ten, minus whole seconds. Both steps are exact in this representation, so
 * two equal inputs always produce bit-identical results. No operation goes
 * through binary floating point except the explicit to_double().
 *
 * ## Range
 * Scale is limited to [0, max_scale]. With 128-bit units the integer part
 * covers far more than any 64-bit tick counter at nanosecond scale.
 */
class Decimal {
public:
    static constexpr int max_scale = 18;

    constexpr Decimal() noexcept = default;

    /// Whole number
    constexpr Decimal(int64_t value) noexcept // NOLINT(google-explicit-constructor)
        : units_(value),
          scale_(0) {}

    /**
     * Build from a scaled integer.
     *
     * @tparam Scale Number of fraction digits in [0, max_scale]
     * @param units Value multiplied by 10^Scale
     */
    template <int Scale>
    static constexpr Decimal from_units(detail::int128_t units) noexcept {
        static_assert(Scale >= 0 && Scale <= max_scale, "Decimal scale out of range");
        return Decimal(units, Scale);
    }

    constexpr detail::int128_t units() const noexcept { return units_; }
    constexpr int scale() const noexcept { return scale_; }

    constexpr bool is_zero() const noexcept { return units_ == 0; }
    constexpr bool is_negative() const noexcept { return units_ < 0; }

    /// Largest integer not greater than the value
    constexpr detail::int128_t floor() const noexcept {
        return detail::floor_divmod(units_, pow10_wide(scale_)).first;
    }

    /**
     * Value expressed in units of 10^-scale, rounded toward negative infinity.
     *
     * Used to read the value at a coarser or finer resolution, for example
     * rescaled(6) yields microseconds.
     */
    constexpr detail::int128_t rescaled(int scale) const noexcept {
        scale = std::clamp(scale, 0, max_scale);
        if (scale >= scale_) {
            return units_ * pow10_wide(scale - scale_);
        }
        return detail::floor_divmod(units_, pow10_wide(scale_ - scale)).first;
    }

    /// Same value at a finer scale
    constexpr Decimal with_scale(int scale) const noexcept {
        scale = std::clamp(scale, 0, max_scale);
        if (scale <= scale_) {
            return *this;
        }
        return Decimal(units_ * pow10_wide(scale - scale_), scale);
    }

    /// Lossy conversion for display and plotting
    constexpr double to_double() const noexcept {
        return static_cast<double>(units_) / static_cast<double>(detail::pow10(scale_));
    }

    /**
     * Canonical decimal string.
     *
     * Trailing fraction zeros are removed and the decimal point is omitted
     * for whole numbers: "1281643591", "1281643591.429876", "-0.5".
     */
    std::string to_string() const {
        detail::uint128_t magnitude = units_ < 0 ? detail::uint128_t(0) - detail::uint128_t(units_)
                                                 : detail::uint128_t(units_);
        int scale = scale_;
        while (scale > 0 && magnitude % 10 == 0) {
            magnitude /= 10;
            --scale;
        }

        std::string digits;
        do {
            digits.push_back(static_cast<char>('0' + static_cast<int>(magnitude % 10)));
            magnitude /= 10;
        } while (magnitude != 0);
        while (static_cast<int>(digits.size()) <= scale) {
            digits.push_back('0');
        }
        if (scale > 0) {
            digits.insert(digits.begin() + scale, '.');
        }
        if (units_ < 0) {
            digits.push_back('-');
        }
        std::reverse(digits.begin(), digits.end());
        return digits;
    }

    // Arithmetic is exact: operands are brought to the finer scale first
    friend constexpr Decimal operator+(Decimal lhs, Decimal rhs) noexcept {
        const int scale = std::max(lhs.scale_, rhs.scale_);
        return Decimal(lhs.with_scale(scale).units_ + rhs.with_scale(scale).units_, scale);
    }

    friend constexpr Decimal operator-(Decimal lhs, Decimal rhs) noexcept {
        const int scale = std::max(lhs.scale_, rhs.scale_);
        return Decimal(lhs.with_scale(scale).units_ - rhs.with_scale(scale).units_, scale);
    }

    constexpr Decimal operator-() const noexcept { return Decimal(-units_, scale_); }

    constexpr Decimal& operator+=(Decimal other) noexcept { return *this = *this + other; }
    constexpr Decimal& operator-=(Decimal other) noexcept { return *this = *this - other; }

    // Comparison by value: 1.50 == 1.5
    friend constexpr bool operator==(Decimal lhs, Decimal rhs) noexcept {
        const int scale = std::max(lhs.scale_, rhs.scale_);
        return lhs.with_scale(scale).units_ == rhs.with_scale(scale).units_;
    }

    friend constexpr std::strong_ordering operator<=>(Decimal lhs, Decimal rhs) noexcept {
        const int scale = std::max(lhs.scale_, rhs.scale_);
        const detail::int128_t a = lhs.with_scale(scale).units_;
        const detail::int128_t b = rhs.with_scale(scale).units_;
        if (a < b) {
            return std::strong_ordering::less;
        }
        if (a > b) {
            return std::strong_ordering::greater;
        }
        return std::strong_ordering::equal;
    }

private:
    constexpr Decimal(detail::int128_t units, int scale) noexcept
        : units_(units),
          scale_(scale) {}

    static constexpr detail::int128_t pow10_wide(int exponent) noexcept {
        return static_cast<detail::int128_t>(detail::pow10(exponent));
    }

    detail::int128_t units_{0};
    int scale_{0};
};

} // namespace tsnorm
