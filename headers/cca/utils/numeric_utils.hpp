#ifndef CCA_NUMERIC_UTILS_HPP
#define CCA_NUMERIC_UTILS_HPP

/**
 * @file numeric_utils.hpp
 * @brief Saturating arithmetic for cost counters.
 *
 * Costs come from external profiler text and may be as large as INT64_MAX,
 * so sums and products clamp to the representable range instead of
 * wrapping.
 */

#include <cmath>
#include <cstdint>
#include <limits>

namespace cca::numeric_utils {

    inline constexpr std::int64_t INT64_MAX_VALUE = std::numeric_limits<std::int64_t>::max();
    inline constexpr std::int64_t INT64_MIN_VALUE = std::numeric_limits<std::int64_t>::min();

    [[nodiscard]] constexpr std::int64_t saturating_add(const std::int64_t a, const std::int64_t b) noexcept {
        if (b > 0 && a > INT64_MAX_VALUE - b) {
            return INT64_MAX_VALUE;
        }
        if (b < 0 && a < INT64_MIN_VALUE - b) {
            return INT64_MIN_VALUE;
        }
        return a + b;
    }

    [[nodiscard]] constexpr std::int64_t saturating_mul(const std::int64_t a, const std::int64_t b) noexcept {
        if (a == 0 || b == 0) {
            return 0;
        }
        const bool negative = (a < 0) != (b < 0);
        if (a == INT64_MIN_VALUE || b == INT64_MIN_VALUE) {
            return negative ? INT64_MIN_VALUE : INT64_MAX_VALUE;
        }
        const std::int64_t abs_a = a < 0 ? -a : a;
        const std::int64_t abs_b = b < 0 ? -b : b;
        if (abs_a > INT64_MAX_VALUE / abs_b) {
            return negative ? INT64_MIN_VALUE : INT64_MAX_VALUE;
        }
        return a * b;
    }

    /**
     * floor(value * factor), clamped to the int64 range. NaN yields 0.
     */
    [[nodiscard]] inline std::int64_t scale(const std::int64_t value, const double factor) noexcept {
        const double scaled = std::floor(static_cast<double>(value) * factor);
        if (std::isnan(scaled)) {
            return 0;
        }
        // 2^63 is exactly representable; anything at or above it does not fit
        if (scaled >= 9223372036854775808.0) {
            return INT64_MAX_VALUE;
        }
        if (scaled < -9223372036854775808.0) {
            return INT64_MIN_VALUE;
        }
        return static_cast<std::int64_t>(scaled);
    }

}  // namespace cca::numeric_utils

#endif //CCA_NUMERIC_UTILS_HPP
