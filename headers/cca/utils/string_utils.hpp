#ifndef CCA_STRING_UTILS_HPP
#define CCA_STRING_UTILS_HPP

/**
 * @file string_utils.hpp
 * @brief String manipulation utilities.
 *
 * Trimming, splitting source text into lines, joining and number
 * formatting shared by the parser, the analyzer rules and the exporters.
 */

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

namespace cca::string_utils {

    /**
     * Trims whitespace from the beginning of a string.
     */
    inline std::string_view trim_left(std::string_view s) noexcept {
        const auto it = std::ranges::find_if(s, [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(static_cast<std::size_t>(it - s.begin()));
    }

    /**
     * Trims whitespace from the end of a string.
     */
    inline std::string_view trim_right(std::string_view s) noexcept {
        const auto it = std::find_if(s.rbegin(), s.rend(), [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(0, static_cast<std::size_t>(s.rend() - it));
    }

    inline std::string_view trim(const std::string_view s) noexcept {
        return trim_left(trim_right(s));
    }

    /**
     * Splits source text into lines.
     *
     * Accepts both "\n" and "\r\n" line endings. A trailing newline yields
     * a final empty line, so the line count of "a\n" is 2; line numbers
     * reported by the profiler are 1-based indices into this vector.
     *
     * @param text The source text.
     * @return Views into @p text, one per line, without terminators.
     */
    inline std::vector<std::string_view> split_lines(std::string_view text) {
        std::vector<std::string_view> lines;
        std::size_t start = 0;

        while (true) {
            const std::size_t end = text.find('\n', start);
            if (end == std::string_view::npos) {
                lines.push_back(text.substr(start));
                break;
            }
            std::size_t len = end - start;
            if (len > 0 && text[end - 1] == '\r') {
                --len;
            }
            lines.push_back(text.substr(start, len));
            start = end + 1;
        }
        return lines;
    }

    template<typename Container>
    std::string join(const Container& parts, const std::string_view delimiter) {
        std::string result;
        bool first = true;
        for (const auto& part : parts) {
            if (!first) {
                result += delimiter;
            }
            result += part;
            first = false;
        }
        return result;
    }

    inline bool contains(const std::string_view s, const std::string_view needle) noexcept {
        return s.find(needle) != std::string_view::npos;
    }

    /**
     * Replaces every occurrence of @p from with @p to.
     */
    inline std::string replace_all(std::string s, const std::string_view from, const std::string_view to) {
        if (from.empty()) {
            return s;
        }
        std::size_t pos = 0;
        while ((pos = s.find(from, pos)) != std::string::npos) {
            s.replace(pos, from.size(), to);
            pos += to.size();
        }
        return s;
    }

    inline std::string to_lower(std::string_view s) {
        std::string result(s);
        std::ranges::transform(result, result.begin(), [](const unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return result;
    }

    /**
     * Formats a number with a fixed count of decimals ("12.35").
     */
    inline std::string format_fixed(const double value, const int decimals) {
        char buffer[64];
        std::snprintf(buffer, sizeof(buffer), "%.*f", decimals, value);
        return buffer;
    }

    /**
     * Formats an integer with thousands separators ("1,234,567").
     */
    inline std::string format_thousands(const std::int64_t value) {
        std::string digits = std::to_string(value < 0 ? -value : value);
        for (std::size_t pos = digits.size(); pos > 3; pos -= 3) {
            digits.insert(pos - 3, ",");
        }
        return value < 0 ? "-" + digits : digits;
    }

}  // namespace cca::string_utils

#endif //CCA_STRING_UTILS_HPP
