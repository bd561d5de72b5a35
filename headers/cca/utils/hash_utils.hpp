#ifndef CCA_HASH_UTILS_HPP
#define CCA_HASH_UTILS_HPP

/**
 * @file hash_utils.hpp
 * @brief Non-cryptographic hashing used for cache keys.
 */

#include <cstdint>
#include <string>
#include <string_view>

namespace cca::hash_utils {

    /**
     * Compute the FNV-1a hash (64-bit) of the input data.
     */
    [[nodiscard]] std::uint64_t fnv1a_hash(std::string_view data) noexcept;

    /**
     * Formats a 64-bit value as 16 lowercase hex digits.
     */
    [[nodiscard]] std::string to_hex_string(std::uint64_t value);

    /**
     * Content hash of source text: hex FNV-1a over the exact bytes.
     *
     * Whitespace-sensitive; two sources differing only in trailing spaces
     * hash differently.
     */
    [[nodiscard]] std::string content_hash(std::string_view source);

}  // namespace cca::hash_utils

#endif //CCA_HASH_UTILS_HPP
