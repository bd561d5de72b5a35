#include "cca/utils/hash_utils.hpp"

namespace cca::hash_utils
{
    std::uint64_t fnv1a_hash(const std::string_view data) noexcept {
        constexpr std::uint64_t FNV_offset_basis = 14695981039346656037ULL;

        std::uint64_t hash = FNV_offset_basis;
        for (const char c : data) {
            constexpr std::uint64_t FNV_prime = 1099511628211ULL;
            hash ^= static_cast<std::uint64_t>(static_cast<unsigned char>(c));
            hash *= FNV_prime;
        }
        return hash;
    }

    std::string to_hex_string(std::uint64_t value) {
        static constexpr char digits[] = "0123456789abcdef";
        std::string result(16, '0');
        for (std::size_t i = 0; i < 16; ++i) {
            result[15 - i] = digits[value & 0xF];
            value >>= 4;
        }
        return result;
    }

    std::string content_hash(const std::string_view source) {
        return to_hex_string(fnv1a_hash(source));
    }

}  // namespace cca::hash_utils
