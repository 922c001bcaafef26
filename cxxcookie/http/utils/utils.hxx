/**
 * @file utils.hxx
 * @brief Aggregates HTTP utility headers for the slice index and cookie dates in the cxxcookie.
 */

#ifndef CXXCOOKIE_HTTP_UTILS_HXX
#define CXXCOOKIE_HTTP_UTILS_HXX

#include "internal/internal.hxx"

#include "date/date.hxx"

namespace cxxcookie::http::utils {
    /**
     * @brief Computes the 32-bit FNV-1a hash for the given string.
     * @param str Input string to hash.
     * @return 32-bit FNV-1a hash value.
     *
     * Implements the Fowler–Noll–Vo hash function variant 1a.
     * Designed for fast, non-cryptographic hashing.
     */
    CXXCOOKIE_INLINE constexpr std::uint32_t fnv1a_hash(const std::string_view str) {
        std::uint32_t hash = 2166136261u;

        for (const auto c : str) {
            hash ^= static_cast<std::uint8_t>(c);
            hash *= 16777619u;
        }

        return hash;
    }

    /**
     * @brief Strip leading and trailing SP and HTAB.
     * @param str Input view.
     * @return Trimmed view into the same storage.
     */
    CXXCOOKIE_INLINE constexpr std::string_view trim(std::string_view str) {
        str.remove_prefix(std::min(str.find_first_not_of(" \t"), str.size()));

        const auto last = str.find_last_not_of(" \t");

        str.remove_suffix(last == std::string_view::npos ? str.size() : str.size() - last - 1u);

        return str;
    }

    /**
     * @brief Check for control characters other than HTAB.
     * @param str Input view.
     * @return True if %x00-08, %x0A-1F or %x7F occurs.
     */
    CXXCOOKIE_INLINE constexpr bool has_ctl(const std::string_view str) {
        for (const auto c : str) {
            const auto u = static_cast<std::uint8_t>(c);

            if ((u < 0x20u && u != 0x09u) || u == 0x7Fu)
                return true;
        }

        return false;
    }
}

#endif // CXXCOOKIE_HTTP_UTILS_HXX
