/**
 * @file date.hxx
 * @brief Parsing and formatting of the Expires cookie-date.
 */

#ifndef CXXCOOKIE_HTTP_UTILS_DATE_HXX
#define CXXCOOKIE_HTTP_UTILS_DATE_HXX

namespace cxxcookie::http::utils {
    /** @brief Earliest year a cookie-date may carry. */
    inline constexpr std::int32_t k_min_cookie_year = 1601;

    /**
     * @brief Parse a cookie-date as described in RFC 6265 section 5.1.1.
     * @param str Attribute value, e.g. "Sun, 06 Nov 1994 08:49:37 GMT".
     * @return UTC time, or nullopt when the date is not acceptable.
     *
     * Tolerant of the formats seen in the wild: tokens are recognized in
     * any order and two-digit years are mapped to 1970-2069.
     */
    std::optional<boost::posix_time::ptime> parse_cookie_date(const std::string_view& str);

    /**
     * @brief Format a time as an RFC 1123 date.
     * @param time UTC time, must not be a special value.
     * @return "Wdy, DD Mon YYYY HH:MM:SS GMT".
     */
    std::string format_cookie_date(const boost::posix_time::ptime& time);
}

#endif // CXXCOOKIE_HTTP_UTILS_DATE_HXX
