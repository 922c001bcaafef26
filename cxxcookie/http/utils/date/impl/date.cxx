#include <cxxcookie.hxx>

namespace cxxcookie::http::utils {
    namespace {
        /** @brief Month prefixes in calendar order. */
        constexpr std::array<std::string_view, 12u> k_months{
            "jan", "feb", "mar", "apr", "may", "jun",
            "jul", "aug", "sep", "oct", "nov", "dec"
        };

        CXXCOOKIE_INLINE constexpr bool is_digit(const char c) { return c >= '0' && c <= '9'; }

        /**
         * @brief Check the delimiter class of RFC 6265 section 5.1.1.
         * @param c Character to check.
         * @return True for %x09 / %x20-2F / %x3B-40 / %x5B-60 / %x7B-7E.
         */
        CXXCOOKIE_INLINE constexpr bool is_delimiter(const char c) {
            const auto u = static_cast<std::uint8_t>(c);

            return u == 0x09u
                   || (u >= 0x20u && u <= 0x2Fu)
                   || (u >= 0x3Bu && u <= 0x40u)
                   || (u >= 0x5Bu && u <= 0x60u)
                   || (u >= 0x7Bu && u <= 0x7Eu);
        }

        /**
         * @brief Read between min and max digits.
         * @return Parsed number and the position after the digits.
         */
        std::optional<std::pair<std::int32_t, std::size_t>> read_digits(
            const std::string_view& token,

            std::size_t pos,

            const std::size_t min,
            const std::size_t max
        ) {
            std::int32_t value{};
            std::size_t count{};

            while (pos < token.size() && count < max && is_digit(token[pos])) {
                value = value * 10 + (token[pos] - '0');

                ++pos;
                ++count;
            }

            if (count < min)
                return std::nullopt;

            return std::make_pair(value, pos);
        }

        // a field ends at the end of the token or at a non-digit
        CXXCOOKIE_INLINE constexpr bool field_ends(const std::string_view& token, const std::size_t pos) {
            return pos >= token.size() || !is_digit(token[pos]);
        }

        bool match_time(const std::string_view& token, std::int32_t& hour, std::int32_t& minute, std::int32_t& second) {
            std::array<std::int32_t, 3u> parts{};

            std::size_t pos{};

            for (std::size_t i{}; i < parts.size(); i++) {
                if (i > 0u) {
                    if (pos >= token.size() || token[pos] != ':')
                        return false;

                    ++pos;
                }

                const auto field = read_digits(token, pos, 1u, 2u);

                if (!field.has_value())
                    return false;

                parts[i] = field->first;
                pos = field->second;
            }

            if (!field_ends(token, pos))
                return false;

            hour = parts[0];
            minute = parts[1];
            second = parts[2];

            return true;
        }

        bool match_number(const std::string_view& token, const std::size_t min, const std::size_t max, std::int32_t& out) {
            const auto field = read_digits(token, 0u, min, max);

            if (!field.has_value() || !field_ends(token, field->second))
                return false;

            out = field->first;

            return true;
        }

        bool match_month(const std::string_view& token, std::int32_t& month) {
            if (token.size() < 3u)
                return false;

            for (std::size_t i{}; i < k_months.size(); i++) {
                if (boost::iequals(token.substr(0u, 3u), k_months[i])) {
                    month = static_cast<std::int32_t>(i) + 1;

                    return true;
                }
            }

            return false;
        }
    }

    std::optional<boost::posix_time::ptime> parse_cookie_date(const std::string_view& str) {
        bool found_time{}, found_day{}, found_month{}, found_year{};

        std::int32_t hour{}, minute{}, second{}, day{}, month{}, year{};

        std::size_t pos{};

        while (pos < str.size()) {
            while (pos < str.size() && is_delimiter(str[pos]))
                ++pos;

            const auto start = pos;

            while (pos < str.size() && !is_delimiter(str[pos]))
                ++pos;

            if (start == pos)
                continue;

            const auto token = str.substr(start, pos - start);

            if (!found_time && match_time(token, hour, minute, second))
                found_time = true;
            else if (!found_day && match_number(token, 1u, 2u, day))
                found_day = true;
            else if (!found_month && match_month(token, month))
                found_month = true;
            else if (!found_year && match_number(token, 2u, 4u, year))
                found_year = true;
        }

        if (!found_time || !found_day || !found_month || !found_year)
            return std::nullopt;

        if (year >= 70 && year <= 99)
            year += 1900;
        else if (year >= 0 && year <= 69)
            year += 2000;

        if (day < 1 || day > 31
            || year < k_min_cookie_year
            || hour > 23
            || minute > 59
            || second > 59)
            return std::nullopt;

        try {
            const boost::gregorian::date date(
                static_cast<unsigned short>(year),
                static_cast<unsigned short>(month),
                static_cast<unsigned short>(day)
            );

            return boost::posix_time::ptime(date, boost::posix_time::time_duration(hour, minute, second));
        }
        catch (const std::out_of_range&) {
            // day outside the month, e.g. 30 Feb
            return std::nullopt;
        }
    }

    std::string format_cookie_date(const boost::posix_time::ptime& time) {
        if (time.is_special())
            throw exceptions::invalid_operation_t("Cannot format a special time value as a cookie-date");

        const auto date = time.date();
        const auto tod = time.time_of_day();

        return fmt::format(
            "{}, {:02} {} {:04} {:02}:{:02}:{:02} GMT",

            date.day_of_week().as_short_string(),

            static_cast<std::int32_t>(date.day()),

            date.month().as_short_string(),

            static_cast<std::int32_t>(date.year()),

            tod.hours(),
            tod.minutes(),
            tod.seconds()
        );
    }
}
