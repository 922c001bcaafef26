#include <cxxcookie.hxx>

namespace cxxcookie::http {
    namespace {
        /** @brief Expiry written by cookie_t::expire(). */
        const boost::posix_time::ptime k_earliest_expiry{boost::gregorian::date(1900, 1, 1)};

        // characters that would break the "name=value; Attr=Val" grammar
        CXXCOOKIE_INLINE bool breaks_grammar(const std::string_view& str) {
            return str.find(';') != std::string_view::npos || utils::has_ctl(str);
        }

        std::string_view checked_name(const std::string_view& name) {
            const auto trimmed = utils::trim(name);

            if (trimmed.empty())
                throw exceptions::invalid_operation_t("Cookie name must not be empty");

            if (breaks_grammar(trimmed) || trimmed.find('=') != std::string_view::npos)
                throw exceptions::invalid_operation_t(fmt::format("Invalid cookie name '{}'", trimmed));

            return trimmed;
        }

        std::string_view checked_value(const std::string_view& value) {
            const auto trimmed = utils::trim(value);

            if (breaks_grammar(trimmed))
                throw exceptions::invalid_operation_t(fmt::format("Invalid cookie value '{}'", trimmed));

            return trimmed;
        }

        std::optional<std::int64_t> parse_max_age(const std::string_view& str) {
            // RFC 6265 5.2.2: first char is a DIGIT or '-', the rest are DIGITs
            const auto digits = (!str.empty() && str.front() == '-') ? str.substr(1u) : str;

            if (digits.empty()
                || std::any_of(digits.begin(), digits.end(), [](const char c) { return c < '0' || c > '9'; }))
                return std::nullopt;

            std::int64_t value{};

            if (auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value); ec != std::errc() || ptr != str.data() + str.size())
                return std::nullopt;

            return value;
        }

        bool accepts(const e_attribute& attribute, const std::string_view& value) {
            switch (attribute) {
                case e_attribute::max_age:
                    return parse_max_age(value).has_value();

                case e_attribute::expires:
                    return utils::parse_cookie_date(value).has_value();

                case e_attribute::same_site:
                    return str_to_same_site(value).has_value();

                case e_attribute::path:
                    return value.front() == '/';

                default:
                    return true;
            }
        }
    }

    cookie_t::cookie_t(const std::string_view& name, const std::string_view& value) {
        const auto checked = checked_name(name);

        m_index.reset(m_buffer, checked, checked_value(value));
    }

    cookie_t cookie_t::parse(const std::string_view& raw, const parse_cfg_t& cfg) {
        if (utils::has_ctl(raw))
            throw exceptions::malformed_cookie_t("Cookie contains a control character");

        auto pos = raw.find(';');

        const auto pair = raw.substr(0u, pos);

        const auto eq_pos = pair.find('=');

        if (eq_pos == std::string_view::npos)
            throw exceptions::malformed_cookie_t(fmt::format("Cookie pair '{}' has no '='", utils::trim(pair)));

        const auto name = utils::trim(pair.substr(0u, eq_pos));
        const auto value = utils::trim(pair.substr(eq_pos + 1u));

        if (name.empty())
            throw exceptions::malformed_cookie_t("Cookie name is empty");

        if (cfg.m_max_pair_size > 0u && name.size() + value.size() > cfg.m_max_pair_size)
            throw exceptions::malformed_cookie_t(
                fmt::format("Cookie pair is {} bytes, limit is {}", name.size() + value.size(), cfg.m_max_pair_size)
            );

        cookie_t cookie(name, value);

        while (pos != std::string_view::npos) {
            const auto start = pos + 1u;

            pos = raw.find(';', start);

            const auto segment = utils::trim(raw.substr(start, pos == std::string_view::npos ? std::string_view::npos : pos - start));

            if (segment.empty())
                continue;

            const auto attr_eq = segment.find('=');

            const auto attr_name = utils::trim(segment.substr(0u, attr_eq));
            const auto attr_value = attr_eq == std::string_view::npos ? std::string_view{} : utils::trim(segment.substr(attr_eq + 1u));

            const auto attribute = recognize(attr_name);

            if (!attribute.has_value()) {
#ifdef CXXCOOKIE_USE_LOGGING_IMPL
                g_logging->log(e_log_level::debug, "[Cookie] Dropping unrecognized attribute '{}' of '{}'", attr_name, name);
#endif // CXXCOOKIE_USE_LOGGING_IMPL

                continue;
            }

            if (cfg.m_max_attribute_value_size > 0u && attr_value.size() > cfg.m_max_attribute_value_size) {
#ifdef CXXCOOKIE_USE_LOGGING_IMPL
                g_logging->log(
                    e_log_level::debug, "[Cookie] Dropping {} of '{}': value is {} bytes", attribute_to_str(*attribute), name, attr_value.size()
                );
#endif // CXXCOOKIE_USE_LOGGING_IMPL

                continue;
            }

            cookie.set_attribute(*attribute, attr_value);
        }

        if (cfg.m_strict_prefixes && !cookie.has_valid_prefix())
            throw exceptions::malformed_cookie_t(fmt::format("Cookie '{}' violates its name prefix requirements", cookie.name()));

        return cookie;
    }

    std::optional<cookie_t> cookie_t::try_parse(const std::string_view& raw, const parse_cfg_t& cfg) {
        try {
            return parse(raw, cfg);
        }
        catch (const exceptions::malformed_cookie_t& e) {
#ifdef CXXCOOKIE_USE_LOGGING_IMPL
            g_logging->log(e_log_level::debug, "[Cookie] {}", e.what());
#endif // CXXCOOKIE_USE_LOGGING_IMPL

            return std::nullopt;
        }
    }

    std::vector<e_attribute> cookie_t::attributes() const {
        std::vector<e_attribute> ret{};

        ret.reserve(m_index.entries().size());

        for (const auto& entry : m_index.entries()) {
            if (const auto attribute = to_attribute(entry.m_field); attribute.has_value())
                ret.push_back(*attribute);
        }

        return ret;
    }

    cookie_t& cookie_t::set_name(const std::string_view& name) {
        m_index.set(m_buffer, e_field::name, checked_name(name));

        return *this;
    }

    cookie_t& cookie_t::set_value(const std::string_view& value) {
        m_index.set(m_buffer, e_field::value, checked_value(value));

        return *this;
    }

    cookie_t& cookie_t::set_attribute(const e_attribute& attribute, const std::string_view& value) {
        const auto field = to_field(attribute);

        if (is_flag(attribute)) {
            m_index.set(m_buffer, field, {});

            return *this;
        }

        const auto trimmed = utils::trim(value);

        if (breaks_grammar(trimmed))
            throw exceptions::invalid_operation_t(
                fmt::format("Invalid value '{}' for attribute {}", trimmed, attribute_to_str(attribute))
            );

        if (trimmed.empty()) {
            m_index.remove(m_buffer, field);

            return *this;
        }

        if (!accepts(attribute, trimmed)) {
#ifdef CXXCOOKIE_USE_LOGGING_IMPL
            g_logging->log(e_log_level::debug, "[Cookie] Ignoring {}='{}' on '{}'", attribute_to_str(attribute), trimmed, name());
#endif // CXXCOOKIE_USE_LOGGING_IMPL

            return *this;
        }

        m_index.set(m_buffer, field, trimmed);

        return *this;
    }

    cookie_t& cookie_t::set_attribute(const std::string_view& name, const std::string_view& value) {
        const auto attribute = recognize(utils::trim(name));

        if (!attribute.has_value())
            return *this;

        return set_attribute(*attribute, value);
    }

    cookie_t& cookie_t::remove_attribute(const std::string_view& name) {
        const auto trimmed = utils::trim(name);

        if (boost::iequals(trimmed, "name"))
            return remove(e_field::name);

        if (boost::iequals(trimmed, "value"))
            return remove(e_field::value);

        const auto attribute = recognize(trimmed);

        if (!attribute.has_value())
            return *this;

        return remove_attribute(*attribute);
    }

    cookie_t& cookie_t::remove(const e_field& field) {
        m_index.remove(m_buffer, field);

        return *this;
    }

    std::optional<std::chrono::seconds> cookie_t::max_age() const {
        const auto str = get_attribute(e_attribute::max_age);

        if (!str.has_value())
            return std::nullopt;

        const auto value = parse_max_age(*str);

        if (!value.has_value())
            return std::nullopt;

        return std::chrono::seconds{*value};
    }

    cookie_t& cookie_t::set_max_age(const std::chrono::seconds& max_age) {
        return set_attribute(e_attribute::max_age, fmt::format("{}", max_age.count()));
    }

    std::optional<boost::posix_time::ptime> cookie_t::expires() const {
        const auto str = get_attribute(e_attribute::expires);

        if (!str.has_value())
            return std::nullopt;

        return utils::parse_cookie_date(*str);
    }

    cookie_t& cookie_t::set_expires(const boost::posix_time::ptime& expires) {
        if (expires.is_special())
            throw exceptions::invalid_operation_t("Expires requires a concrete time");

        if (expires.date().year() < utils::k_min_cookie_year)
            throw exceptions::invalid_operation_t(
                fmt::format("Expires year {} is before {}", static_cast<std::int32_t>(expires.date().year()), utils::k_min_cookie_year)
            );

        return set_attribute(e_attribute::expires, utils::format_cookie_date(expires));
    }

    cookie_t& cookie_t::expire() {
        if (has_attribute(e_attribute::max_age))
            set_max_age(std::chrono::seconds{0});

        return set_expires(k_earliest_expiry);
    }

    std::optional<e_same_site> cookie_t::same_site() const {
        const auto str = get_attribute(e_attribute::same_site);

        if (!str.has_value())
            return std::nullopt;

        return str_to_same_site(*str);
    }

    bool cookie_t::has_valid_prefix() const {
        const auto cookie_name = name();

        if (cookie_name.rfind("__Secure-", 0u) == 0u)
            return secure();

        if (cookie_name.rfind("__Host-", 0u) == 0u)
            return secure() && !has_attribute(e_attribute::domain) && path() == std::optional<std::string_view>{"/"};

        return true;
    }

    void cookie_t::validate_prefix() const {
        if (!has_valid_prefix())
            throw exceptions::invalid_operation_t(
                fmt::format("Cookie '{}' requires Secure{}", name(), name().rfind("__Host-", 0u) == 0u ? ", no Domain and Path=/" : "")
            );
    }
}
