#include <cxxcookie.hxx>

namespace cxxcookie::http {
    namespace {
        std::optional<e_attribute> lookup(const std::string_view& lowered) {
            switch (utils::fnv1a_hash(lowered)) {
                case utils::fnv1a_hash("expires"):
                    return e_attribute::expires;

                case utils::fnv1a_hash("max-age"):
                    return e_attribute::max_age;

                case utils::fnv1a_hash("domain"):
                    return e_attribute::domain;

                case utils::fnv1a_hash("path"):
                    return e_attribute::path;

                case utils::fnv1a_hash("secure"):
                    return e_attribute::secure;

                case utils::fnv1a_hash("httponly"):
                    return e_attribute::http_only;

                case utils::fnv1a_hash("samesite"):
                    return e_attribute::same_site;

                default:
                    return std::nullopt;
            }
        }
    }

    std::optional<e_attribute> recognize(const std::string_view& name) {
        const auto lowered = boost::algorithm::to_lower_copy(std::string{name});

        const auto attribute = lookup(lowered);

        // rule out hash collisions
        if (!attribute.has_value() || !boost::iequals(attribute_to_str(*attribute), lowered))
            return std::nullopt;

        return attribute;
    }

    std::optional<e_same_site> str_to_same_site(const std::string_view& str) {
        if (boost::iequals(str, "strict"))
            return e_same_site::strict;

        if (boost::iequals(str, "lax"))
            return e_same_site::lax;

        if (boost::iequals(str, "none"))
            return e_same_site::none;

        return std::nullopt;
    }
}
