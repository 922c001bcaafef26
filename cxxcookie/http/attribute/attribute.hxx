/**
 * @file attribute.hxx
 * @brief Closed set of recognized cookie attributes and their name lookup.
 */

#ifndef CXXCOOKIE_HTTP_ATTRIBUTE_HXX
#define CXXCOOKIE_HTTP_ATTRIBUTE_HXX

namespace cxxcookie::http {
    /**
     * @brief Cookie attributes understood by RFC 6265.
     *
     * Anything else is dropped on parse and ignored on set.
     */
    enum struct e_attribute : std::int16_t {
        expires,   ///< Expires=<cookie-date>
        max_age,   ///< Max-Age=<delta-seconds>
        domain,    ///< Domain=<domain>
        path,      ///< Path=<path>
        secure,    ///< Secure flag
        http_only, ///< HttpOnly flag
        same_site  ///< SameSite=Strict|Lax|None
    };

    /**
     * @brief Every field a cookie buffer can hold.
     */
    enum struct e_field : std::int16_t {
        name,      ///< Cookie name (mandatory)
        value,     ///< Cookie value (mandatory)
        expires,   ///< Expires attribute
        max_age,   ///< Max-Age attribute
        domain,    ///< Domain attribute
        path,      ///< Path attribute
        secure,    ///< Secure flag
        http_only, ///< HttpOnly flag
        same_site  ///< SameSite attribute
    };

    /**
     * @brief Values accepted by the SameSite attribute.
     */
    enum struct e_same_site : std::int16_t {
        strict, ///< Sent only with same-site requests
        lax,    ///< Also sent on top-level navigations
        none    ///< Sent with cross-site requests (requires Secure)
    };

    /** @brief Number of recognized attributes. */
    inline constexpr std::size_t k_attributes_count = 7u;

    /**
     * @brief Convert an attribute to its canonical serialized name.
     * @param attribute Attribute enum value.
     * @return Name as written into the buffer.
     */
    CXXCOOKIE_INLINE constexpr std::string_view attribute_to_str(const e_attribute& attribute) {
        switch (attribute) {
            case e_attribute::expires:
                return "Expires";
            case e_attribute::max_age:
                return "Max-Age";
            case e_attribute::domain:
                return "Domain";
            case e_attribute::path:
                return "Path";
            case e_attribute::secure:
                return "Secure";
            case e_attribute::http_only:
                return "HttpOnly";
            case e_attribute::same_site:
                return "SameSite";
        }

        return "";
    }

    /**
     * @brief Check whether an attribute is a valueless flag.
     * @param attribute Attribute enum value.
     * @return True for Secure and HttpOnly.
     */
    CXXCOOKIE_INLINE constexpr bool is_flag(const e_attribute& attribute) {
        return attribute == e_attribute::secure || attribute == e_attribute::http_only;
    }

    /**
     * @brief Map an attribute to the field it occupies in the buffer.
     * @param attribute Attribute enum value.
     * @return Matching field.
     */
    CXXCOOKIE_INLINE constexpr e_field to_field(const e_attribute& attribute) {
        switch (attribute) {
            case e_attribute::expires:
                return e_field::expires;
            case e_attribute::max_age:
                return e_field::max_age;
            case e_attribute::domain:
                return e_field::domain;
            case e_attribute::path:
                return e_field::path;
            case e_attribute::secure:
                return e_field::secure;
            case e_attribute::http_only:
                return e_field::http_only;
            case e_attribute::same_site:
                return e_field::same_site;
        }

        return e_field::name;
    }

    /**
     * @brief Map a field back to its attribute.
     * @param field Field enum value.
     * @return Attribute, or nullopt for name and value.
     */
    CXXCOOKIE_INLINE constexpr std::optional<e_attribute> to_attribute(const e_field& field) {
        switch (field) {
            case e_field::expires:
                return e_attribute::expires;
            case e_field::max_age:
                return e_attribute::max_age;
            case e_field::domain:
                return e_attribute::domain;
            case e_field::path:
                return e_attribute::path;
            case e_field::secure:
                return e_attribute::secure;
            case e_field::http_only:
                return e_attribute::http_only;
            case e_field::same_site:
                return e_attribute::same_site;
            default:
                return std::nullopt;
        }
    }

    /**
     * @brief Convert a SameSite value to its canonical string.
     * @param same_site SameSite enum value.
     * @return "Strict", "Lax" or "None".
     */
    CXXCOOKIE_INLINE constexpr std::string_view same_site_to_str(const e_same_site& same_site) {
        switch (same_site) {
            case e_same_site::strict:
                return "Strict";
            case e_same_site::lax:
                return "Lax";
            case e_same_site::none:
                return "None";
        }

        return "";
    }

    /**
     * @brief Look up a recognized attribute by name, case-insensitively.
     * @param name Attribute name as found in a cookie-av.
     * @return The attribute, or nullopt when the name is not recognized.
     */
    std::optional<e_attribute> recognize(const std::string_view& name);

    /**
     * @brief Parse a SameSite value, case-insensitively.
     * @param str Attribute value.
     * @return The SameSite value, or nullopt when unknown.
     */
    std::optional<e_same_site> str_to_same_site(const std::string_view& str);
}

#endif // CXXCOOKIE_HTTP_ATTRIBUTE_HXX
