/**
 * @file cookie.hxx
 * @brief Set-Cookie value backed by a single serialized buffer.
 */

#ifndef CXXCOOKIE_HTTP_COOKIE_HXX
#define CXXCOOKIE_HTTP_COOKIE_HXX

namespace cxxcookie::http {
    /**
     * @brief Limits and policies applied by cookie_t::parse.
     */
    struct parse_cfg_t {
        /** @brief Reject cookies breaking the __Secure- and __Host- prefix rules. (default: false) */
        bool m_strict_prefixes{false};

        /** @brief Maximum name plus value size in bytes, 0 disables the check. (default: 4096) */
        std::size_t m_max_pair_size{4096u};

        /** @brief Attribute values above this size are dropped, 0 disables the check. (default: 1024) */
        std::size_t m_max_attribute_value_size{1024u};
    };

    /**
     * @brief Represents an HTTP cookie as its Set-Cookie serialization.
     *
     * The cookie owns exactly one string holding "name=value; Attr=Val; Attr".
     * Reads return views into that string and writes splice it in place, so the
     * buffer is the serialized form at all times. Attributes keep the order in
     * which they were first set.
     *
     * Views returned by accessors are invalidated by the next mutation, but
     * may themselves be passed to a mutator of the same cookie.
     */
    class cookie_t {
      public:
        /**
         * @brief Construct a cookie from a name and value, with no attributes.
         * @param name Cookie name, surrounding whitespace is trimmed.
         * @param value Cookie value, surrounding whitespace is trimmed.
         *
         * @throws exceptions::invalid_operation_t if the name is empty, contains '=',
         * or either part contains ';' or a control character.
         */
        cookie_t(const std::string_view& name, const std::string_view& value);

      public:
        /**
         * @brief Construct a cookie from a name and value.
         * @param name Cookie name.
         * @param value Cookie value.
         * @return The new cookie.
         */
        [[nodiscard]] CXXCOOKIE_INLINE static cookie_t from_parts(const std::string_view& name, const std::string_view& value) {
            return cookie_t(name, value);
        }

        /**
         * @brief Parse a Set-Cookie header value.
         * @param raw Header value, e.g. "id=42; Path=/; Secure".
         * @param cfg Parse limits and policies.
         * @return The parsed cookie.
         *
         * Unrecognized attributes and attributes with unacceptable values are dropped.
         *
         * @throws exceptions::malformed_cookie_t if the cookie-pair is missing or invalid.
         */
        [[nodiscard]] static cookie_t parse(const std::string_view& raw, const parse_cfg_t& cfg = {});

        /**
         * @brief Parse a Set-Cookie header value without throwing.
         * @param raw Header value.
         * @param cfg Parse limits and policies.
         * @return The parsed cookie, or nullopt if it is malformed.
         */
        [[nodiscard]] static std::optional<cookie_t> try_parse(const std::string_view& raw, const parse_cfg_t& cfg = {});

      public:
        /**
         * @brief Get the serialized cookie.
         * @return Const reference to the buffer.
         */
        [[nodiscard]] CXXCOOKIE_INLINE const std::string& to_string() const { return m_buffer; }

        /**
         * @brief Get the serialized size in bytes.
         * @return Buffer size.
         */
        [[nodiscard]] CXXCOOKIE_INLINE std::size_t size() const { return m_buffer.size(); }

        /**
         * @brief Get the cookie name.
         * @return View into the buffer.
         */
        [[nodiscard]] CXXCOOKIE_INLINE std::string_view name() const { return view(e_field::name).value_or(std::string_view{}); }

        /**
         * @brief Get the cookie value.
         * @return View into the buffer.
         */
        [[nodiscard]] CXXCOOKIE_INLINE std::string_view value() const { return view(e_field::value).value_or(std::string_view{}); }

        /**
         * @brief Get name and value together.
         * @return Pair of views into the buffer.
         */
        [[nodiscard]] CXXCOOKIE_INLINE std::pair<std::string_view, std::string_view> cookie_pair() const { return {name(), value()}; }

        /**
         * @brief Get any field.
         * @param field Field to read.
         * @return View into the buffer (empty for present flags), or nullopt if absent.
         */
        [[nodiscard]] CXXCOOKIE_INLINE std::optional<std::string_view> get(const e_field& field) const { return view(field); }

        /**
         * @brief Get an attribute.
         * @param attribute Attribute to read.
         * @return View into the buffer (empty for present flags), or nullopt if absent.
         */
        [[nodiscard]] CXXCOOKIE_INLINE std::optional<std::string_view> get_attribute(const e_attribute& attribute) const {
            return view(to_field(attribute));
        }

        /**
         * @brief Check whether an attribute is present.
         * @param attribute Attribute to look up.
         * @return True if present.
         */
        [[nodiscard]] CXXCOOKIE_INLINE bool has_attribute(const e_attribute& attribute) const { return m_index.contains(to_field(attribute)); }

        /**
         * @brief Get the present attributes.
         * @return Attributes in buffer order.
         */
        [[nodiscard]] std::vector<e_attribute> attributes() const;

      public:
        /**
         * @brief Replace the cookie name.
         * @param name New name, trimmed.
         * @return Reference to this cookie.
         *
         * @throws exceptions::invalid_operation_t on an invalid name.
         */
        cookie_t& set_name(const std::string_view& name);

        /**
         * @brief Replace the cookie value.
         * @param value New value, trimmed, may be empty.
         * @return Reference to this cookie.
         *
         * @throws exceptions::invalid_operation_t on an invalid value.
         */
        cookie_t& set_value(const std::string_view& value);

        /**
         * @brief Set an attribute.
         * @param attribute Attribute to set.
         * @param value Attribute value, trimmed. Ignored for flags.
         * @return Reference to this cookie.
         *
         * An empty value removes a valued attribute. A value the attribute does
         * not accept (non-numeric Max-Age, unparsable Expires, unknown SameSite,
         * Path not starting with '/') leaves the cookie unchanged. An attribute
         * that is already present keeps its position.
         *
         * @throws exceptions::invalid_operation_t if the value contains ';' or a control character.
         */
        cookie_t& set_attribute(const e_attribute& attribute, const std::string_view& value = {});

        /**
         * @brief Set an attribute by name.
         * @param name Attribute name, matched case-insensitively.
         * @param value Attribute value.
         * @return Reference to this cookie.
         *
         * Unrecognized names are ignored.
         */
        cookie_t& set_attribute(const std::string_view& name, const std::string_view& value = {});

        /**
         * @brief Remove an attribute if present.
         * @param attribute Attribute to remove.
         * @return Reference to this cookie.
         */
        CXXCOOKIE_INLINE cookie_t& remove_attribute(const e_attribute& attribute) { return remove(to_field(attribute)); }

        /**
         * @brief Remove an attribute by name.
         * @param name Attribute name, matched case-insensitively.
         * @return Reference to this cookie.
         *
         * Unrecognized names are ignored.
         *
         * @throws exceptions::invalid_operation_t for "name" and "value".
         */
        cookie_t& remove_attribute(const std::string_view& name);

        /**
         * @brief Remove a field.
         * @param field Field to remove.
         * @return Reference to this cookie.
         *
         * @throws exceptions::invalid_operation_t for name and value.
         */
        cookie_t& remove(const e_field& field);

      public:
        /** @brief Domain attribute. */
        [[nodiscard]] CXXCOOKIE_INLINE std::optional<std::string_view> domain() const { return get_attribute(e_attribute::domain); }

        /** @brief Set or, with an empty value, remove the Domain attribute. */
        CXXCOOKIE_INLINE cookie_t& set_domain(const std::string_view& domain) { return set_attribute(e_attribute::domain, domain); }

        /** @brief Path attribute. */
        [[nodiscard]] CXXCOOKIE_INLINE std::optional<std::string_view> path() const { return get_attribute(e_attribute::path); }

        /** @brief Set or, with an empty value, remove the Path attribute. */
        CXXCOOKIE_INLINE cookie_t& set_path(const std::string_view& path) { return set_attribute(e_attribute::path, path); }

        /**
         * @brief Max-Age attribute as a duration.
         * @return Seconds, possibly zero or negative, or nullopt if absent.
         */
        [[nodiscard]] std::optional<std::chrono::seconds> max_age() const;

        /**
         * @brief Set the Max-Age attribute.
         * @param max_age Lifetime; zero or negative expires the cookie immediately.
         * @return Reference to this cookie.
         */
        cookie_t& set_max_age(const std::chrono::seconds& max_age);

        /**
         * @brief Expires attribute as a UTC time.
         * @return Parsed time, or nullopt if absent.
         */
        [[nodiscard]] std::optional<boost::posix_time::ptime> expires() const;

        /**
         * @brief Set the Expires attribute.
         * @param expires UTC time.
         * @return Reference to this cookie.
         *
         * @throws exceptions::invalid_operation_t for special values and years before 1601.
         */
        cookie_t& set_expires(const boost::posix_time::ptime& expires);

        /**
         * @brief Mark the cookie for deletion.
         * @return Reference to this cookie.
         *
         * Sets Expires to 1 Jan 1900 and rewrites an existing Max-Age to 0.
         */
        cookie_t& expire();

        /** @brief Whether the Secure flag is set. */
        [[nodiscard]] CXXCOOKIE_INLINE bool secure() const { return has_attribute(e_attribute::secure); }

        /** @brief Set or clear the Secure flag. */
        CXXCOOKIE_INLINE cookie_t& set_secure(bool secure) {
            return secure ? set_attribute(e_attribute::secure) : remove_attribute(e_attribute::secure);
        }

        /** @brief Whether the HttpOnly flag is set. */
        [[nodiscard]] CXXCOOKIE_INLINE bool http_only() const { return has_attribute(e_attribute::http_only); }

        /** @brief Set or clear the HttpOnly flag. */
        CXXCOOKIE_INLINE cookie_t& set_http_only(bool http_only) {
            return http_only ? set_attribute(e_attribute::http_only) : remove_attribute(e_attribute::http_only);
        }

        /**
         * @brief SameSite attribute.
         * @return Parsed value, or nullopt if absent.
         */
        [[nodiscard]] std::optional<e_same_site> same_site() const;

        /** @brief Set the SameSite attribute to its canonical spelling. */
        CXXCOOKIE_INLINE cookie_t& set_same_site(const e_same_site& same_site) {
            return set_attribute(e_attribute::same_site, same_site_to_str(same_site));
        }

      public:
        /**
         * @brief Check the __Secure- and __Host- name prefix rules.
         * @return True if the name has no prefix or its requirements are met.
         *
         * __Secure- needs Secure. __Host- needs Secure, no Domain and Path=/.
         */
        [[nodiscard]] bool has_valid_prefix() const;

        /**
         * @brief Enforce the name prefix rules.
         *
         * @throws exceptions::invalid_operation_t if has_valid_prefix() is false.
         */
        void validate_prefix() const;

        /**
         * @brief Get the slice index (read-only).
         * @return Const reference to the index.
         */
        [[nodiscard]] CXXCOOKIE_INLINE const auto& index() const { return m_index; }

      public:
        /**
         * @brief Compare serialized forms.
         */
        CXXCOOKIE_INLINE bool operator==(const cookie_t& other) const { return m_buffer == other.m_buffer; }

        /**
         * @brief Write the serialized form to a stream.
         */
        CXXCOOKIE_INLINE friend std::ostream& operator<<(std::ostream& os, const cookie_t& cookie) { return os << cookie.m_buffer; }

      private:
        /**
         * @brief View a field inside the buffer.
         * @param field Field to read.
         * @return View, or nullopt if absent.
         */
        CXXCOOKIE_INLINE std::optional<std::string_view> view(const e_field& field) const {
            const auto slice = m_index.get(field);

            if (!slice.has_value())
                return std::nullopt;

            return slice->view(m_buffer);
        }

      private:
        /** @brief Serialized Set-Cookie value. */
        std::string m_buffer{};

        /** @brief Byte ranges of every field in m_buffer. */
        internal::slice_index_t m_index{};
    };
}

/**
 * @brief fmt support, formats the serialized cookie.
 */
template <>
struct fmt::formatter<cxxcookie::http::cookie_t> : fmt::formatter<std::string_view> {
    template <typename _context_t>
    auto format(const cxxcookie::http::cookie_t& cookie, _context_t& ctx) const {
        return fmt::formatter<std::string_view>::format(cookie.to_string(), ctx);
    }
};

#endif // CXXCOOKIE_HTTP_COOKIE_HXX
