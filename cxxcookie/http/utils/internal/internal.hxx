/**
 * @file internal.hxx
 * @brief Offset table mapping cookie fields to byte ranges of a single buffer.
 */

#ifndef CXXCOOKIE_HTTP_UTILS_INTERNAL_HXX
#define CXXCOOKIE_HTTP_UTILS_INTERNAL_HXX

/**
 * @brief Internal namespace for HTTP utilities.
 */
namespace cxxcookie::http::internal {
    /**
     * @brief Byte range inside a buffer.
     */
    struct slice_t {
        /** @brief Offset of the first byte. */
        std::size_t m_offset{};

        /** @brief Number of bytes. */
        std::size_t m_length{};

      public:
        /**
         * @brief Offset one past the last byte.
         * @return m_offset + m_length.
         */
        [[nodiscard]] CXXCOOKIE_INLINE constexpr std::size_t end() const { return m_offset + m_length; }

        /**
         * @brief View the range inside a buffer.
         * @param buffer Buffer the range refers to.
         * @return View of the bytes.
         */
        [[nodiscard]] CXXCOOKIE_INLINE std::string_view view(const std::string& buffer) const {
            return std::string_view{buffer}.substr(m_offset, m_length);
        }

        /**
         * @brief Compare two ranges.
         */
        CXXCOOKIE_INLINE constexpr bool operator==(const slice_t&) const = default;
    };

    /**
     * @brief Index entry for a single field.
     *
     * For attributes the segment covers the leading "; " and the key, for
     * value it covers the '=' and for name it equals the value range. The
     * segments of all entries tile the buffer without gaps.
     */
    struct entry_t {
        /** @brief Field stored at this position. */
        e_field m_field{};

        /** @brief Full byte range occupied by the field. */
        slice_t m_segment{};

        /** @brief Byte range of the field's value (empty for flags). */
        slice_t m_value{};
    };

    /**
     * @brief Offset table over a serialized cookie buffer.
     *
     * Entries are kept in buffer order. Every splice updates the touched entry
     * and shifts all later entries, so each recorded range stays valid for the
     * buffer it was last applied to.
     */
    class slice_index_t {
      public:
        /**
         * @brief Construct an index with pre-allocated capacity.
         */
        CXXCOOKIE_INLINE slice_index_t() { m_entries.reserve(2u + k_attributes_count); }

      public:
        /**
         * @brief Rebuild the buffer and index as "name=value".
         * @param buffer Buffer to overwrite.
         * @param name Cookie name.
         * @param value Cookie value.
         *
         * Both views may point into buffer.
         */
        void reset(std::string& buffer, const std::string_view& name, const std::string_view& value);

        /**
         * @brief Get the value range of a field.
         * @param field Field to look up.
         * @return Value range, or nullopt when the field is absent.
         */
        [[nodiscard]] std::optional<slice_t> get(const e_field& field) const;

        /**
         * @brief Write a field's value, appending the field if absent.
         * @param buffer Buffer the index describes.
         * @param field Field to write.
         * @param bytes New value bytes (ignored for flags), may view buffer itself.
         */
        void set(std::string& buffer, const e_field& field, const std::string_view& bytes);

        /**
         * @brief Erase an attribute together with its "; " separator.
         * @param buffer Buffer the index describes.
         * @param field Attribute field to erase.
         * @return True if the field was present.
         *
         * @throws exceptions::invalid_operation_t for name and value.
         */
        bool remove(std::string& buffer, const e_field& field);

      public:
        /**
         * @brief Check whether a field is present.
         * @param field Field to look up.
         * @return True if present.
         */
        [[nodiscard]] CXXCOOKIE_INLINE bool contains(const e_field& field) const { return find(field) != m_entries.end(); }

        /**
         * @brief Get the entries in buffer order (read-only).
         * @return Const reference to the entries.
         */
        [[nodiscard]] CXXCOOKIE_INLINE const auto& entries() const { return m_entries; }

      private:
        /**
         * @brief Find the entry of a field.
         * @param field Field to look up.
         * @return Iterator to the entry or end().
         */
        CXXCOOKIE_INLINE std::vector<entry_t>::const_iterator find(const e_field& field) const {
            return std::find_if(m_entries.begin(), m_entries.end(), [&](const entry_t& entry) { return entry.m_field == field; });
        }

        /**
         * @brief Move every entry after a position by a byte delta.
         * @param position Index of the last entry left untouched.
         * @param delta Signed byte delta.
         */
        void shift(std::size_t position, std::ptrdiff_t delta);

      private:
        /** @brief Entries in buffer order. */
        std::vector<entry_t> m_entries{};
    };
}

#endif // CXXCOOKIE_HTTP_UTILS_INTERNAL_HXX
