/**
 * @file exception.hxx
 * @brief Defines the exception hierarchy used throughout the cxxcookie.
 *
 * Provides a base exception class (`base_exception_t`) derived from `std::runtime_error`,
 * and the specialized exception types raised while parsing or mutating cookies.
 * All exceptions carry an error code, a message prefix, and full error formatting.
 */

#ifndef CXXCOOKIE_EXCEPTION_HXX
#define CXXCOOKIE_EXCEPTION_HXX

namespace cxxcookie {
    /**
     * @brief Error codes attached to cxxcookie exceptions.
     */
    enum struct e_error : std::int16_t {
        none,              ///< No specific error.
        malformed_cookie,  ///< Input is not a valid Set-Cookie string.
        invalid_operation  ///< Operation would break a cookie invariant.
    };

    /**
     * @brief Base exception type for all errors in cxxcookie.
     *
     * Inherits from std::runtime_error and provides error code handling,
     * optional message prefixes, and full error formatting.
     */
    struct base_exception_t : public std::runtime_error {
        /**
         * @brief Construct a base exception with a plain message.
         * @param str Error message.
         */
        CXXCOOKIE_INLINE base_exception_t(const std::string& str)
            : std::runtime_error(str), m_message(str), m_what(str) {
        }

        /**
         * @brief Construct a base exception with a message, error code, and optional prefix.
         * @param str Error message.
         * @param error Associated error code.
         * @param prefix Optional prefix to include in the formatted message.
         */
        CXXCOOKIE_INLINE base_exception_t(const std::string& str, const e_error& error, const std::string_view& prefix = "")
            : std::runtime_error(str), m_error(error), m_prefix(prefix), m_message(str) {
            if (!m_prefix.empty())
                m_what = fmt::format("[{}] {}", m_prefix, m_message);
            else
                m_what = m_message;
        }

      public:
        /**
         * @brief Get the error code associated with the exception (read-only).
         * @return Const reference to the error code.
         */
        CXXCOOKIE_INLINE const auto& error() const { return m_error; }

        /**
         * @brief Get the prefix of the message used in the exception (read-only).
         * @return Const reference to the message prefix.
         */
        CXXCOOKIE_INLINE const auto& prefix() const { return m_prefix; }

        /**
         * @brief Get the message used in the exception (read-only).
         * @return Const reference to the message.
         */
        CXXCOOKIE_INLINE const auto& message() const { return m_message; }

        /**
         * @brief Get the full formatted error message.
         * @return Pointer to a null-terminated C-string with the exception message.
         */
        CXXCOOKIE_INLINE const char* what() const noexcept override { return m_what.c_str(); }

      private:
        /** @brief Error code associated with the exception. */
        e_error m_error{e_error::none};

        /** @brief Optional prefix used to qualify the error message. */
        std::string_view m_prefix{};

        /** @brief Raw message content (without prefix). */
        std::string m_message{};

        /** @brief Cached full message string used in what(). */
        std::string m_what{};
    };

    namespace exceptions {
        /**
         * @brief Raised when a Set-Cookie string cannot be parsed.
         *
         * Automatically sets the prefix to "Cookie-Parse".
         */
        struct malformed_cookie_t : public base_exception_t {
            /**
             * @brief Construct a new malformed_cookie_t with a message.
             * @param str Error message to describe the exception.
             * @param prefix Prefix to prepend to the error message.
             */
            CXXCOOKIE_INLINE malformed_cookie_t(
                const std::string& str,

                const std::string_view& prefix = "Cookie-Parse"
            )
                : base_exception_t(str, e_error::malformed_cookie, prefix) {
            }
        };

        /**
         * @brief Raised when a mutation would violate a cookie invariant.
         *
         * Automatically sets the prefix to "Cookie-Operation".
         */
        struct invalid_operation_t : public base_exception_t {
            /**
             * @brief Construct a new invalid_operation_t with a message.
             * @param str Error message.
             * @param prefix Optional prefix to include in the formatted message.
             */
            CXXCOOKIE_INLINE invalid_operation_t(
                const std::string& str,

                const std::string_view& prefix = "Cookie-Operation"
            )
                : base_exception_t(str, e_error::invalid_operation, prefix) {
            }
        };
    }
}

#endif // CXXCOOKIE_EXCEPTION_HXX
