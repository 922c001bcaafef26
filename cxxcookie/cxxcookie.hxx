/**
 * @file cxxcookie.hxx
 * @brief Main public API and configuration structures for the cxxcookie.
 */

#ifndef CXXCOOKIE_HXX
#define CXXCOOKIE_HXX

#include "shared/shared.hxx"

/**
 * @namespace cxxcookie
 * @brief Main namespace for the cxxcookie.
 */
namespace cxxcookie {
#ifdef CXXCOOKIE_USE_LOGGING_IMPL
    /** @brief Alias for the shared logging implementation. */
    using c_logging = shared::c_logging;

    /** @brief Alias for the shared logging level enumeration. */
    using e_log_level = shared::e_log_level;

    /** @brief Global logger instance for cxxcookie. */
    inline const auto g_logging = std::make_unique<shared::c_logging>();
#endif // CXXCOOKIE_USE_LOGGING_IMPL
}

#include "exception/exception.hxx"

#include "http/http.hxx"

namespace cxxcookie {
    /**
     * @brief Configuration parameters for the cxxcookie.
     */
    struct cxxcookie_cfg_t {
#ifdef CXXCOOKIE_USE_LOGGING_IMPL
        /**
         * @brief Configuration for the internal cxxcookie logger.
         */
        struct logger_t {
            /** @brief Minimum severity level to log. (default: info) */
            e_log_level m_level{e_log_level::info};

            /** @brief Whether to flush output immediately after each message. (default: false) */
            bool m_force_flush{false};
        };

        /** @brief Logger configuration for cxxcookie. */
        logger_t m_logger{};
#endif // CXXCOOKIE_USE_LOGGING_IMPL
    };

    /**
     * @brief Apply a library configuration.
     * @param cfg Configuration settings.
     *
     * Without CXXCOOKIE_USE_LOGGING_IMPL the configuration is empty and init() does nothing.
     */
    void init(const cxxcookie_cfg_t& cfg);
}

#endif // CXXCOOKIE_HXX
