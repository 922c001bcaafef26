/**
 * @file logging.hxx
 * @brief Leveled logging with fmt formatting and a replaceable output sink.
 */

#ifndef CXXCOOKIE_SHARED_LOGGING_HXX
#define CXXCOOKIE_SHARED_LOGGING_HXX

namespace shared {
#ifdef CXXCOOKIE_USE_LOGGING_IMPL
    /**
     * @brief Log severity levels.
     */
    enum struct e_log_level : std::int16_t {
        debug,    ///< Debug-level messages.
        info,     ///< Informational messages.
        warning,  ///< Warning conditions.
        error,    ///< Error conditions.
        critical, ///< Critical conditions.
        none = -1 ///< Logging disabled.
    };

    /**
     * @brief Represents a single log message with metadata.
     */
    struct log_message_t {
        /** @brief Severity level of the log message. */
        e_log_level m_level{};

        /** @brief Log message text. */
        std::string m_message{};

        /** @brief Timestamp when the message was created. */
        std::chrono::system_clock::time_point m_timestamp{};
    };

    /**
     * @brief Synchronous logger with level filtering.
     *
     * Messages go to a user supplied sink when one is set, otherwise they are
     * printed to stdout.
     */
    class c_logging {
      public:
        /** @brief Callback receiving every emitted message. */
        using sink_t = std::function<void(const log_message_t&)>;

      public:
        /**
         * @brief Construct a logger with optional log level and flush behavior.
         * @param log_level Minimum severity level to log.
         * @param force_flush Whether to flush output immediately.
         */
        CXXCOOKIE_INLINE c_logging(const e_log_level& log_level = e_log_level::none, bool force_flush = false)
            : m_force_flush(force_flush), m_log_level(log_level) {
        }

      public:
        /**
         * @brief Initialize the logger with configuration options.
         * @param log_level Minimum severity level to log.
         * @param force_flush Whether to flush output immediately.
         * @param sink Optional sink replacing stdout output, an empty one keeps the current sink.
         */
        CXXCOOKIE_INLINE void init(
            const e_log_level& log_level,

            bool force_flush = false,

            sink_t sink = {}
        ) {
            std::lock_guard<std::mutex> lock(m_mutex);

            m_log_level = log_level;
            m_force_flush = force_flush;

            if (sink)
                m_sink = std::move(sink);
        }

        /**
         * @brief Replace the output sink.
         * @param sink New sink, or an empty function to restore stdout output.
         */
        CXXCOOKIE_INLINE void set_sink(sink_t sink) {
            std::lock_guard<std::mutex> lock(m_mutex);

            m_sink = std::move(sink);
        }

        /**
         * @brief Convert a log level enum to a string representation.
         * @param level Log level to convert.
         * @return String representation of the log level.
         */
        CXXCOOKIE_INLINE const char* lvl_to_str(const e_log_level& level) const {
            switch (level) {
                case e_log_level::info:
                    return "INFO";
                case e_log_level::debug:
                    return "DEBUG";
                case e_log_level::warning:
                    return "WARNING";
                case e_log_level::error:
                    return "ERROR";
                case e_log_level::critical:
                    return "CRITICAL";
                default:
                    return "UNKNOWN";
            }
        }

        /**
         * @brief Check whether a message of the given level would be emitted.
         * @param log_level Severity level to test.
         * @return True if the level passes the filter.
         */
        [[nodiscard]] CXXCOOKIE_INLINE bool enabled(const e_log_level& log_level) const {
            return !(log_level < m_log_level || m_log_level == e_log_level::none);
        }

        /**
         * @brief Emit a formatted message regardless of the configured level.
         * @tparam _args_t Variadic format argument types.
         * @param log_level Severity level of the message.
         * @param message Format string.
         * @param args Format arguments.
         */
        template <typename... _args_t>
        CXXCOOKIE_INLINE void force_log(const e_log_level& log_level, fmt::format_string<_args_t...> message, _args_t&&... args) {
            emit({log_level, fmt::format(message, std::forward<_args_t>(args)...), std::chrono::system_clock::now()}, true);
        }

        /**
         * @brief Log a formatted message if its level passes the filter.
         * @tparam _args_t Variadic format argument types.
         * @param log_level Severity level of the message.
         * @param message Format string.
         * @param args Format arguments.
         */
        template <typename... _args_t>
        CXXCOOKIE_INLINE void log(const e_log_level& log_level, fmt::format_string<_args_t...> message, _args_t&&... args) {
            if (!enabled(log_level))
                return;

            emit({log_level, fmt::format(message, std::forward<_args_t>(args)...), std::chrono::system_clock::now()}, m_force_flush);
        }

      public:
        /**
         * @brief Get the minimum severity level (read-only).
         * @return Const reference to the level.
         */
        [[nodiscard]] CXXCOOKIE_INLINE const auto& level() const { return m_log_level; }

        /**
         * @brief Get the force flush flag (read-only).
         * @return Const reference to the flag.
         */
        [[nodiscard]] CXXCOOKIE_INLINE const auto& force_flush() const { return m_force_flush; }

      private:
        /**
         * @brief Deliver a message to the sink or print it.
         * @param msg Message to deliver.
         * @param flush Whether to flush stdout afterwards.
         */
        CXXCOOKIE_INLINE void emit(const log_message_t& msg, bool flush) {
            sink_t sink{};

            {
                std::lock_guard<std::mutex> lock(m_mutex);

                sink = m_sink;
            }

            // the sink may log through this logger
            if (sink) {
                sink(msg);

                return;
            }

            std::lock_guard<std::mutex> lock(m_mutex);

            auto in_time_t = std::chrono::system_clock::to_time_t(msg.m_timestamp);

            fmt::print(
                "[{:%Y-%m-%d %H:%M:%S}] {} - {}\n",

                fmt::styled(
                    std::chrono::system_clock::time_point(std::chrono::system_clock::from_time_t(in_time_t)),
                    fmt::emphasis::bold | fg(fmt::rgb(245, 245, 184))
                ),

                fmt::styled(
                    lvl_to_str(msg.m_level),
                    fmt::emphasis::bold
                ),

                fmt::styled(
                    msg.m_message,
                    fg(fmt::rgb(255, 255, 230))
                )
            );

            if (!flush)
                return;

            std::fflush(stdout);
        }

      private:
        /** @brief Whether to flush output immediately after each message. */
        bool m_force_flush{};

        /** @brief Minimum severity level to log. */
        e_log_level m_log_level{e_log_level::none};

        /** @brief Optional sink replacing stdout output. */
        sink_t m_sink{};

        /** @brief Mutex guarding the sink and serializing stdout output. */
        std::mutex m_mutex;
    };
#endif // CXXCOOKIE_USE_LOGGING_IMPL
}

#endif // CXXCOOKIE_SHARED_LOGGING_HXX
