#include <cxxcookie.hxx>

namespace cxxcookie {
    void init(const cxxcookie_cfg_t& cfg) {
#ifdef CXXCOOKIE_USE_LOGGING_IMPL
        g_logging->init(cfg.m_logger.m_level, cfg.m_logger.m_force_flush);

        g_logging->log(e_log_level::debug, "[Core] Logger initialized at level {}", g_logging->lvl_to_str(cfg.m_logger.m_level));
#else
        static_cast<void>(cfg);
#endif // CXXCOOKIE_USE_LOGGING_IMPL
    }
}
