/**
 * @file logger.hpp
 * @brief Process-wide leveled logger writing to stderr.
 */
#pragma once
#include "genjob/common/common.hpp"

namespace genjob
{

enum class LogLevel : std::uint8_t
{
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3,
    Trace = 4
};

/**
 * @brief Static logger shared by all genjob components.
 *
 * @details
 * The threshold is read from the `GENJOB_LOG_LEVEL` environment variable on
 * first use (default `warn`) unless set_level() was called before.
 * Each line carries a millisecond timestamp, the level and the name of the
 * calling thread (see set_thread_name()).
 *
 * @par Thread Safety
 * - All members may be called from any thread.
 * - Logging never throws.
 */
class Logger
{
public:
    static void set_level(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    [[nodiscard]] static bool enabled(LogLevel level) noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    /**
     * @brief Parse a level name (case-insensitive).
     * @return The parsed level, or `fallback` for an unknown name.
     */
    [[nodiscard]] static LogLevel parse_level(
        const std::string& name, LogLevel fallback) noexcept;

    static const char* level_name(LogLevel level) noexcept;
};

/**
 * @brief Name the calling thread in subsequent log lines.
 */
void set_thread_name(const std::string& name);

/**
 * @brief Forget the name registered for the calling thread.
 */
void clear_thread_name() noexcept;

} // namespace genjob

#define GENJOB_LOG_AT(lvl, msg)                                  \
    do                                                           \
    {                                                            \
        if (::genjob::Logger::enabled(lvl))                      \
        {                                                        \
            ::genjob::Logger::log(lvl, msg);                     \
        }                                                        \
    } while (0)

#define GENJOB_LOG_ERROR(msg) GENJOB_LOG_AT(::genjob::LogLevel::Error, msg)
#define GENJOB_LOG_WARN(msg)  GENJOB_LOG_AT(::genjob::LogLevel::Warn, msg)
#define GENJOB_LOG_INFO(msg)  GENJOB_LOG_AT(::genjob::LogLevel::Info, msg)
#define GENJOB_LOG_DEBUG(msg) GENJOB_LOG_AT(::genjob::LogLevel::Debug, msg)
#define GENJOB_LOG_TRACE(msg) GENJOB_LOG_AT(::genjob::LogLevel::Trace, msg)
