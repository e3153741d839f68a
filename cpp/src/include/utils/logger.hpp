/*******************************************************************************
 * @file logger.hpp
 * @brief Thread-safe leveled logging utility built on fmt.
 *
 * **Design**
 * 1.  **Formatting at the call site**: `LOGGER_INFO("field {} declared", name)`
 *     checks the format string at compile time (FMT_STRING) and formats into a
 *     memory buffer only when the level is enabled.
 * 2.  **Sink Abstraction**: a `Sink` writes finished lines. The console sink
 *     (stderr) is the default; `set_logfile()` switches to an append-only file.
 * 3.  **Serialized writes**: a single mutex guards the active sink, so lines
 *     from different threads never interleave.
 * 4.  **Robustness**: formatting errors never escape a logging call; they are
 *     logged as `[FORMAT ERROR] ...` instead.
 *
 * **Usage**
 * ```cpp
 * #include "utils/logger.hpp"
 * LOGGER_INFO("class {} built with {} slots", name, count);
 *
 * auto &logger = fieldkit::utils::Logger::instance();
 * logger.set_level(fieldkit::utils::Logger::Level::L_DEBUG);
 * logger.set_logfile("/tmp/fieldkit.log");
 * logger.flush();
 * ```
 ******************************************************************************/

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "fieldkit_export.h"

// Default initial reserve for fmt::memory_buffer used by Logger::log_fmt.
#ifndef LOGGER_FMT_BUFFER_RESERVE
#define LOGGER_FMT_BUFFER_RESERVE (256u)
#endif

namespace fieldkit::utils
{

struct LoggerImpl;

class FIELDKIT_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5,
    };

    static Logger &instance();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    ~Logger();

    // --- Sinks ---

    /// Switch logging to the console (stderr).
    void set_console();

    /**
     * @brief Switch logging to a file opened in append mode.
     * @throws std::runtime_error if the file cannot be opened; the previous
     *         sink stays active in that case.
     */
    void set_logfile(const std::string &utf8_path);

    /// Flush the active sink.
    void flush();

    // --- Configuration ---
    void set_level(Level lvl);
    Level level() const;

    /**
     * @brief Parses "trace", "debug", "info", "warn"/"warning", "error", "system".
     * @return std::nullopt for an unknown name.
     */
    static std::optional<Level> parse_level(std::string_view name) noexcept;

    static const char *level_name(Level lvl) noexcept;

    // --- Formatting API ---
    template <Level lvl, typename... Args>
    void log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept;

    template <typename... Args>
    void trace_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_TRACE>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void debug_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_DEBUG>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void info_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_INFO>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void warn_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_WARNING>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void error_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_ERROR>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void system_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_SYSTEM>(fmt_str, std::forward<Args>(args)...);
    }

  private:
    Logger();

    std::unique_ptr<LoggerImpl> pImpl;

    void write_line(Level lvl, std::string &&body) noexcept;
    bool should_log(Level lvl) const noexcept;
};

// --- Compile-Time Log Level ---
#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0 // 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error
#endif

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= LOGGER_COMPILE_LEVEL)
    {
        if (!should_log(lvl))
            return;

        try
        {
            fmt::memory_buffer mb;
            mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
            fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
            write_line(lvl, std::string(mb.data(), mb.size()));
        }
        catch (const std::exception &ex)
        {
            write_line(lvl, std::string("[FORMAT ERROR] ") + ex.what());
        }
    }
}

} // namespace fieldkit::utils

#define LOGGER_TRACE(fmt, ...)                                                                     \
    ::fieldkit::utils::Logger::instance().trace_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...)                                                                     \
    ::fieldkit::utils::Logger::instance().debug_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...)                                                                      \
    ::fieldkit::utils::Logger::instance().info_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...)                                                                      \
    ::fieldkit::utils::Logger::instance().warn_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...)                                                                     \
    ::fieldkit::utils::Logger::instance().error_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...)                                                                    \
    ::fieldkit::utils::Logger::instance().system_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
