/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the leveled, thread-safe logger.
 *
 * The Logger owns one polymorphic `Sink` behind a mutex. Public calls format
 * on the calling thread (see logger.hpp) and hand the finished body to
 * `write_line`, which stamps time, level and thread id before writing.
 ******************************************************************************/

#include "utils/logger.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>

#include <fmt/chrono.h>
#include <fmt/format.h>

#if defined(__linux__)
#include <sys/syscall.h>
#include <unistd.h>
#endif

namespace fieldkit::utils
{

namespace
{

uint64_t get_native_thread_id() noexcept
{
#if defined(__linux__)
    return static_cast<uint64_t>(::syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

std::string format_line(Logger::Level lvl, std::string_view body)
{
    const auto now = std::chrono::system_clock::now();
    const auto micros =
        std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() %
        1000000;
    return fmt::format("[{:%Y-%m-%d %H:%M:%S}.{:06}] [{:<6}] [{:5}] {}\n",
                       fmt::localtime(std::chrono::system_clock::to_time_t(now)), micros,
                       Logger::level_name(lvl), get_native_thread_id(), body);
}

} // namespace

// ============================================================================
// Sinks
// ============================================================================

/**
 * @class Sink
 * @brief Destination of finished log lines. Always called under the logger mutex.
 */
class Sink
{
  public:
    virtual ~Sink() = default;
    virtual void write(const std::string &line) = 0;
    virtual void flush() = 0;
    virtual std::string description() const = 0;
};

class ConsoleSink : public Sink
{
  public:
    void write(const std::string &line) override { fmt::print(stderr, "{}", line); }
    void flush() override { std::fflush(stderr); }
    std::string description() const override { return "Console"; }
};

class FileSink : public Sink
{
  public:
    explicit FileSink(const std::string &path) : path_(path)
    {
        file_ = std::fopen(path.c_str(), "a");
        if (file_ == nullptr)
        {
            throw std::runtime_error("Failed to open log file: " + path);
        }
    }

    ~FileSink() override
    {
        if (file_ != nullptr)
            std::fclose(file_);
    }

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const std::string &line) override
    {
        std::fwrite(line.data(), 1, line.size(), file_);
    }
    void flush() override { std::fflush(file_); }
    std::string description() const override { return "File: " + path_; }

  private:
    std::string path_;
    std::FILE *file_ = nullptr;
};

// ============================================================================
// Logger Pimpl
// ============================================================================

struct LoggerImpl
{
    std::mutex mutex;
    std::unique_ptr<Sink> sink = std::make_unique<ConsoleSink>();
    std::atomic<Logger::Level> level{Logger::Level::L_INFO};

    void replace_sink(std::unique_ptr<Sink> next)
    {
        std::lock_guard<std::mutex> lock(mutex);
        sink->flush();
        const std::string previous = sink->description();
        sink = std::move(next);
        sink->write(format_line(Logger::Level::L_SYSTEM,
                                fmt::format("Log sink switched from '{}'", previous)));
    }
};

Logger::Logger() : pImpl(std::make_unique<LoggerImpl>()) {}

Logger::~Logger() = default;

Logger &Logger::instance()
{
    static Logger logger;
    return logger;
}

void Logger::set_console()
{
    pImpl->replace_sink(std::make_unique<ConsoleSink>());
}

void Logger::set_logfile(const std::string &utf8_path)
{
    // Open outside the lock so a failure leaves the current sink untouched.
    auto next = std::make_unique<FileSink>(utf8_path);
    pImpl->replace_sink(std::move(next));
}

void Logger::flush()
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->sink->flush();
}

void Logger::set_level(Level lvl)
{
    pImpl->level.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return pImpl->level.load(std::memory_order_relaxed);
}

std::optional<Logger::Level> Logger::parse_level(std::string_view name) noexcept
{
    if (name == "trace")
        return Level::L_TRACE;
    if (name == "debug")
        return Level::L_DEBUG;
    if (name == "info")
        return Level::L_INFO;
    if (name == "warn" || name == "warning")
        return Level::L_WARNING;
    if (name == "error")
        return Level::L_ERROR;
    if (name == "system")
        return Level::L_SYSTEM;
    return std::nullopt;
}

const char *Logger::level_name(Level lvl) noexcept
{
    switch (lvl)
    {
    case Level::L_TRACE: return "TRACE";
    case Level::L_DEBUG: return "DEBUG";
    case Level::L_INFO: return "INFO";
    case Level::L_WARNING: return "WARN";
    case Level::L_ERROR: return "ERROR";
    case Level::L_SYSTEM: return "SYSTEM";
    default: return "UNK";
    }
}

bool Logger::should_log(Level lvl) const noexcept
{
    return static_cast<int>(lvl) >= static_cast<int>(pImpl->level.load(std::memory_order_relaxed));
}

void Logger::write_line(Level lvl, std::string &&body) noexcept
{
    try
    {
        std::string line = format_line(lvl, body);
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->sink->write(line);
    }
    catch (const std::exception &ex)
    {
        // Last resort: the sink itself failed.
        std::fprintf(stderr, "[fieldkit::Logger] write failed: %s\n", ex.what());
    }
}

} // namespace fieldkit::utils
