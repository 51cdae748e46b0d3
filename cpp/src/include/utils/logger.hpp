/*******************************************************************************
 * @file logger.hpp
 * @brief High-performance, asynchronous, thread-safe logging utility.
 *
 * **Design: Command-Queue Pattern**
 *
 * 1.  **Non-Blocking API**: Calls from application threads (e.g. `LOGGER_INFO(...)`)
 *     format the message and push a command onto a thread-safe queue.
 * 2.  **Asynchronous Worker Thread**: A single background thread is the sole
 *     consumer of the queue. It performs all I/O and owns the active sink.
 * 3.  **Sink Abstraction**: `ConsoleSink` (stderr, default) and `FileSink`.
 * 4.  **Robustness**: `flush()` blocks until everything queued so far is written;
 *     `shutdown()` drains the queue and joins the worker. Sink I/O errors are
 *     reported through the write-error callback, never thrown to the caller.
 *
 * **Usage**
 * ```cpp
 * #include "utils/logger.hpp"
 * LOGGER_INFO("Zone {} created by {}", zone_id, handle);
 *
 * Logger& logger = Logger::instance();
 * logger.set_logfile("/tmp/zonechat.log");
 * logger.set_level(Logger::Level::L_DEBUG);
 * ```
 ******************************************************************************/

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "zonechat_core_export.h"
#include "utils/module_def.hpp"

// Default initial reserve for fmt::memory_buffer used by Logger::log_fmt.
#ifndef LOGGER_FMT_BUFFER_RESERVE
#define LOGGER_FMT_BUFFER_RESERVE (1024u)
#endif

namespace zonechat::utils
{

// Forward declaration of the private implementation
struct LoggerImpl;

class ZONECHAT_CORE_EXPORT Logger
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

    // Singleton accessor
    static Logger &instance();

    /** @brief ModuleDef "Logger" for LifecycleGuard; shutdown drains the queue. */
    static ModuleDef GetLifecycleModule();

    /** @brief Parses "trace", "debug", "info", "warn"/"warning", "error", "system". */
    static std::optional<Level> level_from_string(std::string_view name) noexcept;

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    ~Logger();

    // --- Sinks ---
    // Configuration changes are commands executed in order by the worker thread.

    /** @brief Switch logging to the console (stderr). Non-blocking. */
    void set_console();

    /**
     * @brief Switch logging to a file. Non-blocking.
     * @param utf8_path Path to the log file (opened in append mode).
     * @param use_flock If true, hold an advisory file lock during each write.
     */
    void set_logfile(const std::string &utf8_path, bool use_flock = false);

    /**
     * @brief Drains the queue and stops the worker thread. Idempotent.
     *
     * Messages logged after shutdown are written directly to stderr.
     */
    void shutdown();

    /**
     * @brief Blocks until every message queued before the call has been written.
     * @note Must not be called from the write-error callback.
     */
    void flush();

    void set_level(Level lvl);
    Level level() const;

    /**
     * @brief Sets a callback invoked (from the worker thread) on sink errors.
     */
    void set_write_error_callback(std::function<void(const std::string &)> cb);

    // --- Formatting API (header-only templates) ---
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

    // Internal logging function that enqueues a formatted message.
    void enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept;

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
            enqueue_log(lvl, std::move(mb));
        }
        catch (const std::exception &ex)
        {
            fmt::memory_buffer mb;
            fmt::format_to(std::back_inserter(mb), "[FORMAT ERROR] {}", ex.what());
            enqueue_log(lvl, std::move(mb));
        }
    }
}

} // namespace zonechat::utils

// --- Macro Implementation ---
#define LOGGER_TRACE(fmt, ...)                                                                     \
    ::zonechat::utils::Logger::instance().trace_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...)                                                                     \
    ::zonechat::utils::Logger::instance().debug_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...)                                                                      \
    ::zonechat::utils::Logger::instance().info_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...)                                                                      \
    ::zonechat::utils::Logger::instance().warn_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...)                                                                     \
    ::zonechat::utils::Logger::instance().error_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...)                                                                    \
    ::zonechat::utils::Logger::instance().system_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
