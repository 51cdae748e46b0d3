/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the asynchronous logger.
 *
 * Public API calls build a `Command` (a std::variant of log message, sink switch,
 * flush request, ...) and push it onto a queue. The worker thread swaps the whole
 * queue out under the lock and processes the batch without holding it, so
 * producers are blocked only for the push itself.
 ******************************************************************************/
#include "utils/logger.hpp"

#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"

#include <atomic>
#include <condition_variable>
#include <future>
#include <mutex>
#include <thread>
#include <variant>
#include <vector>

#include <sys/syscall.h>
#include <unistd.h>

namespace zonechat::utils
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

fmt::memory_buffer buffer_from(std::string_view text)
{
    fmt::memory_buffer mb;
    mb.append(text.data(), text.data() + text.size());
    return mb;
}

// --- Command Definitions ---
struct SetSinkCommand
{
    std::unique_ptr<Sink> new_sink;
};
struct SinkCreationErrorCommand
{
    std::string error_message;
};
struct FlushCommand
{
    std::shared_ptr<std::promise<void>> promise;
};
struct SetErrorCallbackCommand
{
    std::function<void(const std::string &)> callback;
};

using Command = std::variant<LogMessage, SetSinkCommand, SinkCreationErrorCommand, FlushCommand,
                             SetErrorCallbackCommand>;
} // namespace

// ============================================================================
// Logger Pimpl
// ============================================================================

struct LoggerImpl
{
    LoggerImpl();
    ~LoggerImpl();

    void worker_loop();
    void process(Command &cmd);
    void report_error(const std::string &message);
    void enqueue_command(Command &&cmd);
    void shutdown();

    std::thread worker_thread_;
    std::vector<Command> queue_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> shutdown_completed_{false};
    std::atomic<Logger::Level> level_{Logger::Level::L_INFO};

    // Owned and accessed by the worker thread only.
    std::unique_ptr<Sink> sink_;
    std::function<void(const std::string &)> error_callback_;
};

LoggerImpl::LoggerImpl() : sink_(std::make_unique<ConsoleSink>())
{
    worker_thread_ = std::thread(&LoggerImpl::worker_loop, this);
}

LoggerImpl::~LoggerImpl()
{
    shutdown();
}

void LoggerImpl::enqueue_command(Command &&cmd)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!shutdown_requested_.load(std::memory_order_acquire))
        {
            queue_.emplace_back(std::move(cmd));
            cv_.notify_one();
            return;
        }
    }
    // After shutdown, critical messages go straight to stderr instead of being lost.
    if (auto *msg = std::get_if<LogMessage>(&cmd))
    {
        fmt::print(stderr, "[zonechat::Logger-fallback] {}", Sink::format_logmsg(*msg));
    }
    else if (auto *flush = std::get_if<FlushCommand>(&cmd))
    {
        flush->promise->set_value();
    }
}

void LoggerImpl::report_error(const std::string &message)
{
    if (error_callback_)
    {
        error_callback_(message);
    }
    else
    {
        fmt::print(stderr, "[zonechat::Logger] {}\n", message);
    }
}

void LoggerImpl::process(Command &cmd)
{
    std::visit(
        [this](auto &&arg) {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, LogMessage>)
            {
                if (sink_ && arg.level >= static_cast<int>(level_.load(std::memory_order_relaxed)))
                    sink_->write(arg);
            }
            else if constexpr (std::is_same_v<T, SetSinkCommand>)
            {
                const std::string old_desc = sink_ ? sink_->description() : "null";
                const std::string new_desc = arg.new_sink ? arg.new_sink->description() : "null";
                if (sink_)
                {
                    sink_->write({std::chrono::system_clock::now(), get_native_thread_id(),
                                  static_cast<int>(Logger::Level::L_SYSTEM),
                                  buffer_from("Switching log sink to: " + new_desc)});
                    sink_->flush();
                }
                sink_ = std::move(arg.new_sink);
                if (sink_)
                {
                    sink_->write({std::chrono::system_clock::now(), get_native_thread_id(),
                                  static_cast<int>(Logger::Level::L_SYSTEM),
                                  buffer_from("Log sink switched from: " + old_desc)});
                }
            }
            else if constexpr (std::is_same_v<T, SinkCreationErrorCommand>)
            {
                report_error(arg.error_message);
            }
            else if constexpr (std::is_same_v<T, FlushCommand>)
            {
                if (sink_)
                    sink_->flush();
                arg.promise->set_value();
            }
            else if constexpr (std::is_same_v<T, SetErrorCallbackCommand>)
            {
                error_callback_ = std::move(arg.callback);
            }
        },
        cmd);
}

void LoggerImpl::worker_loop()
{
    std::vector<Command> local_queue;

    while (true)
    {
        bool stop = false;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_.load(); });
            stop = shutdown_requested_.load();
            local_queue.swap(queue_);
        }

        for (auto &cmd : local_queue)
        {
            try
            {
                process(cmd);
            }
            catch (const std::exception &e)
            {
                report_error(fmt::format("Logger worker error: {}", e.what()));
                if (auto *flush = std::get_if<FlushCommand>(&cmd))
                {
                    flush->promise->set_value();
                }
            }
        }
        local_queue.clear();

        if (stop)
        {
            if (sink_)
                sink_->flush();
            break;
        }
    }
}

void LoggerImpl::shutdown()
{
    if (shutdown_completed_.load() || shutdown_requested_.exchange(true))
    {
        return;
    }
    cv_.notify_one();
    if (worker_thread_.joinable())
    {
        worker_thread_.join();
    }
    shutdown_completed_.store(true);
}

// ============================================================================
// Logger public API
// ============================================================================

Logger::Logger() : pImpl(std::make_unique<LoggerImpl>()) {}

Logger::~Logger() = default;

Logger &Logger::instance()
{
    static Logger instance;
    return instance;
}

std::optional<Logger::Level> Logger::level_from_string(std::string_view name) noexcept
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

void Logger::set_console()
{
    pImpl->enqueue_command(SetSinkCommand{std::make_unique<ConsoleSink>()});
}

void Logger::set_logfile(const std::string &utf8_path, bool use_flock)
{
    try
    {
        pImpl->enqueue_command(SetSinkCommand{std::make_unique<FileSink>(utf8_path, use_flock)});
    }
    catch (const std::exception &e)
    {
        pImpl->enqueue_command(
            SinkCreationErrorCommand{fmt::format("Failed to create FileSink: {}", e.what())});
    }
}

void Logger::shutdown()
{
    pImpl->shutdown();
}

void Logger::flush()
{
    if (pImpl->shutdown_requested_.load())
        return;

    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(FlushCommand{promise});
    future.wait();
}

void Logger::set_level(Level lvl)
{
    pImpl->level_.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return pImpl->level_.load(std::memory_order_relaxed);
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    pImpl->enqueue_command(SetErrorCallbackCommand{std::move(cb)});
}

bool Logger::should_log(Level lvl) const noexcept
{
    return static_cast<int>(lvl) >= static_cast<int>(pImpl->level_.load(std::memory_order_relaxed));
}

void Logger::enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept
{
    try
    {
        pImpl->enqueue_command(LogMessage{std::chrono::system_clock::now(), get_native_thread_id(),
                                          static_cast<int>(lvl), std::move(body)});
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[zonechat::Logger] enqueue failed: {}\n", e.what());
    }
}

// ============================================================================
// Lifecycle Integration
// ============================================================================

namespace
{
void do_logger_startup(const char * /*arg*/)
{
    Logger::instance();
}
void do_logger_shutdown(const char * /*arg*/)
{
    Logger::instance().shutdown();
}
} // namespace

ModuleDef Logger::GetLifecycleModule()
{
    ModuleDef module("Logger");
    module.set_startup(&do_logger_startup);
    module.set_shutdown(&do_logger_shutdown);
    return module;
}

} // namespace zonechat::utils
