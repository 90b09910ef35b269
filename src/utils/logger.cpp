/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the asynchronous logger.
 *
 * Producers enqueue `Command`s; one worker thread drains the queue in batches. Log messages
 * take the fast path straight to the sink; control commands (sink switch, flush, callback
 * registration) are visited in order and acknowledged through promises so the public setters
 * can block until they take effect. Write errors are reported through a user callback run on a
 * separate dispatcher thread so a slow callback never stalls logging.
 ******************************************************************************/

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

#include "hk_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"

#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"

namespace hostkeeper::utils
{

enum class LoggerState
{
    Uninitialized,
    Initialized,
    ShuttingDown,
    Shutdown
};

static std::atomic<LoggerState> g_logger_state{LoggerState::Uninitialized};

// Configuration entry points go through here: using them before lifecycle startup is a bug.
static bool logger_is_loggable(const char *function_name)
{
    const auto state = g_logger_state.load(std::memory_order_acquire);
    if (state == LoggerState::Uninitialized)
    {
        HK_PANIC("Logger method '{}' was called before the Logger module was "
                 "initialized via LifecycleManager. Aborting.",
                 function_name);
    }
    return state == LoggerState::Initialized;
}

/**
 * @class CallbackDispatcher
 * @brief Runs user callbacks on their own thread, in posting order.
 */
class CallbackDispatcher
{
  public:
    CallbackDispatcher() : m_worker([this] { run(); }) {}
    ~CallbackDispatcher() { shutdown(); }

    void post(std::function<void()> fn)
    {
        if (m_shutdown_requested.load(std::memory_order_relaxed))
            return;
        {
            std::lock_guard<std::mutex> lg(m_mutex);
            m_queue.push_back(std::move(fn));
        }
        m_cv.notify_one();
    }

    void shutdown()
    {
        {
            std::lock_guard<std::mutex> lg(m_mutex);
            if (m_shutdown_requested.exchange(true))
                return;
        }
        m_cv.notify_one();
        if (m_worker.joinable())
            m_worker.join();
    }

  private:
    void run()
    {
        for (;;)
        {
            std::function<void()> fn;
            {
                std::unique_lock<std::mutex> ul(m_mutex);
                m_cv.wait(ul, [this] { return m_shutdown_requested.load() || !m_queue.empty(); });
                if (m_queue.empty())
                    return;
                fn = std::move(m_queue.front());
                m_queue.pop_front();
            }
            try
            {
                fn();
            }
            catch (const std::exception &e)
            {
                HK_DEBUG("logger error callback threw: {}", e.what());
            }
        }
    }

    std::deque<std::function<void()>> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::atomic<bool> m_shutdown_requested{false};
    std::thread m_worker;
};

// Command Definitions
struct SetSinkCommand
{
    std::unique_ptr<Sink> new_sink;
    std::shared_ptr<std::promise<bool>> promise;
};
struct SinkCreationErrorCommand
{
    std::string error_message;
    std::shared_ptr<std::promise<bool>> promise;
};
struct FlushCommand
{
    std::shared_ptr<std::promise<bool>> promise;
};
struct SetErrorCallbackCommand
{
    std::function<void(const std::string &)> callback;
    std::shared_ptr<std::promise<bool>> promise;
};

using Command =
    std::variant<LogMessage, SetSinkCommand, SinkCreationErrorCommand, FlushCommand,
                 SetErrorCallbackCommand>;

// A promise may already be satisfied when shutdown races a setter; never let that terminate.
static void promise_set_safe(const std::shared_ptr<std::promise<bool>> &p, bool value)
{
    if (!p)
        return;
    try
    {
        p->set_value(value);
    }
    catch (const std::future_error &)
    {
        // already satisfied
    }
}

static LogMessage make_internal_message(Logger::Level lvl, fmt::memory_buffer &&body)
{
    return LogMessage{.timestamp = std::chrono::system_clock::now(),
                      .process_id = platform::get_pid(),
                      .thread_id = platform::get_native_thread_id(),
                      .level = static_cast<int>(lvl),
                      .body = std::move(body)};
}

struct Logger::Impl
{
    Impl() : sink_(std::make_unique<ConsoleSink>()) {}
    ~Impl()
    {
        if (worker_thread_.joinable())
        {
            HK_DEBUG("Logger Impl destroyed without lifecycle shutdown; joining worker now.");
            shutdown();
        }
    }

    void start_worker();
    void worker_loop();
    bool enqueue_command(Command &&cmd);
    void reject_command(Command &cmd);
    void report_error(const std::string &message);
    void shutdown();

    std::function<void(const std::string &)> error_callback_;
    std::unique_ptr<Sink> sink_;
    size_t max_queue_size_{10000};
    std::vector<Command> queue_;
    std::condition_variable cv_;
    std::mutex queue_mutex_;
    std::mutex sink_mutex_;
    CallbackDispatcher callback_dispatcher_;
    std::thread worker_thread_;
    std::atomic<Logger::Level> level_{Logger::Level::L_INFO};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<size_t> messages_dropped_{0};
};

void Logger::Impl::start_worker()
{
    if (!worker_thread_.joinable())
    {
        worker_thread_ = std::thread(&Logger::Impl::worker_loop, this);
    }
}

void Logger::Impl::reject_command(Command &cmd)
{
    std::visit(
        [](auto &&arg)
        {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (!std::is_same_v<T, LogMessage>)
            {
                promise_set_safe(arg.promise, false);
            }
        },
        cmd);
}

bool Logger::Impl::enqueue_command(Command &&cmd)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.load(std::memory_order_acquire))
        {
            reject_command(cmd);
            return false;
        }
        // Soft limit drops log lines only; control commands are allowed up to twice the limit.
        const bool is_log = std::holds_alternative<LogMessage>(cmd);
        if ((is_log && queue_.size() >= max_queue_size_) || queue_.size() >= max_queue_size_ * 2)
        {
            messages_dropped_.fetch_add(1, std::memory_order_relaxed);
            reject_command(cmd);
            return false;
        }
        queue_.emplace_back(std::move(cmd));
    }
    cv_.notify_one();
    return true;
}

void Logger::Impl::report_error(const std::string &message)
{
    if (error_callback_)
    {
        auto cb = error_callback_;
        callback_dispatcher_.post([cb, message]() { cb(message); });
    }
    else
    {
        HK_DEBUG("Logger error with no callback registered: {}", message);
    }
}

void Logger::Impl::worker_loop()
{
    std::vector<Command> local_queue;

    for (;;)
    {
        bool stopping = false;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_.load(); });
            local_queue.swap(queue_);
            stopping = shutdown_requested_.load() && local_queue.empty();
        }

        if (const size_t dropped = messages_dropped_.exchange(0, std::memory_order_relaxed);
            dropped > 0)
        {
            std::lock_guard<std::mutex> sink_lock(sink_mutex_);
            if (sink_)
            {
                try
                {
                    sink_->write(make_internal_message(
                                     Logger::Level::L_WARNING,
                                     format_tools::make_buffer(
                                         "Logger queue overflow: {} messages were dropped.", dropped)),
                                 Sink::ASYNC_WRITE);
                }
                catch (const std::exception &e)
                {
                    report_error(fmt::format("Logger write error: {}", e.what()));
                }
            }
        }

        for (auto &command : local_queue)
        {
            try
            {
                if (auto *msg = std::get_if<LogMessage>(&command))
                {
                    std::lock_guard<std::mutex> sink_lock(sink_mutex_);
                    if (sink_ && msg->level >= static_cast<int>(level_.load(std::memory_order_relaxed)))
                    {
                        sink_->write(*msg, Sink::ASYNC_WRITE);
                    }
                    continue;
                }

                std::visit(
                    [this](auto &&arg)
                    {
                        using T = std::decay_t<decltype(arg)>;
                        if constexpr (std::is_same_v<T, SetSinkCommand>)
                        {
                            std::lock_guard<std::mutex> sink_lock(sink_mutex_);
                            const std::string old_desc = sink_ ? sink_->description() : "null";
                            const std::string new_desc =
                                arg.new_sink ? arg.new_sink->description() : "null";
                            if (sink_)
                            {
                                sink_->write(make_internal_message(
                                                 Logger::Level::L_SYSTEM,
                                                 format_tools::make_buffer(
                                                     "Switching log sink to: {}", new_desc)),
                                             Sink::ASYNC_WRITE);
                                sink_->flush();
                            }
                            sink_ = std::move(arg.new_sink);
                            if (sink_)
                            {
                                sink_->write(make_internal_message(
                                                 Logger::Level::L_SYSTEM,
                                                 format_tools::make_buffer(
                                                     "Log sink switched from: {}", old_desc)),
                                             Sink::ASYNC_WRITE);
                            }
                            promise_set_safe(arg.promise, true);
                        }
                        else if constexpr (std::is_same_v<T, SinkCreationErrorCommand>)
                        {
                            report_error(arg.error_message);
                            promise_set_safe(arg.promise, false);
                        }
                        else if constexpr (std::is_same_v<T, FlushCommand>)
                        {
                            std::lock_guard<std::mutex> sink_lock(sink_mutex_);
                            if (sink_)
                                sink_->flush();
                            promise_set_safe(arg.promise, true);
                        }
                        else if constexpr (std::is_same_v<T, SetErrorCallbackCommand>)
                        {
                            error_callback_ = std::move(arg.callback);
                            promise_set_safe(arg.promise, true);
                        }
                    },
                    command);
            }
            catch (const std::exception &e)
            {
                report_error(fmt::format("Logger worker error: {}", e.what()));
                reject_command(command);
            }
        }
        local_queue.clear();

        if (stopping)
        {
            std::lock_guard<std::mutex> sink_lock(sink_mutex_);
            if (sink_)
            {
                try
                {
                    sink_->write(make_internal_message(Logger::Level::L_SYSTEM,
                                                       format_tools::make_buffer(
                                                           "Logger is shutting down.")),
                                 Sink::ASYNC_WRITE);
                    sink_->flush();
                }
                catch (const std::exception &e)
                {
                    HK_DEBUG("Logger final write failed: {}", e.what());
                }
            }
            g_logger_state.store(LoggerState::Shutdown, std::memory_order_release);
            return;
        }
    }
}

void Logger::Impl::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.exchange(true))
            return;
    }
    cv_.notify_one();
    if (worker_thread_.joinable())
    {
        worker_thread_.join();
    }
    callback_dispatcher_.shutdown();
}

// ============================================================================
// Logger public API
// ============================================================================

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}
Logger::~Logger() = default;

Logger &Logger::instance()
{
    static Logger instance;
    return instance;
}

bool Logger::lifecycle_initialized() noexcept
{
    return g_logger_state.load(std::memory_order_acquire) != LoggerState::Uninitialized;
}

Logger::Level Logger::level_from_string(std::string_view text, Level fallback) noexcept
{
    const auto t = format_tools::trim(text);
    if (format_tools::iequals(t, "trace"))
        return Level::L_TRACE;
    if (format_tools::iequals(t, "debug"))
        return Level::L_DEBUG;
    if (format_tools::iequals(t, "info"))
        return Level::L_INFO;
    if (format_tools::iequals(t, "warn") || format_tools::iequals(t, "warning"))
        return Level::L_WARNING;
    if (format_tools::iequals(t, "error"))
        return Level::L_ERROR;
    if (format_tools::iequals(t, "system"))
        return Level::L_SYSTEM;
    return fallback;
}

bool Logger::set_console()
{
    if (!logger_is_loggable("Logger::set_console"))
        return false;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetSinkCommand{std::make_unique<ConsoleSink>(), promise});
    return future.get();
}

bool Logger::set_logfile(const std::string &utf8_path, bool use_flock)
{
    if (!logger_is_loggable("Logger::set_logfile"))
        return false;
    std::unique_ptr<Sink> sink;
    std::string failure;
    try
    {
        const auto parent = std::filesystem::path(utf8_path).parent_path();
        if (!parent.empty())
        {
            std::filesystem::create_directories(parent);
        }
        sink = std::make_unique<FileSink>(utf8_path, use_flock);
    }
    catch (const std::exception &e)
    {
        failure = fmt::format("Failed to create FileSink: {}", e.what());
    }

    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    if (sink)
        pImpl->enqueue_command(SetSinkCommand{std::move(sink), promise});
    else
        pImpl->enqueue_command(SinkCreationErrorCommand{std::move(failure), promise});
    return future.get();
}

void Logger::shutdown()
{
    if (!lifecycle_initialized())
        return;
    pImpl->shutdown();
}

void Logger::flush()
{
    if (!logger_is_loggable("Logger::flush"))
        return;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(FlushCommand{promise});
    (void)future.get();
}

void Logger::set_level(Level lvl)
{
    if (!logger_is_loggable("Logger::set_level"))
        return;
    pImpl->level_.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    if (!logger_is_loggable("Logger::level"))
        return Level::L_INFO;
    return pImpl->level_.load(std::memory_order_relaxed);
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    if (!logger_is_loggable("Logger::set_write_error_callback"))
        return;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetErrorCallbackCommand{std::move(cb), promise});
    (void)future.get();
}

bool Logger::should_log(Level lvl) const noexcept
{
    if (g_logger_state.load(std::memory_order_acquire) != LoggerState::Initialized)
        return false;
    return static_cast<int>(lvl) >= static_cast<int>(pImpl->level_.load(std::memory_order_relaxed));
}

bool Logger::enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept
{
    try
    {
        return pImpl->enqueue_command(make_internal_message(lvl, std::move(body)));
    }
    catch (const std::exception &e)
    {
        HK_DEBUG("Logger enqueue failed: {}", e.what());
        return false;
    }
}

bool Logger::enqueue_log(Level lvl, std::string &&body) noexcept
{
    try
    {
        return enqueue_log(lvl, format_tools::make_buffer("{}", body));
    }
    catch (const std::exception &e)
    {
        HK_DEBUG("Logger enqueue failed: {}", e.what());
        return false;
    }
}

// C-style callbacks for the lifecycle manager.
void do_logger_startup(const char *arg)
{
    (void)arg;
    Logger::instance().pImpl->start_worker();
    g_logger_state.store(LoggerState::Initialized, std::memory_order_release);
}

void do_logger_shutdown(const char *arg)
{
    (void)arg;
    LoggerState expected = LoggerState::Initialized;
    if (g_logger_state.compare_exchange_strong(expected, LoggerState::ShuttingDown,
                                               std::memory_order_acq_rel))
    {
        Logger::instance().shutdown();
        g_logger_state.store(LoggerState::Shutdown, std::memory_order_release);
    }
}

ModuleDef Logger::GetLifecycleModule()
{
    ModuleDef module("hostkeeper::utils::Logger");
    module.set_startup(&do_logger_startup);
    module.set_shutdown(&do_logger_shutdown, std::chrono::milliseconds(5000));
    return module;
}

} // namespace hostkeeper::utils
