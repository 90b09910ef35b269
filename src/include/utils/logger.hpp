#pragma once
/**
 * @file logger.hpp
 * @brief Process-wide asynchronous logger behind the LOGGER_* macros.
 *
 * The caller's thread formats the message; a worker thread owns the sink (stderr unless a log
 * file is configured) and writes in queue order. Sink switches and flushes are queued as
 * commands too, so a flush returns only after every earlier message reached the sink.
 *
 * Start it as a lifecycle module:
 *
 * @code
 *  hostkeeper::utils::LifecycleGuard app(hostkeeper::utils::Logger::GetLifecycleModule());
 *  LOGGER_INFO("attached to host, {} documents open", count);
 * @endcode
 *
 * Messages logged while the logger is not running are discarded. Changing the sink or level
 * before startup panics.
 */

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "hostkeeper_utils_export.h"
#include "utils/module_def.hpp"

// Levels below this are compiled out of the LOGGER_* macros (0 keeps everything).
#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0
#endif

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace hostkeeper::utils
{

class HOSTKEEPER_UTILS_EXPORT Logger
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

    /// @brief Lifecycle module "hostkeeper::utils::Logger"; its startup launches the worker.
    static ModuleDef GetLifecycleModule();

    /// @brief Stays `true` after shutdown.
    static bool lifecycle_initialized() noexcept;

    /// @brief "trace" .. "system", case-insensitive, "warn" accepted; @p fallback otherwise.
    static Level level_from_string(std::string_view text, Level fallback = Level::L_INFO) noexcept;

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;

    ~Logger();

    // Sink changes wait for the worker to apply them.
    bool set_console();

    /**
     * @brief Switches to appending to @p utf8_path.
     * @param use_flock take flock() around each write (POSIX).
     * @return false when the file cannot be opened; the current sink is kept and the reason
     *         goes to the write-error callback.
     */
    bool set_logfile(const std::string &utf8_path, bool use_flock = false);

    void flush();
    void shutdown();

    void set_level(Level lvl);
    Level level() const;

    /// @brief Called from a separate thread with sink open and write failures.
    void set_write_error_callback(std::function<void(const std::string &)> cb);

    template <Level lvl, typename... Args>
    void write(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        if constexpr (static_cast<int>(lvl) >= LOGGER_COMPILE_LEVEL)
        {
            if (!should_log(lvl))
                return;
            try
            {
                fmt::memory_buffer body;
                fmt::format_to(std::back_inserter(body), fmt_str, std::forward<Args>(args)...);
                enqueue_log(lvl, std::move(body));
            }
            catch (const std::exception &ex)
            {
                enqueue_log(lvl, std::string("[FORMAT ERROR] ") + ex.what());
            }
        }
    }

  private:
    Logger();

    struct Impl;
    std::unique_ptr<Impl> pImpl;

    friend void do_logger_startup(const char *);

    bool enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept;
    bool enqueue_log(Level lvl, std::string &&body) noexcept;
    bool should_log(Level lvl) const noexcept;
};

} // namespace hostkeeper::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

#define HK_LOG_AT(level, fmt, ...)                                                                 \
    ::hostkeeper::utils::Logger::instance().write<::hostkeeper::utils::Logger::Level::level>(      \
        FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)

#define LOGGER_TRACE(fmt, ...) HK_LOG_AT(L_TRACE, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...) HK_LOG_AT(L_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...) HK_LOG_AT(L_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...) HK_LOG_AT(L_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...) HK_LOG_AT(L_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...) HK_LOG_AT(L_SYSTEM, fmt __VA_OPT__(, ) __VA_ARGS__)
