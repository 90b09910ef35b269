// -- Debugging utilities: stack trace printing, panic and debug messages
#pragma once

#include <cstdio>
#include <cstdlib>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "hostkeeper_utils_export.h"
#include "utils/format_tools.hpp"

/**
 * @brief "file:line:function" for a source location.
 */
inline std::string SRCLOC_TO_STR(std::source_location loc)
{
    return fmt::format("{}:{}:{}", hostkeeper::format_tools::filename_only(loc.file_name()),
                       loc.line(), loc.function_name());
}

namespace hostkeeper::debug
{

/**
 * @brief Prints the current call stack to stderr.
 * @warning Not async-signal-safe (allocates, formats).
 */
HOSTKEEPER_UTILS_EXPORT void print_stack_trace() noexcept;

/**
 * @brief Prints a formatted fatal message with its source location and a stack trace, then aborts.
 *
 * Reserved for broken invariants in the utility layers (lifecycle misuse, logger used before
 * startup). Recoverable conditions are reported through exceptions or Result values instead.
 */
template <typename... Args>
[[noreturn]] inline void panic(std::source_location loc, fmt::format_string<Args...> fmt_str,
                               Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[PANIC] {} -- {}\n", SRCLOC_TO_STR(loc), body);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[PANIC] -- formatting the panic message failed: %s\n", e.what());
    }
    std::fflush(stderr);
    print_stack_trace();
    std::abort();
}

template <typename... Args>
inline void debug_msg(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[DBG]  {}\n", body);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[DBG]  FORMAT ERROR DURING DEBUG_MSG: %s\n", e.what());
        std::fflush(stderr);
    }
}

} // namespace hostkeeper::debug

// ---------------- thin macros for convenience --------------
#ifndef HK_LOC_HERE_STR
#define HK_LOC_HERE_STR (SRCLOC_TO_STR(std::source_location::current()))
#endif

#ifndef HK_PANIC
#define HK_PANIC(fmt, ...)                                                                         \
    ::hostkeeper::debug::panic(std::source_location::current(),                                    \
                               FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#endif

#ifndef HK_DEBUG
#if defined(HOSTKEEPER_ENABLE_DEBUG_MESSAGES)
#define HK_DEBUG(fmt, ...) ::hostkeeper::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
#define HK_DEBUG(fmt, ...)                                                                         \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif
