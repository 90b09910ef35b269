#pragma once
/**
 * @file hk_platform.hpp
 * @brief Layer 0: Platform detection, Windows headers, and process/thread utilities.
 *
 * Every file that needs the platform macros (HOSTKEEPER_PLATFORM_WIN64, HOSTKEEPER_IS_POSIX,
 * etc.) or the Windows headers includes this. It is self-contained.
 *
 * Build-system macros (PLATFORM_WIN64, PLATFORM_LINUX, ...) win; compiler predefined macros
 * are the fallback.
 */
#include <cstddef>
#include <cstdint>
#include <string>

#if defined(PLATFORM_WIN64)
#define HOSTKEEPER_PLATFORM_WIN64 1
#elif defined(PLATFORM_APPLE)
#define HOSTKEEPER_PLATFORM_APPLE 1
#elif defined(PLATFORM_FREEBSD)
#define HOSTKEEPER_PLATFORM_FREEBSD 1
#elif defined(PLATFORM_LINUX)
#define HOSTKEEPER_PLATFORM_LINUX 1
#elif defined(PLATFORM_UNKNOWN)
#define HOSTKEEPER_PLATFORM_UNKNOWN 1
#else
#if defined(_WIN64)
#define HOSTKEEPER_PLATFORM_WIN64 1
#elif defined(__APPLE__) && defined(__MACH__)
#define HOSTKEEPER_PLATFORM_APPLE 1
#elif defined(__FreeBSD__)
#define HOSTKEEPER_PLATFORM_FREEBSD 1
#elif defined(__linux__)
#define HOSTKEEPER_PLATFORM_LINUX 1
#else
#define HOSTKEEPER_PLATFORM_UNKNOWN 1
#endif
#endif

#if defined(HOSTKEEPER_PLATFORM_WIN64)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

// Convenience booleans for source code usage:
#if defined(HOSTKEEPER_PLATFORM_WIN64)
#define HOSTKEEPER_IS_WINDOWS 1
#undef HOSTKEEPER_IS_POSIX
#elif defined(HOSTKEEPER_PLATFORM_APPLE) || defined(HOSTKEEPER_PLATFORM_FREEBSD) ||                \
    defined(HOSTKEEPER_PLATFORM_LINUX)
#undef HOSTKEEPER_IS_WINDOWS
#define HOSTKEEPER_IS_POSIX 1
#else
#undef HOSTKEEPER_IS_WINDOWS
#undef HOSTKEEPER_IS_POSIX
#endif

// --- Require C++20 or later --------------------------------------------------
// For GCC/Clang use __cplusplus; for MSVC use _MSVC_LANG (MSVC sets __cplusplus only when
// /Zc:__cplusplus is enabled).
#if defined(_MSC_VER)
#if !defined(_MSVC_LANG) || (_MSVC_LANG < 202002L)
#error "This project requires C++20 or later. Please compile with /std:c++20 or newer (MSVC)."
#endif
#else
#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif
#endif

#include "hostkeeper_utils_export.h"

namespace hostkeeper::platform
{

/**
 * @brief Gets the native thread ID for the calling thread.
 * @return A 64-bit unsigned integer representing the thread ID.
 */
HOSTKEEPER_UTILS_EXPORT uint64_t get_native_thread_id() noexcept;
/**
 * @brief Gets the process ID (PID) for the current process.
 */
HOSTKEEPER_UTILS_EXPORT uint64_t get_pid();
/**
 * @brief Gets the name of the current executable.
 * @param include_path If `true`, returns the full absolute path to the executable.
 *                     If `false` (default), returns only the filename.
 * @return The executable name, or "unknown" on failure.
 */
HOSTKEEPER_UTILS_EXPORT std::string get_executable_name(bool include_path = false) noexcept;

/**
 * @brief Checks if a process with the given PID is currently alive.
 * @details Windows: OpenProcess() + GetExitCodeProcess(). POSIX: kill(pid, 0) with errno check.
 * @note PID 0 always returns false. On POSIX, EPERM is treated as "alive".
 */
HOSTKEEPER_UTILS_EXPORT bool is_process_alive(uint64_t pid) noexcept;

/**
 * @brief Monotonic timestamp in nanoseconds (steady_clock). Use for deltas only.
 */
HOSTKEEPER_UTILS_EXPORT uint64_t monotonic_time_ns() noexcept;

} // namespace hostkeeper::platform
