/**
 * @file platform.cpp
 * @brief Cross-platform implementations of the `hostkeeper::platform` utilities.
 *
 * Process and thread ids, the current executable path, a monotonic clock and a process liveness
 * check. Preprocessor branches select the Windows, macOS, Linux or generic
 * POSIX implementation.
 */
#include "hk_base.hpp"

#include <chrono>
#include <thread>
#include <vector>

#if defined(HOSTKEEPER_IS_POSIX)
#include <cerrno>
#include <climits>
#include <signal.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>
#endif

#ifdef HOSTKEEPER_PLATFORM_FREEBSD
#include <sys/sysctl.h>
#endif

#if defined(HOSTKEEPER_PLATFORM_APPLE)
#include <libproc.h>
#include <mach-o/dyld.h>
#include <pthread.h>
#endif

#include <fmt/core.h>

namespace hostkeeper::platform
{

uint64_t get_pid()
{
#if defined(HOSTKEEPER_PLATFORM_WIN64)
    return static_cast<uint64_t>(GetCurrentProcessId());
#else
    return static_cast<uint64_t>(getpid());
#endif
}

/**
 * @brief Gets a platform-native thread ID.
 * @details Uses `GetCurrentThreadId`, `pthread_threadid_np` or `syscall(SYS_gettid)`; other
 *          systems hash `std::thread::id`.
 */
uint64_t get_native_thread_id() noexcept
{
#if defined(HOSTKEEPER_PLATFORM_WIN64)
    return static_cast<uint64_t>(::GetCurrentThreadId());
#elif defined(HOSTKEEPER_PLATFORM_APPLE)
    uint64_t tid = 0;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(HOSTKEEPER_PLATFORM_LINUX)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

std::string get_executable_name(bool include_path) noexcept
{
    try
    {
        std::string full_path;
#if defined(HOSTKEEPER_PLATFORM_WIN64)
        std::vector<wchar_t> buf(MAX_PATH);
        DWORD len = 0;
        for (;;)
        {
            len = GetModuleFileNameW(nullptr, buf.data(), static_cast<DWORD>(buf.size()));
            if (len == 0)
            {
                return "unknown_win";
            }
            if (len < buf.size() - 1)
            {
                break;
            }
            buf.resize(buf.size() * 2);
        }
        full_path = hostkeeper::format_tools::ws2s(std::wstring(buf.data(), len));
#elif defined(HOSTKEEPER_PLATFORM_LINUX)
        std::vector<char> buf(PATH_MAX);
        ssize_t count = readlink("/proc/self/exe", buf.data(), buf.size());
        if (count == -1)
        {
            return "unknown_linux";
        }
        full_path.assign(buf.data(), static_cast<size_t>(count));
#elif defined(HOSTKEEPER_PLATFORM_APPLE)
        char procbuf[PROC_PIDPATHINFO_MAXSIZE];
        if (proc_pidpath(getpid(), procbuf, sizeof(procbuf)) > 0)
        {
            char resolved[PATH_MAX];
            full_path = (realpath(procbuf, resolved) != nullptr) ? resolved : procbuf;
        }
        if (full_path.empty())
        {
            return "unknown_macos";
        }
#elif defined(HOSTKEEPER_PLATFORM_FREEBSD)
        int mib[4] = {CTL_KERN, KERN_PROC, KERN_PROC_PATHNAME, -1};
        size_t buffer_size = 0;
        if (sysctl(mib, 4, nullptr, &buffer_size, nullptr, 0) == -1)
        {
            return "unknown_freebsd";
        }
        std::vector<char> buf(buffer_size);
        if (sysctl(mib, 4, buf.data(), &buffer_size, nullptr, 0) == -1)
        {
            return "unknown_freebsd";
        }
        full_path.assign(buf.data(), buffer_size - 1);
#else
        (void)include_path;
        return "unknown";
#endif
        if (include_path)
        {
            return full_path;
        }
        return std::filesystem::path(full_path).filename().string();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "Warning: get_executable_name failed: {}.\n", e.what());
    }
    return "unknown";
}

bool is_process_alive(uint64_t pid) noexcept
{
    if (pid == 0)
    {
        return false;
    }

#if defined(HOSTKEEPER_PLATFORM_WIN64)
    HANDLE process =
        OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, static_cast<DWORD>(pid));
    if (process == NULL)
    {
        return GetLastError() != ERROR_INVALID_PARAMETER;
    }
    DWORD exit_code = 0;
    const BOOL ok = GetExitCodeProcess(process, &exit_code);
    CloseHandle(process);
    return ok && exit_code == STILL_ACTIVE;
#else
    if (kill(static_cast<pid_t>(pid), 0) == 0)
    {
        return true;
    }
    // ESRCH: no such process. EPERM: alive but not ours to signal.
    return errno != ESRCH;
#endif
}

uint64_t monotonic_time_ns() noexcept
{
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                     std::chrono::steady_clock::now().time_since_epoch())
                                     .count());
}

} // namespace hostkeeper::platform
