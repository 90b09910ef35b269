#include "hk_base.hpp"
#include "utils/logger_sinks/file_sink.hpp"

#include <cerrno>
#include <stdexcept>
#include <system_error>

#ifndef HOSTKEEPER_PLATFORM_WIN64
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#endif

namespace hostkeeper::utils
{

namespace
{
std::error_code last_error() noexcept
{
#ifdef HOSTKEEPER_PLATFORM_WIN64
    return {static_cast<int>(GetLastError()), std::system_category()};
#else
    return {errno, std::generic_category()};
#endif
}
} // namespace

FileSink::FileSink(const std::string &path, bool use_flock) : m_path(path), m_use_flock(use_flock)
{
#ifdef HOSTKEEPER_PLATFORM_WIN64
    const std::wstring wide = format_tools::win32_to_long_path(m_path);
    HANDLE h = CreateFileW(wide.c_str(), FILE_APPEND_DATA,
                           FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr,
                           OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (h == INVALID_HANDLE_VALUE)
        throw std::runtime_error(
            fmt::format("Failed to open log file '{}': {}", path, last_error().message()));
    m_handle = h;
#else
    m_fd = ::open(m_path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (m_fd == -1)
        throw std::runtime_error(
            fmt::format("Failed to open log file '{}': {}", path, last_error().message()));
#endif
}

FileSink::~FileSink()
{
#ifdef HOSTKEEPER_PLATFORM_WIN64
    if (m_handle != nullptr)
        CloseHandle(m_handle);
#else
    if (m_fd != -1)
        ::close(m_fd);
#endif
}

void FileSink::append(const std::string &line)
{
#ifdef HOSTKEEPER_PLATFORM_WIN64
    DWORD written = 0;
    if (!WriteFile(m_handle, line.data(), static_cast<DWORD>(line.size()), &written, nullptr) ||
        written != line.size())
        throw std::system_error(last_error(), "log file write failed");
#else
    if (m_use_flock)
        ::flock(m_fd, LOCK_EX);
    const char *data = line.data();
    size_t left = line.size();
    int error = 0;
    while (left > 0)
    {
        const ssize_t n = ::write(m_fd, data, left);
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
        {
            error = n < 0 ? errno : EIO;
            break;
        }
        data += n;
        left -= static_cast<size_t>(n);
    }
    if (m_use_flock)
        ::flock(m_fd, LOCK_UN);
    if (error != 0)
        throw std::system_error(error, std::generic_category(), "log file write failed");
#endif
}

void FileSink::write(const LogMessage &msg, Sink::WRITE_MODE mode)
{
    append(format_logmsg(msg, mode));
}

void FileSink::flush()
{
#ifdef HOSTKEEPER_PLATFORM_WIN64
    FlushFileBuffers(m_handle);
#else
    ::fsync(m_fd);
#endif
}

std::string FileSink::description() const
{
    return "File: " + m_path.string();
}

} // namespace hostkeeper::utils
