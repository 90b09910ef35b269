// String, time and path helpers shared by the logger and the host layer.
#pragma once
#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "hostkeeper_utils_export.h"

namespace hostkeeper::format_tools
{

/**
 * @brief Timestamp with microsecond resolution, "YYYY-MM-DD HH:MM:SS.ffffff".
 */
HOSTKEEPER_UTILS_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Strips leading and trailing whitespace (" \t\n\r\f\v").
 */
HOSTKEEPER_UTILS_EXPORT std::string_view trim(std::string_view str) noexcept;

/**
 * @brief ASCII lower-casing. Bytes >= 0x80 are passed through untouched so UTF-8 survives.
 */
HOSTKEEPER_UTILS_EXPORT std::string to_lower_ascii(std::string_view str);

/**
 * @brief Case-insensitive (ASCII) equality.
 */
HOSTKEEPER_UTILS_EXPORT bool iequals(std::string_view a, std::string_view b) noexcept;

/**
 * @brief Interprets "1/true/yes/on" and "0/false/no/off" (any case).
 * @param fallback Returned for anything else, including an empty string.
 */
HOSTKEEPER_UTILS_EXPORT bool parse_bool(std::string_view text, bool fallback) noexcept;

// Windows-only conversions. The POSIX builds return empty strings.
HOSTKEEPER_UTILS_EXPORT std::wstring win32_to_long_path(const std::filesystem::path &);
HOSTKEEPER_UTILS_EXPORT std::wstring s2ws(const std::string &s);
HOSTKEEPER_UTILS_EXPORT std::string ws2s(const std::wstring &w);

template <typename... Args>
fmt::memory_buffer make_buffer(fmt::format_string<Args...> fmt_str, Args &&...args)
{
    fmt::memory_buffer mb;
    mb.reserve(128);
    fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
    return mb;
}

/**
 * @brief Returns the component after the last '/' or '\\' (the whole string if none).
 */
constexpr std::string_view filename_only(std::string_view file_path) noexcept
{
    const auto last_slash = file_path.find_last_of('/');
    const auto last_backslash = file_path.find_last_of('\\');
    std::string_view::size_type pos = std::string_view::npos;
    if (last_slash == std::string_view::npos)
    {
        pos = last_backslash;
    }
    else if (last_backslash == std::string_view::npos)
    {
        pos = last_slash;
    }
    else
    {
        pos = last_slash > last_backslash ? last_slash : last_backslash;
    }
    return pos == std::string_view::npos ? file_path : file_path.substr(pos + 1);
}

} // namespace hostkeeper::format_tools
