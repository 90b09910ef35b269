// format_tools.cpp
#include "hk_base.hpp"

#include <cctype>

namespace hostkeeper::format_tools
{

// Two-step formatting: seconds through fmt's chrono support, then the microsecond fraction.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;
    auto sec_part = fmt::format("{:%Y-%m-%d %H:%M:%S}", secs);
    return fmt::format("{}.{:06d}", sec_part, fractional_us);
}

std::string_view trim(std::string_view str) noexcept
{
    constexpr std::string_view whitespace = " \t\n\r\f\v";
    const auto first = str.find_first_not_of(whitespace);
    if (first == std::string_view::npos)
    {
        return str.substr(0, 0);
    }
    const auto last = str.find_last_not_of(whitespace);
    return str.substr(first, last - first + 1);
}

std::string to_lower_ascii(std::string_view str)
{
    std::string out(str);
    for (auto &c : out)
    {
        if (c >= 'A' && c <= 'Z')
            c = static_cast<char>(c - 'A' + 'a');
    }
    return out;
}

bool iequals(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i)
    {
        char x = a[i];
        char y = b[i];
        if (x >= 'A' && x <= 'Z')
            x = static_cast<char>(x - 'A' + 'a');
        if (y >= 'A' && y <= 'Z')
            y = static_cast<char>(y - 'A' + 'a');
        if (x != y)
            return false;
    }
    return true;
}

bool parse_bool(std::string_view text, bool fallback) noexcept
{
    const auto t = trim(text);
    if (iequals(t, "1") || iequals(t, "true") || iequals(t, "yes") || iequals(t, "on"))
        return true;
    if (iequals(t, "0") || iequals(t, "false") || iequals(t, "no") || iequals(t, "off"))
        return false;
    return fallback;
}

#if defined(HOSTKEEPER_PLATFORM_WIN64)

/// Convert a path to Win32 long-path form with a \\?\ or \\?\UNC\ prefix.
/// Returns an empty string when the path cannot be made absolute.
std::wstring win32_to_long_path(const std::filesystem::path &p_in)
{
    std::error_code ec;
    std::filesystem::path abs = p_in;
    if (!abs.is_absolute())
    {
        abs = std::filesystem::absolute(abs, ec);
        if (ec)
        {
            return std::wstring{};
        }
    }
    std::wstring ws = abs.wstring();
    for (auto &c : ws)
        if (c == L'/')
            c = L'\\';

    if (ws.rfind(L"\\\\?\\", 0) == 0)
    {
        return ws;
    }
    if (ws.rfind(L"\\\\", 0) == 0)
    {
        return std::wstring(L"\\\\?\\UNC\\") + ws.substr(2);
    }
    return std::wstring(L"\\\\?\\") + ws;
}

std::wstring s2ws(const std::string &s)
{
    if (s.empty())
        return {};
    int required = MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, s.data(),
                                       static_cast<int>(s.size()), nullptr, 0);
    if (required <= 0)
        return {};
    std::wstring w(required, L'\0');
    if (MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, s.data(), static_cast<int>(s.size()),
                            w.data(), required) == 0)
        return {};
    return w;
}

std::string ws2s(const std::wstring &w)
{
    if (w.empty())
        return {};
    int required = WideCharToMultiByte(CP_UTF8, WC_ERR_INVALID_CHARS, w.data(),
                                       static_cast<int>(w.size()), nullptr, 0, nullptr, nullptr);
    if (required <= 0)
        return {};
    std::string s(required, '\0');
    if (WideCharToMultiByte(CP_UTF8, WC_ERR_INVALID_CHARS, w.data(), static_cast<int>(w.size()),
                            s.data(), required, nullptr, nullptr) == 0)
        return {};
    return s;
}

#else

std::wstring win32_to_long_path([[maybe_unused]] const std::filesystem::path &path)
{
    return {};
}

std::wstring s2ws([[maybe_unused]] const std::string &str)
{
    return {};
}

std::string ws2s([[maybe_unused]] const std::wstring &wstr)
{
    return {};
}

#endif

} // namespace hostkeeper::format_tools
