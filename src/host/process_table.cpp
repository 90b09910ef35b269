/**
 * @file process_table.cpp
 * @brief Native and command-line process listing and termination strategies.
 */
#include "host/process_table.hpp"
#include "hk_base.hpp"
#include "utils/logger.hpp"

#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>

#if defined(HOSTKEEPER_IS_POSIX)
#include <cerrno>
#include <signal.h>
#include <sys/types.h>
#endif

#if defined(HOSTKEEPER_PLATFORM_WIN64)
#include <tlhelp32.h>
#define popen _popen
#define pclose _pclose
#endif

namespace hostkeeper::host
{

namespace
{

constexpr size_t kLinuxCommLength = 15;

std::optional<uint64_t> parse_u64(std::string_view text)
{
    text = format_tools::trim(text);
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size())
        return std::nullopt;
    return value;
}

std::vector<std::string> read_popen_lines(const std::string &cmd, int *exit_status)
{
    std::vector<std::string> lines;
    FILE *fp = popen(cmd.c_str(), "r");
    if (!fp)
    {
        *exit_status = -1;
        return lines;
    }
    char buf[1024];
    while (fgets(buf, sizeof(buf), fp))
    {
        std::string s(buf);
        while (!s.empty() && (s.back() == '\n' || s.back() == '\r'))
            s.pop_back();
        lines.push_back(std::move(s));
    }
    *exit_status = pclose(fp);
    return lines;
}

#if defined(HOSTKEEPER_PLATFORM_LINUX)
// "/proc/<pid>/stat": "pid (comm) state ppid ...". comm may itself contain ") ".
std::optional<ProcessInfo> read_proc_stat(const std::filesystem::path &stat_path)
{
    std::ifstream in(stat_path);
    std::string line;
    if (!in || !std::getline(in, line))
        return std::nullopt;

    const auto open = line.find('(');
    const auto close = line.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close < open)
        return std::nullopt;

    auto pid = parse_u64(std::string_view(line).substr(0, open));
    // after ") " comes the one-letter state, then ppid
    std::string_view rest = std::string_view(line).substr(close + 1);
    rest = format_tools::trim(rest);
    const auto state_end = rest.find(' ');
    if (!pid || state_end == std::string_view::npos)
        return std::nullopt;
    rest = rest.substr(state_end + 1);
    auto ppid = parse_u64(rest.substr(0, rest.find(' ')));
    if (!ppid)
        return std::nullopt;

    return ProcessInfo{*pid, *ppid, line.substr(open + 1, close - open - 1)};
}
#endif

#if defined(HOSTKEEPER_PLATFORM_WIN64)
// "Node,Name,ParentProcessId,ProcessId" as printed by `wmic ... /format:csv`.
std::optional<ProcessInfo> parse_wmic_csv_line(std::string_view line)
{
    std::vector<std::string_view> fields;
    size_t start = 0;
    while (true)
    {
        const auto comma = line.find(',', start);
        fields.push_back(line.substr(start, comma == std::string_view::npos ? comma : comma - start));
        if (comma == std::string_view::npos)
            break;
        start = comma + 1;
    }
    if (fields.size() < 4)
        return std::nullopt;
    auto ppid = parse_u64(fields[2]);
    auto pid = parse_u64(fields[3]);
    if (!pid || !ppid)
        return std::nullopt;
    return ProcessInfo{*pid, *ppid, std::string(format_tools::trim(fields[1]))};
}
#endif

} // namespace

bool matches_image(std::string_view actual, std::string_view wanted) noexcept
{
    if (actual.empty() || wanted.empty())
        return false;
    if (format_tools::iequals(actual, wanted))
        return true;
    return actual.size() == kLinuxCommLength && wanted.size() > kLinuxCommLength &&
           format_tools::iequals(actual, wanted.substr(0, kLinuxCommLength));
}

std::optional<ProcessInfo> parse_ps_line(std::string_view line)
{
    line = format_tools::trim(line);
    const auto first_space = line.find_first_of(" \t");
    if (first_space == std::string_view::npos)
        return std::nullopt;
    auto pid = parse_u64(line.substr(0, first_space));

    std::string_view rest = format_tools::trim(line.substr(first_space));
    const auto second_space = rest.find_first_of(" \t");
    if (!pid || second_space == std::string_view::npos)
        return std::nullopt;
    auto ppid = parse_u64(rest.substr(0, second_space));
    std::string_view name = format_tools::trim(rest.substr(second_space));
    if (!ppid || name.empty())
        return std::nullopt;

    // `comm` may be a full path on some systems.
    const auto slash = name.find_last_of('/');
    if (slash != std::string_view::npos)
        name = name.substr(slash + 1);
    return ProcessInfo{*pid, *ppid, std::string(name)};
}

// ----------------------------------------------------------------------------
// Listers
// ----------------------------------------------------------------------------

std::optional<std::vector<ProcessInfo>> NativeProcessLister::list()
{
#if defined(HOSTKEEPER_PLATFORM_LINUX)
    std::error_code ec;
    std::filesystem::directory_iterator it("/proc", ec);
    if (ec)
    {
        LOGGER_DEBUG("native process list: cannot read /proc: {}", ec.message());
        return std::nullopt;
    }
    std::vector<ProcessInfo> out;
    for (const auto &entry : it)
    {
        const auto name = entry.path().filename().string();
        if (!parse_u64(name))
            continue;
        // A process may exit between the directory scan and the read.
        if (auto info = read_proc_stat(entry.path() / "stat"))
            out.push_back(std::move(*info));
    }
    return out;
#elif defined(HOSTKEEPER_PLATFORM_WIN64)
    HANDLE snap = CreateToolhelp32Snapshot(TH32CS_SNAPPROCESS, 0);
    if (snap == INVALID_HANDLE_VALUE)
    {
        LOGGER_DEBUG("native process list: CreateToolhelp32Snapshot failed ({})", GetLastError());
        return std::nullopt;
    }
    auto close_snap = basics::make_scope_guard([snap]() { CloseHandle(snap); });

    std::vector<ProcessInfo> out;
    PROCESSENTRY32W pe{};
    pe.dwSize = sizeof(pe);
    if (!Process32FirstW(snap, &pe))
        return std::nullopt;
    do
    {
        out.push_back(ProcessInfo{static_cast<uint64_t>(pe.th32ProcessID),
                                  static_cast<uint64_t>(pe.th32ParentProcessID),
                                  format_tools::ws2s(pe.szExeFile)});
    } while (Process32NextW(snap, &pe));
    return out;
#else
    // No procfs: leave it to the command-line strategy.
    return std::nullopt;
#endif
}

std::optional<std::vector<ProcessInfo>> CommandProcessLister::list()
{
#if defined(HOSTKEEPER_PLATFORM_WIN64)
    const std::string cmd = "wmic process get Name,ParentProcessId,ProcessId /format:csv 2>NUL";
#else
    const std::string cmd = "ps -A -o pid= -o ppid= -o comm= 2>/dev/null";
#endif
    int status = 0;
    auto lines = read_popen_lines(cmd, &status);
    if (status != 0 || lines.empty())
    {
        LOGGER_DEBUG("command process list: '{}' failed (status {})", cmd, status);
        return std::nullopt;
    }

    std::vector<ProcessInfo> out;
    out.reserve(lines.size());
    for (const auto &line : lines)
    {
#if defined(HOSTKEEPER_PLATFORM_WIN64)
        auto info = parse_wmic_csv_line(line);
#else
        auto info = parse_ps_line(line);
#endif
        if (info)
            out.push_back(std::move(*info));
    }
    return out;
}

// ----------------------------------------------------------------------------
// Killers
// ----------------------------------------------------------------------------

bool NativeProcessKiller::kill(uint64_t pid)
{
#if defined(HOSTKEEPER_PLATFORM_WIN64)
    HANDLE h = OpenProcess(PROCESS_TERMINATE, FALSE, static_cast<DWORD>(pid));
    if (!h)
    {
        const DWORD err = GetLastError();
        // ERROR_INVALID_PARAMETER: no such process
        return err == ERROR_INVALID_PARAMETER;
    }
    const BOOL ok = TerminateProcess(h, 1);
    CloseHandle(h);
    return ok == TRUE;
#elif defined(HOSTKEEPER_IS_POSIX)
    if (::kill(static_cast<pid_t>(pid), SIGKILL) == 0)
        return true;
    return errno == ESRCH;
#else
    (void)pid;
    return false;
#endif
}

bool CommandProcessKiller::kill(uint64_t pid)
{
#if defined(HOSTKEEPER_PLATFORM_WIN64)
    const std::string cmd = fmt::format("taskkill /F /T /PID {} >NUL 2>&1", pid);
#else
    const std::string cmd = fmt::format("kill -9 {} >/dev/null 2>&1", pid);
#endif
    const int status = std::system(cmd.c_str());
    if (status != 0)
    {
        LOGGER_DEBUG("command kill: '{}' returned {}", cmd, status);
        return !platform::is_process_alive(pid);
    }
    return true;
}

ProcessListerChain default_process_listers()
{
    return {std::make_shared<NativeProcessLister>(), std::make_shared<CommandProcessLister>()};
}

ProcessKillerChain default_process_killers()
{
    return {std::make_shared<NativeProcessKiller>(), std::make_shared<CommandProcessKiller>()};
}

} // namespace hostkeeper::host
