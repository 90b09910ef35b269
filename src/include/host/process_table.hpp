#pragma once
/**
 * @file process_table.hpp
 * @brief Enumeration and forced termination of OS processes, as ranked strategy chains.
 *
 * `ProcessGuardian` needs two things from the OS: the list of running processes (pid, parent,
 * image name) and a way to kill one. Each has a native strategy (procfs / Toolhelp, signals /
 * TerminateProcess) and a command-line fallback (`ps` / `wmic`, `kill -9` / `taskkill`). The
 * guardian walks its chain in order and uses the first strategy that succeeds; tests inject
 * fakes in place of both.
 */

#include "hostkeeper_host_export.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace hostkeeper::host
{

struct ProcessInfo
{
    uint64_t pid = 0;
    uint64_t parent_pid = 0;
    std::string image_name; ///< Executable name without directory ("EXCEL.EXE", "excel").
};

class ProcessLister
{
  public:
    virtual ~ProcessLister() = default;
    virtual std::string name() const = 0;
    /// @return nullopt when this strategy is unavailable or failed.
    virtual std::optional<std::vector<ProcessInfo>> list() = 0;
};

class ProcessKiller
{
  public:
    virtual ~ProcessKiller() = default;
    virtual std::string name() const = 0;
    /**
     * @brief Forcefully terminates @p pid.
     * @return true when the process is gone afterwards (already-exited counts as success).
     */
    virtual bool kill(uint64_t pid) = 0;
};

using ProcessListerChain = std::vector<std::shared_ptr<ProcessLister>>;
using ProcessKillerChain = std::vector<std::shared_ptr<ProcessKiller>>;

/// @brief Reads the kernel's process table directly (/proc or Toolhelp32).
class HOSTKEEPER_HOST_EXPORT NativeProcessLister : public ProcessLister
{
  public:
    std::string name() const override { return "native"; }
    std::optional<std::vector<ProcessInfo>> list() override;
};

/// @brief Parses the output of `ps` (POSIX) or `wmic process` (Windows).
class HOSTKEEPER_HOST_EXPORT CommandProcessLister : public ProcessLister
{
  public:
    std::string name() const override { return "command"; }
    std::optional<std::vector<ProcessInfo>> list() override;
};

/// @brief SIGKILL (POSIX) or TerminateProcess (Windows).
class HOSTKEEPER_HOST_EXPORT NativeProcessKiller : public ProcessKiller
{
  public:
    std::string name() const override { return "native"; }
    bool kill(uint64_t pid) override;
};

/// @brief `kill -9` (POSIX) or `taskkill /F /T` (Windows).
class HOSTKEEPER_HOST_EXPORT CommandProcessKiller : public ProcessKiller
{
  public:
    std::string name() const override { return "command"; }
    bool kill(uint64_t pid) override;
};

/// @brief Native first, command-line second.
HOSTKEEPER_HOST_EXPORT ProcessListerChain default_process_listers();
HOSTKEEPER_HOST_EXPORT ProcessKillerChain default_process_killers();

/**
 * @brief Case-insensitive image-name comparison. Also accepts @p actual being a prefix of
 *        @p wanted of at least 15 characters, the length Linux truncates `comm` to.
 */
HOSTKEEPER_HOST_EXPORT bool matches_image(std::string_view actual, std::string_view wanted) noexcept;

/// @brief Parses one "pid ppid name" line as printed by `ps -o pid= -o ppid= -o comm=`.
HOSTKEEPER_HOST_EXPORT std::optional<ProcessInfo> parse_ps_line(std::string_view line);

} // namespace hostkeeper::host

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
