#pragma once
/**
 * @file process_guardian.hpp
 * @brief Last line of defence against host processes outliving this program.
 *
 * The guardian remembers the pids of host instances this program launched (never of instances
 * it merely attached to) and, on `force_cleanup_all()`, escalates through four stages, each run
 * regardless of how the previous one went:
 *
 *  1. `stop(false)` on every session attached to this guardian, skipping (and reporting) a
 *     session whose access lock stays busy longer than session_wait();
 *  2. repeated `HostBinding::release_references()` passes so the host sees no live clients;
 *  3. forced termination of every tracked pid and its descendants, leaves first. A tracked pid
 *     the process table shows under another image has been reused and is left alone;
 *  4. a sweep for host-named descendants of this process that tracking missed.
 *
 * Process listing and killing go through ranked strategy chains (see process_table.hpp). The
 * pid set has its own mutex: the exit hook may run outside the normal call path.
 *
 * Example:
 * @code
 *  auto guardian = std::make_shared<ProcessGuardian>(binding, "EXCEL.EXE");
 *  guardian->install_exit_hook();
 *  ...
 *  auto result = guardian->force_cleanup_all();
 *  result.report.log_failures("cleanup");
 * @endcode
 */

#include "hk_base.hpp"
#include "host/host_binding.hpp"
#include "host/host_errors.hpp"
#include "host/process_table.hpp"
#include "utils/logger.hpp"
#include "hostkeeper_host_export.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251 4275)
#endif

namespace hostkeeper::host
{

class HostSession;

struct GuardianReport
{
    std::vector<uint64_t> terminated; ///< Pids a killer reported gone, in kill order.
    size_t sessions_stopped = 0;
    CleanupReport report;
};

class HOSTKEEPER_HOST_EXPORT ProcessGuardian : public std::enable_shared_from_this<ProcessGuardian>
{
  public:
    static constexpr size_t kDefaultReleasePasses = 5;
    static constexpr std::chrono::milliseconds kDefaultSessionWait{2000};

    /**
     * @param binding        Used for the release passes of stage 2; may be null.
     * @param image_name     Host executable name to look for ("EXCEL.EXE").
     * @param listers        Tried in order until one returns a process list.
     * @param killers        Tried in order per pid until one reports success.
     * @param release_passes Number of stage-2 passes.
     */
    ProcessGuardian(std::shared_ptr<HostBinding> binding, std::string image_name,
                    ProcessListerChain listers = default_process_listers(),
                    ProcessKillerChain killers = default_process_killers(),
                    size_t release_passes = kDefaultReleasePasses);
    ~ProcessGuardian();

    ProcessGuardian(const ProcessGuardian &) = delete;
    ProcessGuardian &operator=(const ProcessGuardian &) = delete;

    [[nodiscard]] const std::string &image_name() const noexcept { return m_image_name; }

    /// @brief Longest stage-1 wait for a session's access lock.
    void set_session_wait(std::chrono::milliseconds wait) noexcept { m_session_wait = wait; }
    [[nodiscard]] std::chrono::milliseconds session_wait() const noexcept { return m_session_wait; }

    /**
     * @brief Pids of running processes whose image matches image_name().
     *        Empty when no lister works (logged).
     */
    std::set<uint64_t> snapshot_host_pids();

    /**
     * @brief Tracks every host pid present now but absent from @p before.
     * @return Number of pids added.
     */
    size_t record_fresh_instance(const std::set<uint64_t> &before);

    /**
     * @brief Runs @p create between two snapshots and tracks the difference.
     *        Nothing is tracked when @p create throws.
     */
    template <typename CreateFn> auto track_fresh_instance(CreateFn &&create) -> decltype(create())
    {
        const auto before = snapshot_host_pids();
        auto handle = create();
        const auto added = record_fresh_instance(before);
        if (added == 0)
        {
            LOGGER_WARN("guardian: fresh '{}' instance created but no new pid was found; the exit sweep "
                        "will have to catch it",
                        m_image_name);
        }
        return handle;
    }

    /// @brief Adds @p pid to the tracked set directly.
    void track_pid(uint64_t pid);

    /**
     * @brief Stops tracking pids the process table no longer shows. Does nothing when no lister
     *        works. Called after a session quit its fresh instance.
     * @return Number of pids dropped.
     */
    size_t forget_exited_pids() noexcept;

    [[nodiscard]] std::vector<uint64_t> tracked_pids() const;
    [[nodiscard]] size_t tracked_count() const;

    void attach_session(HostSession *session);
    void detach_session(HostSession *session) noexcept;

    /// @brief Runs the four cleanup stages. Never throws; safe to call repeatedly.
    GuardianReport force_cleanup_all() noexcept;

    /**
     * @brief Registers this guardian with the process-exit handler (std::atexit, installed once
     *        per process). The registry holds a weak reference.
     * @return false when this object is not owned by a std::shared_ptr.
     */
    bool install_exit_hook();

    /**
     * @brief Lifecycle module whose shutdown runs force_cleanup_all() on every guardian that
     *        installed the exit hook, while the Logger is still up. Depends on the Logger.
     */
    static utils::ModuleDef GetLifecycleModule();

    /// @brief force_cleanup_all() on every registered guardian. Returns how many ran.
    static size_t cleanup_registered() noexcept;

  private:
    std::optional<std::vector<ProcessInfo>> list_processes(CleanupReport &report);
    bool kill_one(uint64_t pid, CleanupReport &report);
    void kill_in_order(const std::vector<uint64_t> &order, GuardianReport &out);
    void kill_tree(uint64_t root, const std::vector<ProcessInfo> &table, GuardianReport &out);
    /// Orphans of a tracked root that already exited; the root pid itself is not touched.
    void kill_descendants(uint64_t root, const std::vector<ProcessInfo> &table, GuardianReport &out);

    std::shared_ptr<HostBinding> m_binding;
    std::string m_image_name;
    ProcessListerChain m_listers;
    ProcessKillerChain m_killers;
    size_t m_release_passes;
    std::chrono::milliseconds m_session_wait = kDefaultSessionWait;

    mutable std::mutex m_pid_mutex;
    std::set<uint64_t> m_tracked;

    std::mutex m_session_mutex;
    std::vector<HostSession *> m_sessions;

    std::mutex m_cleanup_mutex;
};

} // namespace hostkeeper::host

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
