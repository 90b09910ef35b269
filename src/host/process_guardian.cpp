/**
 * @file process_guardian.cpp
 * @brief Tracking of launched host pids and the four-stage forced cleanup.
 */
#include "host/process_guardian.hpp"
#include "host/host_session.hpp"
#include "utils/lifecycle.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <deque>
#include <iterator>
#include <map>

namespace hostkeeper::host
{

namespace
{

struct ExitRegistry
{
    std::mutex mutex;
    std::vector<std::weak_ptr<ProcessGuardian>> guardians;
    std::once_flag atexit_once;
};

ExitRegistry &exit_registry()
{
    static ExitRegistry registry;
    return registry;
}

std::vector<std::shared_ptr<ProcessGuardian>> live_guardians()
{
    auto &reg = exit_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    std::vector<std::shared_ptr<ProcessGuardian>> out;
    for (auto it = reg.guardians.begin(); it != reg.guardians.end();)
    {
        if (auto g = it->lock())
        {
            out.push_back(std::move(g));
            ++it;
        }
        else
        {
            it = reg.guardians.erase(it);
        }
    }
    return out;
}

// Runs after the Logger has shut down, so it reports on stderr directly.
void run_exit_hook()
{
    try
    {
        for (const auto &g : live_guardians())
        {
            auto result = g->force_cleanup_all();
            if (result.terminated.empty() && result.report.clean())
                continue;
            fmt::print(stderr, "[hostkeeper-guardian] [pid:{}] exit hook: {} process(es) terminated, {} failure(s)\n",
                       platform::get_pid(), result.terminated.size(), result.report.failures().size());
            for (const auto &line : result.report.messages())
            {
                fmt::print(stderr, "[hostkeeper-guardian]   {}\n", line);
            }
        }
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[hostkeeper-guardian] exit hook failed: {}\n", e.what());
    }
}

void do_guardian_startup(const char *arg)
{
    (void)arg;
}

void do_guardian_shutdown(const char *arg)
{
    (void)arg;
    const size_t ran = ProcessGuardian::cleanup_registered();
    LOGGER_INFO("guardian lifecycle shutdown: cleanup ran for {} guardian(s)", ran);
}

// Descendants of root in breadth-first order (root excluded).
std::vector<uint64_t> descendants_of(uint64_t root, const std::vector<ProcessInfo> &table)
{
    std::multimap<uint64_t, uint64_t> children;
    for (const auto &p : table)
    {
        if (p.pid != p.parent_pid)
            children.emplace(p.parent_pid, p.pid);
    }
    std::vector<uint64_t> out;
    std::deque<uint64_t> queue{root};
    while (!queue.empty())
    {
        const uint64_t parent = queue.front();
        queue.pop_front();
        auto [first, last] = children.equal_range(parent);
        for (auto it = first; it != last; ++it)
        {
            if (it->second == root || std::find(out.begin(), out.end(), it->second) != out.end())
                continue;
            out.push_back(it->second);
            queue.push_back(it->second);
        }
    }
    return out;
}

} // namespace

ProcessGuardian::ProcessGuardian(std::shared_ptr<HostBinding> binding, std::string image_name,
                                 ProcessListerChain listers, ProcessKillerChain killers, size_t release_passes)
    : m_binding(std::move(binding)), m_image_name(std::move(image_name)), m_listers(std::move(listers)),
      m_killers(std::move(killers)), m_release_passes(release_passes)
{
}

ProcessGuardian::~ProcessGuardian() = default;

// ----------------------------------------------------------------------------
// tracking
// ----------------------------------------------------------------------------

std::set<uint64_t> ProcessGuardian::snapshot_host_pids()
{
    CleanupReport report;
    std::set<uint64_t> pids;
    if (auto table = list_processes(report))
    {
        for (const auto &p : *table)
        {
            if (matches_image(p.image_name, m_image_name))
                pids.insert(p.pid);
        }
    }
    report.log_failures("guardian snapshot");
    return pids;
}

size_t ProcessGuardian::record_fresh_instance(const std::set<uint64_t> &before)
{
    const auto after = snapshot_host_pids();
    std::vector<uint64_t> fresh;
    std::set_difference(after.begin(), after.end(), before.begin(), before.end(), std::back_inserter(fresh));

    std::lock_guard<std::mutex> lock(m_pid_mutex);
    for (uint64_t pid : fresh)
    {
        m_tracked.insert(pid);
        LOGGER_INFO("guardian: tracking fresh '{}' instance pid {}", m_image_name, pid);
    }
    return fresh.size();
}

void ProcessGuardian::track_pid(uint64_t pid)
{
    std::lock_guard<std::mutex> lock(m_pid_mutex);
    m_tracked.insert(pid);
}

size_t ProcessGuardian::forget_exited_pids() noexcept
{
    CleanupReport report;
    auto table = list_processes(report);
    if (!table)
        return 0;
    std::set<uint64_t> running;
    for (const auto &p : *table)
        running.insert(p.pid);

    std::lock_guard<std::mutex> lock(m_pid_mutex);
    size_t dropped = 0;
    for (auto it = m_tracked.begin(); it != m_tracked.end();)
    {
        if (running.count(*it) != 0)
        {
            ++it;
            continue;
        }
        LOGGER_DEBUG("guardian: pid {} has exited; no longer tracked", *it);
        it = m_tracked.erase(it);
        ++dropped;
    }
    return dropped;
}

std::vector<uint64_t> ProcessGuardian::tracked_pids() const
{
    std::lock_guard<std::mutex> lock(m_pid_mutex);
    return {m_tracked.begin(), m_tracked.end()};
}

size_t ProcessGuardian::tracked_count() const
{
    std::lock_guard<std::mutex> lock(m_pid_mutex);
    return m_tracked.size();
}

void ProcessGuardian::attach_session(HostSession *session)
{
    std::lock_guard<std::mutex> lock(m_session_mutex);
    if (std::find(m_sessions.begin(), m_sessions.end(), session) == m_sessions.end())
        m_sessions.push_back(session);
}

void ProcessGuardian::detach_session(HostSession *session) noexcept
{
    std::lock_guard<std::mutex> lock(m_session_mutex);
    m_sessions.erase(std::remove(m_sessions.begin(), m_sessions.end(), session), m_sessions.end());
}

// ----------------------------------------------------------------------------
// strategies
// ----------------------------------------------------------------------------

std::optional<std::vector<ProcessInfo>> ProcessGuardian::list_processes(CleanupReport &report)
{
    for (const auto &lister : m_listers)
    {
        std::optional<std::vector<ProcessInfo>> table;
        auto r = attempt_step([&] { table = lister->list(); });
        if (r.is_ok() && table)
            return table;
        LOGGER_DEBUG("guardian: lister '{}' unavailable{}", lister->name(),
                     r.is_error() ? fmt::format(" ({})", r.error_message()) : std::string());
    }
    report.add("list processes", "no process lister succeeded");
    return std::nullopt;
}

bool ProcessGuardian::kill_one(uint64_t pid, CleanupReport &report)
{
    for (const auto &killer : m_killers)
    {
        bool killed = false;
        auto r = attempt_step([&] { killed = killer->kill(pid); });
        if (r.is_ok() && killed)
        {
            LOGGER_DEBUG("guardian: pid {} terminated by '{}'", pid, killer->name());
            return true;
        }
        LOGGER_DEBUG("guardian: killer '{}' failed on pid {}{}", killer->name(), pid,
                     r.is_error() ? fmt::format(" ({})", r.error_message()) : std::string());
    }
    report.add(fmt::format("kill {}", pid), "every termination strategy failed");
    return false;
}

void ProcessGuardian::kill_in_order(const std::vector<uint64_t> &order, GuardianReport &out)
{
    for (uint64_t pid : order)
    {
        if (std::find(out.terminated.begin(), out.terminated.end(), pid) != out.terminated.end())
            continue;
        if (kill_one(pid, out.report))
            out.terminated.push_back(pid);
    }
}

void ProcessGuardian::kill_tree(uint64_t root, const std::vector<ProcessInfo> &table, GuardianReport &out)
{
    auto order = descendants_of(root, table);
    // leaves first, root last
    std::reverse(order.begin(), order.end());
    order.push_back(root);
    kill_in_order(order, out);
}

void ProcessGuardian::kill_descendants(uint64_t root, const std::vector<ProcessInfo> &table, GuardianReport &out)
{
    auto order = descendants_of(root, table);
    std::reverse(order.begin(), order.end());
    kill_in_order(order, out);
}

// ----------------------------------------------------------------------------
// cleanup
// ----------------------------------------------------------------------------

GuardianReport ProcessGuardian::force_cleanup_all() noexcept
{
    std::lock_guard<std::mutex> cleanup_lock(m_cleanup_mutex);
    GuardianReport out;

    // Stage 1: graceful stop of every known session.
    {
        std::lock_guard<std::mutex> lock(m_session_mutex);
        for (HostSession *session : m_sessions)
        {
            auto stopped = session->try_stop(false, m_session_wait);
            if (!stopped)
            {
                out.report.add("stop session",
                               fmt::format("session busy: access lock not acquired within {}ms", m_session_wait.count()));
                continue;
            }
            out.report.merge(*stopped);
            ++out.sessions_stopped;
        }
    }

    // Stage 2: let go of anything that keeps the host from exiting.
    if (m_binding)
    {
        for (size_t pass = 0; pass < m_release_passes; ++pass)
        {
            m_binding->release_references();
        }
    }

    // Stage 3: tracked pids and their process trees.
    std::set<uint64_t> tracked;
    {
        std::lock_guard<std::mutex> lock(m_pid_mutex);
        tracked.swap(m_tracked);
    }
    std::optional<std::vector<ProcessInfo>> table;
    if (!tracked.empty())
    {
        table = list_processes(out.report);
        const std::vector<ProcessInfo> empty_table;
        for (uint64_t pid : tracked)
        {
            if (!table)
            {
                // No listing: the tracked root is all we know about.
                kill_tree(pid, empty_table, out);
                continue;
            }
            auto it = std::find_if(table->begin(), table->end(), [pid](const ProcessInfo &p) { return p.pid == pid; });
            if (it == table->end())
            {
                LOGGER_DEBUG("guardian: tracked pid {} already exited", pid);
                kill_descendants(pid, *table, out);
            }
            else if (!matches_image(it->image_name, m_image_name))
            {
                LOGGER_WARN("guardian: tracked pid {} now runs '{}', not '{}'; leaving it alone", pid,
                            it->image_name, m_image_name);
            }
            else
            {
                kill_tree(pid, *table, out);
            }
        }
    }

    // Stage 4: host-named descendants of this process that tracking missed.
    table = list_processes(out.report);
    if (table)
    {
        const uint64_t self = platform::get_pid();
        for (uint64_t pid : descendants_of(self, *table))
        {
            auto it = std::find_if(table->begin(), table->end(), [pid](const ProcessInfo &p) { return p.pid == pid; });
            if (it == table->end() || !matches_image(it->image_name, m_image_name))
                continue;
            if (std::find(out.terminated.begin(), out.terminated.end(), pid) != out.terminated.end())
                continue;
            LOGGER_WARN("guardian: untracked '{}' child pid {} found by sweep", m_image_name, pid);
            kill_tree(pid, *table, out);
        }
    }

    LOGGER_INFO("guardian: cleanup done ({} session(s) stopped, {} process(es) terminated, {} failure(s))",
                out.sessions_stopped, out.terminated.size(), out.report.failures().size());
    out.report.log_failures("guardian cleanup");
    return out;
}

bool ProcessGuardian::install_exit_hook()
{
    auto self = weak_from_this();
    if (self.expired())
    {
        LOGGER_WARN("guardian: exit hook needs a shared_ptr-owned guardian; not installed");
        return false;
    }
    auto &reg = exit_registry();
    {
        std::lock_guard<std::mutex> lock(reg.mutex);
        reg.guardians.push_back(std::move(self));
    }
    std::call_once(reg.atexit_once, [] {
        if (std::atexit(&run_exit_hook) != 0)
        {
            fmt::print(stderr, "[hostkeeper-guardian] [pid:{}] WARNING: std::atexit registration failed\n",
                       platform::get_pid());
        }
    });
    return true;
}

size_t ProcessGuardian::cleanup_registered() noexcept
{
    size_t ran = 0;
    try
    {
        for (const auto &g : live_guardians())
        {
            (void)g->force_cleanup_all();
            ++ran;
        }
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[hostkeeper-guardian] cleanup of registered guardians aborted: {}\n", e.what());
    }
    return ran;
}

utils::ModuleDef ProcessGuardian::GetLifecycleModule()
{
    utils::ModuleDef module("hostkeeper::host::ProcessGuardian");
    module.add_dependency("hostkeeper::utils::Logger");
    module.set_startup(&do_guardian_startup);
    module.set_shutdown(&do_guardian_shutdown, std::chrono::milliseconds(10000));
    return module;
}

} // namespace hostkeeper::host
