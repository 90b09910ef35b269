/*******************************************************************************
 * @file lifecycle.cpp
 * @brief Implementation of the dependency-aware application lifecycle manager.
 *
 * Two phases:
 *  1. Registration. `register_module()` appends to `m_registered_modules` under
 *     `m_registry_mutex`. Registration after `initialize()` has begun is fatal.
 *  2. Initialization. The registered list becomes a graph (`buildGraph`), Kahn's algorithm
 *     orders it (`topologicalSort`), and startup callbacks run in that order. The shutdown
 *     order is the exact reverse.
 *
 * Shutdown callbacks run on a detached thread; `wait_for()` on its future enforces each
 * module's timeout so a hung module cannot block process exit. Exceptions from shutdown callbacks are reported
 * and the remaining modules still shut down.
 ******************************************************************************/
#include "hk_base.hpp"
#include "utils/lifecycle.hpp"

#include <algorithm>
#include <atomic>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <fmt/core.h>

namespace hostkeeper::utils
{

namespace
{
struct InternalModuleShutdownDef
{
    std::function<void()> func;
    std::chrono::milliseconds timeout{0};
};

struct InternalModuleDef
{
    std::string name;
    std::vector<std::string> dependencies;
    std::function<void()> startup;
    InternalModuleShutdownDef shutdown;
};
} // namespace

// ============================================================================
// ModuleDef (Pimpl forwarding)
// ============================================================================

class ModuleDefImpl
{
  public:
    InternalModuleDef def;
};

ModuleDef::ModuleDef(std::string_view name) : pImpl(std::make_unique<ModuleDefImpl>())
{
    if (name.size() > MAX_MODULE_NAME_LEN)
    {
        throw std::length_error(
            fmt::format("ModuleDef name exceeds {} characters", MAX_MODULE_NAME_LEN));
    }
    pImpl->def.name = std::string(name);
}

ModuleDef::~ModuleDef() = default;
ModuleDef::ModuleDef(ModuleDef &&other) noexcept = default;
ModuleDef &ModuleDef::operator=(ModuleDef &&other) noexcept = default;

void ModuleDef::add_dependency(std::string_view dependency_name)
{
    if (pImpl && !dependency_name.empty())
    {
        pImpl->def.dependencies.emplace_back(dependency_name);
    }
}

void ModuleDef::set_startup(LifecycleCallback startup_func)
{
    if (pImpl && startup_func)
    {
        pImpl->def.startup = [startup_func]() { startup_func(nullptr); };
    }
}

void ModuleDef::set_startup(LifecycleCallback startup_func, std::string_view arg)
{
    if (pImpl && startup_func)
    {
        pImpl->def.startup = [startup_func, a = std::string(arg)]() { startup_func(a.c_str()); };
    }
}

void ModuleDef::set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout)
{
    if (pImpl && shutdown_func)
    {
        pImpl->def.shutdown.func = [shutdown_func]() { shutdown_func(nullptr); };
        pImpl->def.shutdown.timeout = timeout;
    }
}

// ============================================================================
// LifecycleManager
// ============================================================================

class LifecycleManagerImpl
{
  public:
    LifecycleManagerImpl()
        : m_pid(platform::get_pid()), m_app_name(platform::get_executable_name())
    {
    }

    struct InternalGraphNode
    {
        std::string name;
        std::function<void()> startup;
        InternalModuleShutdownDef shutdown;

        size_t in_degree = 0;
        std::vector<InternalGraphNode *> dependents;
    };

    void registerModule(InternalModuleDef module_def)
    {
        if (m_is_initialized.load(std::memory_order_acquire))
        {
            HK_PANIC("[hostkeeper-lifecycle] [{}:{}] module '{}' registered after initialization "
                     "started",
                     m_app_name, m_pid, module_def.name);
        }
        std::lock_guard<std::mutex> lock(m_registry_mutex);
        m_registered_modules.push_back(std::move(module_def));
    }

    void initialize(std::source_location loc)
    {
        if (m_is_initialized.exchange(true, std::memory_order_acq_rel))
        {
            return;
        }

        fmt::print(stderr, "[hostkeeper-lifecycle] [{}:{}] Initializing application ({})...\n",
                   m_app_name, m_pid, SRCLOC_TO_STR(loc));

        try
        {
            buildGraph();
            m_startup_order = topologicalSort();
        }
        catch (const std::runtime_error &e)
        {
            HK_PANIC("[hostkeeper-lifecycle] [{}:{}] lifecycle dependency error: {}", m_app_name,
                     m_pid, e.what());
        }

        m_shutdown_order = m_startup_order;
        std::reverse(m_shutdown_order.begin(), m_shutdown_order.end());

        for (size_t i = 0; i < m_startup_order.size(); ++i)
        {
            auto *module = m_startup_order[i];
            fmt::print(stderr, "[hostkeeper-lifecycle] [{}:{}]   ({}/{}) -> Starting module '{}'\n",
                       m_app_name, m_pid, i + 1, m_startup_order.size(), module->name);
            try
            {
                if (module->startup)
                    module->startup();
            }
            catch (const std::exception &e)
            {
                HK_PANIC("[hostkeeper-lifecycle] [{}:{}] module '{}' threw during startup: {}",
                         m_app_name, m_pid, module->name, e.what());
            }
        }
        m_is_started.store(true, std::memory_order_release);
        fmt::print(stderr, "[hostkeeper-lifecycle] [{}:{}] Application initialization complete.\n",
                   m_app_name, m_pid);
    }

    void finalize(std::source_location loc)
    {
        if (!m_is_initialized.load(std::memory_order_acquire) ||
            m_is_finalized.exchange(true, std::memory_order_acq_rel))
        {
            return;
        }

        fmt::print(stderr, "[hostkeeper-lifecycle] [{}:{}] Finalizing application ({})...\n",
                   m_app_name, m_pid, SRCLOC_TO_STR(loc));

        for (size_t i = 0; i < m_shutdown_order.size(); ++i)
        {
            auto *module = m_shutdown_order[i];
            if (!module->shutdown.func)
                continue;

            fmt::print(stderr, "[hostkeeper-lifecycle] [{}:{}]   ({}/{}) <- Shutting down module '{}'\n",
                       m_app_name, m_pid, i + 1, m_shutdown_order.size(), module->name);
            try
            {
                // A detached runner lets a hung callback be abandoned after its timeout.
                auto done = std::make_shared<std::promise<void>>();
                std::future<void> future = done->get_future();
                std::thread(
                    [fn = module->shutdown.func, done]()
                    {
                        try
                        {
                            fn();
                            done->set_value();
                        }
                        catch (...)
                        {
                            done->set_exception(std::current_exception());
                        }
                    })
                    .detach();
                if (future.wait_for(module->shutdown.timeout) == std::future_status::timeout)
                {
                    fmt::print(stderr,
                               "[hostkeeper-lifecycle] [{}:{}] WARNING: shutdown of module '{}' "
                               "timed out after {}ms.\n",
                               m_app_name, m_pid, module->name, module->shutdown.timeout.count());
                }
                else
                {
                    future.get();
                }
            }
            catch (const std::exception &e)
            {
                fmt::print(stderr,
                           "[hostkeeper-lifecycle] [{}:{}] ERROR: module '{}' threw during "
                           "shutdown: {}\n",
                           m_app_name, m_pid, module->name, e.what());
            }
        }

        fmt::print(stderr, "[hostkeeper-lifecycle] [{}:{}] Application finalization complete.\n",
                   m_app_name, m_pid);
    }

    bool is_initialized() const { return m_is_started.load(std::memory_order_acquire); }
    bool is_finalized() const { return m_is_finalized.load(std::memory_order_acquire); }

  private:
    void buildGraph()
    {
        std::lock_guard<std::mutex> lock(m_registry_mutex);

        for (const auto &mod_def : m_registered_modules)
        {
            if (m_module_graph.count(mod_def.name))
            {
                throw std::runtime_error("Duplicate module name detected: '" + mod_def.name + "'.");
            }
            m_module_graph[mod_def.name] = {mod_def.name, mod_def.startup, mod_def.shutdown, 0, {}};
        }

        for (const auto &mod_def : m_registered_modules)
        {
            InternalGraphNode &module_node = m_module_graph.at(mod_def.name);
            module_node.in_degree = mod_def.dependencies.size();

            for (const auto &dep_name : mod_def.dependencies)
            {
                auto it = m_module_graph.find(dep_name);
                if (it == m_module_graph.end())
                {
                    throw std::runtime_error("Module '" + mod_def.name +
                                             "' has an undefined dependency: '" + dep_name + "'.");
                }
                it->second.dependents.push_back(&module_node);
            }
        }
        m_registered_modules.clear();
    }

    // Kahn's algorithm.
    std::vector<InternalGraphNode *> topologicalSort()
    {
        std::vector<InternalGraphNode *> sorted_order;
        sorted_order.reserve(m_module_graph.size());
        std::vector<InternalGraphNode *> queue;

        for (auto &pair : m_module_graph)
        {
            if (pair.second.in_degree == 0)
            {
                queue.push_back(&pair.second);
            }
        }

        size_t head = 0;
        while (head < queue.size())
        {
            InternalGraphNode *u = queue[head++];
            sorted_order.push_back(u);
            for (InternalGraphNode *v : u->dependents)
            {
                if (--(v->in_degree) == 0)
                {
                    queue.push_back(v);
                }
            }
        }

        if (sorted_order.size() != m_module_graph.size())
        {
            std::string cycle_node_name;
            for (const auto &pair : m_module_graph)
            {
                if (pair.second.in_degree > 0)
                {
                    cycle_node_name = pair.first;
                    break;
                }
            }
            throw std::runtime_error("Circular dependency detected in modules. Module '" +
                                     cycle_node_name + "' is part of a cycle.");
        }
        return sorted_order;
    }

    const uint64_t m_pid;
    const std::string m_app_name;

    std::atomic<bool> m_is_initialized{false};
    std::atomic<bool> m_is_started{false};
    std::atomic<bool> m_is_finalized{false};

    std::mutex m_registry_mutex;

    std::vector<InternalModuleDef> m_registered_modules;
    std::map<std::string, InternalGraphNode> m_module_graph;
    std::vector<InternalGraphNode *> m_startup_order;
    std::vector<InternalGraphNode *> m_shutdown_order;
};

LifecycleManager::LifecycleManager() : pImpl(std::make_unique<LifecycleManagerImpl>()) {}
LifecycleManager::~LifecycleManager() = default;

LifecycleManager &LifecycleManager::instance()
{
    static LifecycleManager instance;
    return instance;
}

void LifecycleManager::register_module(ModuleDef &&module_def)
{
    if (!module_def.pImpl)
        return;
    pImpl->registerModule(std::move(module_def.pImpl->def));
}

void LifecycleManager::initialize(std::source_location loc)
{
    pImpl->initialize(loc);
}

void LifecycleManager::finalize(std::source_location loc)
{
    pImpl->finalize(loc);
}

bool LifecycleManager::is_initialized()
{
    return pImpl->is_initialized();
}

bool LifecycleManager::is_finalized()
{
    return pImpl->is_finalized();
}

// ============================================================================
// LifecycleGuard
// ============================================================================

namespace
{
std::atomic_bool g_guard_claimed{false};
}

LifecycleGuard::LifecycleGuard(ModuleDef &&module, std::source_location loc) : m_loc(loc)
{
    std::vector<ModuleDef> modules;
    modules.emplace_back(std::move(module));
    claim(std::move(modules));
}

LifecycleGuard::LifecycleGuard(std::vector<ModuleDef> &&modules, std::source_location loc)
    : m_loc(loc)
{
    claim(std::move(modules));
}

LifecycleGuard::~LifecycleGuard() noexcept
{
    if (!m_is_owner)
        return;
    HK_DEBUG("[HK_Lifecycle] guard from {}:{} finalizing",
             format_tools::filename_only(m_loc.file_name()), m_loc.line());
    LifecycleManager::instance().finalize(m_loc);
}

void LifecycleGuard::claim(std::vector<ModuleDef> &&modules)
{
    bool expected = false;
    if (!g_guard_claimed.compare_exchange_strong(expected, true, std::memory_order_acq_rel))
    {
        HK_DEBUG("[HK_Lifecycle] guard from {}:{} is not the first; {} module(s) ignored",
                 format_tools::filename_only(m_loc.file_name()), m_loc.line(), modules.size());
        return;
    }
    m_is_owner = true;
    auto &manager = LifecycleManager::instance();
    for (auto &m : modules)
        manager.register_module(std::move(m));
    manager.initialize(m_loc);
}

} // namespace hostkeeper::utils
