#pragma once

/*******************************************************************************
 * @file lifecycle.hpp
 * @brief Ordered startup and bounded shutdown of process-wide modules.
 *
 * Each subsystem describes itself as a `ModuleDef`. The manager starts the registered modules
 * after their dependencies and stops them in the opposite order, giving every shutdown
 * callback its own timeout. A program normally holds one `LifecycleGuard` in `main()`:
 *
 * @code
 *  hostkeeper::utils::LifecycleGuard app(hostkeeper::utils::MakeModDefList(
 *      hostkeeper::utils::Logger::GetLifecycleModule(),
 *      hostkeeper::host::ProcessGuardian::GetLifecycleModule()));
 * @endcode
 ******************************************************************************/
#include "hk_base.hpp"
#include "hostkeeper_utils_export.h"

#include <memory>
#include <source_location>
#include <type_traits>
#include <utility>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace hostkeeper::utils
{

class LifecycleManagerImpl;

template <typename... Mods> inline std::vector<ModuleDef> MakeModDefList(Mods &&...mods)
{
    static_assert((std::is_same_v<std::decay_t<Mods>, ModuleDef> && ...),
                  "MakeModDefList takes ModuleDef values only");
    std::vector<ModuleDef> modules;
    modules.reserve(sizeof...(mods));
    (modules.emplace_back(std::forward<Mods>(mods)), ...);
    return modules;
}

class HOSTKEEPER_UTILS_EXPORT LifecycleManager
{
  public:
    static LifecycleManager &instance();

    /// @brief Panics once initialize() has started.
    void register_module(ModuleDef &&module_def);

    /**
     * @brief Orders the registered modules and runs their startup callbacks. Repeated calls do
     *        nothing. Duplicate names, missing dependencies, cycles and throwing callbacks panic.
     */
    void initialize(std::source_location loc = std::source_location::current());

    /// @brief Runs shutdown callbacks newest first. Does nothing before initialize() or twice.
    void finalize(std::source_location loc = std::source_location::current());

    [[nodiscard]] bool is_initialized();
    [[nodiscard]] bool is_finalized();

    LifecycleManager(const LifecycleManager &) = delete;
    LifecycleManager &operator=(const LifecycleManager &) = delete;

  private:
    LifecycleManager();
    ~LifecycleManager();

    std::unique_ptr<LifecycleManagerImpl> pImpl;
};

/**
 * @brief Registers and starts its modules, and finalizes them when destroyed, but only for the
 *        first guard in the process. Any later guard ignores its modules.
 */
class HOSTKEEPER_UTILS_EXPORT LifecycleGuard
{
  public:
    explicit LifecycleGuard(ModuleDef &&module,
                            std::source_location loc = std::source_location::current());
    explicit LifecycleGuard(std::vector<ModuleDef> &&modules,
                            std::source_location loc = std::source_location::current());
    ~LifecycleGuard() noexcept;

    LifecycleGuard(const LifecycleGuard &) = delete;
    LifecycleGuard &operator=(const LifecycleGuard &) = delete;

    [[nodiscard]] bool is_owner() const noexcept { return m_is_owner; }

  private:
    void claim(std::vector<ModuleDef> &&modules);

    std::source_location m_loc;
    bool m_is_owner{false};
};

} // namespace hostkeeper::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
