#pragma once
/**
 * @file module_def.hpp
 * @brief What the lifecycle manager needs to know about one module.
 *
 * `Logger::GetLifecycleModule()` and `ProcessGuardian::GetLifecycleModule()` each return one.
 * Callbacks are plain function pointers taking an optional C string.
 */
#include "hostkeeper_utils_export.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string_view>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace hostkeeper::utils
{

class ModuleDefImpl;
class LifecycleManager;

using LifecycleCallback = void (*)(const char *arg);

class HOSTKEEPER_UTILS_EXPORT ModuleDef
{
  public:
    static constexpr size_t MAX_MODULE_NAME_LEN = 256;

    /// @throws std::length_error for names over MAX_MODULE_NAME_LEN.
    explicit ModuleDef(std::string_view name);
    ~ModuleDef();

    ModuleDef(ModuleDef &&other) noexcept;
    ModuleDef &operator=(ModuleDef &&other) noexcept;
    ModuleDef(const ModuleDef &) = delete;
    ModuleDef &operator=(const ModuleDef &) = delete;

    /// @brief Start after @p dependency_name, stop before it.
    void add_dependency(std::string_view dependency_name);

    void set_startup(LifecycleCallback startup_func);
    /// @brief @p arg is copied and passed to @p startup_func.
    void set_startup(LifecycleCallback startup_func, std::string_view arg);

    /// @brief Runs on its own thread; finalization stops waiting for it after @p timeout.
    void set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout);

  private:
    friend class LifecycleManager;
    std::unique_ptr<ModuleDefImpl> pImpl;
};

} // namespace hostkeeper::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
