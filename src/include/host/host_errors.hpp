#pragma once
/**
 * @file host_errors.hpp
 * @brief Error taxonomy of the host layer, plus soft-failure bookkeeping for cleanup paths.
 *
 * Two reporting styles coexist:
 *  - Document operations throw `HostError`, tagged with a `HostErrorKind`.
 *  - Lifecycle and cleanup paths (`HostSession::stop`, `ProcessGuardian::force_cleanup_all`,
 *    view-state restore) never throw. Each sub-step runs through `attempt_step()`, which turns
 *    an exception into a `StepResult`; failures are collected in a `CleanupReport`, logged, and
 *    handed back to the caller.
 */

#include "hk_base.hpp"
#include "hostkeeper_host_export.h"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251 4275)
#endif

namespace hostkeeper::host
{

enum class HostErrorKind
{
    HostUnavailable,   ///< No live application handle; call start() again.
    DocumentNotFound,  ///< Path missing (and creation not requested) or not tracked.
    StaleHandle,       ///< A previously valid handle stopped answering.
    NotOwned,          ///< Close of a document this session does not own, without force.
    PlatformCallFailed ///< Opaque failure from the binding.
};

HOSTKEEPER_HOST_EXPORT const char *to_string(HostErrorKind kind) noexcept;

class HOSTKEEPER_HOST_EXPORT HostError : public std::runtime_error
{
  public:
    HostError(HostErrorKind kind, std::string operation, std::string detail);

    [[nodiscard]] HostErrorKind kind() const noexcept { return m_kind; }
    [[nodiscard]] const std::string &operation() const noexcept { return m_operation; }
    [[nodiscard]] const std::string &detail() const noexcept { return m_detail; }

    /**
     * @brief `{"error": <kind>, "message": <what()>, "details": {"kind", "operation", "detail"}}`.
     */
    [[nodiscard]] nlohmann::json to_json() const;

  private:
    HostErrorKind m_kind;
    std::string m_operation;
    std::string m_detail;
};

/// @brief One failed cleanup sub-step.
struct SoftFailure
{
    std::string step;
    std::string message;
};

using StepResult = basics::Result<std::monostate, HostErrorKind>;

/**
 * @brief Runs @p fn and converts any exception into an error StepResult.
 *
 * `HostError` keeps its kind; any other exception becomes `PlatformCallFailed`.
 */
template <typename Fn> StepResult attempt_step(Fn &&fn) noexcept
{
    try
    {
        fn();
        return StepResult::ok(std::monostate{});
    }
    catch (const HostError &e)
    {
        return StepResult::error(e.kind(), e.what());
    }
    catch (const std::exception &e)
    {
        return StepResult::error(HostErrorKind::PlatformCallFailed, e.what());
    }
    catch (...)
    {
        // Bindings may surface foreign (non-std) exceptions; record them, never propagate.
        return StepResult::error(HostErrorKind::PlatformCallFailed, "unknown exception");
    }
}

class HOSTKEEPER_HOST_EXPORT CleanupReport
{
  public:
    /// @brief Records @p result under @p step when it is an error. Returns result.is_ok().
    bool record(std::string_view step, const StepResult &result);
    void add(std::string_view step, std::string_view message);
    void merge(const CleanupReport &other);

    [[nodiscard]] bool clean() const noexcept { return m_failures.empty(); }
    [[nodiscard]] const std::vector<SoftFailure> &failures() const noexcept { return m_failures; }

    /// @brief "step: message" per failure.
    [[nodiscard]] std::vector<std::string> messages() const;

    /// @brief One WARN line per failure, prefixed with @p context.
    void log_failures(std::string_view context) const noexcept;

  private:
    std::vector<SoftFailure> m_failures;
};

} // namespace hostkeeper::host

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
