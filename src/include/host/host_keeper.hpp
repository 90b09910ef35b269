#pragma once
/**
 * @file host_keeper.hpp
 * @brief Composition root: configuration, guardian and session wired together for a tool layer.
 *
 * `HostKeeper` owns one `ProcessGuardian` and one `HostSession` built from a `HostConfig`.
 * Tool code asks it for a started session (`ensure_session()`) or runs a callable against a
 * leased document (`with_document()`); the program tears everything down with `shutdown()`.
 */

#include "host/document_lease.hpp"
#include "host/host_config.hpp"
#include "host/host_session.hpp"
#include "host/process_guardian.hpp"
#include "hostkeeper_host_export.h"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace hostkeeper::host
{

struct HOSTKEEPER_HOST_EXPORT ShutdownResult
{
    bool success = true;
    std::vector<std::string> errors;
    bool forced = false;

    /// @brief `{"success", "errors" (null when empty), "forced"}`.
    [[nodiscard]] nlohmann::json to_json() const;
};

class HOSTKEEPER_HOST_EXPORT HostKeeper
{
  public:
    HostKeeper(HostConfig config, std::shared_ptr<HostBinding> binding,
               ProcessListerChain listers = default_process_listers(),
               ProcessKillerChain killers = default_process_killers());
    ~HostKeeper();

    HostKeeper(const HostKeeper &) = delete;
    HostKeeper &operator=(const HostKeeper &) = delete;

    /**
     * @brief Returns a started, live session: starts it when stopped, restarts it when the
     *        liveness check fails.
     * @throws HostError(HostUnavailable) when no host instance can be obtained.
     */
    HostSession &ensure_session();

    /**
     * @brief Leases @p path, runs `fn(const DocumentEntry &)`, releases (saving when
     *        @p save_on_release is set). The lease is released even when @p fn throws.
     */
    template <typename Fn>
    auto with_document(std::string_view path, const LeaseOptions &options, Fn &&fn, bool save_on_release = false)
        -> decltype(std::forward<Fn>(fn)(std::declval<const DocumentEntry &>()))
    {
        HostSession &session = ensure_session();
        DocumentLease lease(session, path, options);
        lease.set_save_on_release(save_on_release);
        return std::forward<Fn>(fn)(lease.entry());
    }

    [[nodiscard]] SessionStatus status() const;

    /**
     * @brief Stops the session and, when @p force is set, runs the guardian's forced cleanup.
     *        Never throws; failures are returned.
     */
    ShutdownResult shutdown(bool force = true) noexcept;

    [[nodiscard]] HostSession &session() noexcept { return *m_session; }
    [[nodiscard]] ProcessGuardian &guardian() noexcept { return *m_guardian; }
    [[nodiscard]] const HostConfig &config() const noexcept { return m_config; }

  private:
    HostConfig m_config;
    std::shared_ptr<HostBinding> m_binding;
    std::shared_ptr<ProcessGuardian> m_guardian;
    std::unique_ptr<HostSession> m_session;
};

} // namespace hostkeeper::host

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
