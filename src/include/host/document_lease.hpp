#pragma once
/**
 * @file document_lease.hpp
 * @brief Scoped document lease: lock, lease, view capture, and a release that always happens.
 *
 * For its whole lifetime a `DocumentLease` holds the session's access lock, so the lease and
 * release bracket the caller's work as one exclusive unit. Leaving the scope, normally or by
 * exception, releases the document (closing it only if the session owns it) and then restores
 * the view that was active before the lease. Read-only leases skip the view capture.
 *
 * @code
 *  {
 *      DocumentLease lease(session, "C:/data/report.xlsx");
 *      tools.write_range(lease.handle(), "Sheet2", "A1:B2", values);
 *      lease.set_save_on_release(true);
 *  } // released (and saved) here, even if write_range threw
 * @endcode
 */

#include "host/access_lock.hpp"
#include "host/binding_thread.hpp"
#include "host/host_session.hpp"
#include "host/view_state.hpp"
#include "hostkeeper_host_export.h"

#include <mutex>
#include <optional>
#include <string_view>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace hostkeeper::host
{

class HOSTKEEPER_HOST_EXPORT DocumentLease
{
  public:
    /// @throws HostError as HostSession::lease_document() does.
    DocumentLease(HostSession &session, std::string_view path, const LeaseOptions &options = {});
    /// @brief Releases (errors are logged, not thrown) and restores the view.
    ~DocumentLease() noexcept;

    DocumentLease(const DocumentLease &) = delete;
    DocumentLease &operator=(const DocumentLease &) = delete;

    [[nodiscard]] const DocumentEntry &entry() const noexcept { return m_entry; }
    [[nodiscard]] const DocumentHandle &handle() const noexcept { return m_entry.handle; }
    [[nodiscard]] const std::string &path() const noexcept { return m_entry.path; }
    [[nodiscard]] bool owned() const noexcept { return m_entry.owned; }
    [[nodiscard]] bool released() const noexcept { return m_released; }

    void set_save_on_release(bool save) noexcept { m_save = save; }
    void set_force_close(bool force) noexcept { m_force = force; }

    /// @brief Releases now and lets release errors propagate. The view is restored either way.
    void release();

  private:
    HostSession &m_session;
    std::unique_lock<SingletonAccessLock> m_lock;
    std::optional<BindingThreadGuard> m_thread;
    std::optional<ViewStatePreserver> m_view;
    DocumentEntry m_entry;
    bool m_save = false;
    bool m_force = false;
    bool m_released = false;
};

} // namespace hostkeeper::host

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
