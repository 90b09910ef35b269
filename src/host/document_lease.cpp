#include "host/document_lease.hpp"
#include "utils/logger.hpp"

namespace hostkeeper::host
{

DocumentLease::DocumentLease(HostSession &session, std::string_view path, const LeaseOptions &options)
    : m_session(session), m_lock(session.access_lock())
{
    try
    {
        m_thread.emplace(session.binding());
    }
    catch (const std::exception &e)
    {
        throw HostError(HostErrorKind::HostUnavailable, "lease_document",
                        fmt::format("binding thread initialization failed: {}", e.what()));
    }
    // Captured before the lease: opening a document changes the active one.
    if (!options.read_only)
    {
        m_view.emplace(session.binding(), session.app_handle());
    }
    try
    {
        m_entry = session.lease_document(path, options);
    }
    catch (...)
    {
        if (m_view)
            m_view->dismiss();
        throw;
    }
}

DocumentLease::~DocumentLease() noexcept
{
    if (!m_released)
    {
        m_released = true;
        try
        {
            m_session.release_document(m_entry.path, m_save, m_force);
        }
        catch (const std::exception &e)
        {
            LOGGER_ERROR("lease of '{}': release failed: {}", m_entry.path, e.what());
        }
    }
    m_view.reset();
}

void DocumentLease::release()
{
    if (m_released)
        return;
    m_released = true;
    auto restore = basics::make_scope_guard([this]() noexcept { m_view.reset(); });
    m_session.release_document(m_entry.path, m_save, m_force);
}

} // namespace hostkeeper::host
