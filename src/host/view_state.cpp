#include "host/view_state.hpp"
#include "utils/logger.hpp"

namespace hostkeeper::host
{

ViewStatePreserver::ViewStatePreserver(HostBinding &binding, AppHandle app) noexcept
    : m_binding(binding), m_app(std::move(app))
{
    if (!m_app)
    {
        m_done = true;
        return;
    }

    auto &snap = m_snapshot;
    m_capture.record("capture active document",
                     attempt_step([&] { snap.active_document = m_binding.active_document(m_app); }));
    m_capture.record("capture active sheet",
                     attempt_step([&] { snap.active_sheet = m_binding.active_sheet(m_app); }));
    m_capture.record("capture selection",
                     attempt_step([&] { snap.selection = m_binding.selection_address(m_app); }));
    m_capture.record("capture active cell",
                     attempt_step([&] { snap.active_cell = m_binding.active_cell_address(m_app); }));
    m_capture.record("capture scroll",
                     attempt_step([&] { snap.scroll = m_binding.scroll_position(m_app); }));

    for (const auto &f : m_capture.failures())
    {
        LOGGER_DEBUG("view state: {} failed: {}", f.step, f.message);
    }
}

ViewStatePreserver::~ViewStatePreserver() noexcept
{
    if (!m_done)
        (void)restore();
}

CleanupReport ViewStatePreserver::restore() noexcept
{
    CleanupReport report;
    if (m_done)
        return report;
    m_done = true;

    const auto &snap = m_snapshot;
    bool document_ok = false;
    if (snap.active_document)
    {
        // A document closed by the operation would make activation throw on a dead reference.
        document_ok = report.record("check document",
                                    attempt_step([&] { (void)m_binding.describe_document(snap.active_document); })) &&
                      report.record("activate document",
                                    attempt_step([&] { m_binding.activate_document(snap.active_document); }));
    }
    if (document_ok && snap.active_sheet)
    {
        report.record("activate sheet", attempt_step([&] { m_binding.activate_sheet(snap.active_sheet); }));
    }
    if (snap.scroll)
    {
        report.record("restore scroll", attempt_step([&] { m_binding.set_scroll_position(m_app, *snap.scroll); }));
    }

    for (const auto &f : report.failures())
    {
        LOGGER_DEBUG("view state: {} failed: {}", f.step, f.message);
    }
    return report;
}

} // namespace hostkeeper::host
