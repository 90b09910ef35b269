#pragma once
/**
 * @file view_state.hpp
 * @brief Capture and restore of the user's view around a document operation.
 *
 * Opening a document makes the host activate it. When a user is looking at the host window,
 * that is a visible jump. `ViewStatePreserver` records what was active before the operation and
 * puts it back afterwards: active document, then active sheet, then the scroll position.
 * Selection and active cell are captured for diagnostics only; restoring them could overwrite a
 * selection the operation made on purpose.
 *
 * Every step is best-effort. A failed capture leaves that field empty; a failed restore is
 * logged at DEBUG level and skipped. Neither ever throws.
 */

#include "host/host_binding.hpp"
#include "host/host_errors.hpp"
#include "hostkeeper_host_export.h"

#include <optional>
#include <string>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace hostkeeper::host
{

struct ViewSnapshot
{
    DocumentHandle active_document;
    SheetHandle active_sheet;
    std::optional<std::string> selection;
    std::optional<std::string> active_cell;
    std::optional<ScrollPosition> scroll;

    /// @brief true when nothing at all could be captured.
    [[nodiscard]] bool empty() const noexcept
    {
        return !active_document && !active_sheet && !selection && !active_cell && !scroll;
    }
};

class HOSTKEEPER_HOST_EXPORT ViewStatePreserver
{
  public:
    /// @brief Captures the current view of @p app. Never throws.
    ViewStatePreserver(HostBinding &binding, AppHandle app) noexcept;
    /// @brief Restores unless restore() or dismiss() already ran.
    ~ViewStatePreserver() noexcept;

    ViewStatePreserver(const ViewStatePreserver &) = delete;
    ViewStatePreserver &operator=(const ViewStatePreserver &) = delete;

    /**
     * @brief Re-activates the captured document, sheet and scroll position, in that order.
     *        A document that no longer answers is skipped together with its sheet.
     * @return Failed restore steps (also logged at DEBUG).
     */
    CleanupReport restore() noexcept;

    /// @brief Forget the snapshot; the destructor will not restore.
    void dismiss() noexcept { m_done = true; }

    [[nodiscard]] const ViewSnapshot &snapshot() const noexcept { return m_snapshot; }
    [[nodiscard]] const CleanupReport &capture_failures() const noexcept { return m_capture; }

  private:
    HostBinding &m_binding;
    AppHandle m_app;
    ViewSnapshot m_snapshot;
    CleanupReport m_capture;
    bool m_done = false;
};

} // namespace hostkeeper::host

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
