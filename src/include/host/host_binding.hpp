#pragma once
/**
 * @file host_binding.hpp
 * @brief Abstract platform binding to the automation host.
 *
 * Implementations wrap the platform's automation layer (COM on Windows) or, in tests, an
 * in-memory fake. Every method may throw any `std::exception` to signal a failed platform
 * call; `HostSession` wraps those failures as `HostErrorKind::PlatformCallFailed` or records
 * them as soft failures during cleanup.
 *
 * Threading: the binding is thread-affine. A thread must call `initialize_thread()` before
 * touching any handle and `uninitialize_thread()` when done (see `BindingThreadGuard`).
 */

#include "host/host_handle.hpp"

#include <string>
#include <vector>

namespace hostkeeper::host
{

/// @brief One document as reported by the host.
struct DocumentInfo
{
    DocumentHandle handle;
    std::string name;      ///< Display name ("Book1", "report.xlsx").
    std::string full_name; ///< Absolute path when saved; equals name otherwise.
    bool has_path = false; ///< False for never-saved documents.
    bool saved = true;     ///< False when the host reports unsaved changes.
};

/// @brief Window scroll position, 1-based like the host's own row/column numbering.
struct ScrollPosition
{
    long row = 1;
    long column = 1;

    friend bool operator==(const ScrollPosition &, const ScrollPosition &) = default;
};

class HostBinding
{
  public:
    virtual ~HostBinding() = default;

    /// @brief Short human-readable name for logs ("excel-com", "fake").
    virtual std::string description() const = 0;

    // --- thread affinity ---------------------------------------------------------------

    /**
     * @brief Initializes the binding for the calling thread.
     * @return true if this call performed the initialization, false if the thread was
     *         already initialized by someone else.
     */
    virtual bool initialize_thread() = 0;
    virtual void uninitialize_thread() noexcept = 0;

    // --- application ----------------------------------------------------------------------

    /**
     * @brief Attaches to an already running host instance.
     * @throws std::exception when no instance answers a trivial call.
     */
    virtual AppHandle attach_existing() = 0;
    /// @brief Launches a new, dedicated host instance.
    virtual AppHandle create_instance() = 0;
    virtual void set_visible(const AppHandle &app, bool visible) = 0;
    virtual void set_display_alerts(const AppHandle &app, bool enabled) = 0;
    /// @brief Number of open documents. Also serves as the liveness check.
    virtual long document_count(const AppHandle &app) = 0;
    virtual void quit(const AppHandle &app) = 0;
    /// @brief Drops cached native references so a quit host process can exit.
    virtual void release_references() noexcept = 0;

    // --- documents ------------------------------------------------------------------------

    virtual std::vector<DocumentInfo> list_documents(const AppHandle &app) = 0;
    virtual DocumentHandle open_document(const AppHandle &app, const std::string &path,
                                         bool read_only) = 0;
    /// @brief Creates a new document and saves it at @p path.
    virtual DocumentHandle create_document(const AppHandle &app, const std::string &path) = 0;
    /// @brief Reads the document's properties. Throws when the handle went stale.
    virtual DocumentInfo describe_document(const DocumentHandle &doc) = 0;
    virtual void save_document(const DocumentHandle &doc) = 0;
    virtual void close_document(const DocumentHandle &doc, bool save_changes) = 0;

    // --- view state -----------------------------------------------------------------------

    virtual DocumentHandle active_document(const AppHandle &app) = 0;
    virtual SheetHandle active_sheet(const AppHandle &app) = 0;
    virtual std::string selection_address(const AppHandle &app) = 0;
    virtual std::string active_cell_address(const AppHandle &app) = 0;
    virtual ScrollPosition scroll_position(const AppHandle &app) = 0;
    virtual void activate_document(const DocumentHandle &doc) = 0;
    virtual void activate_sheet(const SheetHandle &sheet) = 0;
    virtual void set_scroll_position(const AppHandle &app, const ScrollPosition &pos) = 0;
};

} // namespace hostkeeper::host
