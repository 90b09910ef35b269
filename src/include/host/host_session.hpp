#pragma once
/**
 * @file host_session.hpp
 * @brief The session: one application handle, the documents seen through it, and their owners.
 *
 * `HostSession` is an ordinary object, constructed by whoever composes the program (see
 * `HostKeeper`) with the binding and guardian it should use. Tests build their own sessions on
 * a fake binding.
 *
 * Ownership rule: a document registered by `start()` or found already open by
 * `lease_document()` is *unowned* and is never closed by this session unless a caller passes
 * `force`. Only documents the session opened or created itself are *owned* and closed on
 * release and on `stop()`.
 *
 * Only one session per process may hold a live application handle. `start()` claims that slot
 * and `stop()` gives it back; starting a second session meanwhile fails with `HostUnavailable`.
 *
 * Every public method takes the session's `SingletonAccessLock` for its whole duration and
 * makes sure the calling thread is initialized for the binding.
 */

#include "host/access_lock.hpp"
#include "host/binding_thread.hpp"
#include "host/document_registry.hpp"
#include "host/host_binding.hpp"
#include "host/host_errors.hpp"
#include "host/view_state.hpp"
#include "hostkeeper_host_export.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace hostkeeper::host
{

class ProcessGuardian;
class ScopedViewGuard;

struct SessionOptions
{
    bool visible = false;
    bool display_alerts = false;
    bool attach_to_existing = true;
    size_t release_passes = 3; ///< release_references() calls at the end of stop().
};

struct LeaseOptions
{
    bool read_only = false;
    bool create_if_missing = false; ///< Create and save a new document when the file is absent.
};

struct HOSTKEEPER_HOST_EXPORT SessionStatus
{
    bool running = false;
    size_t document_count = 0;
    std::vector<std::string> open_paths;

    /// @brief `{"running", "document_count", "open_paths"}`.
    [[nodiscard]] nlohmann::json to_json() const;
};

struct SaveAllResult
{
    std::vector<std::string> saved;
    std::vector<std::string> errors;
};

struct CloseAllResult
{
    std::vector<std::string> closed;    ///< Owned documents closed.
    std::vector<std::string> untracked; ///< Unowned documents dropped from tracking, left open.
    std::vector<std::string> errors;
};

class HOSTKEEPER_HOST_EXPORT HostSession
{
  public:
    /**
     * @param binding  Platform binding; required.
     * @param guardian Receives the pids of freshly created instances. May be null, in which
     *                 case fresh instances are not tracked.
     */
    HostSession(std::shared_ptr<HostBinding> binding, std::shared_ptr<ProcessGuardian> guardian,
                SessionOptions options = {});
    /// @brief stop(false) if still started.
    ~HostSession();

    HostSession(const HostSession &) = delete;
    HostSession &operator=(const HostSession &) = delete;

    /**
     * @brief Attaches to a running host (when allowed) or creates one, then registers every
     *        document already open as unowned. No-op while a handle is held.
     * @throws HostError(HostUnavailable) when thread initialization fails, when no instance can
     *         be obtained, or when another session in this process holds the handle.
     */
    void start();

    /**
     * @brief Liveness check (document count). On failure drops the handle and every cached
     *        entry; the next lease restarts the session.
     */
    bool is_alive();

    /**
     * @brief Closes owned documents without saving, untracks the rest, quits the host when this
     *        session created it or @p force_quit is set, then releases references and the
     *        thread binding. Every step is best-effort.
     * @return The steps that failed (already logged).
     */
    CleanupReport stop(bool force_quit = false) noexcept;

    /**
     * @brief stop(), but gives up when the access lock cannot be taken within @p wait, as when
     *        another thread is stuck in a call into an unresponsive host.
     * @return The stop report, or nullopt when the lock was not acquired (nothing was done).
     */
    std::optional<CleanupReport> try_stop(bool force_quit, std::chrono::milliseconds wait) noexcept;

    /**
     * @brief Resolves @p path to a live document: cached entry, else a document already open in
     *        the host (registered unowned), else a fresh open (registered owned).
     *
     * A stale application handle triggers one restart and one retry. Each successful call adds
     * one lease to the entry; release_document() gives it back.
     *
     * @throws HostError(HostUnavailable)    start() was never called or failed.
     * @throws HostError(DocumentNotFound)   the file is absent and creation was not requested.
     * @throws HostError(PlatformCallFailed) the binding failed to open or create the document.
     */
    DocumentEntry lease_document(std::string_view path, const LeaseOptions &options = {});

    /**
     * @brief Gives back one lease on @p path. While other leases remain the document stays open
     *        and tracked (saved in place when @p save is set; @p force is ignored). The last
     *        release ends tracking and closes the document only if owned or @p force;
     *        otherwise it saves it in place when @p save is set.
     * @throws HostError(DocumentNotFound) when @p path is not tracked.
     */
    void release_document(std::string_view path, bool save = false, bool force = false);

    /**
     * @brief Explicit close. Unlike release_document(), refuses unowned documents.
     * @throws HostError(NotOwned) for an unowned document without @p force.
     */
    void close_document(std::string_view path, bool save = false, bool force = false);

    /// @throws HostError(DocumentNotFound) when @p path is not tracked.
    void save_document(std::string_view path);

    /**
     * @brief Saves every open document with unsaved changes. A modified document without a file
     *        path is reported as an error; unmodified documents are left alone.
     */
    SaveAllResult save_all_documents();

    /// @brief Open documents the host reports as modified.
    std::vector<DocumentInfo> unsaved_documents();

    /// @brief Closes every owned document and untracks the unowned ones.
    CloseAllResult close_all_documents(bool save = false);

    /// @brief Path (or name, for never-saved documents) of the active document.
    std::optional<std::string> active_document_path();

    /**
     * @brief Captures the current view; restored when the returned guard is destroyed. The guard
     *        holds the access lock and the thread binding until then.
     * @throws HostError(HostUnavailable) when the calling thread cannot be initialized.
     */
    [[nodiscard]] ScopedViewGuard scoped_preserve();

    [[nodiscard]] SessionStatus status() const;
    [[nodiscard]] bool is_owned(std::string_view path) const;
    [[nodiscard]] bool is_tracked(std::string_view path) const;
    [[nodiscard]] size_t tracked_count() const;
    [[nodiscard]] bool running() const;
    [[nodiscard]] bool attached_to_existing() const;
    /// @brief true if start() performed the binding initialization of its thread.
    [[nodiscard]] bool binding_initialized_here() const;

    /// @brief Current application handle; empty while stopped or after a failed liveness check.
    [[nodiscard]] AppHandle app_handle() const;

    [[nodiscard]] const SessionOptions &options() const noexcept { return m_options; }
    [[nodiscard]] HostBinding &binding() const noexcept { return *m_binding; }
    [[nodiscard]] SingletonAccessLock &access_lock() const noexcept { return m_lock; }

  private:
    void start_locked();
    CleanupReport stop_locked(bool force_quit) noexcept;
    void rollback_start() noexcept;
    void restart_locked();
    void invalidate_locked(std::string_view reason) noexcept;
    bool check_alive_locked() noexcept;
    void require_started(std::string_view operation) const;
    DocumentEntry lease_locked(std::string_view path, const LeaseOptions &options);
    std::optional<DocumentHandle> find_open_document(const std::string &normalized);
    void register_open_documents() noexcept;
    void enter_thread(std::optional<BindingThreadGuard> &slot, std::string_view operation);

    template <typename Fn> auto call_binding(std::string_view operation, Fn &&fn) -> decltype(fn());

    std::shared_ptr<HostBinding> m_binding;
    std::shared_ptr<ProcessGuardian> m_guardian;
    SessionOptions m_options;

    mutable SingletonAccessLock m_lock;
    AppHandle m_app;
    DocumentRegistry m_registry;
    std::unique_ptr<BindingThreadGuard> m_thread_guard;
    bool m_started = false;
    bool m_attached = false;
    bool m_holds_claim = false;
};

/**
 * @brief Lock, thread binding and view snapshot for a block of mutating work that does not go
 *        through a DocumentLease. Members are released in reverse order: the view is restored
 *        while the lock is still held, on an initialized thread.
 */
class HOSTKEEPER_HOST_EXPORT ScopedViewGuard
{
  public:
    /// @throws HostError(HostUnavailable) when the calling thread cannot be initialized.
    explicit ScopedViewGuard(HostSession &session);

    ScopedViewGuard(const ScopedViewGuard &) = delete;
    ScopedViewGuard &operator=(const ScopedViewGuard &) = delete;

    [[nodiscard]] const ViewSnapshot &snapshot() const noexcept { return m_view->snapshot(); }
    /// @brief Forget the snapshot; nothing is restored on destruction.
    void dismiss() noexcept { m_view->dismiss(); }

  private:
    std::unique_lock<SingletonAccessLock> m_lock;
    std::optional<BindingThreadGuard> m_thread;
    std::optional<ViewStatePreserver> m_view;
};

} // namespace hostkeeper::host

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
