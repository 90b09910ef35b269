#include "host/host_session.hpp"
#include "host/process_guardian.hpp"
#include "utils/logger.hpp"

#include <atomic>
#include <filesystem>
#include <mutex>

namespace fs = std::filesystem;

namespace hostkeeper::host
{

namespace
{
// The session currently holding the live application handle, if any.
std::atomic<const HostSession *> g_live_session{nullptr};
} // namespace

nlohmann::json SessionStatus::to_json() const
{
    return nlohmann::json{{"running", running}, {"document_count", document_count}, {"open_paths", open_paths}};
}

template <typename Fn> auto HostSession::call_binding(std::string_view operation, Fn &&fn) -> decltype(fn())
{
    try
    {
        return fn();
    }
    catch (const HostError &)
    {
        throw;
    }
    catch (const std::exception &e)
    {
        throw HostError(HostErrorKind::PlatformCallFailed, std::string(operation), e.what());
    }
}

HostSession::HostSession(std::shared_ptr<HostBinding> binding, std::shared_ptr<ProcessGuardian> guardian,
                         SessionOptions options)
    : m_binding(std::move(binding)), m_guardian(std::move(guardian)), m_options(options)
{
    if (!m_binding)
    {
        throw std::invalid_argument("HostSession requires a binding");
    }
    if (m_guardian)
    {
        m_guardian->attach_session(this);
    }
}

HostSession::~HostSession()
{
    if (m_started || m_app)
    {
        (void)stop(false);
    }
    if (m_guardian)
    {
        m_guardian->detach_session(this);
    }
}

// ----------------------------------------------------------------------------
// start / stop
// ----------------------------------------------------------------------------

void HostSession::enter_thread(std::optional<BindingThreadGuard> &slot, std::string_view operation)
{
    try
    {
        slot.emplace(*m_binding);
    }
    catch (const std::exception &e)
    {
        throw HostError(HostErrorKind::HostUnavailable, std::string(operation),
                        fmt::format("binding thread initialization failed: {}", e.what()));
    }
}

void HostSession::start()
{
    std::lock_guard<SingletonAccessLock> lock(m_lock);
    start_locked();
}

void HostSession::start_locked()
{
    if (m_app)
        return;

    const HostSession *expected = nullptr;
    if (!g_live_session.compare_exchange_strong(expected, this) && expected != this)
    {
        throw HostError(HostErrorKind::HostUnavailable, "start",
                        "another session in this process holds the host handle");
    }
    m_holds_claim = true;
    auto rollback = basics::make_scope_guard([this]() noexcept { rollback_start(); });

    if (!m_thread_guard)
    {
        try
        {
            m_thread_guard = std::make_unique<BindingThreadGuard>(*m_binding);
        }
        catch (const std::exception &e)
        {
            throw HostError(HostErrorKind::HostUnavailable, "start",
                            fmt::format("binding thread initialization failed: {}", e.what()));
        }
    }

    AppHandle app;
    bool attached = false;
    if (m_options.attach_to_existing)
    {
        // A handle that cannot count its documents is not a running instance.
        auto answered = attempt_step([&] {
            app = m_binding->attach_existing();
            (void)m_binding->document_count(app);
        });
        if (answered.is_ok())
        {
            attached = true;
        }
        else
        {
            app.reset();
            LOGGER_DEBUG("no running host instance to attach to ({}); creating one", answered.error_message());
        }
    }
    if (!app)
    {
        try
        {
            auto create = [this] { return m_binding->create_instance(); };
            app = m_guardian ? m_guardian->track_fresh_instance(create) : create();
        }
        catch (const std::exception &e)
        {
            throw HostError(HostErrorKind::HostUnavailable, "start",
                            fmt::format("cannot create a host instance: {}", e.what()));
        }
    }

    m_app = std::move(app);
    m_attached = attached;

    CleanupReport soft;
    soft.record("set visible", attempt_step([&] { m_binding->set_visible(m_app, m_options.visible); }));
    soft.record("set display alerts",
                attempt_step([&] { m_binding->set_display_alerts(m_app, m_options.display_alerts); }));
    soft.log_failures("start");

    register_open_documents();

    m_started = true;
    rollback.dismiss();
    LOGGER_INFO("host session started via '{}' ({}), {} document(s) already open", m_binding->description(),
                m_attached ? "attached to running instance" : "fresh instance", m_registry.size());
}

void HostSession::rollback_start() noexcept
{
    m_app.reset();
    m_attached = false;
    if (m_thread_guard)
    {
        m_thread_guard->release();
        m_thread_guard.reset();
    }
    if (m_holds_claim)
    {
        g_live_session.store(nullptr);
        m_holds_claim = false;
    }
}

void HostSession::register_open_documents() noexcept
{
    auto listed = attempt_step([&] {
        for (auto &doc : m_binding->list_documents(m_app))
        {
            // Never-saved documents have no path to key on; they stay invisible to us.
            if (!doc.has_path)
                continue;
            const auto &entry = m_registry.insert(DocumentEntry{doc.full_name, std::move(doc.handle), false});
            LOGGER_DEBUG("registered pre-existing document '{}' (unowned)", entry.path);
        }
    });
    if (listed.is_error())
    {
        LOGGER_WARN("could not enumerate open documents: {}", listed.error_message());
    }
}

CleanupReport HostSession::stop(bool force_quit) noexcept
{
    std::lock_guard<SingletonAccessLock> lock(m_lock);
    return stop_locked(force_quit);
}

std::optional<CleanupReport> HostSession::try_stop(bool force_quit, std::chrono::milliseconds wait) noexcept
{
    if (!m_lock.try_lock_for(wait))
    {
        LOGGER_WARN("stop skipped: access lock still held by another thread after {}ms", wait.count());
        return std::nullopt;
    }
    std::lock_guard<SingletonAccessLock> lock(m_lock, std::adopt_lock);
    return stop_locked(force_quit);
}

CleanupReport HostSession::stop_locked(bool force_quit) noexcept
{
    CleanupReport report;

    std::optional<BindingThreadGuard> thread;
    report.record("thread init", attempt_step([&] { thread.emplace(*m_binding); }));

    size_t closed = 0;
    size_t untracked = 0;
    bool quit = false;
    if (m_app)
    {
        for (auto &entry : m_registry.drain())
        {
            if (!entry.owned)
            {
                ++untracked;
                continue;
            }
            if (report.record(fmt::format("close '{}'", entry.path),
                              attempt_step([&] { m_binding->close_document(entry.handle, false); })))
                ++closed;
        }

        if (force_quit || !m_attached)
        {
            report.record("suppress alerts", attempt_step([&] { m_binding->set_display_alerts(m_app, false); }));
            quit = report.record("quit", attempt_step([&] { m_binding->quit(m_app); }));
        }
        else
        {
            LOGGER_INFO("leaving attached host instance running");
        }
        m_app.reset();
    }
    else
    {
        m_registry.clear();
    }

    for (size_t pass = 0; pass < m_options.release_passes; ++pass)
    {
        m_binding->release_references();
    }

    thread.reset();
    if (m_thread_guard)
    {
        m_thread_guard->release();
        m_thread_guard.reset();
    }
    if (m_holds_claim)
    {
        g_live_session.store(nullptr);
        m_holds_claim = false;
    }
    m_started = false;
    m_attached = false;

    // A quit instance's pids may be reused by the OS; stop tracking the ones already gone.
    if (quit && m_guardian)
    {
        m_guardian->forget_exited_pids();
    }

    report.log_failures("stop");
    LOGGER_INFO("host session stopped: {} owned closed, {} unowned untracked, {} soft failure(s)", closed, untracked,
                report.failures().size());
    return report;
}

// ----------------------------------------------------------------------------
// liveness
// ----------------------------------------------------------------------------

bool HostSession::check_alive_locked() noexcept
{
    if (!m_app)
        return false;
    auto answered = attempt_step([&] { (void)m_binding->document_count(m_app); });
    if (answered.is_ok())
        return true;
    invalidate_locked(answered.error_message());
    return false;
}

void HostSession::invalidate_locked(std::string_view reason) noexcept
{
    LOGGER_WARN("host handle is stale ({}); dropping it and {} cached document(s)", reason, m_registry.size());
    m_app.reset();
    m_registry.clear();
    m_binding->release_references();
}

bool HostSession::is_alive()
{
    std::lock_guard<SingletonAccessLock> lock(m_lock);
    if (!m_app)
        return false;
    std::optional<BindingThreadGuard> thread;
    enter_thread(thread, "is_alive");
    return check_alive_locked();
}

void HostSession::restart_locked()
{
    LOGGER_INFO("restarting host session");
    if (m_app)
    {
        invalidate_locked("restart requested");
    }
    start_locked();
}

void HostSession::require_started(std::string_view operation) const
{
    if (!m_started)
    {
        throw HostError(HostErrorKind::HostUnavailable, std::string(operation), "session not started");
    }
}

// ----------------------------------------------------------------------------
// leases
// ----------------------------------------------------------------------------

DocumentEntry HostSession::lease_document(std::string_view path, const LeaseOptions &options)
{
    std::lock_guard<SingletonAccessLock> lock(m_lock);
    require_started("lease_document");
    std::optional<BindingThreadGuard> thread;
    enter_thread(thread, "lease_document");

    DocumentEntry entry;
    try
    {
        entry = lease_locked(path, options);
    }
    catch (const HostError &e)
    {
        if (e.kind() != HostErrorKind::StaleHandle)
            throw;
        LOGGER_INFO("lease of '{}' hit a stale handle; restarting once", path);
        restart_locked();
        entry = lease_locked(path, options);
    }
    entry.leases = m_registry.retain(entry.path);
    return entry;
}

DocumentEntry HostSession::lease_locked(std::string_view path, const LeaseOptions &options)
{
    if (!check_alive_locked())
    {
        throw HostError(HostErrorKind::StaleHandle, "lease_document", "application handle does not answer");
    }

    const std::string normalized = DocumentRegistry::normalize_path(path);
    if (normalized.empty())
    {
        throw HostError(HostErrorKind::DocumentNotFound, "lease_document", "empty path");
    }

    if (auto cached = m_registry.find(normalized))
    {
        auto alive = attempt_step([&] { (void)m_binding->describe_document(cached->handle); });
        if (alive.is_ok())
        {
            LOGGER_DEBUG("lease '{}': cached ({})", cached->path, cached->owned ? "owned" : "unowned");
            return *cached;
        }
        LOGGER_DEBUG("lease '{}': cached handle is stale ({}); dropping it", cached->path, alive.error_message());
        m_registry.erase(normalized);
    }

    if (auto open = find_open_document(normalized))
    {
        LOGGER_DEBUG("lease '{}': already open in host, tracking as unowned", normalized);
        return m_registry.insert(DocumentEntry{normalized, std::move(*open), false});
    }

    std::error_code ec;
    if (!fs::exists(normalized, ec))
    {
        if (!options.create_if_missing)
        {
            throw HostError(HostErrorKind::DocumentNotFound, "lease_document",
                            fmt::format("'{}' does not exist", normalized));
        }
        auto handle = call_binding("create_document", [&] { return m_binding->create_document(m_app, normalized); });
        LOGGER_DEBUG("lease '{}': created (owned)", normalized);
        return m_registry.insert(DocumentEntry{normalized, std::move(handle), true});
    }

    auto handle = call_binding("open_document",
                               [&] { return m_binding->open_document(m_app, normalized, options.read_only); });
    LOGGER_DEBUG("lease '{}': opened{} (owned)", normalized, options.read_only ? " read-only" : "");
    return m_registry.insert(DocumentEntry{normalized, std::move(handle), true});
}

std::optional<DocumentHandle> HostSession::find_open_document(const std::string &normalized)
{
    const std::string key = DocumentRegistry::make_key(normalized);
    auto docs = call_binding("list_documents", [&] { return m_binding->list_documents(m_app); });
    for (auto &doc : docs)
    {
        if (doc.has_path && DocumentRegistry::make_key(doc.full_name) == key)
            return std::move(doc.handle);
    }
    return std::nullopt;
}

void HostSession::release_document(std::string_view path, bool save, bool force)
{
    std::lock_guard<SingletonAccessLock> lock(m_lock);
    if (!m_registry.contains(path))
    {
        throw HostError(HostErrorKind::DocumentNotFound, "release_document",
                        fmt::format("'{}' is not tracked", DocumentRegistry::normalize_path(path)));
    }
    std::optional<BindingThreadGuard> thread;
    enter_thread(thread, "release_document");

    if (const size_t remaining = m_registry.drop_lease(path); remaining > 0)
    {
        auto held = m_registry.find(path);
        if (save)
        {
            call_binding("save_document", [&] { m_binding->save_document(held->handle); });
        }
        LOGGER_DEBUG("release '{}': {} lease(s) still held, left open{}", held->path, remaining,
                     save ? " (saved)" : "");
        return;
    }

    auto entry = m_registry.take(path);
    if (entry->owned || force)
    {
        call_binding("close_document", [&] { m_binding->close_document(entry->handle, save); });
        LOGGER_DEBUG("release '{}': closed ({}{})", entry->path, entry->owned ? "owned" : "forced",
                     save ? ", saved" : "");
    }
    else if (save)
    {
        call_binding("save_document", [&] { m_binding->save_document(entry->handle); });
        LOGGER_DEBUG("release '{}': saved, left open (unowned)", entry->path);
    }
    else
    {
        LOGGER_DEBUG("release '{}': left open (unowned)", entry->path);
    }
}

// ----------------------------------------------------------------------------
// document operations
// ----------------------------------------------------------------------------

void HostSession::close_document(std::string_view path, bool save, bool force)
{
    std::lock_guard<SingletonAccessLock> lock(m_lock);
    auto entry = m_registry.find(path);
    if (!entry)
    {
        throw HostError(HostErrorKind::DocumentNotFound, "close_document",
                        fmt::format("'{}' is not tracked", DocumentRegistry::normalize_path(path)));
    }
    if (!entry->owned && !force)
    {
        throw HostError(HostErrorKind::NotOwned, "close_document",
                        fmt::format("'{}' was open before this session; pass force to close it", entry->path));
    }
    std::optional<BindingThreadGuard> thread;
    enter_thread(thread, "close_document");

    m_registry.erase(entry->path);
    call_binding("close_document", [&] { m_binding->close_document(entry->handle, save); });
    LOGGER_DEBUG("closed '{}'", entry->path);
}

void HostSession::save_document(std::string_view path)
{
    std::lock_guard<SingletonAccessLock> lock(m_lock);
    auto entry = m_registry.find(path);
    if (!entry)
    {
        throw HostError(HostErrorKind::DocumentNotFound, "save_document",
                        fmt::format("'{}' is not tracked", DocumentRegistry::normalize_path(path)));
    }
    std::optional<BindingThreadGuard> thread;
    enter_thread(thread, "save_document");
    call_binding("save_document", [&] { m_binding->save_document(entry->handle); });
}

SaveAllResult HostSession::save_all_documents()
{
    std::lock_guard<SingletonAccessLock> lock(m_lock);
    require_started("save_all_documents");
    std::optional<BindingThreadGuard> thread;
    enter_thread(thread, "save_all_documents");

    SaveAllResult result;
    auto docs = call_binding("list_documents", [&] { return m_binding->list_documents(m_app); });
    for (const auto &doc : docs)
    {
        if (doc.saved)
            continue;
        if (!doc.has_path)
        {
            result.errors.push_back(fmt::format("{}: document has never been saved and has no file path", doc.name));
            continue;
        }
        auto saved = attempt_step([&] { m_binding->save_document(doc.handle); });
        if (saved.is_ok())
            result.saved.push_back(doc.full_name);
        else
            result.errors.push_back(fmt::format("{}: {}", doc.full_name, saved.error_message()));
    }
    return result;
}

std::vector<DocumentInfo> HostSession::unsaved_documents()
{
    std::lock_guard<SingletonAccessLock> lock(m_lock);
    require_started("unsaved_documents");
    std::optional<BindingThreadGuard> thread;
    enter_thread(thread, "unsaved_documents");

    auto docs = call_binding("list_documents", [&] { return m_binding->list_documents(m_app); });
    std::vector<DocumentInfo> unsaved;
    for (auto &doc : docs)
    {
        if (!doc.saved)
            unsaved.push_back(std::move(doc));
    }
    return unsaved;
}

CloseAllResult HostSession::close_all_documents(bool save)
{
    std::lock_guard<SingletonAccessLock> lock(m_lock);
    std::optional<BindingThreadGuard> thread;
    enter_thread(thread, "close_all_documents");

    CloseAllResult result;
    for (auto &entry : m_registry.drain())
    {
        if (!entry.owned)
        {
            result.untracked.push_back(entry.path);
            continue;
        }
        auto closed = attempt_step([&] { m_binding->close_document(entry.handle, save); });
        if (closed.is_ok())
            result.closed.push_back(entry.path);
        else
            result.errors.push_back(fmt::format("{}: {}", entry.path, closed.error_message()));
    }
    return result;
}

std::optional<std::string> HostSession::active_document_path()
{
    std::lock_guard<SingletonAccessLock> lock(m_lock);
    require_started("active_document_path");
    std::optional<BindingThreadGuard> thread;
    enter_thread(thread, "active_document_path");

    auto doc = call_binding("active_document", [&] { return m_binding->active_document(m_app); });
    if (!doc)
        return std::nullopt;
    auto info = call_binding("describe_document", [&] { return m_binding->describe_document(doc); });
    return info.has_path ? info.full_name : info.name;
}

ScopedViewGuard HostSession::scoped_preserve()
{
    return ScopedViewGuard(*this);
}

ScopedViewGuard::ScopedViewGuard(HostSession &session) : m_lock(session.access_lock())
{
    try
    {
        m_thread.emplace(session.binding());
    }
    catch (const std::exception &e)
    {
        throw HostError(HostErrorKind::HostUnavailable, "scoped_preserve",
                        fmt::format("binding thread initialization failed: {}", e.what()));
    }
    m_view.emplace(session.binding(), session.app_handle());
}

// ----------------------------------------------------------------------------
// queries
// ----------------------------------------------------------------------------

SessionStatus HostSession::status() const
{
    std::lock_guard<SingletonAccessLock> lock(m_lock);
    return SessionStatus{static_cast<bool>(m_app), m_registry.size(), m_registry.paths()};
}

bool HostSession::is_owned(std::string_view path) const
{
    std::lock_guard<SingletonAccessLock> lock(m_lock);
    return m_registry.is_owned(path);
}

bool HostSession::is_tracked(std::string_view path) const
{
    std::lock_guard<SingletonAccessLock> lock(m_lock);
    return m_registry.contains(path);
}

size_t HostSession::tracked_count() const
{
    std::lock_guard<SingletonAccessLock> lock(m_lock);
    return m_registry.size();
}

bool HostSession::running() const
{
    std::lock_guard<SingletonAccessLock> lock(m_lock);
    return static_cast<bool>(m_app);
}

AppHandle HostSession::app_handle() const
{
    std::lock_guard<SingletonAccessLock> lock(m_lock);
    return m_app;
}

bool HostSession::attached_to_existing() const
{
    std::lock_guard<SingletonAccessLock> lock(m_lock);
    return m_attached;
}

bool HostSession::binding_initialized_here() const
{
    std::lock_guard<SingletonAccessLock> lock(m_lock);
    return m_thread_guard && m_thread_guard->performed_init();
}

} // namespace hostkeeper::host
