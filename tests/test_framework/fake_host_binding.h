// tests/test_framework/fake_host_binding.h
#pragma once

#include "hk_host.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

/**
 * @file fake_host_binding.h
 * @brief In-memory stand-in for the automation host.
 *
 * Models one running application at a time with its documents, their sheets, the active
 * document and sheet, the selection and the window scroll position. Handles point at shared
 * model objects, so a quit instance or a closed document makes every outstanding handle throw
 * on its next use, the way a dead COM reference does.
 *
 * Failure injection: fail_on("open_document") makes every later call of that operation throw
 * until clear_failures(). Counters record how often each operation ran and whether any call
 * came from a thread that was not initialized for the binding.
 */
namespace hostkeeper::tests::helper
{

class FakeHostBinding : public hostkeeper::host::HostBinding
{
  public:
    struct Sheet;
    struct Document;

    struct App
    {
        bool alive = true;
        bool visible = false;
        bool display_alerts = true;
        std::vector<std::shared_ptr<Document>> documents;
        std::shared_ptr<Document> active;
        std::string selection = "A1";
        std::string active_cell = "A1";
        hostkeeper::host::ScrollPosition scroll;
    };

    struct Document
    {
        std::string name;
        std::string full_name;
        bool has_path = true;
        bool saved = true;
        bool open = true;
        std::weak_ptr<App> app;
        std::vector<std::shared_ptr<Sheet>> sheets;
        std::shared_ptr<Sheet> active_sheet;
    };

    struct Sheet
    {
        std::string name;
        std::weak_ptr<Document> document;
    };

    FakeHostBinding() = default;

    // --- HostBinding ------------------------------------------------------------------------

    std::string description() const override { return "fake"; }

    bool initialize_thread() override;
    void uninitialize_thread() noexcept override;

    hostkeeper::host::AppHandle attach_existing() override;
    hostkeeper::host::AppHandle create_instance() override;
    void set_visible(const hostkeeper::host::AppHandle &app, bool visible) override;
    void set_display_alerts(const hostkeeper::host::AppHandle &app, bool enabled) override;
    long document_count(const hostkeeper::host::AppHandle &app) override;
    void quit(const hostkeeper::host::AppHandle &app) override;
    void release_references() noexcept override;

    std::vector<hostkeeper::host::DocumentInfo>
    list_documents(const hostkeeper::host::AppHandle &app) override;
    hostkeeper::host::DocumentHandle open_document(const hostkeeper::host::AppHandle &app,
                                                   const std::string &path, bool read_only) override;
    hostkeeper::host::DocumentHandle create_document(const hostkeeper::host::AppHandle &app,
                                                     const std::string &path) override;
    hostkeeper::host::DocumentInfo
    describe_document(const hostkeeper::host::DocumentHandle &doc) override;
    void save_document(const hostkeeper::host::DocumentHandle &doc) override;
    void close_document(const hostkeeper::host::DocumentHandle &doc, bool save_changes) override;

    hostkeeper::host::DocumentHandle active_document(const hostkeeper::host::AppHandle &app) override;
    hostkeeper::host::SheetHandle active_sheet(const hostkeeper::host::AppHandle &app) override;
    std::string selection_address(const hostkeeper::host::AppHandle &app) override;
    std::string active_cell_address(const hostkeeper::host::AppHandle &app) override;
    hostkeeper::host::ScrollPosition scroll_position(const hostkeeper::host::AppHandle &app) override;
    void activate_document(const hostkeeper::host::DocumentHandle &doc) override;
    void activate_sheet(const hostkeeper::host::SheetHandle &sheet) override;
    void set_scroll_position(const hostkeeper::host::AppHandle &app,
                             const hostkeeper::host::ScrollPosition &pos) override;

    // --- test controls ----------------------------------------------------------------------

    /// @brief Simulates a host instance started by the user before the session.
    void start_user_instance();
    /**
     * @brief Opens a document in the running instance as the user would, and activates it.
     * @param sheets Sheet names; the first becomes active. Defaults to {"Sheet1"}.
     */
    void user_open_document(const std::string &path, std::vector<std::string> sheets = {});
    /// @brief A never-saved document ("Book1") in the running instance; unmodified when @p modified is false.
    void user_new_unsaved_document(const std::string &name, bool modified = true);
    /// @brief Marks a document as modified.
    void touch_document(const std::string &path);
    /// @brief Activates sheet @p sheet of document @p path, as a user click would.
    void user_activate(const std::string &path, const std::string &sheet);
    void user_scroll(long row, long column);
    /// @brief Simulates a host crash: every handle into the running instance goes stale.
    void kill_instance();

    /// @brief Runs after each successful create_instance() (e.g. to add a fake process).
    void on_create_instance(std::function<void()> fn);
    /// @brief Runs after each successful quit() (e.g. to remove the fake process).
    void on_quit(std::function<void()> fn);

    /// @brief Pretends the calling thread was initialized by someone else.
    void mark_thread_preinitialized();
    void fail_thread_init(bool fail);

    void fail_on(const std::string &operation);
    void clear_failures();

    // --- inspection -------------------------------------------------------------------------

    bool instance_running() const;
    /// @brief Paths (full names) of documents currently open in the running instance.
    std::vector<std::string> open_paths() const;
    bool is_open(const std::string &path) const;
    /// @brief Name of the active sheet ("" when none).
    std::string active_sheet_name() const;
    /// @brief Full name of the active document ("" when none).
    std::string active_document_name() const;
    hostkeeper::host::ScrollPosition current_scroll() const;
    bool current_visible() const;
    bool current_display_alerts() const;

    int calls(const std::string &operation) const;
    std::vector<std::string> closed_paths() const;
    std::vector<std::string> saved_paths() const;
    int init_calls() const { return m_init_calls.load(); }
    int uninit_calls() const { return m_uninit_calls.load(); }
    int release_calls() const { return m_release_calls.load(); }
    /// @brief Calls made on a thread that was not initialized for the binding.
    int unbound_calls() const { return m_unbound_calls.load(); }
    bool thread_initialized(std::thread::id id) const;

  private:
    // Call-site bookkeeping; throws when @p operation is set to fail. Expects m_mutex held.
    void enter(const std::string &operation);
    std::shared_ptr<App> live_app(const hostkeeper::host::AppHandle &app) const;
    std::shared_ptr<Document> live_document(const hostkeeper::host::DocumentHandle &doc) const;
    std::shared_ptr<Document> find_document(const std::shared_ptr<App> &app,
                                            const std::string &path) const;
    std::shared_ptr<Document> add_document(const std::shared_ptr<App> &app, const std::string &path,
                                           std::vector<std::string> sheets, bool has_path);
    void remove_document(const std::shared_ptr<Document> &doc);
    static hostkeeper::host::DocumentInfo info_of(const std::shared_ptr<Document> &doc);
    std::shared_ptr<App> running_or_throw(const char *what) const;

    mutable std::mutex m_mutex;
    std::shared_ptr<App> m_running;
    std::function<void()> m_on_create;
    std::function<void()> m_on_quit;

    std::set<std::thread::id> m_initialized;
    std::set<std::thread::id> m_preinitialized;
    bool m_fail_thread_init = false;

    std::set<std::string> m_failing;
    std::map<std::string, int> m_calls;
    std::vector<std::string> m_closed;
    std::vector<std::string> m_saved;

    std::atomic<int> m_init_calls{0};
    std::atomic<int> m_uninit_calls{0};
    std::atomic<int> m_release_calls{0};
    std::atomic<int> m_unbound_calls{0};
};

} // namespace hostkeeper::tests::helper
