#pragma once
/**
 * @file binding_thread.hpp
 * @brief Per-thread initialization guard for the thread-affine host binding.
 *
 * Each OS thread that touches a host handle must initialize the binding for itself first.
 * `BindingThreadGuard` does so on construction when the thread is not yet initialized for that
 * binding, and undoes it when the last guard on that thread goes away, but only if one of
 * these guards performed the initialization. A thread the caller had already initialized is
 * left as it was found.
 *
 * Guards nest: a lease taken on the session thread finds the thread initialized and leaves the
 * teardown to the session's own guard.
 */

#include "host/host_binding.hpp"
#include "hostkeeper_host_export.h"

#include <cstddef>
#include <thread>

namespace hostkeeper::host
{

class HOSTKEEPER_HOST_EXPORT BindingThreadGuard
{
  public:
    /// @throws whatever HostBinding::initialize_thread() throws; nothing is recorded then.
    explicit BindingThreadGuard(HostBinding &binding);
    ~BindingThreadGuard() noexcept;

    BindingThreadGuard(const BindingThreadGuard &) = delete;
    BindingThreadGuard &operator=(const BindingThreadGuard &) = delete;
    BindingThreadGuard(BindingThreadGuard &&) = delete;
    BindingThreadGuard &operator=(BindingThreadGuard &&) = delete;

    /**
     * @brief Ends this guard's claim now. Uninitializes the thread when this was the last guard
     *        and the guards initialized it. Called from another thread, only logs a warning:
     *        thread state can only be torn down on its own thread.
     */
    void release() noexcept;

    /// @brief true if constructing this guard initialized the thread.
    [[nodiscard]] bool performed_init() const noexcept { return m_performed_init; }
    [[nodiscard]] std::thread::id owner() const noexcept { return m_owner; }
    [[nodiscard]] bool released() const noexcept { return m_released; }

    /// @brief Number of live guards for @p binding on the calling thread.
    static size_t thread_depth(const HostBinding &binding) noexcept;

  private:
    HostBinding &m_binding;
    std::thread::id m_owner;
    bool m_performed_init = false;
    bool m_released = false;
};

} // namespace hostkeeper::host
