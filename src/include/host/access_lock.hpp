#pragma once
/**
 * @file access_lock.hpp
 * @brief Reentrant lock serializing every use of the single host handle.
 *
 * Satisfies BasicLockable and Lockable, so it works with `std::unique_lock` and
 * `std::scoped_lock`. Reentrant: a lease taken inside another lease's scope on the same thread
 * does not deadlock. `try_lock_for` bounds the wait for callers that must make progress even
 * when another thread is stuck inside a host call. Tracks the owning thread and nesting depth
 * for diagnostics and tests.
 */

#include "hostkeeper_host_export.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <thread>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace hostkeeper::host
{

class HOSTKEEPER_HOST_EXPORT SingletonAccessLock
{
  public:
    SingletonAccessLock() = default;
    SingletonAccessLock(const SingletonAccessLock &) = delete;
    SingletonAccessLock &operator=(const SingletonAccessLock &) = delete;

    void lock();
    bool try_lock();
    /// @brief Waits at most @p timeout. Returns false when another thread still holds the lock.
    bool try_lock_for(std::chrono::milliseconds timeout);
    void unlock();

    [[nodiscard]] bool held_by_current_thread() const noexcept;
    /// @brief Nesting depth; only meaningful on the owning thread.
    [[nodiscard]] size_t depth() const noexcept;

  private:
    void on_acquired() noexcept;

    std::recursive_timed_mutex m_mutex;
    std::atomic<std::thread::id> m_owner{};
    std::atomic<size_t> m_depth{0};
};

} // namespace hostkeeper::host

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
