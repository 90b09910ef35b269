#include "host/access_lock.hpp"

namespace hostkeeper::host
{

void SingletonAccessLock::lock()
{
    m_mutex.lock();
    on_acquired();
}

bool SingletonAccessLock::try_lock()
{
    if (!m_mutex.try_lock())
        return false;
    on_acquired();
    return true;
}

bool SingletonAccessLock::try_lock_for(std::chrono::milliseconds timeout)
{
    if (!m_mutex.try_lock_for(timeout))
        return false;
    on_acquired();
    return true;
}

void SingletonAccessLock::unlock()
{
    if (m_depth.fetch_sub(1, std::memory_order_acq_rel) == 1)
    {
        m_owner.store(std::thread::id{}, std::memory_order_release);
    }
    m_mutex.unlock();
}

bool SingletonAccessLock::held_by_current_thread() const noexcept
{
    return m_owner.load(std::memory_order_acquire) == std::this_thread::get_id();
}

size_t SingletonAccessLock::depth() const noexcept
{
    return held_by_current_thread() ? m_depth.load(std::memory_order_acquire) : 0;
}

void SingletonAccessLock::on_acquired() noexcept
{
    m_owner.store(std::this_thread::get_id(), std::memory_order_release);
    m_depth.fetch_add(1, std::memory_order_acq_rel);
}

} // namespace hostkeeper::host
