#pragma once

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

namespace hostkeeper::basics
{

/**
 * @brief Calls its action when the scope ends, unless dismissed first.
 *
 * `HostSession::start()` uses it to give back the session claim when attaching fails:
 *
 * @code
 *  auto rollback = hostkeeper::basics::make_scope_guard([&]() noexcept { rollback_start(); });
 *  attach_or_create();
 *  rollback.dismiss();
 * @endcode
 *
 * Whatever the action throws is dropped in the destructor. Moving a guard disarms the source.
 */
template <typename Callable>
requires std::invocable<Callable &>
class ScopeGuard
{
  public:
    static_assert(!std::is_reference_v<Callable>, "ScopeGuard stores its action by value");

    explicit ScopeGuard(Callable fn) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_action(std::move(fn))
    {
    }

    ScopeGuard(ScopeGuard &&other) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_action(std::move(other.m_action)), m_armed(std::exchange(other.m_armed, false))
    {
    }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    ~ScopeGuard() noexcept
    {
        if (!m_armed)
            return;
        try
        {
            std::invoke(m_action);
        }
        catch (...)
        {
            // Cleanup action; nothing left to report to.
        }
    }

    void dismiss() noexcept { m_armed = false; }
    [[nodiscard]] bool armed() const noexcept { return m_armed; }

  private:
    Callable m_action;
    bool m_armed{true};
};

/// @brief Anything captured by reference in @p f must outlive the guard.
template <typename F> auto make_scope_guard(F &&f) -> ScopeGuard<std::decay_t<F>>
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(f));
}

} // namespace hostkeeper::basics
