#include "host/binding_thread.hpp"
#include "utils/logger.hpp"

#include <map>

namespace hostkeeper::host
{

namespace
{
struct ThreadBindingState
{
    size_t depth = 0;
    bool initialized_here = false;
};

// One entry per binding object the current thread is using.
std::map<const HostBinding *, ThreadBindingState> &thread_states()
{
    thread_local std::map<const HostBinding *, ThreadBindingState> states;
    return states;
}
} // namespace

BindingThreadGuard::BindingThreadGuard(HostBinding &binding)
    : m_binding(binding), m_owner(std::this_thread::get_id())
{
    auto &state = thread_states()[&m_binding];
    if (state.depth == 0)
    {
        try
        {
            state.initialized_here = m_binding.initialize_thread();
        }
        catch (...)
        {
            thread_states().erase(&m_binding);
            throw;
        }
        m_performed_init = state.initialized_here;
        LOGGER_DEBUG("binding '{}' thread init ({})", m_binding.description(),
                     m_performed_init ? "performed here" : "already initialized by caller");
    }
    ++state.depth;
}

BindingThreadGuard::~BindingThreadGuard() noexcept
{
    release();
}

void BindingThreadGuard::release() noexcept
{
    if (m_released)
        return;
    m_released = true;

    if (std::this_thread::get_id() != m_owner)
    {
        LOGGER_WARN("binding '{}' guard released off its owning thread; thread state left as is",
                    m_binding.description());
        return;
    }

    auto &states = thread_states();
    auto it = states.find(&m_binding);
    if (it == states.end())
        return;
    if (--it->second.depth == 0)
    {
        const bool uninit = it->second.initialized_here;
        states.erase(it);
        if (uninit)
        {
            m_binding.uninitialize_thread();
            LOGGER_DEBUG("binding '{}' thread uninitialized", m_binding.description());
        }
    }
}

size_t BindingThreadGuard::thread_depth(const HostBinding &binding) noexcept
{
    auto &states = thread_states();
    auto it = states.find(&binding);
    return it == states.end() ? 0 : it->second.depth;
}

} // namespace hostkeeper::host
