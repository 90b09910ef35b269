#include "host/host_keeper.hpp"
#include "utils/logger.hpp"

namespace hostkeeper::host
{

nlohmann::json ShutdownResult::to_json() const
{
    return nlohmann::json{{"success", success},
                          {"errors", errors.empty() ? nlohmann::json(nullptr) : nlohmann::json(errors)},
                          {"forced", forced}};
}

HostKeeper::HostKeeper(HostConfig config, std::shared_ptr<HostBinding> binding, ProcessListerChain listers,
                       ProcessKillerChain killers)
    : m_config(std::move(config)), m_binding(std::move(binding))
{
    m_guardian = std::make_shared<ProcessGuardian>(m_binding, m_config.host_image_name, std::move(listers),
                                                   std::move(killers), m_config.cleanup_release_passes);
    m_guardian->set_session_wait(std::chrono::milliseconds(m_config.session_stop_wait_ms));
    if (m_config.install_exit_hook)
    {
        m_guardian->install_exit_hook();
    }
    m_session = std::make_unique<HostSession>(m_binding, m_guardian, m_config.session_options());
}

HostKeeper::~HostKeeper()
{
    // The session detaches from the guardian in its destructor.
    m_session.reset();
}

HostSession &HostKeeper::ensure_session()
{
    if (!m_session->running())
    {
        m_session->start();
    }
    else if (!m_session->is_alive())
    {
        auto report = m_session->stop(false);
        LOGGER_INFO("HostKeeper: restarting session after failed liveness check ({} soft failure(s) on stop)",
                    report.failures().size());
        m_session->start();
    }
    return *m_session;
}

SessionStatus HostKeeper::status() const
{
    return m_session->status();
}

ShutdownResult HostKeeper::shutdown(bool force) noexcept
{
    ShutdownResult result;
    result.forced = force;
    try
    {
        if (auto stopped = m_session->try_stop(false, m_guardian->session_wait()))
        {
            for (auto &line : stopped->messages())
                result.errors.push_back(fmt::format("session stop: {}", line));
        }
        else
        {
            result.errors.push_back(fmt::format("session stop: session busy for {}ms; not stopped",
                                                m_guardian->session_wait().count()));
        }
        if (force)
        {
            auto cleanup = m_guardian->force_cleanup_all();
            for (auto &line : cleanup.report.messages())
                result.errors.push_back(fmt::format("force cleanup: {}", line));
        }
    }
    catch (const std::exception &e)
    {
        result.errors.push_back(fmt::format("shutdown: {}", e.what()));
    }
    result.success = result.errors.empty();
    LOGGER_INFO("HostKeeper: shutdown {} (forced={}, {} error(s))", result.success ? "clean" : "with errors",
                result.forced, result.errors.size());
    return result;
}

} // namespace hostkeeper::host
