#include "host/host_errors.hpp"
#include "utils/logger.hpp"

#include <fmt/format.h>

namespace hostkeeper::host
{

const char *to_string(HostErrorKind kind) noexcept
{
    switch (kind)
    {
    case HostErrorKind::HostUnavailable:
        return "HostUnavailable";
    case HostErrorKind::DocumentNotFound:
        return "DocumentNotFound";
    case HostErrorKind::StaleHandle:
        return "StaleHandle";
    case HostErrorKind::NotOwned:
        return "NotOwned";
    case HostErrorKind::PlatformCallFailed:
        return "PlatformCallFailed";
    }
    return "Unknown";
}

HostError::HostError(HostErrorKind kind, std::string operation, std::string detail)
    : std::runtime_error(fmt::format("{} in {}: {}", to_string(kind), operation, detail)),
      m_kind(kind), m_operation(std::move(operation)), m_detail(std::move(detail))
{
}

nlohmann::json HostError::to_json() const
{
    return nlohmann::json{{"error", to_string(m_kind)},
                          {"message", what()},
                          {"details", {{"kind", to_string(m_kind)}, {"operation", m_operation}, {"detail", m_detail}}}};
}

bool CleanupReport::record(std::string_view step, const StepResult &result)
{
    if (result.is_ok())
        return true;
    m_failures.push_back(SoftFailure{std::string(step), result.error_message()});
    return false;
}

void CleanupReport::add(std::string_view step, std::string_view message)
{
    m_failures.push_back(SoftFailure{std::string(step), std::string(message)});
}

void CleanupReport::merge(const CleanupReport &other)
{
    m_failures.insert(m_failures.end(), other.m_failures.begin(), other.m_failures.end());
}

std::vector<std::string> CleanupReport::messages() const
{
    std::vector<std::string> out;
    out.reserve(m_failures.size());
    for (const auto &f : m_failures)
    {
        out.push_back(fmt::format("{}: {}", f.step, f.message));
    }
    return out;
}

void CleanupReport::log_failures(std::string_view context) const noexcept
{
    for (const auto &f : m_failures)
    {
        LOGGER_WARN("[{}] step '{}' failed: {}", context, f.step, f.message);
    }
}

} // namespace hostkeeper::host
