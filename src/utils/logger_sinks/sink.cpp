#include "hk_base.hpp"
#include "utils/logger_sinks/sink.hpp"

namespace hostkeeper::utils
{

// Plain int switch so sinks do not depend on Logger::Level.
const char *Sink::level_to_string_internal(int lvl)
{
    switch (lvl)
    {
    case 0:
        return "TRACE";
    case 1:
        return "DEBUG";
    case 2:
        return "INFO";
    case 3:
        return "WARN";
    case 4:
        return "ERROR";
    case 5:
        return "SYSTEM";
    default:
        return "UNK";
    }
}

std::string Sink::format_logmsg(const LogMessage &msg, Sink::WRITE_MODE mode)
{
    const std::string time_str = format_tools::formatted_time(msg.timestamp);
    const std::string_view tag = (mode == Sink::ASYNC_WRITE) ? "LOGGER" : "LOGGER_SYNC";
    return fmt::format("[{}] [{:<6}] [{}] [PID:{:5} TID:{:5}] {}\n", tag,
                       level_to_string_internal(msg.level), time_str, msg.process_id,
                       msg.thread_id, std::string_view(msg.body.data(), msg.body.size()));
}

} // namespace hostkeeper::utils
