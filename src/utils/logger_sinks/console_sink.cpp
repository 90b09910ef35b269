#include "utils/logger_sinks/console_sink.hpp"

#include <cstdio>

namespace hostkeeper::utils
{

void ConsoleSink::write(const LogMessage &msg, Sink::WRITE_MODE mode)
{
    fmt::print(stderr, "{}", format_logmsg(msg, mode));
}

void ConsoleSink::flush()
{
    std::fflush(stderr);
}

std::string ConsoleSink::description() const
{
    return "Console";
}

} // namespace hostkeeper::utils
