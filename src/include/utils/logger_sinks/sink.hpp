#pragma once

#include "hk_base.hpp"

namespace hostkeeper::utils
{

// One log event as it travels from the producer to the worker thread.
struct LogMessage
{
    std::chrono::system_clock::time_point timestamp;
    uint64_t process_id;
    uint64_t thread_id;
    int level; // int keeps this header independent of logger.hpp
    fmt::memory_buffer body;
};

// Abstract interface for a log message destination.
class Sink
{
  public:
    enum WRITE_MODE
    {
        ASYNC_WRITE,
        SYNC_WRITE
    };

    virtual ~Sink() = default;
    virtual void write(const LogMessage &msg, Sink::WRITE_MODE mode) = 0;
    virtual void flush() = 0;
    virtual std::string description() const = 0;

    static const char *level_to_string_internal(int lvl);
    static std::string format_logmsg(const LogMessage &msg, Sink::WRITE_MODE mode);
};

} // namespace hostkeeper::utils
