#pragma once

#include "sink.hpp"

#include <filesystem>
#include <string>

namespace hostkeeper::utils
{

/**
 * @brief Appends formatted lines to one file.
 *
 * POSIX opens with O_APPEND; with `use_flock` each line is written under an exclusive flock()
 * so processes sharing the file do not interleave. Windows opens with FILE_APPEND_DATA.
 */
class FileSink : public Sink
{
  public:
    /// @throws std::runtime_error naming @p path when it cannot be opened.
    FileSink(const std::string &path, bool use_flock);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const LogMessage &msg, Sink::WRITE_MODE mode) override;
    void flush() override;
    std::string description() const override;

  private:
    /// @throws std::system_error when the bytes cannot all be written.
    void append(const std::string &line);

    std::filesystem::path m_path;
    bool m_use_flock = false;
#ifdef HOSTKEEPER_PLATFORM_WIN64
    void *m_handle = nullptr; // HANDLE
#else
    int m_fd = -1;
#endif
};

} // namespace hostkeeper::utils
