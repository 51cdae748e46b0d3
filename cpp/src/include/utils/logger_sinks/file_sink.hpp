#pragma once

#include "utils/logger_sinks/sink.hpp"

#include <string>

namespace zonechat::utils
{

/** @brief Appends formatted log lines to a file; optional advisory flock per write. */
class FileSink : public Sink
{
  public:
    FileSink(const std::string &path, bool use_flock);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const LogMessage &msg) override;
    void flush() override;
    std::string description() const override;

  private:
    std::string m_path;
    bool m_use_flock;
    int m_fd{-1};
};

} // namespace zonechat::utils
