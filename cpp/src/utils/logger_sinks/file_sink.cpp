#include "utils/logger_sinks/file_sink.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <sys/file.h>
#include <unistd.h>

namespace zonechat::utils
{

namespace
{
constexpr mode_t kLogFileMode = 0644;
}

FileSink::FileSink(const std::string &path, bool use_flock) : m_path(path), m_use_flock(use_flock)
{
    m_fd = ::open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, kLogFileMode);
    if (m_fd == -1)
    {
        throw std::runtime_error(
            fmt::format("Failed to open log file '{}': {}", path, std::strerror(errno)));
    }
}

FileSink::~FileSink()
{
    if (m_fd != -1)
        ::close(m_fd);
}

void FileSink::write(const LogMessage &msg)
{
    if (m_fd == -1)
        return;
    const auto line = format_logmsg(msg);
    if (m_use_flock)
        ::flock(m_fd, LOCK_EX);
    const ssize_t written = ::write(m_fd, line.data(), line.size());
    if (m_use_flock)
        ::flock(m_fd, LOCK_UN);
    if (written < 0 || static_cast<size_t>(written) != line.size())
    {
        throw std::runtime_error(
            fmt::format("Short write to log file '{}': {}", m_path, std::strerror(errno)));
    }
}

void FileSink::flush()
{
    if (m_fd != -1)
        ::fsync(m_fd);
}

std::string FileSink::description() const
{
    return "File: " + m_path;
}

} // namespace zonechat::utils
