#include "utils/logger_sinks/file_sink.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>

namespace walkie::utils
{

FileSink::FileSink(std::filesystem::path path) : m_path(std::move(path))
{
    m_fd = ::open(m_path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0600);
    if (m_fd < 0)
    {
        throw std::system_error(errno, std::generic_category(), "open log " + m_path.string());
    }
}

FileSink::~FileSink()
{
    if (m_fd >= 0)
    {
        ::close(m_fd);
    }
}

void FileSink::emit(const LogRecord &record)
{
    const std::string line = render(record);
    const char *p = line.data();
    size_t left = line.size();
    while (left > 0)
    {
        const ssize_t n = ::write(m_fd, p, left);
        if (n < 0 && errno == EINTR)
        {
            continue;
        }
        if (n < 0)
        {
            throw std::system_error(errno, std::generic_category(), "write log " + m_path.string());
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
}

void FileSink::sync()
{
    // EINVAL: the fd does not support syncing (e.g. /dev/stderr redirected).
    if (::fdatasync(m_fd) != 0 && errno != EINVAL)
    {
        throw std::system_error(errno, std::generic_category(), "sync log " + m_path.string());
    }
}

} // namespace walkie::utils
