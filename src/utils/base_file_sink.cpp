#include "ct_base.hpp"

#include <cerrno>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

#include "base_file_sink.hpp"

namespace calltrace::utils
{

BaseFileSink::~BaseFileSink()
{
    close();
}

void BaseFileSink::open(const std::filesystem::path &path, OpenMode mode)
{
    close();

    int flags = O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC;
    if (mode == OpenMode::Truncate)
        flags |= O_TRUNC;

    const int fd = ::open(path.c_str(), flags, 0644);
    if (fd == -1)
        throw std::system_error(errno, std::generic_category(), "open");

    m_fd = fd;
    m_path = path;
}

void BaseFileSink::close() noexcept
{
    if (m_fd != -1)
    {
        ::close(m_fd);
        m_fd = -1;
    }
}

void BaseFileSink::append(std::string_view line)
{
    if (!is_open())
        return;

    const char *data = line.data();
    size_t remaining = line.size();
    while (remaining > 0)
    {
        const ssize_t n = ::write(m_fd, data, remaining);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            throw std::system_error(errno, std::generic_category(),
                                    fmt::format("write to {}", m_path.string()));
        }
        data += n;
        remaining -= static_cast<size_t>(n);
    }
}

void BaseFileSink::sync() noexcept
{
    if (is_open())
        ::fdatasync(m_fd);
}

} // namespace calltrace::utils
