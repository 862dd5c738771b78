#include "papercache/util/file-descriptor.hh"
#include "papercache/util/logging.hh"

#include <array>
#include <cerrno>
#include <utility>

#include <sys/stat.h>
#include <unistd.h>

namespace papercache {

std::string readFile(Descriptor fd)
{
    std::string res;

    struct stat st;
    if (fstat(fd, &st) == 0 && S_ISREG(st.st_mode))
        res.reserve(st.st_size);

    std::array<char, 64 * 1024> buf;
    for (ssize_t n; (n = read(fd, buf.data(), buf.size())) != 0;) {
        if (n > 0)
            res.append(buf.data(), n);
        else if (errno != EINTR)
            throw SysError("reading from file descriptor %d", fd);
    }

    return res;
}

void writeFull(Descriptor fd, std::string_view s)
{
    while (!s.empty()) {
        auto n = write(fd, s.data(), s.size());
        if (n >= 0)
            s.remove_prefix(n);
        else if (errno != EINTR)
            throw SysError("writing to file descriptor %d", fd);
    }
}

AutoCloseFD::AutoCloseFD(AutoCloseFD && that) noexcept
    : fd(std::exchange(that.fd, INVALID_DESCRIPTOR))
{
}

AutoCloseFD & AutoCloseFD::operator=(AutoCloseFD && that)
{
    if (this != &that) {
        close();
        fd = std::exchange(that.fd, INVALID_DESCRIPTOR);
    }
    return *this;
}

AutoCloseFD::~AutoCloseFD()
{
    try {
        close();
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

void AutoCloseFD::close()
{
    if (fd == INVALID_DESCRIPTOR)
        return;
    /* The descriptor is gone even if close() fails. */
    auto old = std::exchange(fd, INVALID_DESCRIPTOR);
    if (::close(old) == -1)
        throw SysError("closing file descriptor %d", old);
}

void AutoCloseFD::fsync() const
{
    if (fd != INVALID_DESCRIPTOR && ::fsync(fd) == -1)
        throw SysError("syncing file descriptor %d", fd);
}

} // namespace papercache
