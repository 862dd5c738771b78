#pragma once
///@file

#include "papercache/util/error.hh"

#include <string_view>

namespace papercache {

using Descriptor = int;

const Descriptor INVALID_DESCRIPTOR = -1;

/**
 * Read from `fd` until end of file.
 */
std::string readFile(Descriptor fd);

/**
 * Write all of `s` to `fd`, retrying short writes.
 */
void writeFull(Descriptor fd, std::string_view s);

/**
 * Owns a file descriptor and closes it on destruction.
 */
class AutoCloseFD
{
    Descriptor fd = INVALID_DESCRIPTOR;

public:
    AutoCloseFD() = default;

    AutoCloseFD(Descriptor fd)
        : fd(fd)
    {
    }

    AutoCloseFD(AutoCloseFD && that) noexcept;
    AutoCloseFD & operator=(AutoCloseFD && that);

    ~AutoCloseFD();

    Descriptor get() const
    {
        return fd;
    }

    explicit operator bool() const
    {
        return fd != INVALID_DESCRIPTOR;
    }

    /**
     * Close now, reporting errors that the destructor would have to
     * swallow.
     */
    void close();

    void fsync() const;
};

} // namespace papercache
