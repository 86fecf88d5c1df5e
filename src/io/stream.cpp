#include <ghmcp/io/stream.hpp>

#include <cerrno>
#include <string>

#include <fcntl.h>
#include <unistd.h>

namespace ghmcp {

namespace {

// Point `fd` at /dev/null. A thread blocked on the old file keeps its
// reference; everything after this sees /dev/null.
Result<void, Error> DetachDescriptor(int fd, const char* operation) {
    int null_fd = ::open("/dev/null", O_RDWR | O_CLOEXEC);
    if (null_fd < 0) {
        return Result<void, Error>::Err(Error::FromErrno(operation, errno));
    }
    int rc = 0;
    do {
        rc = ::dup2(null_fd, fd);
    } while (rc < 0 && errno == EINTR);
    int dup_errno = errno;
    ::close(null_fd);
    if (rc < 0) {
        return Result<void, Error>::Err(Error::FromErrno(operation, dup_errno));
    }
    return Result<void, Error>::Ok();
}

void ReleaseDescriptor(int fd) {
    if (fd >= 0) {
        ::close(fd);
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// FdSource
// ---------------------------------------------------------------------------
Result<std::size_t, Error> FdSource::Read(char* buffer, std::size_t size) {
    if (closed_) {
        return Result<std::size_t, Error>::Err(Error::EndOfStream("FdSource::Read"));
    }
    for (;;) {
        auto n = ::read(fd_, buffer, size);
        if (n > 0) {
            return Result<std::size_t, Error>::Ok(static_cast<std::size_t>(n));
        }
        if (n == 0) {
            return Result<std::size_t, Error>::Err(Error::EndOfStream("FdSource::Read"));
        }
        if (errno == EINTR) {
            continue;
        }
        return Result<std::size_t, Error>::Err(Error::FromErrno("FdSource::Read", errno));
    }
}

FdSource::~FdSource() {
    ReleaseDescriptor(fd_);
}

Result<void, Error> FdSource::Close() {
    if (closed_.exchange(true)) {
        return Result<void, Error>::Ok();
    }
    return DetachDescriptor(fd_, "FdSource::Close");
}

// ---------------------------------------------------------------------------
// FdSink
// ---------------------------------------------------------------------------
Result<std::size_t, Error> FdSink::Write(const char* data, std::size_t size) {
    if (closed_) {
        return Result<std::size_t, Error>::Err(Error::ClosedPipe("FdSink::Write"));
    }
    std::size_t written = 0;
    while (written < size) {
        auto n = ::write(fd_, data + written, size - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EPIPE) {
                return Result<std::size_t, Error>::Err(Error::ClosedPipe("FdSink::Write"));
            }
            return Result<std::size_t, Error>::Err(Error::FromErrno("FdSink::Write", errno));
        }
        written += static_cast<std::size_t>(n);
    }
    return Result<std::size_t, Error>::Ok(written);
}

FdSink::~FdSink() {
    ReleaseDescriptor(fd_);
}

Result<void, Error> FdSink::Close() {
    if (closed_.exchange(true)) {
        return Result<void, Error>::Ok();
    }
    return DetachDescriptor(fd_, "FdSink::Close");
}

// ---------------------------------------------------------------------------
// IstreamSource / OstreamSink
// ---------------------------------------------------------------------------
Result<std::size_t, Error> IstreamSource::Read(char* buffer, std::size_t size) {
    if (size == 0) {
        return Result<std::size_t, Error>::Ok(0);
    }
    if (in_.bad()) {
        return Result<std::size_t, Error>::Err(Error{
            "IstreamSource::Read", "", std::nullopt, "input stream is in a bad state",
            std::nullopt, ErrorCategory::Io, std::nullopt});
    }
    in_.read(buffer, static_cast<std::streamsize>(size));
    auto n = in_.gcount();
    if (n > 0) {
        return Result<std::size_t, Error>::Ok(static_cast<std::size_t>(n));
    }
    return Result<std::size_t, Error>::Err(Error::EndOfStream("IstreamSource::Read"));
}

Result<std::size_t, Error> OstreamSink::Write(const char* data, std::size_t size) {
    out_.write(data, static_cast<std::streamsize>(size));
    out_.flush();
    if (!out_) {
        return Result<std::size_t, Error>::Err(Error{
            "OstreamSink::Write", "", std::nullopt, "output stream write failed",
            std::nullopt, ErrorCategory::Io, std::nullopt});
    }
    return Result<std::size_t, Error>::Ok(size);
}

} // namespace ghmcp
