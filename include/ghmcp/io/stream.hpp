#pragma once

#include <ghmcp/core/result.hpp>

#include <atomic>
#include <cstddef>
#include <istream>
#include <ostream>

namespace ghmcp {

// ---------------------------------------------------------------------------
// Byte stream interfaces: the transport boundary of the MCP server.
//
// Read() returns the number of bytes placed in `buffer` (at least one), or
// an Error. End of input is reported as ErrorCategory::EndOfStream, never as
// a zero-length success. Write() returns the number of bytes accepted.
// ---------------------------------------------------------------------------
class IByteSource {
public:
    virtual ~IByteSource() = default;
    [[nodiscard]] virtual Result<std::size_t, Error> Read(
        char* buffer, std::size_t size) = 0;
};

class IByteSink {
public:
    virtual ~IByteSink() = default;
    [[nodiscard]] virtual Result<std::size_t, Error> Write(
        const char* data, std::size_t size) = 0;
};

// Implemented by streams that own a releasable resource.
class ICloseable {
public:
    virtual ~ICloseable() = default;
    [[nodiscard]] virtual Result<void, Error> Close() = 0;
};

// ---------------------------------------------------------------------------
// FdSource / FdSink: POSIX file descriptor adapters (stdin/stdout, pipes,
// sockets). Reads and writes retry on EINTR. The adapter owns `fd`.
//
// Close() may run on another thread while a Read() or Write() is blocked on
// the descriptor. It marks the adapter closed and points the descriptor at
// /dev/null with dup2(), which releases the underlying pipe or tty without
// freeing the descriptor number. The number itself is closed by the
// destructor. Later Close() calls return Ok.
// ---------------------------------------------------------------------------
class FdSource : public IByteSource, public ICloseable {
public:
    explicit FdSource(int fd) : fd_(fd) {}
    ~FdSource() override;

    FdSource(const FdSource&) = delete;
    FdSource& operator=(const FdSource&) = delete;

    [[nodiscard]] Result<std::size_t, Error> Read(
        char* buffer, std::size_t size) override;
    [[nodiscard]] Result<void, Error> Close() override;

private:
    int fd_;
    std::atomic<bool> closed_{false};
};

class FdSink : public IByteSink, public ICloseable {
public:
    explicit FdSink(int fd) : fd_(fd) {}
    ~FdSink() override;

    FdSink(const FdSink&) = delete;
    FdSink& operator=(const FdSink&) = delete;

    /// Writes the whole buffer unless the descriptor fails part-way.
    [[nodiscard]] Result<std::size_t, Error> Write(
        const char* data, std::size_t size) override;
    [[nodiscard]] Result<void, Error> Close() override;

private:
    int fd_;
    std::atomic<bool> closed_{false};
};

// ---------------------------------------------------------------------------
// IstreamSource / OstreamSink: adapters over iostreams. Not closeable.
// IstreamSource::Read fills the whole buffer unless input ends first, so
// interactive transports should use FdSource instead.
// ---------------------------------------------------------------------------
class IstreamSource : public IByteSource {
public:
    explicit IstreamSource(std::istream& in) : in_(in) {}
    [[nodiscard]] Result<std::size_t, Error> Read(
        char* buffer, std::size_t size) override;
private:
    std::istream& in_;
};

class OstreamSink : public IByteSink {
public:
    explicit OstreamSink(std::ostream& out) : out_(out) {}
    [[nodiscard]] Result<std::size_t, Error> Write(
        const char* data, std::size_t size) override;
private:
    std::ostream& out_;
};

} // namespace ghmcp
