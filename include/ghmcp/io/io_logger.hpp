#pragma once

#include <ghmcp/core/log.hpp>
#include <ghmcp/core/redact.hpp>
#include <ghmcp/io/stream.hpp>

#include <cstddef>
#include <mutex>
#include <string>

namespace ghmcp {

enum class IoDirection {
    Read,
    Write,
};

const char* DirectionName(IoDirection direction);

// ---------------------------------------------------------------------------
// IoLogger: duplex transport wrapper that logs every chunk it forwards.
//
// Reads come from `source`, writes go to `sink`; the bytes are passed
// through untouched. After each successful operation exactly one Info
// record is emitted on `logger` (component "stdio") with the fields
//   direction=read|write  count=<n>  payload=<redacted chunk>
// Underlying errors are returned as-is and are not logged.
//
// Close() flips the logger to closed exactly once. From then on Read()
// returns EndOfStream and Write() returns ClosedPipe without touching the
// wrapped streams. The closed flag is guarded by one mutex shared by all
// three operations; the mutex is not held across Read/Write I/O, so Close()
// may be called from another thread while a read is blocked. Bytes returned
// by a read that was already in flight when Close() ran are discarded: the
// caller gets EndOfStream and nothing is logged.
// ---------------------------------------------------------------------------
class IoLogger : public IByteSource, public IByteSink, public ICloseable {
public:
    IoLogger(IByteSource& source, IByteSink& sink, Logger& logger,
             Redactor redactor = Redactor());

    IoLogger(const IoLogger&) = delete;
    IoLogger& operator=(const IoLogger&) = delete;

    [[nodiscard]] Result<std::size_t, Error> Read(
        char* buffer, std::size_t size) override;

    [[nodiscard]] Result<std::size_t, Error> Write(
        const char* data, std::size_t size) override;

    /// Close the source and sink if they are ICloseable (an object that is
    /// both is closed once). Returns the first close error. Idempotent.
    [[nodiscard]] Result<void, Error> Close() override;

    [[nodiscard]] bool IsClosed() const;

private:
    void Emit(IoDirection direction, const char* data, std::size_t n);

    IByteSource& source_;
    IByteSink& sink_;
    Logger& logger_;
    Redactor redactor_;

    mutable std::mutex mutex_;
    bool closed_ = false;
};

} // namespace ghmcp
