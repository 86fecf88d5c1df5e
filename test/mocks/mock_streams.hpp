#pragma once

#include <ghmcp/io/stream.hpp>

#include <algorithm>
#include <cstring>
#include <deque>
#include <optional>
#include <string>

namespace ghmcp {
namespace testing {

// ---------------------------------------------------------------------------
// MemorySource: IByteSource over scripted chunks.
//
// Each Read() returns the next chunk (truncated to the buffer size, the rest
// stays queued) or the next queued error. An exhausted script reports
// EndOfStream. Counts calls, including those made after exhaustion.
// ---------------------------------------------------------------------------
class MemorySource : public IByteSource {
public:
    MemorySource() = default;
    explicit MemorySource(const std::string& data) { PushChunk(data); }

    void PushChunk(const std::string& data) { script_.push_back({data, std::nullopt}); }
    void PushError(const Error& error) { script_.push_back({"", error}); }

    Result<std::size_t, Error> Read(char* buffer, std::size_t size) override {
        ++read_calls;
        if (script_.empty()) {
            return Result<std::size_t, Error>::Err(Error::EndOfStream("MemorySource::Read"));
        }
        auto& step = script_.front();
        if (step.error.has_value()) {
            auto err = *step.error;
            script_.pop_front();
            return Result<std::size_t, Error>::Err(std::move(err));
        }
        auto n = std::min(size, step.data.size());
        std::memcpy(buffer, step.data.data(), n);
        step.data.erase(0, n);
        if (step.data.empty()) {
            script_.pop_front();
        }
        return Result<std::size_t, Error>::Ok(n);
    }

    int read_calls = 0;

private:
    struct Step {
        std::string data;
        std::optional<Error> error;
    };
    std::deque<Step> script_;
};

// ---------------------------------------------------------------------------
// MemorySink: IByteSink that appends to `data`. Optionally fails every
// write with `fail_with`, or accepts at most `max_chunk` bytes per call.
// ---------------------------------------------------------------------------
class MemorySink : public IByteSink {
public:
    Result<std::size_t, Error> Write(const char* bytes, std::size_t size) override {
        ++write_calls;
        if (fail_with.has_value()) {
            return Result<std::size_t, Error>::Err(*fail_with);
        }
        auto n = max_chunk > 0 ? std::min(size, max_chunk) : size;
        data.append(bytes, n);
        return Result<std::size_t, Error>::Ok(n);
    }

    std::string data;
    std::optional<Error> fail_with;
    std::size_t max_chunk = 0;
    int write_calls = 0;
};

// ---------------------------------------------------------------------------
// Closeable variants: count Close() calls and optionally fail them.
// ---------------------------------------------------------------------------
class CloseableMemorySource : public MemorySource, public ICloseable {
public:
    using MemorySource::MemorySource;

    Result<void, Error> Close() override {
        ++close_calls;
        if (close_error.has_value()) {
            return Result<void, Error>::Err(*close_error);
        }
        return Result<void, Error>::Ok();
    }

    int close_calls = 0;
    std::optional<Error> close_error;
};

class CloseableMemorySink : public MemorySink, public ICloseable {
public:
    Result<void, Error> Close() override {
        ++close_calls;
        if (close_error.has_value()) {
            return Result<void, Error>::Err(*close_error);
        }
        return Result<void, Error>::Ok();
    }

    int close_calls = 0;
    std::optional<Error> close_error;
};

// A single object acting as both ends of the transport (a socket, say).
class MemoryDuplex : public MemorySource, public MemorySink, public ICloseable {
public:
    Result<void, Error> Close() override {
        ++close_calls;
        return Result<void, Error>::Ok();
    }

    int close_calls = 0;
};

inline Error MakeIoError(const std::string& message) {
    return Error{"test", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Io, std::nullopt};
}

} // namespace testing
} // namespace ghmcp
