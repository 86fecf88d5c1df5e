#include <ghmcp/io/io_logger.hpp>

#include <string_view>

namespace ghmcp {

namespace {

constexpr const char* kComponent = "stdio";

} // anonymous namespace

const char* DirectionName(IoDirection direction) {
    switch (direction) {
        case IoDirection::Read:  return "read";
        case IoDirection::Write: return "write";
    }
    return "unknown";
}

IoLogger::IoLogger(IByteSource& source, IByteSink& sink, Logger& logger,
                   Redactor redactor)
    : source_(source), sink_(sink), logger_(logger),
      redactor_(std::move(redactor)) {}

Result<std::size_t, Error> IoLogger::Read(char* buffer, std::size_t size) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return Result<std::size_t, Error>::Err(Error::EndOfStream("IoLogger::Read"));
        }
    }

    auto result = source_.Read(buffer, size);
    if (result.IsErr()) {
        return result;
    }

    // A read that was blocked across Close() drops what it received.
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return Result<std::size_t, Error>::Err(Error::EndOfStream("IoLogger::Read"));
        }
    }
    Emit(IoDirection::Read, buffer, result.Value());
    return result;
}

Result<std::size_t, Error> IoLogger::Write(const char* data, std::size_t size) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return Result<std::size_t, Error>::Err(Error::ClosedPipe("IoLogger::Write"));
        }
    }

    auto result = sink_.Write(data, size);
    if (result.IsOk()) {
        Emit(IoDirection::Write, data, result.Value());
    }
    return result;
}

Result<void, Error> IoLogger::Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return Result<void, Error>::Ok();
    }
    closed_ = true;

    auto* source_closer = dynamic_cast<ICloseable*>(&source_);
    auto* sink_closer = dynamic_cast<ICloseable*>(&sink_);

    std::optional<Error> first_error;
    if (source_closer != nullptr) {
        auto r = source_closer->Close();
        if (r.IsErr()) {
            first_error = std::move(r).Error();
        }
    }
    if (sink_closer != nullptr && sink_closer != source_closer) {
        auto r = sink_closer->Close();
        if (r.IsErr() && !first_error.has_value()) {
            first_error = std::move(r).Error();
        }
    }

    if (first_error.has_value()) {
        return Result<void, Error>::Err(std::move(*first_error));
    }
    return Result<void, Error>::Ok();
}

bool IoLogger::IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

void IoLogger::Emit(IoDirection direction, const char* data, std::size_t n) {
    auto payload = redactor_.Redact(std::string_view(data, n));
    logger_.Info(kComponent,
                 direction == IoDirection::Read ? "[stdin]: received bytes"
                                                : "[stdout]: sending bytes",
                 {
                     {"direction", DirectionName(direction)},
                     {"count", std::to_string(n)},
                     {"payload", std::move(payload)},
                 });
}

} // namespace ghmcp
