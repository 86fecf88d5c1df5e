#pragma once

#include <cassert>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <variant>

namespace ghmcp {

// ---------------------------------------------------------------------------
// Result<T, E>: a discriminated union that holds either a value or an error.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    static Result Ok(const T& value) { return Result(OkTag{}, value); }
    static Result Ok(T&& value) { return Result(OkTag{}, std::move(value)); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(storage_);
    }

    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(std::move(storage_));
    }

    [[nodiscard]] T ValueOr(T default_value) const& {
        if (IsOk()) {
            return std::get<0>(storage_);
        }
        return default_value;
    }

private:
    struct OkTag {};
    struct ErrTag {};

    Result(OkTag, const T& value) : storage_(std::in_place_index<0>, value) {}
    Result(OkTag, T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(ErrTag, const E& error) : storage_(std::in_place_index<1>, error) {}
    Result(ErrTag, E&& error) : storage_(std::in_place_index<1>, std::move(error)) {}

    std::variant<T, E> storage_;
};

// ---------------------------------------------------------------------------
// Result<void, E>: specialization for operations that succeed with no value.
// ---------------------------------------------------------------------------
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(OkTag{}); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return *error_;
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::move(*error_);
    }

private:
    struct OkTag {};
    struct ErrTag {};

    explicit Result(OkTag) : error_(std::nullopt) {}
    Result(ErrTag, const E& error) : error_(error) {}
    Result(ErrTag, E&& error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

// ---------------------------------------------------------------------------
// ErrorCategory: classifies errors for exit codes and structured output.
//
// EndOfStream and ClosedPipe are control signals for stream loops, not
// failures: readers stop on EndOfStream, writers stop on ClosedPipe.
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    EndOfStream,
    ClosedPipe,
    Io,
    Connection,
    Timeout,
    Config,
    Protocol,
    Internal,
};

// ---------------------------------------------------------------------------
// Error: structured error type shared by every module.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string endpoint;
    std::optional<int> http_status;
    std::string message;
    std::optional<std::string> api_message;
    ErrorCategory category = ErrorCategory::Internal;
    std::optional<int> sys_errno;

    /// Create an Error from a non-success HTTP status. When the body is a
    /// GitHub-style JSON error ({"message": "..."}) its message is kept.
    static Error FromHttpStatus(const std::string& operation,
                                const std::string& endpoint,
                                int status_code,
                                const std::string& response_body = "");

    /// Create an Io error from an errno value.
    static Error FromErrno(const std::string& operation, int err);

    static Error EndOfStream(const std::string& operation) {
        return Error{operation, "", std::nullopt, "end of stream", std::nullopt,
                     ErrorCategory::EndOfStream, std::nullopt};
    }

    static Error ClosedPipe(const std::string& operation) {
        return Error{operation, "", std::nullopt, "write on closed pipe",
                     std::nullopt, ErrorCategory::ClosedPipe, std::nullopt};
    }

    [[nodiscard]] bool Is(ErrorCategory c) const noexcept { return category == c; }

    [[nodiscard]] int ExitCode() const {
        switch (category) {
            case ErrorCategory::Config:      return 1;
            case ErrorCategory::Io:          return 2;
            case ErrorCategory::Connection:  return 3;
            case ErrorCategory::Timeout:     return 3;
            case ErrorCategory::EndOfStream: return 0;
            case ErrorCategory::ClosedPipe:  return 0;
            case ErrorCategory::Protocol:    return 99;
            case ErrorCategory::Internal:    return 99;
        }
        return 99;
    }

    [[nodiscard]] std::string CategoryName() const {
        switch (category) {
            case ErrorCategory::EndOfStream: return "end_of_stream";
            case ErrorCategory::ClosedPipe:  return "closed_pipe";
            case ErrorCategory::Io:          return "io";
            case ErrorCategory::Connection:  return "connection";
            case ErrorCategory::Timeout:     return "timeout";
            case ErrorCategory::Config:      return "config";
            case ErrorCategory::Protocol:    return "protocol";
            case ErrorCategory::Internal:    return "internal";
        }
        return "internal";
    }

    [[nodiscard]] std::string ToString() const {
        std::ostringstream oss;
        oss << operation;
        if (!endpoint.empty()) {
            oss << " [" << endpoint << "]";
        }
        if (http_status.has_value()) {
            oss << " (HTTP " << *http_status << ")";
        }
        oss << ": " << message;
        if (api_message.has_value() && !api_message->empty()) {
            oss << " - API: " << *api_message;
        }
        return oss.str();
    }

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation &&
               endpoint == other.endpoint &&
               http_status == other.http_status &&
               message == other.message &&
               api_message == other.api_message &&
               category == other.category &&
               sys_errno == other.sys_errno;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

} // namespace ghmcp
