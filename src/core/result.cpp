#include <ghmcp/core/result.hpp>

#include <nlohmann/json.hpp>

#include <cstring>

namespace ghmcp {

namespace {

// GitHub REST errors carry {"message": "...", "documentation_url": "..."}.
std::optional<std::string> ExtractApiMessage(const std::string& body) {
    if (body.empty()) return std::nullopt;
    auto j = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;
    auto it = j.find("message");
    if (it == j.end() || !it->is_string()) return std::nullopt;
    auto msg = it->get<std::string>();
    if (msg.empty()) return std::nullopt;
    return msg;
}

} // anonymous namespace

Error Error::FromHttpStatus(const std::string& operation,
                            const std::string& endpoint,
                            int status_code,
                            const std::string& response_body) {
    auto api_message = ExtractApiMessage(response_body);

    ErrorCategory category;
    std::string message;

    switch (status_code) {
        case 401:
            category = ErrorCategory::Connection;
            message = "Authentication failed - check the access token";
            break;
        case 403:
            category = ErrorCategory::Connection;
            message = "Forbidden";
            break;
        case 404:
            category = ErrorCategory::Connection;
            message = "Not found";
            break;
        case 408:
        case 504:
            category = ErrorCategory::Timeout;
            message = "Request timed out";
            break;
        case 429:
            category = ErrorCategory::Timeout;
            message = "Too many requests - retry later";
            break;
        case 502:
        case 503:
            category = ErrorCategory::Connection;
            message = "Server unavailable";
            break;
        default:
            category = ErrorCategory::Internal;
            message = "Unexpected HTTP " + std::to_string(status_code);
            break;
    }

    return Error{operation, endpoint, status_code, message, api_message,
                 category, std::nullopt};
}

Error Error::FromErrno(const std::string& operation, int err) {
    return Error{operation, "", std::nullopt, std::strerror(err), std::nullopt,
                 ErrorCategory::Io, err};
}

} // namespace ghmcp
