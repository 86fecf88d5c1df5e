#pragma once

#include <ghmcp/core/result.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace ghmcp {

// ---------------------------------------------------------------------------
// HttpHeaders: header name/value pairs. Names are kept as given.
// ---------------------------------------------------------------------------
using HttpHeaders = std::map<std::string, std::string>;

// ---------------------------------------------------------------------------
// HttpResponse: the result of an HTTP request.
// ---------------------------------------------------------------------------
struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::string body;

    [[nodiscard]] bool IsSuccess() const noexcept {
        return status_code >= 200 && status_code < 300;
    }
};

// ---------------------------------------------------------------------------
// IHttpClient: abstract HTTP client used for host probes.
//
// Any status code is an Ok result; only transport failures (DNS, connect,
// TLS, timeout) are errors. This enables offline testing via MockHttpClient.
// Implementations must be safe to call from several threads at once.
// ---------------------------------------------------------------------------
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    IHttpClient(const IHttpClient&) = delete;
    IHttpClient& operator=(const IHttpClient&) = delete;
    IHttpClient(IHttpClient&&) = delete;
    IHttpClient& operator=(IHttpClient&&) = delete;

    [[nodiscard]] virtual Result<HttpResponse, Error> Get(
        std::string_view url,
        const HttpHeaders& headers = {}) = 0;

protected:
    IHttpClient() = default;
};

// ---------------------------------------------------------------------------
// HttpClientOptions: transport policy for HttpClient.
// ---------------------------------------------------------------------------
struct HttpClientOptions {
    std::chrono::seconds connect_timeout{5};
    std::chrono::seconds read_timeout{5};
    std::string user_agent;
    bool disable_tls_verify = false;
};

// ---------------------------------------------------------------------------
// HttpClient: IHttpClient on top of cpp-httplib.
//
// Uses pimpl to keep httplib out of the public header. Each request gets its
// own httplib::Client, so concurrent Get() calls share no connection state.
// ---------------------------------------------------------------------------
class HttpClient : public IHttpClient {
public:
    explicit HttpClient(const HttpClientOptions& options = {});
    ~HttpClient() override;

    [[nodiscard]] Result<HttpResponse, Error> Get(
        std::string_view url,
        const HttpHeaders& headers = {}) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ghmcp
