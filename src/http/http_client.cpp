#include <ghmcp/http/http_client.hpp>

#include <ghmcp/core/log.hpp>
#include <ghmcp/core/url.hpp>
#include <ghmcp/core/version.hpp>

#include <httplib.h>

namespace ghmcp {

namespace {

Error MakeTransportError(const std::string& url, httplib::Error error) {
    ErrorCategory category = ErrorCategory::Connection;
    switch (error) {
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::Read:
            category = ErrorCategory::Timeout;
            break;
        default:
            break;
    }
    return Error{"HttpClient::Get", url, std::nullopt,
                 "HTTP request failed: " + httplib::to_string(error),
                 std::nullopt, category, std::nullopt};
}

HttpHeaders ToHttpHeaders(const httplib::Headers& hdrs) {
    HttpHeaders result;
    for (const auto& [key, value] : hdrs) {
        result[key] = value;
    }
    return result;
}

} // anonymous namespace

struct HttpClient::Impl {
    HttpClientOptions options;

    explicit Impl(const HttpClientOptions& opts) : options(opts) {
        if (options.user_agent.empty()) {
            options.user_agent = std::string("ghmcp/") + kVersion;
        }
    }

    std::unique_ptr<httplib::Client> MakeClient(const ParsedUrl& url) const {
        auto client = std::make_unique<httplib::Client>(url.Origin());
        client->set_connection_timeout(options.connect_timeout);
        client->set_read_timeout(options.read_timeout);
        client->set_follow_location(false);
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        if (url.scheme == "https" && options.disable_tls_verify) {
            client->enable_server_certificate_verification(false);
        }
#endif
        return client;
    }
};

HttpClient::HttpClient(const HttpClientOptions& options)
    : impl_(std::make_unique<Impl>(options)) {}

HttpClient::~HttpClient() = default;

Result<HttpResponse, Error> HttpClient::Get(std::string_view url,
                                            const HttpHeaders& headers) {
    auto parsed = ParseUrl(url);
    if (parsed.IsErr()) {
        return Result<HttpResponse, Error>::Err(std::move(parsed).Error());
    }
    const auto& target = parsed.Value();

    auto client = impl_->MakeClient(target);

    httplib::Headers hdrs;
    hdrs.emplace("User-Agent", impl_->options.user_agent);
    for (const auto& [key, value] : headers) {
        hdrs.emplace(key, value);
    }

    LogDebug("http", "GET", {{"url", std::string(url)}});
    auto res = client->Get(target.path, hdrs);
    if (!res) {
        return Result<HttpResponse, Error>::Err(
            MakeTransportError(std::string(url), res.error()));
    }

    HttpResponse response;
    response.status_code = res->status;
    response.headers = ToHttpHeaders(res->headers);
    response.body = res->body;
    return Result<HttpResponse, Error>::Ok(std::move(response));
}

} // namespace ghmcp
