#include <ghmcp/host/api_host.hpp>

#include <ghmcp/core/url.hpp>

namespace ghmcp {

namespace {

constexpr std::string_view kDotComHost = "github.com";
constexpr std::string_view kTenancySuffix = ".ghe.com";

bool EndsWith(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

ApiHost DotComHost() {
    ApiHost h;
    h.kind = HostKind::DotCom;
    h.scheme = "https";
    h.authority = std::string(kDotComHost);
    h.rest_url = "https://api.github.com/";
    h.graphql_url = "https://api.github.com/graphql";
    h.upload_url = "https://uploads.github.com";
    h.raw_url = "https://raw.githubusercontent.com/";
    return h;
}

ApiHost TenancyHost(const std::string& hostname) {
    ApiHost h;
    h.kind = HostKind::Tenancy;
    h.scheme = "https";
    h.authority = hostname;
    h.rest_url = "https://api." + hostname + "/";
    h.graphql_url = "https://api." + hostname + "/graphql";
    h.upload_url = "https://uploads." + hostname;
    h.raw_url = "https://raw." + hostname + "/";
    return h;
}

ApiHost EnterpriseServerHost(const ParsedUrl& url) {
    auto base = url.Origin();
    ApiHost h;
    h.kind = HostKind::EnterpriseServer;
    h.scheme = url.scheme;
    h.authority = base.substr(url.scheme.size() + 3);
    h.rest_url = base + "/api/v3/";
    h.graphql_url = base + "/api/graphql";
    h.upload_url = base + "/api/uploads/";
    return h;
}

} // anonymous namespace

const char* HostKindName(HostKind kind) {
    switch (kind) {
        case HostKind::DotCom:           return "dotcom";
        case HostKind::Tenancy:          return "tenancy";
        case HostKind::EnterpriseServer: return "enterprise_server";
    }
    return "unknown";
}

Result<ApiHost, Error> ParseApiHost(std::string_view host) {
    if (host.empty() || host == kDotComHost) {
        return Result<ApiHost, Error>::Ok(DotComHost());
    }
    if (host.find("://") == std::string_view::npos &&
        EndsWith(host, kTenancySuffix)) {
        return Result<ApiHost, Error>::Ok(TenancyHost(std::string(host)));
    }

    auto parsed = ParseUrl(host);
    if (parsed.IsErr()) {
        auto err = std::move(parsed).Error();
        err.operation = "ParseApiHost";
        err.message = "host must be of the form http(s)://hostname: " + err.message;
        return Result<ApiHost, Error>::Err(std::move(err));
    }
    const auto& url = parsed.Value();

    if (url.host == kDotComHost || EndsWith(url.host, ".github.com")) {
        return Result<ApiHost, Error>::Ok(DotComHost());
    }
    if (EndsWith(url.host, kTenancySuffix)) {
        return Result<ApiHost, Error>::Ok(TenancyHost(url.host));
    }
    return Result<ApiHost, Error>::Ok(EnterpriseServerHost(url));
}

std::string ResolveRawBaseUrl(const ApiHost& host,
                              SubdomainIsolationCache& cache,
                              IHttpClient& client) {
    if (host.raw_url.has_value()) {
        return *host.raw_url;
    }
    if (cache.Check(client, host.scheme, host.authority)) {
        return host.scheme + "://raw." + host.authority + "/";
    }
    return host.scheme + "://" + host.authority + "/raw/";
}

std::string RawContentUrl(const std::string& raw_base,
                          const std::string& owner,
                          const std::string& repo,
                          const std::string& ref,
                          const std::string& path) {
    auto trimmed = path;
    while (!trimmed.empty() && trimmed.front() == '/') {
        trimmed.erase(trimmed.begin());
    }
    return raw_base + UrlEncode(owner) + "/" + UrlEncode(repo) + "/" +
           UrlEncodePath(ref) + "/" + UrlEncodePath(trimmed);
}

} // namespace ghmcp
