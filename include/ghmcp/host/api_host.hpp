#pragma once

#include <ghmcp/core/result.hpp>
#include <ghmcp/host/isolation_cache.hpp>
#include <ghmcp/http/http_client.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace ghmcp {

enum class HostKind {
    DotCom,            // github.com
    Tenancy,           // *.ghe.com data residency
    EnterpriseServer,  // self-hosted, explicit scheme://host
};

const char* HostKindName(HostKind kind);

// ---------------------------------------------------------------------------
// ApiHost: base URLs of the API deployment the server talks to.
//
// `raw_url` is known up front for DotCom and Tenancy. For EnterpriseServer
// it depends on whether the instance isolates the raw. subdomain and is
// resolved with ResolveRawBaseUrl().
// ---------------------------------------------------------------------------
struct ApiHost {
    HostKind kind = HostKind::DotCom;
    std::string scheme;
    std::string authority;  // host[:port]
    std::string rest_url;
    std::string graphql_url;
    std::string upload_url;
    std::optional<std::string> raw_url;
};

/// Parse the configured host. "" and "github.com" select DotCom; hosts ending
/// in ".ghe.com" select Tenancy (always https); anything else must carry an
/// http or https scheme and selects EnterpriseServer.
Result<ApiHost, Error> ParseApiHost(std::string_view host);

/// Raw-content base URL, ending in '/'. For EnterpriseServer this consults
/// `cache`, probing through `client` on first use per host.
std::string ResolveRawBaseUrl(const ApiHost& host,
                              SubdomainIsolationCache& cache,
                              IHttpClient& client);

/// <raw_base><owner>/<repo>/<ref>/<path>, each part percent-encoded.
std::string RawContentUrl(const std::string& raw_base,
                          const std::string& owner,
                          const std::string& repo,
                          const std::string& ref,
                          const std::string& path);

} // namespace ghmcp
