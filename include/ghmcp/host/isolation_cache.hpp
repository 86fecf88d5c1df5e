#pragma once

#include <ghmcp/http/http_client.hpp>

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace ghmcp {

/// "scheme://host": the key under which a probe result is cached.
std::string IsolationCacheKey(std::string_view scheme, std::string_view host);

/// "scheme://raw.host/_ping": the URL the probe requests.
std::string IsolationProbeUrl(std::string_view scheme, std::string_view host);

/// One-shot probe: GET IsolationProbeUrl() through `client`. Returns true
/// only for a 2xx response; transport failures and other statuses are
/// logged at debug level and yield false.
bool ProbeSubdomainIsolation(IHttpClient& client, std::string_view scheme,
                             std::string_view host);

// ---------------------------------------------------------------------------
// SubdomainIsolationCache: per-host memo of ProbeSubdomainIsolation().
//
// Construct one per process and pass it by reference to every caller. The
// mutex covers map access only; the probe itself runs unlocked, so two
// callers racing on a cold key may both probe (the last store wins). Entries
// never expire, including negative results from a failed probe.
// ---------------------------------------------------------------------------
class SubdomainIsolationCache {
public:
    SubdomainIsolationCache() = default;

    SubdomainIsolationCache(const SubdomainIsolationCache&) = delete;
    SubdomainIsolationCache& operator=(const SubdomainIsolationCache&) = delete;

    /// Cached flag for scheme://host, probing on first use.
    [[nodiscard]] bool Check(IHttpClient& client, std::string_view scheme,
                             std::string_view host);

    /// Stored flag for a cache key, without probing.
    [[nodiscard]] std::optional<bool> Lookup(const std::string& key) const;

    [[nodiscard]] std::size_t Size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, bool> entries_;
};

} // namespace ghmcp
