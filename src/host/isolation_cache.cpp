#include <ghmcp/host/isolation_cache.hpp>

#include <ghmcp/core/log.hpp>

namespace ghmcp {

std::string IsolationCacheKey(std::string_view scheme, std::string_view host) {
    std::string key;
    key.reserve(scheme.size() + 3 + host.size());
    key.append(scheme).append("://").append(host);
    return key;
}

std::string IsolationProbeUrl(std::string_view scheme, std::string_view host) {
    std::string url;
    url.append(scheme).append("://raw.").append(host).append("/_ping");
    return url;
}

bool ProbeSubdomainIsolation(IHttpClient& client, std::string_view scheme,
                             std::string_view host) {
    auto url = IsolationProbeUrl(scheme, host);
    auto response = client.Get(url);
    if (response.IsErr()) {
        LogDebug("host", "subdomain isolation probe failed",
                 {{"url", url}, {"error", response.Error().ToString()}});
        return false;
    }
    if (!response.Value().IsSuccess()) {
        auto err = Error::FromHttpStatus("ProbeSubdomainIsolation", url,
                                         response.Value().status_code,
                                         response.Value().body);
        LogDebug("host", "subdomain isolation probe rejected",
                 {{"url", url}, {"error", err.ToString()}});
        return false;
    }
    return true;
}

bool SubdomainIsolationCache::Check(IHttpClient& client,
                                    std::string_view scheme,
                                    std::string_view host) {
    auto key = IsolationCacheKey(scheme, host);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            return it->second;
        }
    }

    bool isolated = ProbeSubdomainIsolation(client, scheme, host);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[key] = isolated;
    }
    LogInfo("host", "subdomain isolation detected",
            {{"host", key}, {"isolated", isolated ? "true" : "false"}});
    return isolated;
}

std::optional<bool> SubdomainIsolationCache::Lookup(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t SubdomainIsolationCache::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace ghmcp
