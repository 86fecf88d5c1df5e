#pragma once

#include <ghmcp/host/api_host.hpp>
#include <ghmcp/host/isolation_cache.hpp>
#include <ghmcp/http/http_client.hpp>
#include <ghmcp/mcp/tool_registry.hpp>

namespace ghmcp {

// Register the host tools (get_api_host, get_raw_content_url).
// Handlers capture host, cache and client by reference; all three must
// outlive the registry. Handlers may run concurrently.
void RegisterHostTools(ToolRegistry& registry, const ApiHost& host,
                       SubdomainIsolationCache& cache, IHttpClient& client);

} // namespace ghmcp
