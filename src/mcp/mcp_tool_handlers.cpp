#include <ghmcp/mcp/mcp_tool_handlers.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace ghmcp {

namespace {

// Get a required string param. Returns nullopt and sets out_error on failure.
std::optional<std::string> RequireString(const nlohmann::json& params,
                                         const std::string& key,
                                         ToolResult& out_error) {
    if (!params.contains(key) || !params[key].is_string() ||
        params[key].get<std::string>().empty()) {
        out_error = ToolResult::ErrorText("Missing required parameter: " + key);
        return std::nullopt;
    }
    return params[key].get<std::string>();
}

std::string OptString(const nlohmann::json& params, const std::string& key,
                      const std::string& default_val = "") {
    if (params.contains(key) && params[key].is_string() &&
        !params[key].get<std::string>().empty()) {
        return params[key].get<std::string>();
    }
    return default_val;
}

nlohmann::json StringProp(const std::string& description) {
    return {{"type", "string"}, {"description", description}};
}

} // anonymous namespace

void RegisterHostTools(ToolRegistry& registry, const ApiHost& host,
                       SubdomainIsolationCache& cache, IHttpClient& client) {
    registry.Register(
        ToolSchema{
            "get_api_host",
            "Describe the API deployment this server is configured for: its "
            "kind and REST, GraphQL, upload and raw-content base URLs.",
            {{"type", "object"}, {"properties", nlohmann::json::object()}},
            true,
        },
        [&host, &cache, &client](const nlohmann::json& /*params*/) -> ToolResult {
            nlohmann::json data = {
                {"kind", HostKindName(host.kind)},
                {"rest_url", host.rest_url},
                {"graphql_url", host.graphql_url},
                {"upload_url", host.upload_url},
                {"raw_url", ResolveRawBaseUrl(host, cache, client)},
            };
            return ToolResult::Text(data.dump());
        });

    registry.Register(
        ToolSchema{
            "get_raw_content_url",
            "Build the raw-content URL of a file in a repository.",
            {{"type", "object"},
             {"properties", {
                 {"owner", StringProp("Repository owner")},
                 {"repo", StringProp("Repository name")},
                 {"path", StringProp("Path of the file in the repository")},
                 {"ref", StringProp("Branch, tag or commit (default HEAD)")},
             }},
             {"required", nlohmann::json::array({"owner", "repo", "path"})}},
            true,
        },
        [&host, &cache, &client](const nlohmann::json& params) -> ToolResult {
            ToolResult err;
            auto owner = RequireString(params, "owner", err);
            if (!owner) return err;
            auto repo = RequireString(params, "repo", err);
            if (!repo) return err;
            auto path = RequireString(params, "path", err);
            if (!path) return err;
            auto ref = OptString(params, "ref", "HEAD");

            auto base = ResolveRawBaseUrl(host, cache, client);
            return ToolResult::Text(RawContentUrl(base, *owner, *repo, ref, *path));
        });
}

} // namespace ghmcp
