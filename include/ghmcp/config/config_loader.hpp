#pragma once

#include <ghmcp/config/server_config.hpp>
#include <ghmcp/core/log.hpp>
#include <ghmcp/core/result.hpp>

#include <string_view>

namespace ghmcp {

constexpr int kDefaultTimeoutSeconds = 5;

// Parse a YAML config file into a ServerConfig.
Result<ServerConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse "ghmcp stdio [flags]" into a ServerConfig.
Result<ServerConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Apply GITHUB_HOST over the config's host when the variable is set.
ServerConfig ApplyEnvironment(ServerConfig config);

// Merge two configs: fields set in overrides replace those in base.
ServerConfig MergeConfigs(const ServerConfig& base, const ServerConfig& overrides);

// Read the token from the environment variable named by token_env,
// unless a token is already present.
Result<ServerConfig, Error> ResolveToken(ServerConfig config);

// Validate that all required fields are present and values are sane.
Result<void, Error> ValidateConfig(const ServerConfig& config);

// Effective values with defaults applied.
LogLevel EffectiveLogLevel(const ServerConfig& config);
int EffectiveTimeoutSeconds(const ServerConfig& config);

} // namespace ghmcp
