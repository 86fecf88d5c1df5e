#pragma once

#include <optional>
#include <string>

namespace ghmcp {

constexpr const char* kDefaultTokenEnv = "GITHUB_PERSONAL_ACCESS_TOKEN";
constexpr const char* kHostEnv = "GITHUB_HOST";

struct ServerConfig {
    std::string host;                          // empty selects github.com
    std::string token;                         // resolved from token_env
    std::string token_env = kDefaultTokenEnv;  // env var holding the token
    bool enable_command_logging = false;
    std::optional<std::string> log_file;
    std::string log_level;                     // empty means "warn"
    bool json_logs = false;
    bool read_only = false;
    bool insecure = false;                     // skip TLS verification
    int timeout_seconds = 0;                   // 0 means default (5s)
    std::optional<std::string> config_file;
};

} // namespace ghmcp
