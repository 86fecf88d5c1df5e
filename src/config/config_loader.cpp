#include <ghmcp/config/config_loader.hpp>

#include <ghmcp/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <string>

namespace ghmcp {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Config, std::nullopt};
}

void AddStdioArguments(argparse::ArgumentParser& cmd) {
    cmd.add_argument("--host")
        .help("API host, e.g. https://ghes.example.com or octo.ghe.com");
    cmd.add_argument("-c", "--config")
        .help("Path to YAML config file");
    cmd.add_argument("--token-env")
        .help("Environment variable holding the access token");
    cmd.add_argument("--enable-command-logging")
        .help("Log every chunk read from stdin and written to stdout")
        .default_value(false)
        .implicit_value(true);
    cmd.add_argument("--log-file")
        .help("Write logs to this file instead of stderr");
    cmd.add_argument("--log-level")
        .help("debug, info, warn or error");
    cmd.add_argument("--json-logs")
        .help("Emit logs as JSON lines")
        .default_value(false)
        .implicit_value(true);
    cmd.add_argument("--read-only")
        .help("Only register read-only tools")
        .default_value(false)
        .implicit_value(true);
    cmd.add_argument("--insecure")
        .help("Skip TLS certificate verification for host probes")
        .default_value(false)
        .implicit_value(true);
    cmd.add_argument("--timeout")
        .help("HTTP timeout in seconds")
        .scan<'i', int>();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<ServerConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<ServerConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    ServerConfig config;
    try {
        if (root["host"]) {
            config.host = root["host"].as<std::string>();
        }
        if (root["token_env"]) {
            config.token_env = root["token_env"].as<std::string>();
        }
        if (root["enable_command_logging"]) {
            config.enable_command_logging = root["enable_command_logging"].as<bool>();
        }
        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
        if (root["log_level"]) {
            config.log_level = root["log_level"].as<std::string>();
        }
        if (root["json_logs"]) {
            config.json_logs = root["json_logs"].as<bool>();
        }
        if (root["read_only"]) {
            config.read_only = root["read_only"].as<bool>();
        }
        if (root["insecure"]) {
            config.insecure = root["insecure"].as<bool>();
        }
        if (root["timeout"]) {
            config.timeout_seconds = root["timeout"].as<int>();
        }
    } catch (const YAML::Exception& e) {
        return Result<ServerConfig, Error>::Err(
            MakeConfigError("Invalid value in YAML file: " + std::string(e.what())));
    }
    if (root["token"]) {
        return Result<ServerConfig, Error>::Err(MakeConfigError(
            "Tokens are not read from config files; use token_env"));
    }

    config.config_file = std::string(file_path);
    return Result<ServerConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<ServerConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("ghmcp", kVersion);
    program.add_description("MCP server for the GitHub API");

    argparse::ArgumentParser stdio_cmd("stdio");
    stdio_cmd.add_description("Start the server on stdin/stdout");
    AddStdioArguments(stdio_cmd);
    program.add_subparser(stdio_cmd);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<ServerConfig, Error>::Err(MakeConfigError(e.what()));
    }

    if (!program.is_subcommand_used(stdio_cmd)) {
        return Result<ServerConfig, Error>::Err(
            MakeConfigError("Missing command (expected: stdio)"));
    }

    ServerConfig config;
    if (auto host = stdio_cmd.present("--host")) {
        config.host = *host;
    }
    if (auto path = stdio_cmd.present("--config")) {
        config.config_file = *path;
    }
    if (auto env = stdio_cmd.present("--token-env")) {
        config.token_env = *env;
    }
    if (auto file = stdio_cmd.present("--log-file")) {
        config.log_file = *file;
    }
    if (auto level = stdio_cmd.present("--log-level")) {
        config.log_level = *level;
    }
    if (auto timeout = stdio_cmd.present<int>("--timeout")) {
        config.timeout_seconds = *timeout;
    }
    config.enable_command_logging = stdio_cmd.get<bool>("--enable-command-logging");
    config.json_logs = stdio_cmd.get<bool>("--json-logs");
    config.read_only = stdio_cmd.get<bool>("--read-only");
    config.insecure = stdio_cmd.get<bool>("--insecure");

    return Result<ServerConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ApplyEnvironment
// ---------------------------------------------------------------------------
ServerConfig ApplyEnvironment(ServerConfig config) {
    const char* host = std::getenv(kHostEnv);
    if (host != nullptr && *host != '\0') {
        config.host = host;
    }
    return config;
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
ServerConfig MergeConfigs(const ServerConfig& base, const ServerConfig& overrides) {
    ServerConfig merged = base;

    if (!overrides.host.empty()) {
        merged.host = overrides.host;
    }
    if (!overrides.token.empty()) {
        merged.token = overrides.token;
    }
    if (overrides.token_env != kDefaultTokenEnv) {
        merged.token_env = overrides.token_env;
    }
    if (overrides.log_file.has_value()) {
        merged.log_file = overrides.log_file;
    }
    if (!overrides.log_level.empty()) {
        merged.log_level = overrides.log_level;
    }
    if (overrides.timeout_seconds != 0) {
        merged.timeout_seconds = overrides.timeout_seconds;
    }
    if (overrides.config_file.has_value()) {
        merged.config_file = overrides.config_file;
    }

    // Boolean switches can only be turned on by an override.
    merged.enable_command_logging = base.enable_command_logging || overrides.enable_command_logging;
    merged.json_logs = base.json_logs || overrides.json_logs;
    merged.read_only = base.read_only || overrides.read_only;
    merged.insecure = base.insecure || overrides.insecure;

    return merged;
}

// ---------------------------------------------------------------------------
// ResolveToken
// ---------------------------------------------------------------------------
Result<ServerConfig, Error> ResolveToken(ServerConfig config) {
    if (!config.token.empty()) {
        return Result<ServerConfig, Error>::Ok(std::move(config));
    }
    if (config.token_env.empty()) {
        return Result<ServerConfig, Error>::Err(
            MakeConfigError("token_env must name an environment variable"));
    }
    const char* value = std::getenv(config.token_env.c_str());
    if (value == nullptr || *value == '\0') {
        return Result<ServerConfig, Error>::Err(
            MakeConfigError(config.token_env + " not set"));
    }
    config.token = value;
    return Result<ServerConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const ServerConfig& config) {
    if (config.token.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("Missing access token (set " + config.token_env + ")"));
    }
    if (config.timeout_seconds < 0) {
        return Result<void, Error>::Err(
            MakeConfigError("timeout must be a positive number of seconds"));
    }
    LogLevel level = LogLevel::Warn;
    if (!config.log_level.empty() && !ParseLogLevel(config.log_level, level)) {
        return Result<void, Error>::Err(
            MakeConfigError("Unknown log level: " + config.log_level));
    }
    if (config.log_file.has_value() && config.log_file->empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("log_file must not be empty"));
    }
    return Result<void, Error>::Ok();
}

LogLevel EffectiveLogLevel(const ServerConfig& config) {
    LogLevel level = LogLevel::Warn;
    if (!config.log_level.empty() && !ParseLogLevel(config.log_level, level)) {
        level = LogLevel::Warn;
    }
    // Command logging emits at Info; make sure those records get through.
    if (config.enable_command_logging &&
        static_cast<int>(level) > static_cast<int>(LogLevel::Info)) {
        level = LogLevel::Info;
    }
    return level;
}

int EffectiveTimeoutSeconds(const ServerConfig& config) {
    return config.timeout_seconds > 0 ? config.timeout_seconds
                                      : kDefaultTimeoutSeconds;
}

} // namespace ghmcp
