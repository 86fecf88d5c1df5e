#include <ghmcp/config/config_loader.hpp>
#include <ghmcp/core/log.hpp>
#include <ghmcp/core/signal_watcher.hpp>
#include <ghmcp/core/terminal.hpp>
#include <ghmcp/core/version.hpp>
#include <ghmcp/host/api_host.hpp>
#include <ghmcp/host/isolation_cache.hpp>
#include <ghmcp/http/http_client.hpp>
#include <ghmcp/io/io_logger.hpp>
#include <ghmcp/io/stream.hpp>
#include <ghmcp/mcp/mcp_server.hpp>
#include <ghmcp/mcp/mcp_tool_handlers.hpp>

#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>

#include <unistd.h>

namespace {

constexpr int kExitSuccess = 0;

void PrintError(const ghmcp::Error& error) {
    std::cerr << "ghmcp: " << error.ToString() << "\n";
}

// Resolve the full configuration: YAML < environment < CLI.
ghmcp::Result<ghmcp::ServerConfig, ghmcp::Error> LoadConfig(
    int argc, const char* const* argv) {
    using namespace ghmcp;

    auto cli_result = LoadFromCli(argc, argv);
    if (cli_result.IsErr()) {
        return cli_result;
    }
    auto cli_config = std::move(cli_result).Value();

    ServerConfig base;
    if (cli_config.config_file.has_value()) {
        auto yaml_result = LoadFromYaml(*cli_config.config_file);
        if (yaml_result.IsErr()) {
            return yaml_result;
        }
        base = std::move(yaml_result).Value();
    }

    auto config = MergeConfigs(ApplyEnvironment(std::move(base)), cli_config);

    auto resolved = ResolveToken(std::move(config));
    if (resolved.IsErr()) {
        return resolved;
    }
    config = std::move(resolved).Value();

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        return Result<ServerConfig, Error>::Err(valid.Error());
    }
    return Result<ServerConfig, Error>::Ok(std::move(config));
}

std::unique_ptr<ghmcp::ILogSink> MakeSink(const ghmcp::ServerConfig& config,
                                          std::ofstream& log_file) {
    using namespace ghmcp;
    if (log_file.is_open()) {
        if (config.json_logs) {
            return std::make_unique<JsonSink>(log_file);
        }
        return std::make_unique<ConsoleSink>(log_file);
    }
    if (config.json_logs) {
        return std::make_unique<JsonSink>(std::cerr);
    }
    return std::make_unique<ColorConsoleSink>(UseColorForStderr());
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace ghmcp;

    auto config_result = LoadConfig(argc, argv);
    if (config_result.IsErr()) {
        PrintError(config_result.Error());
        return config_result.Error().ExitCode();
    }
    const auto config = std::move(config_result).Value();

    // -- Logging -------------------------------------------------------------
    std::ofstream log_file;
    if (config.log_file.has_value()) {
        log_file.open(*config.log_file, std::ios::out | std::ios::app);
        if (!log_file) {
            PrintError(Error{"main", *config.log_file, std::nullopt,
                             "cannot open log file", std::nullopt,
                             ErrorCategory::Io, std::nullopt});
            return 2;
        }
    }
    InitGlobalLogger(MakeSink(config, log_file), EffectiveLogLevel(config));

    // -- Host ----------------------------------------------------------------
    auto host_result = ParseApiHost(config.host);
    if (host_result.IsErr()) {
        PrintError(host_result.Error());
        return host_result.Error().ExitCode();
    }
    const auto host = std::move(host_result).Value();

    HttpClientOptions http_options;
    http_options.connect_timeout = std::chrono::seconds(EffectiveTimeoutSeconds(config));
    http_options.read_timeout = std::chrono::seconds(EffectiveTimeoutSeconds(config));
    http_options.disable_tls_verify = config.insecure;
    HttpClient http_client(http_options);
    SubdomainIsolationCache isolation_cache;

    ToolRegistry registry(config.read_only);
    RegisterHostTools(registry, host, isolation_cache, http_client);

    // -- Transport -----------------------------------------------------------
    // SIGPIPE would kill the process on a closed stdout; EPIPE is handled.
    std::signal(SIGPIPE, SIG_IGN);

    FdSource stdin_source(STDIN_FILENO);
    FdSink stdout_sink(STDOUT_FILENO);

    std::unique_ptr<IoLogger> io_logger;
    IByteSource* source = &stdin_source;
    IByteSink* sink = &stdout_sink;
    if (config.enable_command_logging) {
        io_logger = std::make_unique<IoLogger>(stdin_source, stdout_sink,
                                               GlobalLogger());
        source = io_logger.get();
        sink = io_logger.get();
    }

    // Declared after io_logger so it is joined before the logger is freed.
    // On SIGINT/SIGTERM the transport logger is closed, so a concurrent
    // write from the server loop fails with ClosedPipe instead of reaching
    // stdout, and the process exits.
    SignalWatcher signal_watcher([logger = io_logger.get()](int /*sig*/) {
        if (logger != nullptr) {
            auto closed = logger->Close();
            if (closed.IsErr()) {
                LogWarn("main", "closing transport failed",
                        {{"error", closed.Error().ToString()}});
            }
        }
        LogInfo("main", "shutting down server");
        std::_Exit(kExitSuccess);
    });

    LogInfo("main", "starting server",
            {{"version", kVersion},
             {"host", HostKindName(host.kind)},
             {"rest_url", host.rest_url},
             {"read_only", config.read_only ? "true" : "false"},
             {"command_logging", config.enable_command_logging ? "true" : "false"}});

    McpServer server(std::move(registry), *source, *sink);
    auto run = server.Run();
    if (run.IsErr()) {
        PrintError(run.Error());
        return run.Error().ExitCode();
    }

    if (io_logger) {
        auto closed = io_logger->Close();
        if (closed.IsErr()) {
            LogWarn("main", "closing transport failed",
                    {{"error", closed.Error().ToString()}});
        }
    }
    return kExitSuccess;
}
