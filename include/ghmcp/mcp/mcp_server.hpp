#pragma once

#include <ghmcp/core/result.hpp>
#include <ghmcp/io/stream.hpp>
#include <ghmcp/mcp/tool_registry.hpp>

#include <cstddef>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace ghmcp {

// ---------------------------------------------------------------------------
// McpServer: MCP 2024-11-05 server over a byte stream pair.
//
// Messages are newline-delimited JSON-RPC 2.0. Implemented methods:
//   - initialize
//   - ping
//   - tools/list
//   - tools/call
//   - notifications/* (no response)
//
// The transport is usually an IoLogger around stdin/stdout; closing that
// logger ends Run() through EndOfStream / ClosedPipe.
//
// A line longer than `max_line_bytes` is answered with a -32700 parse error
// and skipped up to its terminating newline; at most that many bytes of an
// unterminated line are buffered.
// ---------------------------------------------------------------------------
class McpServer {
public:
    static constexpr std::size_t kDefaultMaxLineBytes = 4 * 1024 * 1024;

    McpServer(ToolRegistry registry, IByteSource& in, IByteSink& out,
              std::size_t max_line_bytes = kDefaultMaxLineBytes);

    /// Serve until the input ends or the output is closed. Other transport
    /// errors are returned.
    [[nodiscard]] Result<void, Error> Run();

    // Process a single JSON-RPC message and return the response (if any).
    // Returns nullopt for notifications.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message);

    [[nodiscard]] bool Initialized() const noexcept { return initialized_; }

private:
    // Handle one line; returns false once the output side is gone.
    [[nodiscard]] Result<bool, Error> HandleLine(const std::string& line);
    [[nodiscard]] Result<bool, Error> RejectOversized(std::size_t size);
    [[nodiscard]] Result<bool, Error> Send(const nlohmann::json& message);

    nlohmann::json HandleInitialize(const nlohmann::json& params,
                                    const nlohmann::json& id);
    nlohmann::json HandleToolsList(const nlohmann::json& id);
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id);
    static nlohmann::json MakeError(const nlohmann::json& id,
                                    int code, const std::string& message);
    static nlohmann::json MakeResult(const nlohmann::json& id,
                                     const nlohmann::json& result);

    ToolRegistry registry_;
    IByteSource& in_;
    IByteSink& out_;
    std::size_t max_line_bytes_;
    std::string pending_;
    bool discarding_ = false;  // inside an oversized line
    bool initialized_ = false;
};

} // namespace ghmcp
