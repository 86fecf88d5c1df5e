#include <ghmcp/mcp/mcp_server.hpp>

#include <ghmcp/core/log.hpp>
#include <ghmcp/core/version.hpp>

#include <array>
#include <string>

namespace ghmcp {

namespace {

constexpr const char* kProtocolVersion = "2024-11-05";
constexpr std::size_t kReadChunk = 4096;

bool IsStreamEnd(const Error& e) {
    return e.Is(ErrorCategory::EndOfStream) || e.Is(ErrorCategory::ClosedPipe);
}

} // anonymous namespace

McpServer::McpServer(ToolRegistry registry, IByteSource& in, IByteSink& out,
                     std::size_t max_line_bytes)
    : registry_(std::move(registry)), in_(in), out_(out),
      max_line_bytes_(max_line_bytes) {}

Result<void, Error> McpServer::Run() {
    std::array<char, kReadChunk> buffer{};
    for (;;) {
        auto read = in_.Read(buffer.data(), buffer.size());
        if (read.IsErr()) {
            const auto& err = read.Error();
            if (!IsStreamEnd(err)) {
                LogError("mcp", "transport read failed", {{"error", err.ToString()}});
                return Result<void, Error>::Err(err);
            }
            // Serve a final unterminated line before stopping.
            if (!pending_.empty() && !discarding_) {
                auto line = std::move(pending_);
                pending_.clear();
                auto handled = HandleLine(line);
                if (handled.IsErr()) {
                    return Result<void, Error>::Err(std::move(handled).Error());
                }
            }
            LogInfo("mcp", "input closed, stopping server");
            return Result<void, Error>::Ok();
        }

        pending_.append(buffer.data(), read.Value());
        std::size_t start = 0;
        for (auto nl = pending_.find('\n', start); nl != std::string::npos;
             nl = pending_.find('\n', start)) {
            auto length = nl - start;
            auto line_start = start;
            start = nl + 1;
            if (discarding_) {
                // End of a line that was already rejected.
                discarding_ = false;
                continue;
            }
            auto handled = length > max_line_bytes_
                               ? RejectOversized(length)
                               : HandleLine(pending_.substr(line_start, length));
            if (handled.IsErr()) {
                return Result<void, Error>::Err(std::move(handled).Error());
            }
            if (!handled.Value()) {
                LogInfo("mcp", "output closed, stopping server");
                return Result<void, Error>::Ok();
            }
        }
        pending_.erase(0, start);

        if (pending_.size() > max_line_bytes_) {
            if (!discarding_) {
                discarding_ = true;
                auto handled = RejectOversized(pending_.size());
                if (handled.IsErr()) {
                    return Result<void, Error>::Err(std::move(handled).Error());
                }
                if (!handled.Value()) {
                    LogInfo("mcp", "output closed, stopping server");
                    return Result<void, Error>::Ok();
                }
            }
            pending_.clear();
        }
    }
}

Result<bool, Error> McpServer::HandleLine(const std::string& line) {
    auto text = line;
    if (!text.empty() && text.back() == '\r') {
        text.pop_back();
    }
    if (text.empty()) {
        return Result<bool, Error>::Ok(true);
    }

    nlohmann::json message;
    try {
        message = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        LogWarn("mcp", "unparsable message", {{"error", e.what()}});
        return Send(MakeError(nullptr, -32700, "Parse error"));
    }

    std::optional<nlohmann::json> response;
    try {
        response = HandleMessage(message);
    } catch (const nlohmann::json::exception& e) {
        LogWarn("mcp", "malformed request", {{"error", e.what()}});
        response = MakeError(message.is_object() ? message.value("id", nlohmann::json())
                                                 : nlohmann::json(),
                             -32600, "Invalid Request");
    }
    if (!response) {
        return Result<bool, Error>::Ok(true);
    }
    return Send(*response);
}

Result<bool, Error> McpServer::RejectOversized(std::size_t size) {
    LogWarn("mcp", "message exceeds line limit",
            {{"bytes", std::to_string(size)},
             {"limit", std::to_string(max_line_bytes_)}});
    return Send(MakeError(nullptr, -32700, "Parse error: message too large"));
}

Result<bool, Error> McpServer::Send(const nlohmann::json& message) {
    auto payload = message.dump() + "\n";
    std::size_t offset = 0;
    while (offset < payload.size()) {
        auto written = out_.Write(payload.data() + offset, payload.size() - offset);
        if (written.IsErr()) {
            if (IsStreamEnd(written.Error())) {
                return Result<bool, Error>::Ok(false);
            }
            LogError("mcp", "transport write failed",
                     {{"error", written.Error().ToString()}});
            return Result<bool, Error>::Err(std::move(written).Error());
        }
        if (written.Value() == 0) {
            return Result<bool, Error>::Err(Error{
                "McpServer::Send", "", std::nullopt, "sink accepted no bytes",
                std::nullopt, ErrorCategory::Io, std::nullopt});
        }
        offset += written.Value();
    }
    return Result<bool, Error>::Ok(true);
}

std::optional<nlohmann::json> McpServer::HandleMessage(
    const nlohmann::json& message) {
    if (!message.is_object()) {
        return MakeError(nullptr, -32600, "Invalid Request");
    }

    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
        if (message.contains("id")) {
            return MakeError(message["id"], -32600, "Invalid JSON-RPC version");
        }
        return std::nullopt;
    }

    if (message.contains("method") && !message["method"].is_string()) {
        return MakeError(message.value("id", nlohmann::json()), -32600,
                         "Invalid Request");
    }

    // Notifications have no "id".
    auto method = message.value("method", "");
    if (!message.contains("id")) {
        LogDebug("mcp", "notification", {{"method", method}});
        return std::nullopt;
    }

    auto id = message["id"];
    auto params = message.value("params", nlohmann::json::object());

    if (method == "initialize") {
        return HandleInitialize(params, id);
    } else if (method == "ping") {
        return MakeResult(id, nlohmann::json::object());
    } else if (method == "tools/list") {
        return HandleToolsList(id);
    } else if (method == "tools/call") {
        return HandleToolsCall(params, id);
    } else {
        return MakeError(id, -32601, "Method not found: " + method);
    }
}

nlohmann::json McpServer::HandleInitialize(
    const nlohmann::json& params, const nlohmann::json& id) {
    initialized_ = true;

    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        LogInfo("mcp", "client connected",
                {{"client", params["clientInfo"].value("name", "")},
                 {"version", params["clientInfo"].value("version", "")}});
    }

    nlohmann::json result;
    result["protocolVersion"] = kProtocolVersion;
    result["capabilities"] = {
        {"tools", nlohmann::json::object()}
    };
    result["serverInfo"] = {
        {"name", "ghmcp"},
        {"version", kVersion}
    };

    return MakeResult(id, result);
}

nlohmann::json McpServer::HandleToolsList(const nlohmann::json& id) {
    nlohmann::json tools = nlohmann::json::array();

    for (const auto& schema : registry_.Tools()) {
        tools.push_back({
            {"name", schema.name},
            {"description", schema.description},
            {"inputSchema", schema.input_schema},
            {"annotations", {{"readOnlyHint", schema.read_only}}}
        });
    }

    return MakeResult(id, {{"tools", tools}});
}

nlohmann::json McpServer::HandleToolsCall(
    const nlohmann::json& params, const nlohmann::json& id) {
    if (!params.contains("name") || !params["name"].is_string()) {
        return MakeError(id, -32602, "Missing 'name' parameter");
    }

    auto tool_name = params["name"].get<std::string>();
    auto arguments = params.value("arguments", nlohmann::json::object());

    if (!registry_.HasTool(tool_name)) {
        return MakeError(id, -32602, "Unknown tool: " + tool_name);
    }

    auto result = registry_.Execute(tool_name, arguments);

    nlohmann::json response_result;
    response_result["content"] = result.content;
    if (result.is_error) {
        response_result["isError"] = true;
    }

    return MakeResult(id, response_result);
}

nlohmann::json McpServer::MakeError(
    const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

nlohmann::json McpServer::MakeResult(
    const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

} // namespace ghmcp
