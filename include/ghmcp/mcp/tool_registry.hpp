#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ghmcp {

// ---------------------------------------------------------------------------
// ToolSchema: name, description and JSON Schema for a tool's arguments.
// ---------------------------------------------------------------------------
struct ToolSchema {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object
    bool read_only = true;        // advertised as annotations.readOnlyHint
};

// ---------------------------------------------------------------------------
// ToolResult: result of executing a tool.
// ---------------------------------------------------------------------------
struct ToolResult {
    bool is_error = false;
    nlohmann::json content;  // array of content blocks

    static ToolResult Text(const std::string& text);
    static ToolResult ErrorText(const std::string& text);
};

// A tool handler takes a JSON arguments object and returns a ToolResult.
using ToolHandler = std::function<ToolResult(const nlohmann::json& params)>;

// ---------------------------------------------------------------------------
// ToolRegistry: registry of MCP tools.
//
// In read-only mode, tools registered with read_only == false are dropped at
// registration time and never listed.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    explicit ToolRegistry(bool read_only_mode = false)
        : read_only_mode_(read_only_mode) {}

    void Register(ToolSchema schema, ToolHandler handler);

    [[nodiscard]] const std::vector<ToolSchema>& Tools() const noexcept {
        return schemas_;
    }

    [[nodiscard]] bool HasTool(const std::string& name) const;

    /// Runs the handler; exceptions become is_error results.
    [[nodiscard]] ToolResult Execute(const std::string& name,
                                     const nlohmann::json& params) const;

private:
    bool read_only_mode_;
    std::vector<ToolSchema> schemas_;
    std::map<std::string, ToolHandler> handlers_;
};

} // namespace ghmcp
