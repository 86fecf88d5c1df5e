#include <ghmcp/mcp/tool_registry.hpp>

#include <ghmcp/core/log.hpp>

namespace ghmcp {

ToolResult ToolResult::Text(const std::string& text) {
    return ToolResult{
        false,
        nlohmann::json::array({{{"type", "text"}, {"text", text}}})
    };
}

ToolResult ToolResult::ErrorText(const std::string& text) {
    return ToolResult{
        true,
        nlohmann::json::array({{{"type", "text"}, {"text", text}}})
    };
}

void ToolRegistry::Register(ToolSchema schema, ToolHandler handler) {
    if (read_only_mode_ && !schema.read_only) {
        LogDebug("mcp", "skipping write tool in read-only mode",
                 {{"tool", schema.name}});
        return;
    }
    auto name = schema.name;
    auto existing = handlers_.find(name);
    if (existing != handlers_.end()) {
        for (auto& s : schemas_) {
            if (s.name == name) {
                s = std::move(schema);
                break;
            }
        }
        existing->second = std::move(handler);
        return;
    }
    schemas_.push_back(std::move(schema));
    handlers_[name] = std::move(handler);
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return handlers_.count(name) > 0;
}

ToolResult ToolRegistry::Execute(const std::string& name,
                                 const nlohmann::json& params) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        return ToolResult::ErrorText("Unknown tool: " + name);
    }

    try {
        return it->second(params);
    } catch (const std::exception& e) {
        LogWarn("mcp", "tool handler threw", {{"tool", name}, {"error", e.what()}});
        return ToolResult::ErrorText(std::string("Tool error: ") + e.what());
    }
}

} // namespace ghmcp
