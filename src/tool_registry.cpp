#include "mcplite/tool_registry.hpp"
#include "mcplite/error.hpp"

namespace mcplite {

ToolRegistry::Builder& ToolRegistry::Builder::add(ToolDefinition def, ToolHandler handler) {
    if (def.name.empty()) {
        throw McpConfigError("Tool name must not be empty");
    }
    if (!handler) {
        throw McpConfigError("Tool '" + def.name + "' has no handler");
    }
    if (handlers_.count(def.name) > 0) {
        throw McpConfigError("Tool '" + def.name + "' registered twice");
    }
    handlers_.emplace(def.name, std::move(handler));
    definitions_.push_back(std::move(def));
    return *this;
}

ToolRegistry ToolRegistry::Builder::build() {
    ToolRegistry registry{std::move(definitions_), std::move(handlers_)};
    definitions_.clear();
    handlers_.clear();
    return registry;
}

ToolRegistry::ToolRegistry(std::vector<ToolDefinition> definitions,
                           std::unordered_map<std::string, ToolHandler> handlers)
    : definitions_(std::move(definitions)), handlers_(std::move(handlers)) {
}

bool ToolRegistry::contains(const std::string& name) const {
    return handlers_.count(name) > 0;
}

ToolResult ToolRegistry::call(const std::string& name, const nlohmann::json& arguments) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        return JsonRpcError{error::InvalidParams, "Unknown tool: " + name};
    }
    return it->second(arguments);
}

} // namespace mcplite
