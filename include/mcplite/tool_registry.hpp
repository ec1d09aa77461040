#pragma once
#include "types.hpp"
#include "json_rpc.hpp"
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace mcplite {

using ToolResult = std::variant<CallToolResult, JsonRpcError>;
using ToolHandler = std::function<ToolResult(const nlohmann::json& arguments)>;

/// Immutable mapping from tool name to catalog entry and handler.
/// Both halves come from the same registration call, so the catalog served
/// by tools/list and the set of callable tools cannot drift apart.
class ToolRegistry {
public:
    class Builder {
    public:
        /// Register a tool. Throws McpConfigError on an empty or duplicate name.
        Builder& add(ToolDefinition def, ToolHandler handler);

        /// Register a tool whose arguments decode into `Args`.
        ///
        /// `Args` provides `static nlohmann::json input_schema()` and is
        /// decoded by an ADL-visible
        /// `std::optional<JsonRpcError> from_arguments(const nlohmann::json&, Args&)`
        /// which applies defaults and reports bad arguments. The handler only
        /// ever sees a fully decoded struct.
        template <typename Args>
        Builder& add_typed(std::string name, std::string description,
                           std::function<ToolResult(const Args&)> handler) {
            ToolDefinition def;
            def.name = std::move(name);
            def.description = std::move(description);
            def.input_schema = Args::input_schema();
            return add(std::move(def),
                [handler = std::move(handler)](const nlohmann::json& arguments) -> ToolResult {
                    Args args;
                    if (auto err = from_arguments(arguments, args)) {
                        return *err;
                    }
                    return handler(args);
                });
        }

        /// Finish registration. The builder is left empty.
        [[nodiscard]] ToolRegistry build();

    private:
        std::vector<ToolDefinition> definitions_;
        std::unordered_map<std::string, ToolHandler> handlers_;
    };

    /// Empty registry.
    ToolRegistry() = default;

    /// Catalog entries in registration order.
    [[nodiscard]] const std::vector<ToolDefinition>& definitions() const { return definitions_; }

    [[nodiscard]] bool contains(const std::string& name) const;
    [[nodiscard]] std::size_t size() const { return definitions_.size(); }

    /// Run a tool. An unknown name is reported as a value, not thrown.
    /// Exceptions escaping the tool handler propagate to the caller.
    [[nodiscard]] ToolResult call(const std::string& name, const nlohmann::json& arguments) const;

private:
    ToolRegistry(std::vector<ToolDefinition> definitions,
                 std::unordered_map<std::string, ToolHandler> handlers);

    std::vector<ToolDefinition> definitions_;
    std::unordered_map<std::string, ToolHandler> handlers_;
};

} // namespace mcplite
