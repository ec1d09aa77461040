#pragma once
#include "types.hpp"
#include "json_rpc.hpp"
#include "tool_registry.hpp"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

namespace mcplite {

using HandlerResult = std::variant<nlohmann::json, JsonRpcError>;
using MethodHandler = std::function<HandlerResult(const nlohmann::json& params)>;

/// Resolves a request's method against a method table fixed at construction
/// and turns the handler outcome into exactly one response.
///
/// Unknown methods yield MethodNotFound. Every handler-level fault, whether
/// returned as a JsonRpcError or thrown, is reported as InternalError with
/// the fault text; the handler's own code only reaches the log.
class Dispatcher {
public:
    struct Options {
        Implementation server_info;
        std::optional<std::string> instructions;
        /// Additional top-level methods. Must not shadow a built-in method.
        std::map<std::string, MethodHandler> extra_methods;
    };

    /// Throws McpConfigError if an extra method shadows a built-in one.
    Dispatcher(Options opts, ToolRegistry tools);

    // Built-in handlers capture `this`
    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    [[nodiscard]] JsonRpcResponse dispatch(const JsonRpcRequest& req) const;

    [[nodiscard]] bool has_method(const std::string& method) const;

    [[nodiscard]] const ToolRegistry& tools() const { return tools_; }

private:
    void install_builtin_methods();

    HandlerResult handle_initialize(const nlohmann::json& params) const;
    HandlerResult handle_tools_list(const nlohmann::json& params) const;
    HandlerResult handle_tools_call(const nlohmann::json& params) const;

    Options opts_;
    ToolRegistry tools_;
    std::unordered_map<std::string, MethodHandler> methods_;
};

} // namespace mcplite
