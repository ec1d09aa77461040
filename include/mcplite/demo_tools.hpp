#pragma once
#include "json_rpc.hpp"
#include "tool_registry.hpp"
#include "types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace mcplite {

/// JSON number as received: integers stay exact, everything else is a double.
using Number = std::variant<int64_t, double>;

/// Render a number the way it would print in a text result
/// (`2`, `2.5`, `2.0`, `1e+20`, `inf`).
std::string format_number(const Number& n);

/// Sum of two numbers; integer unless either side is a double or the
/// integer sum would overflow.
Number add_numbers(const Number& a, const Number& b);

// ---- echo ----

struct EchoArgs {
    std::string message = "Hello from MCP!";

    static nlohmann::json input_schema();
};

std::optional<JsonRpcError> from_arguments(const nlohmann::json& arguments, EchoArgs& args);

CallToolResult run_echo(const EchoArgs& args);

// ---- add ----

struct AddArgs {
    Number a = int64_t{0};
    Number b = int64_t{0};

    static nlohmann::json input_schema();
};

std::optional<JsonRpcError> from_arguments(const nlohmann::json& arguments, AddArgs& args);

CallToolResult run_add(const AddArgs& args);

/// Register `echo` and `add`.
void register_demo_tools(ToolRegistry::Builder& builder);

} // namespace mcplite
