#include "mcplite/demo_tools.hpp"
#include "mcplite/error.hpp"
#include <cmath>
#include <limits>

namespace mcplite {

namespace {

JsonRpcError bad_argument(const std::string& name, const std::string& expected) {
    return JsonRpcError{error::InvalidParams,
                        "Invalid argument '" + name + "': expected " + expected};
}

// Absent and null both mean "use the default".
const nlohmann::json* find_argument(const nlohmann::json& arguments, const char* name) {
    auto it = arguments.find(name);
    if (it == arguments.end() || it->is_null()) return nullptr;
    return &*it;
}

std::optional<JsonRpcError> read_number(const nlohmann::json& arguments, const char* name,
                                        Number& out) {
    const nlohmann::json* value = find_argument(arguments, name);
    if (!value) return std::nullopt;

    if (value->is_number_integer()) {
        if (value->is_number_unsigned()
            && value->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            out = static_cast<double>(value->get<uint64_t>());
        } else {
            out = value->get<int64_t>();
        }
        return std::nullopt;
    }
    if (value->is_number_float()) {
        out = value->get<double>();
        return std::nullopt;
    }
    return bad_argument(name, "number");
}

double as_double(const Number& n) {
    return std::visit([](auto v) { return static_cast<double>(v); }, n);
}

} // anonymous namespace

std::string format_number(const Number& n) {
    if (const auto* i = std::get_if<int64_t>(&n)) {
        return std::to_string(*i);
    }
    double d = std::get<double>(n);
    if (std::isnan(d)) return "nan";
    if (std::isinf(d)) return d > 0 ? "inf" : "-inf";
    // Shortest round-trip form, always with a fraction or exponent
    return nlohmann::json(d).dump();
}

Number add_numbers(const Number& a, const Number& b) {
    const auto* ia = std::get_if<int64_t>(&a);
    const auto* ib = std::get_if<int64_t>(&b);
    if (ia && ib) {
        const int64_t x = *ia;
        const int64_t y = *ib;
        const bool overflow =
            (y > 0 && x > std::numeric_limits<int64_t>::max() - y) ||
            (y < 0 && x < std::numeric_limits<int64_t>::min() - y);
        if (!overflow) return x + y;
    }
    return as_double(a) + as_double(b);
}

// ---- echo ----

nlohmann::json EchoArgs::input_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"message", {{"type", "string"}, {"description", "Message to echo back"}}}
        }},
        {"required", {"message"}}
    };
}

std::optional<JsonRpcError> from_arguments(const nlohmann::json& arguments, EchoArgs& args) {
    if (const nlohmann::json* message = find_argument(arguments, "message")) {
        if (!message->is_string()) return bad_argument("message", "string");
        args.message = message->get<std::string>();
    }
    return std::nullopt;
}

CallToolResult run_echo(const EchoArgs& args) {
    return text_result("Echo: " + args.message);
}

// ---- add ----

nlohmann::json AddArgs::input_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"a", {{"type", "number"}, {"description", "First number"}}},
            {"b", {{"type", "number"}, {"description", "Second number"}}}
        }},
        {"required", {"a", "b"}}
    };
}

std::optional<JsonRpcError> from_arguments(const nlohmann::json& arguments, AddArgs& args) {
    if (auto err = read_number(arguments, "a", args.a)) return err;
    if (auto err = read_number(arguments, "b", args.b)) return err;
    return std::nullopt;
}

CallToolResult run_add(const AddArgs& args) {
    return text_result("The sum of " + format_number(args.a) + " and " + format_number(args.b)
                       + " is " + format_number(add_numbers(args.a, args.b)));
}

void register_demo_tools(ToolRegistry::Builder& builder) {
    builder.add_typed<EchoArgs>("echo", "Echo back the input message",
        [](const EchoArgs& args) -> ToolResult { return run_echo(args); });
    builder.add_typed<AddArgs>("add", "Add two numbers together",
        [](const AddArgs& args) -> ToolResult { return run_add(args); });
}

} // namespace mcplite
