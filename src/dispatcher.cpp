#include "mcplite/dispatcher.hpp"
#include "mcplite/error.hpp"
#include "mcplite/logging.hpp"
#include "mcplite/version.hpp"
#include <stdexcept>

namespace mcplite {

namespace {

JsonRpcFailure make_failure(const RequestId& id, int code, std::string message) {
    JsonRpcFailure failure;
    failure.id = id;
    failure.error = JsonRpcError{code, std::move(message)};
    return failure;
}

} // anonymous namespace

Dispatcher::Dispatcher(Options opts, ToolRegistry tools)
    : opts_(std::move(opts)), tools_(std::move(tools)) {
    install_builtin_methods();
    for (auto& [method, handler] : opts_.extra_methods) {
        if (methods_.count(method) > 0) {
            throw McpConfigError("Method '" + method + "' shadows a built-in method");
        }
        if (!handler) {
            throw McpConfigError("Method '" + method + "' has no handler");
        }
        methods_.emplace(method, handler);
    }
}

void Dispatcher::install_builtin_methods() {
    methods_["initialize"] = [this](const nlohmann::json& params) {
        return handle_initialize(params);
    };

    methods_["ping"] = [](const nlohmann::json&) -> HandlerResult {
        return nlohmann::json::object();
    };

    methods_["tools/list"] = [this](const nlohmann::json& params) {
        return handle_tools_list(params);
    };

    methods_["tools/call"] = [this](const nlohmann::json& params) {
        return handle_tools_call(params);
    };

    // No resources are served; the listings exist so clients can probe them.
    methods_["resources/list"] = [](const nlohmann::json&) -> HandlerResult {
        return nlohmann::json{{"resources", nlohmann::json::array()}};
    };

    methods_["resources/templates/list"] = [](const nlohmann::json&) -> HandlerResult {
        return nlohmann::json{{"resourceTemplates", nlohmann::json::array()}};
    };
}

HandlerResult Dispatcher::handle_initialize(const nlohmann::json&) const {
    // The handshake is fixed per deployment; client capabilities are ignored.
    InitializeResult result;
    result.protocol_version = std::string(PROTOCOL_VERSION);
    result.capabilities.tools = nlohmann::json::object();
    result.capabilities.resources = nlohmann::json::object();
    result.server_info = opts_.server_info;
    result.instructions = opts_.instructions;

    nlohmann::json j;
    to_json(j, result);
    return j;
}

HandlerResult Dispatcher::handle_tools_list(const nlohmann::json&) const {
    nlohmann::json result = {{"tools", tools_.definitions()}};
    return result;
}

HandlerResult Dispatcher::handle_tools_call(const nlohmann::json& params) const {
    auto name_it = params.find("name");
    if (name_it == params.end() || name_it->is_null()) {
        return JsonRpcError{error::InvalidParams, "Missing tool name"};
    }
    if (!name_it->is_string()) {
        return JsonRpcError{error::InvalidParams, "Tool name must be a string"};
    }

    nlohmann::json arguments = nlohmann::json::object();
    auto args_it = params.find("arguments");
    if (args_it != params.end() && !args_it->is_null()) {
        if (!args_it->is_object()) {
            return JsonRpcError{error::InvalidParams, "Tool arguments must be an object"};
        }
        arguments = *args_it;
    }

    auto outcome = tools_.call(name_it->get<std::string>(), arguments);
    if (auto* err = std::get_if<JsonRpcError>(&outcome)) {
        return *err;
    }
    nlohmann::json j;
    to_json(j, std::get<CallToolResult>(outcome));
    return j;
}

bool Dispatcher::has_method(const std::string& method) const {
    return methods_.count(method) > 0;
}

JsonRpcResponse Dispatcher::dispatch(const JsonRpcRequest& req) const {
    auto log = logger();
    log->info("Handling request: {}", req.method);

    auto it = methods_.find(req.method);
    if (it == methods_.end()) {
        log->warn("Method not found: {}", req.method);
        return make_failure(req.id, error::MethodNotFound, "Method not found: " + req.method);
    }

    HandlerResult result;
    try {
        result = it->second(req.params);
    } catch (const McpProtocolError& e) {
        result = JsonRpcError{e.code, e.what()};
    } catch (const std::exception& e) {
        result = JsonRpcError{error::InternalError, e.what()};
    } catch (...) {
        result = JsonRpcError{error::InternalError, "Unknown error"};
    }

    if (auto* err = std::get_if<JsonRpcError>(&result)) {
        // Application faults all look alike on the wire
        log->error("Error handling request {} (code {}): {}", req.method, err->code, err->message);
        return make_failure(req.id, error::InternalError, err->message);
    }

    JsonRpcSuccess success;
    success.id = req.id;
    success.result = std::move(std::get<nlohmann::json>(result));
    return success;
}

} // namespace mcplite
