#include "mcplite/json_rpc.hpp"
#include "mcplite/version.hpp"

namespace mcplite {

const RequestId& response_id(const JsonRpcResponse& r) {
    return std::visit([](const auto& v) -> const RequestId& { return v.id; }, r);
}

void to_json(nlohmann::json& j, const JsonRpcRequest& r) {
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = r.id;
    j["method"] = r.method;
    if (!r.params.empty()) j["params"] = r.params;
}

void to_json(nlohmann::json& j, const JsonRpcSuccess& r) {
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = r.id;
    j["result"] = r.result;
}

void from_json(const nlohmann::json& j, JsonRpcSuccess& r) {
    r.id = j.contains("id") ? j.at("id") : nlohmann::json();
    r.result = j.at("result");
}

void to_json(nlohmann::json& j, const JsonRpcFailure& r) {
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = r.id;
    j["error"] = r.error;
}

void from_json(const nlohmann::json& j, JsonRpcFailure& r) {
    r.id = j.contains("id") ? j.at("id") : nlohmann::json();
    r.error = j.at("error").get<JsonRpcError>();
}

void from_json(const nlohmann::json& j, JsonRpcResponse& r) {
    if (j.contains("error")) {
        r = j.get<JsonRpcFailure>();
    } else {
        r = j.get<JsonRpcSuccess>();
    }
}

} // namespace mcplite
