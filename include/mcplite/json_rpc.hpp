#pragma once
#include <string>
#include <variant>
#include <optional>
#include <type_traits>
#include <nlohmann/json.hpp>

namespace mcplite {

/// Opaque request id: a JSON number, string or null. Echoed back verbatim,
/// so an integer id stays an integer and a float id stays a float.
///
/// Numbers pass through a 64-bit value, which bounds "verbatim": an integer
/// beyond the uint64 range comes back as a double, `-0` comes back as `0`,
/// and a number outside the double range is rejected as malformed input.
using RequestId = nlohmann::json;

/// True for the id shapes the wire schema allows (number, string, null).
inline bool is_valid_request_id(const nlohmann::json& j) {
    return j.is_null() || j.is_number() || j.is_string();
}

struct JsonRpcError {
    int code;
    std::string message;

    bool operator==(const JsonRpcError& o) const {
        return code == o.code && message == o.message;
    }
};

inline void to_json(nlohmann::json& j, const JsonRpcError& e) {
    j = nlohmann::json{{"code", e.code}, {"message", e.message}};
}

inline void from_json(const nlohmann::json& j, JsonRpcError& e) {
    e.code = j.at("code").get<int>();
    e.message = j.at("message").get<std::string>();
}

struct JsonRpcRequest {
    RequestId id;
    std::string method;
    nlohmann::json params = nlohmann::json::object();

    bool operator==(const JsonRpcRequest& o) const {
        return id == o.id && method == o.method && params == o.params;
    }
};

struct JsonRpcSuccess {
    RequestId id;
    nlohmann::json result;

    bool operator==(const JsonRpcSuccess& o) const {
        return id == o.id && result == o.result;
    }
};

struct JsonRpcFailure {
    RequestId id;
    JsonRpcError error;

    bool operator==(const JsonRpcFailure& o) const {
        return id == o.id && error == o.error;
    }
};

using JsonRpcResponse = std::variant<JsonRpcSuccess, JsonRpcFailure>;

/// Id carried by either alternative of a response.
const RequestId& response_id(const JsonRpcResponse& r);

void to_json(nlohmann::json& j, const JsonRpcRequest& r);

void to_json(nlohmann::json& j, const JsonRpcSuccess& r);
void from_json(const nlohmann::json& j, JsonRpcSuccess& r);

void to_json(nlohmann::json& j, const JsonRpcFailure& r);
void from_json(const nlohmann::json& j, JsonRpcFailure& r);

template <typename T, std::enable_if_t<std::is_same_v<T, JsonRpcResponse>, int> = 0>
void to_json(nlohmann::json& j, const T& r) {
    std::visit([&j](const auto& v) { to_json(j, v); }, r);
}
void from_json(const nlohmann::json& j, JsonRpcResponse& r);

} // namespace mcplite
