#include "mcplite/codec.hpp"
#include "mcplite/error.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <stdexcept>
#include <string>

namespace mcplite {

namespace {

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            auto object = val.get_object();
            for (auto field : object) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            // Try integer first, then double
            auto result_int = val.get_int64();
            if (result_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_int.value());
            }
            auto result_uint = val.get_uint64();
            if (result_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_uint.value());
            }
            return nlohmann::json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
        default:
            return nlohmann::json(nullptr);
    }
}

} // anonymous namespace

JsonRpcRequest Codec::parse_object(const nlohmann::json& j) {
    // Recover the id first so every later failure can still be correlated.
    RequestId id;
    if (j.contains("id")) {
        if (!is_valid_request_id(j.at("id"))) {
            throw McpInvalidRequestError(nullptr, "Request id must be a number, string or null");
        }
        id = j.at("id");
    }

    auto method_it = j.find("method");
    if (method_it == j.end()) {
        throw McpInvalidRequestError(id, "Missing 'method' field");
    }
    if (!method_it->is_string()) {
        throw McpInvalidRequestError(id, "Field 'method' must be a string");
    }

    JsonRpcRequest req;
    req.id = std::move(id);
    req.method = method_it->get<std::string>();

    auto params_it = j.find("params");
    if (params_it != j.end() && !params_it->is_null()) {
        if (!params_it->is_object()) {
            throw McpInvalidRequestError(req.id, "Field 'params' must be an object");
        }
        req.params = *params_it;
    }
    return req;
}

JsonRpcRequest Codec::parse(std::string_view raw) {
    if (raw.empty()) {
        throw McpParseError("Empty input");
    }

    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw McpParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    bool scalar = false;
    error = doc.is_scalar().get(scalar);
    if (error) {
        throw McpParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }
    if (scalar) {
        throw McpParseError("Request must be a JSON object");
    }

    // Convert to nlohmann for further processing. On-demand parsing is lazy,
    // so syntax errors inside nested values surface here.
    nlohmann::json j;
    try {
        simdjson::ondemand::value root = doc.get_value();
        j = simdjson_to_nlohmann(root);
    } catch (const std::exception& e) {
        throw McpParseError(std::string("JSON parse error: ") + e.what());
    }
    if (!doc.at_end()) {
        throw McpParseError("JSON parse error: trailing content after value");
    }

    if (!j.is_object()) {
        throw McpParseError("Request must be a JSON object");
    }

    return parse_object(j);
}

std::string Codec::serialize(const JsonRpcResponse& resp) {
    nlohmann::json j;
    to_json(j, resp);
    // ensure_ascii keeps the line 7-bit clean; replace never throws on bad UTF-8
    return j.dump(-1, ' ', true, nlohmann::json::error_handler_t::replace);
}

JsonRpcResponse Codec::failure_for(const std::exception& fault) {
    JsonRpcFailure failure;
    if (const auto* invalid = dynamic_cast<const McpInvalidRequestError*>(&fault)) {
        failure.id = invalid->id;
    }
    failure.error = JsonRpcError{error::InternalError, fault.what()};
    return failure;
}

} // namespace mcplite
