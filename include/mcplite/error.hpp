#pragma once
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace mcplite {

class McpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The line is not a parseable JSON object. No id can be recovered.
class McpParseError : public McpError {
public:
    using McpError::McpError;
};

/// The line is a JSON object but not a usable request.
/// Carries whatever id could be recovered (null otherwise).
class McpInvalidRequestError : public McpParseError {
public:
    nlohmann::json id;
    McpInvalidRequestError(nlohmann::json id, const std::string& msg)
        : McpParseError(msg), id(std::move(id)) {}
};

class McpProtocolError : public McpError {
public:
    int code;
    McpProtocolError(int code, const std::string& msg)
        : McpError(msg), code(code) {}
};

/// Registry/dispatcher misconfiguration detected at startup.
class McpConfigError : public McpError {
public:
    using McpError::McpError;
};

class McpTransportError : public McpError {
public:
    using McpError::McpError;
};

namespace error {
    constexpr int ParseError       = -32700;
    constexpr int InvalidRequest   = -32600;
    constexpr int MethodNotFound   = -32601;
    constexpr int InvalidParams    = -32602;
    constexpr int InternalError    = -32603;
} // namespace error

} // namespace mcplite
