#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <exception>
#include <string>
#include <string_view>

namespace mcplite {

class Codec {
public:
    /// Parse one request line.
    /// Throws McpParseError if the line is not a JSON object, and
    /// McpInvalidRequestError (with the recovered id) if the object is not
    /// a usable request.
    [[nodiscard]] static JsonRpcRequest parse(std::string_view raw);

    /// Serialize a response to a single line (no trailing newline).
    /// Never throws for a well-formed response.
    [[nodiscard]] static std::string serialize(const JsonRpcResponse& resp);

    /// Failure response for a fault raised by parse().
    [[nodiscard]] static JsonRpcResponse failure_for(const std::exception& fault);

private:
    static JsonRpcRequest parse_object(const nlohmann::json& j);
};

} // namespace mcplite
