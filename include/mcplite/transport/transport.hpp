#pragma once
#include "../json_rpc.hpp"
#include <exception>
#include <functional>

namespace mcplite {

/// Callback for each decoded request line
using MessageCallback = std::function<void(JsonRpcRequest)>;
/// Callback for a line that could not be decoded, normally a McpParseError
using ErrorCallback = std::function<void(std::exception_ptr)>;

/// Abstract line transport
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Read and decode lines until end-of-input or shutdown(). Callbacks run
    /// on the calling thread, one line at a time. Throws McpTransportError on
    /// an unrecoverable read error; exceptions thrown by callbacks propagate.
    virtual void start(MessageCallback on_message,
                       ErrorCallback on_error = nullptr) = 0;

    /// Write one response line. Throws McpTransportError if it cannot be written.
    virtual void send(const JsonRpcResponse& msg) = 0;

    /// Stop reading. Must be safe to call from a signal handler.
    virtual void shutdown() = 0;

    /// Check if transport is connected.
    [[nodiscard]] virtual bool is_connected() const = 0;
};

} // namespace mcplite
