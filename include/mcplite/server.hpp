#pragma once
#include "types.hpp"
#include "json_rpc.hpp"
#include "dispatcher.hpp"
#include "tool_registry.hpp"
#include "transport/transport.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace mcplite {

/// Session loop: feeds each line from a transport through the codec and the
/// dispatcher and writes back exactly one response per request line.
class McpServer {
public:
    struct Options {
        Implementation server_info;
        std::optional<std::string> instructions;
        ToolRegistry tools;
        /// Forwarded to Dispatcher::Options::extra_methods.
        std::map<std::string, MethodHandler> extra_methods;
    };

    explicit McpServer(Options opts);
    ~McpServer();

    // Non-copyable, non-movable
    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    /// Serve until end-of-input or shutdown(). Transport faults propagate.
    void serve(std::unique_ptr<ITransport> transport);
    void serve_stdio();

    /// Stop serving. Safe to call from a signal handler. Sticky: once
    /// called, later serve() calls return without reading.
    void shutdown();

    bool is_running() const;

    [[nodiscard]] const Dispatcher& dispatcher() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mcplite
