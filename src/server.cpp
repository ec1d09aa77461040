#include "mcplite/server.hpp"
#include "mcplite/codec.hpp"
#include "mcplite/error.hpp"
#include "mcplite/logging.hpp"
#include "mcplite/transport/stdio_transport.hpp"

#include <atomic>
#include <exception>
#include <string>

namespace mcplite {

// ----------- McpServer::Impl -----------

struct McpServer::Impl {
    Dispatcher dispatcher;

    // Transport currently being served; read by shutdown() from signal context
    std::atomic<ITransport*> transport{nullptr};
    std::atomic<bool> running{false};
    // Sticky: a shutdown that lands before serve() publishes its transport
    std::atomic<bool> shutdown_requested{false};

    explicit Impl(Options o)
        : dispatcher(Dispatcher::Options{std::move(o.server_info), std::move(o.instructions),
                                         std::move(o.extra_methods)},
                     std::move(o.tools)) {}

    void on_message(ITransport& t, JsonRpcRequest req) {
        auto log = logger();
        if (log->should_log(spdlog::level::debug)) {
            nlohmann::json j = req;
            log->debug("Received request: {}", j.dump());
        }

        JsonRpcResponse response = dispatcher.dispatch(req);
        t.send(response);

        if (log->should_log(spdlog::level::debug)) {
            log->debug("Sent response: {}", Codec::serialize(response));
        }
    }

    void on_error(ITransport& t, std::exception_ptr fault) {
        try {
            std::rethrow_exception(fault);
        } catch (const std::exception& e) {
            logger()->error("Error handling request: {}", e.what());
            t.send(Codec::failure_for(e));
        }
    }
};

// ----------- McpServer -----------

McpServer::McpServer(Options opts)
    : impl_(std::make_unique<Impl>(std::move(opts))) {
}

McpServer::~McpServer() = default;

void McpServer::serve(std::unique_ptr<ITransport> transport) {
    auto* t = transport.get();
    // Publish the transport before checking the flag so a concurrent
    // shutdown() either sees the transport or is seen here.
    impl_->transport = t;
    if (impl_->shutdown_requested) {
        impl_->transport = nullptr;
        logger()->info("MCP server shutdown requested before start");
        return;
    }
    impl_->running = true;
    logger()->info("MCP server starting ({} tools)", impl_->dispatcher.tools().size());

    try {
        t->start(
            [this, t](JsonRpcRequest req) { impl_->on_message(*t, std::move(req)); },
            [this, t](std::exception_ptr fault) { impl_->on_error(*t, fault); });
    } catch (...) {
        impl_->running = false;
        impl_->transport = nullptr;
        throw;
    }

    impl_->running = false;
    impl_->transport = nullptr;
    logger()->info("MCP server stopping");
}

void McpServer::serve_stdio() {
    serve(std::make_unique<StdioTransport>());
}

void McpServer::shutdown() {
    impl_->shutdown_requested = true;
    impl_->running = false;
    if (auto* t = impl_->transport.load()) {
        t->shutdown();
    }
}

bool McpServer::is_running() const {
    return impl_->running;
}

const Dispatcher& McpServer::dispatcher() const {
    return impl_->dispatcher;
}

} // namespace mcplite
