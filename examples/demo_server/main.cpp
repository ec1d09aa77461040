/// Demo server: answers MCP requests with the `echo` and `add` tools.
/// Usage: ./mcplite_demo_server
/// Communicates over stdio (newline-delimited JSON-RPC). Logs go to stderr;
/// set SPDLOG_LEVEL=debug to see every request and response.

#include <mcplite/mcplite.hpp>
#include <spdlog/cfg/env.h>
#include <atomic>
#include <csignal>
#include <signal.h>
#include <exception>

namespace {

std::atomic<mcplite::McpServer*> g_server{nullptr};

extern "C" void handle_signal(int) {
    if (auto* server = g_server.load()) {
        server->shutdown();
    }
}

void install_signal_handlers() {
    struct sigaction sa {};
    sa.sa_handler = handle_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    // An unwritable stdout must surface as a write error, not kill the process
    std::signal(SIGPIPE, SIG_IGN);
}

} // namespace

int main() {
    mcplite::init_logging(spdlog::level::info);
    spdlog::cfg::load_env_levels();
    auto log = mcplite::logger();

    mcplite::ToolRegistry::Builder tools;
    mcplite::register_demo_tools(tools);

    mcplite::McpServer::Options opts;
    opts.server_info = {"mcplite-demo-server", std::string(mcplite::LIBRARY_VERSION)};
    opts.tools = tools.build();

    mcplite::McpServer server{std::move(opts)};
    g_server = &server;
    install_signal_handlers();

    int status = 0;
    try {
        // Serve over stdio, blocks until end-of-input or a signal
        server.serve_stdio();
    } catch (const std::exception& e) {
        log->critical("Fatal error: {}", e.what());
        status = 1;
    }

    g_server = nullptr;
    log->flush();
    return status;
}
