#pragma once
#include "transport.hpp"
#include "../codec.hpp"
#include <atomic>
#include <string>
#include <string_view>

namespace mcplite {

/// StdioTransport reads newline-delimited JSON from one descriptor and writes
/// responses to another. Lines are handled synchronously: a response is
/// fully written before the next line is read.
class StdioTransport : public ITransport {
public:
    /// Create transport using system stdin/stdout.
    StdioTransport();

    /// Create transport using specified file descriptors (for testing).
    /// The transport takes ownership of both descriptors.
    StdioTransport(int read_fd, int write_fd);

    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    void start(MessageCallback on_message, ErrorCallback on_error = nullptr) override;
    void send(const JsonRpcResponse& msg) override;
    void shutdown() override;
    bool is_connected() const override;

private:
    void open_wakeup_pipe();
    void read_loop(const MessageCallback& on_message, const ErrorCallback& on_error);
    void handle_line(std::string_view line, const MessageCallback& on_message,
                     const ErrorCallback& on_error);
    void write_all(const std::string& data);

    int read_fd_;
    int write_fd_;
    bool owns_fds_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> shutdown_requested_{false};

    int wakeup_pipe_[2]{-1, -1};  // self-pipe that interrupts poll() on shutdown
};

} // namespace mcplite
