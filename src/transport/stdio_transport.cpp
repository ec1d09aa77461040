#include "mcplite/transport/stdio_transport.hpp"
#include "mcplite/error.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace mcplite {

namespace {

constexpr std::string_view kWhitespace = " \t\r\n\v\f";

std::string_view trim(std::string_view s) {
    auto first = s.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) return {};
    auto last = s.find_last_not_of(kWhitespace);
    return s.substr(first, last - first + 1);
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        throw McpTransportError(std::string("fcntl failed: ") + strerror(errno));
    }
}

} // anonymous namespace

StdioTransport::StdioTransport()
    : read_fd_(STDIN_FILENO), write_fd_(STDOUT_FILENO), owns_fds_(false) {
    open_wakeup_pipe();
}

StdioTransport::StdioTransport(int read_fd, int write_fd)
    : read_fd_(read_fd), write_fd_(write_fd), owns_fds_(true) {
    open_wakeup_pipe();
}

StdioTransport::~StdioTransport() {
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0) ::close(write_fd_);
    }
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void StdioTransport::open_wakeup_pipe() {
    // Created up front so shutdown() from a signal handler never races start().
    if (pipe(wakeup_pipe_) < 0) {
        throw McpTransportError(std::string("Failed to create wakeup pipe: ") + strerror(errno));
    }
    set_nonblocking(wakeup_pipe_[0]);
    set_nonblocking(wakeup_pipe_[1]);
}

void StdioTransport::start(MessageCallback on_message, ErrorCallback on_error) {
    // If shutdown() was called before start(), don't block, exit immediately.
    if (shutdown_requested_.load()) return;
    if (running_.exchange(true)) {
        return; // already running
    }
    connected_ = true;

    try {
        read_loop(on_message, on_error);
    } catch (...) {
        running_ = false;
        connected_ = false;
        throw;
    }
    running_ = false;
    connected_ = false;
}

void StdioTransport::read_loop(const MessageCallback& on_message, const ErrorCallback& on_error) {
    std::string buffer;
    buffer.reserve(4096);

    char chunk[4096];

    while (running_) {
        // Use poll() so that shutdown() can interrupt the blocking read
        // via the wakeup pipe.
        struct pollfd fds[2];
        fds[0].fd = read_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw McpTransportError(std::string("poll failed: ") + strerror(errno));
        }

        // Wakeup pipe has data → shutdown() was called, exit cleanly
        if (fds[1].revents & POLLIN) break;

        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) continue;
            throw McpTransportError(std::string("Read error: ") + strerror(errno));
        }
        if (n == 0) {
            // EOF: an unterminated last line is still a request
            if (!buffer.empty()) {
                handle_line(buffer, on_message, on_error);
                buffer.clear();
            }
            break;
        }

        buffer.append(chunk, static_cast<size_t>(n));

        // Process complete lines
        size_t pos = 0;
        while (running_) {
            size_t nl = buffer.find('\n', pos);
            if (nl == std::string::npos) break;

            std::string_view line(buffer.data() + pos, nl - pos);
            pos = nl + 1;
            handle_line(line, on_message, on_error);
        }

        if (pos > 0) {
            buffer.erase(0, pos);
        }
    }
}

void StdioTransport::handle_line(std::string_view line, const MessageCallback& on_message,
                                 const ErrorCallback& on_error) {
    line = trim(line);
    if (line.empty()) return;

    JsonRpcRequest req;
    try {
        req = Codec::parse(line);
    } catch (const McpParseError&) {
        if (on_error) on_error(std::current_exception());
        return;
    }
    // Outside the try: a failure to answer is a transport fault, not a bad line
    on_message(std::move(req));
}

void StdioTransport::send(const JsonRpcResponse& msg) {
    if (write_fd_ < 0) {
        throw McpTransportError("Transport has no output");
    }
    std::string line = Codec::serialize(msg);
    line += '\n';
    write_all(line);
}

void StdioTransport::write_all(const std::string& data) {
    const char* p = data.data();
    size_t remaining = data.size();

    while (remaining > 0) {
        ssize_t written = ::write(write_fd_, p, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                struct pollfd pfd{write_fd_, POLLOUT, 0};
                if (::poll(&pfd, 1, -1) < 0 && errno != EINTR) {
                    throw McpTransportError(std::string("poll failed: ") + strerror(errno));
                }
                continue;
            }
            throw McpTransportError(std::string("Write error: ") + strerror(errno));
        }
        p += written;
        remaining -= static_cast<size_t>(written);
    }
}

void StdioTransport::shutdown() {
    // Runs inside signal handlers: atomics and write(2) only.
    int saved_errno = errno;
    shutdown_requested_ = true;
    running_ = false;
    connected_ = false;
    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        // A full pipe already holds a pending wakeup byte.
        ssize_t n = ::write(wakeup_pipe_[1], &b, 1);
        (void)n;
    }
    errno = saved_errno;
}

bool StdioTransport::is_connected() const {
    return connected_;
}

} // namespace mcplite
