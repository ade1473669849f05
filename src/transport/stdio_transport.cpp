#include "fsgate/transport/stdio_transport.hpp"
#include "fsgate/error.hpp"
#include <spdlog/spdlog.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <exception>
#include <string>

namespace fsgate {

namespace {

std::string_view trim(std::string_view s) {
    const char* ws = " \t\r";
    auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) return {};
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

} // anonymous namespace

StdioTransport::StdioTransport()
    : read_fd_(STDIN_FILENO), write_fd_(STDOUT_FILENO), owns_fds_(false) {
}

StdioTransport::StdioTransport(int read_fd, int write_fd, std::size_t max_line_bytes)
    : read_fd_(read_fd), write_fd_(write_fd), owns_fds_(true), max_line_bytes_(max_line_bytes) {
}

StdioTransport::~StdioTransport() {
    shutdown();
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0 && write_fd_ != read_fd_) ::close(write_fd_);
    }
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void StdioTransport::start(MessageCallback on_message, ErrorCallback on_error) {
    // If shutdown() was called before start(), don't block
    if (shutdown_requested_.load()) return;
    if (running_.exchange(true)) {
        return; // already running
    }
    connected_ = true;

    if (::pipe(wakeup_pipe_) < 0) {
        running_ = false;
        throw TransportError(std::string("Failed to create wakeup pipe: ") + std::strerror(errno));
    }
    int flags = ::fcntl(wakeup_pipe_[1], F_GETFL, 0);
    ::fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK);

    spdlog::debug("stdio transport started");
    read_loop(on_message, on_error);
    running_ = false;
    connected_ = false;
    spdlog::debug("stdio transport stopped");
}

void StdioTransport::read_loop(const MessageCallback& on_message, const ErrorCallback& on_error) {
    std::string buffer;
    buffer.reserve(4096);
    bool discarding = false;   // inside an oversized line, waiting for its newline

    char chunk[4096];

    while (running_) {
        // poll() so that shutdown() can interrupt the blocking read
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
            spdlog::error("poll failed on stdin: {}", std::strerror(errno));
            break;
        }

        // Wakeup pipe has data: shutdown() was called
        if (fds[1].revents & POLLIN) break;

        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            spdlog::error("Read error on stdin: {}", std::strerror(errno));
            break;
        }
        if (n == 0) {
            // EOF; a final line without a newline still counts
            std::string_view rest = trim(buffer);
            if (!discarding && !rest.empty()) handle_line(rest, on_message, on_error);
            spdlog::info("End of input, client disconnected");
            break;
        }

        buffer.append(chunk, static_cast<size_t>(n));

        size_t pos = 0;
        if (discarding) {
            size_t nl = buffer.find('\n');
            if (nl == std::string::npos) {
                buffer.clear();
                continue;
            }
            pos = nl + 1;
            discarding = false;
        }

        while (running_) {
            size_t nl = buffer.find('\n', pos);
            if (nl == std::string::npos) break;

            if (nl - pos > max_line_bytes_) {
                pos = nl + 1;
                reject_oversized_line(on_error);
                continue;
            }

            std::string_view line = trim(std::string_view(buffer).substr(pos, nl - pos));
            pos = nl + 1;
            if (line.empty()) continue;

            handle_line(line, on_message, on_error);
        }

        if (pos > 0) {
            buffer.erase(0, pos);
        }

        if (buffer.size() > max_line_bytes_) {
            buffer.clear();
            discarding = true;
            reject_oversized_line(on_error);
        }
    }
}

void StdioTransport::reject_oversized_line(const ErrorCallback& on_error) {
    spdlog::warn("Discarding an input line longer than {} bytes", max_line_bytes_);
    if (!on_error) return;
    try {
        on_error(std::make_exception_ptr(
            FormatError("Line exceeds the maximum length of " + std::to_string(max_line_bytes_) + " bytes")));
    } catch (const TransportError& e) {
        spdlog::error("Cannot answer an oversized line: {}", e.what());
        running_ = false;
    }
}

void StdioTransport::handle_line(std::string_view line, const MessageCallback& on_message,
                                 const ErrorCallback& on_error) {
    try {
        JsonRpcMessage msg;
        try {
            msg = Codec::parse(line);
        } catch (const FormatError& e) {
            spdlog::debug("Unparseable line: {}", e.what());
            if (on_error) on_error(std::current_exception());
            return;
        }
        on_message(std::move(msg));
    } catch (const std::exception& e) {
        // Last resort: the peer still gets a valid frame
        spdlog::error("Unhandled failure while processing a message: {}", e.what());
        try {
            write_line(Codec::FALLBACK_ERROR_LINE);
        } catch (const TransportError& te) {
            spdlog::error("Cannot write fallback frame: {}", te.what());
            running_ = false;
        }
    }
}

void StdioTransport::write_line(std::string_view line) {
    std::string framed(line);
    framed += '\n';
    const char* data = framed.data();
    size_t remaining = framed.size();

    while (remaining > 0) {
        ssize_t written = ::write(write_fd_, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            connected_ = false;
            throw TransportError(std::string("Write error: ") + std::strerror(errno));
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
}

void StdioTransport::send(const JsonRpcMessage& msg) {
    if (shutdown_requested_.load()) {
        throw TransportError("Transport shut down");
    }
    write_line(Codec::serialize_safe(msg));
}

void StdioTransport::send_raw(std::string_view line) {
    if (shutdown_requested_.load()) {
        throw TransportError("Transport shut down");
    }
    write_line(line);
}

void StdioTransport::shutdown() {
    shutdown_requested_ = true;
    if (!running_.exchange(false)) return;
    connected_ = false;
    // Interrupt poll() in read_loop()
    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        if (::write(wakeup_pipe_[1], &b, 1) < 0 && errno != EAGAIN) {
            spdlog::debug("wakeup write failed: {}", std::strerror(errno));
        }
    }
}

bool StdioTransport::is_connected() const {
    return connected_;
}

} // namespace fsgate
