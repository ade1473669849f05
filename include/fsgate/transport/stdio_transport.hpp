#pragma once
#include "transport.hpp"
#include "../codec.hpp"
#include <atomic>
#include <cstddef>

namespace fsgate {

/// StdioTransport reads newline-delimited JSON from stdin and writes one
/// line per message to stdout. Reading, dispatching and writing all happen
/// on the thread that calls start(); shutdown() may come from any thread.
///
/// A line longer than max_line_bytes is dropped up to its newline and
/// reported to the error callback as a FormatError.
class StdioTransport : public ITransport {
public:
    static constexpr std::size_t DEFAULT_MAX_LINE_BYTES = 16 * 1024 * 1024;

    /// Create transport using system stdin/stdout.
    StdioTransport();

    /// Create transport using specified file descriptors (for testing).
    StdioTransport(int read_fd, int write_fd, std::size_t max_line_bytes = DEFAULT_MAX_LINE_BYTES);

    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    void start(MessageCallback on_message, ErrorCallback on_error = nullptr) override;
    void send(const JsonRpcMessage& msg) override;
    void send_raw(std::string_view line) override;
    void shutdown() override;
    bool is_connected() const override;

private:
    void read_loop(const MessageCallback& on_message, const ErrorCallback& on_error);
    void handle_line(std::string_view line, const MessageCallback& on_message, const ErrorCallback& on_error);
    void reject_oversized_line(const ErrorCallback& on_error);
    void write_line(std::string_view line);

    int read_fd_;
    int write_fd_;
    bool owns_fds_;
    std::size_t max_line_bytes_ = DEFAULT_MAX_LINE_BYTES;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> shutdown_requested_{false};

    int wakeup_pipe_[2]{-1, -1};  // pipe for interrupting poll()
};

} // namespace fsgate
