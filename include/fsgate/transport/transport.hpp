#pragma once
#include "../json_rpc.hpp"
#include <exception>
#include <functional>
#include <string_view>

namespace fsgate {

/// Callback for incoming messages
using MessageCallback = std::function<void(JsonRpcMessage)>;
/// Called with the FormatError of a line that could not be parsed
using ErrorCallback = std::function<void(std::exception_ptr)>;

/// Abstract transport interface
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Run the read loop. Blocks until end of input or shutdown.
    virtual void start(MessageCallback on_message,
                       ErrorCallback on_error = nullptr) = 0;

    /// Write one message as a single line.
    virtual void send(const JsonRpcMessage& msg) = 0;

    /// Write a pre-encoded line verbatim.
    virtual void send_raw(std::string_view line) = 0;

    /// Graceful shutdown.
    virtual void shutdown() = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;
};

} // namespace fsgate
