#pragma once
#include "config.hpp"
#include "json_rpc.hpp"
#include "script_executor.hpp"
#include "transport/transport.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace fsgate {

/// Wires configuration, path policy, filesystem operations, the script
/// executor and the dispatcher together and drives them from a transport.
class GatewayServer {
public:
    /// The executor defaults to a ProcessScriptExecutor built from config.script.
    explicit GatewayServer(ServerConfig config, std::unique_ptr<IScriptExecutor> scripts = nullptr);
    ~GatewayServer();

    GatewayServer(const GatewayServer&) = delete;
    GatewayServer& operator=(const GatewayServer&) = delete;

    /// Dispatch one parsed message.
    [[nodiscard]] std::optional<JsonRpcMessage> handle(const JsonRpcMessage& msg);

    /// Process one raw input line the way the transport loop does and return
    /// the line to write, if any. Parse failures yield a -32700 response.
    [[nodiscard]] std::optional<std::string> handle_line(std::string_view line);

    /// Serve until end of input or shutdown().
    void serve(std::unique_ptr<ITransport> transport);
    void serve_stdio();
    void shutdown();

    [[nodiscard]] bool is_running() const;
    [[nodiscard]] const ServerConfig& config() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace fsgate
