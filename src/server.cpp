#include "fsgate/server.hpp"
#include "fsgate/codec.hpp"
#include "fsgate/dispatcher.hpp"
#include "fsgate/error.hpp"
#include "fsgate/filesystem_ops.hpp"
#include "fsgate/path_normalizer.hpp"
#include "fsgate/path_security.hpp"
#include "fsgate/transport/stdio_transport.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdint>

namespace fsgate {

struct GatewayServer::Impl {
    ServerConfig config;
    PathNormalizer normalizer;
    PathSecurityPolicy policy;
    FilesystemOperations fs_ops;
    std::unique_ptr<IScriptExecutor> scripts;
    RequestDispatcher dispatcher;

    std::unique_ptr<ITransport> transport;
    std::atomic<bool> running{false};
    std::uint64_t received = 0;

    Impl(ServerConfig cfg, std::unique_ptr<IScriptExecutor> executor)
        : config(std::move(cfg)),
          normalizer(config),
          policy(config),
          fs_ops(config, normalizer, policy),
          scripts(executor ? std::move(executor) : std::make_unique<ProcessScriptExecutor>(config.script)),
          dispatcher(config, fs_ops, *scripts) {}

    // Responses to unparseable lines carry a synthetic id
    JsonRpcResponse parse_error(const std::string& reason) const {
        return make_error_response("error-" + std::to_string(received), error::ParseError,
                                   "Parse error: " + reason);
    }

    static std::string reason_of(std::exception_ptr ep) {
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            return e.what();
        }
        return "unknown error";
    }
};

GatewayServer::GatewayServer(ServerConfig config, std::unique_ptr<IScriptExecutor> scripts)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(scripts))) {
    spdlog::info("fsgate ready: {} allowed director{}, writes {}, symlinks {}, scripts {}",
                 impl_->config.allowed_directories.size(),
                 impl_->config.allowed_directories.size() == 1 ? "y" : "ies",
                 impl_->config.write_enabled ? "enabled" : "disabled",
                 impl_->config.symlinks_allowed ? "allowed" : "denied",
                 impl_->scripts->enabled() ? "enabled" : "disabled");
}

GatewayServer::~GatewayServer() {
    shutdown();
}

const ServerConfig& GatewayServer::config() const {
    return impl_->config;
}

std::optional<JsonRpcMessage> GatewayServer::handle(const JsonRpcMessage& msg) {
    return impl_->dispatcher.dispatch(msg);
}

std::optional<std::string> GatewayServer::handle_line(std::string_view line) {
    ++impl_->received;
    JsonRpcMessage msg;
    try {
        msg = Codec::parse(line);
    } catch (const FormatError& e) {
        return Codec::serialize_safe(impl_->parse_error(e.what()));
    }
    auto response = handle(msg);
    if (!response) return std::nullopt;
    return Codec::serialize_safe(*response);
}

void GatewayServer::serve(std::unique_ptr<ITransport> transport) {
    impl_->transport = std::move(transport);
    impl_->running = true;
    auto* t = impl_->transport.get();

    t->start(
        [this, t](JsonRpcMessage msg) {
            ++impl_->received;
            auto response = handle(msg);
            if (response) t->send(*response);
        },
        [this, t](std::exception_ptr ep) {
            ++impl_->received;
            t->send(impl_->parse_error(Impl::reason_of(ep)));
        });

    impl_->running = false;
}

void GatewayServer::serve_stdio() {
    serve(std::make_unique<StdioTransport>());
}

void GatewayServer::shutdown() {
    if (!impl_->running.exchange(false)) return;
    if (impl_->transport) impl_->transport->shutdown();
}

bool GatewayServer::is_running() const {
    return impl_->running;
}

} // namespace fsgate
