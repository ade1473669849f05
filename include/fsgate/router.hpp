#pragma once
#include "json_rpc.hpp"
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

namespace fsgate {

using HandlerResult = std::variant<nlohmann::json, JsonRpcError>;
using RequestHandler = std::function<HandlerResult(const nlohmann::json& params)>;
using NotificationHandler = std::function<void(const nlohmann::json& params)>;

/// Maps method names to handlers and is the one place where exceptions
/// escaping a handler become JSON-RPC error codes.
class Router {
public:
    /// Register a request handler for a method.
    void on_request(const std::string& method, RequestHandler handler);

    /// Register a notification handler.
    void on_notification(const std::string& method, NotificationHandler handler);

    /// Dispatch an incoming message. Requests always yield a response;
    /// notifications and client responses never do.
    [[nodiscard]] std::optional<JsonRpcMessage> dispatch(const JsonRpcMessage& msg);

    [[nodiscard]] bool has_handler(const std::string& method) const;

    /// Translate the active exception into an error object.
    [[nodiscard]] static JsonRpcError error_from_exception(const std::exception& e);

private:
    std::unordered_map<std::string, RequestHandler> request_handlers_;
    std::unordered_map<std::string, NotificationHandler> notification_handlers_;
};

} // namespace fsgate
