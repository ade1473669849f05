#include "fsgate/router.hpp"
#include "fsgate/error.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <filesystem>

namespace fsgate {

namespace {

int filesystem_error_code(const std::filesystem::filesystem_error& e) {
    const auto& ec = e.code();
    if (ec == std::errc::no_such_file_or_directory) return error::NotFound;
    if (ec == std::errc::file_exists || ec == std::errc::directory_not_empty
        || ec == std::errc::not_a_directory || ec == std::errc::is_a_directory) {
        return error::InvalidParams;
    }
    return error::InternalError;
}

} // anonymous namespace

void Router::on_request(const std::string& method, RequestHandler handler) {
    request_handlers_[method] = std::move(handler);
}

void Router::on_notification(const std::string& method, NotificationHandler handler) {
    notification_handlers_[method] = std::move(handler);
}

bool Router::has_handler(const std::string& method) const {
    return request_handlers_.count(method) > 0 || notification_handlers_.count(method) > 0;
}

JsonRpcError Router::error_from_exception(const std::exception& e) {
    int code = error::InternalError;
    if (const auto* p = dynamic_cast<const ProtocolError*>(&e)) {
        code = p->code;
    } else if (dynamic_cast<const SecurityError*>(&e)) {
        code = error::SecurityViolation;
    } else if (dynamic_cast<const NotFoundError*>(&e)) {
        code = error::NotFound;
    } else if (dynamic_cast<const InvalidArgumentError*>(&e) || dynamic_cast<const FormatError*>(&e)
               || dynamic_cast<const nlohmann::json::exception*>(&e)) {
        code = error::InvalidParams;
    } else if (const auto* fe = dynamic_cast<const std::filesystem::filesystem_error*>(&e)) {
        code = filesystem_error_code(*fe);
    }

    if (code == error::InternalError) {
        spdlog::error("Handler failed: {}", e.what());
    } else {
        spdlog::debug("Handler rejected request ({}): {}", code, e.what());
    }
    return JsonRpcError{code, e.what(), std::nullopt};
}

std::optional<JsonRpcMessage> Router::dispatch(const JsonRpcMessage& msg) {
    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        nlohmann::json params = req->params ? *req->params : nlohmann::json::object();

        auto it = request_handlers_.find(req->method);
        if (it == request_handlers_.end()) {
            spdlog::debug("Method not found: {}", req->method);
            return make_error_response(req->id, error::MethodNotFound, "Method not found: " + req->method);
        }

        JsonRpcResponse resp;
        resp.id = req->id;
        try {
            auto result = it->second(params);
            if (auto* ok = std::get_if<nlohmann::json>(&result)) {
                resp.result = std::move(*ok);
            } else if (auto* err = std::get_if<JsonRpcError>(&result)) {
                resp.error = std::move(*err);
            }
        } catch (const std::exception& e) {
            resp.error = error_from_exception(e);
        }
        return resp;
    } else if (const auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
        nlohmann::json params = notif->params ? *notif->params : nlohmann::json::object();

        // A request sent without an id still runs; its result is dropped
        try {
            auto nit = notification_handlers_.find(notif->method);
            if (nit != notification_handlers_.end()) {
                nit->second(params);
            } else if (auto rit = request_handlers_.find(notif->method); rit != request_handlers_.end()) {
                auto result = rit->second(params);
                if (auto* err = std::get_if<JsonRpcError>(&result)) {
                    spdlog::debug("Notification {} failed: {}", notif->method, err->message);
                }
            } else {
                spdlog::debug("Ignoring unknown notification: {}", notif->method);
            }
        } catch (const std::exception& e) {
            spdlog::warn("Notification {} failed: {}", notif->method, e.what());
        }
        return std::nullopt;
    } else if (const auto* resp = std::get_if<JsonRpcResponse>(&msg)) {
        spdlog::debug("Ignoring client response for id {}", request_id_to_string(resp->id));
        return std::nullopt;
    }

    return std::nullopt;
}

} // namespace fsgate
