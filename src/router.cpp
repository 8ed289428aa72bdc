#include "clinmcp/router.hpp"
#include "clinmcp/error.hpp"
#include "clinmcp/log.hpp"

namespace clinmcp {

void Router::on_request(const std::string& method, RequestHandler handler) {
    request_handlers_[method] = std::move(handler);
}

void Router::on_notification(const std::string& method, NotificationHandler handler) {
    notification_handlers_[method] = std::move(handler);
}

void Router::require_ready(const std::string& method) {
    ready_only_.insert(method);
}

bool Router::has_handler(const std::string& method) const {
    return request_handlers_.count(method) > 0 || notification_handlers_.count(method) > 0;
}

std::optional<JsonRpcResponse> Router::dispatch(const JsonRpcMessage& msg,
                                                const Session* session) {
    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        auto it = request_handlers_.find(req->method);
        if (it == request_handlers_.end()) {
            return JsonRpcResponse::failure(req->id, error::MethodNotFound,
                                            "Method not found: " + req->method);
        }

        if (session && ready_only_.count(req->method) > 0 && !session->is_ready()) {
            return JsonRpcResponse::failure(
                req->id, error::NotInitialized,
                "Server not initialized: '" + req->method + "' requires a completed initialize handshake");
        }

        nlohmann::json params = req->params ? *req->params : nlohmann::json::object();
        try {
            auto result = it->second(params);
            if (auto* ok = std::get_if<nlohmann::json>(&result)) {
                return JsonRpcResponse::success(req->id, std::move(*ok));
            }
            auto& err = std::get<JsonRpcError>(result);
            return JsonRpcResponse::failure(req->id, err.code, std::move(err.message),
                                            std::move(err.data));
        } catch (const ProtocolError& e) {
            return JsonRpcResponse::failure(req->id, e.code, e.what());
        } catch (const nlohmann::json::exception& e) {
            // Handlers read params with .at()/.get(); shape mismatches land here.
            return JsonRpcResponse::failure(req->id, error::InvalidParams,
                                            std::string("Invalid params: ") + e.what());
        } catch (const std::exception& e) {
            CLINMCP_ERROR("Handler for '{}' failed: {}", req->method, e.what());
            return JsonRpcResponse::failure(req->id, error::InternalError, e.what());
        }
    }

    if (const auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
        auto it = notification_handlers_.find(notif->method);
        if (it == notification_handlers_.end()) {
            CLINMCP_DEBUG("Ignoring unknown notification '{}'", notif->method);
            return std::nullopt;
        }
        nlohmann::json params = notif->params ? *notif->params : nlohmann::json::object();
        try {
            it->second(params);
        } catch (const std::exception& e) {
            // Notifications have no channel for errors; the log is the only record.
            CLINMCP_WARN("Notification '{}' failed: {}", notif->method, e.what());
        }
        return std::nullopt;
    }

    const auto& resp = std::get<JsonRpcResponse>(msg);
    CLINMCP_DEBUG("Ignoring response for id {}; this server sends no requests", to_string(resp.id));
    return std::nullopt;
}

} // namespace clinmcp
