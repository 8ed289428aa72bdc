#pragma once
#include "json_rpc.hpp"
#include "session.hpp"
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>

namespace clinmcp {

using HandlerResult = std::variant<nlohmann::json, JsonRpcError>;
using RequestHandler = std::function<HandlerResult(const nlohmann::json& params)>;
using NotificationHandler = std::function<void(const nlohmann::json& params)>;

/// Method table for the protocol engine. Single-threaded: handlers run on
/// the dispatching thread, one at a time.
class Router {
public:
    void on_request(const std::string& method, RequestHandler handler);
    void on_notification(const std::string& method, NotificationHandler handler);

    /// Requests for `method` are answered with NotInitialized unless the
    /// session is Ready.
    void require_ready(const std::string& method);

    /// Dispatch an incoming message. Returns the response for requests;
    /// notifications and responses never produce one.
    [[nodiscard]] std::optional<JsonRpcResponse> dispatch(const JsonRpcMessage& msg,
                                                          const Session* session = nullptr);

    [[nodiscard]] bool has_handler(const std::string& method) const;

private:
    std::unordered_map<std::string, RequestHandler> request_handlers_;
    std::unordered_map<std::string, NotificationHandler> notification_handlers_;
    std::set<std::string> ready_only_;
};

} // namespace clinmcp
