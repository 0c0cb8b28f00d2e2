#pragma once
#include "json_rpc.hpp"
#include <functional>
#include <optional>
#include <unordered_map>
#include <string>
#include <mutex>
#include <variant>
#include <vector>

namespace toolbridge {

using HandlerResult = std::variant<nlohmann::json, JsonRpcError>;
using RequestHandler = std::function<HandlerResult(const nlohmann::json& params)>;
using NotificationHandler = std::function<void(const nlohmann::json& params)>;

/// Dispatch for peer-initiated traffic: requests the server sends to the
/// client and notifications. Responses never pass through here.
class Router {
public:
    /// Register a request handler for a method.
    void on_request(const std::string& method, RequestHandler handler);

    /// Register a notification handler. Several handlers may share a method;
    /// they run in registration order.
    void on_notification(const std::string& method, NotificationHandler handler);

    /// Dispatch an incoming request or notification. Returns the response to
    /// send back for a request, nullopt otherwise. Unregistered request
    /// methods produce MethodNotFound.
    [[nodiscard]] std::optional<JsonRpcResponse> dispatch(const JsonRpcMessage& msg);

    [[nodiscard]] bool has_handler(const std::string& method) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, RequestHandler> request_handlers_;
    std::unordered_map<std::string, std::vector<NotificationHandler>> notification_handlers_;
};

} // namespace toolbridge
