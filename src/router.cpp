#include "toolbridge/router.hpp"
#include "toolbridge/error.hpp"
#include "toolbridge/log.hpp"

namespace toolbridge {

void Router::on_request(const std::string& method, RequestHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    request_handlers_[method] = std::move(handler);
}

void Router::on_notification(const std::string& method, NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    notification_handlers_[method].push_back(std::move(handler));
}

bool Router::has_handler(const std::string& method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return request_handlers_.count(method) > 0 || notification_handlers_.count(method) > 0;
}

std::optional<JsonRpcResponse> Router::dispatch(const JsonRpcMessage& msg) {
    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        RequestHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = request_handlers_.find(req->method);
            if (it == request_handlers_.end()) {
                log::logger()->debug("no handler for server request '{}'", req->method);
                return make_error(req->id, rpc_error::MethodNotFound, "Method not found: " + req->method);
            }
            handler = it->second;
        }
        // Handlers run without the lock so they may register further handlers.
        try {
            auto result = handler(req->params_or_empty());
            if (auto* ok = std::get_if<nlohmann::json>(&result)) {
                return make_result(req->id, std::move(*ok));
            }
            JsonRpcResponse resp;
            resp.id = req->id;
            resp.error = std::get<JsonRpcError>(std::move(result));
            return resp;
        } catch (const RemoteError& e) {
            return make_error(req->id, e.code, e.what());
        } catch (const std::exception& e) {
            return make_error(req->id, rpc_error::InternalError, e.what());
        }
    }

    if (const auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
        std::vector<NotificationHandler> handlers;
        const nlohmann::json params = notif->params_or_empty();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = notification_handlers_.find(notif->method);
            if (it == notification_handlers_.end()) return std::nullopt;
            handlers = it->second;
        }
        for (auto& handler : handlers) {
            try {
                handler(params);
            } catch (const std::exception& e) {
                log::logger()->warn("handler for '{}' failed: {}", notif->method, e.what());
            }
        }
    }
    return std::nullopt;
}

} // namespace toolbridge
