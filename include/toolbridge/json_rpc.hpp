#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace toolbridge {

/// Correlation id. Ids this client allocates are always integers; peers may
/// use strings for the requests they initiate.
using RequestId = std::variant<int64_t, std::string>;

void to_json(nlohmann::json& j, const RequestId& id);

/// Throws std::invalid_argument unless `j` is an integer or a string.
void from_json(const nlohmann::json& j, RequestId& id);

[[nodiscard]] std::string id_to_string(const RequestId& id);

struct JsonRpcError {
    int code = 0;
    std::string message;
    std::optional<nlohmann::json> data;

    bool operator==(const JsonRpcError& o) const {
        return code == o.code && message == o.message && data == o.data;
    }
    bool operator!=(const JsonRpcError& o) const { return !(*this == o); }
};

void to_json(nlohmann::json& j, const JsonRpcError& e);
void from_json(const nlohmann::json& j, JsonRpcError& e);

/// Outbound call from this client, or a server-initiated request (ping,
/// sampling, roots) arriving on the reader thread.
struct JsonRpcRequest {
    RequestId id;
    std::string method;
    std::optional<nlohmann::json> params;

    /// params, or {} when the peer sent none.
    [[nodiscard]] nlohmann::json params_or_empty() const {
        return params ? *params : nlohmann::json::object();
    }
};

struct JsonRpcResponse {
    RequestId id;
    std::optional<nlohmann::json> result;
    std::optional<JsonRpcError> error;

    [[nodiscard]] bool failed() const noexcept { return error.has_value(); }
};

/// Peer-initiated message without a correlation id.
struct JsonRpcNotification {
    std::string method;
    std::optional<nlohmann::json> params;

    [[nodiscard]] nlohmann::json params_or_empty() const {
        return params ? *params : nlohmann::json::object();
    }
};

using JsonRpcMessage = std::variant<JsonRpcRequest, JsonRpcResponse, JsonRpcNotification>;

[[nodiscard]] JsonRpcRequest make_request(int64_t id, std::string method, nlohmann::json params);
[[nodiscard]] JsonRpcNotification make_notification(std::string method,
                                                    std::optional<nlohmann::json> params = std::nullopt);
[[nodiscard]] JsonRpcResponse make_result(RequestId id, nlohmann::json result);
[[nodiscard]] JsonRpcResponse make_error(RequestId id, int code, std::string message);

void to_json(nlohmann::json& j, const JsonRpcRequest& r);
void to_json(nlohmann::json& j, const JsonRpcResponse& r);
void to_json(nlohmann::json& j, const JsonRpcNotification& n);
void to_json(nlohmann::json& j, const JsonRpcMessage& m);

} // namespace toolbridge
