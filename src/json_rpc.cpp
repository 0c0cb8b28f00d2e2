#include "toolbridge/json_rpc.hpp"
#include "toolbridge/version.hpp"
#include <stdexcept>

namespace toolbridge {

void to_json(nlohmann::json& j, const RequestId& id) {
    if (const auto* i = std::get_if<int64_t>(&id)) {
        j = *i;
    } else {
        j = std::get<std::string>(id);
    }
}

void from_json(const nlohmann::json& j, RequestId& id) {
    if (j.is_number_integer()) {
        id = j.get<int64_t>();
    } else if (j.is_string()) {
        id = j.get<std::string>();
    } else {
        throw std::invalid_argument("request id must be an integer or a string, got " + std::string(j.type_name()));
    }
}

std::string id_to_string(const RequestId& id) {
    if (const auto* i = std::get_if<int64_t>(&id)) return std::to_string(*i);
    return std::get<std::string>(id);
}

void to_json(nlohmann::json& j, const JsonRpcError& e) {
    j = nlohmann::json{{"code", e.code}, {"message", e.message}};
    if (e.data) j["data"] = *e.data;
}

void from_json(const nlohmann::json& j, JsonRpcError& e) {
    e.code = j.at("code").get<int>();
    e.message = j.at("message").get<std::string>();
    if (j.contains("data")) e.data = j.at("data");
}

JsonRpcRequest make_request(int64_t id, std::string method, nlohmann::json params) {
    JsonRpcRequest r;
    r.id = RequestId{id};
    r.method = std::move(method);
    if (!params.is_null()) r.params = std::move(params);
    return r;
}

JsonRpcNotification make_notification(std::string method, std::optional<nlohmann::json> params) {
    return JsonRpcNotification{std::move(method), std::move(params)};
}

JsonRpcResponse make_result(RequestId id, nlohmann::json result) {
    JsonRpcResponse r;
    r.id = std::move(id);
    r.result = std::move(result);
    return r;
}

JsonRpcResponse make_error(RequestId id, int code, std::string message) {
    JsonRpcResponse r;
    r.id = std::move(id);
    r.error = JsonRpcError{code, std::move(message), std::nullopt};
    return r;
}

namespace {

nlohmann::json envelope() {
    nlohmann::json j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    return j;
}

} // anonymous namespace

void to_json(nlohmann::json& j, const JsonRpcRequest& r) {
    j = envelope();
    to_json(j["id"], r.id);
    j["method"] = r.method;
    if (r.params) j["params"] = *r.params;
}

void to_json(nlohmann::json& j, const JsonRpcResponse& r) {
    j = envelope();
    to_json(j["id"], r.id);
    if (r.error) {
        j["error"] = *r.error;
    } else {
        j["result"] = r.result ? *r.result : nlohmann::json::object();
    }
}

void to_json(nlohmann::json& j, const JsonRpcNotification& n) {
    j = envelope();
    j["method"] = n.method;
    if (n.params) j["params"] = *n.params;
}

void to_json(nlohmann::json& j, const JsonRpcMessage& m) {
    std::visit([&j](const auto& v) { to_json(j, v); }, m);
}

} // namespace toolbridge
