#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string>
#include <string_view>

namespace toolbridge {

class Codec {
public:
    /// Parse one JSON-RPC message.
    /// Throws ParseError on invalid JSON or when the shape is neither a
    /// request, a response nor a notification.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Classify an already-parsed object.
    [[nodiscard]] static JsonRpcMessage from_object(const nlohmann::json& j);

    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);
};

} // namespace toolbridge
