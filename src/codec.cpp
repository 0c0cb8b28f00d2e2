#include "toolbridge/codec.hpp"
#include "toolbridge/version.hpp"
#include <simdjson.h>
#include <string>

namespace toolbridge {

namespace {

// simdjson DOM element -> nlohmann::json
nlohmann::json to_nlohmann(simdjson::dom::element el) {
    using simdjson::dom::element_type;
    switch (el.type()) {
        case element_type::OBJECT: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : simdjson::dom::object(el)) {
                obj[std::string(field.key)] = to_nlohmann(field.value);
            }
            return obj;
        }
        case element_type::ARRAY: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto item : simdjson::dom::array(el)) {
                arr.push_back(to_nlohmann(item));
            }
            return arr;
        }
        case element_type::STRING:
            return std::string(std::string_view(el));
        case element_type::INT64:
            return int64_t(el);
        case element_type::UINT64:
            return uint64_t(el);
        case element_type::DOUBLE:
            return double(el);
        case element_type::BOOL:
            return bool(el);
        case element_type::NULL_VALUE:
        default:
            return nullptr;
    }
}

RequestId read_id(const nlohmann::json& j, const char* what) {
    const auto& id = j.at("id");
    if (id.is_null()) {
        throw ParseError(std::string(what) + " id must not be null");
    }
    RequestId out;
    try {
        from_json(id, out);
    } catch (const std::invalid_argument& e) {
        throw ParseError(e.what());
    }
    return out;
}

} // anonymous namespace

JsonRpcMessage Codec::from_object(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ParseError("Message must be a JSON object");
    }
    auto version = j.find("jsonrpc");
    if (version == j.end() || !version->is_string()
        || version->get<std::string>() != JSONRPC_VERSION) {
        throw ParseError("Missing or invalid 'jsonrpc' version, expected '2.0'");
    }

    const bool has_id = j.contains("id");
    const bool has_method = j.contains("method");
    if (has_method && !j.at("method").is_string()) {
        throw ParseError("'method' must be a string");
    }

    if (has_method && has_id) {
        JsonRpcRequest req;
        req.id = read_id(j, "Request");
        req.method = j.at("method").get<std::string>();
        if (j.contains("params")) req.params = j.at("params");
        return req;
    }
    if (has_method) {
        JsonRpcNotification notif;
        notif.method = j.at("method").get<std::string>();
        if (j.contains("params")) notif.params = j.at("params");
        return notif;
    }
    if (has_id) {
        JsonRpcResponse resp;
        resp.id = read_id(j, "Response");
        if (j.contains("error")) {
            try {
                resp.error = j.at("error").get<JsonRpcError>();
            } catch (const nlohmann::json::exception& e) {
                throw ParseError(std::string("Malformed error object: ") + e.what());
            }
        } else if (j.contains("result")) {
            resp.result = j.at("result");
        } else {
            throw ParseError("Response carries neither 'result' nor 'error'");
        }
        return resp;
    }
    throw ParseError("Cannot determine message type: missing both 'id' and 'method'");
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    if (raw.empty()) {
        throw ParseError("Empty input");
    }

    // One parser per reader thread; simdjson parsers are not shareable.
    thread_local simdjson::dom::parser parser;
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::dom::element doc;
    auto error = parser.parse(padded).get(doc);
    if (error) {
        throw ParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }
    return from_object(to_nlohmann(doc));
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    return j.dump();
}

} // namespace toolbridge
