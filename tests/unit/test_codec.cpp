#include <gtest/gtest.h>
#include "toolbridge/codec.hpp"
#include "toolbridge/error.hpp"

using namespace toolbridge;

// ---- Parse tests ----

TEST(CodecParse, ValidRequest) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    auto& req = std::get<JsonRpcRequest>(msg);
    EXPECT_EQ(std::get<int64_t>(req.id), 1);
    EXPECT_EQ(req.method, "ping");
}

TEST(CodecParse, ValidRequestStringId) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":"srv-7","method":"roots/list"})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    EXPECT_EQ(std::get<std::string>(std::get<JsonRpcRequest>(msg).id), "srv-7");
}

TEST(CodecParse, ValidResponse) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":42,"result":{"tools":[]}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    auto& resp = std::get<JsonRpcResponse>(msg);
    EXPECT_EQ(std::get<int64_t>(resp.id), 42);
    ASSERT_TRUE(resp.result.has_value());
    EXPECT_TRUE(resp.result->contains("tools"));
    EXPECT_FALSE(resp.error.has_value());
}

TEST(CodecParse, ValidErrorResponse) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":1,"error":{"code":-32601,"message":"Method not found","data":{"x":1}}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    auto& resp = std::get<JsonRpcResponse>(msg);
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, -32601);
    EXPECT_EQ(resp.error->message, "Method not found");
    ASSERT_TRUE(resp.error->data.has_value());
    EXPECT_EQ((*resp.error->data)["x"], 1);
}

TEST(CodecParse, ValidNotification) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","method":"notifications/tools/list_changed"})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcNotification>(msg));
    EXPECT_EQ(std::get<JsonRpcNotification>(msg).method, "notifications/tools/list_changed");
}

TEST(CodecParse, NestedValuesSurviveConversion) {
    auto msg = Codec::parse(
        R"({"jsonrpc":"2.0","id":3,"result":{"a":[1,-2,3.5,true,null,"s"],"big":18446744073709551615}})");
    auto& resp = std::get<JsonRpcResponse>(msg);
    const auto& a = (*resp.result)["a"];
    ASSERT_EQ(a.size(), 6u);
    EXPECT_TRUE(a[0].is_number_integer());
    EXPECT_EQ(a[1], -2);
    EXPECT_DOUBLE_EQ(a[2].get<double>(), 3.5);
    EXPECT_EQ(a[3], true);
    EXPECT_TRUE(a[4].is_null());
    EXPECT_EQ(a[5], "s");
    EXPECT_TRUE((*resp.result)["big"].is_number_unsigned());
}

TEST(CodecParse, InvalidJson) {
    EXPECT_THROW(Codec::parse("{invalid json"), ParseError);
}

TEST(CodecParse, MissingJsonrpc) {
    EXPECT_THROW(Codec::parse(R"({"id":1,"method":"ping"})"), ParseError);
}

TEST(CodecParse, WrongJsonrpcVersion) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"1.0","id":1,"method":"ping"})"), ParseError);
}

TEST(CodecParse, NullId) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":null,"method":"ping"})"), ParseError);
}

TEST(CodecParse, EmptyInput) {
    EXPECT_THROW(Codec::parse(""), ParseError);
}

TEST(CodecParse, NotAnObject) {
    EXPECT_THROW(Codec::parse("[1,2,3]"), ParseError);
}

TEST(CodecParse, ResponseWithoutResultOrError) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":1})"), ParseError);
}

TEST(CodecParse, MalformedErrorObject) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":1,"error":{"message":"no code"}})"), ParseError);
}

TEST(CodecParse, NonStringMethod) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":1,"method":5})"), ParseError);
}

TEST(CodecParse, ParseErrorIsProtocolKind) {
    try {
        (void)Codec::parse("nope");
        FAIL() << "expected ParseError";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Protocol);
    }
}

// ---- Serialize tests ----

TEST(CodecSerialize, ToolCallRequest) {
    JsonRpcRequest req;
    req.id = RequestId{int64_t{9}};
    req.method = "tools/call";
    req.params = nlohmann::json{{"name", "search"}, {"arguments", {{"q", "rooms"}}}};

    auto j = nlohmann::json::parse(Codec::serialize(req));
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["id"], 9);
    EXPECT_EQ(j["method"], "tools/call");
    EXPECT_EQ(j["params"]["arguments"]["q"], "rooms");
}

TEST(CodecSerialize, ResponseDefaultsToEmptyResult) {
    JsonRpcResponse resp;
    resp.id = RequestId{std::string("srv-1")};
    auto j = nlohmann::json::parse(Codec::serialize(resp));
    EXPECT_EQ(j["id"], "srv-1");
    EXPECT_TRUE(j["result"].is_object());
    EXPECT_FALSE(j.contains("error"));
}

TEST(CodecSerialize, ErrorResponseOmitsResult) {
    JsonRpcResponse resp;
    resp.id = RequestId{int64_t{2}};
    resp.error = JsonRpcError{rpc_error::MethodNotFound, "Method not found: x", std::nullopt};
    auto j = nlohmann::json::parse(Codec::serialize(resp));
    EXPECT_FALSE(j.contains("result"));
    EXPECT_EQ(j["error"]["code"], rpc_error::MethodNotFound);
}

TEST(CodecSerialize, NotificationHasNoId) {
    JsonRpcNotification notif;
    notif.method = "notifications/initialized";
    auto j = nlohmann::json::parse(Codec::serialize(notif));
    EXPECT_FALSE(j.contains("id"));
    EXPECT_FALSE(j.contains("params"));
}

// ---- Large message test ----

TEST(CodecParse, LargeMessage) {
    nlohmann::json tools = nlohmann::json::array();
    for (int i = 0; i < 100; ++i) {
        tools.push_back({
            {"name", "tool_" + std::to_string(i)},
            {"description", "Description for tool " + std::to_string(i)},
            {"inputSchema", {{"type", "object"}, {"properties", nlohmann::json::object()}}}
        });
    }
    nlohmann::json response = {
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"result", {{"tools", tools}}}
    };
    auto msg = Codec::parse(response.dump());
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    EXPECT_EQ(std::get<JsonRpcResponse>(msg).result->at("tools").size(), 100u);
}
