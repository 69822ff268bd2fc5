#include <gtest/gtest.h>
#include "mcpconn/codec.hpp"
#include "mcpconn/error.hpp"

using namespace mcpconn;

// ---- Parse tests ----

TEST(CodecParse, ValidRequest) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    auto& req = std::get<JsonRpcRequest>(msg);
    EXPECT_EQ(std::get<int64_t>(req.id), 1);
    EXPECT_EQ(req.method, "ping");
}

TEST(CodecParse, ServerRequestWithStringId) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":"srv-1","method":"ping"})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    EXPECT_EQ(std::get<std::string>(std::get<JsonRpcRequest>(msg).id), "srv-1");
}

TEST(CodecParse, ValidResponse) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":42,"result":{"tools":[]}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    auto& resp = std::get<JsonRpcResponse>(msg);
    ASSERT_TRUE(resp.id.has_value());
    EXPECT_EQ(std::get<int64_t>(*resp.id), 42);
    ASSERT_TRUE(resp.result.has_value());
    EXPECT_TRUE(resp.result->contains("tools"));
    EXPECT_FALSE(resp.error.has_value());
}

TEST(CodecParse, ValidErrorResponse) {
    auto msg = Codec::parse(
        R"({"jsonrpc":"2.0","id":3,"error":{"code":-32601,"message":"Method not found","data":{"x":1}}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    auto& resp = std::get<JsonRpcResponse>(msg);
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, -32601);
    EXPECT_EQ(resp.error->message, "Method not found");
    ASSERT_TRUE(resp.raw_error.has_value());
    EXPECT_EQ((*resp.raw_error)["data"]["x"], 1);
}

TEST(CodecParse, NonConformingErrorObjectIsKept) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":3,"error":"boom"})");
    auto& resp = std::get<JsonRpcResponse>(msg);
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, error::InternalError);
    EXPECT_EQ(resp.error->message, "boom");
    EXPECT_EQ(*resp.raw_error, "boom");
}

TEST(CodecParse, ResponseWithNullIdHasNoId) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":null,"result":{}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    EXPECT_FALSE(std::get<JsonRpcResponse>(msg).id.has_value());
}

TEST(CodecParse, ResponseWithoutIdHasNoId) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","result":{"a":1}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    EXPECT_FALSE(std::get<JsonRpcResponse>(msg).id.has_value());
}

TEST(CodecParse, ResponseWithoutJsonrpcIsAccepted) {
    auto msg = Codec::parse(R"({"id":7,"result":{"ok":true}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    EXPECT_EQ(std::get<int64_t>(*std::get<JsonRpcResponse>(msg).id), 7);
}

TEST(CodecParse, ValidNotification) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","method":"notifications/message","params":{"level":"info"}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcNotification>(msg));
    auto& notif = std::get<JsonRpcNotification>(msg);
    EXPECT_EQ(notif.method, "notifications/message");
    ASSERT_TRUE(notif.params.has_value());
}

TEST(CodecParse, InvalidJson) {
    EXPECT_THROW(Codec::parse("{invalid json"), ParseError);
}

TEST(CodecParse, TrailingGarbage) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":1,"result":{}} extra)"), ParseError);
}

TEST(CodecParse, RequestMissingJsonrpc) {
    EXPECT_THROW(Codec::parse(R"({"id":1,"method":"ping"})"), ParseError);
}

TEST(CodecParse, WrongJsonrpcVersion) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"1.0","id":1,"result":{}})"), ParseError);
}

TEST(CodecParse, RequestWithNullId) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":null,"method":"ping"})"), ParseError);
}

TEST(CodecParse, FractionalId) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":1.5,"result":{}})"), ParseError);
}

TEST(CodecParse, EmptyInput) {
    EXPECT_THROW(Codec::parse(""), ParseError);
}

TEST(CodecParse, NotAnObject) {
    EXPECT_THROW(Codec::parse("[1,2,3]"), ParseError);
}

TEST(CodecParse, ObjectWithoutMessageShape) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0"})"), ParseError);
}

TEST(CodecParse, ToolCallParams) {
    auto msg = Codec::parse(
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"echo","arguments":{"text":"hello"}}})");
    auto& req = std::get<JsonRpcRequest>(msg);
    ASSERT_TRUE(req.params.has_value());
    EXPECT_EQ(req.params->at("name"), "echo");
    EXPECT_EQ(req.params->at("arguments").at("text"), "hello");
}

TEST(CodecParse, PreservesNumberKinds) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":1,"result":{"i":-3,"u":18446744073709551615,"d":0.25}})");
    const auto& result = *std::get<JsonRpcResponse>(msg).result;
    EXPECT_TRUE(result["i"].is_number_integer());
    EXPECT_TRUE(result["u"].is_number_unsigned());
    EXPECT_DOUBLE_EQ(result["d"].get<double>(), 0.25);
}

// ---- Serialize tests ----

TEST(CodecSerialize, RequestIsSingleLine) {
    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "tools/call";
    req.params = nlohmann::json{{"name", "echo"}, {"arguments", {{"text", "a\nb"}}}};
    std::string out = Codec::serialize(req);
    EXPECT_EQ(out.find('\n'), std::string::npos);

    auto j = nlohmann::json::parse(out);
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["id"], 1);
    EXPECT_EQ(j["params"]["arguments"]["text"], "a\nb");
}

TEST(CodecSerialize, NotificationHasNoId) {
    JsonRpcNotification notif;
    notif.method = "notifications/initialized";
    auto j = nlohmann::json::parse(Codec::serialize(notif));
    EXPECT_FALSE(j.contains("id"));
    EXPECT_FALSE(j.contains("params"));
    EXPECT_EQ(j["method"], "notifications/initialized");
}

TEST(CodecSerialize, ErrorResponse) {
    JsonRpcResponse resp;
    resp.id = RequestId{std::string("srv-1")};
    resp.error = JsonRpcError{error::MethodNotFound, "Method not supported by client: ping", std::nullopt};
    auto j = nlohmann::json::parse(Codec::serialize(resp));
    EXPECT_EQ(j["id"], "srv-1");
    EXPECT_EQ(j["error"]["code"], -32601);
    EXPECT_FALSE(j.contains("result"));
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
