#include <gtest/gtest.h>
#include "mcpconn/json_rpc.hpp"
#include "mcpconn/error.hpp"
#include "mcpconn/version.hpp"
#include <nlohmann/json.hpp>

using namespace mcpconn;

TEST(RequestIdJson, IntegerAndString) {
    nlohmann::json j;
    to_json(j, RequestId{int64_t{12}});
    EXPECT_EQ(j, 12);
    to_json(j, RequestId{std::string("abc")});
    EXPECT_EQ(j, "abc");

    RequestId id;
    from_json(nlohmann::json(5), id);
    EXPECT_EQ(std::get<int64_t>(id), 5);
    from_json(nlohmann::json("x"), id);
    EXPECT_EQ(std::get<std::string>(id), "x");
}

TEST(RequestIdJson, RejectsOtherTypes) {
    RequestId id;
    EXPECT_THROW(from_json(nlohmann::json(nullptr), id), std::invalid_argument);
    EXPECT_THROW(from_json(nlohmann::json::array(), id), std::invalid_argument);
}

TEST(RequestIdJson, PrintableForm) {
    EXPECT_EQ(id_to_string(RequestId{int64_t{7}}), "7");
    EXPECT_EQ(id_to_string(RequestId{std::string("seven")}), "\"seven\"");
}

TEST(JsonRpcRequestJson, CarriesVersionAndParams) {
    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "initialize";
    req.params = nlohmann::json{{"protocolVersion", PROTOCOL_VERSION}};

    nlohmann::json j;
    to_json(j, req);
    EXPECT_EQ(j["jsonrpc"], JSONRPC_VERSION);
    EXPECT_EQ(j["id"], 1);
    EXPECT_EQ(j["params"]["protocolVersion"], "2024-11-05");
}

TEST(JsonRpcResponseJson, MissingIdSerializesAsNull) {
    JsonRpcResponse resp;
    resp.result = nlohmann::json::object();

    nlohmann::json j;
    to_json(j, resp);
    ASSERT_TRUE(j.contains("id"));
    EXPECT_TRUE(j["id"].is_null());
}

TEST(JsonRpcErrorJson, DataIsOptional) {
    nlohmann::json without = JsonRpcError{error::InvalidParams, "bad", std::nullopt};
    EXPECT_FALSE(without.contains("data"));

    nlohmann::json with = JsonRpcError{error::InvalidParams, "bad", nlohmann::json{{"field", "x"}}};
    EXPECT_EQ(with["data"]["field"], "x");

    auto back = with.get<JsonRpcError>();
    EXPECT_EQ(back.code, -32602);
    EXPECT_EQ(back.message, "bad");
    ASSERT_TRUE(back.data.has_value());
}

TEST(JsonRpcMessageJson, VisitsAlternative) {
    JsonRpcMessage msg = JsonRpcNotification{"notifications/initialized", std::nullopt};
    nlohmann::json j;
    to_json(j, msg);
    EXPECT_EQ(j["method"], "notifications/initialized");
    EXPECT_FALSE(j.contains("id"));
}

TEST(ErrorCodes, StandardValues) {
    EXPECT_EQ(error::ParseError, -32700);
    EXPECT_EQ(error::InvalidRequest, -32600);
    EXPECT_EQ(error::MethodNotFound, -32601);
    EXPECT_EQ(error::InvalidParams, -32602);
    EXPECT_EQ(error::InternalError, -32603);
}
