#include <gtest/gtest.h>
#include "mcptk/json_rpc.hpp"
#include "mcptk/error.hpp"

using namespace mcptk;

TEST(JsonRpc, ResultResponseSerialization) {
    auto resp = make_result(RequestId{int64_t{7}}, nlohmann::json{{"ok", true}});
    nlohmann::json j = resp;
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["id"], 7);
    EXPECT_EQ(j["result"]["ok"], true);
    EXPECT_FALSE(j.contains("error"));
}

TEST(JsonRpc, ErrorResponseWithNullId) {
    auto resp = make_error(std::nullopt, error::ParseError, "Parse error");
    nlohmann::json j = resp;
    EXPECT_TRUE(j["id"].is_null());
    EXPECT_EQ(j["error"]["code"], -32700);
    EXPECT_EQ(j["error"]["message"], "Parse error");
    EXPECT_FALSE(j["error"].contains("data"));
    EXPECT_FALSE(j.contains("result"));
}

TEST(JsonRpc, ErrorDataIsKept) {
    auto resp = make_error(RequestId{std::string("abc")}, error::InvalidParams, "bad",
                           nlohmann::json{{"field", "x"}});
    nlohmann::json j = resp;
    EXPECT_EQ(j["id"], "abc");
    EXPECT_EQ(j["error"]["data"]["field"], "x");
}

TEST(JsonRpc, RequestIdFromJsonRejectsOtherTypes) {
    RequestId id;
    EXPECT_THROW(from_json(nlohmann::json(1.5), id), std::invalid_argument);
    EXPECT_THROW(from_json(nlohmann::json::array(), id), std::invalid_argument);
    from_json(nlohmann::json("x"), id);
    EXPECT_TRUE(id == RequestId{std::string("x")});
}

TEST(JsonRpc, RequestWithoutIdIsNotification) {
    auto j = nlohmann::json::parse(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    auto req = j.get<JsonRpcRequest>();
    EXPECT_TRUE(req.is_notification());
    EXPECT_EQ(req.method, "notifications/initialized");
    EXPECT_FALSE(req.params.has_value());
}

TEST(JsonRpc, RequestRoundTrip) {
    JsonRpcRequest req{RequestId{int64_t{9}}, "tools/call", nlohmann::json{{"name", "echo"}}};
    nlohmann::json j = req;
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_TRUE(j.get<JsonRpcRequest>() == req);
}

TEST(JsonRpc, ResponseParsesError) {
    auto j = nlohmann::json::parse(
        R"({"jsonrpc":"2.0","id":3,"error":{"code":-32601,"message":"Method not found"}})");
    auto resp = j.get<JsonRpcResponse>();
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, error::MethodNotFound);
    EXPECT_TRUE(resp.id == RequestId{int64_t{3}});
}
