#include <gtest/gtest.h>
#include "mcplite/json_rpc.hpp"
#include "mcplite/version.hpp"
#include <nlohmann/json.hpp>

using namespace mcplite;

TEST(RequestId, NullBecomesAbsent) {
    EXPECT_FALSE(request_id_from_json(nullptr).has_value());
    EXPECT_EQ(*request_id_from_json(5), 5);
    EXPECT_EQ(*request_id_from_json("abc"), "abc");
}

TEST(JsonRpcRequest, Serialize) {
    JsonRpcRequest req;
    req.id = nlohmann::json(1);
    req.method = "tools/list";

    nlohmann::json j;
    to_json(j, req);
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["method"], "tools/list");
    EXPECT_EQ(j["id"], 1);
    EXPECT_TRUE(j["params"].is_object());
}

TEST(JsonRpcRequest, AbsentIdOmitted) {
    JsonRpcRequest req;
    req.method = "notifications/initialized";

    nlohmann::json j;
    to_json(j, req);
    EXPECT_FALSE(j.contains("id"));
}

TEST(JsonRpcResponse, WithResult) {
    JsonRpcResponse resp;
    resp.id = nlohmann::json(42);
    resp.result = nlohmann::json{{"ok", true}};

    nlohmann::json j;
    to_json(j, resp);
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["id"], 42);
    EXPECT_EQ(j["result"]["ok"], true);
    EXPECT_FALSE(j.contains("error"));
}

TEST(JsonRpcResponse, WithError) {
    JsonRpcResponse resp;
    resp.id = nlohmann::json("err-1");
    resp.error = JsonRpcError{-32601, "Method not found", std::nullopt};

    nlohmann::json j;
    to_json(j, resp);
    EXPECT_EQ(j["id"], "err-1");
    EXPECT_EQ(j["error"]["code"], -32601);
    EXPECT_EQ(j["error"]["message"], "Method not found");
    EXPECT_FALSE(j["error"].contains("data"));
    EXPECT_FALSE(j.contains("result"));
}

TEST(JsonRpcResponse, NullIdNotWritten) {
    JsonRpcResponse resp;
    resp.id = nlohmann::json(nullptr);
    resp.result = nlohmann::json::object();

    nlohmann::json j;
    to_json(j, resp);
    EXPECT_FALSE(j.contains("id"));
}

TEST(JsonRpcResponse, FromJson) {
    auto j = nlohmann::json::parse(
        R"({"jsonrpc":"2.0","id":3,"error":{"code":-32602,"message":"Invalid params","data":"Missing required parameters: y"}})");
    auto resp = j.get<JsonRpcResponse>();
    EXPECT_EQ(*resp.id, 3);
    EXPECT_FALSE(resp.result.has_value());
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, -32602);
    EXPECT_EQ(*resp.error->data, "Missing required parameters: y");
}

TEST(JsonRpcError, DataRoundTrip) {
    JsonRpcError err{-32603, "Internal error", nlohmann::json("boom")};
    nlohmann::json j = err;
    EXPECT_EQ(j.get<JsonRpcError>(), err);
}
