#include <gtest/gtest.h>
#include "mcplite/codec.hpp"
#include "mcplite/error.hpp"

using namespace mcplite;

// ---- Parse tests ----

TEST(CodecParse, ValidRequest) {
    auto j = Codec::parse(R"({"jsonrpc":"2.0","id":1,"method":"tools/list","params":{}})");
    ASSERT_TRUE(j.is_object());
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["id"], 1);
    EXPECT_EQ(j["method"], "tools/list");
    EXPECT_TRUE(j["params"].is_object());
}

TEST(CodecParse, ValidRequestStringId) {
    auto j = Codec::parse(R"({"jsonrpc":"2.0","id":"abc-123","method":"initialize"})");
    EXPECT_EQ(j["id"], "abc-123");
}

TEST(CodecParse, NestedValuesKeepTheirTypes) {
    auto j = Codec::parse(
        R"({"jsonrpc":"2.0","method":"tools/call","params":{"name":"calc",)"
        R"("arguments":{"i":-7,"f":2.5,"b":true,"n":null,"list":[1,"two"]}}})");
    const auto& args = j["params"]["arguments"];
    EXPECT_TRUE(args["i"].is_number_integer());
    EXPECT_EQ(args["i"], -7);
    EXPECT_TRUE(args["f"].is_number_float());
    EXPECT_DOUBLE_EQ(args["f"].get<double>(), 2.5);
    EXPECT_EQ(args["b"], true);
    EXPECT_TRUE(args["n"].is_null());
    ASSERT_EQ(args["list"].size(), 2u);
    EXPECT_EQ(args["list"][1], "two");
}

TEST(CodecParse, UnicodeEscapes) {
    auto j = Codec::parse(R"({"jsonrpc":"2.0","method":"echo","params":{"text":"caf\u00e9"}})");
    EXPECT_EQ(j["params"]["text"], "caf\xc3\xa9");
}

TEST(CodecParse, InvalidJson) {
    EXPECT_THROW(Codec::parse("{invalid json"), McpParseError);
}

TEST(CodecParse, UnterminatedObject) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","method":"x","id":1)"), McpParseError);
}

TEST(CodecParse, EmptyInput) {
    EXPECT_THROW(Codec::parse(""), McpParseError);
}

TEST(CodecParse, WhitespaceOnly) {
    EXPECT_THROW(Codec::parse("   \n"), McpParseError);
}

TEST(CodecParse, ArrayRootReturned) {
    auto j = Codec::parse(R"([{"jsonrpc":"2.0","method":"x"}])");
    ASSERT_TRUE(j.is_array());
    ASSERT_EQ(j.size(), 1u);
    EXPECT_EQ(j[0]["method"], "x");
}

TEST(CodecParse, ScalarRootsReturned) {
    EXPECT_EQ(Codec::parse(R"("just a string")"), "just a string");
    EXPECT_EQ(Codec::parse("42"), 42);
    EXPECT_EQ(Codec::parse("-7"), -7);
    EXPECT_DOUBLE_EQ(Codec::parse("2.5").get<double>(), 2.5);
    EXPECT_EQ(Codec::parse("true"), true);
    EXPECT_TRUE(Codec::parse(" null ").is_null());
}

TEST(CodecParse, NullRootWithTrailingContentRejected) {
    EXPECT_THROW(Codec::parse("null null"), McpParseError);
}

TEST(CodecParse, TrailingContentRejected) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","method":"x"} extra)"), McpParseError);
}

// ---- Serialize tests ----

TEST(CodecSerialize, CompactOutput) {
    nlohmann::json j = {{"jsonrpc", "2.0"}, {"result", {{"ok", true}}}};
    std::string s = Codec::serialize(j);
    EXPECT_EQ(s.find('\n'), std::string::npos);
    EXPECT_EQ(nlohmann::json::parse(s), j);
}

TEST(CodecSerialize, ParseOfSerializedEnvelopeMatches) {
    nlohmann::json j = {
        {"jsonrpc", "2.0"},
        {"id", "req-7"},
        {"method", "tools/call"},
        {"params", {{"name", "add"}, {"arguments", {{"x", 1}, {"y", 2}}}}}
    };
    EXPECT_EQ(Codec::parse(Codec::serialize(j)), j);
}
