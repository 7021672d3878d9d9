#include <gtest/gtest.h>
#include "mcplite/mcplite.hpp"
#include <algorithm>
#include <string>
#include <vector>

using namespace mcplite;

class LifecycleTest : public ::testing::Test {
protected:
    struct Line {
        LogLevel level;
        std::string logger;
        std::string message;
    };

    std::vector<Line> lines_;
    std::unique_ptr<McpServer> server_;

    void SetUp() override {
        McpServer::Options sopts;
        sopts.server_info = {"Calc Server", std::nullopt, "2.1.0"};
        sopts.instructions = "Call add with two integers";
        sopts.log_sink = [this](LogLevel level, const std::string& logger,
                                const std::string& message) {
            lines_.push_back({level, logger, message});
        };
        server_ = std::make_unique<McpServer>(sopts);

        server_->add_tool("add", {std::nullopt, "Add two numbers", ""},
            [](int x, int y) { return x + y; },
            {arg("x"), arg("y")});
    }

    size_t count_messages(const std::string& text) const {
        return static_cast<size_t>(std::count_if(lines_.begin(), lines_.end(),
            [&text](const Line& l) { return l.message == text; }));
    }

    bool logged_containing(const std::string& text) const {
        return std::any_of(lines_.begin(), lines_.end(),
            [&text](const Line& l) { return l.message.find(text) != std::string::npos; });
    }
};

TEST_F(LifecycleTest, InitializeHandshake) {
    EXPECT_FALSE(server_->is_initialized());

    auto resp = server_->handle({
        {"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"},
        {"params", {
            {"protocolVersion", "2024-11-05"},
            {"capabilities", nlohmann::json::object()},
            {"clientInfo", {{"name", "test-client"}, {"version", "1.0"}}}
        }}
    });

    ASSERT_TRUE(resp.contains("result"));
    const auto& result = resp["result"];
    EXPECT_EQ(result["protocolVersion"], "2024-11-05");
    EXPECT_EQ(result["capabilities"]["tools"]["listChanged"], false);
    EXPECT_EQ(result["serverInfo"]["name"], "Calc Server");
    EXPECT_EQ(result["serverInfo"]["version"], "2.1.0");
    EXPECT_EQ(result["instructions"], "Call add with two integers");
    EXPECT_TRUE(server_->is_initialized());
}

TEST_F(LifecycleTest, InitializeWithoutParams) {
    auto resp = server_->handle({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"}});
    EXPECT_EQ(resp["result"]["protocolVersion"], "2024-11-05");
    EXPECT_TRUE(server_->is_initialized());
}

TEST_F(LifecycleTest, InitializeIsIdempotent) {
    auto first = server_->handle({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"}});
    auto second = server_->handle({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"}});
    EXPECT_EQ(first, second);
    EXPECT_TRUE(server_->is_initialized());
}

TEST_F(LifecycleTest, InitializeApiMatchesHandler) {
    InitializeResult direct = server_->initialize();
    auto resp = server_->handle({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"}});
    EXPECT_EQ(resp["result"].get<InitializeResult>(), direct);
}

TEST_F(LifecycleTest, InitializedConfirmations) {
    for (const char* method : {"initialized", "notifications/initialized"}) {
        auto resp = server_->handle({{"jsonrpc", "2.0"}, {"id", 4}, {"method", method}});
        ASSERT_TRUE(resp.contains("result")) << method;
        EXPECT_TRUE(resp["result"].is_object());
        EXPECT_TRUE(resp["result"].empty());
    }
    // Confirmations do not drive the state
    EXPECT_FALSE(server_->is_initialized());
}

TEST_F(LifecycleTest, DirectCallAutoInitializesOnce) {
    auto resp = server_->handle({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "add"},
                                 {"params", {{"x", 1}, {"y", 1}}}});
    EXPECT_EQ(resp["result"], 2);
    EXPECT_TRUE(server_->is_initialized());

    (void)server_->handle({{"jsonrpc", "2.0"}, {"id", 2}, {"method", "add"},
                           {"params", {{"x", 1}, {"y", 1}}}});
    EXPECT_EQ(count_messages("Auto-initializing MCP server for tool execution"), 1u);
}

TEST_F(LifecycleTest, UnknownDirectCallStillInitializes) {
    auto resp = server_->handle({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "nope"}});
    EXPECT_EQ(resp["error"]["code"], -32601);
    EXPECT_TRUE(server_->is_initialized());
}

TEST_F(LifecycleTest, ToolsCallDoesNotInitialize) {
    auto resp = server_->handle({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/call"},
                                 {"params", {{"name", "add"},
                                             {"arguments", {{"x", 1}, {"y", 2}}}}}});
    EXPECT_EQ(resp["result"]["content"][0]["text"], "3");
    EXPECT_FALSE(server_->is_initialized());
    EXPECT_EQ(count_messages("Auto-initializing MCP server for tool execution"), 0u);
}

TEST_F(LifecycleTest, AlreadyInitializedSkipsAutoInit) {
    (void)server_->initialize();
    (void)server_->handle({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "add"},
                           {"params", {{"x", 1}, {"y", 1}}}});
    EXPECT_EQ(count_messages("Auto-initializing MCP server for tool execution"), 0u);
}

// ---- Logging ----

TEST_F(LifecycleTest, LoggerNamedAfterServer) {
    EXPECT_EQ(server_->logger().name(), "MCP.Calc_Server");
    ASSERT_FALSE(lines_.empty());
    EXPECT_EQ(lines_.front().logger, "MCP.Calc_Server");
}

TEST_F(LifecycleTest, RegistrationLogged) {
    EXPECT_EQ(count_messages("Registered tool: add - Add two numbers"), 1u);
}

TEST_F(LifecycleTest, RequestsLogged) {
    (void)server_->handle({{"jsonrpc", "2.0"}, {"id", 3}, {"method", "tools/list"}});
    EXPECT_EQ(count_messages("Processing request - Method: tools/list, ID: 3"), 1u);
    EXPECT_TRUE(logged_containing("Request completed - Method: tools/list, ID: 3, Time: "));
}

TEST_F(LifecycleTest, DebugLevelShowsRequestBodies) {
    server_->set_log_level(LogLevel::Debug);
    (void)server_->handle({{"jsonrpc", "2.0"}, {"id", 3}, {"method", "tools/list"}});
    EXPECT_EQ(count_messages("Log level changed to: debug"), 1u);
    EXPECT_TRUE(logged_containing("Incoming request: "));
}

TEST_F(LifecycleTest, InfoLevelHidesRequestBodies) {
    (void)server_->handle({{"jsonrpc", "2.0"}, {"id", 3}, {"method", "tools/list"}});
    EXPECT_FALSE(logged_containing("Incoming request: "));
}

TEST_F(LifecycleTest, DisabledLoggingIsSilent) {
    server_->set_logging_enabled(false);
    lines_.clear();
    (void)server_->handle({{"jsonrpc", "2.0"}, {"id", 3}, {"method", "tools/list"}});
    EXPECT_TRUE(lines_.empty());

    server_->set_logging_enabled(true);
    EXPECT_EQ(count_messages("Logging enabled for MCP.Calc_Server"), 1u);
}

TEST(LifecycleDefaults, DefaultServerInfo) {
    McpServer::Options sopts;
    sopts.enable_logging = false;
    McpServer server(sopts);
    EXPECT_EQ(server.server_info().name, "MCP Server");
    EXPECT_EQ(server.server_info().version, "1.0.0");
    EXPECT_EQ(server.logger().name(), "MCP.MCP_Server");

    InitializeResult r = server.initialize();
    EXPECT_FALSE(r.instructions.has_value());
    nlohmann::json j = r;
    EXPECT_FALSE(j.contains("instructions"));
}
