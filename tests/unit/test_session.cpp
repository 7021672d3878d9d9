#include <gtest/gtest.h>
#include "mcplite/session.hpp"

using namespace mcplite;

TEST(Session, InitialState) {
    Session s;
    EXPECT_EQ(s.state(), SessionState::Uninitialized);
    EXPECT_FALSE(s.is_initialized());
    EXPECT_FALSE(s.client_info().has_value());
}

TEST(Session, MarkInitializedOnce) {
    Session s;
    EXPECT_TRUE(s.mark_initialized());
    EXPECT_TRUE(s.is_initialized());
    EXPECT_EQ(s.state(), SessionState::Initialized);

    // Already initialized: no transition, state unchanged
    EXPECT_FALSE(s.mark_initialized());
    EXPECT_TRUE(s.is_initialized());
}

TEST(Session, RecordClient) {
    Session s;
    s.record_client({
        {"protocolVersion", "2024-11-05"},
        {"capabilities", {{"roots", nlohmann::json::object()}}},
        {"clientInfo", {{"name", "inspector"}, {"version", "0.3"}}}
    });

    ASSERT_TRUE(s.client_info().has_value());
    EXPECT_EQ((*s.client_info())["name"], "inspector");
    ASSERT_TRUE(s.client_capabilities().has_value());
    EXPECT_TRUE(s.client_capabilities()->contains("roots"));
    EXPECT_EQ(s.client_protocol_version(), "2024-11-05");
    // Recording does not initialise the session
    EXPECT_FALSE(s.is_initialized());
}

TEST(Session, RecordClientIgnoresOddShapes) {
    Session s;
    s.record_client(nlohmann::json::array({1, 2}));
    s.record_client({{"protocolVersion", 20241105}});
    EXPECT_FALSE(s.client_info().has_value());
    EXPECT_FALSE(s.client_protocol_version().has_value());
}

TEST(SessionState, ToString) {
    EXPECT_EQ(session_state_to_string(SessionState::Uninitialized), "uninitialized");
    EXPECT_EQ(session_state_to_string(SessionState::Initialized), "initialized");
}
