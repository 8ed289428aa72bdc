#include <gtest/gtest.h>
#include "clinmcp/error.hpp"
#include "clinmcp/session.hpp"

using namespace clinmcp;

TEST(Session, InitialState) {
    Session s;
    EXPECT_EQ(s.state(), SessionState::Uninitialized);
    EXPECT_FALSE(s.is_ready());
    EXPECT_FALSE(s.is_closing());
}

TEST(Session, ForwardTransitions) {
    Session s;
    s.transition(SessionState::Initializing);
    EXPECT_EQ(s.state(), SessionState::Initializing);
    s.transition(SessionState::Ready);
    EXPECT_TRUE(s.is_ready());
    s.transition(SessionState::ShuttingDown);
    EXPECT_TRUE(s.is_closing());
    s.transition(SessionState::Closed);
    EXPECT_EQ(s.state(), SessionState::Closed);
}

TEST(Session, SkippingAheadIsAllowed) {
    Session s;
    s.transition(SessionState::Ready);
    EXPECT_TRUE(s.is_ready());
}

TEST(Session, BackwardTransitionThrows) {
    Session s;
    s.transition(SessionState::Ready);
    EXPECT_THROW(s.transition(SessionState::Initializing), ProtocolError);
    EXPECT_THROW(s.transition(SessionState::Ready), ProtocolError);
    EXPECT_EQ(s.state(), SessionState::Ready);
}

TEST(Session, AnyStateMayClose) {
    for (auto from : {SessionState::Uninitialized, SessionState::Initializing,
                      SessionState::Ready, SessionState::ShuttingDown}) {
        Session s;
        if (from != SessionState::Uninitialized) s.transition(from);
        s.transition(SessionState::Closed);
        EXPECT_EQ(s.state(), SessionState::Closed);
    }
}

TEST(Session, ClosedIsTerminal) {
    Session s;
    s.transition(SessionState::Closed);
    EXPECT_NO_THROW(s.transition(SessionState::Closed));
    EXPECT_THROW(s.transition(SessionState::Ready), ProtocolError);
}

TEST(Session, ClientInfo) {
    Session s;
    s.set_client({{"name", "inspector"}}, {{"roots", nlohmann::json::object()}}, "2024-11-05");
    EXPECT_EQ(s.client_info()["name"], "inspector");
    EXPECT_TRUE(s.client_capabilities().contains("roots"));
    EXPECT_EQ(s.protocol_version(), "2024-11-05");
}

TEST(Session, StateNames) {
    EXPECT_EQ(to_string(SessionState::Uninitialized), "uninitialized");
    EXPECT_EQ(to_string(SessionState::ShuttingDown), "shutting-down");
}
