#include <gtest/gtest.h>
#include "peerdrop/transfer/transfer_types.hpp"
#include <vector>

using namespace peerdrop::transfer;

namespace {
    const std::vector<SessionState> ALL_STATES = {
        SessionState::NEGOTIATING,
        SessionState::CHANNEL_OPEN,
        SessionState::TRANSFERRING,
        SessionState::COMPLETE,
        SessionState::CLOSED,
        SessionState::FAILED
    };
}

TEST(TransferTypesTest, HappyPathIsLegal) {
    EXPECT_TRUE(is_legal_transition(SessionState::NEGOTIATING, SessionState::CHANNEL_OPEN));
    EXPECT_TRUE(is_legal_transition(SessionState::CHANNEL_OPEN, SessionState::TRANSFERRING));
    EXPECT_TRUE(is_legal_transition(SessionState::TRANSFERRING, SessionState::COMPLETE));
    EXPECT_TRUE(is_legal_transition(SessionState::COMPLETE, SessionState::CLOSED));
}

TEST(TransferTypesTest, TerminalStatesHaveNoExits) {
    for (auto from : {SessionState::CLOSED, SessionState::FAILED}) {
        EXPECT_TRUE(is_terminal(from));
        for (auto to : ALL_STATES) {
            EXPECT_FALSE(is_legal_transition(from, to))
                << to_string(from) << " -> " << to_string(to);
        }
    }
}

TEST(TransferTypesTest, FailedReachableFromEveryActiveState) {
    for (auto from : {SessionState::NEGOTIATING, SessionState::CHANNEL_OPEN, SessionState::TRANSFERRING}) {
        EXPECT_TRUE(is_legal_transition(from, SessionState::FAILED)) << to_string(from);
        EXPECT_TRUE(is_legal_transition(from, SessionState::CLOSED)) << to_string(from);
    }
    EXPECT_FALSE(is_legal_transition(SessionState::COMPLETE, SessionState::FAILED));
}

TEST(TransferTypesTest, NoSkippingOrGoingBack) {
    EXPECT_FALSE(is_legal_transition(SessionState::NEGOTIATING, SessionState::TRANSFERRING));
    EXPECT_FALSE(is_legal_transition(SessionState::NEGOTIATING, SessionState::COMPLETE));
    EXPECT_FALSE(is_legal_transition(SessionState::CHANNEL_OPEN, SessionState::COMPLETE));
    EXPECT_FALSE(is_legal_transition(SessionState::TRANSFERRING, SessionState::CHANNEL_OPEN));
    EXPECT_FALSE(is_legal_transition(SessionState::COMPLETE, SessionState::TRANSFERRING));
    for (auto from : ALL_STATES) {
        EXPECT_FALSE(is_legal_transition(from, SessionState::NEGOTIATING));
    }
}

TEST(TransferTypesTest, TerminalErrors) {
    EXPECT_TRUE(is_terminal_error(TransferError::NEGOTIATION_FAILURE));
    EXPECT_TRUE(is_terminal_error(TransferError::CHANNEL_ERROR));
    EXPECT_TRUE(is_terminal_error(TransferError::FILE_TOO_LARGE));
    EXPECT_TRUE(is_terminal_error(TransferError::TIMEOUT));
    
    EXPECT_FALSE(is_terminal_error(TransferError::MALFORMED_FRAME));
    EXPECT_FALSE(is_terminal_error(TransferError::UNKNOWN_PEER));
    EXPECT_FALSE(is_terminal_error(TransferError::INVALID_STATE));
}

TEST(TransferTypesTest, TransferResult) {
    TransferResult ok;
    EXPECT_TRUE(ok.success());
    EXPECT_TRUE(ok);
    
    TransferResult failed(TransferError::CHANNEL_ERROR, "boom");
    EXPECT_FALSE(failed);
    EXPECT_EQ(failed.message, "boom");
}

TEST(TransferTypesTest, Names) {
    EXPECT_STREQ(to_string(Role::SENDER), "sender");
    EXPECT_STREQ(to_string(Role::RECEIVER), "receiver");
    EXPECT_STREQ(to_string(SessionState::CHANNEL_OPEN), "channel-open");
    EXPECT_STREQ(to_string(TransferError::MALFORMED_FRAME), "malformed frame");
}
