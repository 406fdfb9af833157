#include "relay_types.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace websockify;

TEST(RelayTypes, OrderlyEndsAreExpected) {
    EXPECT_TRUE(is_expected_end({}));
    EXPECT_TRUE(is_expected_end(websocket::error::closed));
    EXPECT_TRUE(is_expected_end(net::error::eof));
    EXPECT_TRUE(is_expected_end(net::error::operation_aborted));
    EXPECT_TRUE(is_expected_end(net::error::bad_descriptor));
}

TEST(RelayTypes, TransportFaultsAreNotExpected) {
    EXPECT_FALSE(is_expected_end(net::error::connection_reset));
    EXPECT_FALSE(is_expected_end(net::error::broken_pipe));
    EXPECT_FALSE(is_expected_end(websocket::error::bad_opcode));
}

TEST(RelayTypes, CauseNamesMatchLogVocabulary) {
    EXPECT_EQ(std::string(to_string(TerminationCause::peer_closed)), "peer-closed");
    EXPECT_EQ(std::string(to_string(TerminationCause::local_error)), "local-error");
    EXPECT_EQ(std::string(to_string(TerminationCause::remote_error)), "remote-error");
    EXPECT_EQ(std::string(to_string(TerminationCause::normal_eof)), "normal-eof");
    EXPECT_EQ(std::string(to_string(SessionState::draining)), "draining");
    EXPECT_EQ(std::string(to_string(Direction::ws_to_tcp)), "ws->tcp");
    EXPECT_EQ(std::string(to_string(PumpState::cancelled)), "cancelled");
}
