#include "rpipe/transfer/session.hpp"

#include <gtest/gtest.h>

using rpipe::transfer::SessionMode;
using rpipe::transfer::SessionState;
using rpipe::transfer::TransferSession;

TEST(TransferSessionTest, StartsIdle) {
    TransferSession session{"remote:bucket", SessionMode::Send};

    const auto& info = session.info();
    EXPECT_EQ(info.destination, "remote:bucket");
    EXPECT_EQ(info.mode, SessionMode::Send);
    EXPECT_EQ(info.state, SessionState::Idle);
    EXPECT_EQ(info.chunks, 0u);
}

TEST(TransferSessionTest, SendFollowsPipelineOrder) {
    TransferSession session{"remote:bucket", SessionMode::Send};

    EXPECT_TRUE(session.transition_to(SessionState::Sending).is_ok());
    session.record_progress(3, 10000000);
    EXPECT_TRUE(session.transition_to(SessionState::Draining).is_ok());
    EXPECT_TRUE(session.transition_to(SessionState::Publishing).is_ok());
    EXPECT_TRUE(session.transition_to(SessionState::Verifying).is_ok());
    EXPECT_TRUE(session.transition_to(SessionState::Complete).is_ok());

    EXPECT_EQ(session.info().chunks, 3u);
    EXPECT_EQ(session.info().bytes, 10000000u);

    auto illegal = session.transition_to(SessionState::Sending);
    ASSERT_TRUE(illegal.is_error());
    EXPECT_EQ(illegal.error().kind, rpipe::ErrorKind::InvalidState);
    EXPECT_EQ(rpipe::exit_code_for(illegal.error()), 1);
}

TEST(TransferSessionTest, SendCannotPublishBeforeDraining) {
    TransferSession session{"remote:bucket", SessionMode::Send};
    ASSERT_TRUE(session.transition_to(SessionState::Sending).is_ok());

    auto skipped = session.transition_to(SessionState::Publishing);
    ASSERT_TRUE(skipped.is_error());
    EXPECT_EQ(session.state(), SessionState::Sending);
}

TEST(TransferSessionTest, SkippedVerificationCompletesFromPublishing) {
    TransferSession session{"remote:bucket", SessionMode::Send};
    ASSERT_TRUE(session.transition_to(SessionState::Sending).is_ok());
    ASSERT_TRUE(session.transition_to(SessionState::Draining).is_ok());
    ASSERT_TRUE(session.transition_to(SessionState::Publishing).is_ok());
    EXPECT_TRUE(session.transition_to(SessionState::Complete).is_ok());
}

TEST(TransferSessionTest, ModesHaveTheirOwnTables) {
    TransferSession verify{"d", SessionMode::Verify};
    EXPECT_TRUE(verify.transition_to(SessionState::Sending).is_error());
    EXPECT_TRUE(verify.transition_to(SessionState::Verifying).is_ok());
    EXPECT_TRUE(verify.transition_to(SessionState::Complete).is_ok());

    TransferSession replay{"d", SessionMode::Replay};
    EXPECT_TRUE(replay.transition_to(SessionState::Replaying).is_ok());
    EXPECT_TRUE(replay.transition_to(SessionState::Verifying).is_error());
    EXPECT_TRUE(replay.transition_to(SessionState::Complete).is_ok());
}

TEST(TransferSessionTest, AllowsFailureFromAnyState) {
    TransferSession session{"remote:bucket", SessionMode::Send};
    ASSERT_TRUE(session.transition_to(SessionState::Sending).is_ok());

    auto failed = session.mark_failed("FatalTransmissionError [rp-aaaaab]: upload failed");
    ASSERT_TRUE(failed.is_ok());
    EXPECT_EQ(session.state(), SessionState::Failed);
    EXPECT_EQ(session.info().last_error, "FatalTransmissionError [rp-aaaaab]: upload failed");

    EXPECT_TRUE(session.transition_to(SessionState::Failed).is_ok());
    EXPECT_TRUE(session.transition_to(SessionState::Draining).is_error());
}
