#include "rpipe/replay/replay.hpp"

#include "rpipe/chunk/digest.hpp"
#include "rpipe/events/components.hpp"
#include "rpipe/store/local_store.hpp"
#include "rpipe/transfer/sender.hpp"

#include "../support/test_helpers.hpp"

#include <gtest/gtest.h>

#include <sstream>

using rpipe::ErrorKind;
using rpipe::chunk::md5_hex;
using rpipe::ledger::LedgerMap;
using rpipe::replay::ReplayEngine;
using rpipe::store::LocalStore;
using rpipe::testing::TempDir;
using rpipe::testing::write_file;
using rpipe::transfer::SessionMode;
using rpipe::transfer::SessionState;

namespace {

class ReplayEngineTest : public ::testing::Test {
protected:
    ReplayEngineTest()
        : store_(root_.path()),
          config_(rpipe::testing::make_local_config(root_.path(), scratch_.path(), 100, 32, 2)) {}

    void send(const std::string& input) {
        std::istringstream in(input);
        rpipe::transfer::Sender sender(config_, store_);
        auto sent = sender.send(in);
        ASSERT_TRUE(sent.is_ok()) << sent.error().to_string();
    }

    TempDir root_{"rpipe_replay_root"};
    TempDir scratch_{"rpipe_replay_scratch"};
    LocalStore store_;
    rpipe::SessionConfig config_;
};

} // namespace

TEST_F(ReplayEngineTest, ReproducesTheSentStream) {
    const auto input = rpipe::testing::pseudo_random_bytes(1234, 11);
    send(input);

    rpipe::events::EventBus bus;
    rpipe::events::MetricsComponent metrics(bus);
    ReplayEngine replay(config_, store_, nullptr, &bus);
    std::ostringstream out;
    auto report = replay.replay(out);
    ASSERT_TRUE(report.is_ok()) << report.error().to_string();

    EXPECT_TRUE(out.str() == input);
    EXPECT_EQ(report.value().bytes, 1234u);
    EXPECT_EQ(report.value().chunks, 13u);
    EXPECT_EQ(report.value().stream_digest, md5_hex(input));
    EXPECT_TRUE(report.value().total_matched);
    EXPECT_EQ(replay.session().mode(), SessionMode::Replay);
    EXPECT_EQ(replay.session().state(), SessionState::Complete);
    EXPECT_EQ(replay.session().info().chunks, 13u);
    EXPECT_EQ(replay.session().info().bytes, 1234u);
    EXPECT_EQ(metrics.get_stats().chunks_replayed.load(), 13u);
    EXPECT_EQ(metrics.get_stats().bytes_replayed.load(), 1234u);
}

TEST_F(ReplayEngineTest, VerificationFailureStopsBeforeOutput) {
    send(rpipe::testing::pseudo_random_bytes(300));
    write_file(root_.path() / "rp-aaaaab", "bitrot");

    ReplayEngine replay(config_, store_);
    std::ostringstream out;
    auto report = replay.replay(out);
    ASSERT_TRUE(report.is_error());
    EXPECT_EQ(report.error().kind, ErrorKind::ChecksumMismatch);
    EXPECT_TRUE(out.str().empty());
    EXPECT_EQ(replay.session().state(), SessionState::Failed);
    EXPECT_EQ(replay.session().info().chunks, 0u);
}

TEST_F(ReplayEngineTest, UncheckedReplayWarnsButEmitsCorruptBytes) {
    const auto input = rpipe::testing::pseudo_random_bytes(300);
    send(input);
    write_file(root_.path() / "rp-aaaaab", "bitrot");
    config_.skip_checksum = true;

    rpipe::events::EventBus bus;
    rpipe::events::MetricsComponent metrics(bus);
    ReplayEngine replay(config_, store_, nullptr, &bus);
    std::ostringstream out;
    auto report = replay.replay(out);
    ASSERT_TRUE(report.is_ok());

    EXPECT_EQ(out.str(), input.substr(0, 100) + "bitrot" + input.substr(200));
    EXPECT_EQ(report.value().mismatched_chunks, std::vector<std::string>{"rp-aaaaab"});
    EXPECT_FALSE(report.value().total_matched);
    EXPECT_EQ(metrics.get_stats().mismatches.load(), 1u);
    EXPECT_EQ(replay.session().state(), SessionState::Complete);
}

TEST_F(ReplayEngineTest, ChunksFollowNameOrderNotManifestOrder) {
    write_file(root_.path() / "rp-aaaaaa", "first-");
    write_file(root_.path() / "rp-aaaaab", "second");
    write_file(root_.path() / "rpipe.md5",
               md5_hex("second") + "  rp-aaaaab\n" +
               md5_hex("first-") + "  rp-aaaaaa\n" +
               md5_hex("first-second") + "  TOTAL\n");

    ReplayEngine replay(config_, store_);
    std::ostringstream out;
    auto report = replay.replay(out);
    ASSERT_TRUE(report.is_ok()) << report.error().to_string();
    EXPECT_EQ(out.str(), "first-second");
    EXPECT_TRUE(report.value().total_matched);
}

TEST_F(ReplayEngineTest, MissingTotalIsOnlyAWarning) {
    write_file(root_.path() / "rp-aaaaaa", "abc");
    LedgerMap ledger{{"rp-aaaaaa", md5_hex("abc")}};

    ReplayEngine replay(config_, store_);
    std::ostringstream out;
    auto report = replay.replay(ledger, out);
    ASSERT_TRUE(report.is_ok());
    EXPECT_EQ(out.str(), "abc");
    EXPECT_TRUE(report.value().mismatched_chunks.empty());
    EXPECT_FALSE(report.value().total_matched);
}

TEST_F(ReplayEngineTest, MissingObjectIsFatal) {
    LedgerMap ledger{{"rp-aaaaaa", md5_hex("abc")}, {"TOTAL", md5_hex("abc")}};

    ReplayEngine replay(config_, store_);
    std::ostringstream out;
    auto report = replay.replay(ledger, out);
    ASSERT_TRUE(report.is_error());
    EXPECT_EQ(report.error().kind, ErrorKind::FatalTransmission);
    EXPECT_EQ(report.error().chunk, "rp-aaaaaa");
    EXPECT_EQ(replay.session().state(), SessionState::Failed);

    // Each replay starts a fresh session
    write_file(root_.path() / "rp-aaaaaa", "abc");
    std::ostringstream again;
    auto retried = replay.replay(ledger, again);
    ASSERT_TRUE(retried.is_ok()) << retried.error().to_string();
    EXPECT_EQ(again.str(), "abc");
    EXPECT_EQ(replay.session().state(), SessionState::Complete);
}
