#include "rpipe/verify/verifier.hpp"

#include "rpipe/events/components.hpp"
#include "rpipe/store/local_store.hpp"
#include "rpipe/transfer/sender.hpp"

#include "../support/test_helpers.hpp"

#include <gtest/gtest.h>

#include <sstream>

namespace fs = std::filesystem;
using rpipe::ErrorKind;
using rpipe::store::LocalStore;
using rpipe::testing::FakeErasureEngine;
using rpipe::testing::InstrumentedStore;
using rpipe::testing::TempDir;
using rpipe::testing::read_file;
using rpipe::testing::write_file;
using rpipe::transfer::SessionMode;
using rpipe::transfer::SessionState;
using rpipe::verify::IntegrityVerifier;
using rpipe::verify::RepairCoordinator;
using rpipe::verify::VerifyState;

namespace {

class IntegrityVerifierTest : public ::testing::Test {
protected:
    IntegrityVerifierTest()
        : local_(root_.path()),
          store_(local_, scratch_.path()),
          config_(rpipe::testing::make_local_config(root_.path(), scratch_.path(), 100, 50, 2)) {}

    void send(bool with_parity) {
        config_.create_parity = with_parity;
        config_.skip_checksum = true;
        RepairCoordinator repair(config_, store_, engine_);
        std::istringstream in(input_);
        rpipe::transfer::Sender sender(config_, store_, &repair);
        auto sent = sender.send(in);
        ASSERT_TRUE(sent.is_ok()) << sent.error().to_string();
        config_.skip_checksum = false;
        store_.checksum_calls = 0;
    }

    void corrupt(const std::string& name) {
        write_file(root_.path() / name, "bitrot");
    }

    bool repair_dirs_left() const {
        for (const auto& entry : fs::directory_iterator(scratch_.path())) {
            if (entry.path().filename().string().rfind("rpipe-repair-", 0) == 0) {
                return true;
            }
        }
        return false;
    }

    TempDir root_{"rpipe_verify_root"};
    TempDir scratch_{"rpipe_verify_scratch"};
    LocalStore local_;
    InstrumentedStore store_;
    rpipe::SessionConfig config_;
    FakeErasureEngine engine_;
    std::string input_ = rpipe::testing::pseudo_random_bytes(250, 3);
};

} // namespace

TEST_F(IntegrityVerifierTest, CleanUploadVerifies) {
    send(false);
    IntegrityVerifier verifier(config_, store_);
    auto ledger = verifier.check();
    ASSERT_TRUE(ledger.is_ok()) << ledger.error().to_string();
    EXPECT_EQ(verifier.state(), VerifyState::Verified);
    EXPECT_EQ(ledger.value().size(), 4u);
    EXPECT_TRUE(verifier.repaired().empty());
    EXPECT_EQ(verifier.session().mode(), SessionMode::Verify);
    EXPECT_EQ(verifier.session().state(), SessionState::Complete);
    EXPECT_EQ(verifier.session().info().chunks, 3u);
}

TEST_F(IntegrityVerifierTest, CorruptionWithoutCoordinatorIsChecksumMismatch) {
    send(false);
    corrupt("rp-aaaaab");

    rpipe::events::EventBus bus;
    rpipe::events::MetricsComponent metrics(bus);
    IntegrityVerifier verifier(config_, store_, nullptr, &bus);
    auto ledger = verifier.check();
    ASSERT_TRUE(ledger.is_error());
    EXPECT_EQ(ledger.error().kind, ErrorKind::ChecksumMismatch);
    EXPECT_EQ(ledger.error().chunk, "rp-aaaaab");
    EXPECT_EQ(verifier.state(), VerifyState::Failed);
    EXPECT_EQ(metrics.get_stats().mismatches.load(), 1u);
    EXPECT_EQ(verifier.session().state(), SessionState::Failed);
    EXPECT_NE(verifier.session().info().last_error.find("rp-aaaaab"), std::string::npos);
}

TEST_F(IntegrityVerifierTest, CorruptionWithoutParityIsNoParityAvailable) {
    send(false);
    corrupt("rp-aaaaaa");

    RepairCoordinator repair(config_, store_, engine_);
    IntegrityVerifier verifier(config_, store_, &repair);
    auto ledger = verifier.check();
    ASSERT_TRUE(ledger.is_error());
    EXPECT_EQ(ledger.error().kind, ErrorKind::NoParityAvailable);
    EXPECT_EQ(ledger.error().chunk, "rp-aaaaaa");
    EXPECT_EQ(engine_.repair_calls.load(), 0);
}

TEST_F(IntegrityVerifierTest, ParityPresentButRepairNotRequested) {
    send(true);
    corrupt("rp-aaaaac");

    RepairCoordinator repair(config_, store_, engine_);
    IntegrityVerifier verifier(config_, store_, &repair);
    auto ledger = verifier.check();
    ASSERT_TRUE(ledger.is_error());
    EXPECT_EQ(ledger.error().kind, ErrorKind::RepairAvailableButNotRequested);
    EXPECT_EQ(ledger.error().chunk, "rp-aaaaac");
    EXPECT_EQ(read_file(root_.path() / "rp-aaaaac"), "bitrot");
}

TEST_F(IntegrityVerifierTest, SuccessfulRepairPassesWithoutChecksumRefetch) {
    send(true);
    const auto original = read_file(root_.path() / "rp-aaaaab");
    corrupt("rp-aaaaab");
    config_.attempt_repair = true;

    rpipe::events::EventBus bus;
    rpipe::events::MetricsComponent metrics(bus);
    RepairCoordinator repair(config_, store_, engine_, &bus);
    IntegrityVerifier verifier(config_, store_, &repair, &bus);
    auto ledger = verifier.check();
    ASSERT_TRUE(ledger.is_ok()) << ledger.error().to_string();

    EXPECT_EQ(verifier.state(), VerifyState::Verified);
    EXPECT_EQ(verifier.repaired(), std::vector<std::string>{"rp-aaaaab"});
    EXPECT_EQ(engine_.repair_calls.load(), 1);
    EXPECT_EQ(store_.checksum_calls.load(), 1);
    EXPECT_EQ(read_file(root_.path() / "rp-aaaaab"), original);
    EXPECT_EQ(repair.repaired_count(), 1u);
    EXPECT_EQ(metrics.get_stats().repairs.load(), 1u);
    EXPECT_FALSE(repair_dirs_left());
}

TEST_F(IntegrityVerifierTest, EngineFailureIsRepairFailed) {
    send(true);
    corrupt("rp-aaaaaa");
    config_.attempt_repair = true;
    engine_.fail_repair = true;

    RepairCoordinator repair(config_, store_, engine_);
    IntegrityVerifier verifier(config_, store_, &repair);
    auto ledger = verifier.check();
    ASSERT_TRUE(ledger.is_error());
    EXPECT_EQ(ledger.error().kind, ErrorKind::RepairFailed);
    EXPECT_EQ(ledger.error().chunk, "rp-aaaaaa");
    EXPECT_EQ(read_file(root_.path() / "rp-aaaaaa"), "bitrot");
    EXPECT_FALSE(repair_dirs_left());
}

TEST_F(IntegrityVerifierTest, MissingChunkIsReported) {
    send(false);
    fs::remove(root_.path() / "rp-aaaaab");

    IntegrityVerifier verifier(config_, store_);
    auto ledger = verifier.check();
    ASSERT_TRUE(ledger.is_error());
    EXPECT_EQ(ledger.error().kind, ErrorKind::MissingChunk);
    EXPECT_EQ(ledger.error().chunk, "rp-aaaaab");
}

TEST_F(IntegrityVerifierTest, MissingManifestFails) {
    IntegrityVerifier verifier(config_, store_);
    auto ledger = verifier.check();
    ASSERT_TRUE(ledger.is_error());
    EXPECT_EQ(ledger.error().kind, ErrorKind::FatalTransmission);
    EXPECT_EQ(verifier.state(), VerifyState::Failed);
}

TEST_F(IntegrityVerifierTest, ExtraObjectsAreIgnored) {
    send(false);
    write_file(root_.path() / "rp-zzzzzz", "stray");

    IntegrityVerifier verifier(config_, store_);
    EXPECT_TRUE(verifier.check().is_ok());
}
