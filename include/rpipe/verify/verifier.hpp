#pragma once

#include "rpipe/core/config.hpp"
#include "rpipe/core/result.hpp"
#include "rpipe/events/event_bus.hpp"
#include "rpipe/ledger/ledger.hpp"
#include "rpipe/store/object_store.hpp"
#include "rpipe/transfer/session.hpp"
#include "rpipe/verify/repair.hpp"

#include <string>
#include <vector>

namespace rpipe::verify {

enum class VerifyState {
    Checking,
    ChunkMismatchFound,
    Repairing,
    Verified,
    Failed
};

const char* verify_state_name(VerifyState state) noexcept;

/**
 * @brief Cross-checks the store's own checksums against the manifest
 *
 * Every chunk entry must be present at the destination with the digest the
 * manifest records. A mismatching chunk is handed to the repair coordinator
 * when one is attached; without one the check fails with ChecksumMismatch.
 * The TOTAL entry is not checked here; replay checks it against the
 * reassembled stream.
 *
 * Each check() runs its own Verify-mode session:
 * Idle -> Verifying -> Complete, or Failed.
 */
class IntegrityVerifier {
public:
    IntegrityVerifier(const SessionConfig& config,
                      store::ObjectStore& store,
                      RepairCoordinator* repair = nullptr,
                      events::EventBus* bus = nullptr);

    /**
     * @brief Run the check
     *
     * RETURNS: the parsed manifest when every entry matched or was repaired
     */
    Result<ledger::LedgerMap> check();

    [[nodiscard]] VerifyState state() const noexcept { return state_; }

    [[nodiscard]] const transfer::TransferSession& session() const noexcept { return session_; }

    /// Chunks rebuilt from parity during the last check()
    [[nodiscard]] const std::vector<std::string>& repaired() const noexcept { return repaired_; }

private:
    Result<ledger::LedgerMap> fail(Error error);

    const SessionConfig& config_;
    store::ObjectStore& store_;
    RepairCoordinator* repair_;
    events::EventBus* bus_;
    transfer::TransferSession session_;
    VerifyState state_ = VerifyState::Checking;
    std::vector<std::string> repaired_;
};

} // namespace rpipe::verify
