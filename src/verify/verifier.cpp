#include "rpipe/verify/verifier.hpp"

#include "rpipe/chunk/naming.hpp"
#include "rpipe/events/events.hpp"

#include <spdlog/spdlog.h>

namespace rpipe::verify {

const char* verify_state_name(VerifyState state) noexcept {
    switch (state) {
        case VerifyState::Checking: return "checking";
        case VerifyState::ChunkMismatchFound: return "chunk-mismatch-found";
        case VerifyState::Repairing: return "repairing";
        case VerifyState::Verified: return "verified";
        case VerifyState::Failed: return "failed";
    }
    return "unknown";
}

IntegrityVerifier::IntegrityVerifier(const SessionConfig& config,
                                     store::ObjectStore& store,
                                     RepairCoordinator* repair,
                                     events::EventBus* bus)
    : config_(config),
      store_(store),
      repair_(repair),
      bus_(bus),
      session_(store.describe(), transfer::SessionMode::Verify) {}

Result<ledger::LedgerMap> IntegrityVerifier::check() {
    state_ = VerifyState::Checking;
    repaired_.clear();
    session_ = transfer::TransferSession(store_.describe(), transfer::SessionMode::Verify);
    if (auto res = session_.transition_to(transfer::SessionState::Verifying); res.is_error()) {
        return fail(res.error());
    }

    auto listed = store_.remote_checksums(config_.chunk_prefix + "*");
    if (listed.is_error()) {
        return fail(listed.error());
    }

    // Parity objects share the prefix; keep chunk objects only
    store::ChecksumInventory inventory;
    for (auto& [name, digest] : listed.value()) {
        if (chunk::is_chunk_name(name, config_.name_width, config_.chunk_prefix)) {
            inventory.emplace(name, digest);
        }
    }

    auto fetched = ledger::fetch_ledger(store_, config_);
    if (fetched.is_error()) {
        return fail(fetched.error());
    }
    auto ledger = std::move(fetched.value());

    for (const auto& [name, expected] : ledger::chunk_entries(ledger)) {
        const auto it = inventory.find(name);
        if (it == inventory.end()) {
            spdlog::error("Chunk missing: {}/{}", store_.describe(), name);
            return fail(Error(ErrorKind::MissingChunk, "listed in manifest but not stored", name));
        }
        if (it->second == expected) {
            continue;
        }

        state_ = VerifyState::ChunkMismatchFound;
        events::publish(bus_, events::ChunkMismatchEvent{name, expected, it->second, false});

        if (!repair_) {
            return fail(Error(ErrorKind::ChecksumMismatch,
                              "expected " + expected + ", store reports " + it->second, name));
        }

        state_ = VerifyState::Repairing;
        auto res = repair_->repair_chunk(name);
        if (res.is_error()) {
            return fail(res.error());
        }
        repaired_.push_back(name);
        state_ = VerifyState::Checking;
    }

    const auto verified = ledger::chunk_entries(ledger).size();
    session_.record_progress(verified, 0);
    if (auto res = session_.transition_to(transfer::SessionState::Complete); res.is_error()) {
        return fail(res.error());
    }

    state_ = VerifyState::Verified;
    spdlog::debug("verified {} chunks at {} ({} repaired)",
                  verified, store_.describe(), repaired_.size());
    return Ok(std::move(ledger));
}

Result<ledger::LedgerMap> IntegrityVerifier::fail(Error error) {
    state_ = VerifyState::Failed;
    spdlog::error("Verification failed: {}", error.to_string());
    if (auto res = session_.mark_failed(error.to_string()); res.is_error()) {
        spdlog::debug("{}", res.error().message);
    }
    return Err<ledger::LedgerMap>(std::move(error));
}

} // namespace rpipe::verify
