#pragma once

/**
 * @file replay.hpp
 * @brief Reassembles the stored stream onto an output sink
 *
 * Chunks are fetched in ascending name order, which is send order. Every
 * byte is written to the sink as soon as it arrives; digest checks happen
 * alongside and only warn. A damaged chunk still produces output so the
 * caller can decide what to do with it.
 */

#include "rpipe/core/config.hpp"
#include "rpipe/core/result.hpp"
#include "rpipe/events/event_bus.hpp"
#include "rpipe/ledger/ledger.hpp"
#include "rpipe/store/object_store.hpp"
#include "rpipe/transfer/session.hpp"
#include "rpipe/verify/repair.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace rpipe::replay {

struct ReplayReport {
    std::uint64_t bytes = 0;
    std::size_t chunks = 0;
    std::vector<std::string> mismatched_chunks;
    bool total_matched = true;
    std::string stream_digest;
};

class ReplayEngine {
public:
    ReplayEngine(const SessionConfig& config,
                 store::ObjectStore& store,
                 verify::RepairCoordinator* repair = nullptr,
                 events::EventBus* bus = nullptr);

    /**
     * @brief Obtain the manifest and replay the stream into @p out
     *
     * The manifest is verified first (repairing when configured) unless
     * config.skip_checksum is set, in which case it is used as stored.
     */
    Result<ReplayReport> replay(std::ostream& out);

    /**
     * @brief Replay the chunks named by an already obtained manifest
     */
    Result<ReplayReport> replay(const ledger::LedgerMap& ledger, std::ostream& out);

    /// Idle [-> Verifying] -> Replaying -> Complete, or Failed, for the last replay
    [[nodiscard]] const transfer::TransferSession& session() const noexcept { return session_; }

private:
    Result<ReplayReport> stream(const ledger::LedgerMap& ledger, std::ostream& out);
    Result<ReplayReport> fail(Error error);

    const SessionConfig& config_;
    store::ObjectStore& store_;
    verify::RepairCoordinator* repair_;
    events::EventBus* bus_;
    transfer::TransferSession session_;
};

} // namespace rpipe::replay
