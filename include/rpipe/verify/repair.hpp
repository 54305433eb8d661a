#pragma once

/**
 * @file repair.hpp
 * @brief Parity creation on send and chunk reconstruction on verify
 *
 * WHY THIS FILE EXISTS:
 * The verifier only knows that a remote chunk's digest is wrong. Whether the
 * chunk can be rebuilt depends on a parity artifact uploaded next to it and
 * on whether the user asked for repairs. Both decisions live here so the
 * verifier and the sender never talk to an ErasureEngine directly.
 *
 * SCRATCH USAGE:
 * A repair works in its own directory "<scratch>/rpipe-repair-<chunk>",
 * removed on every exit path together with any side files the engine left.
 */

#include "rpipe/chunk/types.hpp"
#include "rpipe/core/config.hpp"
#include "rpipe/core/result.hpp"
#include "rpipe/events/event_bus.hpp"
#include "rpipe/parity/erasure_engine.hpp"
#include "rpipe/store/object_store.hpp"

#include <cstddef>
#include <string>

namespace rpipe::verify {

class RepairCoordinator {
public:
    RepairCoordinator(const SessionConfig& config,
                      store::ObjectStore& store,
                      parity::ErasureEngine& engine,
                      events::EventBus* bus = nullptr);

    /**
     * @brief Create the parity artifact for a freshly sealed chunk
     *
     * On success chunk.parity_path names the artifact; the scheduler uploads
     * it after the chunk and deletes it on retire.
     */
    Result<void> protect(chunk::Chunk& chunk);

    /**
     * @brief Try to restore a remote chunk whose digest disagrees with the
     *        manifest
     *
     * ERRORS:
     * - NoParityAvailable: no "<chunk>.par2" object at the destination
     * - RepairAvailableButNotRequested: parity exists, repairs not enabled
     * - RepairFailed: the engine could not rebuild the chunk
     * - FatalTransmission: fetching or re-uploading failed
     *
     * On success the rebuilt chunk has replaced the remote object.
     */
    Result<void> repair_chunk(const std::string& name);

    [[nodiscard]] std::size_t repaired_count() const noexcept { return repaired_; }

private:
    Result<void> rebuild(const std::string& name, const std::string& parity);

    const SessionConfig& config_;
    store::ObjectStore& store_;
    parity::ErasureEngine& engine_;
    events::EventBus* bus_;
    std::size_t repaired_ = 0;
};

} // namespace rpipe::verify
