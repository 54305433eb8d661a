#pragma once

#include "rpipe/core/config.hpp"
#include "rpipe/core/result.hpp"
#include "rpipe/events/event_bus.hpp"
#include "rpipe/store/object_store.hpp"
#include "rpipe/transfer/session.hpp"
#include "rpipe/verify/repair.hpp"

#include <cstdint>
#include <istream>
#include <string>

namespace rpipe::transfer {

struct SendReport {
    std::uint64_t chunks = 0;
    std::uint64_t bytes = 0;
    std::string stream_digest;
    bool verified = false;       ///< False when checksum verification was skipped
};

/**
 * @brief Drives one send: chunk, upload, publish the manifest, verify
 *
 * The manifest is published only after every chunk upload is confirmed. Any
 * failure before that aborts the pipeline, removes local temporaries and
 * leaves the destination without a new manifest.
 */
class Sender {
public:
    /**
     * @param repair required when config.create_parity is set; also used to
     *        repair chunks found corrupted by the final verification
     */
    Sender(const SessionConfig& config,
           store::ObjectStore& store,
           verify::RepairCoordinator* repair = nullptr,
           events::EventBus* bus = nullptr);

    Result<SendReport> send(std::istream& input);

    [[nodiscard]] const TransferSession& session() const noexcept { return session_; }

private:
    Result<SendReport> fail(Error error);

    const SessionConfig& config_;
    store::ObjectStore& store_;
    verify::RepairCoordinator* repair_;
    events::EventBus* bus_;
    TransferSession session_;
};

} // namespace rpipe::transfer
