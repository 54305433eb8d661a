#include "rpipe/replay/replay.hpp"

#include "rpipe/chunk/digest.hpp"
#include "rpipe/chunk/naming.hpp"
#include "rpipe/events/events.hpp"
#include "rpipe/verify/verifier.hpp"

#include <spdlog/spdlog.h>

namespace rpipe::replay {

ReplayEngine::ReplayEngine(const SessionConfig& config,
                           store::ObjectStore& store,
                           verify::RepairCoordinator* repair,
                           events::EventBus* bus)
    : config_(config),
      store_(store),
      repair_(repair),
      bus_(bus),
      session_(store.describe(), transfer::SessionMode::Replay) {}

Result<ReplayReport> ReplayEngine::replay(std::ostream& out) {
    session_ = transfer::TransferSession(store_.describe(), transfer::SessionMode::Replay);

    if (!config_.skip_checksum) {
        if (auto res = session_.transition_to(transfer::SessionState::Verifying); res.is_error()) {
            return fail(res.error());
        }
    }
    auto manifest = config_.skip_checksum
        ? ledger::fetch_ledger(store_, config_)
        : verify::IntegrityVerifier(config_, store_, repair_, bus_).check();
    if (manifest.is_error()) {
        return fail(manifest.error());
    }
    return stream(manifest.value(), out);
}

Result<ReplayReport> ReplayEngine::replay(const ledger::LedgerMap& ledger, std::ostream& out) {
    session_ = transfer::TransferSession(store_.describe(), transfer::SessionMode::Replay);
    return stream(ledger, out);
}

Result<ReplayReport> ReplayEngine::stream(const ledger::LedgerMap& ledger, std::ostream& out) {
    if (auto res = session_.transition_to(transfer::SessionState::Replaying); res.is_error()) {
        return fail(res.error());
    }

    ReplayReport report;
    chunk::DigestAccumulator stream_digest;
    const auto entries = ledger::chunk_entries(ledger);

    for (std::size_t i = 0; i < entries.size(); ++i) {
        const std::string& name = entries[i].first;
        const std::string& expected = entries[i].second;
        spdlog::info("Retrieving {}/{} [{} bytes total]", i + 1, entries.size(), report.bytes);

        chunk::DigestAccumulator chunk_digest;
        auto res = store_.get(name, [&](const char* data, std::size_t size) -> Result<void> {
            chunk_digest.update(data, size);
            stream_digest.update(data, size);
            out.write(data, static_cast<std::streamsize>(size));
            if (!out) {
                return Err<void>(ErrorKind::Io, "write to output failed", name);
            }
            return Ok();
        }, config_.block_size);
        if (res.is_error()) {
            spdlog::error("Replay of {} failed: {}", name, res.error().message);
            return fail(res.error());
        }

        const auto actual = chunk_digest.hex_digest();
        const bool matched = actual == expected;
        if (!matched) {
            report.mismatched_chunks.push_back(name);
            spdlog::warn("Checksum mismatch on {}", name);
            events::publish(bus_, events::ChunkMismatchEvent{name, expected, actual, true});
        }

        report.bytes += chunk_digest.bytes();
        report.chunks++;
        session_.record_progress(report.chunks, report.bytes);
        events::publish(bus_, events::ChunkReplayedEvent{name, i + 1, entries.size(),
                                                         chunk_digest.bytes(), matched});
    }

    out.flush();
    if (!out) {
        return fail(Error(ErrorKind::Io, "flush of output failed"));
    }

    report.stream_digest = stream_digest.hex_digest();
    const auto total = ledger.find(std::string(chunk::kTotalKey));
    if (total == ledger.end()) {
        report.total_matched = false;
        spdlog::warn("Manifest has no {} entry; stream checksum {} not confirmed",
                     chunk::kTotalKey, report.stream_digest);
    } else if (total->second != report.stream_digest) {
        report.total_matched = false;
        spdlog::warn("Stream checksum mismatch: {} != {} [{}]",
                     total->second, report.stream_digest, chunk::kTotalKey);
    }

    if (auto res = session_.transition_to(transfer::SessionState::Complete); res.is_error()) {
        return fail(res.error());
    }
    spdlog::info("Retrieved {} bytes total", report.bytes);
    return Ok(std::move(report));
}

Result<ReplayReport> ReplayEngine::fail(Error error) {
    if (auto res = session_.mark_failed(error.to_string()); res.is_error()) {
        spdlog::debug("{}", res.error().message);
    }
    return Err<ReplayReport>(std::move(error));
}

} // namespace rpipe::replay
