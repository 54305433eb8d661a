#include "rpipe/transfer/sender.hpp"

#include "rpipe/chunk/digest.hpp"
#include "rpipe/chunk/producer.hpp"
#include "rpipe/events/events.hpp"
#include "rpipe/ledger/ledger.hpp"
#include "rpipe/transfer/scheduler.hpp"
#include "rpipe/verify/verifier.hpp"

#include <spdlog/spdlog.h>

namespace rpipe::transfer {

Sender::Sender(const SessionConfig& config,
               store::ObjectStore& store,
               verify::RepairCoordinator* repair,
               events::EventBus* bus)
    : config_(config),
      store_(store),
      repair_(repair),
      bus_(bus),
      session_(store.describe(), SessionMode::Send) {}

Result<SendReport> Sender::send(std::istream& input) {
    if (config_.create_parity && !repair_) {
        return fail(Error(ErrorKind::InvalidConfig, "parity requested but no erasure engine configured"));
    }
    if (auto res = session_.transition_to(SessionState::Sending); res.is_error()) {
        return fail(res.error());
    }

    if (auto res = store_.make_container(); res.is_error()) {
        return fail(Error(ErrorKind::FatalTransmission,
                          "cannot create destination: " + res.error().message));
    }

    chunk::DigestAccumulator stream_digest;
    chunk::ChunkProducer producer(input, config_, stream_digest);
    UploadScheduler scheduler(config_, store_, bus_);

    auto abort_with = [&](const Error& error) {
        scheduler.abort();
        return fail(error);
    };

    // Names are only assigned once input is known to remain, so a stream that
    // exactly fills the name space does not overflow on its empty tail
    while (!producer.at_end()) {
        auto opened = scheduler.open_chunk();
        if (opened.is_error()) {
            return abort_with(opened.error());
        }
        chunk::Chunk& current = *opened.value();

        auto filled = producer.fill(current);
        if (filled.is_error()) {
            return abort_with(filled.error());
        }
        if (filled.value() == 0) {
            scheduler.discard(current);
            break;
        }

        events::publish(bus_, events::ChunkSealedEvent{current.index, current.name, current.size,
                                                       current.digest, producer.total_bytes()});
        session_.record_progress(current.index + 1, producer.total_bytes());

        if (auto res = scheduler.make_room(current.index); res.is_error()) {
            return abort_with(res.error());
        }
        if (config_.create_parity) {
            if (auto res = repair_->protect(current); res.is_error()) {
                return abort_with(res.error());
            }
        }
        if (auto res = scheduler.start_upload(current); res.is_error()) {
            return abort_with(res.error());
        }
    }

    if (auto res = session_.transition_to(SessionState::Draining); res.is_error()) {
        return abort_with(res.error());
    }
    if (auto res = scheduler.drain(); res.is_error()) {
        return abort_with(res.error());
    }

    SendReport report;
    report.chunks = scheduler.chunk_count();
    report.bytes = producer.total_bytes();
    report.stream_digest = stream_digest.hex_digest();

    if (auto res = session_.transition_to(SessionState::Publishing); res.is_error()) {
        return fail(res.error());
    }
    spdlog::info("Sending complete. Depositing metadata.");

    ledger::LedgerWriter ledger;
    for (auto& [name, digest] : scheduler.retired_entries()) {
        ledger.add_chunk(std::move(name), std::move(digest));
    }
    ledger.set_total(report.stream_digest);
    if (auto res = ledger.publish(store_, config_); res.is_error()) {
        return fail(res.error());
    }
    events::publish(bus_, events::ManifestPublishedEvent{store_.describe(), config_.manifest_name,
                                                         ledger.chunk_count(), report.stream_digest});

    if (config_.skip_checksum) {
        spdlog::info("Complete. Skipped checksum match.");
    } else {
        if (auto res = session_.transition_to(SessionState::Verifying); res.is_error()) {
            return fail(res.error());
        }
        spdlog::info("Final checksum checks.");
        verify::IntegrityVerifier verifier(config_, store_, repair_, bus_);
        auto checked = verifier.check();
        if (checked.is_error()) {
            return fail(checked.error());
        }
        report.verified = true;
        spdlog::info("Success. Checksums match.");
    }

    if (auto res = session_.transition_to(SessionState::Complete); res.is_error()) {
        return fail(res.error());
    }
    spdlog::info("Wrote {} bytes into {}", report.bytes, store_.describe());
    spdlog::info("Full stream checksum: {}", report.stream_digest);
    return Ok(std::move(report));
}

Result<SendReport> Sender::fail(Error error) {
    spdlog::error("Send failed: {}", error.to_string());
    if (auto res = session_.mark_failed(error.to_string()); res.is_error()) {
        spdlog::debug("{}", res.error().message);
    }
    return Err<SendReport>(std::move(error));
}

} // namespace rpipe::transfer
