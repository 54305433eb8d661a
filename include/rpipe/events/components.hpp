/**
 * @file components.hpp
 * @brief Observers attached to the transfer event bus
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // Both now react to every chunk event.
 */

#pragma once

#include "rpipe/events/event_bus.hpp"
#include "rpipe/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace rpipe::events {

/**
 * @brief Logs every transfer event using spdlog
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<ChunkSealedEvent>([](const ChunkSealedEvent& e) {
            spdlog::info("Sending chunk {} [{} bytes so far]", e.index, e.stream_bytes);
            spdlog::debug("[ChunkSealed] name={} size={} md5={}", e.name, e.size, e.digest);
        });

        bus_.subscribe<ChunkUploadStartedEvent>([](const ChunkUploadStartedEvent& e) {
            spdlog::debug("[UploadStarted] name={} parity={}", e.name, e.with_parity);
        });

        bus_.subscribe<ChunkRetiredEvent>([](const ChunkRetiredEvent& e) {
            spdlog::debug("[ChunkRetired] name={} bytes={} duration={}ms",
                          e.name, e.size, e.upload_time.count());
        });

        bus_.subscribe<ManifestPublishedEvent>([](const ManifestPublishedEvent& e) {
            spdlog::debug("[ManifestPublished] {}/{} chunks={} md5={}",
                          e.destination, e.manifest_name, e.chunk_count, e.stream_digest);
        });

        bus_.subscribe<ChunkMismatchEvent>([](const ChunkMismatchEvent& e) {
            spdlog::warn("{} != {} [{}]", e.expected_digest, e.actual_digest, e.name);
        });

        bus_.subscribe<ChunkRepairedEvent>([](const ChunkRepairedEvent& e) {
            spdlog::info("Repaired {} from {}", e.name, e.parity_name);
        });

        bus_.subscribe<ChunkReplayedEvent>([](const ChunkReplayedEvent& e) {
            spdlog::debug("[ChunkReplayed] {}/{} name={} bytes={}",
                          e.position, e.chunk_count, e.name, e.size);
        });
    }

private:
    EventBus& bus_;
};

/**
 * @brief Counts chunk traffic and tracks peak scratch usage
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * metrics.get_stats().peak_live_chunks.load();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> chunks_sealed{0};
        std::atomic<uint64_t> bytes_sealed{0};
        std::atomic<uint64_t> chunks_uploaded{0};
        std::atomic<uint64_t> bytes_uploaded{0};
        std::atomic<uint64_t> chunks_replayed{0};
        std::atomic<uint64_t> bytes_replayed{0};
        std::atomic<uint64_t> mismatches{0};
        std::atomic<uint64_t> repairs{0};
        std::atomic<uint64_t> live_chunks{0};       ///< Sealed but not yet retired
        std::atomic<uint64_t> peak_live_chunks{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<ChunkSealedEvent>([this](const ChunkSealedEvent& e) {
            stats_.chunks_sealed++;
            stats_.bytes_sealed += e.size;
            const auto live = ++stats_.live_chunks;
            auto peak = stats_.peak_live_chunks.load();
            while (live > peak && !stats_.peak_live_chunks.compare_exchange_weak(peak, live)) {
            }
        });

        bus_.subscribe<ChunkRetiredEvent>([this](const ChunkRetiredEvent& e) {
            stats_.chunks_uploaded++;
            stats_.bytes_uploaded += e.size;
            stats_.live_chunks--;
        });

        bus_.subscribe<ChunkReplayedEvent>([this](const ChunkReplayedEvent& e) {
            stats_.chunks_replayed++;
            stats_.bytes_replayed += e.size;
        });

        bus_.subscribe<ChunkMismatchEvent>([this](const ChunkMismatchEvent&) {
            stats_.mismatches++;
        });

        bus_.subscribe<ChunkRepairedEvent>([this](const ChunkRepairedEvent&) {
            stats_.repairs++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::debug("Transfer statistics:");
        spdlog::debug("  Chunks sealed:    {} ({} bytes)", stats_.chunks_sealed.load(), stats_.bytes_sealed.load());
        spdlog::debug("  Chunks uploaded:  {} ({} bytes)", stats_.chunks_uploaded.load(), stats_.bytes_uploaded.load());
        spdlog::debug("  Chunks replayed:  {} ({} bytes)", stats_.chunks_replayed.load(), stats_.bytes_replayed.load());
        spdlog::debug("  Peak local chunks:{}", stats_.peak_live_chunks.load());
        spdlog::debug("  Mismatches:       {}", stats_.mismatches.load());
        spdlog::debug("  Repairs:          {}", stats_.repairs.load());
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace rpipe::events
