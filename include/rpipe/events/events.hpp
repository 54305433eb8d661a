/**
 * @file events.hpp
 * @brief Transfer event definitions
 *
 * NAMING CONVENTION:
 * Events are past-tense: ChunkSealedEvent, ChunkRetiredEvent
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace rpipe::events {

/**
 * @brief A chunk's local file is complete and its digest is final
 *
 * WHO EMITS: Sender, after the producer fills a non-empty chunk
 * WHO SUBSCRIBES: Logger, Metrics (live local file count)
 */
struct ChunkSealedEvent {
    std::uint64_t index = 0;
    std::string name;
    std::uint64_t size = 0;
    std::string digest;
    std::uint64_t stream_bytes = 0;  ///< Bytes read from the input so far
};

/**
 * @brief An upload task was started for a chunk
 */
struct ChunkUploadStartedEvent {
    std::uint64_t index = 0;
    std::string name;
    bool with_parity = false;
};

/**
 * @brief A chunk's upload was confirmed and its local copy removed
 *
 * WHO EMITS: UploadScheduler
 */
struct ChunkRetiredEvent {
    std::uint64_t index = 0;
    std::string name;
    std::uint64_t size = 0;
    std::chrono::milliseconds upload_time{0};
};

/**
 * @brief The manifest object was written to the destination
 */
struct ManifestPublishedEvent {
    std::string destination;
    std::string manifest_name;
    std::size_t chunk_count = 0;
    std::string stream_digest;
};

/**
 * @brief A remote chunk's digest differs from the ledger
 *
 * WHO EMITS: IntegrityVerifier (remote inventory), ReplayEngine (replayed bytes)
 */
struct ChunkMismatchEvent {
    std::string name;
    std::string expected_digest;
    std::string actual_digest;
    bool during_replay = false;
};

/**
 * @brief A corrupted chunk was rebuilt from parity and uploaded again
 */
struct ChunkRepairedEvent {
    std::string name;
    std::string parity_name;
};

/**
 * @brief One chunk was streamed to the replay output
 */
struct ChunkReplayedEvent {
    std::string name;
    std::size_t position = 0;        ///< 1-based position in replay order
    std::size_t chunk_count = 0;
    std::uint64_t size = 0;
    bool digest_matched = true;
};

} // namespace rpipe::events
