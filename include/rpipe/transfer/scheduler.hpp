#pragma once

/**
 * @file scheduler.hpp
 * @brief Sliding-window upload pipeline
 *
 * The producer seals chunk n while up to W earlier chunks are still being
 * transmitted. Before chunk n starts uploading, chunk n - W must be finished
 * and its local file deleted, so scratch never holds more than W + 1 chunk
 * files. Chunk 0 is waited for immediately after it starts: the destination
 * prefix has to exist before concurrent uploads target it.
 *
 * Uploads are not retried here; store adapters own retries. The first
 * terminal failure is returned to the caller, which aborts the session.
 *
 * OWNERSHIP:
 * The scheduler owns every Chunk record (an arena indexed by sequence
 * number), every upload task, and is the only component that deletes chunk
 * files from scratch.
 */

#include "rpipe/chunk/types.hpp"
#include "rpipe/core/config.hpp"
#include "rpipe/core/result.hpp"
#include "rpipe/events/event_bus.hpp"
#include "rpipe/store/object_store.hpp"

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <string>
#include <utility>
#include <vector>

namespace rpipe::transfer {

class UploadScheduler {
public:
    UploadScheduler(const SessionConfig& config, store::ObjectStore& store, events::EventBus* bus = nullptr);

    /**
     * @brief Aborts (joins tasks, removes local files) if not fully drained
     */
    ~UploadScheduler();

    UploadScheduler(const UploadScheduler&) = delete;
    UploadScheduler& operator=(const UploadScheduler&) = delete;

    /**
     * @brief Create the record for the next chunk in sequence
     *
     * The returned chunk is in state Sealing with its name and scratch path
     * assigned. Fails with NamingOverflow once the name space is used up.
     */
    Result<chunk::Chunk*> open_chunk();

    /**
     * @brief Drop the most recently opened chunk because it came out empty
     */
    void discard(chunk::Chunk& chunk);

    /**
     * @brief Block until chunk (index - W) is uploaded, then retire it
     */
    Result<void> make_room(std::uint64_t index);

    /**
     * @brief Start the upload task for a Sealed chunk
     *
     * For chunk 0 this also waits for the upload to finish.
     */
    Result<void> start_upload(chunk::Chunk& chunk);

    /**
     * @brief Wait for every outstanding upload and retire all chunks
     */
    Result<void> drain();

    /**
     * @brief Stop the pipeline after a fatal error
     *
     * Tasks that have not started yet are cancelled, running ones are joined,
     * and every local chunk and parity file still present is removed.
     */
    void abort();

    /**
     * @brief (name, digest) of retired chunks in sequence order
     */
    [[nodiscard]] std::vector<std::pair<std::string, std::string>> retired_entries() const;

    [[nodiscard]] std::size_t window() const noexcept { return window_; }
    [[nodiscard]] std::size_t in_flight() const noexcept;
    [[nodiscard]] std::size_t chunk_count() const noexcept { return chunks_.size(); }
    [[nodiscard]] const chunk::Chunk& chunk_at(std::uint64_t index) const { return chunks_.at(index); }

private:
    Result<void> retire(std::uint64_t index);
    void remove_local_files(chunk::Chunk& chunk);

    const SessionConfig& config_;
    store::ObjectStore& store_;
    events::EventBus* bus_;
    std::size_t window_;

    std::deque<chunk::Chunk> chunks_;
    std::vector<std::chrono::steady_clock::time_point> started_at_;
    std::atomic<bool> cancelled_{false};
    bool aborted_ = false;

    // Declared last: destroyed (and joined) before the records tasks refer to
    boost::asio::thread_pool pool_;
};

} // namespace rpipe::transfer
