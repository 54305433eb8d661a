#pragma once

#include "rpipe/chunk/digest.hpp"
#include "rpipe/chunk/types.hpp"
#include "rpipe/core/config.hpp"
#include "rpipe/core/result.hpp"

#include <istream>
#include <vector>

namespace rpipe::chunk {

/**
 * @brief Cuts an input stream into sealed chunk files
 *
 * Each call to fill() writes the next slice of the input into the chunk's
 * local file, block by block, feeding every block to the chunk's digest and
 * to the whole-stream digest from the same read. The file is fsync'ed before
 * the chunk is marked Sealed.
 *
 * The sequence is lazy, finite and cannot be restarted: once the input is
 * exhausted every further fill() returns 0.
 */
class ChunkProducer {
public:
    ChunkProducer(std::istream& input, const SessionConfig& config, DigestAccumulator& stream_digest);

    /**
     * @brief Fill @p chunk from the input
     *
     * RETURNS: bytes written. Less than the chunk size only for the final
     * chunk; 0 means the input was already exhausted and the chunk must be
     * discarded. On a non-empty fill the chunk is Sealed with its digest set.
     */
    Result<std::uint64_t> fill(Chunk& chunk);

    [[nodiscard]] bool exhausted() const noexcept { return exhausted_; }

    /**
     * @brief Look ahead one byte without consuming it
     *
     * Marks the producer exhausted when the input has nothing left, so the
     * caller can stop before naming a chunk that would stay empty. A failing
     * stream is not treated as the end; the next fill() reports it.
     */
    bool at_end();

    [[nodiscard]] std::uint64_t total_bytes() const noexcept { return total_bytes_; }

private:
    std::istream& input_;
    const SessionConfig& config_;
    DigestAccumulator& stream_digest_;
    std::vector<char> buffer_;
    std::uint64_t total_bytes_ = 0;
    bool exhausted_ = false;
};

} // namespace rpipe::chunk
