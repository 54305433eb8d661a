#pragma once

#include "rpipe/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <future>
#include <optional>
#include <string>

namespace rpipe::chunk {

/**
 * @brief Lifecycle of one chunk during a send
 *
 * Sealing   local file open, producer still writing
 * Sealed    byte count reached or input exhausted, digest final
 * Uploading upload task started
 * Retired   upload confirmed and local copy deleted
 */
enum class ChunkState {
    Sealing,
    Sealed,
    Uploading,
    Retired
};

const char* chunk_state_name(ChunkState state) noexcept;

/**
 * @brief One contiguous slice of the input stream
 */
struct Chunk {
    std::uint64_t index = 0;
    std::string name;                               ///< Stable remote object name
    std::filesystem::path local_path;               ///< Scratch file holding the bytes
    std::uint64_t size = 0;
    std::string digest;                             ///< Hex MD5, set when sealed
    ChunkState state = ChunkState::Sealing;
    std::optional<std::filesystem::path> parity_path;
    std::future<Result<void>> upload;               ///< Valid while Uploading
};

} // namespace rpipe::chunk
