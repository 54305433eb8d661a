#pragma once

#include "rpipe/core/result.hpp"

#include <filesystem>

namespace rpipe::parity {

/**
 * @brief Creates and applies per-chunk erasure-coded parity
 *
 * Only the RepairCoordinator talks to an engine.
 */
class ErasureEngine {
public:
    virtual ~ErasureEngine() = default;

    /**
     * @brief Build the parity artifact for a local chunk file
     *
     * RETURNS: path of a single artifact file next to the chunk, named
     * "<chunk file name>.par2"
     */
    virtual Result<std::filesystem::path> create_parity(const std::filesystem::path& chunk_path) = 0;

    /**
     * @brief Repair @p corrupted_path in place using @p parity_path
     *
     * Fails with RepairFailed when the damage exceeds the parity's capacity
     * or the parity itself is unusable.
     */
    virtual Result<void> repair(const std::filesystem::path& parity_path,
                                const std::filesystem::path& corrupted_path) = 0;
};

} // namespace rpipe::parity
