#pragma once

#include "rpipe/parity/erasure_engine.hpp"

#include <string>

namespace rpipe::parity {

/**
 * @brief ErasureEngine backed by par2cmdline
 *
 * par2 writes an index file plus recovery volumes. PAR2 readers scan packets
 * regardless of file boundaries, so the pieces are concatenated into one
 * artifact and the pieces removed.
 */
class Par2Engine : public ErasureEngine {
public:
    explicit Par2Engine(std::string binary = "par2", unsigned redundancy_percent = 10);

    Result<std::filesystem::path> create_parity(const std::filesystem::path& chunk_path) override;

    Result<void> repair(const std::filesystem::path& parity_path,
                        const std::filesystem::path& corrupted_path) override;

private:
    std::string binary_;
    unsigned redundancy_percent_;
};

} // namespace rpipe::parity
