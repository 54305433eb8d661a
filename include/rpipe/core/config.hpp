#pragma once

/**
 * @file config.hpp
 * @brief Per-invocation configuration shared by every pipeline component
 *
 * A SessionConfig is built once by the CLI (defaults, then an optional JSON
 * file, then command line flags) and passed by reference to every component.
 * Nothing in the pipeline reads process-wide state.
 */

#include "rpipe/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace rpipe {

enum class StoreBackend {
    Rclone,
    Local
};

struct SessionConfig {
    static constexpr std::size_t kDefaultChunkSize = 1u << 23;  // 8 MiB
    static constexpr std::size_t kDefaultBlockSize = 1u << 16;  // 64 KiB
    static constexpr std::size_t kDefaultJobs = 2;

    std::string destination;
    std::size_t chunk_size = kDefaultChunkSize;
    std::size_t block_size = kDefaultBlockSize;
    std::size_t jobs = kDefaultJobs;                 ///< Upload window width (W)
    std::filesystem::path scratch_dir = "/tmp";

    bool verify_only = false;
    bool skip_checksum = false;
    bool create_parity = false;
    bool attempt_repair = false;

    StoreBackend backend = StoreBackend::Rclone;
    std::string rclone_binary = "rclone";
    unsigned rclone_retries = 10;
    std::string par2_binary = "par2";
    unsigned parity_redundancy = 10;                 ///< Percent of chunk size

    std::string chunk_prefix = "rp-";
    std::size_t name_width = 6;
    std::string manifest_name = "rpipe.md5";

    std::string log_level = "info";

    /**
     * @brief Reject configurations the pipeline cannot run with
     */
    Result<void> validate() const;
};

/**
 * @brief Overlay settings from a JSON object file onto @p config
 *
 * Unknown keys are ignored. A key present with the wrong JSON type is an
 * InvalidConfig error naming the key.
 */
Result<void> load_config_file(const std::filesystem::path& path, SessionConfig& config);

/**
 * @brief Same as load_config_file, from already-read JSON text
 */
Result<void> apply_config_json(const std::string& text, SessionConfig& config);

const char* backend_name(StoreBackend backend) noexcept;

} // namespace rpipe
