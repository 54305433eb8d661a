#pragma once

#include <string>

namespace rpipe {

/**
 * @brief Closed set of failure tags surfaced by the pipeline
 *
 * Each tag is a distinct outcome callers must handle. TransientTransport
 * exists for completeness: store adapters retry those internally and only
 * surface FatalTransmission once their retries are exhausted.
 */
enum class ErrorKind {
    TransientTransport,
    FatalTransmission,
    MissingChunk,
    ChecksumMismatch,
    NoParityAvailable,
    RepairAvailableButNotRequested,
    RepairFailed,
    NamingOverflow,
    Io,
    InvalidConfig,
    InvalidState    ///< Illegal lifecycle transition inside the pipeline
};

struct Error {
    ErrorKind kind = ErrorKind::Io;
    std::string chunk;    ///< Offending chunk name, empty when not chunk-specific
    std::string message;

    Error() = default;
    Error(ErrorKind k, std::string msg, std::string chunk_name = {})
        : kind(k), chunk(std::move(chunk_name)), message(std::move(msg)) {}

    [[nodiscard]] std::string to_string() const;
};

const char* error_kind_name(ErrorKind kind) noexcept;

/**
 * @brief Process exit status for a fatal error
 *
 * Integrity, repair and transmission failures map to 1, configuration
 * problems to 2.
 */
int exit_code_for(const Error& error) noexcept;

} // namespace rpipe
