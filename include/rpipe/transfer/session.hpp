#pragma once

#include "rpipe/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace rpipe::transfer {

enum class SessionState {
    Idle,
    Sending,      ///< Producing and uploading chunks
    Draining,     ///< Input exhausted, waiting for the window to empty
    Publishing,   ///< Writing the manifest
    Verifying,    ///< Cross-checking remote checksums against the manifest
    Replaying,    ///< Streaming chunks to the output sink
    Complete,
    Failed
};

enum class SessionMode {
    Send,
    Verify,
    Replay
};

const char* session_state_name(SessionState state) noexcept;

/**
 * @brief Summary of one send, verify or replay invocation
 */
struct SessionInfo {
    std::string destination;
    SessionMode mode = SessionMode::Send;
    std::chrono::system_clock::time_point started_at{};
    SessionState state = SessionState::Idle;
    std::uint64_t chunks = 0;
    std::uint64_t bytes = 0;
    std::string last_error; ///< Populated when state == Failed
};

/**
 * @brief Lifecycle of one transfer against one destination
 *
 * Send:   Idle -> Sending -> Draining -> Publishing [-> Verifying] -> Complete
 * Verify: Idle -> Verifying -> Complete
 * Replay: Idle [-> Verifying] -> Replaying -> Complete
 * Any state may move to Failed; Complete and Failed are terminal.
 */
class TransferSession {
public:
    TransferSession(std::string destination, SessionMode mode);

    [[nodiscard]] const std::string& destination() const noexcept { return info_.destination; }
    [[nodiscard]] SessionMode mode() const noexcept { return info_.mode; }
    [[nodiscard]] SessionState state() const noexcept { return info_.state; }
    [[nodiscard]] const SessionInfo& info() const noexcept { return info_; }

    Result<void> transition_to(SessionState next_state);
    Result<void> mark_failed(std::string error_message);

    void record_progress(std::uint64_t chunks, std::uint64_t bytes);

    [[nodiscard]] std::chrono::system_clock::time_point last_transition() const noexcept {
        return last_transition_;
    }

private:
    [[nodiscard]] bool can_transition(SessionState target) const noexcept;

    SessionInfo info_;
    std::chrono::system_clock::time_point last_transition_{};
};

} // namespace rpipe::transfer
