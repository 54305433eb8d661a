#include "rpipe/transfer/session.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <utility>
#include <vector>

namespace rpipe::transfer {
namespace {

using TransitionTable = std::map<SessionState, std::vector<SessionState>>;

const TransitionTable& transitions_for(SessionMode mode) {
    static const TransitionTable send {
        {SessionState::Idle, {SessionState::Sending}},
        {SessionState::Sending, {SessionState::Draining}},
        {SessionState::Draining, {SessionState::Publishing}},
        {SessionState::Publishing, {SessionState::Verifying, SessionState::Complete}},
        {SessionState::Verifying, {SessionState::Complete}},
    };
    static const TransitionTable verify {
        {SessionState::Idle, {SessionState::Verifying}},
        {SessionState::Verifying, {SessionState::Complete}},
    };
    static const TransitionTable replay {
        {SessionState::Idle, {SessionState::Verifying, SessionState::Replaying}},
        {SessionState::Verifying, {SessionState::Replaying}},
        {SessionState::Replaying, {SessionState::Complete}},
    };

    switch (mode) {
        case SessionMode::Send: return send;
        case SessionMode::Verify: return verify;
        case SessionMode::Replay: return replay;
    }
    return send;
}

} // namespace

const char* session_state_name(SessionState state) noexcept {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Sending: return "sending";
        case SessionState::Draining: return "draining";
        case SessionState::Publishing: return "publishing";
        case SessionState::Verifying: return "verifying";
        case SessionState::Replaying: return "replaying";
        case SessionState::Complete: return "complete";
        case SessionState::Failed: return "failed";
    }
    return "unknown";
}

TransferSession::TransferSession(std::string destination, SessionMode mode) {
    info_.destination = std::move(destination);
    info_.mode = mode;
    info_.state = SessionState::Idle;
    info_.started_at = std::chrono::system_clock::now();
    last_transition_ = info_.started_at;
}

Result<void> TransferSession::transition_to(SessionState next_state) {
    if (info_.state == next_state) {
        return Ok();
    }

    if (!can_transition(next_state)) {
        return Err<void>(ErrorKind::InvalidState,
                         std::string("illegal session transition ") +
                         session_state_name(info_.state) + " -> " + session_state_name(next_state));
    }

    spdlog::debug("session {}: {} -> {}", info_.destination,
                  session_state_name(info_.state), session_state_name(next_state));
    info_.state = next_state;
    last_transition_ = std::chrono::system_clock::now();
    if (next_state != SessionState::Failed) {
        info_.last_error.clear();
    }
    return Ok();
}

Result<void> TransferSession::mark_failed(std::string error_message) {
    info_.last_error = std::move(error_message);
    return transition_to(SessionState::Failed);
}

void TransferSession::record_progress(std::uint64_t chunks, std::uint64_t bytes) {
    info_.chunks = chunks;
    info_.bytes = bytes;
}

bool TransferSession::can_transition(SessionState target) const noexcept {
    if (info_.state == target) {
        return true;
    }

    if (info_.state == SessionState::Failed || info_.state == SessionState::Complete) {
        return false;
    }

    if (target == SessionState::Failed) {
        return true;
    }

    const auto& table = transitions_for(info_.mode);
    const auto it = table.find(info_.state);
    if (it == table.end()) {
        return false;
    }
    return std::find(it->second.begin(), it->second.end(), target) != it->second.end();
}

} // namespace rpipe::transfer
