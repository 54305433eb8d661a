#include "rpipe/core/error.hpp"

namespace rpipe {

const char* error_kind_name(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::TransientTransport: return "TransientTransportError";
        case ErrorKind::FatalTransmission: return "FatalTransmissionError";
        case ErrorKind::MissingChunk: return "MissingChunk";
        case ErrorKind::ChecksumMismatch: return "ChecksumMismatch";
        case ErrorKind::NoParityAvailable: return "NoParityAvailable";
        case ErrorKind::RepairAvailableButNotRequested: return "RepairAvailableButNotRequested";
        case ErrorKind::RepairFailed: return "RepairFailed";
        case ErrorKind::NamingOverflow: return "NamingOverflow";
        case ErrorKind::Io: return "IoError";
        case ErrorKind::InvalidConfig: return "InvalidConfig";
        case ErrorKind::InvalidState: return "InvalidState";
    }
    return "Unknown";
}

std::string Error::to_string() const {
    std::string out = error_kind_name(kind);
    if (!chunk.empty()) {
        out += " [" + chunk + "]";
    }
    if (!message.empty()) {
        out += ": " + message;
    }
    return out;
}

int exit_code_for(const Error& error) noexcept {
    return error.kind == ErrorKind::InvalidConfig ? 2 : 1;
}

} // namespace rpipe
