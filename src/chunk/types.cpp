#include "rpipe/chunk/types.hpp"

namespace rpipe::chunk {

const char* chunk_state_name(ChunkState state) noexcept {
    switch (state) {
        case ChunkState::Sealing: return "sealing";
        case ChunkState::Sealed: return "sealed";
        case ChunkState::Uploading: return "uploading";
        case ChunkState::Retired: return "retired";
    }
    return "unknown";
}

} // namespace rpipe::chunk
