#include "rpipe/chunk/producer.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <unistd.h>

namespace rpipe::chunk {
namespace {

struct FileCloser {
    void operator()(std::FILE* f) const noexcept {
        if (f) {
            std::fclose(f);
        }
    }
};

using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

Result<std::uint64_t> io_error(const Chunk& chunk, const std::string& what) {
    return Err<std::uint64_t>(ErrorKind::Io,
                              what + " " + chunk.local_path.string() + ": " + std::strerror(errno),
                              chunk.name);
}

} // namespace

ChunkProducer::ChunkProducer(std::istream& input, const SessionConfig& config, DigestAccumulator& stream_digest)
    : input_(input),
      config_(config),
      stream_digest_(stream_digest),
      buffer_(config.block_size) {}

bool ChunkProducer::at_end() {
    if (exhausted_) {
        return true;
    }
    if (input_.peek() == std::istream::traits_type::eof() && !input_.bad()) {
        exhausted_ = true;
    }
    return exhausted_;
}

Result<std::uint64_t> ChunkProducer::fill(Chunk& chunk) {
    FilePtr out(std::fopen(chunk.local_path.c_str(), "wb"));
    if (!out) {
        return io_error(chunk, "cannot create");
    }

    DigestAccumulator chunk_digest;
    std::uint64_t remaining = config_.chunk_size;

    while (remaining > 0 && !exhausted_) {
        const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(buffer_.size(), remaining));
        input_.read(buffer_.data(), static_cast<std::streamsize>(want));
        const auto got = static_cast<std::size_t>(input_.gcount());

        if (input_.bad()) {
            return Err<std::uint64_t>(ErrorKind::Io, "read from input stream failed", chunk.name);
        }
        if (got < want) {
            exhausted_ = true;
        }
        if (got == 0) {
            break;
        }

        chunk_digest.update(buffer_.data(), got);
        stream_digest_.update(buffer_.data(), got);

        if (std::fwrite(buffer_.data(), 1, got, out.get()) != got) {
            return io_error(chunk, "write failed on");
        }
        remaining -= got;
    }

    if (std::fflush(out.get()) != 0 || ::fsync(::fileno(out.get())) != 0) {
        return io_error(chunk, "flush failed on");
    }
    if (std::fclose(out.release()) != 0) {
        return io_error(chunk, "close failed on");
    }

    const std::uint64_t written = config_.chunk_size - remaining;
    chunk.size = written;
    total_bytes_ += written;
    if (written > 0) {
        chunk.digest = chunk_digest.hex_digest();
        chunk.state = ChunkState::Sealed;
    }
    return Ok(written);
}

} // namespace rpipe::chunk
