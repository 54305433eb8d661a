#include "rpipe/parity/par2_engine.hpp"

#include "rpipe/core/subprocess.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <system_error>
#include <vector>

namespace rpipe::parity {
namespace fs = std::filesystem;

namespace {

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void remove_pieces(const std::vector<fs::path>& pieces) {
    for (const auto& piece : pieces) {
        std::error_code ec;
        fs::remove(piece, ec);
        if (ec) {
            spdlog::warn("cannot remove par2 piece {}: {}", piece.string(), ec.message());
        }
    }
}

} // namespace

Par2Engine::Par2Engine(std::string binary, unsigned redundancy_percent)
    : binary_(std::move(binary)),
      redundancy_percent_(redundancy_percent) {}

Result<fs::path> Par2Engine::create_parity(const fs::path& chunk_path) {
    const fs::path dir = chunk_path.parent_path();
    const std::string stem = chunk_path.filename().string() + ".ec";
    const fs::path artifact = fs::path(chunk_path).concat(".par2");

    auto status = run_command({binary_, "create", "-q", "-n1",
                               "-r" + std::to_string(redundancy_percent_),
                               "-B" + dir.string(),
                               "-a", (dir / (stem + ".par2")).string(),
                               "--", chunk_path.string()});
    if (status.is_error()) {
        return Err<fs::path>(status.error());
    }

    // Collect <stem>.par2 and <stem>.volNN+MM.par2 in a stable order
    std::vector<fs::path> pieces;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        const auto name = entry.path().filename().string();
        if (starts_with(name, stem + ".") && ends_with(name, ".par2")) {
            pieces.push_back(entry.path());
        }
    }
    std::sort(pieces.begin(), pieces.end());

    if (status.value() != 0 || pieces.empty()) {
        remove_pieces(pieces);
        return Err<fs::path>(ErrorKind::Io,
                             "par2 create exited with status " + std::to_string(status.value()),
                             chunk_path.filename().string());
    }

    std::ofstream out(artifact, std::ios::binary | std::ios::trunc);
    for (const auto& piece : pieces) {
        std::ifstream in(piece, std::ios::binary);
        out << in.rdbuf();
    }
    out.close();
    remove_pieces(pieces);
    if (!out) {
        return Err<fs::path>(ErrorKind::Io, "cannot write " + artifact.string(),
                             chunk_path.filename().string());
    }
    return Ok(artifact);
}

Result<void> Par2Engine::repair(const fs::path& parity_path, const fs::path& corrupted_path) {
    auto status = run_command({binary_, "repair", "-q",
                               "-B" + corrupted_path.parent_path().string(),
                               "--", parity_path.string(), corrupted_path.string()});
    if (status.is_error()) {
        return Err<void>(ErrorKind::RepairFailed, status.error().message,
                         corrupted_path.filename().string());
    }
    if (status.value() != 0) {
        return Err<void>(ErrorKind::RepairFailed,
                         "par2 repair exited with status " + std::to_string(status.value()),
                         corrupted_path.filename().string());
    }
    return Ok();
}

} // namespace rpipe::parity
