#include "rpipe/verify/repair.hpp"

#include "rpipe/chunk/naming.hpp"
#include "rpipe/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace rpipe::verify {
namespace fs = std::filesystem;

namespace {

// Removes a repair working directory when the repair attempt ends
class ScratchDir {
public:
    explicit ScratchDir(fs::path path) : path_(std::move(path)) {}

    ~ScratchDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec) {
            spdlog::warn("cannot remove repair directory {}: {}", path_.string(), ec.message());
        }
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const fs::path& path() const noexcept { return path_; }

private:
    fs::path path_;
};

} // namespace

RepairCoordinator::RepairCoordinator(const SessionConfig& config,
                                     store::ObjectStore& store,
                                     parity::ErasureEngine& engine,
                                     events::EventBus* bus)
    : config_(config),
      store_(store),
      engine_(engine),
      bus_(bus) {}

Result<void> RepairCoordinator::protect(chunk::Chunk& chunk) {
    auto created = engine_.create_parity(chunk.local_path);
    if (created.is_error()) {
        auto err = created.error();
        if (err.chunk.empty()) {
            err.chunk = chunk.name;
        }
        return Err<void>(std::move(err));
    }
    chunk.parity_path = created.value();
    spdlog::debug("parity for {} at {}", chunk.name, chunk.parity_path->string());
    return Ok();
}

Result<void> RepairCoordinator::repair_chunk(const std::string& name) {
    if (!chunk::chunk_index(name, config_.name_width, config_.chunk_prefix)) {
        return Err<void>(ErrorKind::NoParityAvailable, "not a chunk object", name);
    }

    const auto parity = chunk::parity_name(name);
    auto listed = store_.list(parity);
    if (listed.is_error()) {
        return Err<void>(ErrorKind::FatalTransmission,
                         "cannot list parity objects: " + listed.error().message, name);
    }

    const auto& names = listed.value();
    if (std::find(names.begin(), names.end(), parity) == names.end()) {
        spdlog::error("No parity stored for {}", name);
        return Err<void>(ErrorKind::NoParityAvailable, "no parity object " + parity, name);
    }

    if (!config_.attempt_repair) {
        spdlog::error("Parity available for {}; rerun with --repair to fix it", name);
        return Err<void>(ErrorKind::RepairAvailableButNotRequested,
                         "parity " + parity + " present but repair not requested", name);
    }

    spdlog::info("Attempting repair of {}", name);
    auto res = rebuild(name, parity);
    if (res.is_error()) {
        return res;
    }

    ++repaired_;
    events::publish(bus_, events::ChunkRepairedEvent{name, parity});
    return Ok();
}

Result<void> RepairCoordinator::rebuild(const std::string& name, const std::string& parity) {
    ScratchDir work(config_.scratch_dir / ("rpipe-repair-" + name));

    std::error_code ec;
    fs::create_directories(work.path(), ec);
    if (ec) {
        return Err<void>(ErrorKind::Io,
                         "cannot create " + work.path().string() + ": " + ec.message(), name);
    }

    // The engine matches files by name, so the chunk keeps its remote name
    const fs::path chunk_path = work.path() / name;
    const fs::path parity_path = work.path() / parity;

    auto res = store::fetch_to_file(store_, parity, parity_path, config_.block_size);
    if (res.is_error()) {
        return Err<void>(ErrorKind::FatalTransmission, "cannot fetch parity: " + res.error().message, name);
    }
    res = store::fetch_to_file(store_, name, chunk_path, config_.block_size);
    if (res.is_error()) {
        return Err<void>(ErrorKind::FatalTransmission, "cannot fetch chunk: " + res.error().message, name);
    }

    res = engine_.repair(parity_path, chunk_path);
    if (res.is_error()) {
        return Err<void>(ErrorKind::RepairFailed, res.error().message, name);
    }

    res = store_.put(chunk_path, name);
    if (res.is_error()) {
        return Err<void>(ErrorKind::FatalTransmission,
                         "cannot upload repaired chunk: " + res.error().message, name);
    }
    return Ok();
}

} // namespace rpipe::verify
