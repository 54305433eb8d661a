#include "rpipe/transfer/scheduler.hpp"

#include "rpipe/chunk/naming.hpp"
#include "rpipe/events/events.hpp"

#include <boost/asio/post.hpp>

#include <spdlog/spdlog.h>

#include <future>
#include <memory>
#include <optional>
#include <system_error>

namespace rpipe::transfer {
namespace fs = std::filesystem;
using chunk::Chunk;
using chunk::ChunkState;

namespace {

Result<void> upload_chunk(store::ObjectStore& store,
                          const std::atomic<bool>& cancelled,
                          const fs::path& local_path,
                          const std::string& name,
                          const std::optional<fs::path>& parity_path) {
    if (cancelled.load()) {
        return Err<void>(ErrorKind::FatalTransmission, "cancelled before transmission", name);
    }

    auto res = store.put(local_path, name);
    if (res.is_error()) {
        return Err<void>(ErrorKind::FatalTransmission, "upload failed: " + res.error().message, name);
    }

    if (parity_path) {
        const auto parity = chunk::parity_name(name);
        res = store.put(*parity_path, parity);
        if (res.is_error()) {
            return Err<void>(ErrorKind::FatalTransmission,
                             "parity upload failed: " + res.error().message, parity);
        }
    }
    return Ok();
}

} // namespace

UploadScheduler::UploadScheduler(const SessionConfig& config, store::ObjectStore& store, events::EventBus* bus)
    : config_(config),
      store_(store),
      bus_(bus),
      window_(config.jobs == 0 ? 1 : config.jobs),
      pool_(window_) {}

UploadScheduler::~UploadScheduler() {
    bool outstanding = false;
    for (const auto& c : chunks_) {
        if (c.state != ChunkState::Retired) {
            outstanding = true;
            break;
        }
    }
    if (outstanding && !aborted_) {
        abort();
    }
    pool_.join();
}

Result<Chunk*> UploadScheduler::open_chunk() {
    const auto index = static_cast<std::uint64_t>(chunks_.size());
    auto name = chunk::chunk_name(index, config_.name_width, config_.chunk_prefix);
    if (name.is_error()) {
        return Err<Chunk*>(name.error());
    }

    Chunk& c = chunks_.emplace_back();
    c.index = index;
    c.name = std::move(name.value());
    c.local_path = config_.scratch_dir / c.name;
    c.state = ChunkState::Sealing;
    started_at_.emplace_back();
    return Ok(&c);
}

void UploadScheduler::discard(Chunk& c) {
    remove_local_files(c);
    if (!chunks_.empty() && &chunks_.back() == &c) {
        chunks_.pop_back();
        started_at_.pop_back();
    }
}

Result<void> UploadScheduler::make_room(std::uint64_t index) {
    if (index < window_) {
        return Ok();
    }
    return retire(index - window_);
}

Result<void> UploadScheduler::start_upload(Chunk& c) {
    if (c.state != ChunkState::Sealed) {
        return Err<void>(ErrorKind::Io,
                         std::string("cannot upload a chunk in state ") + chunk::chunk_state_name(c.state),
                         c.name);
    }

    auto task = std::make_shared<std::packaged_task<Result<void>()>>(
        [&store = store_, &cancelled = cancelled_,
         local = c.local_path, name = c.name, parity = c.parity_path]() {
            return upload_chunk(store, cancelled, local, name, parity);
        });

    c.upload = task->get_future();
    c.state = ChunkState::Uploading;
    started_at_[c.index] = std::chrono::steady_clock::now();
    boost::asio::post(pool_, [task]() { (*task)(); });

    events::publish(bus_, events::ChunkUploadStartedEvent{c.index, c.name, c.parity_path.has_value()});

    if (c.index == 0) {
        // The first upload creates the destination prefix; nothing else may
        // run concurrently with it
        return retire(0);
    }
    return Ok();
}

Result<void> UploadScheduler::retire(std::uint64_t index) {
    Chunk& c = chunks_.at(index);
    if (c.state == ChunkState::Retired) {
        return Ok();
    }
    if (c.state != ChunkState::Uploading || !c.upload.valid()) {
        return Err<void>(ErrorKind::Io,
                         std::string("cannot retire a chunk in state ") + chunk::chunk_state_name(c.state),
                         c.name);
    }

    auto res = c.upload.get();
    if (res.is_error()) {
        spdlog::error("Upload of {} failed: {}", c.name, res.error().message);
        return res;
    }

    remove_local_files(c);
    c.state = ChunkState::Retired;

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_at_[index]);
    events::publish(bus_, events::ChunkRetiredEvent{c.index, c.name, c.size, elapsed});
    return Ok();
}

Result<void> UploadScheduler::drain() {
    for (std::uint64_t i = 0; i < chunks_.size(); ++i) {
        auto res = retire(i);
        if (res.is_error()) {
            return res;
        }
    }
    return Ok();
}

void UploadScheduler::abort() {
    if (aborted_) {
        return;
    }
    aborted_ = true;
    cancelled_.store(true);

    for (auto& c : chunks_) {
        if (c.upload.valid()) {
            auto res = c.upload.get();
            if (res.is_error()) {
                spdlog::debug("abandoned upload {}: {}", c.name, res.error().message);
            }
        }
        if (c.state != ChunkState::Retired) {
            remove_local_files(c);
        }
    }
    pool_.join();
}

std::vector<std::pair<std::string, std::string>> UploadScheduler::retired_entries() const {
    std::vector<std::pair<std::string, std::string>> entries;
    entries.reserve(chunks_.size());
    for (const auto& c : chunks_) {
        if (c.state == ChunkState::Retired) {
            entries.emplace_back(c.name, c.digest);
        }
    }
    return entries;
}

std::size_t UploadScheduler::in_flight() const noexcept {
    std::size_t count = 0;
    for (const auto& c : chunks_) {
        if (c.state == ChunkState::Uploading) {
            ++count;
        }
    }
    return count;
}

void UploadScheduler::remove_local_files(Chunk& c) {
    std::error_code ec;
    fs::remove(c.local_path, ec);
    if (ec) {
        spdlog::warn("cannot remove {}: {}", c.local_path.string(), ec.message());
    }
    if (c.parity_path) {
        fs::remove(*c.parity_path, ec);
        if (ec) {
            spdlog::warn("cannot remove {}: {}", c.parity_path->string(), ec.message());
        }
        c.parity_path.reset();
    }
}

} // namespace rpipe::transfer
