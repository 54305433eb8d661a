#include "rpipe/store/local_store.hpp"

#include "rpipe/chunk/digest.hpp"

#include <spdlog/spdlog.h>

#include <fnmatch.h>

#include <algorithm>
#include <fstream>
#include <system_error>

namespace rpipe::store {
namespace fs = std::filesystem;

namespace {

bool matches(const std::string& pattern, const std::string& name) {
    return ::fnmatch(pattern.c_str(), name.c_str(), 0) == 0;
}

} // namespace

LocalStore::LocalStore(fs::path root) : root_(std::move(root)) {}

std::string LocalStore::describe() const {
    return root_.string();
}

fs::path LocalStore::object_path(const std::string& remote_name) const {
    return root_ / remote_name;
}

Result<void> LocalStore::make_container() {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec && !fs::is_directory(root_)) {
        return Err<void>(ErrorKind::FatalTransmission,
                         "cannot create " + root_.string() + ": " + ec.message());
    }
    return Ok();
}

Result<void> LocalStore::put(const fs::path& local_path, const std::string& remote_name) {
    const auto target = object_path(remote_name);
    const auto staging = root_ / ("." + remote_name + ".partial");

    std::error_code ec;
    fs::copy_file(local_path, staging, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return Err<void>(ErrorKind::FatalTransmission,
                         "copy " + local_path.string() + " failed: " + ec.message(), remote_name);
    }
    fs::rename(staging, target, ec);
    if (ec) {
        fs::remove(staging, ec);
        return Err<void>(ErrorKind::FatalTransmission,
                         "cannot move object into place: " + target.string(), remote_name);
    }
    spdlog::debug("local put {} -> {}", local_path.string(), target.string());
    return Ok();
}

Result<void> LocalStore::get(const std::string& remote_name,
                             const ByteConsumer& consumer,
                             std::size_t block_size) {
    std::ifstream input(object_path(remote_name), std::ios::binary);
    if (!input) {
        return Err<void>(ErrorKind::FatalTransmission, "object not found", remote_name);
    }

    std::vector<char> buffer(block_size == 0 ? 4096 : block_size);
    while (input.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || input.gcount() > 0) {
        auto res = consumer(buffer.data(), static_cast<std::size_t>(input.gcount()));
        if (res.is_error()) {
            return res;
        }
    }
    if (input.bad()) {
        return Err<void>(ErrorKind::FatalTransmission, "read failed", remote_name);
    }
    return Ok();
}

Result<std::vector<std::string>> LocalStore::list(const std::string& pattern) {
    std::vector<std::string> names;
    std::error_code ec;
    fs::directory_iterator it(root_, ec);
    if (ec) {
        return Err<std::vector<std::string>>(ErrorKind::FatalTransmission,
                                             "cannot list " + root_.string() + ": " + ec.message());
    }
    for (const auto& entry : it) {
        if (!entry.is_regular_file()) {
            continue;
        }
        auto name = entry.path().filename().string();
        if (matches(pattern, name)) {
            names.push_back(std::move(name));
        }
    }
    std::sort(names.begin(), names.end());
    return Ok(names);
}

Result<ChecksumInventory> LocalStore::remote_checksums(const std::string& pattern) {
    auto names = list(pattern);
    if (names.is_error()) {
        return Err<ChecksumInventory>(names.error());
    }

    ChecksumInventory inventory;
    for (const auto& name : names.value()) {
        chunk::DigestAccumulator digest;
        auto res = get(name, [&digest](const char* data, std::size_t size) -> Result<void> {
            digest.update(data, size);
            return Ok();
        }, 1u << 16);
        if (res.is_error()) {
            return Err<ChecksumInventory>(res.error());
        }
        inventory.emplace(name, digest.hex_digest());
    }
    return Ok(inventory);
}

} // namespace rpipe::store
