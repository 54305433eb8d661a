#include "rpipe/store/rclone_store.hpp"

#include "rpipe/core/subprocess.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

namespace rpipe::store {

namespace {

Result<void> check_status(const Result<int>& status, const std::string& what, const std::string& object = {}) {
    if (status.is_error()) {
        return Err<void>(status.error());
    }
    if (status.value() != 0) {
        return Err<void>(ErrorKind::FatalTransmission,
                         what + " failed with exit status " + std::to_string(status.value()),
                         object);
    }
    return Ok();
}

} // namespace

RcloneStore::RcloneStore(std::string destination, std::string binary, unsigned retries)
    : destination_(std::move(destination)),
      binary_(std::move(binary)),
      retries_(retries) {}

std::string RcloneStore::remote_path(const std::string& remote_name) const {
    if (destination_.empty() || destination_.back() == ':' || destination_.back() == '/') {
        return destination_ + remote_name;
    }
    return destination_ + "/" + remote_name;
}

std::vector<std::string> RcloneStore::command(std::initializer_list<std::string> args) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(binary_);
    auto it = args.begin();
    argv.push_back(*it++);  // subcommand first, then its flags
    argv.push_back("--retries=" + std::to_string(retries_));
    argv.insert(argv.end(), it, args.end());
    return argv;
}

Result<void> RcloneStore::make_container() {
    return check_status(run_command(command({"mkdir", destination_})), "rclone mkdir " + destination_);
}

Result<void> RcloneStore::put(const std::filesystem::path& local_path, const std::string& remote_name) {
    return check_status(run_command(command({"copyto", local_path.string(), remote_path(remote_name)})),
                        "rclone copyto", remote_name);
}

Result<void> RcloneStore::get(const std::string& remote_name,
                              const ByteConsumer& consumer,
                              std::size_t block_size) {
    auto status = stream_command(command({"cat", remote_path(remote_name)}), consumer, block_size);
    return check_status(status, "rclone cat", remote_name);
}

Result<std::vector<std::string>> RcloneStore::list(const std::string& pattern) {
    auto output = capture_command(command({"lsf", "--files-only", "--include=" + pattern, destination_}));
    if (output.is_error()) {
        return Err<std::vector<std::string>>(output.error());
    }
    if (output.value().exit_status != 0) {
        return Err<std::vector<std::string>>(ErrorKind::FatalTransmission,
                                             "rclone lsf failed with exit status " +
                                             std::to_string(output.value().exit_status));
    }

    std::vector<std::string> names;
    std::istringstream lines(output.value().stdout_text);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty()) {
            names.push_back(line);
        }
    }
    return Ok(names);
}

Result<ChecksumInventory> RcloneStore::remote_checksums(const std::string& pattern) {
    auto output = capture_command(command({"md5sum", "--include=" + pattern, destination_}));
    if (output.is_error()) {
        return Err<ChecksumInventory>(output.error());
    }
    if (output.value().exit_status != 0) {
        return Err<ChecksumInventory>(ErrorKind::FatalTransmission,
                                      "rclone md5sum failed with exit status " +
                                      std::to_string(output.value().exit_status));
    }
    return Ok(parse_checksum_listing(output.value().stdout_text));
}

ChecksumInventory parse_checksum_listing(const std::string& text) {
    ChecksumInventory inventory;
    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        std::istringstream tokens(line);
        std::string digest;
        std::string name;
        if (!(tokens >> digest >> name)) {
            continue;
        }
        inventory[name] = digest;
    }
    return inventory;
}

} // namespace rpipe::store
