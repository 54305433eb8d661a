#include "rpipe/store/object_store.hpp"

#include "rpipe/store/local_store.hpp"
#include "rpipe/store/rclone_store.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>

namespace rpipe::store {
namespace fs = std::filesystem;

namespace {

struct FileCloser {
    void operator()(std::FILE* f) const noexcept {
        if (f) {
            std::fclose(f);
        }
    }
};

} // namespace

std::unique_ptr<ObjectStore> make_store(const SessionConfig& config) {
    switch (config.backend) {
        case StoreBackend::Local:
            return std::make_unique<LocalStore>(fs::path(config.destination));
        case StoreBackend::Rclone:
            break;
    }
    return std::make_unique<RcloneStore>(config.destination, config.rclone_binary, config.rclone_retries);
}

Result<void> fetch_to_file(ObjectStore& store,
                           const std::string& remote_name,
                           const fs::path& local_path,
                           std::size_t block_size) {
    std::unique_ptr<std::FILE, FileCloser> out(std::fopen(local_path.c_str(), "wb"));
    if (!out) {
        return Err<void>(ErrorKind::Io,
                         "cannot create " + local_path.string() + ": " + std::strerror(errno),
                         remote_name);
    }

    auto res = store.get(remote_name, [&out, &local_path](const char* data, std::size_t size) -> Result<void> {
        if (std::fwrite(data, 1, size, out.get()) != size) {
            return Err<void>(ErrorKind::Io, "write failed on " + local_path.string());
        }
        return Ok();
    }, block_size);
    if (res.is_error()) {
        return res;
    }

    if (std::fclose(out.release()) != 0) {
        return Err<void>(ErrorKind::Io, "close failed on " + local_path.string(), remote_name);
    }
    return Ok();
}

Result<std::string> fetch_to_string(ObjectStore& store,
                                    const std::string& remote_name,
                                    std::size_t block_size) {
    std::string contents;
    auto res = store.get(remote_name, [&contents](const char* data, std::size_t size) -> Result<void> {
        contents.append(data, size);
        return Ok();
    }, block_size);
    if (res.is_error()) {
        return Err<std::string>(res.error());
    }
    return Ok(contents);
}

} // namespace rpipe::store
