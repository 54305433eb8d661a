#pragma once

#include "rpipe/store/object_store.hpp"

#include <filesystem>

namespace rpipe::store {

/**
 * @brief A local directory acting as the remote destination
 *
 * Objects are plain files directly under root(). put() writes to a
 * temporary name and renames it into place, so readers never observe a
 * half-written object. Checksums are computed on demand from file contents.
 */
class LocalStore : public ObjectStore {
public:
    explicit LocalStore(std::filesystem::path root);

    [[nodiscard]] std::string describe() const override;

    Result<void> make_container() override;

    Result<void> put(const std::filesystem::path& local_path, const std::string& remote_name) override;

    Result<void> get(const std::string& remote_name,
                     const ByteConsumer& consumer,
                     std::size_t block_size) override;

    Result<std::vector<std::string>> list(const std::string& pattern) override;

    Result<ChecksumInventory> remote_checksums(const std::string& pattern) override;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    std::filesystem::path object_path(const std::string& remote_name) const;

    std::filesystem::path root_;
};

} // namespace rpipe::store
