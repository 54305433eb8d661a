#pragma once

#include "rpipe/store/object_store.hpp"

#include <initializer_list>
#include <string>
#include <vector>

namespace rpipe::store {

/**
 * @brief Object store backed by the rclone command line tool
 *
 * Every operation runs one rclone process with --retries so transient
 * transport errors are absorbed by rclone itself. A non-zero exit status is
 * a terminal failure. The destination uses rclone syntax ("remote:path").
 */
class RcloneStore : public ObjectStore {
public:
    RcloneStore(std::string destination, std::string binary = "rclone", unsigned retries = 10);

    [[nodiscard]] std::string describe() const override { return destination_; }

    Result<void> make_container() override;

    Result<void> put(const std::filesystem::path& local_path, const std::string& remote_name) override;

    Result<void> get(const std::string& remote_name,
                     const ByteConsumer& consumer,
                     std::size_t block_size) override;

    Result<std::vector<std::string>> list(const std::string& pattern) override;

    Result<ChecksumInventory> remote_checksums(const std::string& pattern) override;

    /**
     * @brief Full rclone path of an object inside the destination
     */
    [[nodiscard]] std::string remote_path(const std::string& remote_name) const;

private:
    std::vector<std::string> command(std::initializer_list<std::string> args) const;

    std::string destination_;
    std::string binary_;
    unsigned retries_;
};

/**
 * @brief Parse "md5sum"-style text ("<digest>  <name>" per line)
 *
 * Lines with fewer than two tokens are skipped.
 */
ChecksumInventory parse_checksum_listing(const std::string& text);

} // namespace rpipe::store
