#pragma once

/**
 * @file object_store.hpp
 * @brief Narrow interface to the remote object store
 *
 * The pipeline only needs five operations on a destination. Adapters hide
 * transport details and transient-failure retries; anything they return as
 * an error is terminal for that operation.
 *
 * THREAD SAFETY:
 * put() is called concurrently from upload tasks (at most the window
 * width at a time). Implementations must allow that.
 */

#include "rpipe/core/config.hpp"
#include "rpipe/core/result.hpp"
#include "rpipe/core/stream.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace rpipe::store {

/// Remote object name -> store-reported hex MD5
using ChecksumInventory = std::map<std::string, std::string>;

class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    /**
     * @brief Human-readable destination, used in diagnostics
     */
    [[nodiscard]] virtual std::string describe() const = 0;

    /**
     * @brief Ensure the destination container/prefix exists
     */
    virtual Result<void> make_container() = 0;

    /**
     * @brief Copy a local file to @p remote_name, replacing any existing object
     */
    virtual Result<void> put(const std::filesystem::path& local_path, const std::string& remote_name) = 0;

    /**
     * @brief Stream an object's bytes to @p consumer in pieces of at most
     *        @p block_size bytes
     */
    virtual Result<void> get(const std::string& remote_name,
                             const ByteConsumer& consumer,
                             std::size_t block_size) = 0;

    /**
     * @brief Names of objects matching a shell glob such as "rp-*"
     */
    virtual Result<std::vector<std::string>> list(const std::string& pattern) = 0;

    /**
     * @brief Store-computed MD5 for every object matching @p pattern
     */
    virtual Result<ChecksumInventory> remote_checksums(const std::string& pattern) = 0;
};

/**
 * @brief Build the adapter selected by config.backend for config.destination
 */
std::unique_ptr<ObjectStore> make_store(const SessionConfig& config);

/**
 * @brief Download an object into a local file
 */
Result<void> fetch_to_file(ObjectStore& store,
                           const std::string& remote_name,
                           const std::filesystem::path& local_path,
                           std::size_t block_size);

/**
 * @brief Download an object into memory
 */
Result<std::string> fetch_to_string(ObjectStore& store,
                                    const std::string& remote_name,
                                    std::size_t block_size);

} // namespace rpipe::store
