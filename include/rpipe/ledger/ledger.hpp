#pragma once

/**
 * @file ledger.hpp
 * @brief Chunk digest manifest ("rpipe.md5")
 *
 * WIRE FORMAT:
 * One line per chunk in send order, "<md5>  <chunk name>", then a final
 * "<md5>  TOTAL" line with the digest of the whole stream. Same layout as
 * md5sum output, so the object can be checked by hand.
 *
 * Readers treat the manifest as a name -> digest mapping. TOTAL is a key
 * like any other; code iterating chunks must skip it.
 */

#include "rpipe/core/config.hpp"
#include "rpipe/core/result.hpp"
#include "rpipe/store/object_store.hpp"

#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rpipe::ledger {

/// Parsed manifest; ordered by name, which is also replay order
using LedgerMap = std::map<std::string, std::string>;

/**
 * @brief Manifest under construction during a send
 */
class LedgerWriter {
public:
    void add_chunk(std::string name, std::string digest);

    void set_total(std::string digest) { total_digest_ = std::move(digest); }

    [[nodiscard]] std::size_t chunk_count() const noexcept { return entries_.size(); }

    [[nodiscard]] const std::vector<std::pair<std::string, std::string>>& entries() const noexcept {
        return entries_;
    }

    /**
     * @brief Render the manifest text
     */
    [[nodiscard]] std::string serialize() const;

    /**
     * @brief Write the manifest to the scratch directory, fsync it, upload it
     *        as config.manifest_name and remove the local copy
     */
    Result<void> publish(store::ObjectStore& store, const SessionConfig& config) const;

private:
    std::vector<std::pair<std::string, std::string>> entries_;  // (name, digest) in send order
    std::string total_digest_;
};

/**
 * @brief Parse manifest text
 *
 * Lines with fewer than two whitespace-separated tokens (blank trailing
 * lines included) are skipped. Extra tokens are ignored.
 */
LedgerMap parse_ledger(std::string_view text);

/**
 * @brief Fetch and parse the manifest object without any verification
 */
Result<LedgerMap> fetch_ledger(store::ObjectStore& store, const SessionConfig& config);

/**
 * @brief Chunk entries of @p ledger in replay order (TOTAL excluded)
 */
std::vector<std::pair<std::string, std::string>> chunk_entries(const LedgerMap& ledger);

} // namespace rpipe::ledger
