#pragma once

#include "rpipe/core/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rpipe::chunk {

inline constexpr std::string_view kDefaultPrefix = "rp-";
inline constexpr std::size_t kDefaultWidth = 6;
inline constexpr std::string_view kParitySuffix = ".par2";
inline constexpr std::string_view kTotalKey = "TOTAL";

/**
 * @brief Fixed-width base-26 name for chunk @p index
 *
 * Letters are most significant first with 'a' as zero, so plain string
 * comparison of two names orders them like their indices. Replay relies on
 * this: it rebuilds the stream by sorting names.
 *
 * Fails with NamingOverflow when index >= 26^width.
 */
Result<std::string> chunk_name(std::uint64_t index,
                               std::size_t width = kDefaultWidth,
                               std::string_view prefix = kDefaultPrefix);

/**
 * @brief Inverse of chunk_name; empty optional for anything that is not a
 *        chunk name of the given shape
 */
std::optional<std::uint64_t> chunk_index(std::string_view name,
                                         std::size_t width = kDefaultWidth,
                                         std::string_view prefix = kDefaultPrefix);

bool is_chunk_name(std::string_view name,
                   std::size_t width = kDefaultWidth,
                   std::string_view prefix = kDefaultPrefix);

/**
 * @brief Name of the parity artifact that protects @p chunk_name
 */
std::string parity_name(std::string_view chunk_name);

/**
 * @brief Number of distinct names available for @p width, saturating at
 *        UINT64_MAX
 */
std::uint64_t name_capacity(std::size_t width) noexcept;

} // namespace rpipe::chunk
