#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

struct evp_md_ctx_st;

namespace rpipe::chunk {

/**
 * @brief Incremental MD5 over a byte stream
 *
 * hex_digest() can be called at any time; it finalizes a copy of the
 * running context, so feeding may continue afterwards. Strength is meant for
 * transport corruption and bitrot, not for tamper detection.
 *
 * Not thread-safe. Each accumulator has exactly one writer.
 */
class DigestAccumulator {
public:
    DigestAccumulator();
    ~DigestAccumulator();

    DigestAccumulator(DigestAccumulator&&) noexcept;
    DigestAccumulator& operator=(DigestAccumulator&&) noexcept;

    DigestAccumulator(const DigestAccumulator&) = delete;
    DigestAccumulator& operator=(const DigestAccumulator&) = delete;

    void update(const void* data, std::size_t size);
    void update(std::string_view data) { update(data.data(), data.size()); }

    [[nodiscard]] std::string hex_digest() const;

    [[nodiscard]] std::uint64_t bytes() const noexcept { return bytes_; }

    /**
     * @brief Start over as if freshly constructed
     */
    void reset();

private:
    struct CtxDeleter {
        void operator()(evp_md_ctx_st* ctx) const noexcept;
    };

    std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
    std::uint64_t bytes_ = 0;
};

/**
 * @brief MD5 hex digest of an in-memory buffer
 */
std::string md5_hex(std::string_view data);

} // namespace rpipe::chunk
