#include "rpipe/chunk/digest.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace rpipe::chunk {

void DigestAccumulator::CtxDeleter::operator()(evp_md_ctx_st* ctx) const noexcept {
    EVP_MD_CTX_free(ctx);
}

DigestAccumulator::DigestAccumulator() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    reset();
}

DigestAccumulator::~DigestAccumulator() = default;
DigestAccumulator::DigestAccumulator(DigestAccumulator&&) noexcept = default;
DigestAccumulator& DigestAccumulator::operator=(DigestAccumulator&&) noexcept = default;

void DigestAccumulator::reset() {
    // MD5 can be unavailable under a FIPS-only provider; nothing to fall back to
    if (EVP_DigestInit_ex(ctx_.get(), EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex(md5) failed");
    }
    bytes_ = 0;
}

void DigestAccumulator::update(const void* data, std::size_t size) {
    if (size == 0) {
        return;
    }
    if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
    bytes_ += size;
}

std::string DigestAccumulator::hex_digest() const {
    std::unique_ptr<EVP_MD_CTX, CtxDeleter> copy(EVP_MD_CTX_new());
    if (!copy || EVP_MD_CTX_copy_ex(copy.get(), ctx_.get()) != 1) {
        throw std::runtime_error("EVP_MD_CTX_copy_ex failed");
    }

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_DigestFinal_ex(copy.get(), md, &md_len) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < md_len; ++i) {
        oss << std::setw(2) << static_cast<int>(md[i]);
    }
    return oss.str();
}

std::string md5_hex(std::string_view data) {
    DigestAccumulator acc;
    acc.update(data);
    return acc.hex_digest();
}

} // namespace rpipe::chunk
