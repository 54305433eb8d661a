#include "rpipe/ledger/ledger.hpp"

#include "rpipe/chunk/naming.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <sstream>
#include <system_error>
#include <unistd.h>

namespace rpipe::ledger {
namespace fs = std::filesystem;

namespace {

struct FileCloser {
    void operator()(std::FILE* f) const noexcept {
        if (f) {
            std::fclose(f);
        }
    }
};

Result<void> write_durably(const fs::path& path, const std::string& text) {
    std::unique_ptr<std::FILE, FileCloser> out(std::fopen(path.c_str(), "wb"));
    if (!out) {
        return Err<void>(ErrorKind::Io, "cannot create " + path.string() + ": " + std::strerror(errno));
    }
    if (std::fwrite(text.data(), 1, text.size(), out.get()) != text.size() ||
        std::fflush(out.get()) != 0 ||
        ::fsync(::fileno(out.get())) != 0) {
        return Err<void>(ErrorKind::Io, "cannot write " + path.string() + ": " + std::strerror(errno));
    }
    if (std::fclose(out.release()) != 0) {
        return Err<void>(ErrorKind::Io, "cannot close " + path.string());
    }
    return Ok();
}

} // namespace

void LedgerWriter::add_chunk(std::string name, std::string digest) {
    entries_.emplace_back(std::move(name), std::move(digest));
}

std::string LedgerWriter::serialize() const {
    std::ostringstream oss;
    for (const auto& [name, digest] : entries_) {
        oss << digest << "  " << name << '\n';
    }
    oss << total_digest_ << "  " << chunk::kTotalKey << '\n';
    return oss.str();
}

Result<void> LedgerWriter::publish(store::ObjectStore& store, const SessionConfig& config) const {
    const fs::path local = config.scratch_dir / config.manifest_name;

    if (auto res = write_durably(local, serialize()); res.is_error()) {
        std::error_code ec;
        fs::remove(local, ec);
        return res;
    }

    auto res = store.put(local, config.manifest_name);

    std::error_code ec;
    fs::remove(local, ec);
    if (ec) {
        spdlog::warn("cannot remove local manifest {}: {}", local.string(), ec.message());
    }

    if (res.is_error()) {
        return Err<void>(ErrorKind::FatalTransmission, res.error().message, config.manifest_name);
    }
    return Ok();
}

LedgerMap parse_ledger(std::string_view text) {
    LedgerMap ledger;
    std::istringstream lines{std::string(text)};
    std::string line;
    while (std::getline(lines, line)) {
        std::istringstream tokens(line);
        std::string digest;
        std::string name;
        if (!(tokens >> digest >> name)) {
            continue;
        }
        ledger[name] = digest;
    }
    return ledger;
}

Result<LedgerMap> fetch_ledger(store::ObjectStore& store, const SessionConfig& config) {
    auto text = store::fetch_to_string(store, config.manifest_name, config.block_size);
    if (text.is_error()) {
        return Err<LedgerMap>(text.error());
    }
    return Ok(parse_ledger(text.value()));
}

std::vector<std::pair<std::string, std::string>> chunk_entries(const LedgerMap& ledger) {
    std::vector<std::pair<std::string, std::string>> entries;
    entries.reserve(ledger.size());
    for (const auto& [name, digest] : ledger) {
        if (name != chunk::kTotalKey) {
            entries.emplace_back(name, digest);
        }
    }
    return entries;
}

} // namespace rpipe::ledger
