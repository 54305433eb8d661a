#include "rpipe/core/config.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <initializer_list>
#include <limits>
#include <sstream>
#include <system_error>

namespace rpipe {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

Result<void> type_error(const std::string& key, const std::string& expected) {
    return Err<void>(ErrorKind::InvalidConfig,
                     "config key '" + key + "' must be " + expected);
}

Result<void> read_size(const json& j, const char* key, std::size_t& out) {
    auto it = j.find(key);
    if (it == j.end()) {
        return Ok();
    }
    if (!it->is_number_unsigned()) {
        return type_error(key, "a non-negative integer");
    }
    out = it->get<std::size_t>();
    return Ok();
}

Result<void> read_unsigned(const json& j, const char* key, unsigned& out) {
    auto it = j.find(key);
    if (it == j.end()) {
        return Ok();
    }
    if (!it->is_number_unsigned() ||
        it->get<std::uint64_t>() > std::numeric_limits<unsigned>::max()) {
        return type_error(key, "a non-negative integer no larger than " +
                                   std::to_string(std::numeric_limits<unsigned>::max()));
    }
    out = it->get<unsigned>();
    return Ok();
}

Result<void> read_bool(const json& j, const char* key, bool& out) {
    auto it = j.find(key);
    if (it == j.end()) {
        return Ok();
    }
    if (!it->is_boolean()) {
        return type_error(key, "a boolean");
    }
    out = it->get<bool>();
    return Ok();
}

Result<void> read_string(const json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end()) {
        return Ok();
    }
    if (!it->is_string()) {
        return type_error(key, "a string");
    }
    out = it->get<std::string>();
    return Ok();
}

} // namespace

Result<void> SessionConfig::validate() const {
    if (destination.empty()) {
        return Err<void>(ErrorKind::InvalidConfig, "destination must not be empty");
    }
    if (chunk_size == 0) {
        return Err<void>(ErrorKind::InvalidConfig, "chunk size must be > 0");
    }
    if (block_size == 0) {
        return Err<void>(ErrorKind::InvalidConfig, "block size must be > 0");
    }
    if (block_size > chunk_size) {
        return Err<void>(ErrorKind::InvalidConfig, "block size must not exceed chunk size");
    }
    if (jobs == 0) {
        return Err<void>(ErrorKind::InvalidConfig, "jobs must be > 0");
    }
    if (name_width == 0) {
        return Err<void>(ErrorKind::InvalidConfig, "chunk name width must be > 0");
    }
    if (chunk_prefix.find_first_of(" \t\r\n") != std::string::npos ||
        manifest_name.find_first_of(" \t\r\n") != std::string::npos) {
        return Err<void>(ErrorKind::InvalidConfig, "object names must not contain whitespace");
    }

    std::error_code ec;
    if (!fs::is_directory(scratch_dir, ec)) {
        return Err<void>(ErrorKind::InvalidConfig,
                         "scratch directory does not exist: " + scratch_dir.string());
    }
    return Ok();
}

Result<void> apply_config_json(const std::string& text, SessionConfig& config) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        return Err<void>(ErrorKind::InvalidConfig, std::string("malformed config: ") + e.what());
    }

    if (!j.is_object()) {
        return Err<void>(ErrorKind::InvalidConfig, "config must be a JSON object");
    }

    std::string scratch = config.scratch_dir.string();
    std::string backend = backend_name(config.backend);

    for (auto res : {read_string(j, "destination", config.destination),
                     read_size(j, "chunk_size", config.chunk_size),
                     read_size(j, "block_size", config.block_size),
                     read_size(j, "jobs", config.jobs),
                     read_string(j, "scratch_dir", scratch),
                     read_bool(j, "verify_only", config.verify_only),
                     read_bool(j, "skip_checksum", config.skip_checksum),
                     read_bool(j, "create_parity", config.create_parity),
                     read_bool(j, "attempt_repair", config.attempt_repair),
                     read_string(j, "backend", backend),
                     read_string(j, "rclone_binary", config.rclone_binary),
                     read_unsigned(j, "rclone_retries", config.rclone_retries),
                     read_string(j, "par2_binary", config.par2_binary),
                     read_unsigned(j, "parity_redundancy", config.parity_redundancy),
                     read_string(j, "log_level", config.log_level)}) {
        if (res.is_error()) {
            return res;
        }
    }

    config.scratch_dir = scratch;
    if (backend == "rclone") {
        config.backend = StoreBackend::Rclone;
    } else if (backend == "local") {
        config.backend = StoreBackend::Local;
    } else {
        return Err<void>(ErrorKind::InvalidConfig, "unknown backend: " + backend);
    }
    return Ok();
}

Result<void> load_config_file(const fs::path& path, SessionConfig& config) {
    std::ifstream input(path);
    if (!input) {
        return Err<void>(ErrorKind::InvalidConfig, "cannot open config file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return apply_config_json(buffer.str(), config);
}

const char* backend_name(StoreBackend backend) noexcept {
    switch (backend) {
        case StoreBackend::Rclone: return "rclone";
        case StoreBackend::Local: return "local";
    }
    return "unknown";
}

} // namespace rpipe
