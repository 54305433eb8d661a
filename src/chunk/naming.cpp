#include "rpipe/chunk/naming.hpp"

#include <limits>

namespace rpipe::chunk {
namespace {

constexpr std::uint64_t kRadix = 26;

} // namespace

std::uint64_t name_capacity(std::size_t width) noexcept {
    std::uint64_t capacity = 1;
    for (std::size_t i = 0; i < width; ++i) {
        if (capacity > std::numeric_limits<std::uint64_t>::max() / kRadix) {
            return std::numeric_limits<std::uint64_t>::max();
        }
        capacity *= kRadix;
    }
    return capacity;
}

Result<std::string> chunk_name(std::uint64_t index, std::size_t width, std::string_view prefix) {
    const std::uint64_t capacity = name_capacity(width);
    if (index >= capacity && capacity != std::numeric_limits<std::uint64_t>::max()) {
        return Err<std::string>(ErrorKind::NamingOverflow,
                                "chunk index " + std::to_string(index) + " does not fit in " +
                                std::to_string(width) + " letters; increase the chunk size");
    }

    std::string letters(width, 'a');
    std::uint64_t n = index;
    for (std::size_t pos = width; pos > 0 && n != 0; --pos) {
        letters[pos - 1] = static_cast<char>('a' + n % kRadix);
        n /= kRadix;
    }

    std::string name(prefix);
    name += letters;
    return Ok(name);
}

std::optional<std::uint64_t> chunk_index(std::string_view name, std::size_t width, std::string_view prefix) {
    if (name.size() != prefix.size() + width || name.substr(0, prefix.size()) != prefix) {
        return std::nullopt;
    }

    std::uint64_t index = 0;
    for (char c : name.substr(prefix.size())) {
        if (c < 'a' || c > 'z') {
            return std::nullopt;
        }
        if (index > (std::numeric_limits<std::uint64_t>::max() - 25) / kRadix) {
            return std::nullopt;
        }
        index = index * kRadix + static_cast<std::uint64_t>(c - 'a');
    }
    return index;
}

bool is_chunk_name(std::string_view name, std::size_t width, std::string_view prefix) {
    return chunk_index(name, width, prefix).has_value();
}

std::string parity_name(std::string_view chunk_name) {
    std::string name(chunk_name);
    name += kParitySuffix;
    return name;
}

} // namespace rpipe::chunk
