#pragma once

#include "rpipe/core/result.hpp"

#include <cstddef>
#include <functional>

namespace rpipe {

/**
 * @brief Receives successive pieces of a byte stream
 *
 * Returning an error stops the producer of the stream, which propagates
 * that error to its own caller.
 */
using ByteConsumer = std::function<Result<void>(const char* data, std::size_t size)>;

} // namespace rpipe
