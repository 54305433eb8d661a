#pragma once

#include "rpipe/core/result.hpp"
#include "rpipe/core/stream.hpp"

#include <string>
#include <vector>

namespace rpipe {

struct CommandOutput {
    int exit_status = 0;
    std::string stdout_text;
};

/**
 * @brief Run an external program and wait for it
 *
 * The child's stdout is redirected to stderr so that tools never write into
 * a replayed stream. Returns the exit status (128 + signal number for a
 * signalled child); spawning failures are Io errors.
 */
Result<int> run_command(const std::vector<std::string>& argv);

/**
 * @brief Run an external program and collect everything it writes to stdout
 */
Result<CommandOutput> capture_command(const std::vector<std::string>& argv);

/**
 * @brief Run an external program, handing its stdout to @p consumer in
 *        pieces of at most @p block_size bytes
 *
 * If the consumer fails, the pipe is closed, the child is reaped and the
 * consumer's error is returned.
 */
Result<int> stream_command(const std::vector<std::string>& argv,
                           const ByteConsumer& consumer,
                           std::size_t block_size);

std::string format_command(const std::vector<std::string>& argv);

} // namespace rpipe
