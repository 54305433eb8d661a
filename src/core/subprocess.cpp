#include "rpipe/core/subprocess.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <optional>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace rpipe {
namespace {

struct Child {
    pid_t pid = -1;
    int stdout_fd = -1;  ///< Read end of the stdout pipe, -1 when not captured
};

void write_exec_failure(const char* program) {
    // Only async-signal-safe calls between fork and _exit
    const char prefix[] = "rpipe: cannot execute ";
    (void)!::write(STDERR_FILENO, prefix, sizeof(prefix) - 1);
    (void)!::write(STDERR_FILENO, program, std::strlen(program));
    (void)!::write(STDERR_FILENO, "\n", 1);
}

Result<Child> spawn(const std::vector<std::string>& argv, bool capture_stdout) {
    if (argv.empty()) {
        return Err<Child>(ErrorKind::Io, "empty command line");
    }

    // Build argv before forking; the child must not allocate
    std::vector<std::string> storage(argv);
    std::vector<char*> args;
    args.reserve(storage.size() + 1);
    for (auto& s : storage) {
        args.push_back(s.data());
    }
    args.push_back(nullptr);

    int fds[2] = {-1, -1};
    if (capture_stdout && ::pipe2(fds, O_CLOEXEC) != 0) {
        return Err<Child>(ErrorKind::Io, std::string("pipe failed: ") + std::strerror(errno));
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        if (capture_stdout) {
            ::close(fds[0]);
            ::close(fds[1]);
        }
        return Err<Child>(ErrorKind::Io, std::string("fork failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        if (capture_stdout) {
            ::dup2(fds[1], STDOUT_FILENO);
        } else {
            ::dup2(STDERR_FILENO, STDOUT_FILENO);
        }
        ::execvp(args[0], args.data());
        write_exec_failure(args[0]);
        ::_exit(127);
    }

    Child child;
    child.pid = pid;
    if (capture_stdout) {
        ::close(fds[1]);
        child.stdout_fd = fds[0];
    }
    return Ok(child);
}

Result<int> reap(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return Err<int>(ErrorKind::Io, std::string("waitpid failed: ") + std::strerror(errno));
        }
    }
    if (WIFEXITED(status)) {
        return Ok(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return Ok(128 + WTERMSIG(status));
    }
    return Ok(1);
}

} // namespace

std::string format_command(const std::vector<std::string>& argv) {
    std::string line;
    for (const auto& arg : argv) {
        if (!line.empty()) {
            line += ' ';
        }
        line += arg;
    }
    return line;
}

Result<int> run_command(const std::vector<std::string>& argv) {
    spdlog::debug("exec: {}", format_command(argv));
    auto child = spawn(argv, false);
    if (child.is_error()) {
        return Err<int>(child.error());
    }
    return reap(child.value().pid);
}

Result<int> stream_command(const std::vector<std::string>& argv,
                           const ByteConsumer& consumer,
                           std::size_t block_size) {
    spdlog::debug("exec: {}", format_command(argv));
    auto spawned = spawn(argv, true);
    if (spawned.is_error()) {
        return Err<int>(spawned.error());
    }
    const Child child = spawned.value();

    std::vector<char> buffer(block_size == 0 ? 4096 : block_size);
    std::optional<Error> failure;
    while (true) {
        const ssize_t n = ::read(child.stdout_fd, buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            failure = Error(ErrorKind::Io, std::string("read from child failed: ") + std::strerror(errno));
            break;
        }
        if (n == 0) {
            break;
        }
        auto res = consumer(buffer.data(), static_cast<std::size_t>(n));
        if (res.is_error()) {
            failure = res.error();
            break;
        }
    }
    ::close(child.stdout_fd);

    auto status = reap(child.pid);
    if (failure) {
        return Err<int>(*failure);
    }
    return status;
}

Result<CommandOutput> capture_command(const std::vector<std::string>& argv) {
    CommandOutput output;
    auto status = stream_command(argv, [&output](const char* data, std::size_t size) -> Result<void> {
        output.stdout_text.append(data, size);
        return Ok();
    }, 4096);
    if (status.is_error()) {
        return Err<CommandOutput>(status.error());
    }
    output.exit_status = status.value();
    return Ok(output);
}

} // namespace rpipe
