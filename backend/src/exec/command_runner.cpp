/**
 * ShellCommandRunner — popen-based command execution.
 */

#include "exec/command_runner.h"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sys/wait.h>

ShellCommandRunner::ShellCommandRunner(asio::io_context& io)
    : io_(io) {}

ShellCommandRunner::~ShellCommandRunner() {
    pool_.join();
}

void ShellCommandRunner::run(const std::string& command, Completion on_done) {
    auto work = asio::make_work_guard(io_);
    asio::post(pool_, [this, command, on_done = std::move(on_done), work]() mutable {
        CommandOutput result = execute(command);
        asio::post(io_, [on_done = std::move(on_done), result = std::move(result)]() mutable {
            on_done(std::move(result));
        });
        work.reset();
    });
}

CommandOutput ShellCommandRunner::execute(const std::string& command) {
    CommandOutput result;

    const std::string line = command + " 2>&1";
    FILE* pipe = ::popen(line.c_str(), "r");
    if (pipe == nullptr) {
        result.output = std::string("failed to start command: ") + std::strerror(errno);
        result.exit_code = -1;
        return result;
    }

    std::array<char, 4096> buffer{};
    bool truncated = false;
    std::size_t n = 0;
    while ((n = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        const std::size_t room = kMaxOutputBytes - result.output.size();
        result.output.append(buffer.data(), std::min(n, room));
        if (n > room) {
            truncated = true;
            break;
        }
    }
    if (truncated) result.output += "\n[output truncated]";

    // Once the read end is closed a command still writing dies of SIGPIPE,
    // so pclose returns even for one that never ends on its own.

    const int status = ::pclose(pipe);
    if (status == -1) {
        result.exit_code = -1;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else {
        result.exit_code = -1;
    }
    return result;
}
