#pragma once

#include <asio.hpp>
#include <functional>
#include <string>

struct CommandOutput {
    std::string output;     // stdout and stderr, interleaved
    int         exit_code = 0;
};

/**
 * Runs an approved command and reports its output on the event loop.
 */
class CommandRunner {
public:
    using Completion = std::function<void(CommandOutput result)>;

    virtual ~CommandRunner() = default;
    virtual void run(const std::string& command, Completion on_done) = 0;
};

/**
 * Runs commands through /bin/sh on a worker thread so the event loop
 * keeps serving peers. The completion is posted back to @p io.
 */
class ShellCommandRunner : public CommandRunner {
public:
    explicit ShellCommandRunner(asio::io_context& io);
    ~ShellCommandRunner() override;

    void run(const std::string& command, Completion on_done) override;

    /// Run synchronously. Reading stops at kMaxOutputBytes and the pipe is
    /// closed, so a command that keeps writing is ended by SIGPIPE.
    static CommandOutput execute(const std::string& command);

    static constexpr std::size_t kMaxOutputBytes = 1024 * 1024;

private:
    asio::io_context& io_;
    asio::thread_pool pool_{1};
};
