#pragma once

#include <sys/types.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "core/errors/relay_errors.hpp"
#include "process/unique_fd.hpp"

namespace relay::process {

// A program plus its arguments; program is resolved through PATH.
struct Invocation {
    std::string program;
    std::vector<std::string> args;

    std::string to_string() const;
};

struct SpawnOptions {
    std::filesystem::path working_directory;  // empty keeps the parent's cwd
    bool pipe_stdin = true;
    bool pipe_stdout = true;
    bool pipe_stderr = true;
};

struct ExitStatus {
    int exit_code = -1;  // valid when signal == 0
    int signal = 0;

    bool success() const { return signal == 0 && exit_code == 0; }
    std::string to_string() const;
};

// Owns a spawned child. Unless the child has already been reaped, the
// destructor sends SIGKILL and waits for it, so no process outlives its owner.
class ChildProcess {
public:
    static core::errors::Result<std::unique_ptr<ChildProcess>> spawn(
        const Invocation& invocation, const SpawnOptions& options = {});

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const { return pid_; }

    // Non-blocking; returns the cached status once the child has been reaped.
    core::errors::Result<std::optional<ExitStatus>> try_wait();

    // Blocks until the child exits.
    core::errors::Result<ExitStatus> wait();

    // SIGKILL then reap. No-op when already reaped.
    void kill_and_reap();

    // Hand the pipe ends to the caller; an empty UniqueFd means the stream was
    // not piped or was already taken.
    UniqueFd take_stdin() { return std::move(stdin_); }
    UniqueFd take_stdout() { return std::move(stdout_); }
    UniqueFd take_stderr() { return std::move(stderr_); }

private:
    explicit ChildProcess(pid_t pid);

    pid_t pid_ = -1;
    std::optional<ExitStatus> status_;
    UniqueFd stdin_;
    UniqueFd stdout_;
    UniqueFd stderr_;
};

// Writes to a peer whose stdin is closed must surface as EPIPE, not kill us.
void ignore_sigpipe();

}  // namespace relay::process
