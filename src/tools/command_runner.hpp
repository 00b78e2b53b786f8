#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include "core/errors/relay_errors.hpp"
#include "process/child_process.hpp"

namespace relay::tools {

struct CommandOutput {
    process::ExitStatus status;
    bool timed_out = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;

    bool success() const { return !timed_out && status.success(); }
};

struct CommandRequest {
    process::Invocation invocation;
    std::filesystem::path working_directory;
    // Zero waits without limit.
    std::chrono::milliseconds timeout{0};
};

// Runs a command to completion with stdin on /dev/null, capturing stdout and
// stderr. Only a failure to start is an error; a non-zero exit is reported in
// CommandOutput.
core::errors::Result<CommandOutput> run_command(const CommandRequest& request);

}  // namespace relay::tools
