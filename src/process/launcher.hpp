#pragma once

#include <chrono>
#include <memory>
#include <vector>
#include "core/config/settings.hpp"
#include "core/errors/relay_errors.hpp"
#include "process/child_process.hpp"
#include "process/language_runtime.hpp"
#include "protocol/server_descriptor.hpp"

namespace relay::process {

// A running agent process with its three standard streams handed out.
struct LaunchedProcess {
    std::unique_ptr<ChildProcess> child;
    UniqueFd stdin_fd;
    UniqueFd stdout_fd;
    UniqueFd stderr_fd;
};

class Launcher {
public:
    explicit Launcher(std::vector<LanguageRuntime> runtimes = default_language_runtimes(),
                      std::chrono::milliseconds grace = std::chrono::milliseconds(100));

    // "<interpreter> <absolute entrypoint>" for a verified descriptor.
    core::errors::Result<Invocation> build_invocation(
        const protocol::ServerDescriptor& descriptor,
        const core::config::RuntimeConfig& config) const;

    // Spawns with all streams piped, waits the grace interval and fails with
    // immediate_exit if the process is already gone. On any failure the child
    // is killed before returning.
    core::errors::Result<LaunchedProcess> launch_invocation(
        const Invocation& invocation) const;

    core::errors::Result<LaunchedProcess> launch(
        const protocol::ServerDescriptor& descriptor,
        const core::config::RuntimeConfig& config) const;

private:
    std::vector<LanguageRuntime> runtimes_;
    std::chrono::milliseconds grace_;
};

}  // namespace relay::process
