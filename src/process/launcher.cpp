#include "process/launcher.hpp"

#include <system_error>
#include <thread>
#include <utility>
#include "core/logging/logger.hpp"

namespace relay::process {

using core::errors::ErrorCategory;
using core::errors::RelayError;

Launcher::Launcher(std::vector<LanguageRuntime> runtimes,
                   const std::chrono::milliseconds grace)
    : runtimes_(std::move(runtimes)), grace_(grace) {}

core::errors::Result<Invocation> Launcher::build_invocation(
    const protocol::ServerDescriptor& descriptor,
    const core::config::RuntimeConfig& config) const {
    if (!config.supports_language(descriptor.language)) {
        return RelayError{ErrorCategory::Launch,
                          "Unsupported language: " + descriptor.language +
                              " (supported: " +
                              core::config::join_list(config.supported_languages) + ")",
                          "unsupported_language"};
    }

    const auto runtime = find_runtime(runtimes_, descriptor.language);
    if (!runtime.has_value()) {
        return RelayError{ErrorCategory::Launch,
                          "Language '" + descriptor.language +
                              "' is supported but not implemented",
                          "unsupported_language"};
    }

    std::filesystem::path entrypoint =
        config.servers_dir / descriptor.name / descriptor.entrypoint;
    std::error_code ec;
    const auto absolute = std::filesystem::absolute(entrypoint, ec);
    if (!ec) {
        entrypoint = absolute;
    }
    return Invocation{runtime->interpreter, {entrypoint.lexically_normal().string()}};
}

core::errors::Result<LaunchedProcess> Launcher::launch_invocation(
    const Invocation& invocation) const {
    LOG_INFO("LAUNCHER", "Starting process: " + invocation.to_string());

    const auto process_start = std::chrono::steady_clock::now();
    auto spawned = ChildProcess::spawn(invocation);
    if (core::errors::is_error(spawned)) {
        LOG_ERROR("LAUNCHER", "Failed to spawn process: " +
                                  core::errors::get_error(spawned).message);
        return core::errors::get_error(spawned);
    }
    LaunchedProcess launched;
    launched.child = std::move(core::errors::get_value(spawned));
    LOG_INFO("LAUNCHER", "Process spawned with PID: " +
                             std::to_string(launched.child->pid()));

    std::this_thread::sleep_for(grace_);

    auto status = launched.child->try_wait();
    if (core::errors::is_error(status)) {
        LOG_ERROR("LAUNCHER", core::errors::get_error(status).message);
        return core::errors::get_error(status);
    }
    if (core::errors::get_value(status).has_value()) {
        const std::string text = core::errors::get_value(status)->to_string();
        LOG_ERROR("LAUNCHER", "Process exited immediately with " + text);
        return RelayError{ErrorCategory::Launch,
                          "Process exited immediately with " + text,
                          "immediate_exit",
                          "Run the entrypoint by hand to see why it stops."};
    }

    const auto startup_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::steady_clock::now() - process_start)
                                .count();
    LOG_INFO("LAUNCHER", "Process is running healthy - PID: " +
                             std::to_string(launched.child->pid()) +
                             ", startup time: " + std::to_string(startup_ms) + "ms");

    launched.stdin_fd = launched.child->take_stdin();
    launched.stdout_fd = launched.child->take_stdout();
    launched.stderr_fd = launched.child->take_stderr();
    if (!launched.stdin_fd.valid() || !launched.stdout_fd.valid() ||
        !launched.stderr_fd.valid()) {
        return RelayError{ErrorCategory::Launch,
                          "Failed to obtain the process stdin/stdout/stderr pipes",
                          "stream_unavailable"};
    }
    return std::move(launched);
}

core::errors::Result<LaunchedProcess> Launcher::launch(
    const protocol::ServerDescriptor& descriptor,
    const core::config::RuntimeConfig& config) const {
    auto invocation = build_invocation(descriptor, config);
    if (core::errors::is_error(invocation)) {
        return core::errors::get_error(invocation);
    }
    return launch_invocation(core::errors::get_value(invocation));
}

}  // namespace relay::process
