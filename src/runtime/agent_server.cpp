#include "runtime/agent_server.hpp"

#include <chrono>
#include <thread>
#include <utility>
#include "core/logging/logger.hpp"

namespace relay::runtime {

using core::errors::ErrorCategory;
using core::errors::RelayError;

AgentServer::AgentServer(protocol::ServerDescriptor descriptor)
    : descriptor_(std::move(descriptor)) {}

AgentServer::~AgentServer() {
    shutdown();
}

core::errors::Result<std::unique_ptr<AgentServer>> AgentServer::start(
    const protocol::ServerDescriptor& descriptor,
    const core::config::RuntimeConfig& config,
    const bootstrap::Bootstrapper& bootstrapper, const process::Launcher& launcher) {
    LOG_INFO("MCP_SERVER", "Starting MCP server setup for '" + descriptor.name + "'");
    const auto setup_start = std::chrono::steady_clock::now();

    auto prepared = bootstrapper.prepare(descriptor, config);
    if (core::errors::is_error(prepared)) {
        return core::errors::get_error(prepared);
    }

    auto launched = launcher.launch(descriptor, config);
    if (core::errors::is_error(launched)) {
        return core::errors::get_error(launched);
    }
    auto& process = core::errors::get_value(launched);

    // From here on the destructor owns cleanup of whatever has been built.
    std::unique_ptr<AgentServer> server(new AgentServer(descriptor));
    server->handle_ = std::make_shared<session::ProcessHandle>(std::move(process.child));
    server->drain_ = std::make_unique<session::StderrDrain>(
        descriptor.name, std::move(process.stderr_fd), server->handle_);
    server->drain_->start();

    LOG_DEBUG("MCP_SERVER", "Waiting for process initialization (" +
                                std::to_string(config.process_init_wait.count()) + "ms)");
    std::this_thread::sleep_for(config.process_init_wait);

    if (!server->handle_->is_alive()) {
        return RelayError{ErrorCategory::Launch,
                          "Process exited during initialization",
                          "immediate_exit",
                          "Check the STDERR_MONITOR lines above for the agent's output."};
    }

    auto session = std::make_unique<session::ProtocolSession>(
        std::move(process.stdin_fd), std::move(process.stdout_fd), server->handle_,
        config.response_timeout);
    server->actor_ = std::make_unique<session::SessionActor>(std::move(session));

    const auto total_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - setup_start)
                              .count();
    LOG_INFO("MCP_SERVER", "MCP server '" + descriptor.name +
                               "' started successfully - Total setup time: " +
                               std::to_string(total_ms) + "ms");
    return std::move(server);
}

void AgentServer::shutdown() {
    if (actor_) {
        actor_->close();
    }
    // Killing the process first makes an in-flight read see EOF immediately.
    if (handle_) {
        handle_->terminate();
    }
    if (actor_) {
        actor_->shutdown();
    }
    if (drain_) {
        // Give the drain a moment to report the exit before forcing it down.
        static_cast<void>(drain_->wait_finished(std::chrono::milliseconds(500)));
        drain_->stop();
    }
}

}  // namespace relay::runtime
