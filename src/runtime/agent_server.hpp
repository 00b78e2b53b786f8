#pragma once

#include <memory>
#include "bootstrap/bootstrapper.hpp"
#include "core/config/settings.hpp"
#include "core/errors/relay_errors.hpp"
#include "process/launcher.hpp"
#include "protocol/server_descriptor.hpp"
#include "session/process_handle.hpp"
#include "session/session_actor.hpp"
#include "session/stderr_drain.hpp"

namespace relay::runtime {

// One bootstrapped, launched and monitored agent process plus the session that
// serializes queries onto it. shutdown() (also run by the destructor) stops the
// session, kills the process and joins the stderr drain, in that order.
class AgentServer {
public:
    static core::errors::Result<std::unique_ptr<AgentServer>> start(
        const protocol::ServerDescriptor& descriptor,
        const core::config::RuntimeConfig& config,
        const bootstrap::Bootstrapper& bootstrapper = bootstrap::Bootstrapper(),
        const process::Launcher& launcher = process::Launcher());

    ~AgentServer();

    AgentServer(const AgentServer&) = delete;
    AgentServer& operator=(const AgentServer&) = delete;

    session::SessionActor& session() { return *actor_; }
    session::ProcessHandle& process() { return *handle_; }
    session::StderrDrain& stderr_drain() { return *drain_; }
    const protocol::ServerDescriptor& descriptor() const { return descriptor_; }

    void shutdown();

private:
    explicit AgentServer(protocol::ServerDescriptor descriptor);

    protocol::ServerDescriptor descriptor_;
    std::shared_ptr<session::ProcessHandle> handle_;
    std::unique_ptr<session::StderrDrain> drain_;
    std::unique_ptr<session::SessionActor> actor_;
};

}  // namespace relay::runtime
