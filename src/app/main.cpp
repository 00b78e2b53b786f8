#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <pthread.h>
#include <signal.h>
#include <string>
#include <thread>
#include "app/cli_parser.hpp"
#include "core/config/instance_id.hpp"
#include "core/config/settings.hpp"
#include "core/errors/relay_errors.hpp"
#include "core/logging/logger.hpp"
#include "gateway/auth.hpp"
#include "gateway/gateway_service.hpp"
#include "gateway/http_gateway.hpp"
#include "process/child_process.hpp"
#include "registry/server_registry.hpp"
#include "runtime/agent_server.hpp"

namespace {

std::atomic<relay::gateway::HttpGateway*> g_gateway{nullptr};

// Waits for SIGINT/SIGTERM until SIGUSR1 wakes the thread at exit. Every
// signal after the gateway exists asks it to stop.
void wait_for_signals(const sigset_t signals) {
    int received = 0;
    while (sigwait(&signals, &received) == 0) {
        if (received == SIGUSR1) {
            return;
        }
        auto* gateway = g_gateway.load();
        if (gateway == nullptr) {
            LOG_WARN("MAIN", "Interrupted while not serving (signal " +
                                 std::to_string(received) + ")");
            // Spawned children die with us through PR_SET_PDEATHSIG.
            std::_Exit(130);
        }
        LOG_INFO("MAIN", "Received signal " + std::to_string(received) + ", shutting down");
        gateway->stop();
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Block shutdown signals before any thread exists; one thread waits on them.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    sigaddset(&signals, SIGUSR1);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    relay::process::ignore_sigpipe();
    std::thread signal_thread(wait_for_signals, signals);

    auto finish = [&signal_thread](const int code) {
        if (signal_thread.joinable()) {
            pthread_kill(signal_thread.native_handle(), SIGUSR1);
            signal_thread.join();
        }
        return code;
    };

    // 2. Resolve configuration once: environment first, then CLI overrides
    relay::core::logging::Logger::get().set_instance_id(
        relay::core::config::generate_instance_id());
    LOG_INFO("MAIN", "Starting MCP HTTP server...");

    auto settings = relay::core::config::load_settings(relay::core::config::process_environment());
    auto action = relay::app::cli::apply_overrides(argc, argv, settings);
    if (relay::core::errors::is_error(action)) {
        const auto& err = relay::core::errors::get_error(action);
        LOG_ERROR("MAIN", "Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("MAIN", "Hint: " + err.hint);
        }
        return finish(2);
    }
    if (relay::core::errors::get_value(action) == relay::app::cli::CliAction::ShowHelp) {
        std::cout << relay::app::cli::usage() << std::endl;
        return finish(0);
    }
    relay::core::logging::Logger::get().set_min_level(settings.log_level);

    const auto& gateway_settings = settings.gateway;
    const auto& runtime_config = settings.runtime;
    LOG_INFO("MAIN", "Configuration loaded:");
    LOG_INFO("MAIN", "  - Config file: " + gateway_settings.config_file.string());
    LOG_INFO("MAIN", "  - Server name: " + gateway_settings.server_name);
    LOG_INFO("MAIN", "  - Servers dir: " + runtime_config.servers_dir.string());
    LOG_INFO("MAIN", "  - Response timeout: " +
                         std::to_string(runtime_config.response_timeout.count()) + "ms");
    LOG_INFO("MAIN", std::string("  - Auth enabled: ") +
                         (gateway_settings.auth_enabled() ? "true" : "false"));
    LOG_INFO("MAIN", std::string("  - API key present: ") +
                         (gateway_settings.api_key.has_value() ? "true" : "false"));
    LOG_INFO("MAIN", std::string("  - Disable auth flag: ") +
                         (gateway_settings.disable_auth ? "true" : "false"));

    // 3. Load the descriptor for the selected server
    auto registry = relay::registry::ServerRegistry::load_file(gateway_settings.config_file);
    if (relay::core::errors::is_error(registry)) {
        const auto& err = relay::core::errors::get_error(registry);
        LOG_ERROR("MAIN", "Config error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("MAIN", "Hint: " + err.hint);
        }
        return finish(2);
    }
    auto descriptor =
        relay::core::errors::get_value(registry).find(gateway_settings.server_name);
    if (relay::core::errors::is_error(descriptor)) {
        const auto& err = relay::core::errors::get_error(descriptor);
        LOG_ERROR("MAIN", "Config error [" + err.code + "]: " + err.message);
        return finish(2);
    }

    // 4. Bootstrap, launch and monitor the agent process
    LOG_INFO("MAIN", "Initializing MCP server...");
    auto started = relay::runtime::AgentServer::start(
        relay::core::errors::get_value(descriptor), runtime_config);
    if (relay::core::errors::is_error(started)) {
        const auto& err = relay::core::errors::get_error(started);
        LOG_ERROR("MAIN", "Failed to start MCP server [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("MAIN", "Hint: " + err.hint);
        }
        return finish(3);
    }
    auto& agent = relay::core::errors::get_value(started);

    // 5. Serve HTTP until a shutdown signal arrives
    LOG_INFO("MAIN", "Setting up HTTP server...");
    relay::gateway::GatewayService service(agent->session());
    relay::gateway::HttpGateway gateway(
        service, relay::gateway::AuthConfig::from_settings(gateway_settings));
    auto bound = gateway.bind(gateway_settings.host, gateway_settings.port);
    if (relay::core::errors::is_error(bound)) {
        LOG_ERROR("MAIN", relay::core::errors::get_error(bound).message);
        agent->shutdown();
        return finish(4);
    }

    // Stays published until finish() joins the signal thread, so a repeated
    // signal during teardown only repeats stop().
    g_gateway.store(&gateway);
    const bool served = gateway.listen();
    if (!served) {
        LOG_ERROR("MAIN", "Server error: listener stopped unexpectedly");
    }

    // 6. Explicit teardown: session, then process, then stderr drain
    LOG_INFO("MAIN", "Stopping MCP server...");
    agent->shutdown();
    LOG_INFO("MAIN", "Final process stats: " + agent->session().describe_stats());
    return finish(served ? 0 : 1);
}
