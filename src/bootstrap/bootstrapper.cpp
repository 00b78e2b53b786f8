#include "bootstrap/bootstrapper.hpp"

#include <sstream>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"
#include "tools/command_runner.hpp"

namespace relay::bootstrap {

using core::errors::ErrorCategory;
using core::errors::RelayError;
using protocol::ServerDescriptor;

namespace {

bool path_exists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec) && !ec;
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string ms_text(const double ms) {
    return std::to_string(static_cast<long long>(ms)) + "ms";
}

}  // namespace

std::string to_string(const InstallMode mode) {
    switch (mode) {
        case InstallMode::Shell:
            return "shell";
        case InstallMode::Direct:
            return "direct";
        default:
            return "unknown";
    }
}

core::errors::Result<InstallPlan> plan_install_command(const std::string& command) {
    InstallPlan plan;
    if (command.find("&&") != std::string::npos ||
        command.find("||") != std::string::npos) {
        plan.mode = InstallMode::Shell;
        plan.invocation = process::Invocation{"sh", {"-c", command}};
        return plan;
    }

    std::istringstream words(command);
    std::vector<std::string> parts;
    std::string word;
    while (words >> word) {
        parts.push_back(word);
    }
    if (parts.empty()) {
        return RelayError{ErrorCategory::Setup, "Empty install command",
                          "install_failed"};
    }

    plan.mode = InstallMode::Direct;
    plan.invocation.program = parts.front();
    plan.invocation.args.assign(parts.begin() + 1, parts.end());
    return plan;
}

Bootstrapper::Bootstrapper(std::vector<process::LanguageRuntime> runtimes)
    : runtimes_(std::move(runtimes)) {}

core::errors::Status Bootstrapper::fetch_source(
    const std::string& repository, const std::filesystem::path& server_dir,
    const core::config::RuntimeConfig& config) const {
    const std::string url = config.repository_base_url + repository;
    LOG_INFO("SETUP", "Cloning " + url + " to " + server_dir.string());

    std::error_code ec;
    std::filesystem::create_directories(server_dir.parent_path(), ec);
    if (ec) {
        return RelayError{ErrorCategory::Setup,
                          "Unable to create servers directory: " +
                              server_dir.parent_path().string(),
                          "fetch_failed"};
    }

    tools::CommandRequest request;
    request.invocation = process::Invocation{"git", {"clone", url, server_dir.string()}};
    request.timeout = config.install_timeout;
    auto output = tools::run_command(request);
    if (core::errors::is_error(output)) {
        const auto& err = core::errors::get_error(output);
        LOG_ERROR("SETUP", "Failed to execute git: " + err.message);
        return RelayError{ErrorCategory::Setup, "Failed to execute git: " + err.message,
                          "fetch_failed"};
    }

    const auto& capture = core::errors::get_value(output);
    if (!capture.success()) {
        const std::string reason = capture.timed_out ? "timed out" : capture.status.to_string();
        LOG_ERROR("SETUP", "Git clone failed (" + reason + "): " + capture.stderr_text);
        return RelayError{ErrorCategory::Setup,
                          "Git clone failed (" + reason + "): " + capture.stderr_text,
                          "fetch_failed"};
    }

    LOG_INFO("SETUP", "Repository cloned successfully in " + ms_text(capture.duration_ms));
    return core::errors::ok();
}

core::errors::Status Bootstrapper::run_install(
    const std::string& install_command, const std::filesystem::path& server_dir,
    const core::config::RuntimeConfig& config) const {
    LOG_INFO("SETUP", "Installing dependencies: " + install_command);

    auto planned = plan_install_command(install_command);
    if (core::errors::is_error(planned)) {
        return core::errors::get_error(planned);
    }
    const auto& plan = core::errors::get_value(planned);
    LOG_DEBUG("SETUP", "Install mode: " + to_string(plan.mode) + " -> " +
                           plan.invocation.to_string());

    tools::CommandRequest request;
    request.invocation = plan.invocation;
    request.working_directory = server_dir;
    request.timeout = config.install_timeout;
    auto output = tools::run_command(request);
    if (core::errors::is_error(output)) {
        const auto& err = core::errors::get_error(output);
        LOG_ERROR("SETUP", "Failed to execute install command via " +
                               to_string(plan.mode) + ": " + err.message);
        return RelayError{ErrorCategory::Setup,
                          "Failed to execute install command via " +
                              to_string(plan.mode) + ": " + err.message,
                          "install_failed"};
    }

    const auto& capture = core::errors::get_value(output);
    if (!capture.success()) {
        LOG_ERROR("SETUP", "Install command failed: " + capture.stderr_text);
        LOG_ERROR("SETUP", "Install command stdout: " + capture.stdout_text);
        const std::string reason = capture.timed_out ? "timed out" : capture.status.to_string();
        return RelayError{ErrorCategory::Setup,
                          "Install command failed (" + reason + "): " +
                              capture.stderr_text + "\nstdout: " + capture.stdout_text,
                          "install_failed"};
    }

    LOG_INFO("SETUP", "Dependencies installed in " + ms_text(capture.duration_ms));
    return core::errors::ok();
}

core::errors::Status Bootstrapper::probe_runtime(
    const std::string& language, const core::config::RuntimeConfig& config) const {
    const auto runtime = process::find_runtime(runtimes_, language);
    if (!runtime.has_value()) {
        return core::errors::ok();
    }
    LOG_DEBUG("SETUP", "Testing " + language + " runtime: " + runtime->interpreter);

    tools::CommandRequest request;
    request.invocation = process::Invocation{runtime->interpreter, runtime->probe_args};
    request.timeout = config.install_timeout;
    auto output = tools::run_command(request);
    if (core::errors::is_error(output)) {
        const auto& err = core::errors::get_error(output);
        LOG_ERROR("SETUP", runtime->interpreter + " not found: " + err.message);
        return RelayError{ErrorCategory::Setup,
                          runtime->interpreter + " not found: " + err.message,
                          "runtime_unavailable",
                          "Install the interpreter or put it on PATH."};
    }

    const auto& capture = core::errors::get_value(output);
    if (!capture.success()) {
        LOG_ERROR("SETUP", runtime->interpreter + " is not working");
        return RelayError{ErrorCategory::Setup,
                          runtime->interpreter + " is not working (" +
                              capture.status.to_string() + ")",
                          "runtime_unavailable"};
    }

    // Older pythons print their version on stderr.
    const std::string version = trim(capture.stdout_text.empty() ? capture.stderr_text
                                                                 : capture.stdout_text);
    LOG_INFO("SETUP", runtime->interpreter + " version: " + version);
    return core::errors::ok();
}

core::errors::Result<std::filesystem::path> Bootstrapper::prepare(
    const ServerDescriptor& descriptor, const core::config::RuntimeConfig& config) const {
    LOG_DEBUG("SETUP", "Setting up MCP server: " + descriptor.name);

    if (!config.supports_server_type(descriptor.type)) {
        const std::string message =
            "Unsupported server type: " + descriptor.type +
            " (supported: " + core::config::join_list(config.supported_server_types) + ")";
        LOG_ERROR("SETUP", message);
        return RelayError{ErrorCategory::Setup, message, "unsupported_type"};
    }

    if (!descriptor.repository.has_value() || descriptor.repository->empty()) {
        return RelayError{ErrorCategory::Setup, "GitHub repository not specified",
                          "missing_source",
                          "Add a \"repository\" field to the server descriptor."};
    }

    const std::filesystem::path server_dir = config.servers_dir / descriptor.name;
    LOG_DEBUG("SETUP", "Target directory: " + server_dir.string());

    bool need_install = false;
    if (!path_exists(server_dir)) {
        auto fetched = fetch_source(*descriptor.repository, server_dir, config);
        if (core::errors::is_error(fetched)) {
            return core::errors::get_error(fetched);
        }
        need_install = true;
    } else {
        LOG_DEBUG("SETUP", "Directory " + server_dir.string() +
                               " already exists, skipping clone");
    }

    const std::filesystem::path entrypoint_path = server_dir / descriptor.entrypoint;
    if (!path_exists(entrypoint_path)) {
        LOG_WARN("SETUP", "Entrypoint not found: " + entrypoint_path.string() +
                              ", will run install command");
        need_install = true;
    }

    if (need_install) {
        if (descriptor.install_command.has_value()) {
            auto installed = run_install(*descriptor.install_command, server_dir, config);
            if (core::errors::is_error(installed)) {
                return core::errors::get_error(installed);
            }
        } else {
            LOG_WARN("SETUP", "Entrypoint missing but no install command specified");
        }
    }

    LOG_DEBUG("SETUP", "Final check - entrypoint: " + entrypoint_path.string());
    if (!path_exists(entrypoint_path)) {
        LOG_ERROR("SETUP", "Entrypoint not found: " + entrypoint_path.string());
        return RelayError{ErrorCategory::Setup,
                          "Entrypoint not found: " + entrypoint_path.string(),
                          "entrypoint_missing"};
    }
    LOG_DEBUG("SETUP", "Entrypoint verified: " + entrypoint_path.string());

    auto probed = probe_runtime(descriptor.language, config);
    if (core::errors::is_error(probed)) {
        return core::errors::get_error(probed);
    }

    LOG_INFO("SETUP", "Server " + descriptor.name + " ready at " + server_dir.string());
    return server_dir;
}

}  // namespace relay::bootstrap
