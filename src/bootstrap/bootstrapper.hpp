#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "core/config/settings.hpp"
#include "core/errors/relay_errors.hpp"
#include "process/child_process.hpp"
#include "process/language_runtime.hpp"
#include "protocol/server_descriptor.hpp"

namespace relay::bootstrap {

enum class InstallMode {
    Shell,  // "sh -c <command>", chosen when the command chains with && or ||
    Direct  // whitespace-split argv, no quoting support
};

struct InstallPlan {
    InstallMode mode = InstallMode::Direct;
    process::Invocation invocation;
};

core::errors::Result<InstallPlan> plan_install_command(const std::string& command);

std::string to_string(InstallMode mode);

// Makes sure a descriptor's code is on disk and runnable. After a successful
// prepare() the entrypoint exists and the interpreter answered its probe.
class Bootstrapper {
public:
    explicit Bootstrapper(
        std::vector<process::LanguageRuntime> runtimes = process::default_language_runtimes());

    // Returns the install directory "<servers_dir>/<name>".
    core::errors::Result<std::filesystem::path> prepare(
        const protocol::ServerDescriptor& descriptor,
        const core::config::RuntimeConfig& config) const;

private:
    core::errors::Status fetch_source(const std::string& repository,
                                      const std::filesystem::path& server_dir,
                                      const core::config::RuntimeConfig& config) const;

    core::errors::Status run_install(const std::string& install_command,
                                     const std::filesystem::path& server_dir,
                                     const core::config::RuntimeConfig& config) const;

    core::errors::Status probe_runtime(const std::string& language,
                                       const core::config::RuntimeConfig& config) const;

    std::vector<process::LanguageRuntime> runtimes_;
};

}  // namespace relay::bootstrap
