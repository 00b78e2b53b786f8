#pragma once
#include <optional>
#include <string>

namespace relay::protocol {

    // One configured agent server, as loaded from the descriptor mapping.
    struct ServerDescriptor {
        std::string name;
        std::string type;                        // category, e.g. "github"
        std::optional<std::string> repository;   // e.g. "owner/repo"
        std::string language;                    // e.g. "node", "python"
        std::string entrypoint;                  // relative to the install directory
        std::optional<std::string> description;
        std::optional<std::string> install_command;
    };

} // namespace relay::protocol
