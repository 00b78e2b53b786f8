#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "core/errors/relay_errors.hpp"
#include "protocol/server_descriptor.hpp"

namespace relay::registry {

// Immutable name -> descriptor mapping, loaded once at startup.
class ServerRegistry {
public:
    static core::errors::Result<ServerRegistry> from_json_text(const std::string& text);
    static core::errors::Result<ServerRegistry> load_file(const std::filesystem::path& path);

    core::errors::Result<protocol::ServerDescriptor> find(const std::string& name) const;

    std::vector<std::string> names() const;
    std::size_t size() const { return servers_.size(); }

private:
    std::map<std::string, protocol::ServerDescriptor> servers_;
};

}  // namespace relay::registry
