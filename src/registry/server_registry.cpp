#include "registry/server_registry.hpp"

#include <fstream>
#include <optional>
#include <sstream>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"

namespace relay::registry {

using core::errors::ErrorCategory;
using core::errors::RelayError;
using nlohmann::json;
using protocol::ServerDescriptor;

namespace {

RelayError invalid_descriptor(const std::string& name, const std::string& detail) {
    return RelayError{ErrorCategory::Config,
                      "Invalid descriptor for server '" + name + "': " + detail,
                      "invalid_descriptor"};
}

core::errors::Result<std::string> required_string(const json& entry,
                                                  const std::string& server,
                                                  const char* field) {
    const auto it = entry.find(field);
    if (it == entry.end() || !it->is_string()) {
        return invalid_descriptor(server, std::string("field '") + field +
                                              "' must be a string");
    }
    return it->get<std::string>();
}

core::errors::Result<std::optional<std::string>> optional_string(
    const json& entry, const std::string& server, const char* field) {
    const auto it = entry.find(field);
    if (it == entry.end() || it->is_null()) {
        return std::optional<std::string>{};
    }
    if (!it->is_string()) {
        return invalid_descriptor(server, std::string("field '") + field +
                                              "' must be a string or null");
    }
    return std::optional<std::string>{it->get<std::string>()};
}

core::errors::Result<ServerDescriptor> parse_descriptor(const std::string& name,
                                                        const json& entry) {
    if (!entry.is_object()) {
        return invalid_descriptor(name, "entry must be an object");
    }

    ServerDescriptor descriptor;
    descriptor.name = name;

    auto type = required_string(entry, name, "type");
    if (core::errors::is_error(type)) {
        return core::errors::get_error(type);
    }
    auto language = required_string(entry, name, "language");
    if (core::errors::is_error(language)) {
        return core::errors::get_error(language);
    }
    auto entrypoint = required_string(entry, name, "entrypoint");
    if (core::errors::is_error(entrypoint)) {
        return core::errors::get_error(entrypoint);
    }
    auto repository = optional_string(entry, name, "repository");
    if (core::errors::is_error(repository)) {
        return core::errors::get_error(repository);
    }
    auto description = optional_string(entry, name, "description");
    if (core::errors::is_error(description)) {
        return core::errors::get_error(description);
    }
    auto install_command = optional_string(entry, name, "install_command");
    if (core::errors::is_error(install_command)) {
        return core::errors::get_error(install_command);
    }

    descriptor.type = core::errors::get_value(type);
    descriptor.language = core::errors::get_value(language);
    descriptor.entrypoint = core::errors::get_value(entrypoint);
    descriptor.repository = core::errors::get_value(repository);
    descriptor.description = core::errors::get_value(description);
    descriptor.install_command = core::errors::get_value(install_command);
    return descriptor;
}

}  // namespace

core::errors::Result<ServerRegistry> ServerRegistry::from_json_text(
    const std::string& text) {
    const json document = json::parse(text, nullptr, false);
    if (document.is_discarded()) {
        return RelayError{ErrorCategory::Config,
                          "Failed to parse config: descriptor file is not valid JSON.",
                          "config_parse_failed"};
    }
    if (!document.is_object()) {
        return RelayError{ErrorCategory::Config,
                          "Failed to parse config: top level must be an object "
                          "mapping server names to descriptors.",
                          "config_parse_failed"};
    }

    ServerRegistry registry;
    for (const auto& item : document.items()) {
        auto descriptor = parse_descriptor(item.key(), item.value());
        if (core::errors::is_error(descriptor)) {
            return core::errors::get_error(descriptor);
        }
        registry.servers_.emplace(item.key(), core::errors::get_value(descriptor));
    }
    return registry;
}

core::errors::Result<ServerRegistry> ServerRegistry::load_file(
    const std::filesystem::path& path) {
    LOG_DEBUG("REGISTRY", "Loading config from: " + path.string());

    std::ifstream in(path);
    if (!in.is_open()) {
        return RelayError{ErrorCategory::Config,
                          "Failed to read config file: " + path.string(),
                          "config_read_failed",
                          "Set MCP_CONFIG_FILE or pass --config <path>."};
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (!in.good() && !in.eof()) {
        return RelayError{ErrorCategory::Config,
                          "I/O error while reading config file: " + path.string(),
                          "config_read_failed"};
    }

    auto registry = from_json_text(buffer.str());
    if (!core::errors::is_error(registry)) {
        LOG_DEBUG("REGISTRY", "Loaded " +
                                  std::to_string(core::errors::get_value(registry).size()) +
                                  " server descriptor(s)");
    }
    return registry;
}

core::errors::Result<ServerDescriptor> ServerRegistry::find(
    const std::string& name) const {
    const auto it = servers_.find(name);
    if (it == servers_.end()) {
        return RelayError{ErrorCategory::Config,
                          "Server '" + name + "' not found in config",
                          "server_not_found",
                          "Set MCP_SERVER_NAME to one of the configured servers."};
    }
    return it->second;
}

std::vector<std::string> ServerRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(servers_.size());
    for (const auto& entry : servers_) {
        result.push_back(entry.first);
    }
    return result;
}

}  // namespace relay::registry
