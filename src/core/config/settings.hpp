#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "core/logging/logger.hpp"

namespace relay::core::config {

inline constexpr const char* kDefaultServersDir = "/app/mcp-servers";
inline constexpr std::uint64_t kDefaultResponseTimeoutSecs = 30;
inline constexpr std::uint64_t kDefaultProcessInitWaitSecs = 2;
inline constexpr std::uint64_t kDefaultInstallTimeoutSecs = 600;
// Ceiling for every *_SECS setting (24h).
inline constexpr std::uint64_t kMaxDurationSecs = 24 * 60 * 60;
inline constexpr const char* kDefaultConfigFile = "mcp_servers.config.json";
inline constexpr const char* kDefaultServerName = "readability";
inline constexpr const char* kDefaultHost = "0.0.0.0";
inline constexpr std::uint16_t kDefaultPort = 3000;
inline constexpr const char* kDefaultRepositoryBaseUrl = "https://github.com/";

// Process-wide settings for bootstrapping and talking to the agent process.
struct RuntimeConfig {
    std::filesystem::path servers_dir = kDefaultServersDir;
    std::chrono::milliseconds response_timeout{kDefaultResponseTimeoutSecs * 1000};
    std::chrono::milliseconds process_init_wait{kDefaultProcessInitWaitSecs * 1000};
    // Zero disables the limit.
    std::chrono::milliseconds install_timeout{kDefaultInstallTimeoutSecs * 1000};
    std::vector<std::string> supported_languages = {"node", "python"};
    std::vector<std::string> supported_server_types = {"github"};
    std::string repository_base_url = kDefaultRepositoryBaseUrl;

    bool supports_language(const std::string& language) const;
    bool supports_server_type(const std::string& type) const;
};

struct GatewaySettings {
    std::filesystem::path config_file = kDefaultConfigFile;
    std::string server_name = kDefaultServerName;
    std::string host = kDefaultHost;
    std::uint16_t port = kDefaultPort;
    std::optional<std::string> api_key;
    bool disable_auth = false;

    bool auth_enabled() const { return !disable_auth && api_key.has_value(); }
};

struct Settings {
    RuntimeConfig runtime;
    GatewaySettings gateway;
    logging::LogLevel log_level = logging::LogLevel::DEBUG;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Reads the real process environment.
EnvLookup process_environment();

// Resolves every setting once; malformed values fall back to their defaults.
Settings load_settings(const EnvLookup& env);

std::vector<std::string> split_list(const std::string& text);

std::string join_list(const std::vector<std::string>& items);

}  // namespace relay::core::config
