#include "core/config/settings.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <system_error>

namespace relay::core::config {

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

template <typename Number>
Number read_number(const EnvLookup& env, const std::string& name,
                   const Number fallback) {
    const auto raw = env(name);
    if (!raw.has_value()) {
        return fallback;
    }

    Number parsed = 0;
    const char* begin = raw->data();
    const char* end = raw->data() + raw->size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc() || ptr != end) {
        LOG_WARN("CONFIG", "Ignoring invalid " + name + "=\"" + *raw +
                               "\", using default " + std::to_string(fallback));
        return fallback;
    }
    return parsed;
}

// Durations above the ceiling are clamped so deadlines stay representable.
std::chrono::seconds read_seconds(const EnvLookup& env, const std::string& name,
                                  const std::uint64_t fallback) {
    const auto secs = read_number<std::uint64_t>(env, name, fallback);
    if (secs > kMaxDurationSecs) {
        LOG_WARN("CONFIG", name + "=" + std::to_string(secs) + " exceeds the maximum, using " +
                               std::to_string(kMaxDurationSecs));
        return std::chrono::seconds(kMaxDurationSecs);
    }
    return std::chrono::seconds(secs);
}

std::string read_string(const EnvLookup& env, const std::string& name,
                        const std::string& fallback) {
    const auto raw = env(name);
    return raw.has_value() ? *raw : fallback;
}

}  // namespace

bool RuntimeConfig::supports_language(const std::string& language) const {
    return std::find(supported_languages.begin(), supported_languages.end(),
                     language) != supported_languages.end();
}

bool RuntimeConfig::supports_server_type(const std::string& type) const {
    return std::find(supported_server_types.begin(), supported_server_types.end(),
                     type) != supported_server_types.end();
}

EnvLookup process_environment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

std::vector<std::string> split_list(const std::string& text) {
    std::vector<std::string> items;
    std::size_t start = 0;
    while (start <= text.size()) {
        const auto comma = text.find(',', start);
        const auto end = comma == std::string::npos ? text.size() : comma;
        items.push_back(trim(text.substr(start, end - start)));
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return items;
}

std::string join_list(const std::vector<std::string>& items) {
    std::string joined;
    for (const auto& item : items) {
        if (!joined.empty()) {
            joined += ",";
        }
        joined += item;
    }
    return joined;
}

Settings load_settings(const EnvLookup& env) {
    Settings settings;

    RuntimeConfig& runtime = settings.runtime;
    runtime.servers_dir = read_string(env, "MCP_SERVERS_DIR", kDefaultServersDir);
    runtime.response_timeout =
        read_seconds(env, "RESPONSE_TIMEOUT_SECS", kDefaultResponseTimeoutSecs);
    runtime.process_init_wait =
        read_seconds(env, "PROCESS_INIT_WAIT_SECS", kDefaultProcessInitWaitSecs);
    runtime.install_timeout =
        read_seconds(env, "INSTALL_TIMEOUT_SECS", kDefaultInstallTimeoutSecs);
    runtime.supported_languages =
        split_list(read_string(env, "SUPPORTED_LANGUAGES", "node,python"));
    runtime.supported_server_types =
        split_list(read_string(env, "SUPPORTED_SERVER_TYPES", "github"));
    runtime.repository_base_url =
        read_string(env, "REPOSITORY_BASE_URL", kDefaultRepositoryBaseUrl);

    GatewaySettings& gateway = settings.gateway;
    gateway.config_file = read_string(env, "MCP_CONFIG_FILE", kDefaultConfigFile);
    gateway.server_name = read_string(env, "MCP_SERVER_NAME", kDefaultServerName);
    gateway.host = read_string(env, "HOST", kDefaultHost);
    gateway.port = read_number<std::uint16_t>(env, "PORT", kDefaultPort);
    gateway.api_key = env("HTTP_API_KEY");
    gateway.disable_auth = read_string(env, "DISABLE_AUTH", "false") == "true";

    const auto level_text = env("LOG_LEVEL");
    if (level_text.has_value()) {
        const auto level = logging::parse_level(*level_text);
        if (level.has_value()) {
            settings.log_level = *level;
        } else {
            LOG_WARN("CONFIG", "Ignoring invalid LOG_LEVEL=\"" + *level_text + "\"");
        }
    }

    return settings;
}

}  // namespace relay::core::config
