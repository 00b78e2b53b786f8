#include "gateway/auth.hpp"

#include <nlohmann/json.hpp>

namespace relay::gateway {

namespace {

constexpr const char* kBearerPrefix = "Bearer ";

}  // namespace

AuthConfig AuthConfig::from_settings(const core::config::GatewaySettings& settings) {
    AuthConfig config;
    config.api_key = settings.api_key;
    config.enabled = settings.auth_enabled();
    return config;
}

bool is_authorized(const AuthConfig& config, const std::string& authorization_header) {
    if (!config.enabled) {
        return true;
    }
    if (!config.api_key.has_value()) {
        return false;
    }

    const std::string prefix = kBearerPrefix;
    if (authorization_header.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    return authorization_header.substr(prefix.size()) == *config.api_key;
}

std::string unauthorized_body() {
    nlohmann::json body;
    body["error"] = "Unauthorized";
    body["message"] = "Invalid or missing API key";
    return body.dump();
}

}  // namespace relay::gateway
