#pragma once

#include <optional>
#include <string>
#include "core/config/settings.hpp"

namespace relay::gateway {

struct AuthConfig {
    std::optional<std::string> api_key;
    bool enabled = false;

    static AuthConfig from_settings(const core::config::GatewaySettings& settings);
};

// Accepts "Authorization: Bearer <key>" when auth is enabled; always true when
// it is not.
bool is_authorized(const AuthConfig& config, const std::string& authorization_header);

// {"error":"Unauthorized","message":"Invalid or missing API key"}
std::string unauthorized_body();

}  // namespace relay::gateway
