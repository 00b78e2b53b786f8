#pragma once

#include <atomic>
#include <memory>
#include <string>
#include "core/errors/relay_errors.hpp"
#include "gateway/auth.hpp"
#include "gateway/gateway_service.hpp"

namespace httplib {
class Server;
}

namespace relay::gateway {

inline constexpr const char* kQueryRoute = "/api/v1";

// HTTP front end: POST /api/v1, guarded by the bearer-token check.
class HttpGateway {
public:
    HttpGateway(GatewayService& service, AuthConfig auth);
    ~HttpGateway();

    HttpGateway(const HttpGateway&) = delete;
    HttpGateway& operator=(const HttpGateway&) = delete;

    // Port 0 binds an ephemeral port. Returns the bound port.
    core::errors::Result<int> bind(const std::string& host, int port);

    // Serves until stop() is called. Requires a successful bind(). Returns
    // at once if stop() already ran.
    bool listen();

    // Safe from any thread, before or while listen() runs.
    void stop();
    bool is_running() const;

private:
    void configure_routes();

    GatewayService& service_;
    AuthConfig auth_;
    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> listening_{false};
};

}  // namespace relay::gateway
