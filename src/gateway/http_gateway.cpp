#include "gateway/http_gateway.hpp"

#include <chrono>
#include <thread>
#include <utility>
#include <httplib.h>
#include "core/logging/logger.hpp"

namespace relay::gateway {

using core::errors::ErrorCategory;
using core::errors::RelayError;

HttpGateway::HttpGateway(GatewayService& service, AuthConfig auth)
    : service_(service), auth_(std::move(auth)), server_(std::make_unique<httplib::Server>()) {
    configure_routes();
}

HttpGateway::~HttpGateway() {
    stop();
}

void HttpGateway::configure_routes() {
    server_->set_pre_routing_handler(
        [this](const httplib::Request& req, httplib::Response& res) {
            if (is_authorized(auth_, req.get_header_value("Authorization"))) {
                return httplib::Server::HandlerResponse::Unhandled;
            }
            LOG_WARN("AUTH", "Rejected " + req.method + " " + req.path +
                                 ": invalid or missing API key");
            res.status = 401;
            res.set_content(unauthorized_body(), "application/json");
            return httplib::Server::HandlerResponse::Handled;
        });

    server_->Post(kQueryRoute, [this](const httplib::Request& req, httplib::Response& res) {
        const HttpReply reply = service_.handle_query(req.body);
        res.status = reply.status;
        if (!reply.body.empty()) {
            res.set_content(reply.body, reply.content_type);
        }
    });
}

core::errors::Result<int> HttpGateway::bind(const std::string& host, const int port) {
    const std::string addr = host + ":" + std::to_string(port);
    LOG_INFO("MAIN", "Attempting to bind to: " + addr);

    int bound = port;
    if (port == 0) {
        bound = server_->bind_to_any_port(host);
        if (bound < 0) {
            bound = 0;
        }
    } else if (!server_->bind_to_port(host, port)) {
        bound = 0;
    }

    if (bound <= 0) {
        return RelayError{ErrorCategory::Internal, "Failed to bind to " + addr, "bind_failed"};
    }
    LOG_INFO("MAIN", "Server ready at http://" + host + ":" + std::to_string(bound));
    LOG_INFO("MAIN", std::string("Endpoint: POST ") + kQueryRoute);
    return bound;
}

bool HttpGateway::listen() {
    listening_.store(true);
    if (stop_requested_.load()) {
        LOG_INFO("MAIN", "Stop requested before the listener started");
        listening_.store(false);
        return true;
    }
    LOG_INFO("MAIN", "Server is now accepting connections...");
    const bool served = server_->listen_after_bind();
    listening_.store(false);
    return served;
}

void HttpGateway::stop() {
    stop_requested_.store(true);
    // httplib ignores stop() until its accept loop is running.
    while (listening_.load() && !server_->is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    if (server_->is_running()) {
        server_->stop();
    }
}

bool HttpGateway::is_running() const {
    return server_->is_running();
}

}  // namespace relay::gateway
