#include "gateway/gateway_service.hpp"

#include <chrono>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"

namespace relay::gateway {

using nlohmann::json;

namespace {

std::string elapsed_text(const std::chrono::steady_clock::time_point since) {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - since);
    return std::to_string(elapsed.count()) + "ms";
}

HttpReply error_reply(const int status, const std::string& code, const std::string& message) {
    json body;
    body["error"] = code;
    body["message"] = message;
    return HttpReply{status, body.dump(), "application/json"};
}

}  // namespace

GatewayService::GatewayService(session::QueryExecutor& executor) : executor_(executor) {}

HttpReply GatewayService::handle_query(const std::string& body) const {
    const auto request_start = std::chrono::steady_clock::now();
    LOG_INFO("HTTP_HANDLER", "Received HTTP request");

    const json payload = json::parse(body, nullptr, false);
    if (payload.is_discarded()) {
        LOG_WARN("HTTP_HANDLER", "Rejected request: body is not valid JSON");
        return error_reply(400, "invalid_json", "Request body must be valid JSON");
    }
    const auto command = payload.find("command");
    if (!payload.is_object() || command == payload.end() || !command->is_string()) {
        LOG_WARN("HTTP_HANDLER", "Rejected request: missing string field 'command'");
        return error_reply(422, "missing_command",
                           "Request body must contain a string field 'command'");
    }

    protocol::QueryRequest request;
    request.command = command->get<std::string>();
    if (request.command.find_first_of("\r\n") != std::string::npos) {
        LOG_WARN("HTTP_HANDLER", "Rejected request: command contains a newline");
        return error_reply(400, "invalid_command",
                           "Command must be a single line without newline characters");
    }
    LOG_DEBUG("HTTP_HANDLER", "Request payload: " + core::logging::preview(request.command, 100));
    LOG_DEBUG("HTTP_HANDLER", "Process stats: " + executor_.describe_stats());

    const auto result = executor_.execute(request);
    if (core::errors::is_error(result)) {
        const auto& err = core::errors::get_error(result);
        LOG_ERROR("HTTP_HANDLER", "Request failed after " + elapsed_text(request_start) + ": " +
                                      core::errors::describe(err));
        LOG_ERROR("HTTP_HANDLER", "Process stats at failure: " + executor_.describe_stats());
        if (err.category == core::errors::ErrorCategory::Input) {
            return error_reply(400, err.code, err.message);
        }
        return HttpReply{500, "", "text/plain"};
    }

    const auto& response = core::errors::get_value(result);
    LOG_INFO("HTTP_HANDLER", "Request completed successfully in " + elapsed_text(request_start));
    LOG_DEBUG("HTTP_HANDLER", "Response size: " + std::to_string(response.result.size()) + " chars");

    json reply;
    reply["result"] = response.result;
    return HttpReply{200, reply.dump(), "application/json"};
}

}  // namespace relay::gateway
