#include "session/protocol_session.hpp"

#include <utility>
#include <vector>
#include "core/logging/logger.hpp"

namespace relay::session {

using core::errors::ErrorCategory;
using core::errors::RelayError;
using protocol::QueryRequest;
using protocol::QueryResponse;

namespace {

constexpr std::size_t kRequestPreviewChars = 100;
constexpr std::size_t kResponsePreviewChars = 200;

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n\f\v");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n\f\v");
    return text.substr(first, last - first + 1);
}

std::int64_t steady_ns(const std::chrono::steady_clock::time_point point) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(point.time_since_epoch())
        .count();
}

std::string elapsed_text(const std::chrono::steady_clock::time_point since) {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - since);
    return std::to_string(elapsed.count()) + "ms";
}

std::string io_error_text(const std::error_code& error) {
    return error.message() + " (errno: " + std::to_string(error.value()) + ")";
}

}  // namespace

std::string to_string(const QueryState state) {
    switch (state) {
        case QueryState::Idle:
            return "idle";
        case QueryState::Sending:
            return "sending";
        case QueryState::AwaitingResponse:
            return "awaiting_response";
        case QueryState::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

std::string SessionStats::to_string() const {
    std::string text = "PID: " + std::to_string(pid) +
                       ", Uptime: " + std::to_string(uptime.count()) + "ms" +
                       ", Requests: " + std::to_string(request_count) +
                       ", Last activity: " + std::to_string(since_last_activity.count()) +
                       "ms ago";
    if (abandoned_responses > 0) {
        text += ", Abandoned responses: " + std::to_string(abandoned_responses);
    }
    return text;
}

ProtocolSession::ProtocolSession(process::UniqueFd stdin_fd, process::UniqueFd stdout_fd,
                                 std::shared_ptr<ProcessHandle> handle,
                                 const std::chrono::milliseconds response_timeout)
    : writer_(std::move(stdin_fd)),
      reader_(std::move(stdout_fd)),
      handle_(std::move(handle)),
      response_timeout_(response_timeout),
      pid_(handle_ ? handle_->pid() : -1),
      start_time_(std::chrono::steady_clock::now()),
      last_activity_ns_(steady_ns(start_time_)) {}

SessionStats ProtocolSession::stats() const {
    const auto now = std::chrono::steady_clock::now();
    const std::chrono::steady_clock::time_point last_activity{
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::nanoseconds(last_activity_ns_.load()))};

    SessionStats stats;
    stats.pid = pid_;
    stats.uptime = std::chrono::duration_cast<std::chrono::milliseconds>(now - start_time_);
    stats.request_count = request_count_.load();
    stats.since_last_activity =
        std::chrono::duration_cast<std::chrono::milliseconds>(now - last_activity);
    stats.abandoned_responses = abandoned_responses_.load();
    return stats;
}

void ProtocolSession::touch() {
    last_activity_ns_.store(steady_ns(std::chrono::steady_clock::now()));
}

core::errors::Result<QueryResponse> ProtocolSession::query(const QueryRequest& request) {
    const auto query_start = std::chrono::steady_clock::now();
    const std::uint64_t request_number = ++request_count_;
    LOG_DEBUG("MCP_PROCESS", "Query #" + std::to_string(request_number) +
                                 " started - PID: " + std::to_string(pid_));

    auto result = run_query(request, request_number, query_start);
    if (core::errors::is_error(result)) {
        state_.store(QueryState::Failed);
        const auto& err = core::errors::get_error(result);
        LOG_ERROR("MCP_PROCESS", "Query #" + std::to_string(request_number) + " failed after " +
                                     elapsed_text(query_start) + ": " +
                                     core::errors::describe(err));
    } else {
        state_.store(QueryState::Idle);
    }
    return result;
}

core::errors::Result<QueryResponse> ProtocolSession::run_query(
    const QueryRequest& request, const std::uint64_t request_number,
    const std::chrono::steady_clock::time_point query_start) {
    if (request.command.find_first_of("\r\n") != std::string::npos) {
        touch();
        return RelayError{ErrorCategory::Input,
                          "Command must be a single line without newline characters",
                          "invalid_command"};
    }

    if (!handle_ || !handle_->is_alive()) {
        LOG_ERROR("MCP_PROCESS", "Cannot send query: MCP process has terminated");
        touch();
        return RelayError{ErrorCategory::Protocol, "MCP process has terminated",
                          "process_terminated",
                          "The agent process is gone; restart the gateway."};
    }

    const auto idle = std::chrono::duration_cast<std::chrono::milliseconds>(
        stats().since_last_activity);
    LOG_DEBUG("MCP_PROCESS", "Time since last activity: " + std::to_string(idle.count()) + "ms");

    discard_stale_lines();

    state_.store(QueryState::Sending);
    const std::string request_data = request.command + "\n";
    LOG_DEBUG("MCP_PROCESS", "Sending " + std::to_string(request_data.size()) +
                                 " bytes to stdin");
    LOG_DEBUG("MCP_PROCESS", "Request content: " +
                                 core::logging::preview(request.command, kRequestPreviewChars));

    if (const auto error = writer_.write(request_data)) {
        touch();
        return RelayError{ErrorCategory::Protocol,
                          "Failed to write to MCP stdin: " + io_error_text(error),
                          "write_failed"};
    }
    if (const auto error = writer_.flush()) {
        touch();
        return RelayError{ErrorCategory::Protocol,
                          "Failed to flush MCP stdin: " + io_error_text(error),
                          "flush_failed"};
    }
    LOG_DEBUG("MCP_PROCESS", "Request sent, waiting for response (timeout: " +
                                 std::to_string(response_timeout_.count()) + "ms)");

    state_.store(QueryState::AwaitingResponse);
    auto response = await_response(request_number, query_start);
    touch();
    return response;
}

core::errors::Result<QueryResponse> ProtocolSession::await_response(
    const std::uint64_t request_number,
    const std::chrono::steady_clock::time_point query_start) {
    const auto read_start = std::chrono::steady_clock::now();
    const auto deadline = read_start + response_timeout_;
    // Lines that arrived while earlier replies were still owed. Once one more
    // line than is owed has arrived, the held ones are the late replies.
    std::vector<std::string> held;

    while (true) {
        const std::uint64_t owed = abandoned_responses_.load();
        if (!held.empty() && held.size() > owed) {
            return accept_held(held, request_number, read_start, query_start);
        }

        const ReadOutcome outcome = reader_.read_line(deadline);
        if (!held.empty() && (outcome.status == ReadStatus::Timeout ||
                              outcome.status == ReadStatus::Eof)) {
            // No further line can come: the peer never answered some of the
            // timed-out queries, so the newest line belongs to this one.
            LOG_WARN("MCP_PROCESS", "Fewer late responses arrived than were owed; forgetting " +
                                        std::to_string(owed - held.size() + 1) + " of them");
            abandoned_responses_.store(held.size() - 1);
            return accept_held(held, request_number, read_start, query_start);
        }

        switch (outcome.status) {
            case ReadStatus::Timeout:
                ++abandoned_responses_;
                LOG_ERROR("MCP_PROCESS", "Query #" + std::to_string(request_number) +
                                             " timed out after " + elapsed_text(query_start));
                return RelayError{ErrorCategory::Protocol, "MCP server timeout", "timeout"};

            case ReadStatus::Eof:
                LOG_WARN("MCP_PROCESS", "MCP server closed connection (read 0 bytes)");
                return RelayError{ErrorCategory::Protocol, "MCP server closed connection",
                                  "connection_closed"};

            case ReadStatus::Error:
                return RelayError{ErrorCategory::Protocol,
                                  "Failed to read response: " + io_error_text(outcome.error),
                                  "read_failed"};

            case ReadStatus::Line:
                held.push_back(outcome.line);
                break;
        }
    }
}

core::errors::Result<QueryResponse> ProtocolSession::accept_held(
    std::vector<std::string>& held, const std::uint64_t request_number,
    const std::chrono::steady_clock::time_point read_start,
    const std::chrono::steady_clock::time_point query_start) {
    for (std::size_t i = 0; i + 1 < held.size(); ++i) {
        --abandoned_responses_;
        LOG_WARN("MCP_PROCESS", "Discarding late response to an earlier timed-out query: " +
                                    core::logging::preview(trim(held[i]),
                                                           kResponsePreviewChars));
    }
    const std::string line = std::move(held.back());
    held.clear();

    LOG_DEBUG("MCP_PROCESS", "Read " + std::to_string(line.size()) + " bytes in " +
                                 elapsed_text(read_start));
    const std::string response = trim(line);
    if (response.empty()) {
        LOG_WARN("MCP_PROCESS", "Received empty response");
        return RelayError{ErrorCategory::Protocol, "Empty response from MCP server",
                          "empty_response"};
    }

    LOG_DEBUG("MCP_PROCESS", "Response content: " +
                                 core::logging::preview(response, kResponsePreviewChars));
    QueryResponse result;
    result.result = response;
    result.request_number = request_number;
    result.duration_ms = std::chrono::duration<double, std::milli>(
                             std::chrono::steady_clock::now() - query_start)
                             .count();
    LOG_INFO("MCP_PROCESS", "Query #" + std::to_string(request_number) +
                                " completed successfully in " + elapsed_text(query_start));
    return result;
}

void ProtocolSession::discard_stale_lines() {
    while (abandoned_responses_.load() > 0) {
        const ReadOutcome outcome = reader_.try_read_line();
        if (outcome.status != ReadStatus::Line) {
            return;
        }
        --abandoned_responses_;
        LOG_WARN("MCP_PROCESS", "Discarding late response to an earlier timed-out query: " +
                                    core::logging::preview(trim(outcome.line),
                                                           kResponsePreviewChars));
    }
}

}  // namespace relay::session
