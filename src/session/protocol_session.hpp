#pragma once

#include <sys/types.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "core/errors/relay_errors.hpp"
#include "process/unique_fd.hpp"
#include "protocol/query_contract.hpp"
#include "session/line_io.hpp"
#include "session/process_handle.hpp"

namespace relay::session {

enum class QueryState {
    Idle,
    Sending,
    AwaitingResponse,
    Failed
};

std::string to_string(QueryState state);

struct SessionStats {
    pid_t pid = -1;
    std::chrono::milliseconds uptime{0};
    std::uint64_t request_count = 0;
    std::chrono::milliseconds since_last_activity{0};
    std::uint64_t abandoned_responses = 0;

    std::string to_string() const;
};

// Exclusive owner of one agent process's stdin/stdout. Each query writes one
// line and reads one line back; there are no retries. Not thread-safe for
// query(); stats() may be read from any thread.
class ProtocolSession {
public:
    ProtocolSession(process::UniqueFd stdin_fd, process::UniqueFd stdout_fd,
                    std::shared_ptr<ProcessHandle> handle,
                    std::chrono::milliseconds response_timeout);

    ProtocolSession(const ProtocolSession&) = delete;
    ProtocolSession& operator=(const ProtocolSession&) = delete;

    core::errors::Result<protocol::QueryResponse> query(const protocol::QueryRequest& request);

    SessionStats stats() const;
    std::string describe_stats() const { return stats().to_string(); }

    std::uint64_t request_count() const { return request_count_.load(); }
    QueryState state() const { return state_.load(); }
    const std::shared_ptr<ProcessHandle>& handle() const { return handle_; }

private:
    core::errors::Result<protocol::QueryResponse> run_query(
        const protocol::QueryRequest& request, std::uint64_t request_number,
        std::chrono::steady_clock::time_point query_start);
    core::errors::Result<protocol::QueryResponse> await_response(
        std::uint64_t request_number, std::chrono::steady_clock::time_point query_start);
    core::errors::Result<protocol::QueryResponse> accept_held(
        std::vector<std::string>& held, std::uint64_t request_number,
        std::chrono::steady_clock::time_point read_start,
        std::chrono::steady_clock::time_point query_start);
    void discard_stale_lines();
    void touch();

    LineWriter writer_;
    LineReader reader_;
    std::shared_ptr<ProcessHandle> handle_;
    std::chrono::milliseconds response_timeout_;
    const pid_t pid_;
    const std::chrono::steady_clock::time_point start_time_;

    std::atomic<std::uint64_t> request_count_{0};
    std::atomic<std::int64_t> last_activity_ns_;
    // Replies owed for queries that timed out; discarded when they arrive.
    // Reset when a query's deadline passes with fewer late lines than owed.
    std::atomic<std::uint64_t> abandoned_responses_{0};
    std::atomic<QueryState> state_{QueryState::Idle};
};

}  // namespace relay::session
