#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "session/protocol_session.hpp"
#include "session/query_executor.hpp"

namespace relay::session {

// Runs every query on one worker thread that owns the ProtocolSession.
// Submissions are served strictly in FIFO order, one at a time.
class SessionActor : public QueryExecutor {
public:
    explicit SessionActor(std::unique_ptr<ProtocolSession> session);
    ~SessionActor() override;

    SessionActor(const SessionActor&) = delete;
    SessionActor& operator=(const SessionActor&) = delete;

    std::future<core::errors::Result<protocol::QueryResponse>> submit(
        protocol::QueryRequest request);

    core::errors::Result<protocol::QueryResponse> execute(
        const protocol::QueryRequest& request) override;

    std::string describe_stats() const override;

    SessionStats stats() const { return session_->stats(); }
    std::size_t queued() const;

    // Stops intake and fails queued submissions with session_closed. A query
    // already running is left to finish.
    void close();

    // close(), then joins the worker.
    void shutdown();

private:
    struct Job {
        protocol::QueryRequest request;
        std::promise<core::errors::Result<protocol::QueryResponse>> promise;
    };

    void run();

    std::unique_ptr<ProtocolSession> session_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Job> jobs_;
    bool stopping_ = false;
    std::thread worker_;
};

}  // namespace relay::session
