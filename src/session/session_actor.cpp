#include "session/session_actor.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace relay::session {

using core::errors::ErrorCategory;
using core::errors::RelayError;
using protocol::QueryRequest;
using protocol::QueryResponse;

namespace {

RelayError session_closed() {
    return RelayError{ErrorCategory::Protocol, "Session is shutting down",
                      "session_closed"};
}

}  // namespace

SessionActor::SessionActor(std::unique_ptr<ProtocolSession> session)
    : session_(std::move(session)) {
    worker_ = std::thread([this] { run(); });
}

SessionActor::~SessionActor() {
    shutdown();
}

std::future<core::errors::Result<QueryResponse>> SessionActor::submit(QueryRequest request) {
    Job job;
    job.request = std::move(request);
    auto future = job.promise.get_future();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            job.promise.set_value(session_closed());
            return future;
        }
        jobs_.push_back(std::move(job));
    }
    cv_.notify_one();
    return future;
}

core::errors::Result<QueryResponse> SessionActor::execute(const QueryRequest& request) {
    return submit(request).get();
}

std::string SessionActor::describe_stats() const {
    return session_->describe_stats();
}

std::size_t SessionActor::queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

void SessionActor::close() {
    std::deque<Job> abandoned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
        abandoned.swap(jobs_);
    }
    cv_.notify_all();

    for (auto& job : abandoned) {
        job.promise.set_value(session_closed());
    }
    if (!abandoned.empty()) {
        LOG_WARN("SESSION", "Rejected " + std::to_string(abandoned.size()) +
                                " queued request(s) during shutdown");
    }
}

void SessionActor::shutdown() {
    close();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void SessionActor::run() {
    LOG_DEBUG("SESSION", "Session worker started");
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
            if (stopping_) {
                break;
            }
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }
        job.promise.set_value(session_->query(job.request));
    }
    LOG_DEBUG("SESSION", "Session worker stopped");
}

}  // namespace relay::session
