#include "session/process_handle.hpp"

#include <string>
#include <utility>
#include "core/logging/logger.hpp"

namespace relay::session {

ProcessHandle::ProcessHandle(std::unique_ptr<process::ChildProcess> child)
    : child_(std::move(child)), pid_(child_ ? child_->pid() : -1) {}

bool ProcessHandle::is_alive() {
    std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        const bool alive = !exited_.load();
        LOG_DEBUG("MCP_PROCESS", std::string("Process lock busy, last known state: ") +
                                     (alive ? "running" : "exited"));
        return alive;
    }

    if (!child_) {
        LOG_WARN("MCP_PROCESS", "No child process handle available");
        return false;
    }

    auto status = child_->try_wait();
    if (core::errors::is_error(status)) {
        LOG_ERROR("MCP_PROCESS", core::errors::get_error(status).message);
        exited_.store(true);
        return false;
    }
    if (core::errors::get_value(status).has_value()) {
        LOG_WARN("MCP_PROCESS", "Process has exited with " +
                                    core::errors::get_value(status)->to_string());
        exited_.store(true);
        return false;
    }

    LOG_DEBUG("MCP_PROCESS", "Process is still running");
    return true;
}

core::errors::Result<std::optional<process::ExitStatus>> ProcessHandle::check_exit() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!child_) {
        return core::errors::RelayError{core::errors::ErrorCategory::Internal,
                                        "Process handle already released",
                                        "handle_released"};
    }
    auto status = child_->try_wait();
    if (!core::errors::is_error(status) && core::errors::get_value(status).has_value()) {
        exited_.store(true);
    }
    return status;
}

void ProcessHandle::terminate() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!child_) {
        return;
    }
    LOG_INFO("MCP_PROCESS", "Terminating process " + std::to_string(pid_));
    child_->kill_and_reap();
    child_.reset();
    exited_.store(true);
}

bool ProcessHandle::released() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !child_;
}

void ProcessHandle::with_child(const std::function<void(process::ChildProcess*)>& fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    fn(child_.get());
}

}  // namespace relay::session
