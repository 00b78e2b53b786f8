#include "session/stderr_drain.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"

namespace relay::session {

namespace {

constexpr int kExitCheckAttempts = 10;
constexpr std::chrono::milliseconds kExitCheckInterval{10};

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

}  // namespace

std::string to_string(const DrainOutcome outcome) {
    switch (outcome) {
        case DrainOutcome::ProcessExited:
            return "process_exited";
        case DrainOutcome::StderrClosedRunning:
            return "stderr_closed_running";
        case DrainOutcome::HandleReleased:
            return "handle_released";
        case DrainOutcome::StatusUnknown:
            return "status_unknown";
        case DrainOutcome::ReadFailed:
            return "read_failed";
        case DrainOutcome::Stopped:
            return "stopped";
        default:
            return "unknown";
    }
}

StderrDrain::StderrDrain(std::string server_name, process::UniqueFd stderr_fd,
                         std::shared_ptr<ProcessHandle> handle)
    : server_name_(std::move(server_name)),
      stderr_fd_(std::move(stderr_fd)),
      handle_(std::move(handle)) {
    int fds[2] = {-1, -1};
    if (pipe2(fds, O_CLOEXEC) == 0) {
        wake_read_.reset(fds[0]);
        wake_write_.reset(fds[1]);
    }
}

StderrDrain::~StderrDrain() {
    stop();
}

void StderrDrain::start() {
    if (thread_.joinable()) {
        return;
    }
    thread_ = std::thread([this] { run(); });
}

void StderrDrain::stop() {
    if (wake_write_.valid()) {
        const char byte = 'x';
        static_cast<void>(write(wake_write_.get(), &byte, 1));
    }
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool StderrDrain::wait_finished(const std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return finished_cv_.wait_for(lock, timeout, [this] { return outcome_.has_value(); });
}

bool StderrDrain::finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outcome_.has_value();
}

std::optional<DrainOutcome> StderrDrain::outcome() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outcome_;
}

void StderrDrain::handle_line(std::string line) {
    const std::size_t number = ++line_count_;
    const std::string trimmed = trim(line);
    if (!trimmed.empty()) {
        LOG_DEBUG("STDERR_MONITOR",
                  "[" + server_name_ + ":" + std::to_string(number) + "] " + trimmed);
    }
}

DrainOutcome StderrDrain::classify_close() {
    LOG_WARN("STDERR_MONITOR", "Process " + server_name_ + " terminated (stderr closed)");

    // Descriptors close before the exit status is collectable; allow a short window.
    auto status = handle_->check_exit();
    for (int attempt = 0; attempt < kExitCheckAttempts; ++attempt) {
        if (core::errors::is_error(status) || core::errors::get_value(status).has_value()) {
            break;
        }
        std::this_thread::sleep_for(kExitCheckInterval);
        status = handle_->check_exit();
    }
    if (core::errors::is_error(status)) {
        const auto& err = core::errors::get_error(status);
        if (err.code == "handle_released") {
            return DrainOutcome::HandleReleased;
        }
        LOG_ERROR("STDERR_MONITOR", "Failed to check process status: " + err.message);
        return DrainOutcome::StatusUnknown;
    }

    const auto& exit_status = core::errors::get_value(status);
    if (exit_status.has_value()) {
        LOG_ERROR("STDERR_MONITOR", "Process " + server_name_ + " exited with " +
                                        exit_status->to_string());
        return DrainOutcome::ProcessExited;
    }
    LOG_WARN("STDERR_MONITOR",
             "Process " + server_name_ + " stderr closed but process still running");
    return DrainOutcome::StderrClosedRunning;
}

void StderrDrain::finish(const DrainOutcome outcome) {
    LOG_INFO("STDERR_MONITOR", "Stderr monitoring ended for " + server_name_ + " after " +
                                   std::to_string(line_count_.load()) + " lines (" +
                                   to_string(outcome) + ")");
    {
        std::lock_guard<std::mutex> lock(mutex_);
        outcome_ = outcome;
    }
    finished_cv_.notify_all();
}

void StderrDrain::run() {
    LOG_DEBUG("STDERR_MONITOR", "Starting stderr monitoring for " + server_name_);

    std::string pending;
    char buffer[4096];
    while (true) {
        pollfd fds[2];
        fds[0].fd = stderr_fd_.get();
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wake_read_.get();
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        const int ready = poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("STDERR_MONITOR", std::string("poll failed: ") + std::strerror(errno));
            finish(DrainOutcome::ReadFailed);
            return;
        }
        if ((fds[1].revents & POLLIN) != 0) {
            finish(DrainOutcome::Stopped);
            return;
        }
        if (fds[0].revents == 0) {
            continue;
        }

        const ssize_t n = read(stderr_fd_.get(), buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            LOG_ERROR("STDERR_MONITOR", std::string("Failed to read stderr: ") +
                                            std::strerror(errno));
            finish(DrainOutcome::ReadFailed);
            return;
        }
        if (n == 0) {
            if (!pending.empty()) {
                handle_line(std::move(pending));
                pending.clear();
            }
            finish(classify_close());
            return;
        }

        pending.append(buffer, static_cast<std::size_t>(n));
        std::size_t newline = pending.find('\n');
        while (newline != std::string::npos) {
            handle_line(pending.substr(0, newline + 1));
            pending.erase(0, newline + 1);
            newline = pending.find('\n');
        }
    }
}

}  // namespace relay::session
