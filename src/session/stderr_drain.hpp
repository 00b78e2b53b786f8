#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include "process/unique_fd.hpp"
#include "session/process_handle.hpp"

namespace relay::session {

// Why the drain stopped.
enum class DrainOutcome {
    ProcessExited,         // stderr closed and the process had exited
    StderrClosedRunning,   // stderr closed while the process kept running
    HandleReleased,        // stderr closed after the handle was terminated
    StatusUnknown,         // stderr closed and the status check failed
    ReadFailed,            // read(2) on stderr failed
    Stopped                // stop() was called before the stream closed
};

std::string to_string(DrainOutcome outcome);

// Reads the agent's stderr line by line for the whole process lifetime so the
// agent never blocks on a full pipe; each non-empty line goes to the log.
class StderrDrain {
public:
    StderrDrain(std::string server_name, process::UniqueFd stderr_fd,
                std::shared_ptr<ProcessHandle> handle);
    ~StderrDrain();

    StderrDrain(const StderrDrain&) = delete;
    StderrDrain& operator=(const StderrDrain&) = delete;

    void start();

    // Wakes the reader thread and joins it. Safe to call more than once.
    void stop();

    bool wait_finished(std::chrono::milliseconds timeout);

    std::size_t line_count() const { return line_count_.load(); }
    bool finished() const;
    std::optional<DrainOutcome> outcome() const;

private:
    void run();
    void handle_line(std::string line);
    DrainOutcome classify_close();
    void finish(DrainOutcome outcome);

    std::string server_name_;
    process::UniqueFd stderr_fd_;
    process::UniqueFd wake_read_;
    process::UniqueFd wake_write_;
    std::shared_ptr<ProcessHandle> handle_;
    std::thread thread_;
    std::atomic<std::size_t> line_count_{0};

    mutable std::mutex mutex_;
    std::condition_variable finished_cv_;
    std::optional<DrainOutcome> outcome_;
};

}  // namespace relay::session
