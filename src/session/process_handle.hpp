#pragma once

#include <sys/types.h>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include "core/errors/relay_errors.hpp"
#include "process/child_process.hpp"

namespace relay::session {

// Shared owner of the agent process, guarded by its own lock so that liveness
// probes never wait behind an in-flight query.
class ProcessHandle {
public:
    explicit ProcessHandle(std::unique_ptr<process::ChildProcess> child);

    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    pid_t pid() const { return pid_; }

    // Liveness probe; never blocks.
    //   lock taken, child present, exit status known -> false
    //   lock taken, child present, still running     -> true
    //   lock taken, child released                   -> false
    //   lock busy                                    -> !exited()
    bool is_alive();

    // Blocking variant used by the stderr drain once the stream has closed.
    // nullopt with a live child means the process is still running.
    core::errors::Result<std::optional<process::ExitStatus>> check_exit();

    // Set by whoever first observes the exit; readable without the lock.
    bool exited() const { return exited_.load(); }

    // Kills and reaps the child, then releases it. Idempotent.
    void terminate();

    bool released() const;

    // Runs fn with the lock held; fn sees nullptr once the child is released.
    void with_child(const std::function<void(process::ChildProcess*)>& fn);

private:
    mutable std::mutex mutex_;
    std::unique_ptr<process::ChildProcess> child_;
    std::atomic<bool> exited_{false};
    const pid_t pid_;
};

}  // namespace relay::session
