#include "tools/command_runner.hpp"

#include <cerrno>
#include <cstdint>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include "core/logging/logger.hpp"

namespace relay::tools {

namespace {

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void drain_pipe(process::UniqueFd& fd, std::string& out) {
    if (!fd.valid()) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd.get(), buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            fd.reset();
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        fd.reset();
        return;
    }
}

}  // namespace

core::errors::Result<CommandOutput> run_command(const CommandRequest& request) {
    process::SpawnOptions options;
    options.working_directory = request.working_directory;
    options.pipe_stdin = false;

    const auto started = std::chrono::steady_clock::now();
    auto spawned = process::ChildProcess::spawn(request.invocation, options);
    if (core::errors::is_error(spawned)) {
        return core::errors::get_error(spawned);
    }
    auto& child = core::errors::get_value(spawned);

    process::UniqueFd stdout_fd = child->take_stdout();
    process::UniqueFd stderr_fd = child->take_stderr();
    set_nonblocking(stdout_fd.get());
    set_nonblocking(stderr_fd.get());

    CommandOutput capture;
    bool child_exited = false;

    while (stdout_fd.valid() || stderr_fd.valid() || !child_exited) {
        const auto now = std::chrono::steady_clock::now();
        const auto elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(now - started);
        if (!capture.timed_out && request.timeout.count() > 0 &&
            elapsed > request.timeout && !child_exited) {
            capture.timed_out = true;
            LOG_WARN("SETUP", "Command timed out after " +
                                  std::to_string(elapsed.count()) + "ms: " +
                                  request.invocation.to_string());
            static_cast<void>(kill(child->pid(), SIGKILL));
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_fd.valid()) {
            fds[nfds].fd = stdout_fd.get();
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_fd.valid()) {
            fds[nfds].fd = stderr_fd.get();
            fds[nfds].events = POLLIN;
            ++nfds;
        }

        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else {
            static_cast<void>(poll(nullptr, 0, 50));
        }

        drain_pipe(stdout_fd, capture.stdout_text);
        drain_pipe(stderr_fd, capture.stderr_text);

        if (!child_exited) {
            auto status = child->try_wait();
            if (core::errors::is_error(status)) {
                return core::errors::get_error(status);
            }
            if (core::errors::get_value(status).has_value()) {
                child_exited = true;
                capture.status = *core::errors::get_value(status);
            }
        }

        // Grandchildren may keep the pipes open after the child is gone.
        if (child_exited && (capture.timed_out ||
                             (request.timeout.count() > 0 && elapsed > request.timeout))) {
            break;
        }
    }

    const auto ended = std::chrono::steady_clock::now();
    capture.duration_ms =
        std::chrono::duration<double, std::milli>(ended - started).count();
    return capture;
}

}  // namespace relay::tools
