#include "process/child_process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace relay::process {

using core::errors::ErrorCategory;
using core::errors::RelayError;

namespace {

struct PipePair {
    UniqueFd read_end;
    UniqueFd write_end;
};

bool make_pipe(PipePair& pair) {
    int fds[2] = {-1, -1};
    if (pipe2(fds, O_CLOEXEC) != 0) {
        return false;
    }
    pair.read_end.reset(fds[0]);
    pair.write_end.reset(fds[1]);
    return true;
}

ExitStatus decode_status(const int status) {
    ExitStatus decoded;
    if (WIFEXITED(status)) {
        decoded.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        decoded.signal = WTERMSIG(status);
    }
    return decoded;
}

// Runs in the forked child: only async-signal-safe calls from here on.
[[noreturn]] void exec_child(const SpawnOptions& options, const int stdin_fd,
                             const int stdout_fd, const int stderr_fd,
                             const int error_fd, const pid_t parent,
                             char* const* argv) {
    // SIGKILL once the spawning thread exits; getppid catches a parent already gone.
    static_cast<void>(prctl(PR_SET_PDEATHSIG, SIGKILL));
    if (getppid() != parent) {
        _exit(125);
    }

    // Ignored signals and the blocked mask survive exec; give the agent defaults.
    static_cast<void>(signal(SIGPIPE, SIG_DFL));
    sigset_t empty;
    sigemptyset(&empty);
    static_cast<void>(sigprocmask(SIG_SETMASK, &empty, nullptr));

    if (stdin_fd >= 0) {
        static_cast<void>(dup2(stdin_fd, STDIN_FILENO));
    }
    if (stdout_fd >= 0) {
        static_cast<void>(dup2(stdout_fd, STDOUT_FILENO));
    }
    if (stderr_fd >= 0) {
        static_cast<void>(dup2(stderr_fd, STDERR_FILENO));
    }

    if (!options.working_directory.empty() &&
        chdir(options.working_directory.c_str()) != 0) {
        const int err = errno;
        static_cast<void>(write(error_fd, &err, sizeof(err)));
        _exit(126);
    }

    execvp(argv[0], argv);
    const int err = errno;
    static_cast<void>(write(error_fd, &err, sizeof(err)));
    _exit(127);
}

}  // namespace

std::string Invocation::to_string() const {
    std::string text = program;
    for (const auto& arg : args) {
        text += " " + arg;
    }
    return text;
}

std::string ExitStatus::to_string() const {
    if (signal != 0) {
        return "signal: " + std::to_string(signal);
    }
    return "exit status: " + std::to_string(exit_code);
}

void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { static_cast<void>(std::signal(SIGPIPE, SIG_IGN)); });
}

ChildProcess::ChildProcess(const pid_t pid) : pid_(pid) {}

ChildProcess::~ChildProcess() {
    kill_and_reap();
}

core::errors::Result<std::unique_ptr<ChildProcess>> ChildProcess::spawn(
    const Invocation& invocation, const SpawnOptions& options) {
    if (invocation.program.empty()) {
        return RelayError{ErrorCategory::Launch, "Cannot spawn an empty program.",
                          "spawn_failed"};
    }
    ignore_sigpipe();

    PipePair in_pipe;
    PipePair out_pipe;
    PipePair err_pipe;
    PipePair exec_report;
    if ((options.pipe_stdin && !make_pipe(in_pipe)) ||
        (options.pipe_stdout && !make_pipe(out_pipe)) ||
        (options.pipe_stderr && !make_pipe(err_pipe)) || !make_pipe(exec_report)) {
        return RelayError{ErrorCategory::Internal,
                          std::string("Failed to create process pipes: ") +
                              std::strerror(errno),
                          "pipe_creation_failed"};
    }

    UniqueFd null_input;
    if (!options.pipe_stdin) {
        null_input.reset(open("/dev/null", O_RDONLY | O_CLOEXEC));
    }

    // argv must be built before fork; the child may not allocate.
    std::vector<std::string> storage;
    storage.reserve(invocation.args.size() + 1);
    storage.push_back(invocation.program);
    storage.insert(storage.end(), invocation.args.begin(), invocation.args.end());
    std::vector<char*> argv;
    argv.reserve(storage.size() + 1);
    for (auto& item : storage) {
        argv.push_back(item.data());
    }
    argv.push_back(nullptr);

    const pid_t parent = getpid();
    const pid_t pid = fork();
    if (pid < 0) {
        return RelayError{ErrorCategory::Launch,
                          std::string("Failed to fork process: ") + std::strerror(errno),
                          "spawn_failed"};
    }

    if (pid == 0) {
        const int child_stdin = options.pipe_stdin ? in_pipe.read_end.get() : null_input.get();
        exec_child(options, child_stdin,
                   options.pipe_stdout ? out_pipe.write_end.get() : -1,
                   options.pipe_stderr ? err_pipe.write_end.get() : -1,
                   exec_report.write_end.get(), parent, argv.data());
    }

    in_pipe.read_end.reset();
    out_pipe.write_end.reset();
    err_pipe.write_end.reset();
    exec_report.write_end.reset();

    std::unique_ptr<ChildProcess> child(new ChildProcess(pid));
    child->stdin_ = std::move(in_pipe.write_end);
    child->stdout_ = std::move(out_pipe.read_end);
    child->stderr_ = std::move(err_pipe.read_end);

    // EOF on the report pipe means exec succeeded (O_CLOEXEC closed it).
    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = read(exec_report.read_end.get(), &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        child->kill_and_reap();
        return RelayError{ErrorCategory::Launch,
                          "Failed to spawn '" + invocation.program +
                              "': " + std::strerror(child_errno),
                          "spawn_failed"};
    }

    return std::move(child);
}

core::errors::Result<std::optional<ExitStatus>> ChildProcess::try_wait() {
    if (status_.has_value()) {
        return status_;
    }

    int status = 0;
    pid_t waited = 0;
    do {
        waited = waitpid(pid_, &status, WNOHANG);
    } while (waited < 0 && errno == EINTR);

    if (waited == 0) {
        return std::optional<ExitStatus>{};
    }
    if (waited < 0) {
        return RelayError{ErrorCategory::Internal,
                          std::string("Failed to check process status: ") +
                              std::strerror(errno),
                          "wait_failed"};
    }
    status_ = decode_status(status);
    return status_;
}

core::errors::Result<ExitStatus> ChildProcess::wait() {
    if (status_.has_value()) {
        return *status_;
    }

    int status = 0;
    pid_t waited = 0;
    do {
        waited = waitpid(pid_, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (waited < 0) {
        return RelayError{ErrorCategory::Internal,
                          std::string("Failed to wait for process: ") +
                              std::strerror(errno),
                          "wait_failed"};
    }
    status_ = decode_status(status);
    return *status_;
}

void ChildProcess::kill_and_reap() {
    if (pid_ <= 0 || status_.has_value()) {
        return;
    }
    static_cast<void>(::kill(pid_, SIGKILL));
    auto waited = wait();
    if (core::errors::is_error(waited)) {
        // Reaped elsewhere; nothing left to release.
        status_ = ExitStatus{};
    }
}

}  // namespace relay::process
