#include <cerrno>
#include <chrono>
#include <signal.h>
#include <string>
#include <thread>
#include <unistd.h>
#include <gtest/gtest.h>
#include "core/errors/relay_errors.hpp"
#include "process/child_process.hpp"
#include "test_workspace.hpp"

namespace {

using relay::core::errors::ErrorCategory;
using relay::core::errors::get_error;
using relay::core::errors::get_value;
using relay::core::errors::is_error;
using relay::process::ChildProcess;
using relay::process::Invocation;
using relay::process::SpawnOptions;

std::string read_all(const int fd) {
    std::string out;
    char buffer[256];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        return out;
    }
}

TEST(ChildProcessTest, CapturesStdoutAndExitCode) {
    auto spawned = ChildProcess::spawn(Invocation{"sh", {"-c", "echo hello; exit 4"}});
    ASSERT_FALSE(is_error(spawned));
    auto& child = get_value(spawned);

    auto out = child->take_stdout();
    ASSERT_TRUE(out.valid());
    EXPECT_EQ(read_all(out.get()), "hello\n");

    auto status = child->wait();
    ASSERT_FALSE(is_error(status));
    EXPECT_EQ(get_value(status).exit_code, 4);
    EXPECT_FALSE(get_value(status).success());
    EXPECT_EQ(get_value(status).to_string(), "exit status: 4");
}

TEST(ChildProcessTest, ForwardsStdin) {
    auto spawned = ChildProcess::spawn(Invocation{"cat", {}});
    ASSERT_FALSE(is_error(spawned));
    auto& child = get_value(spawned);

    auto in = child->take_stdin();
    auto out = child->take_stdout();
    const std::string line = "ping\n";
    ASSERT_EQ(write(in.get(), line.data(), line.size()), static_cast<ssize_t>(line.size()));
    in.reset();

    EXPECT_EQ(read_all(out.get()), "ping\n");
    auto status = child->wait();
    ASSERT_FALSE(is_error(status));
    EXPECT_TRUE(get_value(status).success());
}

TEST(ChildProcessTest, TakenStreamIsEmptyTheSecondTime) {
    auto spawned = ChildProcess::spawn(Invocation{"true", {}});
    ASSERT_FALSE(is_error(spawned));
    auto& child = get_value(spawned);

    EXPECT_TRUE(child->take_stderr().valid());
    EXPECT_FALSE(child->take_stderr().valid());
}

TEST(ChildProcessTest, TryWaitReportsRunningThenExited) {
    auto spawned = ChildProcess::spawn(Invocation{"sleep", {"5"}});
    ASSERT_FALSE(is_error(spawned));
    auto& child = get_value(spawned);

    auto running = child->try_wait();
    ASSERT_FALSE(is_error(running));
    EXPECT_FALSE(get_value(running).has_value());

    child->kill_and_reap();
    auto exited = child->try_wait();
    ASSERT_FALSE(is_error(exited));
    ASSERT_TRUE(get_value(exited).has_value());
    EXPECT_EQ(get_value(exited)->signal, SIGKILL);
    EXPECT_EQ(get_value(exited)->to_string(), "signal: 9");
}

TEST(ChildProcessTest, DestructorKillsRunningChild) {
    pid_t pid = -1;
    {
        auto spawned = ChildProcess::spawn(Invocation{"sleep", {"30"}});
        ASSERT_FALSE(is_error(spawned));
        pid = get_value(spawned)->pid();
        ASSERT_EQ(kill(pid, 0), 0);
    }
    // Killed and reaped: the pid no longer names a process or a zombie.
    errno = 0;
    EXPECT_EQ(kill(pid, 0), -1);
    EXPECT_EQ(errno, ESRCH);
}

TEST(ChildProcessTest, MissingProgramIsSpawnFailure) {
    auto spawned = ChildProcess::spawn(Invocation{"/definitely/not/a/binary", {}});
    ASSERT_TRUE(is_error(spawned));
    EXPECT_EQ(get_error(spawned).category, ErrorCategory::Launch);
    EXPECT_EQ(get_error(spawned).code, "spawn_failed");
}

TEST(ChildProcessTest, EmptyProgramIsSpawnFailure) {
    auto spawned = ChildProcess::spawn(Invocation{"", {}});
    ASSERT_TRUE(is_error(spawned));
    EXPECT_EQ(get_error(spawned).code, "spawn_failed");
}

TEST(ChildProcessTest, RunsInWorkingDirectory) {
    relay::testing::TempWorkspace workspace;
    SpawnOptions options;
    options.working_directory = workspace.root();

    auto spawned = ChildProcess::spawn(Invocation{"pwd", {}}, options);
    ASSERT_FALSE(is_error(spawned));
    auto out = get_value(spawned)->take_stdout();
    const std::string printed = read_all(out.get());

    EXPECT_EQ(std::filesystem::canonical(printed.substr(0, printed.size() - 1)),
              std::filesystem::canonical(workspace.root()));
}

TEST(ChildProcessTest, MissingWorkingDirectoryIsSpawnFailure) {
    SpawnOptions options;
    options.working_directory = "/definitely/not/a/dir";

    auto spawned = ChildProcess::spawn(Invocation{"true", {}}, options);
    ASSERT_TRUE(is_error(spawned));
    EXPECT_EQ(get_error(spawned).code, "spawn_failed");
}

}  // namespace
