#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <gtest/gtest.h>
#include "core/errors/relay_errors.hpp"
#include "process/child_process.hpp"
#include "session/process_handle.hpp"
#include "session/stderr_drain.hpp"

namespace {

using relay::core::errors::get_error;
using relay::core::errors::get_value;
using relay::core::errors::is_error;
using relay::process::ChildProcess;
using relay::process::Invocation;
using relay::process::UniqueFd;
using relay::session::DrainOutcome;
using relay::session::ProcessHandle;
using relay::session::StderrDrain;

struct Monitored {
    std::shared_ptr<ProcessHandle> handle;
    UniqueFd stderr_fd;
};

Monitored spawn_script(const std::string& script) {
    Monitored monitored;
    auto spawned = ChildProcess::spawn(Invocation{"sh", {"-c", script}});
    if (is_error(spawned)) {
        ADD_FAILURE() << get_error(spawned).message;
        monitored.handle = std::make_shared<ProcessHandle>(nullptr);
        return monitored;
    }
    auto& child = get_value(spawned);
    monitored.stderr_fd = child->take_stderr();
    monitored.handle = std::make_shared<ProcessHandle>(std::move(child));
    return monitored;
}

constexpr std::chrono::milliseconds kWait{3000};

TEST(StderrDrainTest, CountsLinesUntilProcessExits) {
    auto monitored = spawn_script("echo one >&2; echo >&2; printf 'three' >&2; exit 0");
    StderrDrain drain("echo", std::move(monitored.stderr_fd), monitored.handle);
    drain.start();

    ASSERT_TRUE(drain.wait_finished(kWait));
    EXPECT_EQ(drain.line_count(), 3u);
    ASSERT_TRUE(drain.outcome().has_value());
    EXPECT_EQ(drain.outcome().value(), DrainOutcome::ProcessExited);
    EXPECT_TRUE(monitored.handle->exited());
    drain.stop();
}

TEST(StderrDrainTest, ClosedStderrWhileRunning) {
    auto monitored = spawn_script("exec 2>&-; sleep 5");
    StderrDrain drain("quiet", std::move(monitored.stderr_fd), monitored.handle);
    drain.start();

    ASSERT_TRUE(drain.wait_finished(kWait));
    EXPECT_EQ(drain.outcome().value(), DrainOutcome::StderrClosedRunning);
    EXPECT_TRUE(monitored.handle->is_alive());
    monitored.handle->terminate();
    drain.stop();
}

TEST(StderrDrainTest, TerminatedHandleIsReportedAsReleased) {
    auto monitored = spawn_script("sleep 30");
    StderrDrain drain("sleeper", std::move(monitored.stderr_fd), monitored.handle);
    drain.start();

    monitored.handle->terminate();
    ASSERT_TRUE(drain.wait_finished(kWait));
    EXPECT_EQ(drain.outcome().value(), DrainOutcome::HandleReleased);
    drain.stop();
}

TEST(StderrDrainTest, StopWakesBlockedReader) {
    auto monitored = spawn_script("sleep 30");
    StderrDrain drain("sleeper", std::move(monitored.stderr_fd), monitored.handle);
    drain.start();

    const auto started = std::chrono::steady_clock::now();
    drain.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(2));
    EXPECT_TRUE(drain.finished());
    EXPECT_EQ(drain.outcome().value(), DrainOutcome::Stopped);

    // Idempotent.
    drain.stop();
    monitored.handle->terminate();
}

}  // namespace
