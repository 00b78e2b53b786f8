#include <chrono>
#include <filesystem>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/errors/relay_errors.hpp"
#include "process/launcher.hpp"

namespace {

using relay::core::config::RuntimeConfig;
using relay::core::errors::ErrorCategory;
using relay::core::errors::get_error;
using relay::core::errors::get_value;
using relay::core::errors::is_error;
using relay::process::Invocation;
using relay::process::Launcher;
using relay::protocol::ServerDescriptor;

ServerDescriptor node_descriptor() {
    ServerDescriptor descriptor;
    descriptor.name = "readability";
    descriptor.type = "github";
    descriptor.repository = "owner/readability";
    descriptor.language = "node";
    descriptor.entrypoint = "dist/../dist/index.js";
    return descriptor;
}

TEST(LauncherTest, BuildsInterpreterInvocation) {
    RuntimeConfig config;
    config.servers_dir = "/srv/agents";

    auto invocation = Launcher().build_invocation(node_descriptor(), config);
    ASSERT_FALSE(is_error(invocation));
    EXPECT_EQ(get_value(invocation).program, "node");
    ASSERT_EQ(get_value(invocation).args.size(), 1u);
    EXPECT_EQ(get_value(invocation).args[0], "/srv/agents/readability/dist/index.js");
}

TEST(LauncherTest, RelativeServersDirBecomesAbsolute) {
    RuntimeConfig config;
    config.servers_dir = "agents";

    auto invocation = Launcher().build_invocation(node_descriptor(), config);
    ASSERT_FALSE(is_error(invocation));
    EXPECT_TRUE(std::filesystem::path(get_value(invocation).args[0]).is_absolute());
}

TEST(LauncherTest, RejectsLanguageOutsideSupportedList) {
    auto descriptor = node_descriptor();
    descriptor.language = "ruby";

    auto invocation = Launcher().build_invocation(descriptor, RuntimeConfig{});
    ASSERT_TRUE(is_error(invocation));
    EXPECT_EQ(get_error(invocation).category, ErrorCategory::Launch);
    EXPECT_EQ(get_error(invocation).code, "unsupported_language");
}

TEST(LauncherTest, RejectsSupportedLanguageWithoutRuntime) {
    auto descriptor = node_descriptor();
    descriptor.language = "ruby";
    RuntimeConfig config;
    config.supported_languages = {"node", "python", "ruby"};

    auto invocation = Launcher().build_invocation(descriptor, config);
    ASSERT_TRUE(is_error(invocation));
    EXPECT_EQ(get_error(invocation).code, "unsupported_language");
    EXPECT_NE(get_error(invocation).message.find("not implemented"), std::string::npos);
}

TEST(LauncherTest, ProcessThatExitsDuringGraceIsImmediateExit) {
    const Launcher launcher({}, std::chrono::milliseconds(300));

    auto launched = launcher.launch_invocation(Invocation{"sh", {"-c", "exit 3"}});
    ASSERT_TRUE(is_error(launched));
    EXPECT_EQ(get_error(launched).code, "immediate_exit");
    EXPECT_NE(get_error(launched).message.find("exit status: 3"), std::string::npos);
}

TEST(LauncherTest, MissingInterpreterIsSpawnFailure) {
    const Launcher launcher({}, std::chrono::milliseconds(10));

    auto launched = launcher.launch_invocation(Invocation{"/definitely/not/node", {}});
    ASSERT_TRUE(is_error(launched));
    EXPECT_EQ(get_error(launched).code, "spawn_failed");
}

TEST(LauncherTest, RunningProcessHandsOutAllStreams) {
    const Launcher launcher({}, std::chrono::milliseconds(50));

    auto launched = launcher.launch_invocation(Invocation{"cat", {}});
    ASSERT_FALSE(is_error(launched));
    auto& process = get_value(launched);
    EXPECT_TRUE(process.stdin_fd.valid());
    EXPECT_TRUE(process.stdout_fd.valid());
    EXPECT_TRUE(process.stderr_fd.valid());
    ASSERT_NE(process.child, nullptr);

    auto status = process.child->try_wait();
    ASSERT_FALSE(is_error(status));
    EXPECT_FALSE(get_value(status).has_value());
}

}  // namespace
