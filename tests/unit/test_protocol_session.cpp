#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <gtest/gtest.h>
#include "core/errors/relay_errors.hpp"
#include "process/child_process.hpp"
#include "session/process_handle.hpp"
#include "session/protocol_session.hpp"

namespace {

using relay::core::errors::ErrorCategory;
using relay::core::errors::get_error;
using relay::core::errors::get_value;
using relay::core::errors::is_error;
using relay::process::ChildProcess;
using relay::process::Invocation;
using relay::protocol::QueryRequest;
using relay::session::ProcessHandle;
using relay::session::ProtocolSession;
using relay::session::QueryState;

constexpr const char* kEchoPeer = "while read line; do echo \"pong:$line\"; done";

// Starts `sh -c script` as the agent and wires a session onto its pipes.
std::unique_ptr<ProtocolSession> start_peer(
    const std::string& script,
    std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto spawned = ChildProcess::spawn(Invocation{"sh", {"-c", script}});
    if (is_error(spawned)) {
        ADD_FAILURE() << get_error(spawned).message;
        return nullptr;
    }
    auto& child = get_value(spawned);
    auto in = child->take_stdin();
    auto out = child->take_stdout();
    auto handle = std::make_shared<ProcessHandle>(std::move(child));
    return std::make_unique<ProtocolSession>(std::move(in), std::move(out), handle, timeout);
}

QueryRequest command(const std::string& text) {
    return QueryRequest{text};
}

TEST(ProtocolSessionTest, ReturnsTrimmedReplyLine) {
    auto session = start_peer(kEchoPeer);
    ASSERT_NE(session, nullptr);

    auto result = session->query(command("ping"));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).result, "pong:ping");
    EXPECT_EQ(get_value(result).request_number, 1u);
    EXPECT_GE(get_value(result).duration_ms, 0.0);
    EXPECT_EQ(session->state(), QueryState::Idle);
}

TEST(ProtocolSessionTest, StripsSurroundingWhitespace) {
    auto session = start_peer("while read line; do printf '  %s \\t\\r\\n' \"$line\"; done");
    ASSERT_NE(session, nullptr);

    auto result = session->query(command("{\"tool\":\"fetch\"}"));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).result, "{\"tool\":\"fetch\"}");
}

TEST(ProtocolSessionTest, RepliesStayInOrder) {
    auto session = start_peer(kEchoPeer);
    ASSERT_NE(session, nullptr);

    for (int i = 1; i <= 5; ++i) {
        auto result = session->query(command("msg" + std::to_string(i)));
        ASSERT_FALSE(is_error(result));
        EXPECT_EQ(get_value(result).result, "pong:msg" + std::to_string(i));
        EXPECT_EQ(get_value(result).request_number, static_cast<std::uint64_t>(i));
    }
    EXPECT_EQ(session->request_count(), 5u);
    EXPECT_EQ(session->stats().request_count, 5u);
}

TEST(ProtocolSessionTest, ClosedStdoutIsConnectionClosed) {
    auto session = start_peer("read line; exec 1>&-; sleep 5");
    ASSERT_NE(session, nullptr);

    auto result = session->query(command("hello"));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Protocol);
    EXPECT_EQ(get_error(result).code, "connection_closed");
    EXPECT_EQ(session->state(), QueryState::Failed);
}

TEST(ProtocolSessionTest, BlankReplyIsEmptyResponse) {
    auto session = start_peer("read line; echo '   '; sleep 5");
    ASSERT_NE(session, nullptr);

    auto result = session->query(command("hello"));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "empty_response");
}

TEST(ProtocolSessionTest, SlowPeerTimesOut) {
    auto session = start_peer("read line; sleep 5; echo late", std::chrono::milliseconds(500));
    ASSERT_NE(session, nullptr);

    const auto started = std::chrono::steady_clock::now();
    auto result = session->query(command("hello"));
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "timeout");
    EXPECT_EQ(get_error(result).message, "MCP server timeout");
    EXPECT_GE(elapsed, std::chrono::milliseconds(450));
    EXPECT_LT(elapsed, std::chrono::milliseconds(3000));
    EXPECT_EQ(session->stats().abandoned_responses, 1u);
}

TEST(ProtocolSessionTest, LateReplyIsDiscardedBeforeNextQuery) {
    auto session = start_peer(
        "read first; sleep 1; echo late; while read line; do echo \"fresh:$line\"; done",
        std::chrono::milliseconds(300));
    ASSERT_NE(session, nullptr);

    auto first = session->query(command("one"));
    ASSERT_TRUE(is_error(first));
    EXPECT_EQ(get_error(first).code, "timeout");

    // Let the reply to the abandoned query arrive.
    std::this_thread::sleep_for(std::chrono::milliseconds(1500));

    auto second = session->query(command("two"));
    ASSERT_FALSE(is_error(second));
    EXPECT_EQ(get_value(second).result, "fresh:two");
    EXPECT_EQ(session->stats().abandoned_responses, 0u);
}

TEST(ProtocolSessionTest, LateReplyIsDiscardedWhileAwaiting) {
    auto session = start_peer(
        "read first; sleep 1; echo late; while read line; do echo \"fresh:$line\"; done",
        std::chrono::milliseconds(800));
    ASSERT_NE(session, nullptr);

    auto first = session->query(command("one"));
    ASSERT_TRUE(is_error(first));

    // "late" shows up while this query waits and must not be taken as its reply.
    auto second = session->query(command("two"));
    ASSERT_FALSE(is_error(second));
    EXPECT_EQ(get_value(second).result, "fresh:two");
}

TEST(ProtocolSessionTest, UnansweredRequestDoesNotStallLaterQueries) {
    auto session = start_peer(
        "while read line; do [ \"$line\" = skip ] || echo \"pong:$line\"; done",
        std::chrono::milliseconds(300));
    ASSERT_NE(session, nullptr);

    auto a = session->query(command("a"));
    ASSERT_FALSE(is_error(a));
    EXPECT_EQ(get_value(a).result, "pong:a");

    auto skipped = session->query(command("skip"));
    ASSERT_TRUE(is_error(skipped));
    EXPECT_EQ(get_error(skipped).code, "timeout");
    EXPECT_EQ(session->stats().abandoned_responses, 1u);

    // The only line that arrives is this query's own reply; it is returned
    // once the window for a late reply has passed.
    auto b = session->query(command("b"));
    ASSERT_FALSE(is_error(b));
    EXPECT_EQ(get_value(b).result, "pong:b");
    EXPECT_EQ(session->stats().abandoned_responses, 0u);

    for (const std::string name : {"c", "d"}) {
        const auto started = std::chrono::steady_clock::now();
        auto result = session->query(command(name));
        ASSERT_FALSE(is_error(result)) << name;
        EXPECT_EQ(get_value(result).result, "pong:" + name);
        EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(250));
    }
}

TEST(ProtocolSessionTest, PartlyAnsweredTimeoutsAreForgotten) {
    // Answers "one" late, never answers "two", then echoes normally.
    auto session = start_peer(
        "read first; read second; sleep 0.5; echo late:$first; "
        "while read line; do echo \"fresh:$line\"; done",
        std::chrono::milliseconds(200));
    ASSERT_NE(session, nullptr);

    ASSERT_TRUE(is_error(session->query(command("one"))));
    ASSERT_TRUE(is_error(session->query(command("two"))));
    EXPECT_EQ(session->stats().abandoned_responses, 2u);

    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    auto third = session->query(command("three"));
    ASSERT_FALSE(is_error(third));
    EXPECT_EQ(get_value(third).result, "fresh:three");
    EXPECT_EQ(session->stats().abandoned_responses, 0u);

    auto fourth = session->query(command("four"));
    ASSERT_FALSE(is_error(fourth));
    EXPECT_EQ(get_value(fourth).result, "fresh:four");
}

TEST(ProtocolSessionTest, DeadProcessIsProcessTerminated) {
    auto session = start_peer("exit 0");
    ASSERT_NE(session, nullptr);
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    auto result = session->query(command("hello"));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "process_terminated");
    EXPECT_EQ(session->request_count(), 1u);
}

TEST(ProtocolSessionTest, ClosedStdinIsFlushFailure) {
    auto session = start_peer("exec 0<&-; sleep 5");
    ASSERT_NE(session, nullptr);
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    auto result = session->query(command("hello"));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "flush_failed");
}

TEST(ProtocolSessionTest, MultiLineCommandIsRejected) {
    auto session = start_peer(kEchoPeer);
    ASSERT_NE(session, nullptr);

    auto result = session->query(command("line one\nline two"));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "invalid_command");
    EXPECT_EQ(session->request_count(), 1u);

    // The stream is untouched, so the next query still lines up.
    auto next = session->query(command("ok"));
    ASSERT_FALSE(is_error(next));
    EXPECT_EQ(get_value(next).result, "pong:ok");
}

TEST(ProtocolSessionTest, StatsDescribeTheSession) {
    auto session = start_peer(kEchoPeer);
    ASSERT_NE(session, nullptr);
    ASSERT_FALSE(is_error(session->query(command("ping"))));

    const auto stats = session->stats();
    EXPECT_EQ(stats.pid, session->handle()->pid());
    EXPECT_EQ(stats.request_count, 1u);

    const std::string text = session->describe_stats();
    EXPECT_NE(text.find("PID: " + std::to_string(stats.pid)), std::string::npos);
    EXPECT_NE(text.find("Requests: 1"), std::string::npos);
    EXPECT_NE(text.find("Last activity: "), std::string::npos);
}

}  // namespace
