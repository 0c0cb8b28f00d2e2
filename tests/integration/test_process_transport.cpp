#include <gtest/gtest.h>
#include "toolbridge/error.hpp"
#include "toolbridge/session.hpp"
#include "toolbridge/transport/process_transport.hpp"
#include "../support/fake_server.hpp"
#include <sys/wait.h>

using namespace toolbridge;
using namespace std::chrono_literals;

#ifndef FAKE_TOOL_SERVER_PATH
#error "FAKE_TOOL_SERVER_PATH must name the fake_tool_server binary"
#endif

namespace {

ProcessTransport::Options server_options(std::vector<std::string> args = {}) {
    ProcessTransport::Options opts;
    opts.command = FAKE_TOOL_SERVER_PATH;
    opts.args = std::move(args);
    for (const auto& a : opts.args) {
        if (a == "--content-length") opts.framing = Framing::ContentLength;
    }
    opts.shutdown_grace = 500ms;
    return opts;
}

std::unique_ptr<Session> make_session(ProcessTransport::Options opts,
                                      std::chrono::milliseconds handshake_timeout = 3s) {
    Session::Options so;
    so.connector.handshake_timeout = handshake_timeout;
    so.discovery_timeout = 3s;
    so.call_timeout = 5s;
    return std::make_unique<Session>("fake", std::make_unique<ProcessTransport>(std::move(opts)), so);
}

std::string initialize_request() {
    return nlohmann::json{
        {"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"},
        {"params", {{"protocolVersion", std::string(PROTOCOL_VERSION)},
                    {"capabilities", nlohmann::json::object()},
                    {"clientInfo", {{"name", "test"}, {"version", "0"}}}}}
    }.dump();
}

} // namespace

// ---------- Raw transport ----------

TEST(ProcessTransport, ExchangesNewlineFrames) {
    ProcessTransport t(server_options());
    t.open();
    EXPECT_TRUE(t.is_open());
    EXPECT_GT(t.pid(), 0);

    t.send(initialize_request());
    auto frame = t.receive();
    ASSERT_TRUE(frame.has_value());
    auto reply = nlohmann::json::parse(*frame);
    EXPECT_EQ(reply["id"], 1);
    EXPECT_EQ(reply["result"]["serverInfo"]["name"], "fake-tool-server");

    t.close();
    EXPECT_FALSE(t.is_open());
    ASSERT_TRUE(t.exit_status().has_value());
    EXPECT_TRUE(WIFEXITED(*t.exit_status()));
    EXPECT_EQ(WEXITSTATUS(*t.exit_status()), 0);
}

TEST(ProcessTransport, ExchangesContentLengthFrames) {
    ProcessTransport t(server_options({"--content-length"}));
    t.open();
    t.send(initialize_request());
    auto frame = t.receive();
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(nlohmann::json::parse(*frame)["id"], 1);
}

TEST(ProcessTransport, MissingExecutableIsConnectError) {
    ProcessTransport::Options opts;
    opts.command = "/nonexistent/toolbridge-no-such-server";
    ProcessTransport t(opts);
    EXPECT_THROW(t.open(), ConnectError);
    EXPECT_FALSE(t.is_open());
}

TEST(ProcessTransport, SendAfterCloseFails) {
    ProcessTransport t(server_options());
    t.open();
    t.close();
    t.close();
    EXPECT_THROW(t.send("{}"), TransportError);
}

TEST(ProcessTransport, NonZeroExitIsReportedAsFailure) {
    ProcessTransport t(server_options({"--crash", "7"}));
    t.open();
    EXPECT_THROW((void)t.receive(), TransportError);
}

TEST(ProcessTransport, CleanExitIsEndOfStream) {
    ProcessTransport t(server_options({"--crash", "0"}));
    t.open();
    EXPECT_FALSE(t.receive().has_value());
}

TEST(ProcessTransport, Describe) {
    ProcessTransport t(server_options({"--content-length"}));
    EXPECT_EQ(t.describe(), std::string("process '") + FAKE_TOOL_SERVER_PATH + " --content-length'");
}

// ---------- Sessions over a child process ----------

TEST(ProcessSession, DiscoverAndCall) {
    auto s = make_session(server_options());
    s->start();
    auto tools = s->discover();
    EXPECT_EQ(tools.size(), 9u);

    auto r = s->call("add", {{"a", 2}, {"b", 40}});
    ASSERT_TRUE(r.structured_content.has_value());
    EXPECT_EQ((*r.structured_content)["sum"], 42.0);

    auto failed = s->call("fail", nlohmann::json::object());
    EXPECT_TRUE(failed.is_error);
}

TEST(ProcessSession, ContentLengthFraming) {
    auto s = make_session(server_options({"--content-length"}));
    s->start();
    EXPECT_EQ(s->call("echo", {{"text", "framed"}}).text(), "framed");
}

TEST(ProcessSession, EnvironmentAndWorkingDirectory) {
    auto opts = server_options();
    opts.env["TOOLBRIDGE_TEST_MARKER"] = "present";
    opts.working_dir = "/";
    auto s = make_session(opts);
    s->start();
    EXPECT_EQ(s->call("env", {{"name", "TOOLBRIDGE_TEST_MARKER"}}).text(), "present");
    EXPECT_EQ(s->call("cwd", nlohmann::json::object()).text(), "/");
}

TEST(ProcessSession, MalformedOutputIsSkipped) {
    auto s = make_session(server_options());
    s->start();
    EXPECT_EQ(s->call("garbage", nlohmann::json::object()).text(), "after garbage");
    EXPECT_EQ(s->state(), SessionState::Ready);
}

TEST(ProcessSession, SlowCallTimesOutAndSessionRecovers) {
    auto s = make_session(server_options());
    s->start();
    EXPECT_THROW((void)s->call("sleep", {{"ms", 600}}, 100ms), TimeoutError);
    // the server is sequential; the next reply waits for the sleep to finish
    EXPECT_EQ(s->call("echo", {{"text", "still here"}}).text(), "still here");
    EXPECT_EQ(s->pending_count(), 0u);
}

TEST(ProcessSession, ListChangedRefreshesCache) {
    auto s = make_session(server_options());
    s->start();
    (void)s->call("notify_change", nlohmann::json::object());
    (void)s->call("echo", {{"text", "sync"}});
    EXPECT_EQ(s->discover().size(), 9u);
}

TEST(ProcessSession, CrashFailsPendingCallAndDegrades) {
    auto s = make_session(server_options());
    s->start();
    try {
        (void)s->call("exit", {{"code", 3}});
        FAIL() << "expected ConnectionLost";
    } catch (const ConnectionLost& e) {
        EXPECT_NE(std::string(e.what()).find("exited with status 3"), std::string::npos);
    }
    ASSERT_TRUE(toolbridge::testing::eventually([&] { return s->state() == SessionState::Degraded; }));
}

TEST(ProcessSession, CleanExitAlsoDegrades) {
    auto s = make_session(server_options());
    s->start();
    EXPECT_THROW((void)s->call("exit", {{"code", 0}}), ConnectionLost);
    ASSERT_TRUE(toolbridge::testing::eventually([&] { return s->state() == SessionState::Degraded; }));
}

TEST(ProcessSession, HandshakeFailures) {
    EXPECT_THROW(make_session(server_options({"--bad-handshake"}))->start(), HandshakeError);
    EXPECT_THROW(make_session(server_options({"--no-handshake"}), 300ms)->start(), HandshakeError);
    EXPECT_THROW(make_session(server_options({"--crash", "2"}))->start(), HandshakeError);
}

TEST(ProcessSession, ExecFailureIsConnectError) {
    ProcessTransport::Options opts;
    opts.command = "/nonexistent/toolbridge-no-such-server";
    auto s = make_session(opts);
    EXPECT_THROW(s->start(), ConnectError);
    EXPECT_EQ(s->state(), SessionState::Closed);
}
