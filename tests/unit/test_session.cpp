#include <gtest/gtest.h>
#include "toolbridge/session.hpp"
#include "toolbridge/error.hpp"
#include "../support/fake_server.hpp"
#include <thread>
#include <vector>

using namespace toolbridge;
using namespace toolbridge::testing;
using namespace std::chrono_literals;

namespace {

class SessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        server = std::make_shared<FakeServer>("rooms");
    }

    std::unique_ptr<Session> make(bool validate = true) {
        Session::Options opts;
        opts.connector.handshake_timeout = 500ms;
        opts.discovery_timeout = 1s;
        opts.call_timeout = 2s;
        opts.validate_arguments = validate;
        return std::make_unique<Session>("rooms", std::make_unique<FakeTransport>(server), opts);
    }

    std::unique_ptr<Session> started() {
        auto s = make();
        s->start();
        return s;
    }

    static nlohmann::json text_args(const std::string& text) {
        return {{"text", text}};
    }

    std::shared_ptr<FakeServer> server;
};

} // namespace

// ---------- Lifecycle ----------

TEST_F(SessionTest, StartReachesReadyWithCapabilities) {
    auto s = make();
    EXPECT_EQ(s->state(), SessionState::Connecting);
    EXPECT_FALSE(s->capabilities().has_value());

    s->start();
    EXPECT_EQ(s->state(), SessionState::Ready);
    auto caps = s->capabilities();
    ASSERT_TRUE(caps.has_value());
    ASSERT_EQ(caps->size(), 1u);
    EXPECT_EQ((*caps)[0].name, "echo");
    ASSERT_TRUE(s->server_info().has_value());
    EXPECT_EQ(s->server_info()->server_info.name, "rooms");
}

TEST_F(SessionTest, StartTwiceIsHarmless) {
    auto s = started();
    EXPECT_NO_THROW(s->start());
    EXPECT_EQ(server->connections(), 1);
}

TEST_F(SessionTest, ConnectFailureClosesSession) {
    server->fail_open = true;
    auto s = make();
    EXPECT_THROW(s->start(), ConnectError);
    EXPECT_EQ(s->state(), SessionState::Closed);
}

TEST_F(SessionTest, HandshakeRejectionClosesSession) {
    server->reject_initialize = true;
    auto s = make();
    EXPECT_THROW(s->start(), HandshakeError);
    EXPECT_EQ(s->state(), SessionState::Closed);
}

TEST_F(SessionTest, SilentServerTimesOutAsHandshakeError) {
    server->silent_initialize = true;
    auto s = make();
    auto begin = std::chrono::steady_clock::now();
    EXPECT_THROW(s->start(), HandshakeError);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 3s);
    EXPECT_EQ(s->state(), SessionState::Closed);
}

TEST_F(SessionTest, StartAfterCloseFails) {
    auto s = make();
    s->close();
    EXPECT_THROW(s->start(), SessionClosed);
}

TEST_F(SessionTest, CallBeforeStartIsNotReady) {
    auto s = make();
    EXPECT_THROW((void)s->call("echo", text_args("x")), NotReady);
}

TEST_F(SessionTest, CloseTwiceAndCallAfterClose) {
    auto s = started();
    s->close();
    s->close();
    EXPECT_EQ(s->state(), SessionState::Closed);
    EXPECT_FALSE(s->capabilities().has_value());
    EXPECT_THROW((void)s->call("echo", text_args("x")), SessionClosed);
}

// ---------- Calls ----------

TEST_F(SessionTest, CallReturnsToolResult) {
    auto s = started();
    auto r = s->call("echo", text_args("hello"));
    EXPECT_FALSE(r.is_error);
    EXPECT_EQ(nlohmann::json::parse(r.text())["text"], "hello");

    auto calls = server->received("tools/call");
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0]["params"]["name"], "echo");
    EXPECT_EQ(calls[0]["params"]["arguments"]["text"], "hello");
}

TEST_F(SessionTest, ToolErrorIsAResultNotAnException) {
    server->on_call = [](const std::string&, const nlohmann::json&) {
        return nlohmann::json{{"content", {{{"type", "text"}, {"text", "no rooms"}}}}, {"isError", true}};
    };
    auto s = started();
    auto r = s->call("echo", text_args("x"));
    EXPECT_TRUE(r.is_error);
    EXPECT_EQ(r.text(), "no rooms");
}

TEST_F(SessionTest, RemoteErrorSurfacesWithCode) {
    server->on_call = [](const std::string&, const nlohmann::json&) -> nlohmann::json {
        throw RemoteError(-32602, "location is required");
    };
    auto s = started();
    try {
        (void)s->call("echo", text_args("x"));
        FAIL() << "expected RemoteError";
    } catch (const RemoteError& e) {
        EXPECT_EQ(e.code, -32602);
    }
    EXPECT_EQ(s->state(), SessionState::Ready);
}

TEST_F(SessionTest, UnknownToolIsRejectedLocally) {
    auto s = started();
    EXPECT_THROW((void)s->call("book_flight", nlohmann::json::object()), UnknownCapability);
    EXPECT_TRUE(server->received("tools/call").empty());
}

TEST_F(SessionTest, InvalidArgumentsAreRejectedLocally) {
    auto s = started();
    EXPECT_THROW((void)s->call("echo", nlohmann::json::object()), InvalidArguments);
    EXPECT_THROW((void)s->call("echo", {{"text", 12}}), InvalidArguments);
    EXPECT_TRUE(server->received("tools/call").empty());
}

TEST_F(SessionTest, ValidationCanBeDisabled) {
    auto s = make(false);
    s->start();
    EXPECT_NO_THROW((void)s->call("echo", nlohmann::json::object()));
    EXPECT_EQ(server->received("tools/call").size(), 1u);
}

TEST_F(SessionTest, NullArgumentsBecomeEmptyObject) {
    auto s = make(false);
    s->start();
    (void)s->call("echo", nullptr);
    EXPECT_TRUE(server->received("tools/call")[0]["params"]["arguments"].is_object());
}

TEST_F(SessionTest, ConcurrentCallsAreCorrelated) {
    auto s = started();
    std::vector<std::thread> threads;
    std::vector<std::string> got(16);
    for (size_t i = 0; i < got.size(); ++i) {
        threads.emplace_back([&, i] {
            auto r = s->call("echo", text_args("msg-" + std::to_string(i)));
            got[i] = nlohmann::json::parse(r.text())["text"].get<std::string>();
        });
    }
    for (auto& t : threads) t.join();
    for (size_t i = 0; i < got.size(); ++i) {
        EXPECT_EQ(got[i], "msg-" + std::to_string(i));
    }
    EXPECT_EQ(s->pending_count(), 0u);
}

TEST_F(SessionTest, OutOfOrderResponsesReachTheirCallers) {
    server->hold_calls = true;
    auto s = started();
    auto a = s->call_async("echo", text_args("a"));
    auto b = s->call_async("echo", text_args("b"));
    auto c = s->call_async("echo", text_args("c"));
    ASSERT_TRUE(server->wait_for_held(3));
    EXPECT_LT(a.id(), b.id());
    EXPECT_LT(b.id(), c.id());

    auto reply = [](const std::string& t) {
        return nlohmann::json{{"content", {{{"type", "text"}, {"text", t}}}}};
    };
    server->respond(c.id(), reply("C"));
    server->respond(a.id(), reply("A"));
    server->respond(b.id(), reply("B"));

    EXPECT_EQ(b.get().text(), "B");
    EXPECT_EQ(c.get().text(), "C");
    EXPECT_EQ(a.get().text(), "A");
}

TEST_F(SessionTest, DuplicateResponseIsDiscarded) {
    server->duplicate_responses = true;
    auto s = started();
    auto first = s->call("echo", text_args("one"));
    EXPECT_NE(first.text(), "duplicate");
    server->duplicate_responses = false;
    auto second = s->call("echo", text_args("two"));
    EXPECT_EQ(nlohmann::json::parse(second.text())["text"], "two");
    EXPECT_EQ(s->state(), SessionState::Ready);
}

TEST_F(SessionTest, TimeoutCancelsAndSessionStaysUsable) {
    server->hold_calls = true;
    auto s = started();
    auto begin = std::chrono::steady_clock::now();
    EXPECT_THROW((void)s->call("echo", text_args("slow"), 100ms), TimeoutError);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 2s);
    EXPECT_EQ(server->received("notifications/cancelled").size(), 1u);

    auto held = server->held_calls();
    ASSERT_EQ(held.size(), 1u);
    server->respond(held[0], {{"content", nlohmann::json::array()}});

    server->hold_calls = false;
    EXPECT_NO_THROW((void)s->call("echo", text_args("fast")));
    EXPECT_EQ(s->pending_count(), 0u);
    EXPECT_EQ(s->state(), SessionState::Ready);
}

TEST_F(SessionTest, CancelledCall) {
    server->hold_calls = true;
    auto s = started();
    auto call = s->call_async("echo", text_args("x"));
    ASSERT_TRUE(server->wait_for_held(1));
    call.cancel("no longer needed");
    EXPECT_THROW((void)call.get(), Cancelled);
    EXPECT_EQ(call.tool(), "echo");
    EXPECT_EQ(server->received("notifications/cancelled")[0]["params"]["requestId"], call.id());
}

TEST_F(SessionTest, ReleasedHandlesLeaveNothingPending) {
    server->hold_calls = true;
    auto s = started();
    for (int i = 0; i < 100; ++i) {
        (void)s->call_async("echo", text_args(std::to_string(i)), 10ms);
    }
    EXPECT_EQ(s->pending_count(), 0u);
    EXPECT_EQ(server->received("notifications/cancelled").size(), 100u);
    EXPECT_EQ(s->state(), SessionState::Ready);
}

TEST_F(SessionTest, MoveAssignmentReleasesTheOverwrittenCall) {
    server->hold_calls = true;
    auto s = started();
    auto call = s->call_async("echo", text_args("first"));
    int64_t first = call.id();
    call = s->call_async("echo", text_args("second"));
    EXPECT_EQ(s->pending_count(), 1u);

    auto cancels = server->received("notifications/cancelled");
    ASSERT_EQ(cancels.size(), 1u);
    EXPECT_EQ(cancels[0]["params"]["requestId"], first);

    ASSERT_TRUE(server->wait_for_held(2));
    server->respond(call.id(), {{"content", {{{"type", "text"}, {"text", "done"}}}}});
    EXPECT_EQ(call.get().text(), "done");
}

TEST_F(SessionTest, CallOutlivingItsSession) {
    server->hold_calls = true;
    auto s = started();
    auto call = s->call_async("echo", text_args("x"));
    s.reset();

    EXPECT_NO_THROW(call.cancel("too late"));
    EXPECT_THROW((void)call.get(), SessionClosed);
    EXPECT_THROW((void)call.get(), SessionClosed);
}

// ---------- Disconnects ----------

TEST_F(SessionTest, DisconnectFailsEveryPendingCall) {
    server->hold_calls = true;
    auto s = started();
    std::vector<PendingCall> calls;
    for (int i = 0; i < 4; ++i) calls.push_back(s->call_async("echo", text_args(std::to_string(i))));
    ASSERT_TRUE(server->wait_for_held(4));

    server->drop();
    for (auto& c : calls) {
        EXPECT_THROW((void)c.get(), ConnectionLost);
    }
    ASSERT_TRUE(eventually([&] { return s->state() == SessionState::Degraded; }));
    EXPECT_EQ(s->pending_count(), 0u);
    EXPECT_THROW((void)s->call("echo", text_args("after")), ConnectionLost);
    EXPECT_THROW(s->start(), ConnectionLost);
}

TEST_F(SessionTest, CloseFailsPendingWithSessionClosed) {
    server->hold_calls = true;
    auto s = started();
    auto call = s->call_async("echo", text_args("x"));
    ASSERT_TRUE(server->wait_for_held(1));
    s->close();
    EXPECT_THROW((void)call.get(), SessionClosed);
    EXPECT_EQ(s->state(), SessionState::Closed);
}

TEST_F(SessionTest, DegradedSessionCanStillClose) {
    auto s = started();
    server->drop();
    ASSERT_TRUE(eventually([&] { return s->state() == SessionState::Degraded; }));
    s->close();
    EXPECT_EQ(s->state(), SessionState::Closed);
}

// ---------- Capability cache ----------

TEST_F(SessionTest, DiscoverUsesCacheUntilListChanged) {
    auto s = started();
    EXPECT_EQ(s->discover().size(), 1u);
    EXPECT_EQ(server->received("tools/list").size(), 1u);

    server->tools.push_back(FakeServer::make_tool("late"));
    server->notify("notifications/tools/list_changed");
    // Any round trip orders us after the notification on the reader thread.
    (void)s->call("echo", text_args("sync"));

    auto tools = s->discover();
    EXPECT_EQ(tools.size(), 2u);
    EXPECT_EQ(server->received("tools/list").size(), 2u);
    EXPECT_EQ(s->discover().size(), 2u);
    EXPECT_EQ(server->received("tools/list").size(), 2u);
}

TEST_F(SessionTest, UnknownToolAfterListChangedTriggersRefresh) {
    auto s = started();
    server->tools.push_back(FakeServer::make_tool("late"));
    server->notify("notifications/tools/list_changed");
    (void)s->call("echo", text_args("sync"));

    EXPECT_NO_THROW((void)s->call("late", nlohmann::json::object()));
    EXPECT_THROW((void)s->call("still_missing", nlohmann::json::object()), UnknownCapability);
}

TEST_F(SessionTest, NotificationsAreObservable) {
    auto s = started();
    auto stream = s->notifications();
    server->notify("notifications/message", {{"level", "info"}, {"data", "indexing"}});
    auto n = stream->next_for(2s);
    ASSERT_TRUE(n.has_value());
    EXPECT_EQ(n->method, "notifications/message");
}

TEST(SessionStates, Names) {
    EXPECT_EQ(to_string(SessionState::Connecting), "connecting");
    EXPECT_EQ(to_string(SessionState::Degraded), "degraded");
}
