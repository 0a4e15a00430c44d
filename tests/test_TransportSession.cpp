#include <gtest/gtest.h>
#include "TestFakes.h"
#include "transport/TransportSession.h"
#include <future>

using namespace fakes;
using namespace std::chrono_literals;

class TransportSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        server = std::make_shared<FakeServer>();
        options.connectTimeoutMs = 1000;
        options.callTimeoutMs = 1000;
        options.maxReconnectAttempts = 3;
        options.backoffInitialMs = 1000;
        options.backoffMaxMs = 4000;
    }

    std::unique_ptr<TransportSession> makeSession(const std::string& apiKey = "secret") {
        endpoint = std::make_shared<ServerEndpoint>("tasks", "http", "localhost", 8010, apiKey);
        return std::make_unique<TransportSession>(endpoint, FakeChannel::factory(server), options,
            [this](std::chrono::milliseconds d) {
                std::lock_guard<std::mutex> lock(delaysMutex);
                delays.push_back(d.count());
            });
    }

    DispatchRequest request(const std::string& tool, uint64_t id, ArgumentMap args = ArgumentMap::object(),
                            std::chrono::milliseconds timeout = 1000ms) {
        DispatchRequest req;
        req.toolName = tool;
        req.arguments = std::move(args);
        req.correlationId = id;
        req.deadline = DispatchClock::now() + timeout;
        return req;
    }

    std::vector<long long> recordedDelays() {
        std::lock_guard<std::mutex> lock(delaysMutex);
        return delays;
    }

    std::shared_ptr<FakeServer> server;
    std::shared_ptr<ServerEndpoint> endpoint;
    TransportOptions options;
    std::mutex delaysMutex;
    std::vector<long long> delays;
};

TEST_F(TransportSessionTest, HandshakeThenConnected) {
    auto session = makeSession();
    session->connect();

    EXPECT_EQ(endpoint->state.load(), ConnectionState::Connected);
    std::lock_guard<std::mutex> lock(server->mtx);
    ASSERT_EQ(server->received.size(), 2u);
    EXPECT_EQ(server->received[0]["method"], "initialize");
    EXPECT_EQ(server->received[0]["params"]["clientInfo"]["name"], "switchboard");
    EXPECT_EQ(server->received[1]["method"], "notifications/initialized");
    EXPECT_FALSE(server->received[1].contains("id"));
}

TEST_F(TransportSessionTest, ListToolsFollowsPaginationInServerOrder) {
    for (const char* name : {"get_tasks", "add_new_task", "complete_task", "get_events", "crawl_site"}) {
        server->tools.push_back(toolEntry(name));
    }
    server->tools[1] = toolEntry("add_new_task", {{"task", "string"}, {"due", "string"}, {"priority", "integer"}}, {"task"});
    server->pageSize = 2;

    auto session = makeSession();
    session->connect();
    auto catalog = session->listTools();

    ASSERT_EQ(catalog["tools"].size(), 5u);
    EXPECT_EQ(catalog["tools"][0]["name"], "get_tasks");
    EXPECT_EQ(catalog["tools"][4]["name"], "crawl_site");
    EXPECT_EQ(server->countMethod("tools/list"), 3u);

    std::vector<std::string> order;
    for (const auto& [key, value] : catalog["tools"][1]["inputSchema"]["properties"].items()) {
        order.push_back(key);
    }
    EXPECT_EQ(order, (std::vector<std::string>{"task", "due", "priority"}));
}

TEST_F(TransportSessionTest, CallEchoesCorrelationId) {
    auto session = makeSession();
    session->connect();

    ArgumentMap args = {{"task", "write report"}};
    DispatchResult result = session->call(request("add_new_task", 42, args));

    ASSERT_TRUE(result.ok) << result.message;
    EXPECT_EQ(result.correlationId, 42u);
    auto text = result.payload["content"][0]["text"].get<std::string>();
    EXPECT_EQ(nlohmann::json::parse(text), nlohmann::json({{"task", "write report"}}));

    std::lock_guard<std::mutex> lock(server->mtx);
    const auto& sent = server->received.back();
    EXPECT_EQ(sent["method"], "tools/call");
    EXPECT_EQ(sent["id"], 42);
    EXPECT_EQ(sent["params"]["name"], "add_new_task");
}

TEST_F(TransportSessionTest, MissingKeyFailsWithoutTouchingTheNetwork) {
    auto session = makeSession("");
    try {
        session->connect();
        FAIL() << "expected AuthError";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::AuthError);
    }
    EXPECT_EQ(server->opens.load(), 0);
    EXPECT_EQ(endpoint->state.load(), ConnectionState::Failed);

    DispatchResult result = session->call(request("get_tasks", 1));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.errorKind, ErrorKind::AuthError);
    EXPECT_EQ(result.correlationId, 1u);
}

TEST_F(TransportSessionTest, RejectedKeyIsNotRetried) {
    server->rejectAuth = true;
    auto session = makeSession();
    try {
        session->connect();
        FAIL() << "expected AuthError";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::AuthError);
    }
    EXPECT_EQ(server->opens.load(), 1);
    EXPECT_EQ(endpoint->state.load(), ConnectionState::Failed);
    EXPECT_TRUE(recordedDelays().empty());

    DispatchResult result = session->call(request("get_tasks", 2));
    EXPECT_EQ(result.errorKind, ErrorKind::EndpointUnavailable);
}

TEST_F(TransportSessionTest, BackoffDoublesUpToTheCap) {
    EXPECT_EQ(TransportSession::backoffDelay(1, options).count(), 1000);
    EXPECT_EQ(TransportSession::backoffDelay(2, options).count(), 2000);
    EXPECT_EQ(TransportSession::backoffDelay(3, options).count(), 4000);
    EXPECT_EQ(TransportSession::backoffDelay(4, options).count(), 4000);
    EXPECT_EQ(TransportSession::backoffDelay(20, options).count(), 4000);
}

TEST_F(TransportSessionTest, ConnectRetriesWithBackoff) {
    server->failOpens = 2;
    auto session = makeSession();
    session->connect();

    EXPECT_EQ(endpoint->state.load(), ConnectionState::Connected);
    EXPECT_EQ(server->opens.load(), 3);
    EXPECT_EQ(recordedDelays(), (std::vector<long long>{1000, 2000}));
}

TEST_F(TransportSessionTest, UnreachableAfterAllAttemptsIsFailed) {
    server->failOpens = 100;
    auto session = makeSession();
    try {
        session->connect();
        FAIL() << "expected ConnectionError";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ConnectionError);
    }
    EXPECT_EQ(server->opens.load(), 3);
    EXPECT_EQ(endpoint->state.load(), ConnectionState::Failed);
    EXPECT_EQ(recordedDelays(), (std::vector<long long>{1000, 2000}));
}

TEST_F(TransportSessionTest, ReconnectsAfterDrop) {
    auto session = makeSession();
    session->connect();

    server->dropConnection("stream ended");
    ASSERT_TRUE(waitFor([&]() { return server->opens == 2 && endpoint->state == ConnectionState::Connected; }));
    EXPECT_EQ(server->countMethod("initialize"), 2u);
    EXPECT_GE(server->closes.load(), 1);

    DispatchResult result = session->call(request("get_tasks", 5));
    EXPECT_TRUE(result.ok) << result.message;
}

TEST_F(TransportSessionTest, DropWithServerGoneMarksFailed) {
    auto session = makeSession();
    session->connect();
    auto sub = session->subscribe();

    server->failOpens = 100;
    server->dropConnection("connection reset");
    ASSERT_TRUE(waitFor([&]() { return endpoint->state == ConnectionState::Failed; }));
    EXPECT_EQ(server->opens.load(), 1 + options.maxReconnectAttempts);

    DispatchResult result = session->call(request("get_tasks", 6));
    EXPECT_EQ(result.errorKind, ErrorKind::EndpointUnavailable);
    EXPECT_EQ(result.correlationId, 6u);

    ASSERT_TRUE(waitFor([&]() { return !sub->isActive(); }));
    EXPECT_FALSE(sub->next(100ms).has_value());
}

TEST_F(TransportSessionTest, NoReplyBeforeDeadlineIsTimeout) {
    server->answerCalls = false;
    auto session = makeSession();
    session->connect();

    DispatchResult result = session->call(request("crawl_site", 9, ArgumentMap::object(), 150ms));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.errorKind, ErrorKind::Timeout);
    EXPECT_EQ(result.correlationId, 9u);

    // A late reply finds no waiter and is dropped
    server->deliver(nlohmann::json({{"jsonrpc", "2.0"}, {"id", 9}, {"result", nlohmann::json::object()}}));

    server->answerCalls = true;
    EXPECT_TRUE(session->call(request("get_tasks", 9)).ok);
}

TEST_F(TransportSessionTest, CancelEndsTheWait) {
    server->answerCalls = false;
    auto session = makeSession();
    session->connect();

    auto token = CancellationToken::create();
    auto pendingCall = std::async(std::launch::async, [&]() {
        return session->call(request("crawl_site", 11, ArgumentMap::object(), 5000ms), token);
    });
    ASSERT_TRUE(waitFor([&]() { return server->countMethod("tools/call") == 1; }));
    token->cancel();

    DispatchResult result = pendingCall.get();
    EXPECT_EQ(result.errorKind, ErrorKind::Cancelled);
    EXPECT_EQ(result.correlationId, 11u);
}

TEST_F(TransportSessionTest, SameIdInFlightIsRejected) {
    server->answerCalls = false;
    auto session = makeSession();
    session->connect();

    auto token = CancellationToken::create();
    auto first = std::async(std::launch::async, [&]() {
        return session->call(request("crawl_site", 13, ArgumentMap::object(), 5000ms), token);
    });
    ASSERT_TRUE(waitFor([&]() { return server->countMethod("tools/call") == 1; }));

    DispatchResult second = session->call(request("crawl_site", 13));
    EXPECT_EQ(second.errorKind, ErrorKind::DuplicateRequest);
    EXPECT_EQ(server->countMethod("tools/call"), 1u);

    token->cancel();
    EXPECT_EQ(first.get().errorKind, ErrorKind::Cancelled);
}

TEST_F(TransportSessionTest, ToolErrorIsRemoteError) {
    server->onCall = [](const nlohmann::json& msg) -> std::optional<nlohmann::json> {
        nlohmann::json reply = {{"jsonrpc", "2.0"}, {"id", msg["id"]}};
        reply["result"]["content"] = nlohmann::json::array({{{"type", "text"}, {"text", "Task with title 'x' not found."}}});
        reply["result"]["isError"] = true;
        return reply;
    };
    auto session = makeSession();
    session->connect();

    DispatchResult result = session->call(request("complete_task", 21, {{"task", "x"}}));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.errorKind, ErrorKind::RemoteError);
    EXPECT_EQ(result.message, "Task with title 'x' not found.");
}

TEST_F(TransportSessionTest, JsonRpcErrorIsRemoteError) {
    server->onCall = [](const nlohmann::json& msg) -> std::optional<nlohmann::json> {
        return nlohmann::json({{"jsonrpc", "2.0"}, {"id", msg["id"]},
                               {"error", {{"code", -32602}, {"message", "Unknown tool: nope"}}}});
    };
    auto session = makeSession();
    session->connect();

    DispatchResult result = session->call(request("nope", 22));
    EXPECT_EQ(result.errorKind, ErrorKind::RemoteError);
    EXPECT_EQ(result.message, "Unknown tool: nope");
}

TEST_F(TransportSessionTest, NotificationsReachSubscribersUntilClose) {
    auto session = makeSession();
    session->connect();
    auto sub = session->subscribe();

    nlohmann::json note = {{"jsonrpc", "2.0"}, {"method", "notifications/crawl_record"},
                           {"params", {{"seed_url", "http://example.com/"}}}};
    server->deliver(note);

    auto event = sub->next(1000ms);
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->type, "notifications/crawl_record");
    EXPECT_EQ(event->payload["seed_url"], "http://example.com/");

    session->close();
    EXPECT_FALSE(sub->next().has_value());
    EXPECT_EQ(endpoint->state.load(), ConnectionState::Disconnected);
}
