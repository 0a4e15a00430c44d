#include <gtest/gtest.h>
#include "TestFakes.h"
#include "dispatch/ArgumentValidator.h"
#include "dispatch/Dispatcher.h"
#include <future>

using namespace fakes;
using namespace std::chrono_literals;

class DispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        nlohmann::ordered_json taskTools = nlohmann::ordered_json::array();
        taskTools.push_back(toolEntry("get_tasks"));
        taskTools.push_back(toolEntry("add_new_task", {{"task", "string"}, {"priority", "integer"}}, {"task"}));
        nlohmann::ordered_json calendarTools = nlohmann::ordered_json::array();
        calendarTools.push_back(toolEntry("get_events", {{"date", "string"}}));

        auto t = std::make_unique<FakeSession>("tasks", taskTools);
        auto c = std::make_unique<FakeSession>("calendar", calendarTools);
        tasks = t.get();
        calendar = c.get();
        sessions.addSession(std::move(t));
        sessions.addSession(std::move(c));
        registry.refresh(*tasks);
        registry.refresh(*calendar);
    }

    SessionManager sessions;
    ToolRegistry registry;
    OrchestrationContext ctx{sessions, registry, std::chrono::milliseconds(2000)};
    Dispatcher dispatcher{ctx};
    FakeSession* tasks = nullptr;
    FakeSession* calendar = nullptr;
};

TEST_F(DispatcherTest, RoutesToOwningEndpoint) {
    auto req = dispatcher.makeRequest("add_new_task", {{"task", "buy milk"}});
    DispatchResult result = dispatcher.dispatch(req);

    ASSERT_TRUE(result.ok) << result.message;
    EXPECT_EQ(result.correlationId, req.correlationId);
    EXPECT_EQ(result.payload["server"], "tasks");
    EXPECT_EQ(result.payload["arguments"]["task"], "buy milk");
    EXPECT_EQ(tasks->calls.load(), 1);
    EXPECT_EQ(calendar->calls.load(), 0);
}

TEST_F(DispatcherTest, UnknownToolNeverReachesTheNetwork) {
    DispatchResult result = dispatcher.dispatch(dispatcher.makeRequest("send_email"));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.errorKind, ErrorKind::UnknownTool);
    EXPECT_EQ(tasks->calls + calendar->calls, 0);
}

TEST_F(DispatcherTest, MissingRequiredArgument) {
    DispatchResult result = dispatcher.dispatch(dispatcher.makeRequest("add_new_task", {{"priority", 1}}));
    EXPECT_EQ(result.errorKind, ErrorKind::InvalidArguments);
    EXPECT_NE(result.message.find("task"), std::string::npos);
    EXPECT_EQ(tasks->calls.load(), 0);
}

TEST_F(DispatcherTest, WrongArgumentType) {
    DispatchResult result = dispatcher.dispatch(dispatcher.makeRequest("add_new_task", {{"task", 5}}));
    EXPECT_EQ(result.errorKind, ErrorKind::InvalidArguments);

    result = dispatcher.dispatch(dispatcher.makeRequest("add_new_task", {{"task", "x"}, {"priority", 2.5}}));
    EXPECT_EQ(result.errorKind, ErrorKind::InvalidArguments);

    result = dispatcher.dispatch(dispatcher.makeRequest("add_new_task", {{"task", "x"}, {"priority", 2.0}}));
    EXPECT_TRUE(result.ok) << result.message;
}

TEST_F(DispatcherTest, ExtraArgumentsAreForwarded) {
    DispatchResult result = dispatcher.dispatch(
        dispatcher.makeRequest("add_new_task", {{"task", "x"}, {"notes", "from chat"}}));
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(tasks->last().arguments["notes"], "from chat");
}

TEST_F(DispatcherTest, SessionFailuresPassThrough) {
    tasks->handler = [](const DispatchRequest& req, const std::shared_ptr<CancellationToken>&) {
        if (req.toolName == "get_tasks") return DispatchResult::failure(req.correlationId, ErrorKind::Timeout, "slow");
        return DispatchResult::failure(req.correlationId, ErrorKind::RemoteError, "Task with title 'x' already exists.");
    };

    DispatchResult timeout = dispatcher.dispatch(dispatcher.makeRequest("get_tasks"));
    EXPECT_EQ(timeout.errorKind, ErrorKind::Timeout);

    DispatchResult remote = dispatcher.dispatch(dispatcher.makeRequest("add_new_task", {{"task", "x"}}));
    EXPECT_EQ(remote.errorKind, ErrorKind::RemoteError);
    EXPECT_EQ(remote.message, "Task with title 'x' already exists.");
    EXPECT_EQ(remote.toJson()["error"]["kind"], "remote_error");
}

TEST_F(DispatcherTest, WrongIdFromSessionIsCorrected) {
    tasks->handler = [](const DispatchRequest&, const std::shared_ptr<CancellationToken>&) {
        return DispatchResult::success(999, nlohmann::json::object());
    };
    auto req = dispatcher.makeRequest("get_tasks");
    EXPECT_EQ(dispatcher.dispatch(req).correlationId, req.correlationId);
}

TEST_F(DispatcherTest, FailedEndpointIsIsolated) {
    calendar->ep->state = ConnectionState::Failed;

    DispatchResult events = dispatcher.dispatch(dispatcher.makeRequest("get_events"));
    EXPECT_EQ(events.errorKind, ErrorKind::EndpointUnavailable);
    EXPECT_EQ(calendar->calls.load(), 0);

    DispatchResult list = dispatcher.dispatch(dispatcher.makeRequest("get_tasks"));
    EXPECT_TRUE(list.ok);
}

TEST_F(DispatcherTest, RefreshKeepsToolsOfFailedEndpoint) {
    calendar->ep->state = ConnectionState::Failed;
    EXPECT_EQ(registry.refreshAll(sessions), 1);
    ASSERT_TRUE(registry.resolve("get_events").has_value());

    DispatchResult events = dispatcher.dispatch(dispatcher.makeRequest("get_events"));
    EXPECT_EQ(events.errorKind, ErrorKind::EndpointUnavailable);
    EXPECT_EQ(calendar->calls.load(), 0);

    EXPECT_TRUE(dispatcher.dispatch(dispatcher.makeRequest("add_new_task", {{"task", "call mum"}})).ok);
}

TEST_F(DispatcherTest, ReusedIdIsRejected) {
    auto req = dispatcher.makeRequest("get_tasks");
    EXPECT_TRUE(dispatcher.dispatch(req).ok);

    DispatchResult again = dispatcher.dispatch(req);
    EXPECT_EQ(again.errorKind, ErrorKind::DuplicateRequest);
    EXPECT_EQ(again.correlationId, req.correlationId);
    EXPECT_EQ(tasks->calls.load(), 1);
}

TEST_F(DispatcherTest, GeneratedIdsSkipCallerChosenOnes) {
    DispatchRequest manual;
    manual.toolName = "get_tasks";
    manual.correlationId = 1;
    manual.deadline = DispatchClock::now() + 1s;
    EXPECT_TRUE(dispatcher.dispatch(manual).ok);

    EXPECT_NE(dispatcher.nextCorrelationId(), 1u);
}

TEST_F(DispatcherTest, SpentIdsAreNotRetained) {
    std::vector<PlannedCall> plan(100, PlannedCall{"get_tasks", ArgumentMap::object()});
    auto results = dispatcher.dispatchPlan(plan);
    ASSERT_EQ(results.size(), 100u);
    EXPECT_EQ(dispatcher.trackedIdCount(), 0u);

    DispatchRequest replay;
    replay.toolName = "get_tasks";
    replay.correlationId = results[42].correlationId;
    replay.deadline = DispatchClock::now() + 1s;
    EXPECT_EQ(dispatcher.dispatch(replay).errorKind, ErrorKind::DuplicateRequest);

    // A caller-chosen id ahead of the counter is held only until the counter passes it
    replay.correlationId = dispatcher.nextCorrelationId() + 1;
    EXPECT_TRUE(dispatcher.dispatch(replay).ok);
    EXPECT_EQ(dispatcher.dispatch(replay).errorKind, ErrorKind::DuplicateRequest);
    EXPECT_EQ(dispatcher.trackedIdCount(), 2u);
    EXPECT_EQ(dispatcher.nextCorrelationId(), replay.correlationId + 1);
    EXPECT_EQ(dispatcher.trackedIdCount(), 2u);
    EXPECT_EQ(dispatcher.dispatch(replay).errorKind, ErrorKind::DuplicateRequest);
}

TEST_F(DispatcherTest, CancelWakesTheCaller) {
    tasks->handler = [](const DispatchRequest& req, const std::shared_ptr<CancellationToken>& cancel) {
        while (!cancel->isCancelled()) std::this_thread::sleep_for(5ms);
        return DispatchResult::failure(req.correlationId, ErrorKind::Cancelled, "call cancelled by caller");
    };

    auto req = dispatcher.makeRequest("get_tasks");
    auto pending = std::async(std::launch::async, [&]() { return dispatcher.dispatch(req); });
    ASSERT_TRUE(waitFor([&]() { return dispatcher.inFlightCount() == 1; }));

    EXPECT_TRUE(dispatcher.cancel(req.correlationId));
    DispatchResult result = pending.get();
    EXPECT_EQ(result.errorKind, ErrorKind::Cancelled);
    EXPECT_EQ(dispatcher.inFlightCount(), 0u);
    EXPECT_FALSE(dispatcher.cancel(req.correlationId));
}

TEST_F(DispatcherTest, PlanRunsEveryStep) {
    std::vector<PlannedCall> plan = {
        {"get_events", {{"date", "2025-05-30"}}},
        {"no_such_tool", ArgumentMap::object()},
        {"get_tasks", ArgumentMap::object()}
    };
    auto results = dispatcher.dispatchPlan(plan);

    ASSERT_EQ(results.size(), 3u);
    EXPECT_TRUE(results[0].ok);
    EXPECT_EQ(results[0].payload["server"], "calendar");
    EXPECT_EQ(results[1].errorKind, ErrorKind::UnknownTool);
    EXPECT_TRUE(results[2].ok);
    EXPECT_LT(results[0].correlationId, results[2].correlationId);
}

TEST(ArgumentValidatorTest, TypeNames) {
    EXPECT_TRUE(ArgumentValidator::matchesType(3, "integer"));
    EXPECT_TRUE(ArgumentValidator::matchesType(3.0, "integer"));
    EXPECT_FALSE(ArgumentValidator::matchesType("3", "integer"));
    EXPECT_TRUE(ArgumentValidator::matchesType(0.5, "number"));
    EXPECT_TRUE(ArgumentValidator::matchesType(true, "boolean"));
    EXPECT_TRUE(ArgumentValidator::matchesType(nlohmann::ordered_json::array(), "array"));
    EXPECT_FALSE(ArgumentValidator::matchesType(nlohmann::ordered_json::array(), "object"));
    EXPECT_TRUE(ArgumentValidator::matchesType(nullptr, "null"));
    EXPECT_TRUE(ArgumentValidator::matchesType("anything", ""));
    EXPECT_TRUE(ArgumentValidator::matchesType("anything", "x-custom"));
}

TEST(ArgumentValidatorTest, ArgumentsMustBeAnObject) {
    ToolDescriptor tool;
    tool.name = "get_tasks";
    EXPECT_TRUE(ArgumentValidator::validate(tool, nlohmann::ordered_json::array({1, 2})).has_value());
    EXPECT_FALSE(ArgumentValidator::validate(tool, nlohmann::ordered_json::object()).has_value());
}
