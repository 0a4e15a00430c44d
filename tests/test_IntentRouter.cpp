#include <gtest/gtest.h>
#include "TestFakes.h"
#include "router/IntentRouter.h"

using namespace fakes;

class IntentRouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto tasks = std::make_shared<ServerEndpoint>("tasks", "http", "localhost", 8010, "k");
        auto crawler = std::make_shared<ServerEndpoint>("crawler", "http", "localhost", 8020, "k");
        registry.replace(tasks, {
            ToolDescriptor::fromCatalogEntry(toolEntry("get_tasks"), tasks),
            ToolDescriptor::fromCatalogEntry(toolEntry("add_new_task", {{"task", "string"}}, {"task"}), tasks)
        });
        registry.replace(crawler, {
            ToolDescriptor::fromCatalogEntry(toolEntry("crawl_site", {{"seed_url", "string"}}, {"seed_url"}), crawler)
        });
        endpoints = {tasks, crawler};
    }

    ToolRegistry registry;
    std::vector<std::shared_ptr<ServerEndpoint>> endpoints;
};

TEST_F(IntentRouterTest, SingleCallPlan) {
    ScriptedClassifier classifier({R"({"calls": [{"tool": "add_new_task", "arguments": {"task": "write report"}}]})"});
    IntentRouter router(classifier);

    RouteResult result = router.route("remind me to write the report", registry);
    ASSERT_TRUE(result.ok) << result.message;
    ASSERT_EQ(result.calls.size(), 1u);
    EXPECT_EQ(result.calls[0].toolName, "add_new_task");
    EXPECT_EQ(result.calls[0].arguments["task"], "write report");
    EXPECT_EQ(result.classifierCalls, 1);

    // The classifier sees the catalog and the user text
    const auto& messages = classifier.prompts.at(0);
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0]["role"], "system");
    std::string system = messages[0]["content"].get<std::string>();
    EXPECT_NE(system.find("crawl_site"), std::string::npos);
    EXPECT_NE(system.find("seed_url"), std::string::npos);
    EXPECT_EQ(messages[1]["content"], "remind me to write the report");
}

TEST_F(IntentRouterTest, MultiStepPlanKeepsOrder) {
    ScriptedClassifier classifier({
        "```json\n{\"calls\": [{\"tool\": \"crawl_site\", \"arguments\": {\"seed_url\": \"https://example.com\"}},"
        " {\"tool\": \"add_new_task\", \"arguments\": {\"task\": \"read example.com\"}}]}\n```"
    });
    IntentRouter router(classifier);

    RouteResult result = router.route("crawl example.com and add a task to read it", registry);
    ASSERT_TRUE(result.ok);
    ASSERT_EQ(result.calls.size(), 2u);
    EXPECT_EQ(result.calls[0].toolName, "crawl_site");
    EXPECT_EQ(result.calls[1].toolName, "add_new_task");
}

TEST_F(IntentRouterTest, NoToolMeansEmptyPlan) {
    for (const std::string reply : {"none", "other", "\"OTHER\"", "{\"calls\": []}", "", "I am not sure what you mean"}) {
        ScriptedClassifier classifier({reply});
        IntentRouter router(classifier);
        RouteResult result = router.route("hello there", registry);
        EXPECT_TRUE(result.ok) << reply;
        EXPECT_TRUE(result.calls.empty()) << reply;
    }
}

TEST_F(IntentRouterTest, HallucinatedToolIsCorrectedOnce) {
    ScriptedClassifier classifier({
        R"({"tool": "send_email", "arguments": {"to": "bob"}})",
        R"({"tool": "add_new_task", "arguments": {"task": "email bob"}})"
    });
    IntentRouter router(classifier);

    RouteResult result = router.route("email bob", registry);
    ASSERT_TRUE(result.ok) << result.message;
    EXPECT_EQ(result.classifierCalls, 2);
    ASSERT_EQ(result.calls.size(), 1u);
    EXPECT_EQ(result.calls[0].toolName, "add_new_task");

    const auto& retry = classifier.prompts.at(1);
    ASSERT_EQ(retry.size(), 4u);
    EXPECT_EQ(retry[2]["role"], "assistant");
    std::string correction = retry[3]["content"].get<std::string>();
    EXPECT_NE(correction.find("send_email"), std::string::npos);
    EXPECT_NE(correction.find("get_tasks"), std::string::npos);
}

TEST_F(IntentRouterTest, HallucinatedTwiceIsRoutingFailure) {
    ScriptedClassifier classifier({R"({"tool": "send_email"})", R"({"tool": "send_sms"})"});
    IntentRouter router(classifier);

    RouteResult result = router.route("text bob", registry);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.errorKind, ErrorKind::RoutingFailure);
    EXPECT_EQ(result.classifierCalls, 2);
    EXPECT_TRUE(result.calls.empty());
    EXPECT_EQ(classifier.prompts.size(), 2u);
    EXPECT_EQ(result.cause, ErrorKind::HallucinatedTool);
    EXPECT_EQ(result.toJson()["error"]["kind"], "routing_failure");
    EXPECT_EQ(result.toJson()["error"]["cause"], "hallucinated_tool");
}

TEST_F(IntentRouterTest, ClassifierExceptionIsRoutingFailure) {
    class ThrowingClassifier : public IIntentClassifier {
    public:
        std::string classify(const nlohmann::json&) override { throw std::runtime_error("HTTP 503"); }
    } classifier;
    IntentRouter router(classifier);

    RouteResult result = router.route("anything", registry);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.errorKind, ErrorKind::RoutingFailure);
    EXPECT_NE(result.message.find("HTTP 503"), std::string::npos);
}

TEST(IntentRouterParseTest, AcceptedReplyShapes) {
    auto bare = IntentRouter::parsePlan("get_tasks");
    ASSERT_EQ(bare.size(), 1u);
    EXPECT_EQ(bare[0].toolName, "get_tasks");
    EXPECT_TRUE(bare[0].arguments.empty());

    auto action = IntentRouter::parsePlan(R"(Sure! {"action": "complete_task", "args": "{\"task\": \"x\"}"})");
    ASSERT_EQ(action.size(), 1u);
    EXPECT_EQ(action[0].toolName, "complete_task");
    EXPECT_EQ(action[0].arguments["task"], "x");

    auto named = IntentRouter::parsePlan(R"({"name": "get_events", "parameters": {"date": "2025-05-30"}})");
    ASSERT_EQ(named.size(), 1u);
    EXPECT_EQ(named[0].arguments["date"], "2025-05-30");

    auto noneInside = IntentRouter::parsePlan(R"({"calls": [{"tool": "none"}, {"tool": "get_tasks"}]})");
    ASSERT_EQ(noneInside.size(), 1u);
    EXPECT_EQ(noneInside[0].toolName, "get_tasks");

    EXPECT_TRUE(IntentRouter::parsePlan("{not json}").empty());
    EXPECT_TRUE(IntentRouter::parsePlan(R"({"action": "other"})").empty());
}
