#include <gtest/gtest.h>
#include "server/CalendarTools.h"
#include "server/TaskStore.h"
#include "server/TaskTools.h"
#include "server/ToolHost.h"
#include <chrono>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class TaskStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        testDir = fs::temp_directory_path() / fs::path("switchboard_tasks_test_" + std::to_string(now));
        store = std::make_shared<TaskStore>((testDir / "tasks").string());
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }

    static std::string text(const nlohmann::json& result) {
        return result["content"][0]["text"].get<std::string>();
    }

    fs::path testDir;
    std::shared_ptr<TaskStore> store;
};

TEST_F(TaskStoreTest, AddListComplete) {
    EXPECT_TRUE(store->readTasks("alice").empty());

    store->addTask("alice", "write report");
    store->addTask("alice", "buy milk");
    store->completeTask("alice", "buy milk");

    auto tasks = store->readTasks("alice");
    ASSERT_EQ(tasks.size(), 2u);
    EXPECT_EQ(tasks[0].title, "write report");
    EXPECT_FALSE(tasks[0].isDone);
    EXPECT_TRUE(tasks[1].isDone);

    EXPECT_TRUE(fs::exists(store->filePath("alice")));
    EXPECT_TRUE(store->readTasks("bob").empty());
}

TEST_F(TaskStoreTest, DuplicateAndMissingTitles) {
    store->addTask("alice", "write report");
    try {
        store->addTask("alice", "write report");
        FAIL() << "expected duplicate error";
    } catch (const std::invalid_argument& e) {
        EXPECT_STREQ(e.what(), "Task with title 'write report' already exists.");
    }
    EXPECT_THROW(store->completeTask("alice", "nothing"), std::invalid_argument);
    EXPECT_THROW(store->addTask("alice", ""), std::invalid_argument);
    EXPECT_EQ(store->readTasks("alice").size(), 1u);
}

TEST_F(TaskStoreTest, UserIdCannotEscapeTheDirectory) {
    EXPECT_THROW(store->filePath("../etc/passwd"), std::invalid_argument);
    EXPECT_THROW(store->filePath(""), std::invalid_argument);
    EXPECT_THROW(store->addTask("a/b", "x"), std::invalid_argument);
}

TEST_F(TaskStoreTest, CorruptedFileReadsAsEmpty) {
    fs::create_directories(testDir / "tasks");
    {
        std::ofstream out(store->filePath("alice"));
        out << "{ this is not a task list";
    }
    EXPECT_TRUE(store->readTasks("alice").empty());

    store->addTask("alice", "start over");
    EXPECT_EQ(store->readTasks("alice").size(), 1u);
}

TEST_F(TaskStoreTest, TaskToolsSpeakTheWireFormat) {
    ToolHost host;
    registerTaskTools(host, store);
    ASSERT_EQ(host.getToolCount(), 3u);

    EXPECT_EQ(text(host.executeTool("get_tasks", nlohmann::json::object())), "No tasks found");
    EXPECT_EQ(text(host.executeTool("add_new_task", {{"task", "call mom"}})), "Successfully added task");

    auto dup = host.executeTool("add_new_task", {{"task", "call mom"}});
    EXPECT_EQ(dup["error"], "Task with title 'call mom' already exists.");

    EXPECT_EQ(text(host.executeTool("complete_task", {{"task", "call mom"}})), "Successfully updated task");
    auto missing = host.executeTool("complete_task", {{"task", "nope"}});
    EXPECT_EQ(missing["error"], "Task with title 'nope' not found.");

    auto listed = nlohmann::json::parse(text(host.executeTool("get_tasks", nlohmann::json::object())));
    ASSERT_EQ(listed.size(), 1u);
    EXPECT_EQ(listed[0]["title"], "call mom");
    EXPECT_EQ(listed[0]["isDone"], true);

    EXPECT_TRUE(host.executeTool("add_new_task", nlohmann::json::object()).contains("error"));
    EXPECT_TRUE(store->readTasks("user").size() == 1u);
}

TEST_F(TaskStoreTest, TaskSchemasRequireTheTitle) {
    ToolHost host;
    registerTaskTools(host, store);
    auto list = host.listTools();
    EXPECT_EQ(list["tools"][1]["name"], "add_new_task");
    EXPECT_EQ(list["tools"][1]["inputSchema"]["required"][0], "task");
    EXPECT_TRUE(list["tools"][0]["inputSchema"]["properties"].empty());
}

TEST_F(TaskStoreTest, CalendarSampleAndDateFilter) {
    ToolHost host;
    registerCalendarTools(host, "");

    auto all = nlohmann::json::parse(text(host.executeTool("get_events", nlohmann::json::object())));
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0]["title"], "MCP Stream");

    auto sameDay = nlohmann::json::parse(text(host.executeTool("get_events", {{"date", "2025-05-30"}})));
    EXPECT_EQ(sameDay.size(), 2u);
    EXPECT_EQ(text(host.executeTool("get_events", {{"date", "2025-06-01"}})), "No events found");
}

TEST_F(TaskStoreTest, CalendarFromFile) {
    fs::create_directories(testDir);
    auto path = (testDir / "events.json").string();
    {
        std::ofstream out(path);
        out << R"([{"title": "Dentist", "start": "2025-06-02T09:00:00", "end": "2025-06-02T09:30:00"}])";
    }
    ToolHost host;
    registerCalendarTools(host, path);
    auto events = nlohmann::json::parse(text(host.executeTool("get_events", nlohmann::json::object())));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0]["title"], "Dentist");

    {
        std::ofstream out(path, std::ios::trunc);
        out << R"({"title": "not a list"})";
    }
    auto broken = host.executeTool("get_events", nlohmann::json::object());
    ASSERT_TRUE(broken.contains("error"));
    EXPECT_NE(broken["error"].get<std::string>().find("JSON array"), std::string::npos);
}
