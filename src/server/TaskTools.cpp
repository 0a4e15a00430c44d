#include "server/TaskTools.h"
#include "server/ToolHost.h"

namespace {
    nlohmann::ordered_json taskSchema() {
        nlohmann::ordered_json schema;
        schema["type"] = "object";
        schema["properties"]["task"] = {{"type", "string"}, {"description", "Title of the task"}};
        schema["required"] = nlohmann::ordered_json::array({"task"});
        return schema;
    }
}

GetTasksTool::GetTasksTool(std::shared_ptr<TaskStore> store, std::string userId)
    : store(std::move(store)), userId(std::move(userId)) {}

std::string GetTasksTool::getDescription() const {
    return "List all tasks of the user with their completion state.";
}

nlohmann::ordered_json GetTasksTool::getSchema() const {
    nlohmann::ordered_json schema;
    schema["type"] = "object";
    schema["properties"] = nlohmann::ordered_json::object();
    return schema;
}

nlohmann::json GetTasksTool::execute(const nlohmann::json&, const ToolCallContext&) {
    auto tasks = store->readTasks(userId);
    if (tasks.empty()) return textResult("No tasks found");
    return textResult(TaskStore::toJson(tasks).dump(2));
}

AddTaskTool::AddTaskTool(std::shared_ptr<TaskStore> store, std::string userId)
    : store(std::move(store)), userId(std::move(userId)) {}

std::string AddTaskTool::getDescription() const {
    return "Add a new task for the user. Fails when a task with the same title exists.";
}

nlohmann::ordered_json AddTaskTool::getSchema() const {
    return taskSchema();
}

nlohmann::json AddTaskTool::execute(const nlohmann::json& args, const ToolCallContext&) {
    if (!args.contains("task") || !args["task"].is_string()) {
        return errorResult("Missing required parameter: task");
    }
    try {
        store->addTask(userId, args["task"].get<std::string>());
    } catch (const std::invalid_argument& e) {
        return errorResult(e.what());
    }
    return textResult("Successfully added task");
}

CompleteTaskTool::CompleteTaskTool(std::shared_ptr<TaskStore> store, std::string userId)
    : store(std::move(store)), userId(std::move(userId)) {}

std::string CompleteTaskTool::getDescription() const {
    return "Mark an existing task of the user as done.";
}

nlohmann::ordered_json CompleteTaskTool::getSchema() const {
    return taskSchema();
}

nlohmann::json CompleteTaskTool::execute(const nlohmann::json& args, const ToolCallContext&) {
    if (!args.contains("task") || !args["task"].is_string()) {
        return errorResult("Missing required parameter: task");
    }
    try {
        store->completeTask(userId, args["task"].get<std::string>());
    } catch (const std::invalid_argument& e) {
        return errorResult(e.what());
    }
    return textResult("Successfully updated task");
}

void registerTaskTools(ToolHost& host, std::shared_ptr<TaskStore> store, const std::string& userId) {
    host.registerTool(std::make_unique<GetTasksTool>(store, userId));
    host.registerTool(std::make_unique<AddTaskTool>(store, userId));
    host.registerTool(std::make_unique<CompleteTaskTool>(store, userId));
}
