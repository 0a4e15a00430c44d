#pragma once
#include <memory>
#include <string>
#include "server/ITool.h"
#include "server/TaskStore.h"

class ToolHost;

/**
 * @brief tasks 工具集: get_tasks / add_new_task / complete_task
 *
 * 所有调用作用于同一个用户 (默认 "user")。
 */
class GetTasksTool : public ITool {
public:
    GetTasksTool(std::shared_ptr<TaskStore> store, std::string userId);

    std::string getName() const override { return "get_tasks"; }
    std::string getDescription() const override;
    nlohmann::ordered_json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args, const ToolCallContext& ctx) override;

private:
    std::shared_ptr<TaskStore> store;
    std::string userId;
};

class AddTaskTool : public ITool {
public:
    AddTaskTool(std::shared_ptr<TaskStore> store, std::string userId);

    std::string getName() const override { return "add_new_task"; }
    std::string getDescription() const override;
    nlohmann::ordered_json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args, const ToolCallContext& ctx) override;

private:
    std::shared_ptr<TaskStore> store;
    std::string userId;
};

class CompleteTaskTool : public ITool {
public:
    CompleteTaskTool(std::shared_ptr<TaskStore> store, std::string userId);

    std::string getName() const override { return "complete_task"; }
    std::string getDescription() const override;
    nlohmann::ordered_json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args, const ToolCallContext& ctx) override;

private:
    std::shared_ptr<TaskStore> store;
    std::string userId;
};

void registerTaskTools(ToolHost& host, std::shared_ptr<TaskStore> store, const std::string& userId = "user");
