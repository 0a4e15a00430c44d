#pragma once
#include <memory>
#include <string>
#include "server/ITool.h"
#include "server/MemoryStore.h"

class ToolHost;

/**
 * @brief memory 工具集: save_memory / search_memories / get_all_memories
 *
 * 检索和列出的结果都是记忆内容的 JSON 字符串数组。
 */
class SaveMemoryTool : public ITool {
public:
    SaveMemoryTool(std::shared_ptr<IMemoryStore> store, std::string userId);

    std::string getName() const override { return "save_memory"; }
    std::string getDescription() const override;
    nlohmann::ordered_json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args, const ToolCallContext& ctx) override;

private:
    std::shared_ptr<IMemoryStore> store;
    std::string userId;
};

class SearchMemoriesTool : public ITool {
public:
    SearchMemoriesTool(std::shared_ptr<IMemoryStore> store, std::string userId, size_t limit = 10);

    std::string getName() const override { return "search_memories"; }
    std::string getDescription() const override;
    nlohmann::ordered_json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args, const ToolCallContext& ctx) override;

private:
    std::shared_ptr<IMemoryStore> store;
    std::string userId;
    size_t limit;
};

class GetAllMemoriesTool : public ITool {
public:
    GetAllMemoriesTool(std::shared_ptr<IMemoryStore> store, std::string userId);

    std::string getName() const override { return "get_all_memories"; }
    std::string getDescription() const override;
    nlohmann::ordered_json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args, const ToolCallContext& ctx) override;

private:
    std::shared_ptr<IMemoryStore> store;
    std::string userId;
};

void registerMemoryTools(ToolHost& host, std::shared_ptr<IMemoryStore> store, const std::string& userId = "user");
