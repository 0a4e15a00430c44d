#pragma once
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "server/ITool.h"

/**
 * @brief 服务器端工具注册中心
 *
 * 统一管理本服务器暴露的工具: 注册、查找、列目录和执行。
 * 目录按注册顺序输出。
 */
class ToolHost {
public:
    ToolHost() = default;

    ToolHost(const ToolHost&) = delete;
    ToolHost& operator=(const ToolHost&) = delete;

    /**
     * @brief 注册一个工具, 同名工具会被替换
     * @param tool 工具实例 (unique_ptr 转移所有权)
     */
    void registerTool(std::unique_ptr<ITool> tool);

    /**
     * @brief 获取工具实例
     * @return 工具指针 (如果不存在返回 nullptr)
     */
    ITool* getTool(const std::string& name) const;

    /**
     * @brief "tools/list" 的结果
     *
     * 格式:
     * {
     *   "tools": [
     *     {"name": "...", "description": "...", "inputSchema": { JSON Schema }}
     *   ]
     * }
     */
    nlohmann::ordered_json listTools() const;

    /**
     * @brief 执行工具
     *
     * 工具不存在时返回 {"error": "Tool not found: xxx"};
     * 工具抛出的异常同样转换为 {"error": ...}。
     */
    nlohmann::json executeTool(const std::string& name, const nlohmann::json& args,
                               const ToolCallContext& ctx = {});

    size_t getToolCount() const { return tools.size(); }

    bool hasTool(const std::string& name) const { return getTool(name) != nullptr; }

private:
    std::vector<std::unique_ptr<ITool>> tools;
};
