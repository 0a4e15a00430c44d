#pragma once
#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "core/Cancellation.h"

/**
 * @brief 一次工具调用的运行环境
 *
 * notify 把中间结果作为服务器推送发回调用方的推送流;
 * cancel 在调用方断开连接时被置位。
 */
struct ToolCallContext {
    std::function<void(const std::string& method, const nlohmann::json& params)> notify;
    std::shared_ptr<CancellationToken> cancel;

    void push(const std::string& method, const nlohmann::json& params) const {
        if (notify) notify(method, params);
    }
};

/**
 * @brief 服务器端工具接口
 *
 * 工具只执行, 不判断。
 */
class ITool {
public:
    virtual ~ITool() = default;

    /**
     * @brief 获取工具名称
     * @return 工具在本服务器内的唯一名称
     */
    virtual std::string getName() const = 0;

    /**
     * @brief 获取工具描述 (用于分类器理解)
     */
    virtual std::string getDescription() const = 0;

    /**
     * @brief 获取工具的 JSON Schema (properties 的声明顺序即参数顺序)
     */
    virtual nlohmann::ordered_json getSchema() const = 0;

    /**
     * @brief 执行工具操作
     * @param args 工具参数
     * @return MCP 格式的结果
     *
     * 成功:
     * {
     *   "content": [
     *     {"type": "text", "text": "结果内容"}
     *   ]
     * }
     *
     * 错误:
     * {
     *   "error": "错误描述"
     * }
     */
    virtual nlohmann::json execute(const nlohmann::json& args, const ToolCallContext& ctx) = 0;

protected:
    static nlohmann::json textResult(const std::string& text) {
        return {{"content", {{{"type", "text"}, {"text", text}}}}};
    }

    static nlohmann::json errorResult(const std::string& message) {
        return {{"error", message}};
    }
};
