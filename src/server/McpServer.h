#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "server/ToolHost.h"

/**
 * @brief 与传输无关的 JSON-RPC 2.0 处理器
 *
 * 支持 initialize / notifications/initialized / ping / tools/list / tools/call。
 * 通知 (没有 id 的消息) 不产生响应。
 */
class McpServer {
public:
    McpServer(ToolHost& host, std::string name, std::string version = "1.0.0");

    // Responses are ordered so tool schemas keep their property order on the wire
    std::optional<nlohmann::ordered_json> handle(const nlohmann::json& message, const ToolCallContext& ctx = {});

    // Parses raw text first; malformed JSON yields a -32700 error response
    std::optional<nlohmann::ordered_json> handleText(const std::string& body, const ToolCallContext& ctx = {});

    static nlohmann::ordered_json makeError(const nlohmann::json& id, int code, const std::string& message);

private:
    ToolHost& host;
    std::string serverName;
    std::string serverVersion;

    nlohmann::ordered_json callTool(const nlohmann::json& params, const ToolCallContext& ctx);
};
