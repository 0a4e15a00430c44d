#pragma once
#include <string>
#include "server/ITool.h"

class ToolHost;

/**
 * @brief calendar 工具集: get_events
 *
 * 事件来自一个 JSON 文件 ([{"title","start","end"}, ...]);
 * 未配置文件时返回内置的示例事件。
 */
class GetEventsTool : public ITool {
public:
    explicit GetEventsTool(std::string eventsFile = "");

    std::string getName() const override { return "get_events"; }
    std::string getDescription() const override;
    nlohmann::ordered_json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args, const ToolCallContext& ctx) override;

    static nlohmann::json sampleEvents();

private:
    std::string eventsFile;

    nlohmann::json loadEvents() const;
};

void registerCalendarTools(ToolHost& host, const std::string& eventsFile);
