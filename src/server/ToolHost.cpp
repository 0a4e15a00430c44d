#include "server/ToolHost.h"
#include "utils/Logger.h"

void ToolHost::registerTool(std::unique_ptr<ITool> tool) {
    if (!tool) return;

    std::string name = tool->getName();
    for (auto& existing : tools) {
        if (existing->getName() == name) {
            Logger::getInstance().warn("Tool '" + name + "' registered twice, keeping the newer one");
            existing = std::move(tool);
            return;
        }
    }
    tools.push_back(std::move(tool));
}

ITool* ToolHost::getTool(const std::string& name) const {
    for (const auto& tool : tools) {
        if (tool->getName() == name) return tool.get();
    }
    return nullptr;
}

nlohmann::ordered_json ToolHost::listTools() const {
    nlohmann::ordered_json list = nlohmann::ordered_json::array();
    for (const auto& tool : tools) {
        nlohmann::ordered_json entry;
        entry["name"] = tool->getName();
        entry["description"] = tool->getDescription();
        entry["inputSchema"] = tool->getSchema();
        list.push_back(std::move(entry));
    }
    nlohmann::ordered_json result;
    result["tools"] = std::move(list);
    return result;
}

nlohmann::json ToolHost::executeTool(const std::string& name, const nlohmann::json& args,
                                     const ToolCallContext& ctx) {
    ITool* tool = getTool(name);
    if (!tool) {
        return {{"error", "Tool not found: " + name}};
    }

    try {
        return tool->execute(args.is_null() ? nlohmann::json::object() : args, ctx);
    } catch (const std::exception& e) {
        Logger::getInstance().error("Tool '" + name + "' threw: " + e.what());
        return {{"error", std::string("Tool execution failed: ") + e.what()}};
    }
}
