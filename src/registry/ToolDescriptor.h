#pragma once
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "transport/ServerEndpoint.h"

/**
 * @brief 工具参数定义 (来自 inputSchema.properties, 保持声明顺序)
 */
struct ParameterSpec {
    std::string name;
    std::string type;        // JSON Schema 类型名, 未声明时为空
    bool required = false;
    std::string description;
};

/**
 * @brief 某个端点上的一个工具
 *
 * 刷新时整体替换, 创建后不再修改。
 * 端点只以弱引用保存, 注册表不负责端点生命周期。
 */
struct ToolDescriptor {
    std::string name;
    std::string description;
    std::vector<ParameterSpec> parameters;
    nlohmann::ordered_json inputSchema = nlohmann::ordered_json::object();
    std::string serverName;
    std::weak_ptr<ServerEndpoint> endpoint;

    const ParameterSpec* findParameter(const std::string& param) const {
        for (const auto& p : parameters) {
            if (p.name == param) return &p;
        }
        return nullptr;
    }

    // Builds a descriptor from one "tools/list" entry; throws std::invalid_argument when it has no name
    static ToolDescriptor fromCatalogEntry(const nlohmann::ordered_json& entry,
                                           const std::shared_ptr<ServerEndpoint>& owner);

    // {name, description, server, parameters:[{name,type,required}]}
    nlohmann::ordered_json toJson() const;
};
