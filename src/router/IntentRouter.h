#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/DispatchTypes.h"
#include "registry/ToolRegistry.h"
#include "router/IIntentClassifier.h"

/**
 * @brief 一次路由的结果
 *
 * ok 且 calls 为空表示没有适用的工具, 调用方应直接对话回复。
 */
struct RouteResult {
    bool ok = true;
    std::vector<PlannedCall> calls;
    ErrorKind errorKind = ErrorKind::None;
    // HallucinatedTool when the correction retry was used up
    ErrorKind cause = ErrorKind::None;
    std::string message;
    int classifierCalls = 0;

    nlohmann::json toJson() const;
};

/**
 * @brief 把自然语言请求映射为工具调用计划
 *
 * 以注册表快照作为分类器的决策空间; 分类器选择了不存在的工具时,
 * 带着纠正信息重试一次, 仍然失败则返回 RoutingFailure, 不会触发任何分发。
 */
class IntentRouter {
public:
    explicit IntentRouter(IIntentClassifier& classifier);

    RouteResult route(const std::string& userText, const RegistrySnapshot& snapshot);

    RouteResult route(const std::string& userText, const ToolRegistry& registry) {
        return route(userText, *registry.snapshot());
    }

    // System prompt listing every tool with its parameters
    static std::string buildCatalogPrompt(const RegistrySnapshot& snapshot);

    /**
     * @brief 解析分类器回复
     *
     * 支持 {"calls":[...]}, 单个 {"tool":...} 或 {"action":...}, 以及只有工具名的回复。
     * "none"/"other"/空回复/无法解析的回复都得到空计划。
     */
    static std::vector<PlannedCall> parsePlan(const std::string& reply);

private:
    IIntentClassifier& classifier;

    static constexpr int kMaxCorrections = 1;
};
