#pragma once
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <vector>
#include "core/DispatchTypes.h"
#include "core/Cancellation.h"
#include "dispatch/OrchestrationContext.h"

/**
 * @brief 把一次工具调用送到拥有该工具的端点
 *
 * 流程: 查注册表 -> 校验参数 -> 选会话 -> 带截止时间调用。
 * dispatch() 从不抛异常; 结果的 correlationId 总是等于请求的 correlationId。
 * 超时不自动重试, 重试策略由调用方决定。
 */
class Dispatcher {
public:
    explicit Dispatcher(OrchestrationContext& context);

    // 单调递增, 跳过调用方自行使用过的 id
    uint64_t nextCorrelationId();

    // 生成带新 id 和默认截止时间的请求
    DispatchRequest makeRequest(const std::string& toolName, ArgumentMap arguments = ArgumentMap::object());

    DispatchResult dispatch(const DispatchRequest& request);

    /**
     * @brief 取消一个正在等待响应的调用
     * @return 该 id 是否仍在进行中
     *
     * 已发出的请求不会被撤回, 迟到的响应会被丢弃。
     */
    bool cancel(uint64_t correlationId);

    // 按顺序执行路由计划, 每个调用对应一个结果 (失败不中断后续调用)
    std::vector<DispatchResult> dispatchPlan(const std::vector<PlannedCall>& plan);

    size_t inFlightCount() const;

    // 仍需记住的 id 数: 已生成未派发的, 以及调用方自选且高于计数器的
    size_t trackedIdCount() const;

private:
    OrchestrationContext& ctx;

    // Ids <= counter are spent unless still in `issued`
    std::atomic<uint64_t> counter{0};
    mutable std::mutex mtx;
    std::set<uint64_t> issued;
    std::set<uint64_t> seenAbove;
    std::map<uint64_t, std::shared_ptr<CancellationToken>> inFlight;

    DispatchResult dispatchResolved(const DispatchRequest& request, const std::shared_ptr<CancellationToken>& token);
    void finish(uint64_t correlationId);
};
