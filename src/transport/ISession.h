#pragma once
#include <memory>
#include <nlohmann/json.hpp>
#include "core/Cancellation.h"
#include "core/DispatchTypes.h"
#include "transport/ServerEndpoint.h"
#include "transport/EventSubscription.h"

/**
 * @brief 与一个后端服务器的会话
 *
 * connect()/listTools() 以 TransportError 报告失败;
 * call() 从不抛异常, 总是返回一个与请求 correlationId 相同的 DispatchResult。
 */
class ISession {
public:
    virtual ~ISession() = default;

    virtual std::shared_ptr<ServerEndpoint> endpoint() const = 0;

    virtual void connect() = 0;

    // "tools/list" result in server order: {"tools": [{name, description, inputSchema}, ...]}
    virtual nlohmann::ordered_json listTools() = 0;

    virtual DispatchResult call(const DispatchRequest& request,
                                const std::shared_ptr<CancellationToken>& cancel = nullptr) = 0;

    virtual std::shared_ptr<EventSubscription> subscribe() = 0;

    virtual void close() = 0;
};
