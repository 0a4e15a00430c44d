#pragma once
#include <string>
#include <memory>
#include <functional>
#include "transport/SseParser.h"
#include "transport/ServerEndpoint.h"

struct TransportOptions {
    int connectTimeoutMs = 5000;
    int callTimeoutMs = 30000;
    int maxReconnectAttempts = 5;
    int backoffInitialMs = 1000;
    int backoffMaxMs = 30000;
    int streamReadTimeoutS = 300;
};

/**
 * @brief 单个逻辑连接上的两条通道
 *
 * 推送流 (server -> client) 由 open() 建立, 事件通过 onMessage 回调送达;
 * 调用通道 (client -> server) 由 post() 发送。两者共享同一个鉴权身份。
 */
class IChannel {
public:
    using MessageHandler = std::function<void(const SseEvent&)>;
    using DropHandler = std::function<void(const std::string& reason)>;

    virtual ~IChannel() = default;

    /**
     * @brief 建立推送流并等待服务器宣告调用通道
     * @throws TransportError AuthError (401/403) 或 ConnectionError
     *
     * onDrop 只在意外断开时调用, close() 之后不会再调用。
     */
    virtual void open(MessageHandler onMessage, DropHandler onDrop) = 0;

    /**
     * @brief 在调用通道上发送一条 JSON-RPC 消息
     * @throws TransportError
     */
    virtual void post(const std::string& body) = 0;

    virtual void close() = 0;
};

using ChannelFactory = std::function<std::unique_ptr<IChannel>(const ServerEndpoint&)>;
