#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "core/ConfigManager.h"
#include "transport/ISession.h"
#include "transport/IChannel.h"

/**
 * @brief 管理所有端点及其会话
 *
 * 每个端点一个独立会话; 某个端点失败不会影响其它端点。
 * 端点对象由这里持有, 注册表只保存弱引用。
 */
class SessionManager {
public:
    explicit SessionManager(TransportOptions options = {}, ChannelFactory factory = nullptr);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // 根据配置创建端点与会话 (尚未连接)
    std::shared_ptr<ServerEndpoint> addEndpoint(const Config::Server& server);

    // 注入一个现成的会话 (测试或内置服务器使用)
    void addSession(std::unique_ptr<ISession> session);

    // 并行连接所有端点, 返回连接成功的数量
    int connectAll();

    ISession* find(const std::string& name) const;

    std::vector<std::shared_ptr<ServerEndpoint>> endpoints() const;

    std::vector<ISession*> connectedSessions() const;

    void shutdown();

private:
    TransportOptions options;
    ChannelFactory channelFactory;

    mutable std::mutex mtx;
    std::map<std::string, std::unique_ptr<ISession>> sessions;
};
