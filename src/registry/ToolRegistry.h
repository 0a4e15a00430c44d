#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "registry/ToolDescriptor.h"
#include "transport/ISession.h"

class SessionManager;

/**
 * @brief 工具名冲突记录: 同名工具由后刷新的端点覆盖
 */
struct ToolCollision {
    std::string toolName;
    std::string shadowedServer;
    std::string winningServer;
};

/**
 * @brief 注册表的一个不可变版本
 *
 * 读者持有 shared_ptr, 刷新只会发布新版本, 不会修改已发布的版本。
 */
struct RegistrySnapshot {
    uint64_t version = 0;
    // 按最近一次刷新顺序排列的端点名
    std::vector<std::string> endpointOrder;
    std::map<std::string, std::vector<ToolDescriptor>> byEndpoint;
    // 聚合后的 name -> descriptor (last-write-wins)
    std::map<std::string, ToolDescriptor> tools;
    std::vector<ToolCollision> collisions;
};

/**
 * @brief 跨端点的工具目录
 *
 * 写入 (refresh/remove) 串行化并以整体替换的方式发布,
 * 并发读者要么看到旧目录, 要么看到新目录, 不会看到两者混合。
 */
class ToolRegistry {
public:
    ToolRegistry();

    /**
     * @brief 查询一个端点的目录并原子替换它原有的工具集合
     * @return 该端点的新工具集合
     * @throws TransportError (kind = RegistryError), 失败时原有目录保持不变
     */
    std::vector<ToolDescriptor> refresh(ISession& session);

    /**
     * @brief 直接替换一个端点的工具集合 (refresh 的最后一步, 测试也会用到)
     */
    void replace(const std::shared_ptr<ServerEndpoint>& endpoint, std::vector<ToolDescriptor> tools);

    // 刷新所有已连接端点, 返回成功数量; 单个端点失败只记录日志
    int refreshAll(SessionManager& sessions);

    // 删除一个端点的所有工具 (端点失败时调用)
    void remove(const std::string& endpointName);

    std::map<std::string, ToolDescriptor> allTools() const;

    // 未找到时返回 std::nullopt
    std::optional<ToolDescriptor> resolve(const std::string& name) const;

    std::vector<ToolCollision> collisions() const;

    std::shared_ptr<const RegistrySnapshot> snapshot() const;

    size_t size() const { return snapshot()->tools.size(); }

private:
    std::mutex writeMutex;
    std::shared_ptr<const RegistrySnapshot> current;

    void publish(std::shared_ptr<RegistrySnapshot> next);
    static void aggregate(RegistrySnapshot& snap);
};
