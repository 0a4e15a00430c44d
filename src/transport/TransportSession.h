#pragma once
#include <map>
#include <mutex>
#include <atomic>
#include <future>
#include <thread>
#include <vector>
#include <string>
#include <functional>
#include <condition_variable>
#include "transport/ISession.h"
#include "transport/IChannel.h"

/**
 * @brief 一个端点上的长连接会话
 *
 * - 推送流上的 JSON-RPC 响应按 id 分发给等待中的调用, 其余消息进入订阅队列
 * - 断线后按指数退避重连 (initial, 2x, 4x ... 上限 backoffMax), 超过次数后标记 Failed
 * - 鉴权失败不重试, 直接标记 Failed
 */
class TransportSession : public ISession {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    TransportSession(std::shared_ptr<ServerEndpoint> endpoint,
                     ChannelFactory factory,
                     TransportOptions options = {},
                     Sleeper sleeper = nullptr);
    ~TransportSession() override;

    std::shared_ptr<ServerEndpoint> endpoint() const override { return ep; }

    void connect() override;
    nlohmann::ordered_json listTools() override;
    DispatchResult call(const DispatchRequest& request,
                        const std::shared_ptr<CancellationToken>& cancel = nullptr) override;
    std::shared_ptr<EventSubscription> subscribe() override;
    void close() override;

    // Delay before retry number `attempt` (1-based)
    static std::chrono::milliseconds backoffDelay(int attempt, const TransportOptions& options);

private:
    std::shared_ptr<ServerEndpoint> ep;
    ChannelFactory channelFactory;
    TransportOptions opts;
    Sleeper sleeper;

    std::mutex channelMutex;
    std::shared_ptr<IChannel> channel;
    std::atomic<uint64_t> generation{0};

    std::mutex pendingMutex;
    // Raw response text keyed by the JSON-RPC id
    std::map<std::string, std::promise<std::string>> pending;
    std::atomic<uint64_t> internalIds{0};

    std::mutex subsMutex;
    std::vector<std::weak_ptr<EventSubscription>> subscribers;

    std::atomic<bool> closed{false};
    std::mutex sleepMutex;
    std::condition_variable sleepCv;

    std::mutex reconnectMutex;
    std::thread reconnectThread;

    void connectWithRetry(const std::string& phase);
    void openChannel();
    void pause(std::chrono::milliseconds delay);

    std::string request(const std::string& method, const nlohmann::json& params,
                        std::chrono::milliseconds timeout);
    void notify(const std::string& method, const nlohmann::json& params);
    void send(const std::string& body);
    std::string awaitResponse(const std::string& key, std::future<std::string>& future,
                                 DispatchClock::time_point deadline,
                                 const std::shared_ptr<CancellationToken>& cancel);

    void handleMessage(const SseEvent& event);
    void handleDrop(const std::string& reason);
    void reconnectLoop();
    void failPending(ErrorKind kind, const std::string& message);
    void publish(SessionEvent event);
    void closeSubscribers();
};
