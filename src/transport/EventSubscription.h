#pragma once
#include <string>
#include <deque>
#include <mutex>
#include <optional>
#include <chrono>
#include <condition_variable>
#include <nlohmann/json.hpp>

// A server-pushed event: notification method (or SSE event name) plus payload
struct SessionEvent {
    std::string type;
    nlohmann::json payload;
};

/**
 * @brief 服务器推送事件的惰性序列
 *
 * 序列是无限的: next() 一直阻塞到下一个事件, 只有在 cancel() 或会话关闭后
 * 才返回 std::nullopt。
 */
class EventSubscription {
public:
    std::optional<SessionEvent> next();

    // Returns std::nullopt on timeout as well; check isActive() to tell the cases apart
    std::optional<SessionEvent> next(std::chrono::milliseconds timeout);

    void cancel();
    bool isActive() const;

    // Session side
    void push(SessionEvent event);
    void close();

private:
    mutable std::mutex mtx;
    std::condition_variable cv;
    std::deque<SessionEvent> queue;
    bool cancelled = false;
    bool closed = false;
};
