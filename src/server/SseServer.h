#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "core/Cancellation.h"
#include "server/McpServer.h"

namespace httplib {
class Server;
class Request;
}

/**
 * @brief MCP over SSE 的 HTTP 服务端
 *
 * - GET /sse: 校验 Bearer key, 建立推送流, 第一条事件是 endpoint (POST 路径)
 * - POST /messages/?session_id=...: 立即返回 202, 响应在推送流上送达
 *
 * 每个 POST 在独立的工作线程里执行, 推送流断开时该会话的调用收到取消信号。
 */
class SseServer {
public:
    struct Options {
        std::string host = "127.0.0.1";
        int port = 3006;        // 0 picks a free port
        std::string apiKey;
        int keepAliveSeconds = 15;
    };

    SseServer(McpServer& mcp, Options options);
    ~SseServer();

    SseServer(const SseServer&) = delete;
    SseServer& operator=(const SseServer&) = delete;

    // Binds and serves on a background thread; false when the port cannot be bound
    bool start();

    // Binds and serves on the calling thread until stop()
    bool run();

    void stop();

    int port() const { return boundPort; }
    size_t sessionCount() const;

private:
    class Session {
    public:
        explicit Session(std::string id) : id(std::move(id)), cancel(CancellationToken::create()) {}

        void push(std::string chunk);
        // Waits for the next chunk; false on timeout or close
        bool next(std::string& chunk, std::chrono::seconds timeout);
        void close();
        bool isClosed() const;

        const std::string id;
        const std::shared_ptr<CancellationToken> cancel;

    private:
        mutable std::mutex mtx;
        std::condition_variable cv;
        std::deque<std::string> outbox;
        bool closed = false;
    };

    McpServer& mcp;
    Options opts;
    std::unique_ptr<httplib::Server> http;
    std::thread listenThread;
    std::atomic<int> boundPort{0};
    std::atomic<bool> stopping{false};

    mutable std::mutex sessionsMutex;
    std::map<std::string, std::shared_ptr<Session>> sessions;

    std::mutex workersMutex;
    std::list<std::future<void>> workers;

    void setupRoutes();
    bool bind();
    bool authorized(const httplib::Request& req) const;
    std::shared_ptr<Session> findSession(const std::string& id) const;
    void dropSession(const std::string& id);
    void submit(std::shared_ptr<Session> session, std::string body);
    static std::string newSessionId();
};
