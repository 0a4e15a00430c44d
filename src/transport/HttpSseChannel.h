#pragma once
#include <string>
#include <memory>
#include <mutex>
#include <thread>
#include <atomic>
#include <condition_variable>
#include "core/Errors.h"
#include "transport/IChannel.h"

namespace httplib { class Client; }

/**
 * @brief HTTP 上的 SSE 推送流 + POST 调用通道
 *
 * GET /sse 建立推送流, 第一个 "endpoint" 事件给出 POST 路径。
 * 所有请求都带 "Authorization: Bearer <api_key>"。
 */
class HttpSseChannel : public IChannel {
public:
    HttpSseChannel(const ServerEndpoint& endpoint, const TransportOptions& options);
    ~HttpSseChannel() override;

    void open(MessageHandler onMessage, DropHandler onDrop) override;
    void post(const std::string& body) override;
    void close() override;

    static ChannelFactory factory(const TransportOptions& options);

private:
    std::string name;
    std::string baseUrl;
    std::string apiKey;
    TransportOptions options;

    MessageHandler messageHandler;
    DropHandler dropHandler;

    std::unique_ptr<httplib::Client> streamClient;
    std::thread readerThread;
    std::atomic<bool> closing{false};

    std::mutex stateMutex;
    std::condition_variable stateCv;
    bool opened = false;
    bool openFailed = false;
    ErrorKind failureKind = ErrorKind::ConnectionError;
    std::string failureMessage;
    std::string messagesPath;

    void readLoop();
    void onSseEvent(const SseEvent& event);
    void failOpen(ErrorKind kind, const std::string& message);
};
