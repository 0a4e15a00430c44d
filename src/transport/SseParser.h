#pragma once
#include <string>
#include <functional>

struct SseEvent {
    std::string event = "message";
    std::string data;
    std::string id;
};

/**
 * @brief 增量 text/event-stream 解析器
 *
 * 数据可以任意切块喂入; 每遇到一个空行就分发一个事件。
 * 以 ':' 开头的注释行 (keep-alive) 被丢弃。
 */
class SseParser {
public:
    using EventHandler = std::function<void(const SseEvent&)>;

    explicit SseParser(EventHandler handler) : onEvent(std::move(handler)) {}

    void feed(const char* data, size_t length);
    void feed(const std::string& chunk) { feed(chunk.data(), chunk.size()); }

    // Dispatch a pending event that was not terminated by a blank line
    void finish();

    static std::string format(const std::string& event, const std::string& data);

private:
    EventHandler onEvent;
    std::string buffer;
    SseEvent pending;
    bool hasData = false;

    void processLine(const std::string& line);
    void dispatch();
};
