#pragma once
#include <string>
#include <atomic>

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Failed
};

inline const char* connectionStateName(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Connected: return "connected";
        case ConnectionState::Failed: return "failed";
    }
    return "unknown";
}

/**
 * @brief 一个后端服务器的身份与连接状态
 *
 * 由 SessionManager 独占持有 (shared_ptr), ToolRegistry 只保存 weak_ptr 用于查找。
 */
struct ServerEndpoint {
    std::string name;
    std::string scheme = "http";
    std::string host;
    int port = 80;
    std::string apiKey;
    std::atomic<ConnectionState> state{ConnectionState::Disconnected};

    ServerEndpoint() = default;
    ServerEndpoint(std::string name, std::string scheme, std::string host, int port, std::string apiKey)
        : name(std::move(name)), scheme(std::move(scheme)), host(std::move(host)), port(port), apiKey(std::move(apiKey)) {}

    std::string baseUrl() const {
        return scheme + "://" + host + ":" + std::to_string(port);
    }
};
