#pragma once
#include <chrono>
#include "transport/SessionManager.h"
#include "registry/ToolRegistry.h"

/**
 * @brief 编排层共享的运行时对象
 *
 * 启动时构造, 显式传给 Dispatcher / IntentRouter, 关闭时随 main 一起销毁。
 * 不持有所有权。
 */
struct OrchestrationContext {
    SessionManager& sessions;
    ToolRegistry& registry;
    std::chrono::milliseconds callTimeout{30000};

    OrchestrationContext(SessionManager& sessions, ToolRegistry& registry,
                         std::chrono::milliseconds callTimeout = std::chrono::milliseconds(30000))
        : sessions(sessions), registry(registry), callTimeout(callTimeout) {}
};
