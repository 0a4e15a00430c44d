#pragma once
#include <string>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "core/Errors.h"

// Arguments keep the order the classifier (or caller) supplied them in
using ArgumentMap = nlohmann::ordered_json;
using DispatchClock = std::chrono::steady_clock;

struct DispatchRequest {
    std::string toolName;
    ArgumentMap arguments = ArgumentMap::object();
    uint64_t correlationId = 0;
    DispatchClock::time_point deadline;
};

/**
 * @brief 一次调用的结果: 成功载荷或 (kind, message) 失败
 *
 * correlationId 总是等于对应请求的 correlationId。
 */
struct DispatchResult {
    uint64_t correlationId = 0;
    bool ok = false;
    nlohmann::json payload;
    ErrorKind errorKind = ErrorKind::None;
    std::string message;

    static DispatchResult success(uint64_t id, nlohmann::json payload) {
        DispatchResult r;
        r.correlationId = id;
        r.ok = true;
        r.payload = std::move(payload);
        return r;
    }

    static DispatchResult failure(uint64_t id, ErrorKind kind, std::string message) {
        DispatchResult r;
        r.correlationId = id;
        r.ok = false;
        r.errorKind = kind;
        r.message = std::move(message);
        return r;
    }

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["correlation_id"] = correlationId;
        j["status"] = ok ? "ok" : "error";
        if (ok) {
            j["payload"] = payload;
        } else {
            j["error"] = {{"kind", errorKindName(errorKind)}, {"message", message}};
        }
        return j;
    }
};

// One step of a routing plan, before a correlation id and deadline are attached
struct PlannedCall {
    std::string toolName;
    ArgumentMap arguments = ArgumentMap::object();
};
