#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class FetchOutcome {
    Ok,
    HttpError,
    Timeout,
    ParseError
};

inline const char* fetchOutcomeName(FetchOutcome outcome) {
    switch (outcome) {
        case FetchOutcome::Ok: return "ok";
        case FetchOutcome::HttpError: return "http-error";
        case FetchOutcome::Timeout: return "timeout";
        case FetchOutcome::ParseError: return "parse-error";
    }
    return "unknown";
}

enum class CrawlStatus {
    Idle,
    Running,
    Completed,
    Cancelled,
    Failed
};

inline const char* crawlStatusName(CrawlStatus status) {
    switch (status) {
        case CrawlStatus::Idle: return "idle";
        case CrawlStatus::Running: return "running";
        case CrawlStatus::Completed: return "completed";
        case CrawlStatus::Cancelled: return "cancelled";
        case CrawlStatus::Failed: return "failed";
    }
    return "unknown";
}

enum class CrawlScope {
    SameOrigin,
    AllowList
};

struct CrawlOptions {
    std::string seedUrl;
    int maxDepth = 2;
    double rateLimitPerSecond = 1.0;   // <= 0 disables rate limiting
    int maxPages = 50;                 // 0 = unlimited
    CrawlScope scope = CrawlScope::SameOrigin;
    std::vector<std::string> allowHosts;
};

/**
 * @brief 一个页面的抓取结果, 创建后不再修改
 */
struct CrawlRecord {
    std::string url;
    std::string title;
    std::string text;
    std::vector<std::string> links;   // canonical outbound http(s) links, in page order
    int depth = 0;
    FetchOutcome outcome = FetchOutcome::Ok;
    int statusCode = 0;
    std::string error;

    bool ok() const { return outcome == FetchOutcome::Ok; }

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["url"] = url;
        j["depth"] = depth;
        j["outcome"] = fetchOutcomeName(outcome);
        if (statusCode) j["status"] = statusCode;
        if (!title.empty()) j["title"] = title;
        j["text"] = text;
        j["links"] = links;
        if (!error.empty()) j["error"] = error;
        return j;
    }
};
