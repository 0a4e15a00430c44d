#pragma once
#include <string>
#include "crawl/Url.h"

struct FetchResponse {
    int status = 0;              // 0 when no response arrived
    std::string body;
    std::string contentType;
    std::string error;
    bool timedOut = false;
};

/**
 * @brief 页面抓取协作者
 *
 * 实现不应抛异常, 失败通过 status / timedOut / error 报告。
 */
class IPageFetcher {
public:
    virtual ~IPageFetcher() = default;
    virtual FetchResponse fetch(const Url& url) = 0;
};

/**
 * @brief 基于 cpp-httplib 的抓取实现, 跟随重定向
 */
class HttpPageFetcher : public IPageFetcher {
public:
    explicit HttpPageFetcher(int timeoutSeconds = 15, std::string userAgent = "");

    FetchResponse fetch(const Url& url) override;

private:
    int timeoutSeconds;
    std::string userAgent;
};
