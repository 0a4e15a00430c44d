#pragma once
#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include "core/Cancellation.h"
#include "crawl/CrawlTypes.h"
#include "crawl/HtmlExtractor.h"
#include "crawl/PageFetcher.h"
#include "crawl/RateLimiter.h"
#include "crawl/Url.h"

/**
 * @brief 有界、限速的广度优先爬虫
 *
 * 状态: Idle -> Running -> {Completed, Cancelled, Failed}
 *
 * - frontier 是显式队列, 按深度从低到高处理
 * - 已访问集合保存规范化 URL, 只属于本次爬取
 * - 两次抓取的开始时间间隔不小于 1 / rateLimitPerSecond
 * - 单个页面失败只产生失败记录, 只有种子 URL 无效才是致命错误
 *
 * next()/run() 只能在一个线程中调用, cancel() 可以在任意线程调用。
 */
class CrawlEngine {
public:
    using RecordCallback = std::function<void(const CrawlRecord&)>;

    CrawlEngine(CrawlOptions options,
                IPageFetcher& fetcher,
                IHtmlExtractor& extractor,
                std::shared_ptr<CrawlClock> clock = nullptr,
                std::shared_ptr<CancellationToken> cancelToken = nullptr);

    // Idle -> Running, or Failed when the seed URL is unusable
    bool start();

    // 抓取下一个页面; 爬取结束 (完成/取消/失败) 时返回 std::nullopt
    std::optional<CrawlRecord> next();

    // 运行到结束, 返回全部记录 (取消时返回已收集的部分)
    std::vector<CrawlRecord> run(const RecordCallback& onRecord = nullptr);

    void cancel();

    CrawlStatus status() const { return state.load(); }
    const std::string& failureReason() const { return failure; }
    int fetchCount() const { return fetches; }
    size_t visitedCount() const { return visited.size(); }
    size_t frontierSize() const { return frontier.size(); }

    bool inScope(const Url& url) const;

private:
    struct FrontierEntry {
        Url url;
        int depth;
    };

    CrawlOptions opts;
    IPageFetcher& fetcher;
    IHtmlExtractor& extractor;
    std::shared_ptr<CrawlClock> clock;
    std::shared_ptr<CancellationToken> token;
    RateLimiter limiter;

    std::atomic<CrawlStatus> state{CrawlStatus::Idle};
    std::string failure;
    std::optional<Url> seed;
    std::deque<FrontierEntry> frontier;
    std::unordered_set<std::string> visited;
    int fetches = 0;

    bool cancelled() const { return token->isCancelled(); }
    CrawlRecord fetchPage(const FrontierEntry& entry);
    void enqueue(const Url& url, int depth);
};
