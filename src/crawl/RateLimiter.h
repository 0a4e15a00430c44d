#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include "core/Cancellation.h"

/**
 * @brief 爬虫使用的时钟, 测试中替换为可手动推进的假时钟
 */
class CrawlClock {
public:
    using Duration = std::chrono::steady_clock::duration;
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~CrawlClock() = default;
    virtual TimePoint now() { return std::chrono::steady_clock::now(); }
    // Returns early when cancel is signalled
    virtual void sleepFor(Duration d, CancellationToken* cancel = nullptr);
};

/**
 * @brief 全局最小抓取间隔 (1 / rate), 从上一次抓取开始时计算
 */
class RateLimiter {
public:
    RateLimiter(double perSecond, std::shared_ptr<CrawlClock> clock);

    // Blocks until the next fetch may start and marks that start.
    // Returns false without marking a start if cancel fires while waiting.
    bool acquire(CancellationToken* cancel = nullptr);

    // Time left before acquire() would return immediately
    CrawlClock::Duration pending();

    CrawlClock::Duration interval() const { return minInterval; }

private:
    std::shared_ptr<CrawlClock> clock;
    CrawlClock::Duration minInterval{0};
    std::optional<CrawlClock::TimePoint> lastStart;
};
