#include "crawl/RateLimiter.h"
#include <thread>

void CrawlClock::sleepFor(Duration d, CancellationToken* cancel) {
    if (d <= Duration::zero()) return;
    if (cancel) {
        cancel->waitFor(d);
    } else {
        std::this_thread::sleep_for(d);
    }
}

RateLimiter::RateLimiter(double perSecond, std::shared_ptr<CrawlClock> clock)
    : clock(clock ? std::move(clock) : std::make_shared<CrawlClock>()) {
    if (perSecond > 0) {
        minInterval = std::chrono::duration_cast<CrawlClock::Duration>(std::chrono::duration<double>(1.0 / perSecond));
    }
}

CrawlClock::Duration RateLimiter::pending() {
    if (!lastStart || minInterval == CrawlClock::Duration::zero()) return CrawlClock::Duration::zero();
    auto ready = *lastStart + minInterval;
    auto now = clock->now();
    return ready > now ? ready - now : CrawlClock::Duration::zero();
}

bool RateLimiter::acquire(CancellationToken* cancel) {
    // Loop in case the clock wakes early
    for (auto wait = pending(); wait > CrawlClock::Duration::zero(); wait = pending()) {
        if (cancel && cancel->isCancelled()) return false;
        clock->sleepFor(wait, cancel);
    }
    if (cancel && cancel->isCancelled()) return false;
    lastStart = clock->now();
    return true;
}
