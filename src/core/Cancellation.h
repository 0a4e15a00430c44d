#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

// Shared flag checked between units of work (fetches, response waits)
class CancellationToken {
public:
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mtx);
            cancelled.store(true);
        }
        cv.notify_all();
    }

    bool isCancelled() const { return cancelled.load(); }

    // Sleeps up to d, waking early on cancel(); true if cancelled
    bool waitFor(std::chrono::steady_clock::duration d) {
        std::unique_lock<std::mutex> lock(mtx);
        return cv.wait_for(lock, d, [this] { return cancelled.load(); });
    }

    static std::shared_ptr<CancellationToken> create() {
        return std::make_shared<CancellationToken>();
    }

private:
    std::atomic<bool> cancelled{false};
    std::mutex mtx;
    std::condition_variable cv;
};
