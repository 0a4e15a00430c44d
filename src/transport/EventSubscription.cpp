#include "transport/EventSubscription.h"

std::optional<SessionEvent> EventSubscription::next() {
    std::unique_lock<std::mutex> lock(mtx);
    cv.wait(lock, [this]() { return cancelled || !queue.empty() || closed; });
    if (cancelled || queue.empty()) return std::nullopt;
    SessionEvent event = std::move(queue.front());
    queue.pop_front();
    return event;
}

std::optional<SessionEvent> EventSubscription::next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mtx);
    cv.wait_for(lock, timeout, [this]() { return cancelled || !queue.empty() || closed; });
    if (cancelled || queue.empty()) return std::nullopt;
    SessionEvent event = std::move(queue.front());
    queue.pop_front();
    return event;
}

void EventSubscription::cancel() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        cancelled = true;
        queue.clear();
    }
    cv.notify_all();
}

bool EventSubscription::isActive() const {
    std::lock_guard<std::mutex> lock(mtx);
    // Events buffered before close are still delivered
    return !cancelled && (!closed || !queue.empty());
}

void EventSubscription::push(SessionEvent event) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (cancelled || closed) return;
        queue.push_back(std::move(event));
    }
    cv.notify_one();
}

void EventSubscription::close() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        closed = true;
    }
    cv.notify_all();
}
