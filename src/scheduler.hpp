#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>

namespace engram {

// Single background thread running cancellable deferred actions.
// Actions run outside the lock, in due-time order. An action that
// throws is logged and dropped; it never takes the thread down.
class DeferredScheduler {
public:
    using Ticket = uint64_t;

    DeferredScheduler();
    ~DeferredScheduler();

    DeferredScheduler(const DeferredScheduler&) = delete;
    DeferredScheduler& operator=(const DeferredScheduler&) = delete;

    // Run fn after delay_ms. Returns a ticket for cancel(); 0 if stopped.
    Ticket schedule_after(uint64_t delay_ms, std::function<void()> fn);

    // True if the action was removed before it started.
    bool cancel(Ticket ticket);

    // Drop pending actions and join the worker. Idempotent.
    void stop();

    size_t pending() const;

private:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Key = std::pair<TimePoint, Ticket>;

    void run();

    std::map<Key, std::function<void()>> queue_;
    std::unordered_map<Ticket, TimePoint> due_;   // ticket -> queue_ key time
    Ticket next_ticket_ = 1;
    std::atomic<bool> running_{true};
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
};

} // namespace engram
