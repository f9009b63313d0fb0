#include "scheduler.hpp"
#include <iostream>
#include <stdexcept>

namespace engram {

DeferredScheduler::DeferredScheduler() {
    worker_ = std::thread([this] { run(); });
}

DeferredScheduler::~DeferredScheduler() {
    stop();
}

DeferredScheduler::Ticket DeferredScheduler::schedule_after(uint64_t delay_ms,
                                                            std::function<void()> fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_.load()) return 0;

    Ticket ticket = next_ticket_++;
    auto due = std::chrono::steady_clock::now() + std::chrono::milliseconds(delay_ms);
    queue_.emplace(Key{due, ticket}, std::move(fn));
    due_[ticket] = due;
    cv_.notify_all();
    return ticket;
}

bool DeferredScheduler::cancel(Ticket ticket) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = due_.find(ticket);
    if (it == due_.end()) return false;
    queue_.erase(Key{it->second, ticket});
    due_.erase(it);
    return true;
}

void DeferredScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_.store(false);
        queue_.clear();
        due_.clear();
    }
    cv_.notify_all();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

size_t DeferredScheduler::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void DeferredScheduler::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_.load()) {
        if (queue_.empty()) {
            cv_.wait(lock, [this] { return !running_.load() || !queue_.empty(); });
            continue;
        }

        auto first = queue_.begin();
        auto due = first->first.first;
        if (std::chrono::steady_clock::now() < due) {
            cv_.wait_until(lock, due);
            continue;
        }

        auto fn = std::move(first->second);
        due_.erase(first->first.second);
        queue_.erase(first);

        lock.unlock();
        try {
            fn();
        } catch (const std::exception& e) {
            std::cerr << "[scheduler] Deferred action failed: " << e.what() << "\n";
        }
        lock.lock();
    }
}

} // namespace engram
