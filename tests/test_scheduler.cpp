#include <catch2/catch_test_macros.hpp>
#include "scheduler.hpp"
#include "test_helpers.hpp"
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <vector>

using namespace engram;
using namespace engram_test;

TEST_CASE("DeferredScheduler: runs an action after its delay", "[scheduler]") {
    DeferredScheduler scheduler;
    std::atomic<int> runs{0};
    auto ticket = scheduler.schedule_after(10, [&runs] { runs++; });
    REQUIRE(ticket != 0);
    REQUIRE(wait_until([&runs] { return runs.load() == 1; }));
    REQUIRE(scheduler.pending() == 0);
}

TEST_CASE("DeferredScheduler: actions run in due-time order", "[scheduler]") {
    DeferredScheduler scheduler;
    std::mutex mutex;
    std::vector<int> order;
    auto record = [&](int n) {
        return [&mutex, &order, n] {
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back(n);
        };
    };
    scheduler.schedule_after(60, record(3));
    scheduler.schedule_after(0, record(1));
    scheduler.schedule_after(30, record(2));

    REQUIRE(wait_until([&] {
        std::lock_guard<std::mutex> lock(mutex);
        return order.size() == 3;
    }));
    std::lock_guard<std::mutex> lock(mutex);
    REQUIRE(order == std::vector<int>{1, 2, 3});
}

TEST_CASE("DeferredScheduler: cancel removes a pending action", "[scheduler]") {
    DeferredScheduler scheduler;
    std::atomic<int> runs{0};
    auto ticket = scheduler.schedule_after(200, [&runs] { runs++; });
    REQUIRE(scheduler.pending() == 1);
    REQUIRE(scheduler.cancel(ticket));
    REQUIRE_FALSE(scheduler.cancel(ticket));
    REQUIRE(scheduler.pending() == 0);

    std::this_thread::sleep_for(std::chrono::milliseconds(250));
    REQUIRE(runs.load() == 0);
}

TEST_CASE("DeferredScheduler: throwing action does not stop the worker", "[scheduler]") {
    DeferredScheduler scheduler;
    std::atomic<int> runs{0};
    scheduler.schedule_after(0, [] { throw std::runtime_error("boom"); });
    scheduler.schedule_after(20, [&runs] { runs++; });
    REQUIRE(wait_until([&runs] { return runs.load() == 1; }));
}

TEST_CASE("DeferredScheduler: stop is idempotent and rejects new work", "[scheduler]") {
    DeferredScheduler scheduler;
    std::atomic<int> runs{0};
    scheduler.schedule_after(500, [&runs] { runs++; });
    scheduler.stop();
    scheduler.stop();
    REQUIRE(scheduler.pending() == 0);
    REQUIRE(scheduler.schedule_after(0, [&runs] { runs++; }) == 0);
    REQUIRE(runs.load() == 0);
}
