/**
 * @file test_scheduler.cpp
 * @brief Unit tests for ThreadedScheduler
 */

#include <gtest/gtest.h>
#include <courier/core/scheduler.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace courier::core;
using namespace std::chrono_literals;

class SchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        scheduler_.start();
    }

    void TearDown() override {
        scheduler_.stop();
    }

    // Waits until @p predicate holds or two seconds pass.
    template<typename Predicate>
    bool waitFor(Predicate predicate) {
        auto deadline = std::chrono::steady_clock::now() + 2s;
        while (std::chrono::steady_clock::now() < deadline) {
            if (predicate()) {
                return true;
            }
            std::this_thread::sleep_for(5ms);
        }
        return predicate();
    }

    ThreadedScheduler scheduler_;
};

TEST_F(SchedulerTest, RunsTask) {
    std::atomic<int> runs{0};
    TimerId id = scheduler_.schedule(10ms, "g", [&runs]() { runs++; });

    EXPECT_NE(id, kInvalidTimer);
    EXPECT_TRUE(waitFor([&]() { return runs.load() == 1; }));
    EXPECT_EQ(scheduler_.pendingCount("g"), 0u);
}

TEST_F(SchedulerTest, RunsInDeadlineOrder) {
    std::mutex mutex;
    std::vector<int> order;
    auto record = [&](int value) {
        return [&, value]() {
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back(value);
        };
    };

    scheduler_.schedule(60ms, "g", record(3));
    scheduler_.schedule(20ms, "g", record(1));
    scheduler_.schedule(40ms, "g", record(2));

    ASSERT_TRUE(waitFor([&]() {
        std::lock_guard<std::mutex> lock(mutex);
        return order.size() == 3;
    }));
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST_F(SchedulerTest, CancelPreventsRun) {
    std::atomic<int> runs{0};
    TimerId id = scheduler_.schedule(50ms, "g", [&runs]() { runs++; });

    EXPECT_TRUE(scheduler_.cancel(id));
    EXPECT_FALSE(scheduler_.cancel(id));

    std::this_thread::sleep_for(120ms);
    EXPECT_EQ(runs.load(), 0);
}

TEST_F(SchedulerTest, CancelGroupOnlyTouchesThatGroup) {
    std::atomic<int> a{0};
    std::atomic<int> b{0};
    scheduler_.schedule(50ms, "conn-a", [&a]() { a++; });
    scheduler_.schedule(50ms, "conn-a", [&a]() { a++; });
    scheduler_.schedule(50ms, "conn-b", [&b]() { b++; });

    EXPECT_EQ(scheduler_.pendingCount("conn-a"), 2u);
    EXPECT_EQ(scheduler_.cancelGroup("conn-a"), 2u);
    EXPECT_EQ(scheduler_.pendingCount("conn-a"), 0u);
    EXPECT_EQ(scheduler_.pendingCount("conn-b"), 1u);

    EXPECT_TRUE(waitFor([&]() { return b.load() == 1; }));
    EXPECT_EQ(a.load(), 0);
}

TEST_F(SchedulerTest, CancelGroupWaitsForRunningCallback) {
    std::atomic<bool> entered{false};
    std::atomic<bool> finished{false};

    scheduler_.schedule(0ms, "conn", [&]() {
        entered = true;
        std::this_thread::sleep_for(100ms);
        finished = true;
    });

    ASSERT_TRUE(waitFor([&]() { return entered.load(); }));
    scheduler_.cancelGroup("conn");
    EXPECT_TRUE(finished.load());
}

TEST_F(SchedulerTest, CancelGroupFromOwnCallbackDoesNotDeadlock) {
    std::atomic<bool> done{false};
    std::atomic<int> later{0};

    scheduler_.schedule(0ms, "conn", [&]() {
        scheduler_.schedule(50ms, "conn", [&later]() { later++; });
        scheduler_.cancelGroup("conn");
        done = true;
    });

    EXPECT_TRUE(waitFor([&]() { return done.load(); }));
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(later.load(), 0);
}

TEST_F(SchedulerTest, ThrowingCallbackDoesNotStopTimerThread) {
    std::atomic<int> runs{0};
    scheduler_.schedule(0ms, "g", []() { throw std::runtime_error("boom"); });
    scheduler_.schedule(20ms, "g", [&runs]() { runs++; });

    EXPECT_TRUE(waitFor([&]() { return runs.load() == 1; }));
}

TEST_F(SchedulerTest, StoppedSchedulerRejects) {
    scheduler_.stop();
    EXPECT_FALSE(scheduler_.isRunning());
    EXPECT_EQ(scheduler_.schedule(0ms, "g", []() {}), kInvalidTimer);
}

TEST_F(SchedulerTest, StopDropsPendingTimers) {
    std::atomic<int> runs{0};
    scheduler_.schedule(200ms, "g", [&runs]() { runs++; });
    scheduler_.stop();

    EXPECT_EQ(scheduler_.pendingCount("g"), 0u);
    std::this_thread::sleep_for(250ms);
    EXPECT_EQ(runs.load(), 0);
}
