/**
 * @file scheduler.hpp
 * @brief Cancellable timers with group-keyed cancellation.
 *
 * Every timer belongs to a group (a connection-id, a supervisor instance, the
 * liveness sweep). Tearing a connection down cancels its whole group, so no
 * retry or heartbeat callback outlives the connection it was armed for.
 *
 * @copyright Copyright (c) 2024 Courier Contributors
 * @license MIT License
 */

#pragma once

#include "courier/core/export.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>

namespace courier {
namespace core {

using TimerId = uint64_t;

/// Never returned by schedule().
constexpr TimerId kInvalidTimer = 0;

/**
 * @class Scheduler
 * @brief Abstract timer service. Injected so tests can drive time by hand.
 */
class COURIER_CORE_API Scheduler {
public:
    using Task = std::function<void()>;

    virtual ~Scheduler() = default;

    /**
     * @brief Run @p task once after @p delay.
     * @param group Cancellation group the timer belongs to.
     * @return Timer id, or kInvalidTimer if the scheduler is stopped.
     */
    virtual TimerId schedule(std::chrono::milliseconds delay,
                             const std::string& group,
                             Task task) = 0;

    /**
     * @brief Cancel one pending timer. Does not wait for a running callback.
     * @return true if the timer was still pending.
     */
    virtual bool cancel(TimerId id) = 0;

    /**
     * @brief Cancel every pending timer of a group.
     *
     * When a callback of the group is running on another thread, waits for it
     * to return before cancelling.
     *
     * @return Number of timers removed.
     */
    virtual size_t cancelGroup(const std::string& group) = 0;

    /**
     * @brief Number of pending timers in a group.
     */
    virtual size_t pendingCount(const std::string& group) const = 0;

    /**
     * @brief Current time in epoch milliseconds as seen by this scheduler.
     */
    virtual int64_t nowMs() const = 0;
};

/**
 * @class ThreadedScheduler
 * @brief Scheduler backed by one dedicated timer thread.
 *
 * Callbacks run sequentially on the timer thread, never on the caller's.
 */
class COURIER_CORE_API ThreadedScheduler : public Scheduler {
public:
    ThreadedScheduler();
    ~ThreadedScheduler() override;

    ThreadedScheduler(const ThreadedScheduler&) = delete;
    ThreadedScheduler& operator=(const ThreadedScheduler&) = delete;

    void start();

    /**
     * @brief Stop the timer thread. Pending timers are discarded.
     */
    void stop();

    bool isRunning() const { return running_.load(); }

    TimerId schedule(std::chrono::milliseconds delay,
                     const std::string& group,
                     Task task) override;
    bool cancel(TimerId id) override;
    size_t cancelGroup(const std::string& group) override;
    size_t pendingCount(const std::string& group) const override;
    int64_t nowMs() const override;

private:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        Clock::time_point deadline;
        std::string group;
        Task task;
    };

    void run();
    void eraseLocked(TimerId id);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;

    std::multimap<Clock::time_point, TimerId> deadlines_;
    std::unordered_map<TimerId, Entry> entries_;
    std::unordered_map<std::string, std::unordered_set<TimerId>> groups_;

    TimerId next_id_ = 1;
    std::string running_group_;
    bool callback_running_ = false;

    std::atomic<bool> running_{false};
    std::thread thread_;
};

}  // namespace core
}  // namespace courier
