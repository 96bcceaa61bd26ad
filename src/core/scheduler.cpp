/**
 * @file scheduler.cpp
 * @brief ThreadedScheduler implementation.
 *
 * @copyright Copyright (c) 2024 Courier Contributors
 * @license MIT License
 */

#include "courier/core/scheduler.hpp"
#include "courier/utils/clock.hpp"
#include "courier/utils/logger.hpp"

#include <exception>

namespace courier {
namespace core {

ThreadedScheduler::ThreadedScheduler() = default;

ThreadedScheduler::~ThreadedScheduler() {
    stop();
}

void ThreadedScheduler::start() {
    if (running_.exchange(true)) {
        return;
    }
    thread_ = std::thread(&ThreadedScheduler::run, this);
    LOG_DEBUG("Scheduler", "Timer thread started");
}

void ThreadedScheduler::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    size_t dropped = entries_.size();
    deadlines_.clear();
    entries_.clear();
    groups_.clear();
    LOG_DEBUG("Scheduler", "Timer thread stopped ({} pending timers dropped)", dropped);
}

TimerId ThreadedScheduler::schedule(std::chrono::milliseconds delay,
                                    const std::string& group,
                                    Task task) {
    if (!running_.load()) {
        LOG_WARN("Scheduler", "schedule() on stopped scheduler (group {})", group);
        return kInvalidTimer;
    }
    if (delay.count() < 0) {
        delay = std::chrono::milliseconds(0);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    TimerId id = next_id_++;
    Entry entry;
    entry.deadline = Clock::now() + delay;
    entry.group = group;
    entry.task = std::move(task);

    deadlines_.emplace(entry.deadline, id);
    groups_[group].insert(id);
    entries_.emplace(id, std::move(entry));

    cv_.notify_one();
    return id;
}

bool ThreadedScheduler::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.find(id) == entries_.end()) {
        return false;
    }
    eraseLocked(id);
    return true;
}

size_t ThreadedScheduler::cancelGroup(const std::string& group) {
    std::unique_lock<std::mutex> lock(mutex_);

    // A callback of this group may be mid-flight; let it finish first so it
    // cannot re-arm a timer after we return. The timer thread itself would
    // deadlock here, so it skips the wait.
    if (std::this_thread::get_id() != thread_.get_id()) {
        idle_cv_.wait(lock, [&]() {
            return !callback_running_ || running_group_ != group;
        });
    }

    auto it = groups_.find(group);
    if (it == groups_.end()) {
        return 0;
    }

    auto ids = it->second;
    for (TimerId id : ids) {
        eraseLocked(id);
    }
    return ids.size();
}

size_t ThreadedScheduler::pendingCount(const std::string& group) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = groups_.find(group);
    return it == groups_.end() ? 0 : it->second.size();
}

int64_t ThreadedScheduler::nowMs() const {
    return utils::epochMillis();
}

void ThreadedScheduler::eraseLocked(TimerId id) {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return;
    }

    auto range = deadlines_.equal_range(it->second.deadline);
    for (auto d = range.first; d != range.second; ++d) {
        if (d->second == id) {
            deadlines_.erase(d);
            break;
        }
    }

    auto g = groups_.find(it->second.group);
    if (g != groups_.end()) {
        g->second.erase(id);
        if (g->second.empty()) {
            groups_.erase(g);
        }
    }

    entries_.erase(it);
}

void ThreadedScheduler::run() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (running_.load()) {
        if (deadlines_.empty()) {
            cv_.wait(lock, [this]() {
                return !running_.load() || !deadlines_.empty();
            });
            continue;
        }

        auto next = deadlines_.begin();
        if (next->first > Clock::now()) {
            cv_.wait_until(lock, next->first);
            continue;
        }

        TimerId id = next->second;
        auto it = entries_.find(id);
        Task task = std::move(it->second.task);
        running_group_ = it->second.group;
        callback_running_ = true;
        eraseLocked(id);

        lock.unlock();
        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("Scheduler", "Timer callback in group {} threw: {}", running_group_, e.what());
        }
        lock.lock();

        callback_running_ = false;
        running_group_.clear();
        idle_cv_.notify_all();
    }
}

}  // namespace core
}  // namespace courier
