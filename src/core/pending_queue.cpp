/**
 * @file pending_queue.cpp
 * @brief PendingQueue implementation.
 *
 * @copyright Copyright (c) 2024 Courier Contributors
 * @license MIT License
 */

#include "courier/core/pending_queue.hpp"
#include "courier/utils/logger.hpp"

#include <algorithm>

namespace courier {
namespace core {

PendingQueue::PendingQueue(size_t limit)
    : limit_(limit)
{}

std::shared_ptr<PendingQueue::PrincipalQueue> PendingQueue::find(const std::string& principal_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = queues_.find(principal_id);
    return it == queues_.end() ? nullptr : it->second;
}

void PendingQueue::dropIfEmpty(const std::string& principal_id) {
    // A concurrent enqueue holds the shared map lock for its whole append,
    // so an emptied bucket cannot be refilled between the check and the erase.
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = queues_.find(principal_id);
    if (it == queues_.end()) {
        return;
    }
    std::lock_guard<std::mutex> qlock(it->second->mutex);
    if (it->second->entries.empty()) {
        queues_.erase(it);
    }
}

void PendingQueue::noteDepth(size_t depth) {
    size_t current = high_watermark_.load();
    while (depth > current && !high_watermark_.compare_exchange_weak(current, depth)) {
    }
}

EnqueueOutcome PendingQueue::enqueue(const std::string& principal_id, Envelope envelope, int64_t now_ms) {
    if (envelope.isExpired(now_ms)) {
        expired_++;
        EnqueueOutcome outcome;
        outcome.result = EnqueueResult::EXPIRED;
        return outcome;
    }

    // The map lock is held for the whole append so drain() can safely drop
    // an emptied bucket without racing a writer that already looked it up.
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = queues_.find(principal_id);
        if (it != queues_.end()) {
            return appendLocked(*it->second, principal_id, std::move(envelope));
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& slot = queues_[principal_id];
    if (!slot) {
        slot = std::make_shared<PrincipalQueue>();
    }
    return appendLocked(*slot, principal_id, std::move(envelope));
}

EnqueueOutcome PendingQueue::appendLocked(PrincipalQueue& queue, const std::string& principal_id,
                                          Envelope envelope) {
    EnqueueOutcome outcome;
    std::lock_guard<std::mutex> lock(queue.mutex);

    for (const auto& queued : queue.entries) {
        if (queued.envelope_id == envelope.envelope_id) {
            outcome.result = EnqueueResult::DUPLICATE;
            return outcome;
        }
    }

    if (limit_ > 0 && queue.entries.size() >= limit_) {
        outcome.evicted = std::move(queue.entries.front());
        queue.entries.pop_front();
        outcome.result = EnqueueResult::EVICTED_OLDEST;
        evicted_oldest_++;
        LOG_WARN("PendingQueue", "Queue for {} full ({}), evicted oldest envelope {}",
                 principal_id, limit_, outcome.evicted->envelope_id);
    }

    queue.entries.push_back(std::move(envelope));
    total_enqueued_++;
    noteDepth(queue.entries.size());
    return outcome;
}

std::vector<Envelope> PendingQueue::drain(const std::string& principal_id, int64_t now_ms,
                                          std::vector<Envelope>* expired) {
    std::vector<Envelope> result;
    auto queue = find(principal_id);
    if (!queue) {
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(queue->mutex);
        result.reserve(queue->entries.size());
        for (auto& envelope : queue->entries) {
            if (envelope.isExpired(now_ms)) {
                expired_++;
                if (expired) {
                    expired->push_back(std::move(envelope));
                }
                continue;
            }
            result.push_back(std::move(envelope));
        }
        queue->entries.clear();
    }

    dropIfEmpty(principal_id);

    total_drained_ += result.size();
    if (!result.empty()) {
        LOG_DEBUG("PendingQueue", "Drained {} envelopes for {}", result.size(), principal_id);
    }
    return result;
}

std::vector<Envelope> PendingQueue::requestSince(const std::string& principal_id, int64_t since_ms,
                                                 int64_t now_ms) const {
    std::vector<Envelope> result;
    auto queue = find(principal_id);
    if (!queue) {
        return result;
    }

    std::lock_guard<std::mutex> lock(queue->mutex);
    for (const auto& envelope : queue->entries) {
        if (envelope.created_at_ms > since_ms && !envelope.isExpired(now_ms)) {
            result.push_back(envelope);
        }
    }
    return result;
}

bool PendingQueue::remove(const std::string& principal_id, const std::string& envelope_id) {
    auto queue = find(principal_id);
    if (!queue) {
        return false;
    }

    bool emptied = false;
    {
        std::lock_guard<std::mutex> lock(queue->mutex);
        auto it = std::find_if(queue->entries.begin(), queue->entries.end(),
                               [&](const Envelope& e) { return e.envelope_id == envelope_id; });
        if (it == queue->entries.end()) {
            return false;
        }
        queue->entries.erase(it);
        emptied = queue->entries.empty();
    }

    if (emptied) {
        dropIfEmpty(principal_id);
    }
    return true;
}

bool PendingQueue::contains(const std::string& principal_id, const std::string& envelope_id) const {
    auto queue = find(principal_id);
    if (!queue) {
        return false;
    }

    std::lock_guard<std::mutex> lock(queue->mutex);
    return std::any_of(queue->entries.begin(), queue->entries.end(),
                       [&](const Envelope& e) { return e.envelope_id == envelope_id; });
}

size_t PendingQueue::size(const std::string& principal_id) const {
    auto queue = find(principal_id);
    if (!queue) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(queue->mutex);
    return queue->entries.size();
}

std::vector<Envelope> PendingQueue::reapExpired(int64_t now_ms) {
    std::vector<std::pair<std::string, std::shared_ptr<PrincipalQueue>>> snapshot;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        snapshot.reserve(queues_.size());
        for (const auto& [principal, queue] : queues_) {
            snapshot.emplace_back(principal, queue);
        }
    }

    std::vector<Envelope> reaped;
    std::vector<std::string> emptied;
    for (auto& [principal, queue] : snapshot) {
        std::lock_guard<std::mutex> lock(queue->mutex);
        auto keep = std::stable_partition(queue->entries.begin(), queue->entries.end(),
                                          [&](const Envelope& e) { return !e.isExpired(now_ms); });
        for (auto it = keep; it != queue->entries.end(); ++it) {
            reaped.push_back(std::move(*it));
        }
        queue->entries.erase(keep, queue->entries.end());
        if (queue->entries.empty()) {
            emptied.push_back(principal);
        }
    }

    for (const auto& principal : emptied) {
        dropIfEmpty(principal);
    }

    expired_ += reaped.size();
    if (!reaped.empty()) {
        LOG_DEBUG("PendingQueue", "Reaped {} expired envelopes", reaped.size());
    }
    return reaped;
}

size_t PendingQueue::principalCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return queues_.size();
}

PendingQueueStats PendingQueue::stats() const {
    PendingQueueStats stats;
    stats.limit = limit_;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& [principal, queue] : queues_) {
            std::lock_guard<std::mutex> qlock(queue->mutex);
            if (!queue->entries.empty()) {
                stats.principals++;
                stats.total_depth += queue->entries.size();
            }
        }
    }
    stats.high_watermark = high_watermark_.load();
    stats.total_enqueued = total_enqueued_.load();
    stats.total_drained = total_drained_.load();
    stats.evicted_oldest = evicted_oldest_.load();
    stats.expired = expired_.load();
    return stats;
}

}  // namespace core
}  // namespace courier
