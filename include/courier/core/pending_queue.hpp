/**
 * @file pending_queue.hpp
 * @brief Per-principal bounded backlog of envelopes awaiting a live connection.
 *
 * Queued order is preserved. When a principal's queue is full the oldest
 * entry is evicted to make room; every entry expires on its own deadline.
 *
 * @copyright Copyright (c) 2024 Courier Contributors
 * @license MIT License
 */

#pragma once

#include "courier/core/envelope.hpp"
#include "courier/core/export.hpp"

#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace courier {
namespace core {

/**
 * @brief Result of an enqueue operation.
 */
enum class EnqueueResult {
    ENQUEUED,        ///< Appended
    EVICTED_OLDEST,  ///< Appended after evicting the oldest entry
    DUPLICATE,       ///< Envelope id already queued for this principal
    EXPIRED          ///< Already past its deadline, not queued
};

struct EnqueueOutcome {
    EnqueueResult result = EnqueueResult::ENQUEUED;
    std::optional<Envelope> evicted;
};

/**
 * @brief Aggregate statistics across all principals.
 */
struct PendingQueueStats {
    size_t principals = 0;
    size_t total_depth = 0;
    size_t limit = 0;
    size_t high_watermark = 0;
    uint64_t total_enqueued = 0;
    uint64_t total_drained = 0;
    uint64_t evicted_oldest = 0;
    uint64_t expired = 0;
};

/**
 * @class PendingQueue
 * @brief Thread-safe map of principal -> bounded FIFO.
 *
 * Usage:
 * @code
 * PendingQueue queue(1000);
 * queue.enqueue("user-42", envelope, now);
 * for (auto& env : queue.drain("user-42", now)) { ... }
 * @endcode
 */
class COURIER_CORE_API PendingQueue {
public:
    /**
     * @param limit Maximum entries per principal (0 = unlimited).
     */
    explicit PendingQueue(size_t limit = 1000);

    PendingQueue(const PendingQueue&) = delete;
    PendingQueue& operator=(const PendingQueue&) = delete;

    EnqueueOutcome enqueue(const std::string& principal_id, Envelope envelope, int64_t now_ms);

    /**
     * @brief Remove and return every non-expired entry in queued order.
     * @param expired When non-null, receives entries dropped for expiry.
     */
    std::vector<Envelope> drain(const std::string& principal_id, int64_t now_ms,
                                std::vector<Envelope>* expired = nullptr);

    /**
     * @brief Non-destructive read of non-expired entries created after @p since_ms.
     */
    std::vector<Envelope> requestSince(const std::string& principal_id, int64_t since_ms,
                                       int64_t now_ms) const;

    bool remove(const std::string& principal_id, const std::string& envelope_id);
    bool contains(const std::string& principal_id, const std::string& envelope_id) const;
    size_t size(const std::string& principal_id) const;

    /**
     * @brief Drop expired entries across all principals.
     * @return The dropped envelopes.
     */
    std::vector<Envelope> reapExpired(int64_t now_ms);

    PendingQueueStats stats() const;
    size_t limit() const { return limit_; }

    /// Principals with a bucket allocated. Buckets are dropped once empty.
    size_t principalCount() const;

private:
    struct PrincipalQueue {
        mutable std::mutex mutex;
        std::deque<Envelope> entries;
    };

    std::shared_ptr<PrincipalQueue> find(const std::string& principal_id) const;
    EnqueueOutcome appendLocked(PrincipalQueue& queue, const std::string& principal_id,
                                Envelope envelope);
    void dropIfEmpty(const std::string& principal_id);
    void noteDepth(size_t depth);

    const size_t limit_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<PrincipalQueue>> queues_;

    std::atomic<uint64_t> total_enqueued_{0};
    std::atomic<uint64_t> total_drained_{0};
    std::atomic<uint64_t> evicted_oldest_{0};
    std::atomic<uint64_t> expired_{0};
    std::atomic<size_t> high_watermark_{0};
};

}  // namespace core
}  // namespace courier
