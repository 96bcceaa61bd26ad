/**
 * @file delivery_engine.hpp
 * @brief At-least-once delivery over live connections with offline queuing.
 *
 * The DeliveryEngine ties together:
 * - The ConnectionRegistry (who is connected, what is in flight where)
 * - The PendingQueue (what waits for a principal to come back)
 * - The SideStore mirror (what survives a process restart)
 * - The Scheduler (ack timeouts, retransmits, the liveness sweep)
 *
 * Transports report connection lifecycle and inbound frames to the engine;
 * applications call send() and receive terminal failures and delivery
 * receipts through the registered handlers.
 *
 * Side-store I/O never runs on the caller's thread: mirror writes and the
 * per-principal restore are posted, in order, to a store lane (a group on
 * the store scheduler), so a slow store delays durability, not delivery.
 *
 * @copyright Copyright (c) 2024 Courier Contributors
 * @license MIT License
 */

#pragma once

#include "courier/core/backoff.hpp"
#include "courier/core/connection_registry.hpp"
#include "courier/core/envelope.hpp"
#include "courier/core/export.hpp"
#include "courier/core/pending_queue.hpp"
#include "courier/core/scheduler.hpp"
#include "courier/core/side_store.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace courier {
namespace core {

/**
 * @struct DeliveryConfig
 * @brief Engine tunables.
 */
struct COURIER_CORE_API DeliveryConfig {
    std::chrono::milliseconds ack_timeout{30000};
    uint32_t max_retries = 3;
    ExponentialBackoff retry_backoff;

    /// Applied when SendOptions::ttl is zero. Zero here means never expire.
    std::chrono::milliseconds default_ttl{std::chrono::hours(24 * 7)};

    size_t queue_limit = 1000;

    std::chrono::milliseconds heartbeat_interval{30000};
    uint32_t heartbeat_max_missed = 3;

    /// Explicit envelope ids remembered for duplicate-emit suppression.
    size_t dedup_capacity = 10000;

    /// Most recently updated envelopes whose status() stays answerable.
    size_t status_capacity = 10000;

    /// After a side-store failure, skip the store for this long.
    std::chrono::milliseconds store_retry_interval{5000};

    std::string key_prefix = "courier";
};

/**
 * @enum FailureReason
 * @brief Why an envelope was given up on.
 */
enum class FailureReason {
    MAX_RETRIES,     ///< No ack after the last retry
    EXPIRED,         ///< Past its deadline before it could be delivered
    UNREACHABLE,     ///< Connection-targeted and the connection is gone
    QUEUE_OVERFLOW   ///< Evicted from a full pending queue
};

inline const char* failureReasonToString(FailureReason reason) {
    switch (reason) {
        case FailureReason::MAX_RETRIES: return "max_retries";
        case FailureReason::EXPIRED: return "expired";
        case FailureReason::UNREACHABLE: return "unreachable";
        case FailureReason::QUEUE_OVERFLOW: return "queue_overflow";
        default: return "unknown";
    }
}

/**
 * @enum DeliveryStatus
 * @brief Where an envelope currently stands.
 */
enum class DeliveryStatus {
    PENDING,    ///< Queued for an offline principal
    SENT,       ///< Handed to at least one connection, not yet acknowledged
    DELIVERED,  ///< Acknowledged
    FAILED      ///< Given up on, see FailureReason
};

inline const char* deliveryStatusToString(DeliveryStatus status) {
    switch (status) {
        case DeliveryStatus::PENDING: return "pending";
        case DeliveryStatus::SENT: return "sent";
        case DeliveryStatus::DELIVERED: return "delivered";
        case DeliveryStatus::FAILED: return "failed";
        default: return "unknown";
    }
}

/**
 * @brief Terminal failure notification passed to the application.
 */
struct COURIER_CORE_API DeliveryFailure {
    std::string envelope_id;
    std::string principal_id;
    std::string connection_id;
    std::string event;
    FailureReason reason = FailureReason::MAX_RETRIES;
    uint32_t retry_count = 0;
};

/**
 * @brief Delivery receipt: one per acknowledged envelope.
 */
struct COURIER_CORE_API DeliveryReceipt {
    std::string envelope_id;
    std::string principal_id;
    std::string connection_id;   ///< Connection the ack arrived on
    std::string event;
    int64_t delivered_at_ms = 0;
};

/**
 * @brief A client-originated event.
 */
struct COURIER_CORE_API InboundEvent {
    std::string connection_id;
    std::string principal_id;
    std::string envelope_id;
    std::string event;
    std::string payload;
};

/**
 * @brief What send() did with an envelope.
 */
struct COURIER_CORE_API SendResult {
    bool accepted = false;     ///< false: rejected, a failure was reported
    std::string envelope_id;
    size_t transmitted = 0;    ///< Connections the envelope went out on
    bool queued = false;       ///< Parked in the principal's pending queue
    bool duplicate = false;    ///< Explicit id seen before, nothing done
};

struct COURIER_CORE_API DeliveryStats {
    uint64_t sent = 0;
    uint64_t transmitted = 0;
    uint64_t retransmitted = 0;
    uint64_t acked = 0;
    uint64_t duplicate_acks = 0;
    uint64_t queued = 0;
    uint64_t drained = 0;
    uint64_t replayed = 0;
    uint64_t restored = 0;
    uint64_t failed = 0;
    uint64_t expired = 0;
    uint64_t inbound_events = 0;
    uint64_t stale_closed = 0;
    bool store_healthy = true;
    size_t store_backlog = 0;         ///< Mirror jobs not yet run
    size_t restored_principals = 0;   ///< Principals with a restore on record
    size_t tracked_statuses = 0;
    RegistryStats registry;
    PendingQueueStats queue;
};

/**
 * @class DeliveryEngine
 * @brief Reliable delivery core. Thread-safe.
 *
 * Usage:
 * @code
 * auto engine = std::make_shared<DeliveryEngine>(config, scheduler, store, storeLane);
 * engine->setFailureHandler([](const DeliveryFailure& f) { ... });
 * engine->setDeliveredHandler([](const DeliveryReceipt& r) { ... });
 * engine->start();
 *
 * // transport side
 * engine->connectionOpened(connId, sink);
 * engine->principalIdentified(connId, "user-42");
 * engine->ackReceived(connId, envelopeId);
 *
 * // application side
 * engine->send(Target::principal("user-42"), "message.new", payload);
 * @endcode
 */
class COURIER_CORE_API DeliveryEngine {
public:
    using FailureHandler = std::function<void(const DeliveryFailure&)>;
    using InboundHandler = std::function<void(const InboundEvent&)>;
    using DeliveredHandler = std::function<void(const DeliveryReceipt&)>;

    /**
     * @param store Durable mirror; nullptr runs memory-only.
     * @param store_scheduler Runs the store lane; nullptr shares @p scheduler.
     */
    DeliveryEngine(DeliveryConfig config,
                   std::shared_ptr<Scheduler> scheduler,
                   std::shared_ptr<SideStore> store = nullptr,
                   std::shared_ptr<Scheduler> store_scheduler = nullptr);
    ~DeliveryEngine();

    DeliveryEngine(const DeliveryEngine&) = delete;
    DeliveryEngine& operator=(const DeliveryEngine&) = delete;

    /**
     * @brief Start the periodic liveness sweep.
     */
    void start();

    /**
     * @brief Stop the sweep and cancel every connection's timers.
     *
     * Mirror writes already posted stay queued; see flushStore().
     */
    void stop();

    /**
     * @brief Wait until every mirror job posted so far has run.
     *
     * Must not be called from the store scheduler's own thread.
     * @return false if the lane did not catch up within @p timeout.
     */
    bool flushStore(std::chrono::milliseconds timeout);

    bool isRunning() const { return running_.load(); }

    void setFailureHandler(FailureHandler handler);
    void setInboundHandler(InboundHandler handler);
    void setDeliveredHandler(DeliveredHandler handler);

    // =========================================================================
    // Outbound
    // =========================================================================

    SendResult send(const Target& target,
                    const std::string& event,
                    const std::string& payload,
                    const SendOptions& options = SendOptions());

    // =========================================================================
    // Transport events
    // =========================================================================

    bool connectionOpened(const std::string& connection_id, std::shared_ptr<ConnectionSink> sink);
    void connectionClosed(const std::string& connection_id, const std::string& reason);

    /**
     * @brief Attribute the connection, restore anything mirrored for the
     *        principal, then deliver its pending queue in order.
     */
    bool principalIdentified(const std::string& connection_id, const std::string& principal_id);

    /**
     * @brief Idempotent. Unknown, repeated or late acks are no-ops.
     * @return true if this ack retired an in-flight envelope.
     */
    bool ackReceived(const std::string& connection_id, const std::string& envelope_id);

    void livenessResponseReceived(const std::string& connection_id);

    /**
     * @brief Client-initiated ping: counts as liveness and is answered with a pong.
     */
    void pingReceived(const std::string& connection_id, int64_t sent_at_ms);

    /**
     * @brief Re-send queued envelopes created after @p since_ms to this connection.
     * @return Number of envelopes transmitted.
     */
    size_t replayRequested(const std::string& connection_id, int64_t since_ms);

    /**
     * @brief Hand a client event to the inbound handler and acknowledge it.
     */
    bool inboundEvent(const std::string& connection_id,
                      const std::string& envelope_id,
                      const std::string& event,
                      const std::string& payload);

    // =========================================================================
    // Introspection
    // =========================================================================

    DeliveryStats stats() const;

    /**
     * @brief Last known status of an envelope.
     * @return nullopt for ids never seen or aged out of the status window.
     */
    std::optional<DeliveryStatus> status(const std::string& envelope_id) const;

    const DeliveryConfig& config() const { return config_; }
    const ConnectionRegistry& registry() const { return registry_; }
    const PendingQueue& pendingQueue() const { return queue_; }

    std::string inflightKey(const std::string& principal_id) const;
    std::string connectionInflightKey(const std::string& connection_id) const;
    std::string pendingKey(const std::string& principal_id) const;

    static constexpr const char* kLivenessGroup = "courier:liveness";

    /// Failure and delivery notifications are dispatched from the scheduler thread.
    static constexpr const char* kNotifyGroup = "courier:notifications";

    /// Mirror writes and restores, run in posting order on the store scheduler.
    static constexpr const char* kStoreGroup = "courier:store";

private:
    // Caller holds connection.mutex.
    bool transmitLocked(Connection& connection, Envelope envelope, int64_t now_ms);
    void armAckTimerLocked(Connection& connection, const std::string& envelope_id);

    void onAckTimeout(const std::string& connection_id, const std::string& envelope_id);
    void onRetransmit(const std::string& connection_id, const std::string& envelope_id);

    // Removes the envelope and its timers from every connection of the
    // principal except @p except_connection_id. With @p failure_reason set,
    // each connection that still carried it gets a delivery_failed frame.
    void settleAcrossConnections(const std::string& principal_id, const std::string& envelope_id,
                                 const std::string& except_connection_id, const char* failure_reason);
    void failInFlight(const Envelope& envelope, const std::string& connection_id,
                      FailureReason reason);

    // Caller holds the principal's stripe lock.
    void handOff(const std::string& connection_id, std::vector<Envelope> envelopes, int64_t now_ms);
    void queueForPrincipal(const std::string& principal_id, Envelope envelope, int64_t now_ms);
    size_t deliverToConnection(const std::string& connection_id, const std::string& principal_id,
                               std::vector<Envelope> envelopes, int64_t now_ms);
    size_t drainTo(const std::string& connection_id, const std::string& principal_id, int64_t now_ms);

    // Posts the restore once per principal; it runs on the store lane.
    void scheduleRestore(const std::string& principal_id, const std::string& connection_id);
    void restoreFromStore(const std::string& principal_id, const std::string& connection_id);
    std::string identifiedConnectionFor(const std::string& principal_id, const std::string& preferred) const;

    void livenessTick();
    void scheduleLivenessTick();
    void forceClose(const std::string& connection_id, const std::string& reason);

    Envelope makeEnvelope(const Target& target, const std::string& event,
                          const std::string& payload, const SendOptions& options, int64_t now_ms) const;
    bool rememberEnvelopeId(const std::string& envelope_id);
    void forgetEnvelopeId(const std::string& envelope_id);
    void recordStatus(const std::string& envelope_id, DeliveryStatus status);

    // Both dispatch asynchronously, so they are safe to call with locks held.
    void reportFailure(const Envelope& envelope, const std::string& connection_id, FailureReason reason);
    void reportDelivered(const Envelope& envelope, const std::string& connection_id, int64_t now_ms);

    // Durable mirror. mirrorPush / mirrorRemove only post to the store lane;
    // the write* and loadMirror bodies run there and degrade to a logged
    // no-op while the store is down.
    void postStoreJob(Scheduler::Task job);
    void mirrorPush(const std::string& key, std::vector<Envelope> envelopes);
    void mirrorRemove(const std::string& key, std::unordered_set<std::string> envelope_ids);
    void writePush(const std::string& key, const std::vector<Envelope>& envelopes);
    void writeRemove(const std::string& key, const std::unordered_set<std::string>& envelope_ids);
    std::optional<std::vector<Envelope>> loadMirror(const std::string& key);
    bool storeUsable(int64_t now_ms) const;
    void noteStoreResult(bool ok, const char* operation, int64_t now_ms);

    std::mutex& stripeFor(const std::string& principal_id);

    const DeliveryConfig config_;
    std::shared_ptr<Scheduler> scheduler_;
    std::shared_ptr<SideStore> store_;
    std::shared_ptr<Scheduler> store_scheduler_;

    ConnectionRegistry registry_;
    PendingQueue queue_;

    // Serializes send / drain / hand-off per principal so a drain always
    // completes before newer traffic for the same principal goes out.
    std::array<std::mutex, 64> stripes_;

    mutable std::mutex handler_mutex_;
    FailureHandler failure_handler_;
    InboundHandler inbound_handler_;
    DeliveredHandler delivered_handler_;

    // Recency lists: front is the oldest entry, evicted first.
    std::mutex dedup_mutex_;
    std::list<std::string> seen_order_;
    std::unordered_map<std::string, std::list<std::string>::iterator> seen_ids_;

    struct StatusEntry {
        DeliveryStatus status;
        std::list<std::string>::iterator position;
    };
    mutable std::mutex status_mutex_;
    std::list<std::string> status_order_;
    std::unordered_map<std::string, StatusEntry> statuses_;

    // Principals whose mirror was restored; dropped when the last connection closes.
    mutable std::mutex restored_mutex_;
    std::unordered_set<std::string> restored_principals_;

    std::atomic<bool> store_healthy_{true};
    std::atomic<int64_t> store_retry_at_ms_{0};

    std::atomic<bool> running_{false};

    std::atomic<uint64_t> sent_{0};
    std::atomic<uint64_t> transmitted_{0};
    std::atomic<uint64_t> retransmitted_{0};
    std::atomic<uint64_t> acked_{0};
    std::atomic<uint64_t> duplicate_acks_{0};
    std::atomic<uint64_t> queued_{0};
    std::atomic<uint64_t> drained_{0};
    std::atomic<uint64_t> replayed_{0};
    std::atomic<uint64_t> restored_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> expired_{0};
    std::atomic<uint64_t> inbound_events_{0};
    std::atomic<uint64_t> stale_closed_{0};
};

}  // namespace core
}  // namespace courier
