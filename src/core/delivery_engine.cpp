/**
 * @file delivery_engine.cpp
 * @brief DeliveryEngine implementation.
 *
 * @copyright Copyright (c) 2024 Courier Contributors
 * @license MIT License
 */

#include "courier/core/delivery_engine.hpp"
#include "courier/utils/logger.hpp"
#include "courier/utils/uuid.hpp"

#include <algorithm>
#include <exception>
#include <functional>
#include <future>

namespace courier {
namespace core {

DeliveryEngine::DeliveryEngine(DeliveryConfig config,
                               std::shared_ptr<Scheduler> scheduler,
                               std::shared_ptr<SideStore> store,
                               std::shared_ptr<Scheduler> store_scheduler)
    : config_(std::move(config))
    , scheduler_(std::move(scheduler))
    , store_(std::move(store))
    , store_scheduler_(store_scheduler ? std::move(store_scheduler) : scheduler_)
    , queue_(config_.queue_limit)
{}

DeliveryEngine::~DeliveryEngine() {
    stop();
    size_t dropped = store_scheduler_->cancelGroup(kStoreGroup);
    if (dropped > 0) {
        LOG_WARN("Engine", "{} mirror writes dropped at shutdown", dropped);
    }
}

void DeliveryEngine::start() {
    if (running_.exchange(true)) {
        return;
    }

    LOG_INFO("Engine", "Started (ack timeout {}ms, max retries {}, heartbeat {}ms x{}, queue limit {}, store {})",
             config_.ack_timeout.count(), config_.max_retries,
             config_.heartbeat_interval.count(), config_.heartbeat_max_missed,
             config_.queue_limit, store_ ? store_->describe() : "none");
    scheduleLivenessTick();
}

void DeliveryEngine::stop() {
    bool was_running = running_.exchange(false);

    scheduler_->cancelGroup(kLivenessGroup);
    for (const auto& connection_id : registry_.connectionIds()) {
        scheduler_->cancelGroup(connection_id);
    }
    scheduler_->cancelGroup(kNotifyGroup);

    if (was_running) {
        LOG_INFO("Engine", "Stopped ({} connections still registered)", registry_.size());
    }
}

void DeliveryEngine::setFailureHandler(FailureHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    failure_handler_ = std::move(handler);
}

void DeliveryEngine::setInboundHandler(InboundHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    inbound_handler_ = std::move(handler);
}

void DeliveryEngine::setDeliveredHandler(DeliveredHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    delivered_handler_ = std::move(handler);
}

bool DeliveryEngine::flushStore(std::chrono::milliseconds timeout) {
    if (!store_) {
        return true;
    }

    auto done = std::make_shared<std::promise<void>>();
    auto future = done->get_future();
    TimerId marker = store_scheduler_->schedule(std::chrono::milliseconds(0), kStoreGroup,
                                                [done]() { done->set_value(); });
    if (marker == kInvalidTimer) {
        return false;
    }
    if (future.wait_for(timeout) != std::future_status::ready) {
        LOG_WARN("Engine", "Side-store lane still has {} jobs after {}ms",
                 store_scheduler_->pendingCount(kStoreGroup), timeout.count());
        return false;
    }
    return true;
}

std::mutex& DeliveryEngine::stripeFor(const std::string& principal_id) {
    return stripes_[std::hash<std::string>{}(principal_id) % stripes_.size()];
}

// =============================================================================
// Keys
// =============================================================================

std::string DeliveryEngine::inflightKey(const std::string& principal_id) const {
    return config_.key_prefix + ":inflight:" + principal_id;
}

std::string DeliveryEngine::connectionInflightKey(const std::string& connection_id) const {
    return config_.key_prefix + ":inflight:conn:" + connection_id;
}

std::string DeliveryEngine::pendingKey(const std::string& principal_id) const {
    return config_.key_prefix + ":pending:" + principal_id;
}

// =============================================================================
// Outbound
// =============================================================================

Envelope DeliveryEngine::makeEnvelope(const Target& target, const std::string& event,
                                      const std::string& payload, const SendOptions& options,
                                      int64_t now_ms) const {
    Envelope envelope;
    envelope.envelope_id = options.envelope_id.empty() ? utils::UUIDGenerator::generate()
                                                       : options.envelope_id;
    envelope.event = event;
    envelope.payload = payload;
    envelope.created_at_ms = now_ms;
    envelope.requires_ack = options.requires_ack;
    envelope.priority = options.priority;
    envelope.max_retries = options.max_retries.value_or(config_.max_retries);

    auto ttl = options.ttl.count() > 0 ? options.ttl : config_.default_ttl;
    envelope.expires_at_ms = ttl.count() > 0 ? now_ms + ttl.count() : 0;

    if (target.kind == Target::Kind::PRINCIPAL) {
        envelope.principal_id = target.id;
    }
    return envelope;
}

bool DeliveryEngine::rememberEnvelopeId(const std::string& envelope_id) {
    std::lock_guard<std::mutex> lock(dedup_mutex_);
    if (seen_ids_.count(envelope_id) > 0) {
        return false;
    }
    seen_order_.push_back(envelope_id);
    seen_ids_.emplace(envelope_id, std::prev(seen_order_.end()));
    while (seen_order_.size() > config_.dedup_capacity) {
        seen_ids_.erase(seen_order_.front());
        seen_order_.pop_front();
    }
    return true;
}

void DeliveryEngine::forgetEnvelopeId(const std::string& envelope_id) {
    std::lock_guard<std::mutex> lock(dedup_mutex_);
    auto it = seen_ids_.find(envelope_id);
    if (it == seen_ids_.end()) {
        return;
    }
    seen_order_.erase(it->second);
    seen_ids_.erase(it);
}

void DeliveryEngine::recordStatus(const std::string& envelope_id, DeliveryStatus status) {
    if (config_.status_capacity == 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(status_mutex_);
    auto it = statuses_.find(envelope_id);
    if (it != statuses_.end()) {
        it->second.status = status;
        status_order_.splice(status_order_.end(), status_order_, it->second.position);
        return;
    }

    status_order_.push_back(envelope_id);
    statuses_.emplace(envelope_id, StatusEntry{status, std::prev(status_order_.end())});
    while (status_order_.size() > config_.status_capacity) {
        statuses_.erase(status_order_.front());
        status_order_.pop_front();
    }
}

std::optional<DeliveryStatus> DeliveryEngine::status(const std::string& envelope_id) const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    auto it = statuses_.find(envelope_id);
    if (it == statuses_.end()) {
        return std::nullopt;
    }
    return it->second.status;
}

SendResult DeliveryEngine::send(const Target& target,
                                const std::string& event,
                                const std::string& payload,
                                const SendOptions& options) {
    SendResult result;
    const int64_t now = scheduler_->nowMs();

    if (target.id.empty()) {
        LOG_WARN("Engine", "send({}) with empty target rejected", event);
        return result;
    }

    if (!options.envelope_id.empty() && !rememberEnvelopeId(options.envelope_id)) {
        LOG_DEBUG("Engine", "Duplicate emit of {} suppressed", options.envelope_id);
        result.accepted = true;
        result.duplicate = true;
        result.envelope_id = options.envelope_id;
        return result;
    }

    Envelope envelope = makeEnvelope(target, event, payload, options, now);
    result.envelope_id = envelope.envelope_id;
    sent_++;

    if (target.kind == Target::Kind::CONNECTION) {
        auto connection = registry_.find(target.id);
        std::string principal_id;
        if (connection) {
            std::lock_guard<std::mutex> clock(connection->mutex);
            principal_id = connection->principal_id;
        }

        bool taken = false;
        if (connection) {
            std::lock_guard<std::mutex> slock(stripeFor(principal_id));
            std::lock_guard<std::mutex> clock(connection->mutex);
            taken = transmitLocked(*connection, envelope, now);
            // Posted under the connection lock so the ack's removal queues behind it.
            if (taken && envelope.requires_ack) {
                mirrorPush(connectionInflightKey(target.id), {envelope});
            }
        }

        if (!taken) {
            LOG_DEBUG("Engine", "Connection {} unreachable for envelope {}", target.id, envelope.envelope_id);
            reportFailure(envelope, target.id, FailureReason::UNREACHABLE);
            return result;
        }

        result.accepted = true;
        result.transmitted = 1;
        return result;
    }

    const std::string& principal_id = target.id;
    std::lock_guard<std::mutex> slock(stripeFor(principal_id));

    for (const auto& connection_id : registry_.findByPrincipal(principal_id)) {
        auto connection = registry_.find(connection_id);
        if (!connection) {
            continue;
        }
        std::lock_guard<std::mutex> clock(connection->mutex);
        if (connection->state != ConnectionState::IDENTIFIED) {
            continue;
        }
        if (!transmitLocked(*connection, envelope, now)) {
            continue;
        }
        if (result.transmitted == 0 && envelope.requires_ack) {
            mirrorPush(inflightKey(principal_id), {envelope});
        }
        result.transmitted++;
    }

    result.accepted = true;
    if (result.transmitted > 0) {
        LOG_DEBUG("Engine", "Envelope {} ({}) sent to {} on {} connection(s)",
                  envelope.envelope_id, event, principal_id, result.transmitted);
        return result;
    }

    queueForPrincipal(principal_id, envelope, now);
    result.queued = queue_.contains(principal_id, envelope.envelope_id);
    return result;
}

bool DeliveryEngine::transmitLocked(Connection& connection, Envelope envelope, int64_t now_ms) {
    if (connection.state == ConnectionState::STALE || connection.state == ConnectionState::CLOSED) {
        return false;
    }

    bool ok = connection.sink->sendEnvelope(envelope, now_ms);
    if (ok || envelope.requires_ack) {
        recordStatus(envelope.envelope_id, DeliveryStatus::SENT);
    }
    if (ok) {
        transmitted_++;
    } else {
        LOG_DEBUG("Engine", "Transport refused envelope {} on {}", envelope.envelope_id,
                  connection.connection_id);
    }

    if (!envelope.requires_ack) {
        return ok;
    }

    // Tracked even when the write failed: the transport is closing and the
    // close path hands the in-flight set off.
    std::string envelope_id = envelope.envelope_id;
    if (Envelope* existing = connection.findInFlight(envelope_id)) {
        existing->retry_count = envelope.retry_count;
    } else {
        connection.in_flight.push_back(std::move(envelope));
    }
    armAckTimerLocked(connection, envelope_id);
    return true;
}

void DeliveryEngine::armAckTimerLocked(Connection& connection, const std::string& envelope_id) {
    auto existing = connection.timers.find(envelope_id);
    if (existing != connection.timers.end()) {
        scheduler_->cancel(existing->second);
    }

    std::string connection_id = connection.connection_id;
    connection.timers[envelope_id] = scheduler_->schedule(
        config_.ack_timeout, connection_id,
        [this, connection_id, envelope_id]() { onAckTimeout(connection_id, envelope_id); });
}

// =============================================================================
// Retry path
// =============================================================================

void DeliveryEngine::onAckTimeout(const std::string& connection_id, const std::string& envelope_id) {
    auto connection = registry_.find(connection_id);
    if (!connection) {
        return;
    }

    const int64_t now = scheduler_->nowMs();
    Envelope failed;
    FailureReason reason = FailureReason::MAX_RETRIES;
    {
        std::lock_guard<std::mutex> clock(connection->mutex);
        if (connection->state == ConnectionState::CLOSED) {
            return;
        }
        connection->timers.erase(envelope_id);

        Envelope* envelope = connection->findInFlight(envelope_id);
        if (!envelope) {
            return;
        }

        if (envelope->isExpired(now)) {
            reason = FailureReason::EXPIRED;
        } else if (envelope->retry_count < envelope->max_retries) {
            envelope->retry_count++;
            auto delay = config_.retry_backoff.delayFor(envelope->retry_count);
            LOG_DEBUG("Engine", "No ack for {} on {}, retry {}/{} in {}ms",
                      envelope_id, connection_id, envelope->retry_count, envelope->max_retries, delay.count());
            connection->timers[envelope_id] = scheduler_->schedule(
                delay, connection_id,
                [this, connection_id, envelope_id]() { onRetransmit(connection_id, envelope_id); });
            return;
        } else {
            connection->sink->sendDeliveryFailed(envelope_id, failureReasonToString(reason));
        }

        failed = *envelope;
        connection->eraseInFlight(envelope_id);
    }

    failInFlight(failed, connection_id, reason);
}

void DeliveryEngine::onRetransmit(const std::string& connection_id, const std::string& envelope_id) {
    auto connection = registry_.find(connection_id);
    if (!connection) {
        return;
    }

    const int64_t now = scheduler_->nowMs();
    Envelope expired;
    {
        std::lock_guard<std::mutex> clock(connection->mutex);
        if (connection->state == ConnectionState::CLOSED) {
            return;
        }
        connection->timers.erase(envelope_id);

        Envelope* envelope = connection->findInFlight(envelope_id);
        if (!envelope) {
            return;
        }

        if (!envelope->isExpired(now)) {
            connection->sink->sendEnvelope(*envelope, now);
            retransmitted_++;
            armAckTimerLocked(*connection, envelope_id);
            return;
        }

        expired = *envelope;
        connection->eraseInFlight(envelope_id);
    }

    failInFlight(expired, connection_id, FailureReason::EXPIRED);
}

void DeliveryEngine::failInFlight(const Envelope& envelope, const std::string& connection_id,
                                  FailureReason reason) {
    if (envelope.principal_id.empty()) {
        mirrorRemove(connectionInflightKey(connection_id), {envelope.envelope_id});
        reportFailure(envelope, connection_id, reason);
        return;
    }

    // The envelope fails once, not once per connection that carried it.
    settleAcrossConnections(envelope.principal_id, envelope.envelope_id, connection_id,
                            reason == FailureReason::MAX_RETRIES ? failureReasonToString(reason) : nullptr);
    queue_.remove(envelope.principal_id, envelope.envelope_id);
    mirrorRemove(inflightKey(envelope.principal_id), {envelope.envelope_id});
    reportFailure(envelope, connection_id, reason);
}

void DeliveryEngine::settleAcrossConnections(const std::string& principal_id, const std::string& envelope_id,
                                             const std::string& except_connection_id,
                                             const char* failure_reason) {
    for (const auto& id : registry_.findByPrincipal(principal_id)) {
        if (id == except_connection_id) {
            continue;
        }
        auto other = registry_.find(id);
        if (!other) {
            continue;
        }
        std::lock_guard<std::mutex> clock(other->mutex);
        if (!other->eraseInFlight(envelope_id)) {
            continue;
        }
        auto timer = other->timers.find(envelope_id);
        if (timer != other->timers.end()) {
            scheduler_->cancel(timer->second);
            other->timers.erase(timer);
        }
        if (failure_reason && other->state != ConnectionState::CLOSED) {
            other->sink->sendDeliveryFailed(envelope_id, failure_reason);
        }
    }
}

// =============================================================================
// Queuing and hand-off
// =============================================================================

void DeliveryEngine::queueForPrincipal(const std::string& principal_id, Envelope envelope, int64_t now_ms) {
    auto outcome = queue_.enqueue(principal_id, envelope, now_ms);

    switch (outcome.result) {
        case EnqueueResult::EXPIRED:
            reportFailure(envelope, "", FailureReason::EXPIRED);
            return;
        case EnqueueResult::DUPLICATE:
            return;
        default:
            break;
    }

    queued_++;
    recordStatus(envelope.envelope_id, DeliveryStatus::PENDING);
    LOG_DEBUG("Engine", "Envelope {} queued for offline principal {} (depth {})",
              envelope.envelope_id, principal_id, queue_.size(principal_id));
    mirrorPush(pendingKey(principal_id), {envelope});

    if (outcome.evicted) {
        mirrorRemove(pendingKey(principal_id), {outcome.evicted->envelope_id});
        reportFailure(*outcome.evicted, "", FailureReason::QUEUE_OVERFLOW);
    }
}

void DeliveryEngine::handOff(const std::string& connection_id, std::vector<Envelope> envelopes, int64_t now_ms) {
    for (auto& envelope : envelopes) {
        if (envelope.principal_id.empty()) {
            mirrorRemove(connectionInflightKey(connection_id), {envelope.envelope_id});
            reportFailure(envelope, connection_id, FailureReason::UNREACHABLE);
            continue;
        }

        std::vector<std::shared_ptr<Connection>> live;
        bool covered = false;
        for (const auto& id : registry_.findByPrincipal(envelope.principal_id)) {
            auto other = registry_.find(id);
            if (!other) {
                continue;
            }
            std::lock_guard<std::mutex> clock(other->mutex);
            if (other->findInFlight(envelope.envelope_id)) {
                covered = true;
            }
            live.push_back(other);
        }

        // Another connection still carries it and settles it, expired or not.
        if (covered) {
            continue;
        }

        if (envelope.isExpired(now_ms)) {
            mirrorRemove(inflightKey(envelope.principal_id), {envelope.envelope_id});
            reportFailure(envelope, connection_id, FailureReason::EXPIRED);
            continue;
        }

        if (!live.empty()) {
            envelope.retry_count = 0;
            for (auto& other : live) {
                std::lock_guard<std::mutex> clock(other->mutex);
                transmitLocked(*other, envelope, now_ms);
            }
            continue;
        }

        envelope.retry_count = 0;
        mirrorRemove(inflightKey(envelope.principal_id), {envelope.envelope_id});
        queueForPrincipal(envelope.principal_id, std::move(envelope), now_ms);
    }
}

size_t DeliveryEngine::deliverToConnection(const std::string& connection_id, const std::string& principal_id,
                                           std::vector<Envelope> envelopes, int64_t now_ms) {
    if (envelopes.empty()) {
        return 0;
    }

    auto connection = registry_.find(connection_id);
    size_t delivered = 0;
    std::vector<Envelope> leftover;

    if (connection) {
        std::vector<Envelope> tracked;
        std::unordered_set<std::string> delivered_ids;
        std::lock_guard<std::mutex> clock(connection->mutex);
        for (auto& envelope : envelopes) {
            envelope.retry_count = 0;
            if (transmitLocked(*connection, envelope, now_ms)) {
                delivered_ids.insert(envelope.envelope_id);
                if (envelope.requires_ack) {
                    tracked.push_back(envelope);
                }
            } else {
                leftover.push_back(std::move(envelope));
            }
        }
        delivered = delivered_ids.size();
        mirrorRemove(pendingKey(principal_id), std::move(delivered_ids));
        mirrorPush(inflightKey(principal_id), std::move(tracked));
    } else {
        leftover = std::move(envelopes);
    }

    for (auto& envelope : leftover) {
        recordStatus(envelope.envelope_id, DeliveryStatus::PENDING);
        queue_.enqueue(principal_id, std::move(envelope), now_ms);
    }
    return delivered;
}

size_t DeliveryEngine::drainTo(const std::string& connection_id, const std::string& principal_id,
                               int64_t now_ms) {
    std::vector<Envelope> expired;
    auto envelopes = queue_.drain(principal_id, now_ms, &expired);

    if (!expired.empty()) {
        std::unordered_set<std::string> ids;
        for (const auto& envelope : expired) {
            ids.insert(envelope.envelope_id);
            reportFailure(envelope, connection_id, FailureReason::EXPIRED);
        }
        mirrorRemove(pendingKey(principal_id), std::move(ids));
    }

    size_t delivered = deliverToConnection(connection_id, principal_id, std::move(envelopes), now_ms);
    drained_ += delivered;
    return delivered;
}

// =============================================================================
// Transport events
// =============================================================================

bool DeliveryEngine::connectionOpened(const std::string& connection_id, std::shared_ptr<ConnectionSink> sink) {
    if (!sink) {
        return false;
    }
    auto connection = registry_.registerConnection(connection_id, std::move(sink), scheduler_->nowMs());
    if (!connection) {
        return false;
    }
    LOG_INFO("Engine", "Connection {} opened", connection_id);
    return true;
}

void DeliveryEngine::connectionClosed(const std::string& connection_id, const std::string& reason) {
    auto connection = registry_.find(connection_id);
    if (!connection) {
        return;
    }

    std::string principal_id;
    {
        std::lock_guard<std::mutex> clock(connection->mutex);
        principal_id = connection->principal_id;
    }

    std::vector<Envelope> handed_off;
    bool last_connection = false;
    {
        std::lock_guard<std::mutex> slock(stripeFor(principal_id));
        handed_off = registry_.unregister(connection_id);
        last_connection = !principal_id.empty() && registry_.findByPrincipal(principal_id).empty();
    }

    // Closed connections cannot arm new timers, so after this nothing of the
    // connection's group is left in the scheduler.
    scheduler_->cancelGroup(connection_id);

    LOG_INFO("Engine", "Connection {} ({}) closed: {} ({} in flight handed off)",
             connection_id, principal_id.empty() ? "anonymous" : principal_id, reason, handed_off.size());

    if (last_connection) {
        // The next identify re-reads the mirror; the restore skips whatever
        // is already queued or in flight.
        std::lock_guard<std::mutex> lock(restored_mutex_);
        restored_principals_.erase(principal_id);
    }

    if (handed_off.empty()) {
        return;
    }

    std::lock_guard<std::mutex> slock(stripeFor(principal_id));
    handOff(connection_id, std::move(handed_off), scheduler_->nowMs());
}

bool DeliveryEngine::principalIdentified(const std::string& connection_id, const std::string& principal_id) {
    size_t delivered = 0;
    {
        std::lock_guard<std::mutex> slock(stripeFor(principal_id));
        if (!registry_.attribute(connection_id, principal_id)) {
            return false;
        }
        delivered = drainTo(connection_id, principal_id, scheduler_->nowMs());
    }

    // Posted after the drain's mirror writes, so the restore reads a mirror
    // that already reflects them.
    scheduleRestore(principal_id, connection_id);

    LOG_INFO("Engine", "Connection {} identified as {} ({} queued envelopes delivered)",
             connection_id, principal_id, delivered);
    return true;
}

void DeliveryEngine::scheduleRestore(const std::string& principal_id, const std::string& connection_id) {
    if (!store_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(restored_mutex_);
        if (!restored_principals_.insert(principal_id).second) {
            return;
        }
    }
    postStoreJob([this, principal_id, connection_id]() { restoreFromStore(principal_id, connection_id); });
}

std::string DeliveryEngine::identifiedConnectionFor(const std::string& principal_id,
                                                    const std::string& preferred) const {
    std::string fallback;
    for (const auto& id : registry_.findByPrincipal(principal_id)) {
        auto connection = registry_.find(id);
        if (!connection) {
            continue;
        }
        std::lock_guard<std::mutex> clock(connection->mutex);
        if (connection->state != ConnectionState::IDENTIFIED) {
            continue;
        }
        if (id == preferred) {
            return id;
        }
        if (fallback.empty()) {
            fallback = id;
        }
    }
    return fallback;
}

void DeliveryEngine::restoreFromStore(const std::string& principal_id, const std::string& connection_id) {
    // Store reads run outside the stripe lock.
    auto pending = loadMirror(pendingKey(principal_id));
    auto inflight = loadMirror(inflightKey(principal_id));
    if (!pending || !inflight) {
        std::lock_guard<std::mutex> lock(restored_mutex_);
        restored_principals_.erase(principal_id);
        return;
    }

    std::lock_guard<std::mutex> slock(stripeFor(principal_id));
    const int64_t now = scheduler_->nowMs();

    std::unordered_set<std::string> live_ids;
    for (const auto& id : registry_.findByPrincipal(principal_id)) {
        auto connection = registry_.find(id);
        if (!connection) {
            continue;
        }
        std::lock_guard<std::mutex> clock(connection->mutex);
        for (const auto& envelope : connection->in_flight) {
            live_ids.insert(envelope.envelope_id);
        }
    }

    std::vector<Envelope> moved;
    std::unordered_set<std::string> moved_ids;
    std::unordered_set<std::string> dead_pending;
    size_t restored = 0;

    auto absorb = [&](Envelope& envelope, bool from_inflight) {
        if (live_ids.count(envelope.envelope_id) > 0) {
            return;
        }
        // Settled after the mirror was read; its removal is still queued.
        auto known = status(envelope.envelope_id);
        if (known && (*known == DeliveryStatus::DELIVERED || *known == DeliveryStatus::FAILED)) {
            return;
        }
        envelope.principal_id = principal_id;
        envelope.retry_count = 0;

        // Already queued in memory: the drain owns its expiry.
        if (queue_.contains(principal_id, envelope.envelope_id)) {
            if (from_inflight) {
                moved_ids.insert(envelope.envelope_id);
            }
            return;
        }
        if (envelope.isExpired(now)) {
            (from_inflight ? moved_ids : dead_pending).insert(envelope.envelope_id);
            reportFailure(envelope, "", FailureReason::EXPIRED);
            return;
        }

        auto outcome = queue_.enqueue(principal_id, envelope, now);
        if (outcome.result == EnqueueResult::ENQUEUED || outcome.result == EnqueueResult::EVICTED_OLDEST) {
            restored++;
            recordStatus(envelope.envelope_id, DeliveryStatus::PENDING);
            if (from_inflight) {
                moved_ids.insert(envelope.envelope_id);
                moved.push_back(envelope);
            }
        }
        if (outcome.evicted) {
            dead_pending.insert(outcome.evicted->envelope_id);
            reportFailure(*outcome.evicted, "", FailureReason::QUEUE_OVERFLOW);
        }
    };

    for (auto& envelope : *pending) {
        absorb(envelope, false);
    }
    for (auto& envelope : *inflight) {
        absorb(envelope, true);
    }

    mirrorRemove(inflightKey(principal_id), std::move(moved_ids));
    mirrorRemove(pendingKey(principal_id), std::move(dead_pending));
    mirrorPush(pendingKey(principal_id), std::move(moved));

    if (restored > 0) {
        restored_ += restored;
        LOG_INFO("Engine", "Restored {} mirrored envelopes for {} from {}",
                 restored, principal_id, store_->describe());
    }

    // Identified while the restore was running: deliver now. Otherwise the
    // envelopes wait in the queue for the next identify.
    std::string target = identifiedConnectionFor(principal_id, connection_id);
    if (!target.empty() && queue_.size(principal_id) > 0) {
        size_t delivered = drainTo(target, principal_id, now);
        LOG_DEBUG("Engine", "Delivered {} restored envelopes to {} on {}", delivered, principal_id, target);
    }
}

bool DeliveryEngine::ackReceived(const std::string& connection_id, const std::string& envelope_id) {
    auto connection = registry_.find(connection_id);
    if (!connection) {
        duplicate_acks_++;
        LOG_DEBUG("Engine", "Ack for {} on unknown connection {} ignored", envelope_id, connection_id);
        return false;
    }

    Envelope acked;
    bool found = false;
    {
        std::lock_guard<std::mutex> clock(connection->mutex);
        if (Envelope* envelope = connection->findInFlight(envelope_id)) {
            acked = *envelope;
            found = true;
            connection->eraseInFlight(envelope_id);
            auto timer = connection->timers.find(envelope_id);
            if (timer != connection->timers.end()) {
                scheduler_->cancel(timer->second);
                connection->timers.erase(timer);
            }
        }
    }

    if (!found) {
        duplicate_acks_++;
        LOG_TRACE("Engine", "Duplicate or late ack for {} on {}", envelope_id, connection_id);
        return false;
    }

    acked_++;
    const int64_t now = scheduler_->nowMs();

    if (acked.principal_id.empty()) {
        mirrorRemove(connectionInflightKey(connection_id), {envelope_id});
        reportDelivered(acked, connection_id, now);
        return true;
    }

    // One ack from any of the principal's connections settles the envelope.
    settleAcrossConnections(acked.principal_id, envelope_id, connection_id, nullptr);
    queue_.remove(acked.principal_id, envelope_id);
    mirrorRemove(inflightKey(acked.principal_id), {envelope_id});
    reportDelivered(acked, connection_id, now);

    LOG_TRACE("Engine", "Envelope {} acknowledged by {}", envelope_id, acked.principal_id);
    return true;
}

void DeliveryEngine::livenessResponseReceived(const std::string& connection_id) {
    registry_.recordHeartbeatAck(connection_id, scheduler_->nowMs());
}

void DeliveryEngine::pingReceived(const std::string& connection_id, int64_t sent_at_ms) {
    registry_.recordHeartbeatAck(connection_id, scheduler_->nowMs());

    auto connection = registry_.find(connection_id);
    if (!connection) {
        return;
    }
    std::lock_guard<std::mutex> clock(connection->mutex);
    if (connection->state != ConnectionState::CLOSED) {
        connection->sink->sendPong(sent_at_ms);
    }
}

size_t DeliveryEngine::replayRequested(const std::string& connection_id, int64_t since_ms) {
    auto connection = registry_.find(connection_id);
    if (!connection) {
        return 0;
    }

    std::string principal_id;
    {
        std::lock_guard<std::mutex> clock(connection->mutex);
        principal_id = connection->principal_id;
    }
    if (principal_id.empty()) {
        LOG_WARN("Engine", "Replay requested on unidentified connection {}", connection_id);
        return 0;
    }

    std::lock_guard<std::mutex> slock(stripeFor(principal_id));
    const int64_t now = scheduler_->nowMs();

    auto envelopes = queue_.requestSince(principal_id, since_ms, now);
    for (const auto& envelope : envelopes) {
        queue_.remove(principal_id, envelope.envelope_id);
    }

    size_t delivered = deliverToConnection(connection_id, principal_id, std::move(envelopes), now);
    replayed_ += delivered;

    LOG_DEBUG("Engine", "Replay since {} for {} on {}: {} envelopes",
              since_ms, principal_id, connection_id, delivered);
    return delivered;
}

bool DeliveryEngine::inboundEvent(const std::string& connection_id,
                                  const std::string& envelope_id,
                                  const std::string& event,
                                  const std::string& payload) {
    auto connection = registry_.find(connection_id);
    if (!connection) {
        return false;
    }

    InboundEvent inbound;
    inbound.connection_id = connection_id;
    inbound.envelope_id = envelope_id;
    inbound.event = event;
    inbound.payload = payload;
    {
        std::lock_guard<std::mutex> clock(connection->mutex);
        inbound.principal_id = connection->principal_id;
    }

    InboundHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = inbound_handler_;
    }

    if (handler) {
        try {
            handler(inbound);
        } catch (const std::exception& e) {
            LOG_ERROR("Engine", "Inbound handler failed for {} ({}): {}", envelope_id, event, e.what());
            return false;
        }
    }

    inbound_events_++;
    std::lock_guard<std::mutex> clock(connection->mutex);
    if (connection->state == ConnectionState::CLOSED) {
        return false;
    }
    return connection->sink->sendAck(envelope_id);
}

// =============================================================================
// Liveness
// =============================================================================

void DeliveryEngine::scheduleLivenessTick() {
    if (!running_.load()) {
        return;
    }
    scheduler_->schedule(config_.heartbeat_interval, kLivenessGroup, [this]() { livenessTick(); });
}

void DeliveryEngine::livenessTick() {
    if (!running_.load()) {
        return;
    }

    const int64_t now = scheduler_->nowMs();
    const int64_t timeout = config_.heartbeat_interval.count() *
                            static_cast<int64_t>(config_.heartbeat_max_missed);

    for (const auto& connection_id : registry_.reapStale(timeout, now)) {
        stale_closed_++;
        forceClose(connection_id, "liveness timeout");
    }

    for (const auto& connection_id : registry_.connectionIds()) {
        auto connection = registry_.find(connection_id);
        if (!connection) {
            continue;
        }
        {
            std::lock_guard<std::mutex> clock(connection->mutex);
            if (connection->state != ConnectionState::OPEN && connection->state != ConnectionState::IDENTIFIED) {
                continue;
            }
            connection->sink->sendPing(now);
        }
        registry_.recordHeartbeatSent(connection_id, now);
    }

    auto reaped = queue_.reapExpired(now);
    for (const auto& envelope : reaped) {
        mirrorRemove(pendingKey(envelope.principal_id), {envelope.envelope_id});
        reportFailure(envelope, "", FailureReason::EXPIRED);
    }

    scheduleLivenessTick();
}

void DeliveryEngine::forceClose(const std::string& connection_id, const std::string& reason) {
    auto connection = registry_.find(connection_id);
    if (!connection) {
        return;
    }
    connection->sink->close(reason);
    connectionClosed(connection_id, reason);
}

// =============================================================================
// Failure reporting
// =============================================================================

void DeliveryEngine::reportFailure(const Envelope& envelope, const std::string& connection_id,
                                   FailureReason reason) {
    DeliveryFailure failure;
    failure.envelope_id = envelope.envelope_id;
    failure.principal_id = envelope.principal_id;
    failure.connection_id = connection_id;
    failure.event = envelope.event;
    failure.reason = reason;
    failure.retry_count = envelope.retry_count;

    failed_++;
    if (reason == FailureReason::EXPIRED) {
        expired_++;
    }

    // No longer tracked, so a producer retry under the same id goes through.
    forgetEnvelopeId(envelope.envelope_id);
    recordStatus(envelope.envelope_id, DeliveryStatus::FAILED);

    LOG_WARN("Engine", "Delivery of {} ({}) to {} failed: {}",
             failure.envelope_id, failure.event,
             failure.principal_id.empty() ? connection_id : failure.principal_id,
             failureReasonToString(reason));

    scheduler_->schedule(std::chrono::milliseconds(0), kNotifyGroup, [this, failure]() {
        FailureHandler handler;
        {
            std::lock_guard<std::mutex> lock(handler_mutex_);
            handler = failure_handler_;
        }
        if (!handler) {
            return;
        }
        try {
            handler(failure);
        } catch (const std::exception& e) {
            LOG_ERROR("Engine", "Failure handler threw for {}: {}", failure.envelope_id, e.what());
        }
    });
}

void DeliveryEngine::reportDelivered(const Envelope& envelope, const std::string& connection_id,
                                     int64_t now_ms) {
    recordStatus(envelope.envelope_id, DeliveryStatus::DELIVERED);

    DeliveryReceipt receipt;
    receipt.envelope_id = envelope.envelope_id;
    receipt.principal_id = envelope.principal_id;
    receipt.connection_id = connection_id;
    receipt.event = envelope.event;
    receipt.delivered_at_ms = now_ms;

    scheduler_->schedule(std::chrono::milliseconds(0), kNotifyGroup, [this, receipt]() {
        DeliveredHandler handler;
        {
            std::lock_guard<std::mutex> lock(handler_mutex_);
            handler = delivered_handler_;
        }
        if (!handler) {
            return;
        }
        try {
            handler(receipt);
        } catch (const std::exception& e) {
            LOG_ERROR("Engine", "Delivered handler threw for {}: {}", receipt.envelope_id, e.what());
        }
    });
}

// =============================================================================
// Durable mirror
// =============================================================================

void DeliveryEngine::postStoreJob(Scheduler::Task job) {
    if (store_scheduler_->schedule(std::chrono::milliseconds(0), kStoreGroup, std::move(job)) == kInvalidTimer) {
        LOG_DEBUG("Engine", "Store lane stopped, mirror job dropped");
    }
}

void DeliveryEngine::mirrorPush(const std::string& key, std::vector<Envelope> envelopes) {
    if (!store_ || envelopes.empty()) {
        return;
    }
    postStoreJob([this, key, envelopes = std::move(envelopes)]() { writePush(key, envelopes); });
}

void DeliveryEngine::mirrorRemove(const std::string& key, std::unordered_set<std::string> envelope_ids) {
    if (!store_ || envelope_ids.empty()) {
        return;
    }
    postStoreJob([this, key, envelope_ids = std::move(envelope_ids)]() { writeRemove(key, envelope_ids); });
}

bool DeliveryEngine::storeUsable(int64_t now_ms) const {
    if (!store_) {
        return false;
    }
    return store_healthy_.load() || now_ms >= store_retry_at_ms_.load();
}

void DeliveryEngine::noteStoreResult(bool ok, const char* operation, int64_t now_ms) {
    if (ok) {
        if (!store_healthy_.exchange(true)) {
            LOG_INFO("Engine", "Side-store {} reachable again, mirroring resumed", store_->describe());
        }
        return;
    }

    store_retry_at_ms_.store(now_ms + config_.store_retry_interval.count());
    if (store_healthy_.exchange(false)) {
        LOG_WARN("Engine", "Side-store {} failed during {}, continuing memory-only",
                 store_->describe(), operation);
    }
}

void DeliveryEngine::writePush(const std::string& key, const std::vector<Envelope>& envelopes) {
    const int64_t now = scheduler_->nowMs();
    if (!storeUsable(now)) {
        return;
    }

    // The key has to outlive the longest-lived envelope on it.
    int64_t longest_ms = 0;
    bool unbounded = false;
    for (const auto& envelope : envelopes) {
        if (!store_->push(key, encodeEnvelope(envelope))) {
            noteStoreResult(false, "push", now);
            return;
        }
        if (envelope.expires_at_ms == 0) {
            unbounded = true;
        } else {
            longest_ms = std::max(longest_ms, envelope.expires_at_ms - now);
        }
    }

    if (!unbounded && longest_ms > 0) {
        std::chrono::seconds ttl((longest_ms + 999) / 1000);
        if (!store_->expire(key, ttl)) {
            noteStoreResult(false, "expire", now);
            return;
        }
    }
    noteStoreResult(true, "push", now);
}

void DeliveryEngine::writeRemove(const std::string& key, const std::unordered_set<std::string>& envelope_ids) {
    const int64_t now = scheduler_->nowMs();
    if (!storeUsable(now)) {
        return;
    }

    bool ok = store_->remove(key, [&envelope_ids](const std::string& value) {
        auto envelope = decodeEnvelope(value);
        return !envelope || envelope_ids.count(envelope->envelope_id) > 0;
    });
    noteStoreResult(ok, "remove", now);
}

std::optional<std::vector<Envelope>> DeliveryEngine::loadMirror(const std::string& key) {
    const int64_t now = scheduler_->nowMs();
    if (!storeUsable(now)) {
        return std::nullopt;
    }

    auto values = store_->list(key);
    noteStoreResult(values.has_value(), "list", now);
    if (!values) {
        return std::nullopt;
    }

    std::vector<Envelope> envelopes;
    envelopes.reserve(values->size());
    for (const auto& value : *values) {
        auto envelope = decodeEnvelope(value);
        if (!envelope) {
            LOG_WARN("Engine", "Skipping undecodable mirror entry under {}", key);
            continue;
        }
        envelopes.push_back(std::move(*envelope));
    }
    return envelopes;
}

// =============================================================================
// Introspection
// =============================================================================

DeliveryStats DeliveryEngine::stats() const {
    DeliveryStats stats;
    stats.sent = sent_.load();
    stats.transmitted = transmitted_.load();
    stats.retransmitted = retransmitted_.load();
    stats.acked = acked_.load();
    stats.duplicate_acks = duplicate_acks_.load();
    stats.queued = queued_.load();
    stats.drained = drained_.load();
    stats.replayed = replayed_.load();
    stats.restored = restored_.load();
    stats.failed = failed_.load();
    stats.expired = expired_.load();
    stats.inbound_events = inbound_events_.load();
    stats.stale_closed = stale_closed_.load();
    stats.store_healthy = store_ ? store_healthy_.load() : true;
    stats.store_backlog = store_ ? store_scheduler_->pendingCount(kStoreGroup) : 0;
    {
        std::lock_guard<std::mutex> lock(restored_mutex_);
        stats.restored_principals = restored_principals_.size();
    }
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        stats.tracked_statuses = statuses_.size();
    }
    stats.registry = registry_.stats();
    stats.queue = queue_.stats();
    return stats;
}

}  // namespace core
}  // namespace courier
