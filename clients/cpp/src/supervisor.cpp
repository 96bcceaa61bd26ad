/**
 * @file supervisor.cpp
 * @brief Supervisor implementation.
 *
 * @copyright Copyright (c) 2024 Courier Contributors
 * @license MIT License
 */

#include "courier_client/supervisor.hpp"
#include "courier/utils/logger.hpp"
#include "courier/utils/uuid.hpp"

#include <algorithm>
#include <exception>

namespace courier {
namespace client {

Supervisor::Supervisor(SupervisorConfig config,
                       std::shared_ptr<ClientTransport> transport,
                       std::shared_ptr<core::Scheduler> scheduler)
    : config_(std::move(config))
    , transport_(std::move(transport))
    , scheduler_(std::move(scheduler))
    , group_("supervisor:" + utils::UUIDGenerator::generate())
{
    LOG_DEBUG("Supervisor", "Created for principal {} (group {})", config_.principal_id, group_);
}

Supervisor::~Supervisor() {
    disconnect();
    scheduler_->cancelGroup(group_);
}

void Supervisor::setEnvelopeHandler(EnvelopeHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    envelope_handler_ = std::move(handler);
}

void Supervisor::setStateHandler(StateHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    state_handler_ = std::move(handler);
}

void Supervisor::setDeliveryFailedHandler(DeliveryFailedHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    failed_handler_ = std::move(handler);
}

// =============================================================================
// Transitions
// =============================================================================

void Supervisor::connect() {
    reconnect();
}

void Supervisor::reconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    manual_ = false;
    if (state_ == ConnectionState::CONNECTED || connecting_) {
        return;
    }
    attempt_ = 0;
    scheduleAttemptLocked(std::chrono::milliseconds(0));
}

void Supervisor::disconnect() {
    Transition transition;
    std::vector<PendingEmit> emits;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (manual_ && state_ == ConnectionState::DISCONNECTED && !connecting_) {
            return;
        }
        manual_ = true;
        ++generation_;
        retry_timer_ = core::kInvalidTimer;
        cancelProbeLocked();
        emits = takeEmitsLocked();
        transition = setStateLocked(ConnectionState::DISCONNECTED, "disconnected by application");
    }

    // Waits for an attempt in progress on the timer thread.
    scheduler_->cancelGroup(group_);
    transport_->close();

    notify(transition);
    failEmits(std::move(emits), "disconnected");
}

Supervisor::Transition Supervisor::setStateLocked(ConnectionState state, const std::string& reason) {
    if (state_ == state) {
        return Transition();
    }
    LOG_INFO("Supervisor", "{} -> {} ({})", connectionStateToString(state_),
             connectionStateToString(state), reason);
    state_ = state;

    Transition transition;
    transition.changed = true;
    transition.state = state;
    transition.reason = reason;
    return transition;
}

void Supervisor::scheduleAttemptLocked(std::chrono::milliseconds delay) {
    if (retry_timer_ != core::kInvalidTimer) {
        scheduler_->cancel(retry_timer_);
    }
    retry_timer_ = scheduler_->schedule(delay, group_, [this]() { runAttempt(); });
    if (retry_timer_ == core::kInvalidTimer) {
        LOG_ERROR("Supervisor", "Scheduler is not running, cannot schedule a connection attempt");
    }
}

Supervisor::Transition Supervisor::retryOrFailLocked(const std::string& reason) {
    if (config_.max_attempts > 0 && attempt_ >= config_.max_attempts) {
        LOG_ERROR("Supervisor", "Giving up after {} attempts: {}", attempt_, reason);
        return setStateLocked(ConnectionState::FAILED, reason);
    }

    if (!reachable_) {
        LOG_INFO("Supervisor", "Network unreachable, waiting for it to come back");
        return setStateLocked(ConnectionState::DISCONNECTED, reason);
    }

    // First retry after losing a live connection is immediate.
    auto delay = attempt_ == 0 ? std::chrono::milliseconds(0) : config_.reconnect.delayFor(attempt_);
    LOG_INFO("Supervisor", "Reconnecting in {}ms (attempt {})", delay.count(), attempt_ + 1);
    scheduleAttemptLocked(delay);
    return setStateLocked(ConnectionState::DISCONNECTED, reason);
}

Supervisor::Transition Supervisor::abandonLocked(const std::string& reason, std::vector<PendingEmit>& emits) {
    ++generation_;
    ++stats_.disconnects;
    cancelProbeLocked();
    emits = takeEmitsLocked();
    return retryOrFailLocked(reason);
}

void Supervisor::kickLocked() {
    if (manual_) {
        return;
    }
    if (state_ == ConnectionState::CONNECTED) {
        if (foreground_) {
            scheduleProbeLocked(std::chrono::milliseconds(0));
        }
        return;
    }
    if (connecting_) {
        return;
    }
    if (state_ == ConnectionState::FAILED) {
        attempt_ = 0;
    }
    scheduleAttemptLocked(std::chrono::milliseconds(0));
}

void Supervisor::runAttempt() {
    uint64_t generation = 0;
    Transition transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        retry_timer_ = core::kInvalidTimer;
        if (manual_ || connecting_ || state_ == ConnectionState::CONNECTED || !reachable_) {
            return;
        }
        connecting_ = true;
        ++attempt_;
        ++stats_.attempts;
        generation = ++generation_;
        transition = setStateLocked(ConnectionState::CONNECTING, "attempt " + std::to_string(attempt_));
    }
    notify(transition);

    bool opened = false;
    try {
        opened = transport_->open(makeHandlers(generation));
    } catch (const std::exception& e) {
        LOG_ERROR("Supervisor", "Transport open threw: {}", e.what());
    }

    bool closeTransport = false;
    bool recover = false;
    int64_t since = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connecting_ = false;

        if (generation != generation_) {
            // Disconnected or dropped while the attempt was running.
            closeTransport = opened;
            if (!manual_) {
                transition = retryOrFailLocked("connection lost while opening");
            }
        } else if (opened) {
            attempt_ = 0;
            ++stats_.connects;
            if (was_connected_) {
                ++stats_.reconnects;
            }
            was_connected_ = true;
            probe_outstanding_ = false;
            transition = setStateLocked(ConnectionState::CONNECTED, "connected");
            if (foreground_) {
                scheduleProbeLocked(config_.probe_interval);
            }
            recover = true;
            since = last_known_good_ms_;
        } else {
            transition = retryOrFailLocked("connection attempt failed");
        }
    }

    if (closeTransport) {
        transport_->close();
    }
    notify(transition);

    if (recover) {
        if (!transport_->sendIdentify(config_.principal_id) || !transport_->sendReplayRequest(since)) {
            LOG_WARN("Supervisor", "Could not send identify/replay after connecting");
        } else {
            LOG_DEBUG("Supervisor", "Identified as {}, replay since {}", config_.principal_id, since);
        }
    }
}

// =============================================================================
// Environment signals
// =============================================================================

void Supervisor::onReachabilityChanged(bool reachable) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reachable_ == reachable) {
        return;
    }
    reachable_ = reachable;
    LOG_INFO("Supervisor", "Network {}", reachable ? "reachable" : "unreachable");

    if (reachable) {
        kickLocked();
        return;
    }

    if (retry_timer_ != core::kInvalidTimer) {
        scheduler_->cancel(retry_timer_);
        retry_timer_ = core::kInvalidTimer;
    }
    if (state_ == ConnectionState::CONNECTED && foreground_) {
        scheduleProbeLocked(std::chrono::milliseconds(0));
    }
}

void Supervisor::onForeground() {
    std::lock_guard<std::mutex> lock(mutex_);
    foreground_ = true;
    kickLocked();
}

void Supervisor::onBackground() {
    std::lock_guard<std::mutex> lock(mutex_);
    foreground_ = false;
    cancelProbeLocked();
}

// =============================================================================
// Liveness probing
// =============================================================================

void Supervisor::scheduleProbeLocked(std::chrono::milliseconds delay) {
    if (probe_timer_ != core::kInvalidTimer) {
        scheduler_->cancel(probe_timer_);
    }
    const uint64_t generation = generation_;
    probe_timer_ = scheduler_->schedule(delay, group_, [this, generation]() { probe(generation); });
}

void Supervisor::cancelProbeLocked() {
    if (probe_timer_ != core::kInvalidTimer) {
        scheduler_->cancel(probe_timer_);
        probe_timer_ = core::kInvalidTimer;
    }
    if (probe_timeout_timer_ != core::kInvalidTimer) {
        scheduler_->cancel(probe_timeout_timer_);
        probe_timeout_timer_ = core::kInvalidTimer;
    }
    probe_outstanding_ = false;
}

void Supervisor::probe(uint64_t generation) {
    int64_t now = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || state_ != ConnectionState::CONNECTED || !foreground_) {
            return;
        }
        probe_timer_ = core::kInvalidTimer;
        scheduleProbeLocked(config_.probe_interval);

        if (probe_outstanding_) {
            return;
        }
        probe_outstanding_ = true;
        ++stats_.probes_sent;
        now = scheduler_->nowMs();
        probe_timeout_timer_ = scheduler_->schedule(config_.probe_timeout, group_,
            [this, generation]() { onProbeTimeout(generation); });
    }

    if (!transport_->sendPing(now)) {
        LOG_DEBUG("Supervisor", "Probe could not be sent");
    }
}

void Supervisor::onProbeTimeout(uint64_t generation) {
    Transition transition;
    std::vector<PendingEmit> emits;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || !probe_outstanding_) {
            return;
        }
        probe_timeout_timer_ = core::kInvalidTimer;
        ++stats_.probes_missed;
        LOG_WARN("Supervisor", "No pong within {}ms, dropping the connection", config_.probe_timeout.count());
        transition = abandonLocked("liveness probe timed out", emits);
    }

    transport_->close();
    notify(transition);
    failEmits(std::move(emits), "connection lost");
}

// =============================================================================
// Transport events
// =============================================================================

ClientTransport::Handlers Supervisor::makeHandlers(uint64_t generation) {
    ClientTransport::Handlers handlers;
    handlers.onEnvelope = [this, generation](const ReceivedEnvelope& envelope) {
        onEnvelope(generation, envelope);
    };
    handlers.onAck = [this, generation](const std::string& envelope_id) {
        onAck(generation, envelope_id);
    };
    handlers.onPing = [this, generation](int64_t sent_at_ms) {
        onPing(generation, sent_at_ms);
    };
    handlers.onPong = [this, generation](int64_t sent_at_ms) {
        onPong(generation, sent_at_ms);
    };
    handlers.onDeliveryFailed = [this, generation](const std::string& envelope_id, const std::string& reason) {
        onDeliveryFailed(generation, envelope_id, reason);
    };
    handlers.onClosed = [this, generation](const std::string& reason) {
        onTransportClosed(generation, reason);
    };
    return handlers;
}

void Supervisor::onTransportClosed(uint64_t generation, const std::string& reason) {
    Transition transition;
    std::vector<PendingEmit> emits;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            return;
        }
        if (connecting_) {
            // runAttempt() sees the bumped generation and retries.
            ++generation_;
            return;
        }
        if (state_ != ConnectionState::CONNECTED) {
            return;
        }
        LOG_WARN("Supervisor", "Connection lost: {}", reason);
        transition = abandonLocked(reason, emits);
    }

    notify(transition);
    failEmits(std::move(emits), "connection lost");
}

void Supervisor::onEnvelope(uint64_t generation, const ReceivedEnvelope& envelope) {
    bool duplicate = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            return;
        }
        ++stats_.received;
        duplicate = seenLocked(envelope.envelope_id);
        if (duplicate) {
            ++stats_.duplicates;
        }
    }

    if (duplicate) {
        LOG_DEBUG("Supervisor", "Duplicate envelope {}, acknowledging again", envelope.envelope_id);
    } else {
        EnvelopeHandler handler;
        {
            std::lock_guard<std::mutex> lock(handler_mutex_);
            handler = envelope_handler_;
        }
        if (handler) {
            try {
                handler(envelope);
            } catch (const std::exception& e) {
                // Left unacknowledged so the server redelivers it.
                LOG_ERROR("Supervisor", "Envelope handler failed for {}: {}", envelope.envelope_id, e.what());
                return;
            }
        }

        std::lock_guard<std::mutex> lock(mutex_);
        rememberLocked(envelope.envelope_id);
        last_known_good_ms_ = std::max(last_known_good_ms_, envelope.created_at_ms);
    }

    if (envelope.requires_ack && !transport_->sendAck(envelope.envelope_id)) {
        LOG_DEBUG("Supervisor", "Ack for {} not sent", envelope.envelope_id);
    }
}

void Supervisor::onAck(uint64_t generation, const std::string& envelope_id) {
    (void)generation;
    resolveEmit(envelope_id, true, "");
}

void Supervisor::onPing(uint64_t generation, int64_t sent_at_ms) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            return;
        }
    }
    transport_->sendPong(sent_at_ms);
}

void Supervisor::onPong(uint64_t generation, int64_t sent_at_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (generation != generation_ || !probe_outstanding_) {
        return;
    }
    probe_outstanding_ = false;
    if (probe_timeout_timer_ != core::kInvalidTimer) {
        scheduler_->cancel(probe_timeout_timer_);
        probe_timeout_timer_ = core::kInvalidTimer;
    }
    LOG_TRACE("Supervisor", "Pong, rtt {}ms", scheduler_->nowMs() - sent_at_ms);
}

void Supervisor::onDeliveryFailed(uint64_t generation, const std::string& envelope_id, const std::string& reason) {
    (void)generation;
    LOG_WARN("Supervisor", "Server gave up on {}: {}", envelope_id, reason);

    DeliveryFailedHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = failed_handler_;
    }
    if (handler) {
        handler(envelope_id, reason);
    }
}

// =============================================================================
// Client-originated events
// =============================================================================

std::string Supervisor::emit(const std::string& event, const std::string& payload, EmitCallback callback) {
    const std::string envelope_id = utils::UUIDGenerator::generate();
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (state_ != ConnectionState::CONNECTED) {
            ++stats_.emits_failed;
            lock.unlock();
            if (callback) {
                callback(false, "not connected");
            }
            return envelope_id;
        }

        PendingEmit pending;
        pending.callback = std::move(callback);
        pending.timer = scheduler_->schedule(config_.send_timeout, group_,
            [this, envelope_id]() { resolveEmit(envelope_id, false, "timed out"); });
        emits_[envelope_id] = std::move(pending);
    }

    if (!transport_->sendEvent(envelope_id, event, payload)) {
        resolveEmit(envelope_id, false, "send failed");
    }
    return envelope_id;
}

void Supervisor::resolveEmit(const std::string& envelope_id, bool ok, const std::string& error) {
    PendingEmit pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = emits_.find(envelope_id);
        if (it == emits_.end()) {
            return;
        }
        pending = std::move(it->second);
        emits_.erase(it);
        scheduler_->cancel(pending.timer);
        if (ok) {
            ++stats_.emits_succeeded;
        } else {
            ++stats_.emits_failed;
        }
    }

    if (pending.callback) {
        pending.callback(ok, error);
    }
}

std::vector<Supervisor::PendingEmit> Supervisor::takeEmitsLocked() {
    std::vector<PendingEmit> emits;
    emits.reserve(emits_.size());
    for (auto& [id, pending] : emits_) {
        scheduler_->cancel(pending.timer);
        ++stats_.emits_failed;
        emits.push_back(std::move(pending));
    }
    emits_.clear();
    return emits;
}

void Supervisor::failEmits(std::vector<PendingEmit> emits, const std::string& error) {
    for (auto& pending : emits) {
        if (pending.callback) {
            pending.callback(false, error);
        }
    }
}

void Supervisor::notify(const Transition& transition) {
    if (!transition.changed) {
        return;
    }
    StateHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = state_handler_;
    }
    if (handler) {
        handler(transition.state, transition.reason);
    }
}

// =============================================================================
// Duplicate filter
// =============================================================================

bool Supervisor::seenLocked(const std::string& envelope_id) {
    auto it = seen_.find(envelope_id);
    if (it == seen_.end()) {
        return false;
    }
    seen_order_.splice(seen_order_.begin(), seen_order_, it->second);
    return true;
}

void Supervisor::rememberLocked(const std::string& envelope_id) {
    if (envelope_id.empty() || config_.dedup_capacity == 0 || seen_.count(envelope_id) > 0) {
        return;
    }
    seen_order_.push_front(envelope_id);
    seen_[envelope_id] = seen_order_.begin();
    while (seen_order_.size() > config_.dedup_capacity) {
        seen_.erase(seen_order_.back());
        seen_order_.pop_back();
    }
}

// =============================================================================
// Introspection
// =============================================================================

ConnectionState Supervisor::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

SupervisorStats Supervisor::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

int64_t Supervisor::lastKnownGoodMs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_known_good_ms_;
}

uint32_t Supervisor::attempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempt_;
}

bool Supervisor::isForeground() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return foreground_;
}

}  // namespace client
}  // namespace courier
