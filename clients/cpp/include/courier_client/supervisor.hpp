/**
 * @file supervisor.hpp
 * @brief Client connection supervisor: reconnection, liveness probing, recovery.
 *
 * State machine:
 * @verbatim
 *   DISCONNECTED --connect()--> CONNECTING --open ok--> CONNECTED
 *        ^                          |                      |
 *        |                     open failed           transport lost /
 *        |                          v                probe timed out
 *        +------ retry timer ---- (wait) <-----------------+
 *                                   |
 *                         max_attempts exceeded
 *                                   v
 *                                 FAILED --reconnect() / env signal--> CONNECTING
 * @endverbatim
 *
 * disconnect() is the only way into a DISCONNECTED state that does not
 * reconnect on its own.
 *
 * @copyright Copyright (c) 2024 Courier Contributors
 * @license MIT License
 */

#pragma once

#include "courier_client/client_transport.hpp"
#include "courier/core/backoff.hpp"
#include "courier/core/scheduler.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace courier {
namespace client {

enum class ConnectionState {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    FAILED
};

inline const char* connectionStateToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED: return "DISCONNECTED";
        case ConnectionState::CONNECTING: return "CONNECTING";
        case ConnectionState::CONNECTED: return "CONNECTED";
        case ConnectionState::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Supervisor tunables.
 */
struct SupervisorConfig {
    std::string principal_id;

    core::ReconnectSchedule reconnect;
    uint32_t max_attempts = 10;  ///< 0 = unlimited

    std::chrono::milliseconds probe_interval{30000};
    std::chrono::milliseconds probe_timeout{10000};

    /// Upper bound for emit() to resolve.
    std::chrono::milliseconds send_timeout{10000};

    /// Processed envelope ids remembered for duplicate suppression.
    size_t dedup_capacity = 1000;
};

struct SupervisorStats {
    uint64_t attempts = 0;
    uint64_t connects = 0;
    uint64_t reconnects = 0;       ///< Connects after an unintended disconnect
    uint64_t disconnects = 0;      ///< Unintended ones only
    uint64_t probes_sent = 0;
    uint64_t probes_missed = 0;
    uint64_t received = 0;
    uint64_t duplicates = 0;
    uint64_t emits_succeeded = 0;
    uint64_t emits_failed = 0;
};

/**
 * @class Supervisor
 * @brief Keeps one logical connection alive for a principal. Thread-safe.
 *
 * Attempts and probes run on the injected scheduler. Every timer the
 * supervisor arms belongs to its own scheduler group.
 */
class Supervisor {
public:
    using EnvelopeHandler = std::function<void(const ReceivedEnvelope&)>;
    using StateHandler = std::function<void(ConnectionState, const std::string& reason)>;
    using DeliveryFailedHandler = std::function<void(const std::string& envelope_id, const std::string& reason)>;
    /// Called exactly once per emit().
    using EmitCallback = std::function<void(bool ok, const std::string& error)>;

    Supervisor(SupervisorConfig config,
               std::shared_ptr<ClientTransport> transport,
               std::shared_ptr<core::Scheduler> scheduler);
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    void setEnvelopeHandler(EnvelopeHandler handler);
    void setStateHandler(StateHandler handler);
    void setDeliveryFailedHandler(DeliveryFailedHandler handler);

    /**
     * @brief Start connecting. No-op while connected or an attempt is running.
     */
    void connect();

    /**
     * @brief Explicit retry, also the way out of FAILED. Resets the attempt count.
     */
    void reconnect();

    /**
     * @brief Close and stay closed until connect() is called again.
     */
    void disconnect();

    // =========================================================================
    // Environment signals
    // =========================================================================

    void onReachabilityChanged(bool reachable);
    void onForeground();
    void onBackground();

    /**
     * @brief Send a client-originated event.
     * @return The envelope id assigned to the event.
     */
    std::string emit(const std::string& event, const std::string& payload, EmitCallback callback);

    // =========================================================================
    // Introspection
    // =========================================================================

    ConnectionState state() const;
    SupervisorStats stats() const;

    /// Creation time of the newest envelope processed; replay starts after it.
    int64_t lastKnownGoodMs() const;

    /// Attempts made since the last successful connect.
    uint32_t attempts() const;

    bool isForeground() const;

    const std::string& timerGroup() const { return group_; }

private:
    struct Transition {
        bool changed = false;
        ConnectionState state = ConnectionState::DISCONNECTED;
        std::string reason;
    };

    struct PendingEmit {
        EmitCallback callback;
        core::TimerId timer = core::kInvalidTimer;
    };

    // Caller holds mutex_.
    Transition setStateLocked(ConnectionState state, const std::string& reason);
    void scheduleAttemptLocked(std::chrono::milliseconds delay);
    Transition retryOrFailLocked(const std::string& reason);
    void scheduleProbeLocked(std::chrono::milliseconds delay);
    void cancelProbeLocked();
    Transition abandonLocked(const std::string& reason, std::vector<PendingEmit>& emits);
    std::vector<PendingEmit> takeEmitsLocked();
    void kickLocked();

    void runAttempt();
    void onTransportClosed(uint64_t generation, const std::string& reason);
    void onEnvelope(uint64_t generation, const ReceivedEnvelope& envelope);
    void onAck(uint64_t generation, const std::string& envelope_id);
    void onPing(uint64_t generation, int64_t sent_at_ms);
    void onPong(uint64_t generation, int64_t sent_at_ms);
    void onDeliveryFailed(uint64_t generation, const std::string& envelope_id, const std::string& reason);

    void probe(uint64_t generation);
    void onProbeTimeout(uint64_t generation);
    void resolveEmit(const std::string& envelope_id, bool ok, const std::string& error);

    ClientTransport::Handlers makeHandlers(uint64_t generation);
    void notify(const Transition& transition);
    void failEmits(std::vector<PendingEmit> emits, const std::string& error);

    bool seenLocked(const std::string& envelope_id);
    void rememberLocked(const std::string& envelope_id);

    const SupervisorConfig config_;
    std::shared_ptr<ClientTransport> transport_;
    std::shared_ptr<core::Scheduler> scheduler_;
    const std::string group_;

    mutable std::mutex mutex_;
    ConnectionState state_ = ConnectionState::DISCONNECTED;
    bool connecting_ = false;
    bool manual_ = true;              ///< Set by disconnect(), cleared by connect()
    bool foreground_ = true;
    bool reachable_ = true;
    bool was_connected_ = false;
    uint64_t generation_ = 0;         ///< Bumped whenever a connection is abandoned
    uint32_t attempt_ = 0;

    core::TimerId retry_timer_ = core::kInvalidTimer;
    core::TimerId probe_timer_ = core::kInvalidTimer;
    core::TimerId probe_timeout_timer_ = core::kInvalidTimer;
    bool probe_outstanding_ = false;

    int64_t last_known_good_ms_ = 0;

    std::list<std::string> seen_order_;
    std::unordered_map<std::string, std::list<std::string>::iterator> seen_;

    std::unordered_map<std::string, PendingEmit> emits_;

    SupervisorStats stats_;

    mutable std::mutex handler_mutex_;
    EnvelopeHandler envelope_handler_;
    StateHandler state_handler_;
    DeliveryFailedHandler failed_handler_;
};

}  // namespace client
}  // namespace courier
