/**
 * @file connection_registry.hpp
 * @brief Live connections, their principal attribution and in-flight sets.
 *
 * The ConnectionRegistry maintains:
 * - Every open connection and its transport handle
 * - The principal -> connections index used to resolve sends
 * - Per-connection heartbeat timestamps for liveness detection
 * - Per-connection in-flight envelopes awaiting acknowledgment
 *
 * @copyright Copyright (c) 2024 Courier Contributors
 * @license MIT License
 */

#pragma once

#include "courier/core/envelope.hpp"
#include "courier/core/export.hpp"
#include "courier/core/scheduler.hpp"

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace courier {
namespace core {

/**
 * @enum ConnectionState
 * @brief Open -> Identified -> Stale -> Closed. Open may also go straight to
 *        Stale or Closed.
 */
enum class ConnectionState {
    OPEN,        ///< Transport up, principal unknown
    IDENTIFIED,  ///< Attributed to a principal
    STALE,       ///< Missed too many liveness probes, about to be closed
    CLOSED       ///< Removed from the registry
};

inline const char* connectionStateToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::OPEN: return "open";
        case ConnectionState::IDENTIFIED: return "identified";
        case ConnectionState::STALE: return "stale";
        case ConnectionState::CLOSED: return "closed";
        default: return "unknown";
    }
}

/**
 * @class ConnectionSink
 * @brief Outbound half of a transport connection.
 *
 * Implementations must not block and must not call back into the delivery
 * engine from inside these methods. A false return means the frame could not
 * be queued (the transport is going away).
 */
class COURIER_CORE_API ConnectionSink {
public:
    virtual ~ConnectionSink() = default;

    virtual bool sendEnvelope(const Envelope& envelope, int64_t sent_at_ms) = 0;
    virtual bool sendAck(const std::string& envelope_id) = 0;
    virtual bool sendPing(int64_t sent_at_ms) = 0;
    virtual bool sendPong(int64_t sent_at_ms) = 0;
    virtual bool sendDeliveryFailed(const std::string& envelope_id, const std::string& reason) = 0;

    /// Ask the transport to shut the connection down.
    virtual void close(const std::string& reason) = 0;
};

/**
 * @struct Connection
 * @brief One live transport connection.
 *
 * Identity fields are immutable after registration. Everything else is
 * guarded by @c mutex, which serializes ack handling, retry timers and
 * heartbeat bookkeeping for this connection.
 */
struct COURIER_CORE_API Connection {
    const std::string connection_id;
    const std::shared_ptr<ConnectionSink> sink;
    const int64_t created_at_ms;

    mutable std::mutex mutex;
    std::string principal_id;
    ConnectionState state = ConnectionState::OPEN;
    int64_t last_heartbeat_sent_at_ms = 0;
    int64_t last_heartbeat_ack_at_ms = 0;

    /// Insertion-ordered envelopes awaiting acknowledgment.
    std::vector<Envelope> in_flight;

    /// Envelope id -> armed ack-timeout or retransmit timer.
    std::unordered_map<std::string, TimerId> timers;

    Connection(std::string id, std::shared_ptr<ConnectionSink> s, int64_t now_ms)
        : connection_id(std::move(id))
        , sink(std::move(s))
        , created_at_ms(now_ms)
        , last_heartbeat_ack_at_ms(now_ms)
    {}

    /// Caller holds @c mutex.
    Envelope* findInFlight(const std::string& envelope_id);

    /// Caller holds @c mutex.
    bool eraseInFlight(const std::string& envelope_id);
};

/**
 * @brief Snapshot of one connection for status output.
 */
struct COURIER_CORE_API ConnectionInfo {
    std::string connection_id;
    std::string principal_id;
    ConnectionState state = ConnectionState::OPEN;
    int64_t created_at_ms = 0;
    int64_t last_heartbeat_ack_at_ms = 0;
    size_t in_flight = 0;
};

struct RegistryStats {
    size_t open = 0;
    size_t identified = 0;
    size_t stale = 0;
    size_t principals = 0;
    size_t in_flight = 0;
};

/**
 * @class ConnectionRegistry
 * @brief Thread-safe connection table.
 *
 * The table itself is guarded by a read-write lock; per-connection state by
 * each Connection's own mutex. Lock order is registry before connection.
 *
 * Usage:
 * @code
 * ConnectionRegistry registry;
 * registry.registerConnection(connId, sink, now);
 * registry.attribute(connId, "user-42");
 * for (auto& id : registry.findByPrincipal("user-42")) { ... }
 * auto handedOff = registry.unregister(connId);
 * @endcode
 */
class COURIER_CORE_API ConnectionRegistry {
public:
    ConnectionRegistry() = default;

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /**
     * @brief Add a freshly opened connection in state Open.
     * @return The new connection, or nullptr if the id is already registered.
     */
    std::shared_ptr<Connection> registerConnection(const std::string& connection_id,
                                                   std::shared_ptr<ConnectionSink> sink,
                                                   int64_t now_ms);

    /**
     * @brief Attribute a connection to a principal (Open -> Identified).
     *
     * Re-attribution to a different principal moves the connection between
     * index buckets. Stale and closed connections cannot be attributed.
     */
    bool attribute(const std::string& connection_id, const std::string& principal_id);

    /**
     * @brief Remove a connection and hand off its in-flight envelopes.
     *
     * The connection is marked Closed; timers still listed on it are cleared
     * from its bookkeeping (the caller cancels their scheduler group).
     */
    std::vector<Envelope> unregister(const std::string& connection_id);

    // =========================================================================
    // Lookup
    // =========================================================================

    std::shared_ptr<Connection> find(const std::string& connection_id) const;

    /**
     * @brief Ids of the principal's connections that are still deliverable
     *        (Identified, not Stale).
     */
    std::vector<std::string> findByPrincipal(const std::string& principal_id) const;

    std::vector<ConnectionInfo> listConnections() const;
    std::vector<std::string> connectionIds() const;
    size_t size() const;
    RegistryStats stats() const;

    // =========================================================================
    // Liveness
    // =========================================================================

    void recordHeartbeatSent(const std::string& connection_id, int64_t now_ms);

    /**
     * @brief Record a liveness response. Ignored for stale connections.
     */
    void recordHeartbeatAck(const std::string& connection_id, int64_t now_ms);

    /**
     * @brief True when no liveness response arrived within @p timeout_ms.
     *        Unknown connections are reported stale.
     */
    bool isStale(const std::string& connection_id, int64_t timeout_ms, int64_t now_ms) const;

    /**
     * @brief Mark every connection silent for longer than @p timeout_ms Stale.
     * @return Ids of connections that became Stale (the caller closes them).
     */
    std::vector<std::string> reapStale(int64_t timeout_ms, int64_t now_ms);

private:
    // Caller holds connection.mutex.
    static bool staleLocked(const Connection& connection, int64_t timeout_ms, int64_t now_ms);

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Connection>> connections_;
    std::unordered_map<std::string, std::unordered_set<std::string>> by_principal_;
};

}  // namespace core
}  // namespace courier
