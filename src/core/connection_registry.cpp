/**
 * @file connection_registry.cpp
 * @brief ConnectionRegistry implementation.
 *
 * @copyright Copyright (c) 2024 Courier Contributors
 * @license MIT License
 */

#include "courier/core/connection_registry.hpp"
#include "courier/utils/logger.hpp"

#include <algorithm>

namespace courier {
namespace core {

// =============================================================================
// Connection
// =============================================================================

Envelope* Connection::findInFlight(const std::string& envelope_id) {
    for (auto& envelope : in_flight) {
        if (envelope.envelope_id == envelope_id) {
            return &envelope;
        }
    }
    return nullptr;
}

bool Connection::eraseInFlight(const std::string& envelope_id) {
    auto it = std::find_if(in_flight.begin(), in_flight.end(),
                           [&](const Envelope& e) { return e.envelope_id == envelope_id; });
    if (it == in_flight.end()) {
        return false;
    }
    in_flight.erase(it);
    return true;
}

// =============================================================================
// Lifecycle
// =============================================================================

std::shared_ptr<Connection> ConnectionRegistry::registerConnection(const std::string& connection_id,
                                                                   std::shared_ptr<ConnectionSink> sink,
                                                                   int64_t now_ms) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (connections_.count(connection_id) > 0) {
        LOG_WARN("Registry", "Connection {} already registered", connection_id);
        return nullptr;
    }

    auto connection = std::make_shared<Connection>(connection_id, std::move(sink), now_ms);
    connections_.emplace(connection_id, connection);
    LOG_DEBUG("Registry", "Registered connection {} ({} total)", connection_id, connections_.size());
    return connection;
}

bool ConnectionRegistry::attribute(const std::string& connection_id, const std::string& principal_id) {
    if (principal_id.empty()) {
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
        LOG_WARN("Registry", "Attribute for unknown connection {}", connection_id);
        return false;
    }

    auto& connection = it->second;
    std::lock_guard<std::mutex> clock(connection->mutex);

    if (connection->state == ConnectionState::STALE || connection->state == ConnectionState::CLOSED) {
        LOG_WARN("Registry", "Cannot attribute {} connection {}",
                 connectionStateToString(connection->state), connection_id);
        return false;
    }

    if (!connection->principal_id.empty() && connection->principal_id != principal_id) {
        auto bucket = by_principal_.find(connection->principal_id);
        if (bucket != by_principal_.end()) {
            bucket->second.erase(connection_id);
            if (bucket->second.empty()) {
                by_principal_.erase(bucket);
            }
        }
        LOG_INFO("Registry", "Connection {} re-attributed from {} to {}",
                 connection_id, connection->principal_id, principal_id);
    }

    connection->principal_id = principal_id;
    connection->state = ConnectionState::IDENTIFIED;
    by_principal_[principal_id].insert(connection_id);

    LOG_DEBUG("Registry", "Connection {} identified as {}", connection_id, principal_id);
    return true;
}

std::vector<Envelope> ConnectionRegistry::unregister(const std::string& connection_id) {
    std::shared_ptr<Connection> connection;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = connections_.find(connection_id);
        if (it == connections_.end()) {
            return {};
        }
        connection = it->second;
        connections_.erase(it);

        std::lock_guard<std::mutex> clock(connection->mutex);
        if (!connection->principal_id.empty()) {
            auto bucket = by_principal_.find(connection->principal_id);
            if (bucket != by_principal_.end()) {
                bucket->second.erase(connection_id);
                if (bucket->second.empty()) {
                    by_principal_.erase(bucket);
                }
            }
        }
    }

    std::lock_guard<std::mutex> clock(connection->mutex);
    connection->state = ConnectionState::CLOSED;
    connection->timers.clear();
    std::vector<Envelope> handed_off = std::move(connection->in_flight);
    connection->in_flight.clear();

    LOG_DEBUG("Registry", "Unregistered connection {} ({} in-flight handed off)",
              connection_id, handed_off.size());
    return handed_off;
}

// =============================================================================
// Lookup
// =============================================================================

std::shared_ptr<Connection> ConnectionRegistry::find(const std::string& connection_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = connections_.find(connection_id);
    return it == connections_.end() ? nullptr : it->second;
}

std::vector<std::string> ConnectionRegistry::findByPrincipal(const std::string& principal_id) const {
    std::vector<std::string> result;
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto bucket = by_principal_.find(principal_id);
    if (bucket == by_principal_.end()) {
        return result;
    }

    for (const auto& connection_id : bucket->second) {
        auto it = connections_.find(connection_id);
        if (it == connections_.end()) {
            continue;
        }
        std::lock_guard<std::mutex> clock(it->second->mutex);
        if (it->second->state == ConnectionState::IDENTIFIED) {
            result.push_back(connection_id);
        }
    }

    std::sort(result.begin(), result.end());
    return result;
}

std::vector<ConnectionInfo> ConnectionRegistry::listConnections() const {
    std::vector<ConnectionInfo> result;
    std::shared_lock<std::shared_mutex> lock(mutex_);
    result.reserve(connections_.size());

    for (const auto& [id, connection] : connections_) {
        std::lock_guard<std::mutex> clock(connection->mutex);
        ConnectionInfo info;
        info.connection_id = id;
        info.principal_id = connection->principal_id;
        info.state = connection->state;
        info.created_at_ms = connection->created_at_ms;
        info.last_heartbeat_ack_at_ms = connection->last_heartbeat_ack_at_ms;
        info.in_flight = connection->in_flight.size();
        result.push_back(std::move(info));
    }
    return result;
}

std::vector<std::string> ConnectionRegistry::connectionIds() const {
    std::vector<std::string> result;
    std::shared_lock<std::shared_mutex> lock(mutex_);
    result.reserve(connections_.size());
    for (const auto& [id, connection] : connections_) {
        result.push_back(id);
    }
    return result;
}

size_t ConnectionRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return connections_.size();
}

RegistryStats ConnectionRegistry::stats() const {
    RegistryStats stats;
    std::shared_lock<std::shared_mutex> lock(mutex_);
    stats.principals = by_principal_.size();

    for (const auto& [id, connection] : connections_) {
        std::lock_guard<std::mutex> clock(connection->mutex);
        switch (connection->state) {
            case ConnectionState::OPEN: stats.open++; break;
            case ConnectionState::IDENTIFIED: stats.identified++; break;
            case ConnectionState::STALE: stats.stale++; break;
            default: break;
        }
        stats.in_flight += connection->in_flight.size();
    }
    return stats;
}

// =============================================================================
// Liveness
// =============================================================================

void ConnectionRegistry::recordHeartbeatSent(const std::string& connection_id, int64_t now_ms) {
    auto connection = find(connection_id);
    if (!connection) {
        return;
    }
    std::lock_guard<std::mutex> clock(connection->mutex);
    connection->last_heartbeat_sent_at_ms = now_ms;
}

void ConnectionRegistry::recordHeartbeatAck(const std::string& connection_id, int64_t now_ms) {
    auto connection = find(connection_id);
    if (!connection) {
        return;
    }
    std::lock_guard<std::mutex> clock(connection->mutex);
    if (connection->state == ConnectionState::STALE || connection->state == ConnectionState::CLOSED) {
        return;
    }
    connection->last_heartbeat_ack_at_ms = std::max(connection->last_heartbeat_ack_at_ms, now_ms);
}

bool ConnectionRegistry::staleLocked(const Connection& connection, int64_t timeout_ms, int64_t now_ms) {
    if (connection.state == ConnectionState::STALE || connection.state == ConnectionState::CLOSED) {
        return true;
    }
    return now_ms - connection.last_heartbeat_ack_at_ms > timeout_ms;
}

bool ConnectionRegistry::isStale(const std::string& connection_id, int64_t timeout_ms, int64_t now_ms) const {
    auto connection = find(connection_id);
    if (!connection) {
        return true;
    }
    std::lock_guard<std::mutex> clock(connection->mutex);
    return staleLocked(*connection, timeout_ms, now_ms);
}

std::vector<std::string> ConnectionRegistry::reapStale(int64_t timeout_ms, int64_t now_ms) {
    std::vector<std::string> stale;
    std::shared_lock<std::shared_mutex> lock(mutex_);

    for (const auto& [id, connection] : connections_) {
        std::lock_guard<std::mutex> clock(connection->mutex);
        if (!staleLocked(*connection, timeout_ms, now_ms)) {
            continue;
        }
        if (connection->state != ConnectionState::STALE) {
            LOG_INFO("Registry", "Connection {} ({}) is stale: no liveness response for {}ms",
                     id, connection->principal_id.empty() ? "anonymous" : connection->principal_id,
                     now_ms - connection->last_heartbeat_ack_at_ms);
            connection->state = ConnectionState::STALE;
        }
        stale.push_back(id);
    }
    return stale;
}

}  // namespace core
}  // namespace courier
