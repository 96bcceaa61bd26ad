/**
 * @file client.hpp
 * @brief Courier C++ Client Library
 *
 * High-level C++ client for the Courier delivery daemon.
 * Features automatic reconnection, liveness probing, duplicate suppression
 * and replay of missed envelopes after a reconnect.
 */

#pragma once

#include "courier_client/supervisor.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace courier {
namespace client {

// Forward declarations
class ClientImpl;

/**
 * @brief Client configuration
 */
struct ClientOptions {
    std::string principal_id;
    core::ReconnectSchedule reconnect;
    uint32_t max_attempts = 10;  ///< 0 = unlimited
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds probe_interval{30000};
    std::chrono::milliseconds probe_timeout{10000};
    std::chrono::milliseconds send_timeout{10000};
};

/**
 * @brief Options for producer-side emits
 */
struct EmitOptions {
    bool fire_and_forget = false;
    core::Priority priority = core::Priority::NORMAL;
    int64_t ttl_ms = 0;           ///< 0 = server default
    std::string envelope_id;      ///< Set to make retries of the same emit idempotent
};

/**
 * @brief Result of a producer-side emit
 */
struct EmitResult {
    bool success = false;
    std::string envelope_id;
    uint32_t transmitted = 0;
    bool queued = false;
    bool duplicate = false;
    std::string error_message;
};

/**
 * @brief Courier Client
 *
 * Receiving side: connect() keeps a supervised Connect stream open for the
 * configured principal and hands every new envelope to the envelope handler.
 *
 * Producing side: emitToPrincipal() / emitToConnection() call the Emit RPC
 * and need no open stream.
 *
 * Example:
 * @code
 * courier::client::ClientOptions options;
 * options.principal_id = "user-42";
 * courier::client::Client client("localhost:50061", options);
 *
 * client.setEnvelopeHandler([](const courier::client::ReceivedEnvelope& env) {
 *     std::cout << env.event << ": " << env.payload << "\n";
 * });
 * client.connect();
 *
 * client.emitToPrincipal("user-7", "message.new", "hello");
 * @endcode
 *
 * Handlers run on transport threads. Envelope and delivery-failure handlers
 * must not call disconnect(); the state handler may.
 */
class Client {
public:
    /**
     * @brief Construct a new client
     * @param address Daemon address in "host:port" format
     * @param options Client configuration
     */
    explicit Client(const std::string& address = "localhost:50061",
                    const ClientOptions& options = {});

    /// Destructor
    ~Client();

    // Non-copyable
    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // Movable
    Client(Client&&) noexcept;
    Client& operator=(Client&&) noexcept;

    void setEnvelopeHandler(Supervisor::EnvelopeHandler handler);
    void setStateHandler(Supervisor::StateHandler handler);
    void setDeliveryFailedHandler(Supervisor::DeliveryFailedHandler handler);

    void connect();
    void disconnect();

    ConnectionState state() const;
    bool isConnected() const;

    /**
     * @brief Send a client-originated event over the open stream.
     * @return Envelope id of the event
     */
    std::string emitEvent(const std::string& event,
                          const std::string& payload,
                          Supervisor::EmitCallback callback = nullptr);

    /**
     * @brief Deliver an event to every connection of a principal.
     */
    EmitResult emitToPrincipal(const std::string& principal_id,
                               const std::string& event,
                               const std::string& payload,
                               const EmitOptions& options = {});

    /**
     * @brief Deliver an event to a single connection.
     */
    EmitResult emitToConnection(const std::string& connection_id,
                                const std::string& event,
                                const std::string& payload,
                                const EmitOptions& options = {});

    /// Underlying supervisor, for environment signals and stats.
    Supervisor& supervisor();

private:
    std::unique_ptr<ClientImpl> impl_;
};

}  // namespace client
}  // namespace courier
