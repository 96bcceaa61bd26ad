/**
 * @file client_transport.hpp
 * @brief Client side of one bidirectional delivery connection.
 *
 * The Supervisor drives a ClientTransport and never talks to gRPC directly,
 * so tests can substitute a scripted transport.
 *
 * @copyright Copyright (c) 2024 Courier Contributors
 * @license MIT License
 */

#pragma once

#include "courier/core/envelope.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace courier {
namespace client {

/**
 * @brief Envelope as seen by the client application.
 */
struct ReceivedEnvelope {
    std::string envelope_id;
    std::string event;
    std::string payload;
    bool requires_ack = true;
    int64_t created_at_ms = 0;
    int64_t sent_at_ms = 0;
    core::Priority priority = core::Priority::NORMAL;
};

/**
 * @class ClientTransport
 * @brief One connection to the delivery server at a time.
 *
 * open() blocks until the connection is usable or the attempt fails.
 * Handlers are invoked from transport threads. close() is idempotent and,
 * once it returns, no handler of the closed connection runs any more.
 * onClosed fires only for closes the transport did not get from close().
 */
class ClientTransport {
public:
    struct Handlers {
        std::function<void(const ReceivedEnvelope&)> onEnvelope;
        std::function<void(const std::string& envelope_id)> onAck;
        std::function<void(int64_t sent_at_ms)> onPing;
        std::function<void(int64_t sent_at_ms)> onPong;
        std::function<void(const std::string& envelope_id, const std::string& reason)> onDeliveryFailed;
        std::function<void(const std::string& reason)> onClosed;
    };

    virtual ~ClientTransport() = default;

    virtual bool open(Handlers handlers) = 0;
    virtual void close() = 0;

    virtual bool sendIdentify(const std::string& principal_id) = 0;
    virtual bool sendAck(const std::string& envelope_id) = 0;
    virtual bool sendPing(int64_t sent_at_ms) = 0;
    virtual bool sendPong(int64_t sent_at_ms) = 0;
    virtual bool sendReplayRequest(int64_t since_ms) = 0;
    virtual bool sendEvent(const std::string& envelope_id,
                           const std::string& event,
                           const std::string& payload) = 0;
};

}  // namespace client
}  // namespace courier
