/**
 * @file envelope.hpp
 * @brief Delivery envelope, send options and addressing targets.
 *
 * @copyright Copyright (c) 2024 Courier Contributors
 * @license MIT License
 */

#pragma once

#include "courier/core/export.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace courier {
namespace core {

/**
 * @enum Priority
 * @brief Envelope priority. Carried to the client; never reorders a queue.
 */
enum class Priority : int {
    LOW = 0,
    NORMAL = 1,
    HIGH = 2,
    URGENT = 3
};

inline const char* priorityToString(Priority priority) {
    switch (priority) {
        case Priority::LOW: return "low";
        case Priority::NORMAL: return "normal";
        case Priority::HIGH: return "high";
        case Priority::URGENT: return "urgent";
        default: return "unknown";
    }
}

/**
 * @struct Envelope
 * @brief The unit of delivery: an event plus its tracking metadata.
 *
 * An envelope lives in exactly one of: a connection's in-flight set, a
 * principal's pending queue, or nowhere (acknowledged, expired or failed).
 */
struct COURIER_CORE_API Envelope {
    std::string envelope_id;
    std::string event;
    std::string payload;            ///< Opaque bytes
    std::string principal_id;       ///< Empty for connection-targeted sends
    int64_t created_at_ms = 0;
    int64_t expires_at_ms = 0;      ///< 0 = never expires
    bool requires_ack = true;
    uint32_t retry_count = 0;
    uint32_t max_retries = 0;
    Priority priority = Priority::NORMAL;

    bool isExpired(int64_t now_ms) const {
        return expires_at_ms > 0 && now_ms >= expires_at_ms;
    }
};

/**
 * @struct SendOptions
 * @brief Per-send overrides. Zero / unset values fall back to DeliveryConfig.
 */
struct COURIER_CORE_API SendOptions {
    bool requires_ack = true;
    Priority priority = Priority::NORMAL;
    std::chrono::milliseconds ttl{0};
    std::optional<uint32_t> max_retries;

    /// Caller-chosen id. A repeated id is suppressed as a duplicate emit.
    std::string envelope_id;
};

/**
 * @struct Target
 * @brief Send destination: one connection or every connection of a principal.
 */
struct COURIER_CORE_API Target {
    enum class Kind {
        CONNECTION,
        PRINCIPAL
    };

    Kind kind = Kind::PRINCIPAL;
    std::string id;

    static Target connection(std::string connection_id) {
        return Target{Kind::CONNECTION, std::move(connection_id)};
    }

    static Target principal(std::string principal_id) {
        return Target{Kind::PRINCIPAL, std::move(principal_id)};
    }
};

/**
 * @brief Serialize an envelope for the durable mirror (StoredEnvelope bytes).
 */
COURIER_CORE_API std::string encodeEnvelope(const Envelope& envelope);

/**
 * @brief Parse bytes produced by encodeEnvelope().
 * @return nullopt when the bytes are not a valid stored envelope.
 */
COURIER_CORE_API std::optional<Envelope> decodeEnvelope(const std::string& bytes);

}  // namespace core
}  // namespace courier
