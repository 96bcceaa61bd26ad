/**
 * @file wire.hpp
 * @brief Conversions between core types and the protobuf wire messages.
 *
 * @copyright Copyright (c) 2024 Courier Contributors
 * @license MIT License
 */

#pragma once

#include "courier/core/envelope.hpp"
#include "courier/proto/delivery.pb.h"

namespace courier {
namespace core {

inline proto::Priority toWirePriority(Priority priority) {
    switch (priority) {
        case Priority::LOW: return proto::PRIORITY_LOW;
        case Priority::HIGH: return proto::PRIORITY_HIGH;
        case Priority::URGENT: return proto::PRIORITY_URGENT;
        case Priority::NORMAL:
        default: return proto::PRIORITY_NORMAL;
    }
}

inline Priority fromWirePriority(proto::Priority priority) {
    switch (priority) {
        case proto::PRIORITY_LOW: return Priority::LOW;
        case proto::PRIORITY_HIGH: return Priority::HIGH;
        case proto::PRIORITY_URGENT: return Priority::URGENT;
        default: return Priority::NORMAL;
    }
}

/**
 * @brief Fill the wire form of an envelope as sent to a client.
 */
inline void toWireEnvelope(const Envelope& envelope, int64_t sent_at_ms, proto::Envelope* out) {
    out->set_envelope_id(envelope.envelope_id);
    out->set_event(envelope.event);
    out->set_payload(envelope.payload);
    out->set_requires_ack(envelope.requires_ack);
    out->set_sent_at_ms(sent_at_ms);
    out->set_created_at_ms(envelope.created_at_ms);
    out->set_priority(toWirePriority(envelope.priority));
}

}  // namespace core
}  // namespace courier
