/**
 * @file envelope.cpp
 * @brief StoredEnvelope encoding for the durable mirror.
 *
 * @copyright Copyright (c) 2024 Courier Contributors
 * @license MIT License
 */

#include "courier/core/envelope.hpp"
#include "courier/core/wire.hpp"

namespace courier {
namespace core {

std::string encodeEnvelope(const Envelope& envelope) {
    proto::StoredEnvelope stored;
    stored.set_envelope_id(envelope.envelope_id);
    stored.set_event(envelope.event);
    stored.set_payload(envelope.payload);
    stored.set_principal_id(envelope.principal_id);
    stored.set_created_at_ms(envelope.created_at_ms);
    stored.set_expires_at_ms(envelope.expires_at_ms);
    stored.set_requires_ack(envelope.requires_ack);
    stored.set_retry_count(envelope.retry_count);
    stored.set_max_retries(envelope.max_retries);
    stored.set_priority(toWirePriority(envelope.priority));
    return stored.SerializeAsString();
}

std::optional<Envelope> decodeEnvelope(const std::string& bytes) {
    proto::StoredEnvelope stored;
    if (!stored.ParseFromString(bytes) || stored.envelope_id().empty()) {
        return std::nullopt;
    }

    Envelope envelope;
    envelope.envelope_id = stored.envelope_id();
    envelope.event = stored.event();
    envelope.payload = stored.payload();
    envelope.principal_id = stored.principal_id();
    envelope.created_at_ms = stored.created_at_ms();
    envelope.expires_at_ms = stored.expires_at_ms();
    envelope.requires_ack = stored.requires_ack();
    envelope.retry_count = stored.retry_count();
    envelope.max_retries = stored.max_retries();
    envelope.priority = fromWirePriority(stored.priority());
    return envelope;
}

}  // namespace core
}  // namespace courier
