/**
 * @file side_store.hpp
 * @brief Durable side-store contract and the in-process implementation.
 *
 * The side-store mirrors in-flight and queued envelopes so that a restarted
 * process can resume delivery. It is a list-per-key store with per-key expiry;
 * every operation reports failure instead of throwing, and callers treat a
 * failure as "continue memory-only".
 *
 * @copyright Copyright (c) 2024 Courier Contributors
 * @license MIT License
 */

#pragma once

#include "courier/core/export.hpp"

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace courier {
namespace core {

/**
 * @class SideStore
 * @brief List-valued key store with expiry.
 */
class COURIER_CORE_API SideStore {
public:
    using Predicate = std::function<bool(const std::string&)>;

    virtual ~SideStore() = default;

    /// Append @p value to the list at @p key.
    virtual bool push(const std::string& key, const std::string& value) = 0;

    /// Whole list at @p key (empty if absent), nullopt on store failure.
    virtual std::optional<std::vector<std::string>> list(const std::string& key) = 0;

    /// Remove every value at @p key matching @p predicate.
    virtual bool remove(const std::string& key, const Predicate& predicate) = 0;

    /**
     * @brief Make @p key live at least @p ttl from now.
     *
     * Extends only: an expiry already further out is kept. A key that has no
     * expiry yet gets one.
     */
    virtual bool expire(const std::string& key, std::chrono::seconds ttl) = 0;

    /// Short name for log lines.
    virtual std::string describe() const = 0;
};

/**
 * @class MemorySideStore
 * @brief In-process SideStore. Survives nothing; used by tests and as the
 *        daemon's default when no external store is configured.
 */
class COURIER_CORE_API MemorySideStore : public SideStore {
public:
    bool push(const std::string& key, const std::string& value) override;
    std::optional<std::vector<std::string>> list(const std::string& key) override;
    bool remove(const std::string& key, const Predicate& predicate) override;
    bool expire(const std::string& key, std::chrono::seconds ttl) override;
    std::string describe() const override { return "memory"; }

    size_t keyCount() const;

    /// Remaining lifetime of @p key, nullopt when absent or without expiry.
    std::optional<std::chrono::seconds> ttlOf(const std::string& key) const;

private:
    using Clock = std::chrono::steady_clock;

    struct Slot {
        std::vector<std::string> values;
        std::optional<Clock::time_point> expires_at;
    };

    // Drops the slot if its expiry has passed. Caller holds mutex_.
    void evictIfExpired(const std::string& key);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Slot> slots_;
};

}  // namespace core
}  // namespace courier
