/**
 * @file memory_side_store.cpp
 * @brief MemorySideStore implementation.
 *
 * @copyright Copyright (c) 2024 Courier Contributors
 * @license MIT License
 */

#include "courier/core/side_store.hpp"

#include <algorithm>

namespace courier {
namespace core {

void MemorySideStore::evictIfExpired(const std::string& key) {
    auto it = slots_.find(key);
    if (it != slots_.end() && it->second.expires_at &&
        *it->second.expires_at <= Clock::now()) {
        slots_.erase(it);
    }
}

bool MemorySideStore::push(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    evictIfExpired(key);
    slots_[key].values.push_back(value);
    return true;
}

std::optional<std::vector<std::string>> MemorySideStore::list(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    evictIfExpired(key);
    auto it = slots_.find(key);
    if (it == slots_.end()) {
        return std::vector<std::string>{};
    }
    return it->second.values;
}

bool MemorySideStore::remove(const std::string& key, const Predicate& predicate) {
    std::lock_guard<std::mutex> lock(mutex_);
    evictIfExpired(key);
    auto it = slots_.find(key);
    if (it == slots_.end()) {
        return true;
    }

    auto& values = it->second.values;
    values.erase(std::remove_if(values.begin(), values.end(), predicate), values.end());
    if (values.empty()) {
        slots_.erase(it);
    }
    return true;
}

bool MemorySideStore::expire(const std::string& key, std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(key);
    if (it == slots_.end()) {
        return true;
    }
    auto expires_at = Clock::now() + ttl;
    if (!it->second.expires_at || *it->second.expires_at < expires_at) {
        it->second.expires_at = expires_at;
    }
    return true;
}

std::optional<std::chrono::seconds> MemorySideStore::ttlOf(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(key);
    if (it == slots_.end() || !it->second.expires_at) {
        return std::nullopt;
    }
    auto remaining = *it->second.expires_at - Clock::now();
    if (remaining <= Clock::duration::zero()) {
        return std::nullopt;
    }
    return std::chrono::ceil<std::chrono::seconds>(remaining);
}

size_t MemorySideStore::keyCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

}  // namespace core
}  // namespace courier
