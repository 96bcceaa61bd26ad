/**
 * @file resp_side_store.cpp
 * @brief RespSideStore implementation.
 *
 * @copyright Copyright (c) 2024 Courier Contributors
 * @license MIT License
 */

#include "courier/net/resp_side_store.hpp"
#include "courier/utils/logger.hpp"

#include <cstdlib>

namespace courier {
namespace net {

std::optional<RespEndpoint> RespEndpoint::parse(const std::string& uri) {
    std::string rest = uri;
    const std::string scheme = "resp://";
    if (rest.compare(0, scheme.size(), scheme) == 0) {
        rest = rest.substr(scheme.size());
    }
    if (rest.empty()) {
        return std::nullopt;
    }

    RespEndpoint endpoint;
    size_t colon = rest.rfind(':');
    if (colon == std::string::npos) {
        endpoint.host = rest;
        return endpoint;
    }

    endpoint.host = rest.substr(0, colon);
    std::string port = rest.substr(colon + 1);
    if (endpoint.host.empty() || port.empty()) {
        return std::nullopt;
    }

    char* end = nullptr;
    long value = std::strtol(port.c_str(), &end, 10);
    if (*end != '\0' || value <= 0 || value > 65535) {
        return std::nullopt;
    }
    endpoint.port = static_cast<uint16_t>(value);
    return endpoint;
}

RespSideStore::RespSideStore(RespEndpoint endpoint, std::chrono::milliseconds timeout)
    : endpoint_(std::move(endpoint))
    , timeout_(timeout)
{}

std::string RespSideStore::describe() const {
    return "resp://" + endpoint_.toString();
}

std::optional<RespValue> RespSideStore::run(const std::vector<std::string>& args) {
    if (!connection_.isConnected()) {
        if (!connection_.connect(endpoint_.host, endpoint_.port, timeout_)) {
            LOG_DEBUG("SideStore", "Connect to {} failed (error {})",
                      endpoint_.toString(), connection_.lastError());
            return std::nullopt;
        }
        LOG_DEBUG("SideStore", "Connected to {}", endpoint_.toString());
    }

    auto reply = connection_.execute(args);
    if (!reply) {
        LOG_DEBUG("SideStore", "{} on {} failed (error {})",
                  args.front(), endpoint_.toString(), connection_.lastError());
        return std::nullopt;
    }
    if (reply->isError()) {
        LOG_WARN("SideStore", "{} rejected by {}: {}", args.front(), endpoint_.toString(), reply->str);
        return std::nullopt;
    }
    return reply;
}

bool RespSideStore::ping() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto reply = run({"PING"});
    return reply && reply->type == RespType::SIMPLE_STRING;
}

bool RespSideStore::push(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto reply = run({"RPUSH", key, value});
    return reply && reply->type == RespType::INTEGER;
}

std::optional<std::vector<std::string>> RespSideStore::list(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto reply = run({"LRANGE", key, "0", "-1"});
    if (!reply) {
        return std::nullopt;
    }
    if (reply->type == RespType::NIL) {
        return std::vector<std::string>{};
    }
    if (reply->type != RespType::ARRAY) {
        return std::nullopt;
    }

    std::vector<std::string> values;
    values.reserve(reply->array.size());
    for (auto& item : reply->array) {
        if (item.type == RespType::BULK_STRING || item.type == RespType::SIMPLE_STRING) {
            values.push_back(std::move(item.str));
        }
    }
    return values;
}

bool RespSideStore::remove(const std::string& key, const Predicate& predicate) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto reply = run({"LRANGE", key, "0", "-1"});
    if (!reply) {
        return false;
    }
    if (reply->type != RespType::ARRAY) {
        return reply->type == RespType::NIL;
    }

    for (const auto& item : reply->array) {
        if (item.type != RespType::BULK_STRING || !predicate(item.str)) {
            continue;
        }
        // count 0 removes every copy of the value
        auto removed = run({"LREM", key, "0", item.str});
        if (!removed || removed->type != RespType::INTEGER) {
            return false;
        }
    }
    return true;
}

bool RespSideStore::expire(const std::string& key, std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto current = run({"TTL", key});
    if (!current || current->type != RespType::INTEGER) {
        return false;
    }
    // -2: no such key, -1: no expiry set yet
    if (current->integer == -2 || current->integer >= ttl.count()) {
        return true;
    }
    auto reply = run({"EXPIRE", key, std::to_string(ttl.count())});
    return reply && reply->type == RespType::INTEGER;
}

}  // namespace net
}  // namespace courier
