/**
 * @file resp_side_store.hpp
 * @brief SideStore backed by a Redis-compatible server over RESP.
 *
 * @copyright Copyright (c) 2024 Courier Contributors
 * @license MIT License
 */

#pragma once

#include "courier/core/side_store.hpp"
#include "courier/net/export.hpp"
#include "courier/net/resp.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace courier {
namespace net {

/**
 * @brief Parsed "resp://host:port" store location.
 */
struct COURIER_NET_API RespEndpoint {
    std::string host = "127.0.0.1";
    uint16_t port = 6379;

    std::string toString() const { return host + ":" + std::to_string(port); }

    /**
     * @brief Parse "resp://host:port" or "host:port". Port defaults to 6379.
     */
    static std::optional<RespEndpoint> parse(const std::string& uri);
};

/**
 * @class RespSideStore
 * @brief Maps the SideStore contract onto RPUSH / LRANGE / LREM / TTL + EXPIRE.
 *
 * One connection, used under a mutex. A failed call drops the connection;
 * the next call reconnects.
 */
class COURIER_NET_API RespSideStore : public core::SideStore {
public:
    explicit RespSideStore(RespEndpoint endpoint,
                           std::chrono::milliseconds timeout = std::chrono::milliseconds(500));

    bool push(const std::string& key, const std::string& value) override;
    std::optional<std::vector<std::string>> list(const std::string& key) override;
    bool remove(const std::string& key, const Predicate& predicate) override;
    bool expire(const std::string& key, std::chrono::seconds ttl) override;
    std::string describe() const override;

    /**
     * @brief Connect now and PING. Used at startup to report reachability.
     */
    bool ping();

private:
    // Caller holds mutex_.
    std::optional<RespValue> run(const std::vector<std::string>& args);

    const RespEndpoint endpoint_;
    const std::chrono::milliseconds timeout_;

    std::mutex mutex_;
    RespConnection connection_;
};

}  // namespace net
}  // namespace courier
