/**
 * @file resp.hpp
 * @brief RESP (Redis serialization protocol) values and a blocking TCP client.
 *
 * Only what the side-store needs: command encoding, reply parsing for the
 * five RESP2 types, and a connection that sends one command and waits for
 * its reply with a bounded timeout.
 *
 * @copyright Copyright (c) 2024 Courier Contributors
 * @license MIT License
 */

#pragma once

#include "courier/net/export.hpp"
#include "courier/net/platform.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace courier {
namespace net {

enum class RespType {
    SIMPLE_STRING,
    ERROR,
    INTEGER,
    BULK_STRING,
    ARRAY,
    NIL
};

/**
 * @struct RespValue
 * @brief One decoded reply.
 */
struct COURIER_NET_API RespValue {
    RespType type = RespType::NIL;
    std::string str;               ///< Simple, error and bulk strings
    int64_t integer = 0;
    std::vector<RespValue> array;

    bool isError() const { return type == RespType::ERROR; }
};

enum class RespParseStatus {
    COMPLETE,    ///< One value decoded, @c pos advanced past it
    INCOMPLETE,  ///< Need more bytes, @c pos unchanged
    MALFORMED    ///< Not RESP
};

/**
 * @brief Encode a command as a RESP array of bulk strings.
 */
COURIER_NET_API std::string encodeRespCommand(const std::vector<std::string>& args);

/**
 * @brief Decode one value from @p data starting at @p pos.
 */
COURIER_NET_API RespParseStatus parseResp(const std::string& data, size_t& pos, RespValue& out);

/**
 * @class RespConnection
 * @brief RAII TCP connection speaking RESP request/reply.
 *
 * Not thread-safe; callers serialize access.
 */
class COURIER_NET_API RespConnection {
public:
    RespConnection();
    ~RespConnection();

    RespConnection(const RespConnection&) = delete;
    RespConnection& operator=(const RespConnection&) = delete;

    RespConnection(RespConnection&& other) noexcept;
    RespConnection& operator=(RespConnection&& other) noexcept;

    /**
     * @brief Resolve and connect, bounded by @p timeout.
     */
    bool connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout);

    void close();

    bool isConnected() const { return socket_ != INVALID_SOCKET_HANDLE; }

    /**
     * @brief Send one command and wait for its reply.
     * @return nullopt on any I/O failure; the connection is closed in that case.
     */
    std::optional<RespValue> execute(const std::vector<std::string>& args);

    int lastError() const { return lastError_; }

private:
    bool sendAll(const std::string& data);
    bool waitReadable();

    SocketHandle socket_;
    std::chrono::milliseconds timeout_{1000};
    std::string buffer_;
    int lastError_ = 0;
};

}  // namespace net
}  // namespace courier
