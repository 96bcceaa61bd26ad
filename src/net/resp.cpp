/**
 * @file resp.cpp
 * @brief RESP encoding, parsing and the blocking TCP connection.
 *
 * @copyright Copyright (c) 2024 Courier Contributors
 * @license MIT License
 */

#include "courier/net/resp.hpp"
#include "courier/utils/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace courier {
namespace net {

// =============================================================================
// Encoding / parsing
// =============================================================================

std::string encodeRespCommand(const std::vector<std::string>& args) {
    std::string out = "*" + std::to_string(args.size()) + "\r\n";
    for (const auto& arg : args) {
        out += "$" + std::to_string(arg.size()) + "\r\n";
        out += arg;
        out += "\r\n";
    }
    return out;
}

namespace {

// Finds the CRLF-terminated line starting at pos. Returns false if incomplete.
bool readLine(const std::string& data, size_t pos, std::string& line, size_t& next) {
    size_t end = data.find("\r\n", pos);
    if (end == std::string::npos) {
        return false;
    }
    line = data.substr(pos, end - pos);
    next = end + 2;
    return true;
}

bool parseInteger(const std::string& text, int64_t& out) {
    if (text.empty()) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0') {
        return false;
    }
    out = static_cast<int64_t>(value);
    return true;
}

}  // namespace

RespParseStatus parseResp(const std::string& data, size_t& pos, RespValue& out) {
    if (pos >= data.size()) {
        return RespParseStatus::INCOMPLETE;
    }

    const char prefix = data[pos];
    std::string line;
    size_t cursor = 0;
    if (!readLine(data, pos + 1, line, cursor)) {
        return RespParseStatus::INCOMPLETE;
    }

    switch (prefix) {
        case '+':
            out.type = RespType::SIMPLE_STRING;
            out.str = line;
            pos = cursor;
            return RespParseStatus::COMPLETE;

        case '-':
            out.type = RespType::ERROR;
            out.str = line;
            pos = cursor;
            return RespParseStatus::COMPLETE;

        case ':':
            out.type = RespType::INTEGER;
            if (!parseInteger(line, out.integer)) {
                return RespParseStatus::MALFORMED;
            }
            pos = cursor;
            return RespParseStatus::COMPLETE;

        case '$': {
            int64_t length = 0;
            if (!parseInteger(line, length)) {
                return RespParseStatus::MALFORMED;
            }
            if (length < 0) {
                out.type = RespType::NIL;
                pos = cursor;
                return RespParseStatus::COMPLETE;
            }
            size_t needed = cursor + static_cast<size_t>(length) + 2;
            if (data.size() < needed) {
                return RespParseStatus::INCOMPLETE;
            }
            if (data.compare(needed - 2, 2, "\r\n") != 0) {
                return RespParseStatus::MALFORMED;
            }
            out.type = RespType::BULK_STRING;
            out.str = data.substr(cursor, static_cast<size_t>(length));
            pos = needed;
            return RespParseStatus::COMPLETE;
        }

        case '*': {
            int64_t count = 0;
            if (!parseInteger(line, count)) {
                return RespParseStatus::MALFORMED;
            }
            if (count < 0) {
                out.type = RespType::NIL;
                pos = cursor;
                return RespParseStatus::COMPLETE;
            }
            RespValue array;
            array.type = RespType::ARRAY;
            array.array.reserve(static_cast<size_t>(count));
            for (int64_t i = 0; i < count; ++i) {
                RespValue child;
                RespParseStatus status = parseResp(data, cursor, child);
                if (status != RespParseStatus::COMPLETE) {
                    return status;
                }
                array.array.push_back(std::move(child));
            }
            out = std::move(array);
            pos = cursor;
            return RespParseStatus::COMPLETE;
        }

        default:
            return RespParseStatus::MALFORMED;
    }
}

// =============================================================================
// RespConnection
// =============================================================================

RespConnection::RespConnection()
    : socket_(INVALID_SOCKET_HANDLE)
{}

RespConnection::~RespConnection() {
    close();
}

RespConnection::RespConnection(RespConnection&& other) noexcept
    : socket_(other.socket_)
    , timeout_(other.timeout_)
    , buffer_(std::move(other.buffer_))
    , lastError_(other.lastError_)
{
    other.socket_ = INVALID_SOCKET_HANDLE;
}

RespConnection& RespConnection::operator=(RespConnection&& other) noexcept {
    if (this != &other) {
        close();
        socket_ = other.socket_;
        timeout_ = other.timeout_;
        buffer_ = std::move(other.buffer_);
        lastError_ = other.lastError_;
        other.socket_ = INVALID_SOCKET_HANDLE;
    }
    return *this;
}

bool RespConnection::connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) {
    close();
    timeout_ = timeout;

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* result = nullptr;
    int rc = ::getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &result);
    if (rc != 0) {
        LOG_DEBUG("Resp", "Cannot resolve {}: {}", host, gai_strerror(rc));
        lastError_ = rc;
        return false;
    }

    for (addrinfo* rp = result; rp != nullptr; rp = rp->ai_next) {
        SocketHandle fd = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (fd == INVALID_SOCKET_HANDLE) {
            lastError_ = getLastSocketError();
            continue;
        }

        // Non-blocking connect so the timeout applies to the handshake too.
        setNonBlocking(fd, true);

        bool ok = ::connect(fd, rp->ai_addr, static_cast<socklen_t>(rp->ai_addrlen)) == 0;
        int error = ok ? 0 : getLastSocketError();

        if (!ok && connectInProgress(error)) {
            int ready = waitForSocket(fd, true, timeout);
            if (ready > 0) {
                socklen_t len = sizeof(error);
                ::getsockopt(fd, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&error), &len);
                ok = error == 0;
            } else {
                error = ready == 0 ? kTimedOutError : getLastSocketError();
            }
        }
        setNonBlocking(fd, false);

        if (ok) {
            int nodelay = 1;
            ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY,
                         reinterpret_cast<const char*>(&nodelay), sizeof(nodelay));
            socket_ = fd;
            break;
        }

        lastError_ = error;
        closeSocket(fd);
    }

    ::freeaddrinfo(result);
    buffer_.clear();
    return isConnected();
}

void RespConnection::close() {
    if (socket_ != INVALID_SOCKET_HANDLE) {
        closeSocket(socket_);
        socket_ = INVALID_SOCKET_HANDLE;
    }
    buffer_.clear();
}

bool RespConnection::sendAll(const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        auto n = sendSome(socket_, data.data() + sent, data.size() - sent);
        if (n <= 0) {
            lastError_ = getLastSocketError();
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

bool RespConnection::waitReadable() {
    int ready = waitForSocket(socket_, false, timeout_);
    if (ready <= 0) {
        lastError_ = ready == 0 ? kTimedOutError : getLastSocketError();
        return false;
    }
    return true;
}

std::optional<RespValue> RespConnection::execute(const std::vector<std::string>& args) {
    if (!isConnected()) {
        return std::nullopt;
    }

    if (!sendAll(encodeRespCommand(args))) {
        close();
        return std::nullopt;
    }

    char chunk[4096];
    while (true) {
        size_t pos = 0;
        RespValue value;
        RespParseStatus status = parseResp(buffer_, pos, value);

        if (status == RespParseStatus::COMPLETE) {
            buffer_.erase(0, pos);
            return value;
        }
        if (status == RespParseStatus::MALFORMED) {
            LOG_WARN("Resp", "Malformed reply to {}", args.empty() ? "" : args.front());
            close();
            return std::nullopt;
        }

        if (!waitReadable()) {
            close();
            return std::nullopt;
        }

        auto n = recvSome(socket_, chunk, sizeof(chunk));
        if (n <= 0) {
            lastError_ = n == 0 ? kResetError : getLastSocketError();
            close();
            return std::nullopt;
        }
        buffer_.append(chunk, static_cast<size_t>(n));
    }
}

}  // namespace net
}  // namespace courier
