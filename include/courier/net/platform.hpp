/**
 * @file platform.hpp
 * @brief Socket portability layer for the side-store client.
 *
 * Winsock2 and POSIX differ in handle types, error retrieval, non-blocking
 * mode and send flags. The helpers here hide those differences from the
 * RESP connection, which only needs blocking TCP with bounded waits.
 *
 * @copyright Copyright (c) 2024 Courier Contributors
 * @license MIT License
 */

#pragma once

#include <chrono>
#include <cstddef>

#ifdef _WIN32
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
    #include <WinSock2.h>
    #include <WS2tcpip.h>

    #pragma comment(lib, "Ws2_32.lib")

    namespace courier {
    namespace net {
        using SocketHandle = SOCKET;
        constexpr SocketHandle INVALID_SOCKET_HANDLE = INVALID_SOCKET;

        inline int getLastSocketError() { return WSAGetLastError(); }
        inline void closeSocket(SocketHandle s) { ::closesocket(s); }

        inline bool initializeSockets() {
            WSADATA wsaData;
            return WSAStartup(MAKEWORD(2, 2), &wsaData) == 0;
        }

        inline void cleanupSockets() {
            WSACleanup();
        }

        inline bool setNonBlocking(SocketHandle s, bool enabled) {
            u_long mode = enabled ? 1 : 0;
            return ::ioctlsocket(s, FIONBIO, &mode) == 0;
        }

        inline bool connectInProgress(int error) { return error == WSAEWOULDBLOCK; }

        inline int sendSome(SocketHandle s, const char* data, size_t size) {
            return ::send(s, data, static_cast<int>(size), 0);
        }

        inline int recvSome(SocketHandle s, char* data, size_t size) {
            return ::recv(s, data, static_cast<int>(size), 0);
        }

        constexpr int kTimedOutError = WSAETIMEDOUT;
        constexpr int kResetError = WSAECONNRESET;
    }  // namespace net
    }  // namespace courier

#else
    #include <arpa/inet.h>
    #include <errno.h>
    #include <fcntl.h>
    #include <netdb.h>
    #include <netinet/in.h>
    #include <netinet/tcp.h>
    #include <sys/select.h>
    #include <sys/socket.h>
    #include <sys/types.h>
    #include <unistd.h>

    namespace courier {
    namespace net {
        using SocketHandle = int;
        constexpr SocketHandle INVALID_SOCKET_HANDLE = -1;

        inline int getLastSocketError() { return errno; }
        inline void closeSocket(SocketHandle s) { ::close(s); }

        inline bool initializeSockets() { return true; }
        inline void cleanupSockets() {}

        inline bool setNonBlocking(SocketHandle s, bool enabled) {
            int flags = ::fcntl(s, F_GETFL, 0);
            if (flags < 0) {
                return false;
            }
            flags = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
            return ::fcntl(s, F_SETFL, flags) == 0;
        }

        inline bool connectInProgress(int error) { return error == EINPROGRESS; }

        // MSG_NOSIGNAL: a peer that went away must not raise SIGPIPE.
        inline ssize_t sendSome(SocketHandle s, const char* data, size_t size) {
            return ::send(s, data, size, MSG_NOSIGNAL);
        }

        inline ssize_t recvSome(SocketHandle s, char* data, size_t size) {
            return ::recv(s, data, size, 0);
        }

        constexpr int kTimedOutError = ETIMEDOUT;
        constexpr int kResetError = ECONNRESET;
    }  // namespace net
    }  // namespace courier

#endif

namespace courier {
namespace net {

/**
 * @brief Wait until @p s is readable (or writable when @p forWrite).
 * @return >0 ready, 0 timed out, <0 error.
 */
inline int waitForSocket(SocketHandle s, bool forWrite, std::chrono::milliseconds timeout) {
    fd_set set;
    FD_ZERO(&set);
    FD_SET(s, &set);

    struct timeval tv;
    tv.tv_sec = static_cast<long>(timeout.count() / 1000);
    tv.tv_usec = static_cast<long>((timeout.count() % 1000) * 1000);

#ifdef _WIN32
    const int nfds = 0;
#else
    const int nfds = s + 1;
#endif
    return forWrite ? ::select(nfds, nullptr, &set, nullptr, &tv)
                    : ::select(nfds, &set, nullptr, nullptr, &tv);
}

/**
 * @brief RAII helper for socket initialization.
 *
 * The daemon creates one at startup; required for Winsock.
 */
class SocketInitializer {
public:
    SocketInitializer() : initialized_(initializeSockets()) {}
    ~SocketInitializer() { if (initialized_) cleanupSockets(); }

    bool isInitialized() const { return initialized_; }

    SocketInitializer(const SocketInitializer&) = delete;
    SocketInitializer& operator=(const SocketInitializer&) = delete;

private:
    bool initialized_;
};

}  // namespace net
}  // namespace courier
