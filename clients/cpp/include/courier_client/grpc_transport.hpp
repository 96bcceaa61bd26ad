/**
 * @file grpc_transport.hpp
 * @brief ClientTransport over the DeliveryService/Connect gRPC stream.
 *
 * @copyright Copyright (c) 2024 Courier Contributors
 * @license MIT License
 */

#pragma once

#include "courier_client/client_transport.hpp"

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "courier/proto/delivery.grpc.pb.h"

namespace courier {
namespace client {

/**
 * @class GrpcClientTransport
 * @brief One Connect stream per open(), driven by a callback reactor.
 */
class GrpcClientTransport : public ClientTransport {
public:
    /**
     * @param address Server address in "host:port" format
     * @param connect_timeout How long open() waits for the channel
     */
    explicit GrpcClientTransport(const std::string& address,
                                 std::chrono::milliseconds connect_timeout = std::chrono::milliseconds(5000));
    ~GrpcClientTransport() override;

    GrpcClientTransport(const GrpcClientTransport&) = delete;
    GrpcClientTransport& operator=(const GrpcClientTransport&) = delete;

    bool open(Handlers handlers) override;
    void close() override;

    bool sendIdentify(const std::string& principal_id) override;
    bool sendAck(const std::string& envelope_id) override;
    bool sendPing(int64_t sent_at_ms) override;
    bool sendPong(int64_t sent_at_ms) override;
    bool sendReplayRequest(int64_t since_ms) override;
    bool sendEvent(const std::string& envelope_id,
                   const std::string& event,
                   const std::string& payload) override;

    std::shared_ptr<grpc::Channel> channel() const { return channel_; }

private:
    class Stream;

    bool write(proto::ClientFrame frame);

    const std::string address_;
    const std::chrono::milliseconds connect_timeout_;
    std::shared_ptr<grpc::Channel> channel_;
    std::unique_ptr<proto::DeliveryService::Stub> stub_;

    std::mutex mutex_;
    std::unique_ptr<Stream> stream_;
};

}  // namespace client
}  // namespace courier
