/**
 * @file delivery_service.hpp
 * @brief Callback gRPC service exposing the delivery engine.
 *
 * DeliveryService is the API clients and producers talk to:
 * - Connect: One bidirectional stream per client connection
 * - Emit: Send an event to a principal or a single connection
 *
 * @copyright Copyright (c) 2024 Courier Contributors
 * @license MIT License
 */

#pragma once

#include "courier/core/delivery_engine.hpp"
#include "courier/services/export.hpp"

#include <grpcpp/grpcpp.h>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "courier/proto/delivery.grpc.pb.h"

namespace courier {
namespace services {

class StreamSink;

/**
 * @class DeliveryServiceImpl
 * @brief Implementation of the DeliveryService gRPC service.
 *
 * Each Connect stream gets a fresh connection id and is registered with the
 * engine for its whole lifetime; the stream's outbound side is the
 * connection's ConnectionSink.
 *
 * Usage:
 * @code
 * auto engine = std::make_shared<core::DeliveryEngine>(config, scheduler, store);
 * DeliveryServiceImpl service(engine);
 *
 * grpc::ServerBuilder builder;
 * builder.AddListeningPort("0.0.0.0:50061", grpc::InsecureServerCredentials());
 * builder.RegisterService(&service);
 * auto server = builder.BuildAndStart();
 * @endcode
 */
class COURIER_SERVICES_API DeliveryServiceImpl final : public proto::DeliveryService::CallbackService {
public:
    explicit DeliveryServiceImpl(std::shared_ptr<core::DeliveryEngine> engine);
    ~DeliveryServiceImpl() override;

    // =========================================================================
    // gRPC Service Methods (Async Callback API)
    // =========================================================================

    /**
     * @brief Handle Connect RPC (bidirectional streaming).
     */
    grpc::ServerBidiReactor<proto::ClientFrame, proto::ServerFrame>* Connect(
        grpc::CallbackServerContext* context) override;

    /**
     * @brief Handle Emit RPC.
     */
    grpc::ServerUnaryReactor* Emit(
        grpc::CallbackServerContext* context,
        const proto::EmitRequest* request,
        proto::EmitResponse* response) override;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /**
     * @brief Finish every open stream. Call before Server::Shutdown().
     */
    void closeAll(const std::string& reason);

    size_t activeStreams() const;

    // Called by stream reactors.
    void trackStream(const std::string& connection_id, std::shared_ptr<StreamSink> sink);
    void untrackStream(const std::string& connection_id);

private:
    std::shared_ptr<core::DeliveryEngine> engine_;

    mutable std::mutex streamsMutex_;
    std::unordered_map<std::string, std::shared_ptr<StreamSink>> activeStreams_;
};

}  // namespace services
}  // namespace courier
