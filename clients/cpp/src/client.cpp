/**
 * @file client.cpp
 * @brief Courier C++ Client Implementation
 */

#include "courier_client/client.hpp"
#include "courier_client/grpc_transport.hpp"
#include "courier/core/scheduler.hpp"
#include "courier/core/wire.hpp"

#include <grpcpp/grpcpp.h>
#include <chrono>
#include "courier/proto/delivery.grpc.pb.h"

namespace courier {
namespace client {

namespace {

SupervisorConfig toSupervisorConfig(const ClientOptions& options) {
    SupervisorConfig config;
    config.principal_id = options.principal_id;
    config.reconnect = options.reconnect;
    config.max_attempts = options.max_attempts;
    config.probe_interval = options.probe_interval;
    config.probe_timeout = options.probe_timeout;
    config.send_timeout = options.send_timeout;
    return config;
}

}  // namespace

/**
 * @brief Client implementation (PIMPL)
 */
class ClientImpl {
public:
    ClientImpl(const std::string& address, const ClientOptions& options)
        : address_(address)
        , transport_(std::make_shared<GrpcClientTransport>(address, options.connect_timeout))
        , scheduler_(std::make_shared<core::ThreadedScheduler>())
        , stub_(proto::DeliveryService::NewStub(transport_->channel()))
        , send_timeout_(options.send_timeout)
    {
        scheduler_->start();
        supervisor_ = std::make_unique<Supervisor>(toSupervisorConfig(options), transport_, scheduler_);
    }

    ~ClientImpl() {
        supervisor_.reset();
        scheduler_->stop();
    }

    EmitResult emit(proto::EmitRequest& request,
                    const std::string& event,
                    const std::string& payload,
                    const EmitOptions& options) {
        request.set_event(event);
        request.set_payload(payload);
        request.set_fire_and_forget(options.fire_and_forget);
        request.set_priority(core::toWirePriority(options.priority));
        request.set_ttl_ms(options.ttl_ms);
        request.set_envelope_id(options.envelope_id);

        proto::EmitResponse response;
        grpc::ClientContext context;
        context.set_deadline(std::chrono::system_clock::now() + send_timeout_);

        grpc::Status status = stub_->Emit(&context, request, &response);

        EmitResult result;
        if (status.ok()) {
            result.success = response.success();
            result.envelope_id = response.envelope_id();
            result.transmitted = response.transmitted();
            result.queued = response.queued();
            result.duplicate = response.duplicate();
            result.error_message = response.error_message();
        } else {
            result.success = false;
            result.error_message = status.error_message();
        }

        return result;
    }

    Supervisor& supervisor() { return *supervisor_; }

private:
    std::string address_;
    std::shared_ptr<GrpcClientTransport> transport_;
    std::shared_ptr<core::ThreadedScheduler> scheduler_;
    std::unique_ptr<proto::DeliveryService::Stub> stub_;
    const std::chrono::milliseconds send_timeout_;
    std::unique_ptr<Supervisor> supervisor_;
};


// ============================================================================
// Client Implementation
// ============================================================================

Client::Client(const std::string& address, const ClientOptions& options)
    : impl_(std::make_unique<ClientImpl>(address, options))
{
}

Client::~Client() = default;

Client::Client(Client&&) noexcept = default;
Client& Client::operator=(Client&&) noexcept = default;

void Client::setEnvelopeHandler(Supervisor::EnvelopeHandler handler) {
    impl_->supervisor().setEnvelopeHandler(std::move(handler));
}

void Client::setStateHandler(Supervisor::StateHandler handler) {
    impl_->supervisor().setStateHandler(std::move(handler));
}

void Client::setDeliveryFailedHandler(Supervisor::DeliveryFailedHandler handler) {
    impl_->supervisor().setDeliveryFailedHandler(std::move(handler));
}

void Client::connect() {
    impl_->supervisor().connect();
}

void Client::disconnect() {
    impl_->supervisor().disconnect();
}

ConnectionState Client::state() const {
    return impl_->supervisor().state();
}

bool Client::isConnected() const {
    return state() == ConnectionState::CONNECTED;
}

std::string Client::emitEvent(const std::string& event,
                              const std::string& payload,
                              Supervisor::EmitCallback callback) {
    return impl_->supervisor().emit(event, payload, std::move(callback));
}

EmitResult Client::emitToPrincipal(const std::string& principal_id,
                                   const std::string& event,
                                   const std::string& payload,
                                   const EmitOptions& options) {
    proto::EmitRequest request;
    request.set_principal_id(principal_id);
    return impl_->emit(request, event, payload, options);
}

EmitResult Client::emitToConnection(const std::string& connection_id,
                                    const std::string& event,
                                    const std::string& payload,
                                    const EmitOptions& options) {
    proto::EmitRequest request;
    request.set_connection_id(connection_id);
    return impl_->emit(request, event, payload, options);
}

Supervisor& Client::supervisor() {
    return impl_->supervisor();
}

}  // namespace client
}  // namespace courier
