/**
 * @file delivery_service.cpp
 * @brief DeliveryServiceImpl implementation.
 *
 * @copyright Copyright (c) 2024 Courier Contributors
 * @license MIT License
 */

#include "courier/services/delivery_service.hpp"
#include "courier/core/wire.hpp"
#include "courier/utils/logger.hpp"
#include "courier/utils/uuid.hpp"

#include <chrono>
#include <deque>
#include <exception>

namespace courier {
namespace services {

using ConnectReactorBase = grpc::ServerBidiReactor<proto::ClientFrame, proto::ServerFrame>;

class ConnectReactor;

// =============================================================================
// StreamSink - outbound half of a Connect stream
// =============================================================================

/**
 * Frames are queued and written one at a time; gRPC allows a single
 * outstanding write per stream. Finish is deferred until the write in
 * progress completes.
 */
class StreamSink : public core::ConnectionSink {
public:
    StreamSink(ConnectReactor* reactor, std::string connection_id)
        : reactor_(reactor)
        , connection_id_(std::move(connection_id))
    {}

    bool sendEnvelope(const core::Envelope& envelope, int64_t sent_at_ms) override {
        proto::ServerFrame frame;
        core::toWireEnvelope(envelope, sent_at_ms, frame.mutable_envelope());
        return enqueue(std::move(frame));
    }

    bool sendAck(const std::string& envelope_id) override {
        proto::ServerFrame frame;
        frame.mutable_ack()->set_envelope_id(envelope_id);
        return enqueue(std::move(frame));
    }

    bool sendPing(int64_t sent_at_ms) override {
        proto::ServerFrame frame;
        frame.mutable_ping()->set_sent_at_ms(sent_at_ms);
        return enqueue(std::move(frame));
    }

    bool sendPong(int64_t sent_at_ms) override {
        proto::ServerFrame frame;
        frame.mutable_pong()->set_sent_at_ms(sent_at_ms);
        return enqueue(std::move(frame));
    }

    bool sendDeliveryFailed(const std::string& envelope_id, const std::string& reason) override {
        proto::ServerFrame frame;
        auto* failed = frame.mutable_delivery_failed();
        failed->set_envelope_id(envelope_id);
        failed->set_reason(reason);
        return enqueue(std::move(frame));
    }

    void close(const std::string& reason) override;

    void onWriteDone(bool ok);

    /// The reactor is going away; nothing may touch it after this.
    void detach() {
        std::lock_guard<std::mutex> lock(mutex_);
        reactor_ = nullptr;
        finished_ = true;
        queue_.clear();
    }

    std::string closeReason() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closeReason_.empty() ? "stream finished" : closeReason_;
    }

private:
    bool enqueue(proto::ServerFrame frame);
    void finishLocked(std::unique_lock<std::mutex>& lock);

    mutable std::mutex mutex_;
    ConnectReactor* reactor_;
    const std::string connection_id_;
    std::deque<proto::ServerFrame> queue_;
    bool writing_ = false;
    bool closing_ = false;
    bool finished_ = false;
    std::string closeReason_;
};

// =============================================================================
// Connect Reactor
// =============================================================================

class ConnectReactor : public ConnectReactorBase {
public:
    ConnectReactor(DeliveryServiceImpl* service,
                   std::shared_ptr<core::DeliveryEngine> engine,
                   std::string peer)
        : service_(service)
        , engine_(std::move(engine))
        , connectionId_(utils::UUIDGenerator::generate())
        , peer_(std::move(peer))
    {
        sink_ = std::make_shared<StreamSink>(this, connectionId_);
        service_->trackStream(connectionId_, sink_);

        LOG_INFO("DeliveryService", "Connect: id={}, peer={}", connectionId_, peer_);

        if (!engine_->connectionOpened(connectionId_, sink_)) {
            sink_->close("registration failed");
            return;
        }
        StartRead(&incoming_);
    }

    void OnReadDone(bool ok) override {
        if (!ok) {
            sink_->close("client closed stream");
            return;
        }

        try {
            dispatch(incoming_);
        } catch (const std::exception& e) {
            LOG_ERROR("DeliveryService", "Frame handling failed on {}: {}", connectionId_, e.what());
        }

        incoming_.Clear();
        StartRead(&incoming_);
    }

    void OnWriteDone(bool ok) override {
        sink_->onWriteDone(ok);
    }

    void OnCancel() override {
        LOG_DEBUG("DeliveryService", "Connect cancelled: id={}", connectionId_);
        sink_->close("cancelled");
    }

    void OnDone() override {
        std::string reason = sink_->closeReason();
        sink_->detach();
        engine_->connectionClosed(connectionId_, reason);
        service_->untrackStream(connectionId_);
        LOG_DEBUG("DeliveryService", "Connect done: id={}", connectionId_);
        delete this;
    }

    void write(const proto::ServerFrame* frame) { StartWrite(frame); }
    void finish(const grpc::Status& status) { Finish(status); }

private:
    void dispatch(const proto::ClientFrame& frame) {
        switch (frame.frame_case()) {
            case proto::ClientFrame::kIdentify:
                if (frame.identify().principal_id().empty()) {
                    LOG_WARN("DeliveryService", "Empty identify on {}", connectionId_);
                    break;
                }
                engine_->principalIdentified(connectionId_, frame.identify().principal_id());
                break;

            case proto::ClientFrame::kAck:
                engine_->ackReceived(connectionId_, frame.ack().envelope_id());
                break;

            case proto::ClientFrame::kPing:
                engine_->pingReceived(connectionId_, frame.ping().sent_at_ms());
                break;

            case proto::ClientFrame::kPong:
                engine_->livenessResponseReceived(connectionId_);
                break;

            case proto::ClientFrame::kReplay:
                engine_->replayRequested(connectionId_, frame.replay().since_ms());
                break;

            case proto::ClientFrame::kEvent:
                engine_->inboundEvent(connectionId_, frame.event().envelope_id(),
                                      frame.event().event(), frame.event().payload());
                break;

            default:
                LOG_WARN("DeliveryService", "Empty frame on {}", connectionId_);
                break;
        }
    }

    DeliveryServiceImpl* service_;
    std::shared_ptr<core::DeliveryEngine> engine_;
    std::shared_ptr<StreamSink> sink_;
    const std::string connectionId_;
    const std::string peer_;
    proto::ClientFrame incoming_;
};

// =============================================================================
// StreamSink (continued)
// =============================================================================

bool StreamSink::enqueue(proto::ServerFrame frame) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (closing_ || finished_ || !reactor_) {
        return false;
    }

    queue_.push_back(std::move(frame));
    if (writing_) {
        return true;
    }

    writing_ = true;
    const proto::ServerFrame* next = &queue_.front();
    ConnectReactor* reactor = reactor_;
    lock.unlock();

    reactor->write(next);
    return true;
}

void StreamSink::onWriteDone(bool ok) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!queue_.empty()) {
        queue_.pop_front();
    }

    if (!ok) {
        LOG_DEBUG("DeliveryService", "Write failed on {}", connection_id_);
        queue_.clear();
        if (closeReason_.empty()) {
            closeReason_ = "write failed";
        }
        closing_ = true;
    }

    if (!queue_.empty() && reactor_) {
        const proto::ServerFrame* next = &queue_.front();
        ConnectReactor* reactor = reactor_;
        lock.unlock();
        reactor->write(next);
        return;
    }

    writing_ = false;
    if (closing_) {
        finishLocked(lock);
    }
}

void StreamSink::close(const std::string& reason) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (finished_) {
        return;
    }
    if (closeReason_.empty()) {
        closeReason_ = reason;
    }
    closing_ = true;

    // The write in flight finishes the stream from onWriteDone().
    if (writing_) {
        return;
    }
    finishLocked(lock);
}

void StreamSink::finishLocked(std::unique_lock<std::mutex>& lock) {
    if (finished_ || !reactor_) {
        return;
    }
    finished_ = true;
    ConnectReactor* reactor = reactor_;
    lock.unlock();

    reactor->finish(grpc::Status::OK);
}

// =============================================================================
// DeliveryServiceImpl
// =============================================================================

DeliveryServiceImpl::DeliveryServiceImpl(std::shared_ptr<core::DeliveryEngine> engine)
    : engine_(std::move(engine))
{
    LOG_INFO("DeliveryService", "DeliveryService initialized");
}

DeliveryServiceImpl::~DeliveryServiceImpl() {
    LOG_INFO("DeliveryService", "DeliveryService shutting down");
}

grpc::ServerBidiReactor<proto::ClientFrame, proto::ServerFrame>* DeliveryServiceImpl::Connect(
    grpc::CallbackServerContext* context) {
    return new ConnectReactor(this, engine_, context->peer());
}

// =============================================================================
// Emit
// =============================================================================

class EmitReactor : public grpc::ServerUnaryReactor {
public:
    EmitReactor(std::shared_ptr<core::DeliveryEngine> engine,
                const proto::EmitRequest* request,
                proto::EmitResponse* response)
    {
        core::Target target;
        switch (request->target_case()) {
            case proto::EmitRequest::kConnectionId:
                target = core::Target::connection(request->connection_id());
                break;
            case proto::EmitRequest::kPrincipalId:
                target = core::Target::principal(request->principal_id());
                break;
            default:
                response->set_success(false);
                response->set_error_message("target required");
                Finish(grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "target required"));
                return;
        }

        if (target.id.empty() || request->event().empty()) {
            response->set_success(false);
            response->set_error_message("target id and event are required");
            Finish(grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "target id and event are required"));
            return;
        }

        core::SendOptions options;
        options.requires_ack = !request->fire_and_forget();
        options.priority = core::fromWirePriority(request->priority());
        options.ttl = std::chrono::milliseconds(request->ttl_ms());
        options.envelope_id = request->envelope_id();

        LOG_DEBUG("DeliveryService", "Emit: event={}, target={}, ack={}",
                  request->event(), target.id, options.requires_ack);

        auto result = engine->send(target, request->event(), request->payload(), options);

        response->set_success(result.accepted);
        response->set_envelope_id(result.envelope_id);
        response->set_transmitted(static_cast<uint32_t>(result.transmitted));
        response->set_queued(result.queued);
        response->set_duplicate(result.duplicate);
        if (!result.accepted) {
            response->set_error_message("target unreachable");
        }

        Finish(grpc::Status::OK);
    }

    void OnDone() override {
        delete this;
    }
};

grpc::ServerUnaryReactor* DeliveryServiceImpl::Emit(
    grpc::CallbackServerContext* context,
    const proto::EmitRequest* request,
    proto::EmitResponse* response) {
    return new EmitReactor(engine_, request, response);
}

// =============================================================================
// Lifecycle
// =============================================================================

void DeliveryServiceImpl::trackStream(const std::string& connection_id, std::shared_ptr<StreamSink> sink) {
    std::lock_guard<std::mutex> lock(streamsMutex_);
    activeStreams_[connection_id] = std::move(sink);
}

void DeliveryServiceImpl::untrackStream(const std::string& connection_id) {
    std::lock_guard<std::mutex> lock(streamsMutex_);
    activeStreams_.erase(connection_id);
}

size_t DeliveryServiceImpl::activeStreams() const {
    std::lock_guard<std::mutex> lock(streamsMutex_);
    return activeStreams_.size();
}

void DeliveryServiceImpl::closeAll(const std::string& reason) {
    std::vector<std::shared_ptr<StreamSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(streamsMutex_);
        for (const auto& [id, sink] : activeStreams_) {
            sinks.push_back(sink);
        }
    }

    LOG_INFO("DeliveryService", "Closing {} open streams: {}", sinks.size(), reason);
    for (auto& sink : sinks) {
        sink->close(reason);
    }
}

}  // namespace services
}  // namespace courier
