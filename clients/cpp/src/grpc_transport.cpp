/**
 * @file grpc_transport.cpp
 * @brief GrpcClientTransport implementation.
 *
 * @copyright Copyright (c) 2024 Courier Contributors
 * @license MIT License
 */

#include "courier_client/grpc_transport.hpp"
#include "courier/core/wire.hpp"
#include "courier/utils/logger.hpp"

#include <condition_variable>
#include <deque>
#include <functional>

namespace courier {
namespace client {

// =============================================================================
// Stream - one Connect call
// =============================================================================

class GrpcClientTransport::Stream
    : public grpc::ClientBidiReactor<proto::ClientFrame, proto::ServerFrame> {
public:
    Stream(proto::DeliveryService::Stub* stub, Handlers handlers)
        : handlers_(std::move(handlers))
    {
        stub->async()->Connect(&context_, this);
        StartRead(&incoming_);
        StartCall();
    }

    bool write(proto::ClientFrame frame) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (done_ || closing_ || failed_) {
            return false;
        }
        queue_.push_back(std::move(frame));
        if (writing_) {
            return true;
        }
        writing_ = true;
        const proto::ClientFrame* next = &queue_.front();
        lock.unlock();

        StartWrite(next);
        return true;
    }

    /// Cancel the call; onClosed is not reported for it.
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (done_) {
                return;
            }
            closing_ = true;
        }
        context_.TryCancel();
    }

    void waitDone() {
        std::unique_lock<std::mutex> lock(mutex_);
        doneCv_.wait(lock, [this]() { return done_; });
    }

    void OnWriteDone(bool ok) override {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!queue_.empty()) {
            queue_.pop_front();
        }
        if (!ok) {
            failed_ = true;
            queue_.clear();
            writing_ = false;
            return;
        }
        if (queue_.empty()) {
            writing_ = false;
            return;
        }
        const proto::ClientFrame* next = &queue_.front();
        lock.unlock();
        StartWrite(next);
    }

    void OnReadDone(bool ok) override {
        if (!ok) {
            return;
        }
        dispatch(incoming_);
        incoming_.Clear();
        StartRead(&incoming_);
    }

    // Marks the stream done before onClosed runs: the handler may close the
    // transport, which waits for done_ and then destroys this stream. Only
    // locals are touched after the lock is released.
    void OnDone(const grpc::Status& status) override {
        std::function<void(const std::string&)> on_closed;
        std::string reason = status.ok() ? "server closed stream" : status.error_message();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!closing_) {
                on_closed = handlers_.onClosed;
            }
            done_ = true;
            doneCv_.notify_all();
        }
        if (on_closed) {
            on_closed(reason);
        }
    }

private:
    void dispatch(const proto::ServerFrame& frame) {
        switch (frame.frame_case()) {
            case proto::ServerFrame::kEnvelope: {
                const auto& wire = frame.envelope();
                ReceivedEnvelope envelope;
                envelope.envelope_id = wire.envelope_id();
                envelope.event = wire.event();
                envelope.payload = wire.payload();
                envelope.requires_ack = wire.requires_ack();
                envelope.created_at_ms = wire.created_at_ms();
                envelope.sent_at_ms = wire.sent_at_ms();
                envelope.priority = core::fromWirePriority(wire.priority());
                if (handlers_.onEnvelope) {
                    handlers_.onEnvelope(envelope);
                }
                break;
            }
            case proto::ServerFrame::kAck:
                if (handlers_.onAck) {
                    handlers_.onAck(frame.ack().envelope_id());
                }
                break;
            case proto::ServerFrame::kPing:
                if (handlers_.onPing) {
                    handlers_.onPing(frame.ping().sent_at_ms());
                }
                break;
            case proto::ServerFrame::kPong:
                if (handlers_.onPong) {
                    handlers_.onPong(frame.pong().sent_at_ms());
                }
                break;
            case proto::ServerFrame::kDeliveryFailed:
                if (handlers_.onDeliveryFailed) {
                    handlers_.onDeliveryFailed(frame.delivery_failed().envelope_id(),
                                               frame.delivery_failed().reason());
                }
                break;
            default:
                LOG_WARN("GrpcTransport", "Empty server frame");
                break;
        }
    }

    const Handlers handlers_;
    grpc::ClientContext context_;
    proto::ServerFrame incoming_;

    std::mutex mutex_;
    std::condition_variable doneCv_;
    std::deque<proto::ClientFrame> queue_;
    bool writing_ = false;
    bool closing_ = false;
    bool failed_ = false;
    bool done_ = false;
};

// =============================================================================
// GrpcClientTransport
// =============================================================================

GrpcClientTransport::GrpcClientTransport(const std::string& address,
                                         std::chrono::milliseconds connect_timeout)
    : address_(address)
    , connect_timeout_(connect_timeout)
    , channel_(grpc::CreateChannel(address, grpc::InsecureChannelCredentials()))
    , stub_(proto::DeliveryService::NewStub(channel_))
{}

GrpcClientTransport::~GrpcClientTransport() {
    close();
}

bool GrpcClientTransport::open(Handlers handlers) {
    close();

    auto deadline = std::chrono::system_clock::now() + connect_timeout_;
    if (!channel_->WaitForConnected(deadline)) {
        LOG_DEBUG("GrpcTransport", "{} not reachable within {}ms", address_, connect_timeout_.count());
        return false;
    }

    auto stream = std::make_unique<Stream>(stub_.get(), std::move(handlers));

    std::lock_guard<std::mutex> lock(mutex_);
    stream_ = std::move(stream);
    LOG_DEBUG("GrpcTransport", "Stream opened to {}", address_);
    return true;
}

void GrpcClientTransport::close() {
    std::unique_ptr<Stream> stream;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stream = std::move(stream_);
    }
    if (!stream) {
        return;
    }
    stream->cancel();
    stream->waitDone();
}

bool GrpcClientTransport::write(proto::ClientFrame frame) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!stream_) {
        return false;
    }
    return stream_->write(std::move(frame));
}

bool GrpcClientTransport::sendIdentify(const std::string& principal_id) {
    proto::ClientFrame frame;
    frame.mutable_identify()->set_principal_id(principal_id);
    return write(std::move(frame));
}

bool GrpcClientTransport::sendAck(const std::string& envelope_id) {
    proto::ClientFrame frame;
    frame.mutable_ack()->set_envelope_id(envelope_id);
    return write(std::move(frame));
}

bool GrpcClientTransport::sendPing(int64_t sent_at_ms) {
    proto::ClientFrame frame;
    frame.mutable_ping()->set_sent_at_ms(sent_at_ms);
    return write(std::move(frame));
}

bool GrpcClientTransport::sendPong(int64_t sent_at_ms) {
    proto::ClientFrame frame;
    frame.mutable_pong()->set_sent_at_ms(sent_at_ms);
    return write(std::move(frame));
}

bool GrpcClientTransport::sendReplayRequest(int64_t since_ms) {
    proto::ClientFrame frame;
    frame.mutable_replay()->set_since_ms(since_ms);
    return write(std::move(frame));
}

bool GrpcClientTransport::sendEvent(const std::string& envelope_id,
                                    const std::string& event,
                                    const std::string& payload) {
    proto::ClientFrame frame;
    auto* wire = frame.mutable_event();
    wire->set_envelope_id(envelope_id);
    wire->set_event(event);
    wire->set_payload(payload);
    return write(std::move(frame));
}

}  // namespace client
}  // namespace courier
