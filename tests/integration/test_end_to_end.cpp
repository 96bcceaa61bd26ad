/**
 * @file test_end_to_end.cpp
 * @brief Integration test: a delivery server and clients over real gRPC streams
 */

#include <gtest/gtest.h>
#include <courier/utils/logger.hpp>
#include <courier/core/delivery_engine.hpp>
#include <courier/core/scheduler.hpp>
#include <courier/core/side_store.hpp>
#include <courier/services/delivery_service.hpp>
#include <courier_client/client.hpp>
#include "courier/proto/delivery.grpc.pb.h"

#include <grpcpp/grpcpp.h>
#include <grpcpp/server_builder.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace courier;

/**
 * @brief Engine, service and gRPC server on an ephemeral loopback port
 */
class TestServer {
public:
    TestServer()
        : scheduler_(std::make_shared<core::ThreadedScheduler>())
        , store_(std::make_shared<core::MemorySideStore>())
    {
    }

    ~TestServer() {
        stop();
    }

    bool start() {
        scheduler_->start();

        core::DeliveryConfig config;
        config.ack_timeout = std::chrono::milliseconds(2000);
        engine_ = std::make_shared<core::DeliveryEngine>(config, scheduler_, store_);
        engine_->setInboundHandler([this](const core::InboundEvent& event) {
            std::lock_guard<std::mutex> lock(mutex_);
            inbound_.push_back(event);
        });
        engine_->start();

        service_ = std::make_unique<services::DeliveryServiceImpl>(engine_);

        grpc::ServerBuilder builder;
        builder.AddListeningPort("127.0.0.1:0", grpc::InsecureServerCredentials(), &port_);
        builder.RegisterService(service_.get());
        server_ = builder.BuildAndStart();

        if (!server_ || port_ == 0) {
            LOG_ERROR("TestServer", "Failed to start delivery server");
            return false;
        }
        return true;
    }

    void stop() {
        if (server_) {
            service_->closeAll("test finished");
            server_->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(2));
            server_.reset();
        }
        if (engine_) {
            engine_->stop();
        }
        scheduler_->stop();
    }

    void kickAll() {
        service_->closeAll("kicked");
    }

    std::string address() const {
        return "127.0.0.1:" + std::to_string(port_);
    }

    core::DeliveryEngine& engine() { return *engine_; }

    std::vector<core::InboundEvent> inbound() {
        std::lock_guard<std::mutex> lock(mutex_);
        return inbound_;
    }

private:
    std::shared_ptr<core::ThreadedScheduler> scheduler_;
    std::shared_ptr<core::MemorySideStore> store_;
    std::shared_ptr<core::DeliveryEngine> engine_;
    std::unique_ptr<services::DeliveryServiceImpl> service_;
    std::unique_ptr<grpc::Server> server_;
    int port_ = 0;

    std::mutex mutex_;
    std::vector<core::InboundEvent> inbound_;
};

class EndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::Logger::instance().setLevel(utils::LogLevel::WARN);
        server_ = std::make_unique<TestServer>();
        ASSERT_TRUE(server_->start());
    }

    void TearDown() override {
        server_.reset();
    }

    std::unique_ptr<client::Client> makeClient(const std::string& principal) {
        client::ClientOptions options;
        options.principal_id = principal;
        auto c = std::make_unique<client::Client>(server_->address(), options);
        c->setEnvelopeHandler([this](const client::ReceivedEnvelope& envelope) {
            std::lock_guard<std::mutex> lock(mutex_);
            received_.push_back(envelope);
        });
        return c;
    }

    static bool waitFor(const std::function<bool()>& condition,
                        std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (condition()) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return condition();
    }

    std::vector<client::ReceivedEnvelope> received() {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

    std::unique_ptr<TestServer> server_;
    std::mutex mutex_;
    std::vector<client::ReceivedEnvelope> received_;
};

TEST_F(EndToEndTest, DeliversAndAcknowledges) {
    auto c = makeClient("user-1");
    c->connect();
    ASSERT_TRUE(waitFor([&]() { return c->isConnected(); }));
    ASSERT_TRUE(waitFor([&]() { return server_->engine().stats().registry.identified == 1; }));

    auto result = server_->engine().send(core::Target::principal("user-1"), "message.new", "hello");
    EXPECT_TRUE(result.accepted);
    EXPECT_EQ(result.transmitted, 1u);

    ASSERT_TRUE(waitFor([&]() { return received().size() == 1; }));
    EXPECT_EQ(received()[0].event, "message.new");
    EXPECT_EQ(received()[0].payload, "hello");
    EXPECT_EQ(received()[0].envelope_id, result.envelope_id);

    EXPECT_TRUE(waitFor([&]() { return server_->engine().stats().acked == 1; }));

    c->disconnect();
}

TEST_F(EndToEndTest, QueuedWhileOfflineThenDrained) {
    auto result = server_->engine().send(core::Target::principal("user-2"), "message.new", "first");
    server_->engine().send(core::Target::principal("user-2"), "message.new", "second");
    EXPECT_TRUE(result.queued);

    auto c = makeClient("user-2");
    c->connect();

    ASSERT_TRUE(waitFor([&]() { return received().size() == 2; }));
    EXPECT_EQ(received()[0].payload, "first");
    EXPECT_EQ(received()[1].payload, "second");
    EXPECT_TRUE(waitFor([&]() { return server_->engine().stats().acked == 2; }));

    c->disconnect();
}

TEST_F(EndToEndTest, ProducerEmitReachesConnectedPrincipal) {
    auto receiver = makeClient("user-3");
    receiver->connect();
    ASSERT_TRUE(waitFor([&]() { return server_->engine().stats().registry.identified == 1; }));

    client::ClientOptions producer_options;
    producer_options.principal_id = "producer";
    client::Client producer(server_->address(), producer_options);

    auto result = producer.emitToPrincipal("user-3", "order.shipped", "#42");
    EXPECT_TRUE(result.success) << result.error_message;
    EXPECT_FALSE(result.envelope_id.empty());

    ASSERT_TRUE(waitFor([&]() { return received().size() == 1; }));
    EXPECT_EQ(received()[0].event, "order.shipped");

    auto unknown = producer.emitToConnection("no-such-connection", "x", "y");
    EXPECT_FALSE(unknown.success);

    receiver->disconnect();
}

TEST_F(EndToEndTest, ClientEventIsAcknowledgedByServer) {
    auto c = makeClient("user-4");
    c->connect();
    ASSERT_TRUE(waitFor([&]() { return server_->engine().stats().registry.identified == 1; }));

    std::atomic<int> resolved{0};
    std::atomic<bool> ok{false};
    c->emitEvent("typing", "on", [&](bool success, const std::string&) {
        ok = success;
        ++resolved;
    });

    ASSERT_TRUE(waitFor([&]() { return resolved.load() == 1; }));
    EXPECT_TRUE(ok.load());

    auto inbound = server_->inbound();
    ASSERT_EQ(inbound.size(), 1u);
    EXPECT_EQ(inbound[0].principal_id, "user-4");
    EXPECT_EQ(inbound[0].event, "typing");

    c->disconnect();
}

TEST_F(EndToEndTest, ServerCloseTriggersReconnect) {
    auto c = makeClient("user-5");
    c->connect();
    ASSERT_TRUE(waitFor([&]() { return server_->engine().stats().registry.identified == 1; }));

    ASSERT_EQ(server_->engine().registry().findByPrincipal("user-5").size(), 1u);
    server_->kickAll();

    ASSERT_TRUE(waitFor([&]() { return c->supervisor().stats().reconnects >= 1; }));
    ASSERT_TRUE(waitFor([&]() { return server_->engine().stats().registry.identified == 1; }));

    c->disconnect();
}

TEST_F(EndToEndTest, StateHandlerMayDisconnectOnLostConnection) {
    auto c = makeClient("user-6");
    client::Client* raw = c.get();
    std::atomic<bool> connected{false};
    std::atomic<bool> fired{false};
    std::atomic<bool> returned{false};
    c->setStateHandler([&, raw](client::ConnectionState state, const std::string&) {
        if (state == client::ConnectionState::CONNECTED) {
            connected = true;
            return;
        }
        if (connected.load() && !fired.exchange(true)) {
            raw->disconnect();
            returned = true;
        }
    });

    c->connect();
    ASSERT_TRUE(waitFor([&]() { return server_->engine().stats().registry.identified == 1; }));

    server_->kickAll();

    ASSERT_TRUE(waitFor([&]() { return returned.load(); }));
    EXPECT_EQ(c->state(), client::ConnectionState::DISCONNECTED);
    EXPECT_TRUE(waitFor([&]() { return server_->engine().stats().registry.identified == 0; }));
}

/**
 * @brief Takes Emit calls and holds them unanswered until released
 */
class StalledEmitService : public proto::DeliveryService::CallbackService {
public:
    grpc::ServerUnaryReactor* Emit(grpc::CallbackServerContext* context,
                                   const proto::EmitRequest* /*request*/,
                                   proto::EmitResponse* /*response*/) override {
        auto* reactor = context->DefaultReactor();
        std::lock_guard<std::mutex> lock(mutex_);
        held_.push_back(reactor);
        return reactor;
    }

    size_t held() {
        std::lock_guard<std::mutex> lock(mutex_);
        return held_.size();
    }

    void releaseAll() {
        std::vector<grpc::ServerUnaryReactor*> held;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            held.swap(held_);
        }
        for (auto* reactor : held) {
            reactor->Finish(grpc::Status(grpc::StatusCode::CANCELLED, "released"));
        }
    }

private:
    std::mutex mutex_;
    std::vector<grpc::ServerUnaryReactor*> held_;
};

class StalledServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::Logger::instance().setLevel(utils::LogLevel::WARN);
        grpc::ServerBuilder builder;
        builder.AddListeningPort("127.0.0.1:0", grpc::InsecureServerCredentials(), &port_);
        builder.RegisterService(&service_);
        server_ = builder.BuildAndStart();
        ASSERT_TRUE(server_ != nullptr);
        ASSERT_NE(port_, 0);
    }

    void TearDown() override {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (service_.held() == 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        service_.releaseAll();
        if (server_) {
            server_->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(2));
        }
    }

    std::string address() const {
        return "127.0.0.1:" + std::to_string(port_);
    }

    StalledEmitService service_;
    std::unique_ptr<grpc::Server> server_;
    int port_ = 0;
};

TEST_F(StalledServerTest, EmitFailsOnceSendTimeoutPasses) {
    client::ClientOptions options;
    options.principal_id = "producer";
    options.send_timeout = std::chrono::milliseconds(300);
    client::Client producer(address(), options);

    auto started = std::chrono::steady_clock::now();
    auto result = producer.emitToPrincipal("user-1", "message.new", "hello");
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error_message.empty());
    EXPECT_GE(elapsed, std::chrono::milliseconds(250));
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}
