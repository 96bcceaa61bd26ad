/**
 * @file main.cpp
 * @brief Courier daemon entry point
 *
 * This is the thin executable that wires together all the library components:
 * - Timer scheduler for ack timeouts, retries and the liveness sweep
 * - Durable side-store (in-memory or RESP) mirroring unacknowledged envelopes
 * - Delivery engine
 * - Delivery service for clients and producers
 */

#include "courier/daemon/config.hpp"
#include "courier/core/delivery_engine.hpp"
#include "courier/core/scheduler.hpp"
#include "courier/core/side_store.hpp"
#include "courier/net/platform.hpp"
#include "courier/net/resp_side_store.hpp"
#include "courier/services/delivery_service.hpp"
#include "courier/utils/logger.hpp"

#include <grpcpp/grpcpp.h>
#include <grpcpp/server_builder.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <thread>

using namespace courier;
using namespace courier::daemon;

// Global shutdown flag
static std::atomic<bool> g_shutdown{false};

// Signal handler
void signalHandler(int signal) {
    (void)signal;
    g_shutdown.store(true);
}

namespace {

std::shared_ptr<core::SideStore> makeStore(const Config& config) {
    if (config.store == "memory") {
        return std::make_shared<core::MemorySideStore>();
    }

    auto endpoint = net::RespEndpoint::parse(config.store);
    if (!endpoint) {
        LOG_FATAL("Daemon", "Invalid --store value: {}", config.store);
        return nullptr;
    }

    auto store = std::make_shared<net::RespSideStore>(*endpoint);
    if (!store->ping()) {
        // The engine keeps running memory-only until the store answers.
        LOG_WARN("Daemon", "Side-store {} is not reachable yet", store->describe());
    }
    return store;
}

void logStats(const core::DeliveryEngine& engine, const services::DeliveryServiceImpl& service) {
    auto stats = engine.stats();
    LOG_INFO("Daemon",
             "streams={} identified={} principals={} in_flight={} queued={} sent={} acked={} "
             "retransmitted={} failed={} store={} store_backlog={}",
             service.activeStreams(), stats.registry.identified, stats.registry.principals,
             stats.registry.in_flight, stats.queue.total_depth, stats.sent, stats.acked,
             stats.retransmitted, stats.failed, stats.store_healthy ? "healthy" : "degraded",
             stats.store_backlog);
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse command line arguments
    Config config = parseArgs(argc, argv);

    if (config.help) {
        printUsage(argv[0]);
        return 0;
    }

    // Configure logging
    utils::Logger::instance().setLevel(utils::parseLogLevel(config.log_level));

    LOG_INFO("Daemon", "Courier starting...");
    LOG_INFO("Daemon", "Ack timeout: {}ms, max retries: {}", config.ack_timeout_ms, config.max_retries);
    LOG_INFO("Daemon", "Heartbeat: every {}ms, {} missed closes", config.heartbeat_interval_ms,
             config.heartbeat_max_missed);
    LOG_INFO("Daemon", "Queue limit: {}, default TTL: {}ms", config.queue_limit, config.default_ttl_ms);

    // Install signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    net::SocketInitializer socketInit;

    try {
        auto store = makeStore(config);
        if (!store) {
            return 1;
        }
        LOG_INFO("Daemon", "Side-store: {}", store->describe());

        auto scheduler = std::make_shared<core::ThreadedScheduler>();
        scheduler->start();

        // Side-store lane: mirror writes and restores.
        auto storeScheduler = std::make_shared<core::ThreadedScheduler>();
        storeScheduler->start();

        auto engine = std::make_shared<core::DeliveryEngine>(toDeliveryConfig(config), scheduler, store,
                                                             storeScheduler);
        engine->setFailureHandler([](const core::DeliveryFailure& failure) {
            LOG_WARN("Daemon", "Delivery failed: id={}, event={}, principal={}, reason={}, retries={}",
                     failure.envelope_id, failure.event, failure.principal_id,
                     core::failureReasonToString(failure.reason), failure.retry_count);
        });
        engine->setInboundHandler([](const core::InboundEvent& event) {
            LOG_DEBUG("Daemon", "Inbound event {} from {} ({} bytes)",
                      event.event, event.principal_id, event.payload.size());
        });
        engine->start();

        // Create delivery service
        auto service = std::make_unique<services::DeliveryServiceImpl>(engine);

        // Build and start gRPC server
        std::string addr = config.bind_addr + ":" + std::to_string(config.port);
        grpc::ServerBuilder builder;
        builder.AddListeningPort(addr, grpc::InsecureServerCredentials());
        builder.RegisterService(service.get());
        auto server = builder.BuildAndStart();

        if (!server) {
            LOG_FATAL("Daemon", "Failed to start delivery server on {}", addr);
            engine->stop();
            scheduler->stop();
            storeScheduler->stop();
            return 1;
        }
        LOG_INFO("Daemon", "Delivery server listening on {}", addr);
        LOG_INFO("Daemon", "Courier is ready");

        // Main loop - wait for shutdown signal
        auto nextStats = std::chrono::steady_clock::now() + std::chrono::milliseconds(config.stats_interval_ms);
        while (!g_shutdown.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));

            if (config.stats_interval_ms > 0 && std::chrono::steady_clock::now() >= nextStats) {
                logStats(*engine, *service);
                nextStats += std::chrono::milliseconds(config.stats_interval_ms);
            }
        }

        // Graceful shutdown
        LOG_INFO("Daemon", "Shutting down...");

        service->closeAll("server shutting down");

        auto deadline = std::chrono::system_clock::now() + std::chrono::seconds(5);
        server->Shutdown(deadline);

        engine->stop();
        if (!engine->flushStore(std::chrono::seconds(5))) {
            LOG_WARN("Daemon", "Side-store writes still queued at exit");
        }
        scheduler->stop();
        storeScheduler->stop();

        LOG_INFO("Daemon", "Courier stopped");
        return 0;

    } catch (const std::exception& e) {
        LOG_FATAL("Daemon", "Fatal error: {}", e.what());
        return 1;
    }
}
