/**
 * @file config.hpp
 * @brief Courier daemon configuration and CLI parsing
 */

#pragma once

#include "courier/core/delivery_engine.hpp"

#include <chrono>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>

namespace courier {
namespace daemon {

/**
 * @brief Daemon configuration structure
 */
struct Config {
    std::string bind_addr = "0.0.0.0";
    uint16_t port = 50061;
    std::string log_level = "INFO";
    bool help = false;

    /// "memory" or "resp://host:port"
    std::string store = "memory";

    // Acknowledgment and retry
    int64_t ack_timeout_ms = 30000;
    uint32_t max_retries = 3;
    int64_t retry_base_ms = 2000;
    double retry_multiplier = 2.0;
    int64_t retry_cap_ms = 30000;

    // Offline queue
    int64_t default_ttl_ms = 7LL * 24 * 60 * 60 * 1000;  ///< 7 days, 0 = never expire
    size_t queue_limit = 1000;                              ///< Max envelopes per principal

    // Liveness
    int64_t heartbeat_interval_ms = 30000;
    uint32_t heartbeat_max_missed = 3;

    int64_t stats_interval_ms = 60000;  ///< 0 disables the periodic stats line
};

/**
 * @brief Engine settings derived from the daemon configuration.
 */
inline core::DeliveryConfig toDeliveryConfig(const Config& config) {
    core::DeliveryConfig delivery;
    delivery.ack_timeout = std::chrono::milliseconds(config.ack_timeout_ms);
    delivery.max_retries = config.max_retries;
    delivery.retry_backoff.base = std::chrono::milliseconds(config.retry_base_ms);
    delivery.retry_backoff.multiplier = config.retry_multiplier;
    delivery.retry_backoff.cap = std::chrono::milliseconds(config.retry_cap_ms);
    delivery.default_ttl = std::chrono::milliseconds(config.default_ttl_ms);
    delivery.queue_limit = config.queue_limit;
    delivery.heartbeat_interval = std::chrono::milliseconds(config.heartbeat_interval_ms);
    delivery.heartbeat_max_missed = config.heartbeat_max_missed;
    return delivery;
}

/**
 * @brief Print usage information
 * @param program_name Name of the executable
 */
inline void printUsage(const char* program_name) {
    std::cout << "Courier - Reliable Real-Time Delivery Daemon\n\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --bind <addr>         Bind address for the gRPC server (default: 0.0.0.0)\n"
              << "  --port <port>         gRPC port for clients and producers (default: 50061)\n"
              << "  --log-level <level>   Log level: TRACE, DEBUG, INFO, WARN, ERROR, FATAL, OFF (default: INFO)\n"
              << "  --store <location>    Durable side-store: memory or resp://host:port (default: memory)\n"
              << "\nDelivery Options:\n"
              << "  --ack-timeout-ms <ms>       Time to wait for an acknowledgment (default: 30000)\n"
              << "  --max-retries <n>           Retransmissions before giving up (default: 3)\n"
              << "  --retry-base-ms <ms>        First retry delay (default: 2000)\n"
              << "  --retry-multiplier <x>      Retry delay growth factor (default: 2.0)\n"
              << "  --retry-cap-ms <ms>         Longest retry delay (default: 30000)\n"
              << "\nOffline Queue Options:\n"
              << "  --default-ttl-ms <ms>       Envelope lifetime, 0=never expire (default: 604800000 = 7 days)\n"
              << "  --queue-limit <n>           Max queued envelopes per principal (default: 1000)\n"
              << "\nLiveness Options:\n"
              << "  --heartbeat-interval-ms <ms> Interval between server pings (default: 30000)\n"
              << "  --heartbeat-max-missed <n>   Missed pings before a connection is closed (default: 3)\n"
              << "  --stats-interval-ms <ms>     Interval of the stats log line, 0=off (default: 60000)\n"
              << "\n  --help                Show this help message\n\n"
              << "Example:\n"
              << "  " << program_name << " --port 50061 --store resp://127.0.0.1:6379\n"
              << "  " << program_name << " --ack-timeout-ms 10000 --max-retries 5 --retry-cap-ms 60000\n";
}

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @return Parsed configuration; help is set on any error
 */
inline Config parseArgs(int argc, char* argv[]) {
    Config config;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            config.help = true;
            return config;
        }

        // Options that require a value
        if (i + 1 >= argc) {
            std::cerr << "Error: Option " << arg << " requires a value\n";
            config.help = true;
            return config;
        }

        const char* value = argv[++i];

        try {
            if (std::strcmp(arg, "--bind") == 0) {
                config.bind_addr = value;
            } else if (std::strcmp(arg, "--port") == 0) {
                int port = std::stoi(value);
                if (port < 0 || port > 65535) {
                    throw std::out_of_range("port");
                }
                config.port = static_cast<uint16_t>(port);
            } else if (std::strcmp(arg, "--log-level") == 0) {
                config.log_level = value;
            } else if (std::strcmp(arg, "--store") == 0) {
                config.store = value;
            } else if (std::strcmp(arg, "--ack-timeout-ms") == 0) {
                config.ack_timeout_ms = std::stoll(value);
            } else if (std::strcmp(arg, "--max-retries") == 0) {
                config.max_retries = static_cast<uint32_t>(std::stoul(value));
            } else if (std::strcmp(arg, "--retry-base-ms") == 0) {
                config.retry_base_ms = std::stoll(value);
            } else if (std::strcmp(arg, "--retry-multiplier") == 0) {
                config.retry_multiplier = std::stod(value);
            } else if (std::strcmp(arg, "--retry-cap-ms") == 0) {
                config.retry_cap_ms = std::stoll(value);
            } else if (std::strcmp(arg, "--default-ttl-ms") == 0) {
                config.default_ttl_ms = std::stoll(value);
            } else if (std::strcmp(arg, "--queue-limit") == 0) {
                config.queue_limit = std::stoull(value);
            } else if (std::strcmp(arg, "--heartbeat-interval-ms") == 0) {
                config.heartbeat_interval_ms = std::stoll(value);
            } else if (std::strcmp(arg, "--heartbeat-max-missed") == 0) {
                config.heartbeat_max_missed = static_cast<uint32_t>(std::stoul(value));
            } else if (std::strcmp(arg, "--stats-interval-ms") == 0) {
                config.stats_interval_ms = std::stoll(value);
            } else {
                std::cerr << "Error: Unknown option " << arg << "\n";
                config.help = true;
                return config;
            }
        } catch (const std::exception&) {
            std::cerr << "Error: Invalid value '" << value << "' for option " << arg << "\n";
            config.help = true;
            return config;
        }
    }

    if (config.ack_timeout_ms <= 0 || config.heartbeat_interval_ms <= 0 ||
        config.heartbeat_max_missed == 0 || config.retry_base_ms <= 0) {
        std::cerr << "Error: Timeouts, intervals and --heartbeat-max-missed must be positive\n";
        config.help = true;
    }

    return config;
}

} // namespace daemon
} // namespace courier
