/**
 * @file test_config.cpp
 * @brief Unit tests for daemon configuration and CLI parsing
 *
 * Tests cover:
 * - Default configuration values
 * - CLI argument parsing
 * - Conversion into engine settings
 * - Error handling
 * - Log level parsing
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <courier/daemon/config.hpp>
#include <courier/utils/logger.hpp>

#include <vector>
#include <string>
#include <cstring>

using namespace courier::daemon;

class ConfigTest : public ::testing::Test {
protected:
    // Helper to create argc/argv from vector of strings
    std::pair<int, std::vector<char*>> makeArgs(const std::vector<std::string>& args) {
        argv_storage_.clear();
        argv_storage_.reserve(args.size());

        for (const auto& arg : args) {
            argv_storage_.push_back(std::vector<char>(arg.begin(), arg.end()));
            argv_storage_.back().push_back('\0');
        }

        argv_ptrs_.clear();
        for (auto& storage : argv_storage_) {
            argv_ptrs_.push_back(storage.data());
        }

        return {static_cast<int>(argv_ptrs_.size()), argv_ptrs_};
    }

private:
    std::vector<std::vector<char>> argv_storage_;
    std::vector<char*> argv_ptrs_;
};

// =============================================================================
// Default Values
// =============================================================================

TEST_F(ConfigTest, DefaultValues) {
    Config config;

    EXPECT_EQ(config.bind_addr, "0.0.0.0");
    EXPECT_EQ(config.port, 50061);
    EXPECT_EQ(config.log_level, "INFO");
    EXPECT_EQ(config.store, "memory");
    EXPECT_FALSE(config.help);

    EXPECT_EQ(config.ack_timeout_ms, 30000);
    EXPECT_EQ(config.max_retries, 3u);
    EXPECT_EQ(config.retry_base_ms, 2000);
    EXPECT_DOUBLE_EQ(config.retry_multiplier, 2.0);
    EXPECT_EQ(config.retry_cap_ms, 30000);

    EXPECT_EQ(config.default_ttl_ms, 604800000);  // 7 days
    EXPECT_EQ(config.queue_limit, 1000u);

    EXPECT_EQ(config.heartbeat_interval_ms, 30000);
    EXPECT_EQ(config.heartbeat_max_missed, 3u);
    EXPECT_EQ(config.stats_interval_ms, 60000);
}

// =============================================================================
// Basic CLI Parsing
// =============================================================================

TEST_F(ConfigTest, ParseNoArgs) {
    auto [argc, argv] = makeArgs({"courierd"});
    Config config = parseArgs(argc, argv.data());

    EXPECT_FALSE(config.help);
    EXPECT_EQ(config.port, 50061);
}

TEST_F(ConfigTest, ParseHelp) {
    auto [argc, argv] = makeArgs({"courierd", "--help"});
    Config config = parseArgs(argc, argv.data());

    EXPECT_TRUE(config.help);
}

TEST_F(ConfigTest, ParseHelpShort) {
    auto [argc, argv] = makeArgs({"courierd", "-h"});
    Config config = parseArgs(argc, argv.data());

    EXPECT_TRUE(config.help);
}

TEST_F(ConfigTest, ParseServerOptions) {
    auto [argc, argv] = makeArgs({"courierd", "--bind", "127.0.0.1", "--port", "7000",
                                  "--log-level", "DEBUG", "--store", "resp://10.0.0.5:6380"});
    Config config = parseArgs(argc, argv.data());

    EXPECT_FALSE(config.help);
    EXPECT_EQ(config.bind_addr, "127.0.0.1");
    EXPECT_EQ(config.port, 7000);
    EXPECT_EQ(config.log_level, "DEBUG");
    EXPECT_EQ(config.store, "resp://10.0.0.5:6380");
}

// =============================================================================
// Delivery Options
// =============================================================================

TEST_F(ConfigTest, ParseRetryOptions) {
    auto [argc, argv] = makeArgs({"courierd", "--ack-timeout-ms", "10000", "--max-retries", "5",
                                  "--retry-base-ms", "500", "--retry-multiplier", "1.5",
                                  "--retry-cap-ms", "60000"});
    Config config = parseArgs(argc, argv.data());

    EXPECT_FALSE(config.help);
    EXPECT_EQ(config.ack_timeout_ms, 10000);
    EXPECT_EQ(config.max_retries, 5u);
    EXPECT_EQ(config.retry_base_ms, 500);
    EXPECT_DOUBLE_EQ(config.retry_multiplier, 1.5);
    EXPECT_EQ(config.retry_cap_ms, 60000);
}

TEST_F(ConfigTest, ParseQueueAndLivenessOptions) {
    auto [argc, argv] = makeArgs({"courierd", "--default-ttl-ms", "0", "--queue-limit", "50",
                                  "--heartbeat-interval-ms", "5000", "--heartbeat-max-missed", "2",
                                  "--stats-interval-ms", "0"});
    Config config = parseArgs(argc, argv.data());

    EXPECT_FALSE(config.help);
    EXPECT_EQ(config.default_ttl_ms, 0);
    EXPECT_EQ(config.queue_limit, 50u);
    EXPECT_EQ(config.heartbeat_interval_ms, 5000);
    EXPECT_EQ(config.heartbeat_max_missed, 2u);
    EXPECT_EQ(config.stats_interval_ms, 0);
}

TEST_F(ConfigTest, ToDeliveryConfig) {
    auto [argc, argv] = makeArgs({"courierd", "--ack-timeout-ms", "1500", "--max-retries", "4",
                                  "--retry-base-ms", "100", "--retry-cap-ms", "900",
                                  "--queue-limit", "7", "--heartbeat-interval-ms", "250",
                                  "--heartbeat-max-missed", "5", "--default-ttl-ms", "60000"});
    Config config = parseArgs(argc, argv.data());
    ASSERT_FALSE(config.help);

    auto delivery = toDeliveryConfig(config);
    EXPECT_EQ(delivery.ack_timeout.count(), 1500);
    EXPECT_EQ(delivery.max_retries, 4u);
    EXPECT_EQ(delivery.retry_backoff.base.count(), 100);
    EXPECT_EQ(delivery.retry_backoff.cap.count(), 900);
    EXPECT_EQ(delivery.queue_limit, 7u);
    EXPECT_EQ(delivery.heartbeat_interval.count(), 250);
    EXPECT_EQ(delivery.heartbeat_max_missed, 5u);
    EXPECT_EQ(delivery.default_ttl.count(), 60000);
}

// =============================================================================
// Error Handling
// =============================================================================

TEST_F(ConfigTest, UnknownOptionSetsHelp) {
    auto [argc, argv] = makeArgs({"courierd", "--unknown-option", "value"});
    Config config = parseArgs(argc, argv.data());

    EXPECT_TRUE(config.help);
}

TEST_F(ConfigTest, MissingValueSetsHelp) {
    auto [argc, argv] = makeArgs({"courierd", "--port"});
    Config config = parseArgs(argc, argv.data());

    EXPECT_TRUE(config.help);
}

TEST_F(ConfigTest, NonNumericValueSetsHelp) {
    auto [argc, argv] = makeArgs({"courierd", "--max-retries", "many"});
    Config config = parseArgs(argc, argv.data());

    EXPECT_TRUE(config.help);
}

TEST_F(ConfigTest, PortOutOfRangeSetsHelp) {
    auto [argc, argv] = makeArgs({"courierd", "--port", "70000"});
    Config config = parseArgs(argc, argv.data());

    EXPECT_TRUE(config.help);
}

TEST_F(ConfigTest, ZeroHeartbeatSetsHelp) {
    auto [argc, argv] = makeArgs({"courierd", "--heartbeat-interval-ms", "0"});
    Config config = parseArgs(argc, argv.data());

    EXPECT_TRUE(config.help);
}

// =============================================================================
// Log Level Parsing
// =============================================================================

TEST_F(ConfigTest, ParseLogLevelNames) {
    using courier::utils::LogLevel;
    using courier::utils::parseLogLevel;

    EXPECT_EQ(parseLogLevel("TRACE"), LogLevel::TRACE);
    EXPECT_EQ(parseLogLevel("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("INFO"), LogLevel::INFO);
    EXPECT_EQ(parseLogLevel("WARN"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("ERROR"), LogLevel::ERROR);
    EXPECT_EQ(parseLogLevel("FATAL"), LogLevel::FATAL);
    EXPECT_EQ(parseLogLevel("OFF"), LogLevel::OFF);
    EXPECT_EQ(parseLogLevel("verbose"), LogLevel::INFO);
    EXPECT_EQ(parseLogLevel("verbose", LogLevel::WARN), LogLevel::WARN);
}
