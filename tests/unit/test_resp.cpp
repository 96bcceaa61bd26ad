/**
 * @file test_resp.cpp
 * @brief Unit tests for RESP encoding/parsing and the RESP-backed side-store
 */

#include <gtest/gtest.h>
#include <courier/core/delivery_engine.hpp>
#include <courier/net/platform.hpp>
#include <courier/net/resp.hpp>
#include <courier/net/resp_side_store.hpp>

#include "common/manual_scheduler.hpp"

#include <algorithm>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace courier::net;
using namespace std::chrono_literals;

// =============================================================================
// Encoding / parsing
// =============================================================================

class RespCodecTest : public ::testing::Test {
protected:
    static RespParseStatus parseAll(const std::string& data, RespValue& out, size_t& pos) {
        pos = 0;
        return parseResp(data, pos, out);
    }
};

TEST_F(RespCodecTest, EncodesCommandAsBulkArray) {
    EXPECT_EQ(encodeRespCommand({"RPUSH", "k", "v"}),
              "*3\r\n$5\r\nRPUSH\r\n$1\r\nk\r\n$1\r\nv\r\n");
}

TEST_F(RespCodecTest, EncodesBinaryArguments) {
    std::string value("a\r\nb\0c", 6);
    std::string encoded = encodeRespCommand({value});

    RespValue parsed;
    size_t pos = 0;
    ASSERT_EQ(parseAll(encoded, parsed, pos), RespParseStatus::COMPLETE);
    ASSERT_EQ(parsed.type, RespType::ARRAY);
    ASSERT_EQ(parsed.array.size(), 1u);
    EXPECT_EQ(parsed.array[0].str, value);
    EXPECT_EQ(pos, encoded.size());
}

TEST_F(RespCodecTest, ParsesScalarTypes) {
    RespValue value;
    size_t pos = 0;

    ASSERT_EQ(parseAll("+OK\r\n", value, pos), RespParseStatus::COMPLETE);
    EXPECT_EQ(value.type, RespType::SIMPLE_STRING);
    EXPECT_EQ(value.str, "OK");

    ASSERT_EQ(parseAll("-ERR wrong type\r\n", value, pos), RespParseStatus::COMPLETE);
    EXPECT_TRUE(value.isError());
    EXPECT_EQ(value.str, "ERR wrong type");

    ASSERT_EQ(parseAll(":-42\r\n", value, pos), RespParseStatus::COMPLETE);
    EXPECT_EQ(value.type, RespType::INTEGER);
    EXPECT_EQ(value.integer, -42);

    ASSERT_EQ(parseAll("$5\r\nhello\r\n", value, pos), RespParseStatus::COMPLETE);
    EXPECT_EQ(value.type, RespType::BULK_STRING);
    EXPECT_EQ(value.str, "hello");
    EXPECT_EQ(pos, 11u);
}

TEST_F(RespCodecTest, ParsesNil) {
    RespValue value;
    size_t pos = 0;

    ASSERT_EQ(parseAll("$-1\r\n", value, pos), RespParseStatus::COMPLETE);
    EXPECT_EQ(value.type, RespType::NIL);

    ASSERT_EQ(parseAll("*-1\r\n", value, pos), RespParseStatus::COMPLETE);
    EXPECT_EQ(value.type, RespType::NIL);
}

TEST_F(RespCodecTest, ParsesNestedArrays) {
    RespValue value;
    size_t pos = 0;

    ASSERT_EQ(parseAll("*2\r\n*1\r\n:1\r\n$3\r\nabc\r\n", value, pos), RespParseStatus::COMPLETE);
    ASSERT_EQ(value.array.size(), 2u);
    EXPECT_EQ(value.array[0].type, RespType::ARRAY);
    EXPECT_EQ(value.array[0].array[0].integer, 1);
    EXPECT_EQ(value.array[1].str, "abc");
}

TEST_F(RespCodecTest, IncompleteLeavesPositionUntouched) {
    RespValue value;
    size_t pos = 0;

    EXPECT_EQ(parseAll("", value, pos), RespParseStatus::INCOMPLETE);
    EXPECT_EQ(parseAll("+OK", value, pos), RespParseStatus::INCOMPLETE);
    EXPECT_EQ(parseAll("$5\r\nhel", value, pos), RespParseStatus::INCOMPLETE);
    EXPECT_EQ(parseAll("*2\r\n:1\r\n", value, pos), RespParseStatus::INCOMPLETE);
    EXPECT_EQ(pos, 0u);
}

TEST_F(RespCodecTest, RejectsMalformedInput) {
    RespValue value;
    size_t pos = 0;

    EXPECT_EQ(parseAll("?what\r\n", value, pos), RespParseStatus::MALFORMED);
    EXPECT_EQ(parseAll(":12x\r\n", value, pos), RespParseStatus::MALFORMED);
    EXPECT_EQ(parseAll("$3\r\nabcde\r\n", value, pos), RespParseStatus::MALFORMED);
    EXPECT_EQ(parseAll("*x\r\n", value, pos), RespParseStatus::MALFORMED);
}

TEST_F(RespCodecTest, ParsesBackToBackReplies) {
    std::string data = "+OK\r\n:7\r\n";
    size_t pos = 0;
    RespValue first;
    RespValue second;

    ASSERT_EQ(parseResp(data, pos, first), RespParseStatus::COMPLETE);
    ASSERT_EQ(parseResp(data, pos, second), RespParseStatus::COMPLETE);
    EXPECT_EQ(first.str, "OK");
    EXPECT_EQ(second.integer, 7);
    EXPECT_EQ(pos, data.size());
}

// =============================================================================
// Endpoint parsing
// =============================================================================

TEST(RespEndpointTest, ParsesSchemeHostAndPort) {
    auto endpoint = RespEndpoint::parse("resp://cache.internal:6380");
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_EQ(endpoint->host, "cache.internal");
    EXPECT_EQ(endpoint->port, 6380);
    EXPECT_EQ(endpoint->toString(), "cache.internal:6380");
}

TEST(RespEndpointTest, PortDefaults) {
    auto endpoint = RespEndpoint::parse("10.0.0.5");
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_EQ(endpoint->host, "10.0.0.5");
    EXPECT_EQ(endpoint->port, 6379);
}

TEST(RespEndpointTest, RejectsBadInput) {
    EXPECT_FALSE(RespEndpoint::parse("").has_value());
    EXPECT_FALSE(RespEndpoint::parse("resp://").has_value());
    EXPECT_FALSE(RespEndpoint::parse("host:").has_value());
    EXPECT_FALSE(RespEndpoint::parse(":6379").has_value());
    EXPECT_FALSE(RespEndpoint::parse("host:abc").has_value());
    EXPECT_FALSE(RespEndpoint::parse("host:70000").has_value());
}

// =============================================================================
// RespSideStore against a loopback server
// =============================================================================

/**
 * Minimal single-client RESP server holding lists in memory. Understands
 * PING, RPUSH, LRANGE, LREM, TTL and EXPIRE. TTLs do not count down.
 */
class LoopbackRespServer {
public:
    LoopbackRespServer() {
        listen_ = ::socket(AF_INET, SOCK_STREAM, 0);
        int yes = 1;
        ::setsockopt(listen_, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&yes), sizeof(yes));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ok_ = ::bind(listen_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 &&
              ::listen(listen_, 4) == 0;

        socklen_t len = sizeof(addr);
        ::getsockname(listen_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this]() { serve(); });
    }

    ~LoopbackRespServer() {
        stop();
    }

    void stop() {
        if (stopped_.exchange(true)) {
            return;
        }
        ::shutdown(listen_, SHUT_RDWR);
        closeSocket(listen_);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (client_ != INVALID_SOCKET_HANDLE) {
                ::shutdown(client_, SHUT_RDWR);
            }
        }
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    bool ok() const { return ok_; }
    uint16_t port() const { return port_; }

    std::vector<std::string> values(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = lists_.find(key);
        return it == lists_.end() ? std::vector<std::string>{} : it->second;
    }

    size_t commandCount(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::count(commands_.begin(), commands_.end(), name));
    }

    int64_t ttlOf(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = ttls_.find(key);
        return it == ttls_.end() ? -1 : it->second;
    }

private:
    void serve() {
        while (!stopped_.load()) {
            SocketHandle fd = ::accept(listen_, nullptr, nullptr);
            if (fd == INVALID_SOCKET_HANDLE) {
                return;
            }
            {
                std::lock_guard<std::mutex> lock(mutex_);
                client_ = fd;
            }
            handle(fd);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                client_ = INVALID_SOCKET_HANDLE;
            }
            closeSocket(fd);
        }
    }

    void handle(SocketHandle fd) {
        std::string buffer;
        char chunk[4096];
        while (true) {
            auto n = recvSome(fd, chunk, sizeof(chunk));
            if (n <= 0) {
                return;
            }
            buffer.append(chunk, static_cast<size_t>(n));

            while (true) {
                size_t pos = 0;
                RespValue request;
                RespParseStatus status = parseResp(buffer, pos, request);
                if (status == RespParseStatus::INCOMPLETE) {
                    break;
                }
                if (status == RespParseStatus::MALFORMED) {
                    return;
                }
                buffer.erase(0, pos);

                std::string reply = execute(request);
                sendSome(fd, reply.data(), reply.size());
            }
        }
    }

    static std::string bulk(const std::string& value) {
        return "$" + std::to_string(value.size()) + "\r\n" + value + "\r\n";
    }

    std::string execute(const RespValue& request) {
        std::vector<std::string> args;
        for (const auto& item : request.array) {
            args.push_back(item.str);
        }
        if (args.empty()) {
            return "-ERR empty command\r\n";
        }

        std::lock_guard<std::mutex> lock(mutex_);
        commands_.push_back(args[0]);

        if (args[0] == "PING") {
            return "+PONG\r\n";
        }
        if (args[0] == "RPUSH" && args.size() == 3) {
            auto& list = lists_[args[1]];
            list.push_back(args[2]);
            return ":" + std::to_string(list.size()) + "\r\n";
        }
        if (args[0] == "LRANGE" && args.size() == 4) {
            const auto& list = lists_[args[1]];
            std::string reply = "*" + std::to_string(list.size()) + "\r\n";
            for (const auto& value : list) {
                reply += bulk(value);
            }
            return reply;
        }
        if (args[0] == "LREM" && args.size() == 4) {
            auto& list = lists_[args[1]];
            size_t before = list.size();
            list.erase(std::remove(list.begin(), list.end(), args[3]), list.end());
            return ":" + std::to_string(before - list.size()) + "\r\n";
        }
        if (args[0] == "TTL" && args.size() == 2) {
            auto ttl = ttls_.find(args[1]);
            if (ttl != ttls_.end()) {
                return ":" + std::to_string(ttl->second) + "\r\n";
            }
            return lists_.count(args[1]) > 0 ? ":-1\r\n" : ":-2\r\n";
        }
        if (args[0] == "EXPIRE" && args.size() == 3) {
            ttls_[args[1]] = std::stoll(args[2]);
            return ":1\r\n";
        }
        return "-ERR unknown command '" + args[0] + "'\r\n";
    }

    SocketHandle listen_ = INVALID_SOCKET_HANDLE;
    SocketHandle client_ = INVALID_SOCKET_HANDLE;
    uint16_t port_ = 0;
    bool ok_ = false;
    std::atomic<bool> stopped_{false};
    std::thread thread_;

    std::mutex mutex_;
    std::map<std::string, std::vector<std::string>> lists_;
    std::map<std::string, int64_t> ttls_;
    std::vector<std::string> commands_;
};

class RespSideStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_ = std::make_unique<LoopbackRespServer>();
        ASSERT_TRUE(server_->ok());

        RespEndpoint endpoint;
        endpoint.host = "127.0.0.1";
        endpoint.port = server_->port();
        store_ = std::make_shared<RespSideStore>(endpoint, 1000ms);
    }

    void TearDown() override {
        store_.reset();
        server_.reset();
    }

    std::unique_ptr<LoopbackRespServer> server_;
    std::shared_ptr<RespSideStore> store_;
};

TEST_F(RespSideStoreTest, PingAndDescribe) {
    EXPECT_TRUE(store_->ping());
    EXPECT_EQ(store_->describe(), "resp://127.0.0.1:" + std::to_string(server_->port()));
}

TEST_F(RespSideStoreTest, PushAndListInOrder) {
    EXPECT_TRUE(store_->push("courier:pending:user-1", "a"));
    EXPECT_TRUE(store_->push("courier:pending:user-1", "b"));

    auto values = store_->list("courier:pending:user-1");
    ASSERT_TRUE(values.has_value());
    EXPECT_EQ(*values, (std::vector<std::string>{"a", "b"}));

    auto missing = store_->list("courier:pending:nobody");
    ASSERT_TRUE(missing.has_value());
    EXPECT_TRUE(missing->empty());
}

TEST_F(RespSideStoreTest, RemoveMatching) {
    store_->push("k", "keep");
    store_->push("k", "drop");
    store_->push("k", "drop");

    EXPECT_TRUE(store_->remove("k", [](const std::string& v) { return v == "drop"; }));
    EXPECT_EQ(server_->values("k"), (std::vector<std::string>{"keep"}));
}

TEST_F(RespSideStoreTest, ExpireSendsSeconds) {
    store_->push("k", "v");
    EXPECT_TRUE(store_->expire("k", 3600s));
    EXPECT_EQ(server_->ttlOf("k"), 3600);
}

TEST_F(RespSideStoreTest, ExpireNeverShortens) {
    store_->push("k", "v");
    EXPECT_TRUE(store_->expire("k", 3600s));
    EXPECT_TRUE(store_->expire("k", 60s));
    EXPECT_EQ(server_->ttlOf("k"), 3600);
    EXPECT_EQ(server_->commandCount("EXPIRE"), 1u);

    EXPECT_TRUE(store_->expire("k", 7200s));
    EXPECT_EQ(server_->ttlOf("k"), 7200);

    EXPECT_TRUE(store_->expire("missing", 60s));
    EXPECT_EQ(server_->commandCount("EXPIRE"), 2u);
}

TEST_F(RespSideStoreTest, UnreachableServerReportsFailure) {
    server_->stop();

    EXPECT_FALSE(store_->ping());
    EXPECT_FALSE(store_->push("k", "v"));
    EXPECT_FALSE(store_->list("k").has_value());
    EXPECT_FALSE(store_->remove("k", [](const std::string&) { return true; }));
    EXPECT_FALSE(store_->expire("k", 1s));
}

TEST_F(RespSideStoreTest, EngineMirrorsQueuedEnvelopes) {
    auto scheduler = std::make_shared<courier::test::ManualScheduler>();
    courier::core::DeliveryConfig config;
    courier::core::DeliveryEngine engine(config, scheduler, store_);

    courier::core::SendOptions options;
    options.envelope_id = "e1";
    auto result = engine.send(courier::core::Target::principal("user-1"), "message.new",
                              std::string("\r\nbinary\0", 9), options);

    EXPECT_TRUE(result.queued);
    scheduler->runDue();
    auto stored = server_->values("courier:pending:user-1");
    ASSERT_EQ(stored.size(), 1u);
    auto envelope = courier::core::decodeEnvelope(stored[0]);
    ASSERT_TRUE(envelope.has_value());
    EXPECT_EQ(envelope->envelope_id, "e1");
    EXPECT_EQ(envelope->payload.size(), 9u);
    EXPECT_GT(server_->ttlOf("courier:pending:user-1"), 0);
}
