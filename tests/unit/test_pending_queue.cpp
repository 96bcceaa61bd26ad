/**
 * @file test_pending_queue.cpp
 * @brief Unit tests for PendingQueue
 */

#include <gtest/gtest.h>
#include <courier/core/pending_queue.hpp>

#include <atomic>
#include <thread>
#include <vector>

using namespace courier::core;

class PendingQueueTest : public ::testing::Test {
protected:
    static constexpr int64_t kNow = 1700000000000;

    Envelope makeEnvelope(const std::string& id, int64_t created_at_ms = kNow,
                          int64_t expires_at_ms = 0) {
        Envelope envelope;
        envelope.envelope_id = id;
        envelope.event = "test.event";
        envelope.payload = "payload-" + id;
        envelope.principal_id = "user-1";
        envelope.created_at_ms = created_at_ms;
        envelope.expires_at_ms = expires_at_ms;
        return envelope;
    }

    static std::vector<std::string> idsOf(const std::vector<Envelope>& envelopes) {
        std::vector<std::string> ids;
        for (const auto& e : envelopes) {
            ids.push_back(e.envelope_id);
        }
        return ids;
    }
};

TEST_F(PendingQueueTest, EnqueueAndDrainInOrder) {
    PendingQueue queue(10);

    EXPECT_EQ(queue.enqueue("user-1", makeEnvelope("a"), kNow).result, EnqueueResult::ENQUEUED);
    EXPECT_EQ(queue.enqueue("user-1", makeEnvelope("b"), kNow).result, EnqueueResult::ENQUEUED);
    EXPECT_EQ(queue.enqueue("user-1", makeEnvelope("c"), kNow).result, EnqueueResult::ENQUEUED);
    EXPECT_EQ(queue.size("user-1"), 3u);

    auto drained = queue.drain("user-1", kNow);
    EXPECT_EQ(idsOf(drained), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(queue.size("user-1"), 0u);
    EXPECT_TRUE(queue.drain("user-1", kNow).empty());
}

TEST_F(PendingQueueTest, PrincipalsAreIsolated) {
    PendingQueue queue(10);
    queue.enqueue("user-1", makeEnvelope("a"), kNow);
    queue.enqueue("user-2", makeEnvelope("b"), kNow);

    EXPECT_EQ(idsOf(queue.drain("user-1", kNow)), (std::vector<std::string>{"a"}));
    EXPECT_EQ(queue.size("user-2"), 1u);
}

TEST_F(PendingQueueTest, FullQueueEvictsOldest) {
    PendingQueue queue(2);
    queue.enqueue("user-1", makeEnvelope("a"), kNow);
    queue.enqueue("user-1", makeEnvelope("b"), kNow);

    auto outcome = queue.enqueue("user-1", makeEnvelope("c"), kNow);
    EXPECT_EQ(outcome.result, EnqueueResult::EVICTED_OLDEST);
    ASSERT_TRUE(outcome.evicted.has_value());
    EXPECT_EQ(outcome.evicted->envelope_id, "a");

    EXPECT_EQ(idsOf(queue.drain("user-1", kNow)), (std::vector<std::string>{"b", "c"}));
    EXPECT_EQ(queue.stats().evicted_oldest, 1u);
}

TEST_F(PendingQueueTest, ZeroLimitIsUnbounded) {
    PendingQueue queue(0);
    for (int i = 0; i < 5000; ++i) {
        EXPECT_EQ(queue.enqueue("user-1", makeEnvelope("e" + std::to_string(i)), kNow).result,
                  EnqueueResult::ENQUEUED);
    }
    EXPECT_EQ(queue.size("user-1"), 5000u);
}

TEST_F(PendingQueueTest, DuplicateIdRejected) {
    PendingQueue queue(10);
    queue.enqueue("user-1", makeEnvelope("a"), kNow);

    EXPECT_EQ(queue.enqueue("user-1", makeEnvelope("a"), kNow).result, EnqueueResult::DUPLICATE);
    EXPECT_EQ(queue.size("user-1"), 1u);
}

TEST_F(PendingQueueTest, AlreadyExpiredNotQueued) {
    PendingQueue queue(10);
    auto outcome = queue.enqueue("user-1", makeEnvelope("a", kNow - 100, kNow), kNow);

    EXPECT_EQ(outcome.result, EnqueueResult::EXPIRED);
    EXPECT_EQ(queue.size("user-1"), 0u);
}

TEST_F(PendingQueueTest, DrainSkipsExpiredEntries) {
    PendingQueue queue(10);
    queue.enqueue("user-1", makeEnvelope("short", kNow, kNow + 100), kNow);
    queue.enqueue("user-1", makeEnvelope("long", kNow, kNow + 100000), kNow);

    std::vector<Envelope> expired;
    auto drained = queue.drain("user-1", kNow + 500, &expired);

    EXPECT_EQ(idsOf(drained), (std::vector<std::string>{"long"}));
    EXPECT_EQ(idsOf(expired), (std::vector<std::string>{"short"}));
    EXPECT_EQ(queue.stats().expired, 1u);
}

TEST_F(PendingQueueTest, ReapExpiredAcrossPrincipals) {
    PendingQueue queue(10);
    queue.enqueue("user-1", makeEnvelope("a", kNow, kNow + 10), kNow);
    queue.enqueue("user-2", makeEnvelope("b", kNow, kNow + 10), kNow);
    queue.enqueue("user-2", makeEnvelope("c"), kNow);

    auto reaped = queue.reapExpired(kNow + 20);

    EXPECT_EQ(reaped.size(), 2u);
    EXPECT_EQ(queue.size("user-1"), 0u);
    EXPECT_EQ(queue.size("user-2"), 1u);
    EXPECT_TRUE(queue.contains("user-2", "c"));
}

TEST_F(PendingQueueTest, RequestSinceIsNonDestructive) {
    PendingQueue queue(10);
    queue.enqueue("user-1", makeEnvelope("old", kNow - 5000), kNow);
    queue.enqueue("user-1", makeEnvelope("new", kNow - 10), kNow);

    auto replay = queue.requestSince("user-1", kNow - 1000, kNow);
    EXPECT_EQ(idsOf(replay), (std::vector<std::string>{"new"}));
    EXPECT_EQ(queue.size("user-1"), 2u);
}

TEST_F(PendingQueueTest, RemoveById) {
    PendingQueue queue(10);
    queue.enqueue("user-1", makeEnvelope("a"), kNow);
    queue.enqueue("user-1", makeEnvelope("b"), kNow);

    EXPECT_TRUE(queue.remove("user-1", "a"));
    EXPECT_FALSE(queue.remove("user-1", "a"));
    EXPECT_FALSE(queue.remove("nobody", "a"));
    EXPECT_FALSE(queue.contains("user-1", "a"));
    EXPECT_TRUE(queue.contains("user-1", "b"));
}

TEST_F(PendingQueueTest, EmptiedBucketsAreReleased) {
    PendingQueue queue(10);

    for (int i = 0; i < 1000; ++i) {
        std::string principal = "user-" + std::to_string(i);
        queue.enqueue(principal, makeEnvelope("short-" + std::to_string(i), kNow, kNow + 100), kNow);
    }
    queue.enqueue("user-a", makeEnvelope("x"), kNow);
    queue.enqueue("user-b", makeEnvelope("y"), kNow);
    queue.enqueue("user-b", makeEnvelope("z"), kNow);
    EXPECT_EQ(queue.principalCount(), 1002u);

    EXPECT_EQ(queue.reapExpired(kNow + 200).size(), 1000u);
    EXPECT_EQ(queue.principalCount(), 2u);

    EXPECT_TRUE(queue.remove("user-a", "x"));
    EXPECT_EQ(queue.principalCount(), 1u);

    // A bucket that still holds entries survives.
    EXPECT_TRUE(queue.remove("user-b", "y"));
    EXPECT_EQ(queue.principalCount(), 1u);
    EXPECT_TRUE(queue.contains("user-b", "z"));

    queue.drain("user-b", kNow);
    EXPECT_EQ(queue.principalCount(), 0u);
    EXPECT_EQ(queue.stats().principals, 0u);
}

TEST_F(PendingQueueTest, StatsTrackDepthAndTotals) {
    PendingQueue queue(10);
    queue.enqueue("user-1", makeEnvelope("a"), kNow);
    queue.enqueue("user-1", makeEnvelope("b"), kNow);
    queue.enqueue("user-2", makeEnvelope("c"), kNow);

    auto stats = queue.stats();
    EXPECT_EQ(stats.principals, 2u);
    EXPECT_EQ(stats.total_depth, 3u);
    EXPECT_EQ(stats.limit, 10u);
    EXPECT_EQ(stats.high_watermark, 2u);
    EXPECT_EQ(stats.total_enqueued, 3u);

    queue.drain("user-1", kNow);
    stats = queue.stats();
    EXPECT_EQ(stats.principals, 1u);
    EXPECT_EQ(stats.total_drained, 2u);
}

TEST_F(PendingQueueTest, ConcurrentEnqueueKeepsEveryEntry) {
    PendingQueue queue(0);
    constexpr int kThreads = 4;
    constexpr int kPerThread = 250;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                queue.enqueue("user-1",
                              makeEnvelope("t" + std::to_string(t) + "-" + std::to_string(i)),
                              kNow);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(queue.size("user-1"), static_cast<size_t>(kThreads * kPerThread));
}
