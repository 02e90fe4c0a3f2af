#include <gtest/gtest.h>
#include <leaseguard/leaseguard.hpp>

using namespace leaseguard;
using namespace std::chrono_literals;

namespace {

HealthState sample(HealthStatus status, Timestamp at, double utilization) {
    HealthState s;
    s.status = status;
    s.timestamp = at;
    s.indicators.metrics.utilization = utilization;
    return s;
}

} // namespace

// ===========================================================================
// RingBuffer
// ===========================================================================

TEST(RingBufferTest, KeepsMostRecentOldestFirst) {
    RingBuffer<int> ring(3);
    for (int i = 1; i <= 5; ++i) {
        ring.push(i);
    }

    EXPECT_EQ(ring.size(), 3u);
    EXPECT_EQ(ring.capacity(), 3u);
    EXPECT_EQ(ring.last_n(3), (std::vector<int>{3, 4, 5}));
    EXPECT_EQ(ring.last_n(2), (std::vector<int>{4, 5}));
    EXPECT_EQ(ring.last_n(10), (std::vector<int>{3, 4, 5}));
    ASSERT_NE(ring.back(), nullptr);
    EXPECT_EQ(*ring.back(), 5);
}

TEST(RingBufferTest, EmptyAndClear) {
    RingBuffer<int> ring(2);
    EXPECT_TRUE(ring.empty());
    EXPECT_EQ(ring.back(), nullptr);

    ring.push(7);
    ring.clear();
    EXPECT_TRUE(ring.empty());
    EXPECT_TRUE(ring.last_n(5).empty());
}

TEST(RingBufferTest, ZeroCapacityHoldsOne) {
    RingBuffer<int> ring(0);
    ring.push(1);
    ring.push(2);
    EXPECT_EQ(ring.capacity(), 1u);
    EXPECT_EQ(ring.last_n(5), (std::vector<int>{2}));
}

// ===========================================================================
// StateHistory
// ===========================================================================

TEST(StateHistoryTest, RecordsAndEvictsSamples) {
    StateHistory history(3, 8);
    auto t0 = Timestamp{} + 1s;
    for (int i = 0; i < 5; ++i) {
        history.record_sample(sample(HealthStatus::Healthy, t0 + i * 1s, 0.1 * i));
    }

    EXPECT_EQ(history.sample_count(), 3u);
    auto recent = history.last_n(3);
    ASSERT_EQ(recent.size(), 3u);
    EXPECT_DOUBLE_EQ(*recent.front().indicators.metrics.utilization, 0.2);
    EXPECT_DOUBLE_EQ(*recent.back().indicators.metrics.utilization, 0.4);
    EXPECT_DOUBLE_EQ(*history.latest()->indicators.metrics.utilization, 0.4);
}

TEST(StateHistoryTest, ClampsBackwardsTimestamps) {
    StateHistory history(4, 4);
    auto t0 = Timestamp{} + 10s;
    history.record_sample(sample(HealthStatus::Healthy, t0, 0.1));
    history.record_sample(sample(HealthStatus::Healthy, t0 - 5s, 0.2));

    auto recent = history.last_n(2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[1].timestamp, t0);
}

TEST(StateHistoryTest, MinimumSampleCapacity) {
    StateHistory history(0, 4);
    EXPECT_EQ(history.sample_capacity(), 2u);
}

TEST(StateHistoryTest, Transitions) {
    StateHistory history(4, 2);
    EXPECT_FALSE(history.last_transition().has_value());

    auto t0 = Timestamp{} + 1s;
    history.record_transition({HealthStatus::Healthy, HealthStatus::Degraded, t0, "a"});
    history.record_transition({HealthStatus::Degraded, HealthStatus::Unhealthy, t0 + 1s, "b"});
    history.record_transition({HealthStatus::Unhealthy, HealthStatus::Degraded, t0 + 2s, "c"});

    auto all = history.transitions();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].reason, "b");
    EXPECT_EQ(history.last_transition()->reason, "c");
}

TEST(StateHistoryTest, Clear) {
    StateHistory history(4, 4);
    history.record_sample(sample(HealthStatus::Degraded, Timestamp{} + 1s, 0.8));
    history.record_transition({HealthStatus::Healthy, HealthStatus::Degraded, Timestamp{} + 1s, "x"});
    history.clear();

    EXPECT_EQ(history.sample_count(), 0u);
    EXPECT_FALSE(history.latest().has_value());
    EXPECT_TRUE(history.transitions().empty());
}
