#include <gtest/gtest.h>
#include <leaseguard/leaseguard.hpp>

using namespace leaseguard;
using namespace std::chrono_literals;

namespace {

ResourceRequest request(ResourceKind kind, std::optional<double> memory,
                        std::optional<double> cpu) {
    ResourceRequest r;
    r.id = "req";
    r.kind = kind;
    r.requirements.memory = memory;
    r.requirements.cpu = cpu;
    return r;
}

LeaseShape shape(std::int64_t memory_bucket, Timestamp at = Timestamp{}) {
    LeaseShape s;
    s.fingerprint = Fingerprint{ResourceKind::Memory, memory_bucket, 0};
    s.requirements.memory = static_cast<double>(memory_bucket) * 1024.0;
    s.created_at = at;
    return s;
}

} // namespace

// ===========================================================================
// Fingerprints
// ===========================================================================

TEST(FingerprintTest, QuantizesUpwards) {
    auto f = make_fingerprint(request(ResourceKind::Memory, 1500.0, 25.0), 1024.0, 10.0);
    EXPECT_EQ(f.kind, ResourceKind::Memory);
    EXPECT_EQ(f.memory_bucket, 2);
    EXPECT_EQ(f.cpu_bucket, 3);
}

TEST(FingerprintTest, NearbyRequestsShareFingerprint) {
    auto a = make_fingerprint(request(ResourceKind::Cpu, 1025.0, 11.0), 1024.0, 10.0);
    auto b = make_fingerprint(request(ResourceKind::Cpu, 2048.0, 20.0), 1024.0, 10.0);
    EXPECT_EQ(a, b);
    EXPECT_EQ(FingerprintHash{}(a), FingerprintHash{}(b));
}

TEST(FingerprintTest, KindAndAbsenceMatter) {
    auto a = make_fingerprint(request(ResourceKind::Cpu, 1024.0, std::nullopt), 1024.0, 10.0);
    auto b = make_fingerprint(request(ResourceKind::Memory, 1024.0, std::nullopt), 1024.0, 10.0);
    EXPECT_NE(a, b);
    EXPECT_EQ(a.cpu_bucket, 0);
}

// ===========================================================================
// LRU behaviour
// ===========================================================================

TEST(LeaseCacheTest, MissThenHit) {
    LeaseCache cache(4);
    auto now = Timestamp{} + 1s;
    EXPECT_FALSE(cache.get(shape(1).fingerprint, now).has_value());

    cache.put(shape(1), now);
    auto hit = cache.get(shape(1).fingerprint, now + 1s);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->reuse_count, 1u);
    EXPECT_EQ(hit->last_used, now + 1s);
    EXPECT_DOUBLE_EQ(*hit->requirements.memory, 1024.0);
}

TEST(LeaseCacheTest, EvictsLeastRecentlyUsed) {
    LeaseCache cache(2);
    auto now = Timestamp{} + 1s;
    cache.put(shape(1), now);
    cache.put(shape(2), now);
    cache.get(shape(1).fingerprint, now);   // 2 is now least recent

    EXPECT_TRUE(cache.put(shape(3), now));
    EXPECT_TRUE(cache.contains(shape(1).fingerprint));
    EXPECT_FALSE(cache.contains(shape(2).fingerprint));
    EXPECT_TRUE(cache.contains(shape(3).fingerprint));
    EXPECT_EQ(cache.size(), 2u);
}

TEST(LeaseCacheTest, PutExistingRefreshesWithoutEviction) {
    LeaseCache cache(2);
    auto now = Timestamp{} + 1s;
    cache.put(shape(1), now);
    cache.put(shape(2), now);
    EXPECT_FALSE(cache.put(shape(1), now));
    EXPECT_EQ(cache.size(), 2u);

    // 1 was refreshed, so 2 goes first
    cache.put(shape(3), now);
    EXPECT_TRUE(cache.contains(shape(1).fingerprint));
    EXPECT_FALSE(cache.contains(shape(2).fingerprint));
}

TEST(LeaseCacheTest, DisabledWhenMaxSizeZero) {
    LeaseCache cache(0);
    EXPECT_FALSE(cache.enabled());
    EXPECT_FALSE(cache.put(shape(1), Timestamp{}));
    EXPECT_EQ(cache.size(), 0u);
}

TEST(LeaseCacheTest, TrimIdleKeepsFloor) {
    LeaseCache cache(10);
    auto t0 = Timestamp{} + 100s;
    for (int i = 1; i <= 5; ++i) {
        cache.put(shape(i), t0 + i * 1s);
    }

    // Shapes 1..3 were last used before the cutoff; one must survive
    EXPECT_EQ(cache.trim_idle(t0 + 4s, 3), 2u);
    EXPECT_EQ(cache.size(), 3u);
    EXPECT_FALSE(cache.contains(shape(1).fingerprint));
    EXPECT_TRUE(cache.contains(shape(3).fingerprint));
}

TEST(LeaseCacheTest, TouchProtectsFromTrim) {
    LeaseCache cache(10);
    auto t0 = Timestamp{} + 100s;
    cache.put(shape(1), t0);
    cache.put(shape(2), t0);
    cache.touch(shape(1).fingerprint, t0 + 10s);

    EXPECT_EQ(cache.trim_idle(t0 + 5s, 0), 1u);
    EXPECT_TRUE(cache.contains(shape(1).fingerprint));
    EXPECT_EQ(cache.get(shape(1).fingerprint, t0 + 11s)->reuse_count, 1u);
}

TEST(LeaseCacheTest, RemoveAndClear) {
    LeaseCache cache(4);
    cache.put(shape(1), Timestamp{});
    cache.put(shape(2), Timestamp{});
    EXPECT_TRUE(cache.remove(shape(1).fingerprint));
    EXPECT_FALSE(cache.remove(shape(1).fingerprint));
    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
}
