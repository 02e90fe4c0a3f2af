#include <gtest/gtest.h>
#include <leaseguard/leaseguard.hpp>

#include <cstdint>
#include <set>

using namespace leaseguard;

// ===========================================================================
// 1000 allocations cycling through 100 requirement shapes
// ===========================================================================

TEST(CacheReuseTest, CyclingShapesMostlyHitCache) {
    constexpr int SHAPES = 100;
    constexpr int ALLOCATIONS = 1000;

    auto sched = std::make_shared<ManualScheduler>();
    auto detector = std::make_shared<ManualResourceDetector>(DetectorConfig{}, sched);
    PoolConfig cfg;
    cfg.cache_max_size = 100;
    ResourcePoolManager pool(detector, cfg, sched);

    auto metrics = std::make_shared<MetricsMonitor>();
    pool.set_monitor(metrics);

    std::set<LeaseId> ids;
    int from_cache = 0;

    for (int i = 0; i < ALLOCATIONS; ++i) {
        int shape = i % SHAPES;
        ResourceRequest req;
        req.id = "req-" + std::to_string(i);
        req.kind = shape % 2 == 0 ? ResourceKind::Memory : ResourceKind::Cpu;
        req.requirements.memory = 1024.0 * (shape + 1);
        req.requirements.cpu = 10.0 * (shape % 7 + 1);

        auto lease = pool.allocate(req);
        EXPECT_TRUE(ids.insert(lease.id).second);
        EXPECT_EQ(lease.request_id, req.id);
        EXPECT_EQ(lease.kind, req.kind);
        ASSERT_TRUE(lease.requirements.memory.has_value());
        EXPECT_DOUBLE_EQ(*lease.requirements.memory, *req.requirements.memory);
        EXPECT_DOUBLE_EQ(*lease.requirements.cpu, *req.requirements.cpu);
        // Shapes are bucket ceilings; these requests sit exactly on a bucket edge
        EXPECT_EQ(lease.from_cache, i >= SHAPES);
        EXPECT_EQ(lease.reuse_count, static_cast<std::uint64_t>(i / SHAPES));
        if (lease.from_cache) from_cache++;

        pool.release(lease);
    }

    double hit_rate = static_cast<double>(from_cache) / ALLOCATIONS;
    EXPECT_GT(hit_rate, 0.85);

    auto m = pool.get_metrics();
    EXPECT_GT(m.cache_hit_rate(), 0.85);
    EXPECT_EQ(m.cache_hits, static_cast<std::uint64_t>(from_cache));
    EXPECT_EQ(m.cached_shapes, 100u);
    EXPECT_EQ(metrics->get_metrics().cache_hits, m.cache_hits);
    EXPECT_EQ(ids.size(), static_cast<std::size_t>(ALLOCATIONS));
}

TEST(CacheReuseTest, TooManyShapesThrashSmallCache) {
    auto sched = std::make_shared<ManualScheduler>();
    auto detector = std::make_shared<ManualResourceDetector>(DetectorConfig{}, sched);
    PoolConfig cfg;
    cfg.cache_max_size = 10;
    ResourcePoolManager pool(detector, cfg, sched);

    // 20 shapes round-robin through an LRU of 10 never hit
    for (int i = 0; i < 200; ++i) {
        ResourceRequest req;
        req.id = "req-" + std::to_string(i);
        req.requirements.memory = 1024.0 * (i % 20 + 1);
        pool.release(pool.allocate(req));
    }

    auto m = pool.get_metrics();
    EXPECT_EQ(m.cache_hits, 0u);
    EXPECT_EQ(m.cached_shapes, 10u);
    EXPECT_GT(m.cache_evictions, 0u);
}
