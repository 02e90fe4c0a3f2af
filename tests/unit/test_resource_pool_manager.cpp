#include <gtest/gtest.h>
#include <leaseguard/leaseguard.hpp>

#include <cmath>
#include <limits>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>

using namespace leaseguard;
using namespace std::chrono_literals;

namespace {

class RecordingMonitor : public Monitor {
public:
    void on_event(const MonitorEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back(event);
    }
    void on_snapshot(const PoolSnapshot& snapshot) override {
        std::lock_guard<std::mutex> lock(mutex);
        snapshots.push_back(snapshot);
    }

    std::size_t count(EventType type) {
        std::lock_guard<std::mutex> lock(mutex);
        std::size_t n = 0;
        for (const auto& e : events) {
            if (e.type == type) n++;
        }
        return n;
    }

    std::optional<MonitorEvent> last(EventType type) {
        std::lock_guard<std::mutex> lock(mutex);
        for (auto it = events.rbegin(); it != events.rend(); ++it) {
            if (it->type == type) return *it;
        }
        return std::nullopt;
    }

    std::mutex mutex;
    std::vector<MonitorEvent> events;
    std::vector<PoolSnapshot> snapshots;
};

ResourceRequest make_request(const std::string& id,
                             std::optional<double> memory = std::nullopt,
                             std::optional<double> cpu = std::nullopt) {
    ResourceRequest r;
    r.id = id;
    r.kind = ResourceKind::Memory;
    r.priority = Priority::Medium;
    r.requirements.memory = memory;
    r.requirements.cpu = cpu;
    return r;
}

} // namespace

// ===========================================================================
// Fixture: manual clock, scripted detector, small pool
// ===========================================================================

class ResourcePoolManagerTest : public ::testing::Test {
protected:
    std::shared_ptr<ManualScheduler> sched;
    std::shared_ptr<ManualResourceDetector> detector;
    std::shared_ptr<RecordingMonitor> recorder;
    PoolConfig cfg;
    std::unique_ptr<ResourcePoolManager> pool;

    void SetUp() override {
        sched = std::make_shared<ManualScheduler>(Timestamp{} + 1s);
        detector = std::make_shared<ManualResourceDetector>(DetectorConfig{}, sched);
        recorder = std::make_shared<RecordingMonitor>();
        cfg.max_pool_size = 10;
        cfg.min_pool_size = 1;
        cfg.cache_max_size = 10;
        cfg.resource_timeout = 1s;
        cfg.cleanup_interval = 100ms;
        cfg.health_check_interval = 500ms;
    }

    void create_pool() {
        pool = std::make_unique<ResourcePoolManager>(detector, cfg, sched);
        pool->set_monitor(recorder);
    }
};

// ===========================================================================
// Construction
// ===========================================================================

TEST_F(ResourcePoolManagerTest, RequiresDetector) {
    EXPECT_THROW(ResourcePoolManager(nullptr, cfg, sched), ValidationException);
}

TEST_F(ResourcePoolManagerTest, RejectsInvalidConfig) {
    cfg.max_pool_size = 0;
    EXPECT_THROW(create_pool(), ValidationException);
}

TEST_F(ResourcePoolManagerTest, InitialStatus) {
    create_pool();
    auto status = pool->monitor();
    EXPECT_EQ(status.health, HealthStatus::Healthy);
    EXPECT_EQ(status.active_leases, 0u);
    EXPECT_EQ(status.max_pool_size, 10u);
    EXPECT_DOUBLE_EQ(status.utilization, 0.0);
    EXPECT_FALSE(pool->is_running());
}

// ===========================================================================
// Allocation
// ===========================================================================

TEST_F(ResourcePoolManagerTest, AllocateEchoesRequest) {
    create_pool();
    auto req = make_request("req-1", 2048.0, 25.0);
    req.priority = Priority::High;
    auto lease = pool->allocate(req);

    EXPECT_GT(lease.id, 0u);
    EXPECT_EQ(lease.request_id, "req-1");
    EXPECT_EQ(lease.kind, ResourceKind::Memory);
    EXPECT_EQ(lease.priority, Priority::High);
    EXPECT_DOUBLE_EQ(*lease.requirements.memory, 2048.0);
    EXPECT_DOUBLE_EQ(*lease.requirements.cpu, 25.0);
    EXPECT_EQ(lease.allocated_at, sched->now());
    EXPECT_EQ(lease.expires_at, sched->now() + 1s);
    EXPECT_FALSE(lease.from_cache);
    EXPECT_EQ(pool->lease_state(lease.id), LeaseState::Active);

    auto status = pool->monitor();
    EXPECT_EQ(status.active_leases, 1u);
    EXPECT_DOUBLE_EQ(status.utilization, 0.1);
}

TEST_F(ResourcePoolManagerTest, RequestTimeoutOverridesDefault) {
    create_pool();
    auto req = make_request("req-1");
    req.requirements.timeout = 250ms;
    auto lease = pool->allocate(req);
    EXPECT_EQ(lease.expires_at, lease.allocated_at + 250ms);
}

TEST_F(ResourcePoolManagerTest, ExhaustionCarriesContext) {
    cfg.max_pool_size = 2;
    create_pool();
    pool->allocate(make_request("a"));
    pool->allocate(make_request("b"));

    try {
        pool->allocate(make_request("c"));
        FAIL() << "expected PoolExhaustedException";
    } catch (const PoolExhaustedException& e) {
        EXPECT_STREQ(e.what(), "No resources available");
        EXPECT_TRUE(e.is_retryable());
        EXPECT_EQ(e.context().at("activeLeases"), "2");
        EXPECT_EQ(e.context().at("maxPoolSize"), "2");
        EXPECT_EQ(e.context().at("requestId"), "c");
    }
    EXPECT_EQ(pool->get_metrics().allocation_failures, 1u);
    EXPECT_EQ(recorder->count(EventType::AllocationRejected), 1u);
}

TEST_F(ResourcePoolManagerTest, ValidationErrors) {
    create_pool();

    EXPECT_THROW(pool->allocate(make_request("")), ValidationException);
    EXPECT_THROW(pool->allocate(make_request("neg", -1.0)), ValidationException);
    EXPECT_THROW(pool->allocate(make_request("nan", std::nullopt,
                                             std::numeric_limits<double>::quiet_NaN())),
                 ValidationException);

    auto zero_timeout = make_request("t");
    zero_timeout.requirements.timeout = Duration::zero();
    EXPECT_THROW(pool->allocate(zero_timeout), ValidationException);

    auto bad_kind = make_request("k");
    bad_kind.kind = static_cast<ResourceKind>(42);
    try {
        pool->allocate(bad_kind);
        FAIL() << "expected ValidationException";
    } catch (const ValidationException& e) {
        EXPECT_STREQ(e.what(), "Unknown resource type");
    }

    auto bad_priority = make_request("p");
    bad_priority.priority = static_cast<Priority>(7);
    EXPECT_THROW(pool->allocate(bad_priority), ValidationException);

    EXPECT_EQ(pool->get_metrics().validation_failures, 6u);
    EXPECT_EQ(pool->monitor().active_leases, 0u);
}

// ===========================================================================
// Release
// ===========================================================================

TEST_F(ResourcePoolManagerTest, ReleaseFreesCapacity) {
    create_pool();
    auto lease = pool->allocate(make_request("a"));
    pool->release(lease);

    EXPECT_EQ(pool->monitor().active_leases, 0u);
    EXPECT_EQ(pool->lease_state(lease.id), LeaseState::Released);
    EXPECT_EQ(pool->get_metrics().releases, 1u);
    EXPECT_EQ(recorder->count(EventType::LeaseReleased), 1u);
}

TEST_F(ResourcePoolManagerTest, DoubleReleaseIsRejected) {
    create_pool();
    auto lease = pool->allocate(make_request("a"));
    pool->release(lease);

    try {
        pool->release(lease);
        FAIL() << "expected ValidationException";
    } catch (const ValidationException& e) {
        EXPECT_STREQ(e.what(), "Lease already released");
        EXPECT_EQ(e.context().at("leaseId"), std::to_string(lease.id));
    }
}

TEST_F(ResourcePoolManagerTest, UnknownLeaseIsRejected) {
    create_pool();
    Lease forged;
    forged.id = 999;
    forged.request_id = "ghost";
    EXPECT_THROW(pool->release(forged), ValidationException);
    EXPECT_EQ(recorder->count(EventType::ReleaseRejected), 1u);
}

TEST_F(ResourcePoolManagerTest, MismatchedHandleIsRejected) {
    create_pool();
    auto lease = pool->allocate(make_request("a"));
    Lease tampered = lease;
    tampered.request_id = "b";
    EXPECT_THROW(pool->release(tampered), ValidationException);
    EXPECT_EQ(pool->lease_state(lease.id), LeaseState::Active);
}

TEST_F(ResourcePoolManagerTest, ExpiredLeaseIsStaleOnRelease) {
    create_pool();
    auto lease = pool->allocate(make_request("a"));
    sched->advance(1s);   // expires_at == now, no cleanup timer running

    EXPECT_THROW(pool->release(lease), StaleResourceException);
    EXPECT_EQ(pool->lease_state(lease.id), LeaseState::Stale);
    EXPECT_EQ(pool->monitor().active_leases, 0u);

    // Still stale on a second attempt
    EXPECT_THROW(pool->release(lease), StaleResourceException);
}

TEST_F(ResourcePoolManagerTest, EveryRejectedReleaseIsReported) {
    create_pool();
    auto metrics = std::make_shared<MetricsMonitor>();
    auto fan_out = std::make_shared<CompositeMonitor>();
    fan_out->add_monitor(recorder);
    fan_out->add_monitor(metrics);
    pool->set_monitor(fan_out);

    Lease forged;
    forged.id = 999;
    forged.request_id = "ghost";
    EXPECT_THROW(pool->release(forged), ValidationException);

    auto released = pool->allocate(make_request("a"));
    pool->release(released);
    EXPECT_THROW(pool->release(released), ValidationException);

    auto held = pool->allocate(make_request("b"));
    Lease tampered = held;
    tampered.request_id = "not-b";
    EXPECT_THROW(pool->release(tampered), ValidationException);

    sched->advance(1s);
    EXPECT_THROW(pool->release(held), StaleResourceException);
    EXPECT_THROW(pool->release(held), StaleResourceException);

    EXPECT_EQ(recorder->count(EventType::ReleaseRejected), 5u);
    EXPECT_EQ(recorder->count(EventType::LeaseReleased), 1u);
    EXPECT_EQ(metrics->get_metrics().rejected_releases, 5u);
    EXPECT_EQ(metrics->get_metrics().released_leases, 1u);

    auto last = recorder->last(EventType::ReleaseRejected);
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->lease_id, held.id);
    EXPECT_EQ(last->message, "Resource is stale");
}

TEST_F(ResourcePoolManagerTest, RetiredRecordsAreBounded) {
    cfg.retired_lease_retention = 2;
    create_pool();
    auto first = pool->allocate(make_request("a"));
    pool->release(first);
    pool->release(pool->allocate(make_request("b")));
    pool->release(pool->allocate(make_request("c")));

    EXPECT_FALSE(pool->lease_state(first.id).has_value());
    try {
        pool->release(first);
        FAIL() << "expected ValidationException";
    } catch (const ValidationException& e) {
        EXPECT_STREQ(e.what(), "Unknown lease");
    }
}

// ===========================================================================
// Cache
// ===========================================================================

TEST_F(ResourcePoolManagerTest, RepeatedShapeHitsCache) {
    create_pool();
    auto a = pool->allocate(make_request("a", 1000.0));
    pool->release(a);
    auto b = pool->allocate(make_request("b", 1020.0));   // same 1 KiB bucket

    EXPECT_FALSE(a.from_cache);
    EXPECT_TRUE(b.from_cache);
    EXPECT_NE(a.id, b.id);
    EXPECT_DOUBLE_EQ(*a.requirements.memory, 1000.0);
    EXPECT_EQ(a.reuse_count, 0u);

    // Reissued from the cached shape: the bucket ceiling covers both requests
    EXPECT_DOUBLE_EQ(*b.requirements.memory, 1024.0);
    EXPECT_FALSE(b.requirements.cpu.has_value());
    EXPECT_EQ(b.request_id, "b");
    EXPECT_EQ(b.reuse_count, 1u);

    auto m = pool->get_metrics();
    EXPECT_EQ(m.cache_hits, 1u);
    EXPECT_EQ(m.cache_misses, 1u);
    EXPECT_DOUBLE_EQ(m.cache_hit_rate(), 0.5);
}

TEST_F(ResourcePoolManagerTest, CacheHitKeepsRequestLifetime) {
    create_pool();
    pool->release(pool->allocate(make_request("a", 2000.0, 15.0)));

    auto req = make_request("b", 1900.0, 12.0);
    req.requirements.timeout = 5s;
    auto b = pool->allocate(req);
    pool->release(b);
    auto c = pool->allocate(make_request("c", 2048.0, 20.0));

    ASSERT_TRUE(b.from_cache);
    EXPECT_DOUBLE_EQ(*b.requirements.memory, 2048.0);
    EXPECT_DOUBLE_EQ(*b.requirements.cpu, 20.0);
    ASSERT_TRUE(b.requirements.timeout.has_value());
    EXPECT_EQ(*b.requirements.timeout, Duration(5s));
    EXPECT_EQ(b.expires_at, b.allocated_at + 5s);

    ASSERT_TRUE(c.from_cache);
    EXPECT_EQ(c.reuse_count, 2u);
    EXPECT_FALSE(c.requirements.timeout.has_value());
    EXPECT_EQ(c.expires_at, c.allocated_at + 1s);
}

TEST_F(ResourcePoolManagerTest, CacheEvictsBeyondCapacity) {
    cfg.cache_max_size = 2;
    create_pool();
    for (int i = 1; i <= 3; ++i) {
        pool->allocate(make_request("r" + std::to_string(i), 1024.0 * i));
    }
    auto m = pool->get_metrics();
    EXPECT_EQ(m.cached_shapes, 2u);
    EXPECT_EQ(m.cache_evictions, 1u);
}

TEST_F(ResourcePoolManagerTest, DisabledCacheNeverHits) {
    cfg.cache_max_size = 0;
    create_pool();
    pool->release(pool->allocate(make_request("a", 10.0)));
    auto lease = pool->allocate(make_request("b", 10.0));
    EXPECT_FALSE(lease.from_cache);
    EXPECT_EQ(pool->get_metrics().cached_shapes, 0u);
}

TEST_F(ResourcePoolManagerTest, CleanupTrimsIdleShapesAboveFloor) {
    cfg.resource_timeout = 100ms;
    create_pool();
    for (int i = 1; i <= 3; ++i) {
        auto req = make_request("r" + std::to_string(i), 1024.0 * i);
        req.requirements.timeout = 10s;
        pool->release(pool->allocate(req));
    }
    sched->advance(200ms);

    EXPECT_EQ(pool->run_cleanup(), 0u);
    EXPECT_EQ(pool->get_metrics().cached_shapes, 1u);
    EXPECT_EQ(recorder->last(EventType::CacheEvicted)->count, 2u);
}

// ===========================================================================
// Cleanup
// ===========================================================================

TEST_F(ResourcePoolManagerTest, CleanupSweepsExpiredLeases) {
    create_pool();
    auto short_req = make_request("short");
    short_req.requirements.timeout = 50ms;
    auto expiring = pool->allocate(short_req);
    auto keeping = pool->allocate(make_request("long"));

    sched->advance(50ms);
    EXPECT_EQ(pool->run_cleanup(), 1u);
    EXPECT_EQ(pool->lease_state(expiring.id), LeaseState::Stale);
    EXPECT_EQ(pool->lease_state(keeping.id), LeaseState::Active);
    EXPECT_EQ(pool->get_metrics().stale_leases, 1u);

    auto done = recorder->last(EventType::CleanupCompleted);
    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done->count, 1u);
}

// ===========================================================================
// Health
// ===========================================================================

TEST_F(ResourcePoolManagerTest, ForceUpdateFeedsStateMachine) {
    create_pool();
    detector->set_utilization(85.0, 40.0);
    pool->force_update();

    auto status = pool->monitor();
    EXPECT_EQ(status.health, HealthStatus::Degraded);
    EXPECT_EQ(status.last_updated, sched->now());
    EXPECT_STREQ(to_pool_label(status.health), "warning");

    auto samples = pool->health_manager().recent_samples(1);
    ASSERT_EQ(samples.size(), 1u);
    EXPECT_NEAR(*samples[0].indicators.metrics.utilization, 0.85, 1e-9);
    EXPECT_DOUBLE_EQ(*samples[0].indicators.metrics.error_rate, 0.0);
    EXPECT_FALSE(recorder->snapshots.empty());
    ASSERT_TRUE(pool->last_availability().has_value());
}

TEST_F(ResourcePoolManagerTest, PoolOccupancyCountsTowardsUtilization) {
    cfg.max_pool_size = 4;
    create_pool();
    detector->set_utilization(10.0, 10.0);
    for (int i = 0; i < 3; ++i) {
        pool->allocate(make_request("r" + std::to_string(i)));
    }
    pool->force_update();

    auto samples = pool->health_manager().recent_samples(1);
    EXPECT_NEAR(*samples[0].indicators.metrics.utilization, 0.75, 1e-9);
    EXPECT_EQ(pool->monitor().health, HealthStatus::Degraded);
}

TEST_F(ResourcePoolManagerTest, AllocationFailuresRaiseErrorRate) {
    cfg.max_pool_size = 1;
    cfg.min_pool_size = 0;
    create_pool();
    detector->set_utilization(10.0, 10.0);
    pool->allocate(make_request("a"));
    EXPECT_THROW(pool->allocate(make_request("b")), PoolExhaustedException);
    pool->force_update();

    auto samples = pool->health_manager().recent_samples(1);
    EXPECT_DOUBLE_EQ(*samples[0].indicators.metrics.error_rate, 0.5);
    EXPECT_EQ(pool->monitor().health, HealthStatus::Degraded);

    // Window resets after each sample
    pool->force_update();
    samples = pool->health_manager().recent_samples(1);
    EXPECT_DOUBLE_EQ(*samples[0].indicators.metrics.error_rate, 0.0);
}

TEST_F(ResourcePoolManagerTest, UnhealthyHostRejectsResourceHungryRequests) {
    create_pool();
    detector->set_utilization(95.0, 95.0);
    pool->force_update();
    pool->force_update();
    ASSERT_EQ(pool->monitor().health, HealthStatus::Unhealthy);

    try {
        pool->allocate(make_request("big", 1024.0));
        FAIL() << "expected PoolExhaustedException";
    } catch (const PoolExhaustedException& e) {
        EXPECT_STREQ(e.what(), "System resources exhausted");
        EXPECT_EQ(e.context().at("health"), "critical");
        EXPECT_EQ(e.context().at("metric"), "memory");
        EXPECT_EQ(e.context().at("required"), std::to_string(1024.0));
        EXPECT_EQ(e.context().at("criticalThreshold"), std::to_string(90.0));
        EXPECT_EQ(e.context().count("utilizationPercent"), 1u);
    }
    try {
        pool->allocate(make_request("cpu", std::nullopt, 50.0));
        FAIL() << "expected PoolExhaustedException";
    } catch (const PoolExhaustedException& e) {
        EXPECT_EQ(e.context().at("metric"), "cpu");
        EXPECT_EQ(e.context().at("required"), std::to_string(1.0));
        EXPECT_EQ(e.context().at("available"), std::to_string(8.0));
    }

    // Requests without requirements only need pool capacity
    EXPECT_NO_THROW(pool->allocate(make_request("small")));
}

TEST_F(ResourcePoolManagerTest, HealthResetIsVisibleToMonitorAndAllocation) {
    create_pool();
    detector->set_utilization(95.0, 95.0);
    pool->force_update();
    pool->force_update();
    ASSERT_EQ(pool->monitor().health, HealthStatus::Unhealthy);
    EXPECT_THROW(pool->allocate(make_request("big", 1024.0)), PoolExhaustedException);

    auto result = pool->reset_health("operator");
    EXPECT_TRUE(result.changed);
    EXPECT_EQ(result.status, HealthStatus::Degraded);
    EXPECT_EQ(pool->monitor().health, HealthStatus::Degraded);
    EXPECT_EQ(pool->monitor().health, pool->health_manager().current_status());
    EXPECT_EQ(recorder->snapshots.back().health, HealthStatus::Degraded);

    // The health gate only applies while unhealthy
    EXPECT_NO_THROW(pool->allocate(make_request("big-again", 1024.0)));
}

TEST_F(ResourcePoolManagerTest, ExplicitHealthTransitionsGoThroughGuards) {
    create_pool();
    try {
        pool->transition_health(HealthStatus::Unhealthy, "operator");
        FAIL() << "expected GuardRejectedException";
    } catch (const GuardRejectedException& e) {
        EXPECT_EQ(e.from(), HealthStatus::Healthy);
        EXPECT_EQ(e.to(), HealthStatus::Unhealthy);
    }
    EXPECT_EQ(pool->monitor().health, HealthStatus::Healthy);
    EXPECT_EQ(recorder->count(EventType::HealthTransitionRejected), 1u);
}

TEST_F(ResourcePoolManagerTest, PoolHealthGuardsApplyToResets) {
    create_pool();
    bool frozen = true;
    pool->add_health_guard({"Frozen by operator", [&](HealthStatus, HealthStatus to) {
        return !(frozen && to == HealthStatus::Healthy);
    }});

    detector->set_utilization(85.0, 40.0);
    pool->force_update();
    ASSERT_EQ(pool->monitor().health, HealthStatus::Degraded);

    try {
        pool->reset_health("operator");
        FAIL() << "expected GuardRejectedException";
    } catch (const GuardRejectedException& e) {
        EXPECT_NE(std::string(e.what()).find("Frozen by operator"), std::string::npos);
    }
    EXPECT_EQ(pool->monitor().health, HealthStatus::Degraded);

    frozen = false;
    auto result = pool->reset_health("operator");
    EXPECT_EQ(result.status, HealthStatus::Healthy);
    EXPECT_EQ(pool->monitor().health, HealthStatus::Healthy);
    EXPECT_EQ(pool->health_manager().transitions().back().reason, "reset: operator");
}

TEST_F(ResourcePoolManagerTest, ThrowingAlertSubscriberCountsAsDetectorFailure) {
    create_pool();
    detector->on_alert([](const ResourceAlert&) { throw std::runtime_error("pager down"); });
    detector->set_utilization(85.0, 40.0);

    EXPECT_NO_THROW(pool->force_update());
    EXPECT_EQ(pool->monitor().health, HealthStatus::Healthy);
    EXPECT_EQ(recorder->count(EventType::DetectorFailure), 1u);
}

TEST_F(ResourcePoolManagerTest, DetectorFailureKeepsHealth) {
    create_pool();
    detector->set_utilization(85.0, 40.0);
    pool->force_update();
    ASSERT_EQ(pool->monitor().health, HealthStatus::Degraded);

    detector->set_failure("sensor down");
    EXPECT_NO_THROW(pool->force_update());
    EXPECT_EQ(pool->monitor().health, HealthStatus::Degraded);
    EXPECT_EQ(recorder->count(EventType::DetectorFailure), 1u);

    auto alert = recorder->last(EventType::DetectorAlert);
    ASSERT_TRUE(alert.has_value());
    EXPECT_EQ(alert->message, "Resource detection failed: sensor down");
}

TEST_F(ResourcePoolManagerTest, DetectorAlertsAreForwarded) {
    create_pool();
    detector->set_utilization(85.0, 40.0);
    pool->force_update();
    auto alert = recorder->last(EventType::DetectorAlert);
    ASSERT_TRUE(alert.has_value());
    EXPECT_EQ(alert->message, "memory usage exceeded warning threshold");
}

TEST_F(ResourcePoolManagerTest, DetectorOutlivesPool) {
    create_pool();
    pool.reset();
    detector->set_utilization(95.0, 95.0);
    EXPECT_NO_THROW(detector->refresh());
}

// ===========================================================================
// Circuit breaker
// ===========================================================================

TEST_F(ResourcePoolManagerTest, CircuitOpensAfterRepeatedExhaustion) {
    cfg.max_pool_size = 1;
    cfg.min_pool_size = 0;
    cfg.circuit_breaker.enabled = true;
    cfg.circuit_breaker.failure_threshold = 2;
    cfg.circuit_breaker.reset_timeout = 1s;
    cfg.circuit_breaker.half_open_max_attempts = 1;
    create_pool();

    auto held = pool->allocate(make_request("held"));
    EXPECT_THROW(pool->allocate(make_request("x")), PoolExhaustedException);
    EXPECT_THROW(pool->allocate(make_request("y")), PoolExhaustedException);
    EXPECT_EQ(pool->circuit_state(), CircuitState::Open);
    EXPECT_EQ(recorder->count(EventType::CircuitOpened), 1u);

    pool->release(held);
    try {
        pool->allocate(make_request("z"));
        FAIL() << "expected PoolExhaustedException";
    } catch (const PoolExhaustedException& e) {
        EXPECT_STREQ(e.what(), "Circuit breaker is open");
    }

    sched->advance(1s);
    EXPECT_NO_THROW(pool->allocate(make_request("trial")));
    EXPECT_EQ(pool->circuit_state(), CircuitState::Closed);
    EXPECT_EQ(recorder->count(EventType::CircuitClosed), 1u);
}

// ===========================================================================
// Lifecycle
// ===========================================================================

TEST_F(ResourcePoolManagerTest, StartSchedulesTimersAndSamples) {
    create_pool();
    pool->start();

    EXPECT_TRUE(pool->is_running());
    EXPECT_EQ(sched->active_timers(), 2u);
    EXPECT_EQ(recorder->count(EventType::PoolStarted), 1u);
    EXPECT_EQ(pool->health_manager().history().sample_count(), 1u);

    sched->advance(1s);
    EXPECT_EQ(pool->health_manager().history().sample_count(), 3u);
}

TEST_F(ResourcePoolManagerTest, DisposeStopsEverything) {
    create_pool();
    pool->start();
    pool->allocate(make_request("a", 64.0));
    pool->dispose();

    EXPECT_TRUE(pool->is_disposed());
    EXPECT_FALSE(pool->is_running());
    EXPECT_EQ(sched->active_timers(), 0u);
    EXPECT_EQ(pool->get_metrics().cached_shapes, 0u);
    EXPECT_EQ(recorder->count(EventType::PoolDisposed), 1u);

    EXPECT_THROW(pool->allocate(make_request("b")), ValidationException);
    EXPECT_THROW(pool->start(), ValidationException);

    // Idempotent
    EXPECT_NO_THROW(pool->dispose());
    EXPECT_EQ(recorder->count(EventType::PoolDisposed), 1u);
}

TEST_F(ResourcePoolManagerTest, EventsCarryLeaseDetails) {
    create_pool();
    auto lease = pool->allocate(make_request("req-9"));

    auto granted = recorder->last(EventType::LeaseGranted);
    ASSERT_TRUE(granted.has_value());
    EXPECT_EQ(granted->lease_id, lease.id);
    EXPECT_EQ(granted->request_id, std::string("req-9"));
    EXPECT_TRUE(granted->duration_us.has_value());
    EXPECT_DOUBLE_EQ(*granted->utilization, 0.1);
}
