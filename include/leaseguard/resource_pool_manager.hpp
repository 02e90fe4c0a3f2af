#pragma once

#include "leaseguard/circuit_breaker.hpp"
#include "leaseguard/config.hpp"
#include "leaseguard/exceptions.hpp"
#include "leaseguard/health_state_manager.hpp"
#include "leaseguard/lease_cache.hpp"
#include "leaseguard/metric_evaluator.hpp"
#include "leaseguard/monitor.hpp"
#include "leaseguard/resource_detector.hpp"
#include "leaseguard/scheduler.hpp"
#include "leaseguard/types.hpp"

#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace leaseguard {

struct PoolMetrics {
    std::uint64_t allocations{0};
    std::uint64_t releases{0};
    std::uint64_t allocation_failures{0};   // capacity / health / circuit rejections
    std::uint64_t validation_failures{0};
    std::uint64_t stale_leases{0};
    std::uint64_t cache_hits{0};
    std::uint64_t cache_misses{0};
    std::uint64_t cache_evictions{0};
    std::size_t active_leases{0};
    std::size_t peak_active_leases{0};
    std::size_t cached_shapes{0};
    double average_allocation_latency_us{0.0};
    CircuitState circuit_state{CircuitState::Closed};

    double cache_hit_rate() const {
        auto lookups = cache_hits + cache_misses;
        return lookups == 0 ? 0.0 : static_cast<double>(cache_hits) / static_cast<double>(lookups);
    }
};

// Leases bounded capacity to concurrent callers and keeps a guarded health
// classification fed by the detector.
//
// allocate/release/monitor never perform I/O. Detector sampling happens on
// the health tick or in force_update().
class ResourcePoolManager {
public:
    ResourcePoolManager(std::shared_ptr<ResourceDetector> detector,
                        PoolConfig config = PoolConfig{},
                        std::shared_ptr<Scheduler> scheduler = nullptr);
    ~ResourcePoolManager();

    ResourcePoolManager(const ResourcePoolManager&) = delete;
    ResourcePoolManager& operator=(const ResourcePoolManager&) = delete;

    // ==================== Leases ====================

    // Throws ValidationException or PoolExhaustedException
    Lease allocate(const ResourceRequest& request);

    // Throws ValidationException or StaleResourceException
    void release(const Lease& lease);

    std::optional<LeaseState> lease_state(LeaseId id) const;

    // ==================== Health ====================

    // Cached view; never evaluates metrics
    PoolStatus monitor() const;

    // Re-sample the detector and feed the state machine now
    void force_update();

    // Read-only view; commits go through the pool so monitor() stays in step
    const HealthStateManager& health_manager() const { return health_manager_; }

    // Step health one level towards healthy. Throws GuardRejectedException.
    TransitionResult reset_health(const std::string& reason);

    // Explicit transition judged on the latest sample. Throws GuardRejectedException.
    void transition_health(HealthStatus to, const std::string& reason = "manual");

    void add_health_guard(GuardCondition guard);

    std::optional<ResourceAvailability> last_availability() const;

    // ==================== Maintenance ====================

    // One stale-lease sweep. Returns the number of leases moved to stale.
    std::size_t run_cleanup();

    PoolMetrics get_metrics() const;
    CircuitState circuit_state() const { return breaker_.state(); }

    // ==================== Lifecycle ====================

    // Schedule the cleanup and health timers and take an initial sample
    void start();

    // Cancel timers and clear the cache. Later allocations are rejected.
    void dispose();

    bool is_running() const;
    bool is_disposed() const;

    void set_monitor(std::shared_ptr<Monitor> monitor);

    const PoolConfig& config() const { return config_; }
    Scheduler& scheduler() { return *scheduler_; }

private:
    struct LeaseRecord {
        Lease lease;
        Fingerprint fingerprint;
    };

    // Monitor holder that outlives the pool inside detector callbacks
    class EventSink {
    public:
        void set(std::shared_ptr<Monitor> monitor);
        void emit(const MonitorEvent& event);
        void snapshot(const PoolSnapshot& snapshot);
    private:
        std::mutex mutex_;
        std::shared_ptr<Monitor> monitor_;
    };

    void validate_request(const ResourceRequest& request) const;
    // Context naming the first requirement the last snapshot cannot cover
    std::optional<ErrorContext> resource_shortfall(const ResourceRequest& request) const;
    void reject_allocation(const ResourceRequest& request, const PoolExhaustedException& error);
    void record_breaker_failure(Timestamp now);
    void reject_release(const Lease& lease, Timestamp now, const std::string& reason);

    // Publish the committed state machine status; caller holds health_mutex_
    void sync_health(Timestamp now);

    // Caller holds pool_mutex_ exclusively
    void retire(LeaseId id, LeaseState state);

    void update_health(bool resample);
    HealthState build_sample(const ResourceAvailability& availability, Timestamp now);
    PoolSnapshot make_snapshot(Timestamp now) const;

    void emit_event(MonitorEvent event);

    PoolConfig config_;
    std::shared_ptr<Scheduler> scheduler_;
    std::shared_ptr<ResourceDetector> detector_;
    std::shared_ptr<EventSink> sink_;

    // Leases, counters and cache
    mutable std::shared_mutex pool_mutex_;
    std::unordered_map<LeaseId, LeaseRecord> leases_;
    std::unordered_map<LeaseId, LeaseState> retired_;
    std::deque<LeaseId> retired_order_;
    LeaseCache cache_;
    LeaseId next_lease_id_{1};
    PoolMetrics metrics_;
    double latency_sum_us_{0.0};

    // Allocation outcomes since the previous health sample
    std::uint64_t window_attempts_{0};
    std::uint64_t window_failures_{0};

    // Lock-free reads for monitor()
    std::atomic<std::size_t> active_leases_{0};
    std::atomic<HealthStatus> health_{HealthStatus::Healthy};
    std::atomic<Timestamp> last_updated_{};

    MetricEvaluator evaluator_;
    HealthStateManager health_manager_;
    CircuitBreaker breaker_;

    // Serializes detector sampling and state machine feeding
    std::mutex health_mutex_;

    mutable std::mutex availability_mutex_;
    std::optional<ResourceAvailability> last_availability_;

    // Sweeps never overlap
    std::mutex sweep_mutex_;

    mutable std::mutex lifecycle_mutex_;
    std::optional<TimerId> cleanup_timer_;
    std::optional<TimerId> health_timer_;
    std::atomic<bool> disposed_{false};
};

} // namespace leaseguard
