#pragma once

#include "leaseguard/types.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace leaseguard {

enum class EventType {
    PoolStarted,
    PoolDisposed,
    LeaseGranted,
    LeaseReleased,
    LeaseExpired,
    AllocationRejected,
    ReleaseRejected,
    CacheHit,
    CacheMiss,
    CacheEvicted,
    CleanupCompleted,
    // Health state machine
    HealthSampleRecorded,
    HealthTransitionAccepted,
    HealthTransitionRejected,
    // Detector
    DetectorAlert,
    DetectorFailure,
    // Circuit breaker
    CircuitOpened,
    CircuitClosed
};

const char* to_string(EventType t);

struct MonitorEvent {
    EventType type;
    Timestamp timestamp;
    std::string message;

    std::optional<LeaseId> lease_id;
    std::optional<RequestId> request_id;

    // Health transitions
    std::optional<HealthStatus> from_status;
    std::optional<HealthStatus> to_status;

    // Pool utilization fraction at the time of the event
    std::optional<double> utilization;

    // Count attached to batch events (expired leases, evicted shapes)
    std::optional<std::size_t> count;

    // Operation duration in microseconds (e.g., allocation latency)
    std::optional<double> duration_us;
};

// Abstract monitor interface
class Monitor {
public:
    virtual ~Monitor() = default;
    virtual void on_event(const MonitorEvent& event) = 0;
    virtual void on_snapshot(const PoolSnapshot& snapshot) = 0;
};

// Console logger
class ConsoleMonitor : public Monitor {
public:
    enum class Verbosity { Quiet, Normal, Verbose, Debug };

    explicit ConsoleMonitor(Verbosity v = Verbosity::Normal);

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const PoolSnapshot& snapshot) override;

private:
    Verbosity verbosity_;
    mutable std::mutex output_mutex_;
};

// Metrics collector
class MetricsMonitor : public Monitor {
public:
    struct Metrics {
        std::uint64_t granted_leases{0};
        std::uint64_t rejected_allocations{0};
        std::uint64_t released_leases{0};
        std::uint64_t rejected_releases{0};
        std::uint64_t expired_leases{0};
        std::uint64_t cache_hits{0};
        std::uint64_t cache_misses{0};
        std::uint64_t accepted_transitions{0};
        std::uint64_t rejected_transitions{0};
        std::uint64_t detector_alerts{0};
        std::uint64_t detector_failures{0};
        double average_allocation_latency_us{0.0};
        double utilization_percent{0.0};
        HealthStatus last_health{HealthStatus::Healthy};
    };

    MetricsMonitor();

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const PoolSnapshot& snapshot) override;

    Metrics get_metrics() const;
    void reset_metrics();

    using AlertCallback = std::function<void(const std::string&)>;
    void set_utilization_alert_threshold(double threshold, AlertCallback cb);
    void set_expired_lease_alert_threshold(std::uint64_t threshold, AlertCallback cb);

private:
    mutable std::mutex metrics_mutex_;
    Metrics metrics_;

    double utilization_threshold_{1.1};  // > 1.0 means disabled
    AlertCallback utilization_cb_;
    std::uint64_t expired_threshold_{0};
    AlertCallback expired_cb_;

    std::uint64_t latency_sample_count_{0};
    double latency_sum_us_{0.0};
};

// Fan-out to multiple monitors
class CompositeMonitor : public Monitor {
public:
    void add_monitor(std::shared_ptr<Monitor> monitor);

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const PoolSnapshot& snapshot) override;

private:
    std::vector<std::shared_ptr<Monitor>> monitors_;
};

} // namespace leaseguard
