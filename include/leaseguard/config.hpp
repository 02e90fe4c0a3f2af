#pragma once

#include "leaseguard/types.hpp"
#include <cstddef>
#include <string>

namespace leaseguard {

// Whether large values (latency) or small values (throughput) are bad
enum class MetricDirection {
    HigherIsWorse,
    LowerIsWorse
};

// {warning, critical, recovery} band for one metric.
// recovery is the most forgiving bound and lies strictly inside warning.
struct MetricThresholds {
    double warning{0.0};
    double critical{0.0};
    double recovery{0.0};
    MetricDirection direction{MetricDirection::HigherIsWorse};

    bool breaches_critical(double value) const noexcept {
        return direction == MetricDirection::HigherIsWorse ? value >= critical
                                                           : value <= critical;
    }

    bool breaches_warning(double value) const noexcept {
        return direction == MetricDirection::HigherIsWorse ? value >= warning
                                                           : value <= warning;
    }

    bool within_recovery(double value) const noexcept {
        return direction == MetricDirection::HigherIsWorse ? value <= recovery
                                                           : value >= recovery;
    }

    // Strictly better than `previous` in this band's direction
    bool improved(double value, double previous) const noexcept {
        return direction == MetricDirection::HigherIsWorse ? value < previous
                                                           : value > previous;
    }

    bool worsened(double value, double previous) const noexcept {
        return improved(previous, value);
    }
};

struct ThresholdConfig {
    struct Memory {
        MetricThresholds heap_usage{0.7, 0.9, 0.5};
        MetricThresholds cache_utilization{0.8, 0.95, 0.6};
    } memory;

    struct Performance {
        // milliseconds
        MetricThresholds latency{100.0, 200.0, 50.0};
        // operations per second, lower is worse
        MetricThresholds throughput{500.0, 200.0, 800.0, MetricDirection::LowerIsWorse};
    } performance;

    struct Error {
        MetricThresholds error_rate{0.05, 0.1, 0.01};
    } error;

    // Pool-level utilization fraction. ResourcePoolManager rebuilds this band
    // from its warning/critical/recovery thresholds.
    struct Resource {
        MetricThresholds utilization{0.7, 0.9, 0.5};
    } resource;
};

// How much sustained evidence is needed before leaving a downgraded state
struct RecoveryConfig {
    // Consecutive improving samples required for unhealthy -> degraded
    std::size_t min_healthy_samples = 3;

    // Samples inspected by the success-rate guard on degraded -> healthy
    std::size_t validation_window = 5;

    // Fraction of samples in the window that must sit within warning bounds.
    // 0 disables the guard.
    double required_success_rate = 0.0;

    // Minimum time since the last accepted transition before recovering to
    // healthy. Zero disables the guard.
    Duration cooldown_period = Duration::zero();
};

struct CircuitBreakerConfig {
    bool enabled = false;
    std::size_t failure_threshold = 5;
    Duration reset_timeout = std::chrono::seconds(30);
    std::size_t half_open_max_attempts = 3;
};

// Warning / critical utilization percentages for one detector category
struct CategoryThresholds {
    double warning{80.0};
    double critical{90.0};
};

struct DetectorConfig {
    // How often the detector refreshes its snapshot once started
    Duration update_interval = std::chrono::seconds(1);

    CategoryThresholds memory{80.0, 90.0};
    CategoryThresholds cpu{80.0, 90.0};
    CategoryThresholds disk{85.0, 95.0};
};

struct PoolConfig {
    // Idle cached shapes are never trimmed below this count
    std::size_t min_pool_size = 10;

    // Upper bound on simultaneously active leases
    std::size_t max_pool_size = 1000;

    // Number of reusable lease shapes kept (0 disables the cache)
    std::size_t cache_max_size = 100;

    // Period of the stale-lease sweep
    Duration cleanup_interval = std::chrono::seconds(60);

    // Lease lifetime when the request carries no timeout
    Duration resource_timeout = std::chrono::seconds(30);

    // Period of the detector sampling / health update
    Duration health_check_interval = std::chrono::seconds(1);

    // Utilization fractions used to classify detector snapshots
    double warning_threshold = 0.7;
    double critical_threshold = 0.9;
    double recovery_threshold = 0.5;

    // Fingerprint quantization steps
    double memory_quantum = 1024.0;
    double cpu_quantum = 10.0;

    // Released / stale lease records remembered for precise release errors
    std::size_t retired_lease_retention = 10000;

    // Health samples kept by the state machine
    std::size_t history_capacity = 64;

    ThresholdConfig thresholds;
    RecoveryConfig recovery;
    CircuitBreakerConfig circuit_breaker;
};

// Throw ValidationException when a band or config is inconsistent
void validate(const MetricThresholds& band, const std::string& name);
void validate(const ThresholdConfig& config);
void validate(const RecoveryConfig& config);
void validate(const DetectorConfig& config);
void validate(const PoolConfig& config);

} // namespace leaseguard
