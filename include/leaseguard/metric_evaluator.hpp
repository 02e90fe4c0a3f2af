#pragma once

#include "leaseguard/config.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace leaseguard {

struct MetricValidationResult {
    bool is_valid{true};
    double score{1.0};
    std::vector<std::string> violations;
    std::vector<std::string> recommendations;
};

struct MemoryMetrics {
    double heap_usage{0.0};
    double heap_limit{1.0};
    double cache_utilization{0.0};
};

struct PerformanceMetrics {
    std::vector<double> latencies_ms;
    double throughput{0.0};
};

struct ErrorMetrics {
    std::uint64_t error_count{0};
    std::uint64_t total_operations{0};
};

// Stateless scorer mapping raw readings onto ThresholdConfig bands.
// Scores: 0.2 past critical, 0.6 past warning, 0.8 near recovery, 1.0 otherwise.
class MetricEvaluator {
public:
    explicit MetricEvaluator(ThresholdConfig thresholds = {});

    // Score one value against one band
    static MetricValidationResult evaluate(double value, const MetricThresholds& band,
                                           const std::string& metric_name);

    // 0.6 * heap(usage / limit) + 0.4 * cache utilization
    MetricValidationResult evaluate_memory_health(const MemoryMetrics& metrics) const;

    // 0.4 * mean latency + 0.3 * throughput + 0.3 * spike score
    MetricValidationResult evaluate_performance_health(const PerformanceMetrics& metrics) const;

    MetricValidationResult evaluate_error_health(const ErrorMetrics& metrics) const;

    // Pool utilization fraction against the resource band
    MetricValidationResult evaluate_utilization_health(double utilization) const;

    // Arithmetic mean of the scores, 1.0 when there is nothing to judge
    static double aggregate_score(const std::vector<MetricValidationResult>& results);

    // Penalizes samples further than two standard deviations from the mean
    static double latency_spike_score(const std::vector<double>& latencies);

    const ThresholdConfig& thresholds() const { return thresholds_; }

private:
    ThresholdConfig thresholds_;
};

} // namespace leaseguard
