#include "leaseguard/metric_evaluator.hpp"
#include "leaseguard/exceptions.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>

namespace leaseguard {

namespace {

std::string format_value(double v) {
    std::ostringstream out;
    out << v;
    return out.str();
}

void append(std::vector<std::string>& to, const std::vector<std::string>& from) {
    to.insert(to.end(), from.begin(), from.end());
}

} // anonymous namespace

MetricEvaluator::MetricEvaluator(ThresholdConfig thresholds)
    : thresholds_(std::move(thresholds)) {
    validate(thresholds_);
}

MetricValidationResult MetricEvaluator::evaluate(double value, const MetricThresholds& band,
                                                 const std::string& metric_name) {
    MetricValidationResult result;
    bool higher_is_worse = band.direction == MetricDirection::HigherIsWorse;
    const char* extreme = higher_is_worse ? "high" : "low";
    const char* crosses = higher_is_worse ? " exceeds " : " falls below ";

    if (band.breaches_critical(value)) {
        result.score = 0.2;
        result.violations.push_back(metric_name + crosses + "critical threshold: " +
                                    format_value(value));
        result.recommendations.push_back("Immediate action required: " + metric_name +
                                         " is critically " + extreme);
    } else if (band.breaches_warning(value)) {
        result.score = 0.6;
        result.violations.push_back(metric_name + crosses + "warning threshold: " +
                                    format_value(value));
        result.recommendations.push_back("Monitor " + metric_name +
                                         ": approaching critical levels");
    } else if (higher_is_worse ? value > band.recovery * 1.1 : value < band.recovery * 0.9) {
        result.score = 0.8;
        result.recommendations.push_back("Continue monitoring " + metric_name +
                                         " for stability");
    }

    result.is_valid = result.score >= 0.8;
    return result;
}

MetricValidationResult MetricEvaluator::evaluate_memory_health(const MemoryMetrics& metrics) const {
    if (!(metrics.heap_limit > 0.0)) {
        throw ValidationException("heap_limit must be positive",
                                  {{"heapLimit", format_value(metrics.heap_limit)}});
    }

    auto heap = evaluate(metrics.heap_usage / metrics.heap_limit,
                         thresholds_.memory.heap_usage, "Heap usage");
    auto cache = evaluate(metrics.cache_utilization,
                          thresholds_.memory.cache_utilization, "Cache utilization");

    MetricValidationResult result;
    result.score = heap.score * 0.6 + cache.score * 0.4;
    append(result.violations, heap.violations);
    append(result.violations, cache.violations);
    append(result.recommendations, heap.recommendations);
    append(result.recommendations, cache.recommendations);
    result.is_valid = result.score >= 0.8;
    return result;
}

MetricValidationResult MetricEvaluator::evaluate_performance_health(
    const PerformanceMetrics& metrics) const {
    const auto& samples = metrics.latencies_ms;
    double mean = samples.empty()
        ? 0.0
        : std::accumulate(samples.begin(), samples.end(), 0.0) / static_cast<double>(samples.size());

    auto latency = evaluate(mean, thresholds_.performance.latency, "Average latency");
    auto throughput = evaluate(metrics.throughput, thresholds_.performance.throughput, "Throughput");
    double spike = latency_spike_score(samples);

    MetricValidationResult result;
    result.score = latency.score * 0.4 + throughput.score * 0.3 + spike * 0.3;
    append(result.violations, latency.violations);
    append(result.violations, throughput.violations);
    append(result.recommendations, latency.recommendations);
    append(result.recommendations, throughput.recommendations);

    if (spike < 0.8) {
        result.violations.push_back("High latency variance detected");
        result.recommendations.push_back("Investigate potential resource contention");
        result.recommendations.push_back("Monitor system load patterns");
        result.recommendations.push_back("Review concurrent operations");
    }

    result.is_valid = result.score >= 0.8;
    return result;
}

MetricValidationResult MetricEvaluator::evaluate_error_health(const ErrorMetrics& metrics) const {
    double rate = metrics.total_operations > 0
        ? static_cast<double>(metrics.error_count) / static_cast<double>(metrics.total_operations)
        : 0.0;

    auto result = evaluate(rate, thresholds_.error.error_rate, "Error rate");
    if (result.score < 0.8) {
        result.recommendations.push_back("Review error patterns and frequencies");
        result.recommendations.push_back("Check error handling mechanisms");
        result.recommendations.push_back("Consider enabling the circuit breaker");
    }
    return result;
}

MetricValidationResult MetricEvaluator::evaluate_utilization_health(double utilization) const {
    return evaluate(utilization, thresholds_.resource.utilization, "Resource utilization");
}

double MetricEvaluator::aggregate_score(const std::vector<MetricValidationResult>& results) {
    if (results.empty()) {
        return 1.0;
    }
    double sum = 0.0;
    for (const auto& r : results) {
        sum += r.score;
    }
    return sum / static_cast<double>(results.size());
}

double MetricEvaluator::latency_spike_score(const std::vector<double>& latencies) {
    if (latencies.size() < 3) {
        return 1.0;
    }

    double n = static_cast<double>(latencies.size());
    double mean = std::accumulate(latencies.begin(), latencies.end(), 0.0) / n;
    double variance = 0.0;
    for (double l : latencies) {
        variance += (l - mean) * (l - mean);
    }
    double std_dev = std::sqrt(variance / n);

    auto spikes = std::count_if(latencies.begin(), latencies.end(), [&](double l) {
        return std::abs(l - mean) > 2.0 * std_dev;
    });

    double ratio = static_cast<double>(spikes) / n;
    return std::max(0.0, 1.0 - ratio * 5.0);
}

} // namespace leaseguard
