#include "leaseguard/config.hpp"
#include "leaseguard/exceptions.hpp"

#include <cmath>
#include <utility>

namespace leaseguard {

namespace {

std::string fmt(double v) {
    std::string s = std::to_string(v);
    // Trim trailing zeros ("0.700000" -> "0.7")
    auto dot = s.find('.');
    if (dot != std::string::npos) {
        auto last = s.find_last_not_of('0');
        s.erase(last == dot ? dot : last + 1);
    }
    return s;
}

} // anonymous namespace

void validate(const MetricThresholds& band, const std::string& name) {
    ErrorContext ctx{{"metric", name},
                     {"warning", fmt(band.warning)},
                     {"critical", fmt(band.critical)},
                     {"recovery", fmt(band.recovery)}};

    if (!std::isfinite(band.warning) || !std::isfinite(band.critical) ||
        !std::isfinite(band.recovery)) {
        throw ValidationException("Threshold band for " + name + " must be finite", ctx);
    }

    bool ordered = (band.direction == MetricDirection::HigherIsWorse)
        ? (band.recovery < band.warning && band.warning <= band.critical)
        : (band.recovery > band.warning && band.warning >= band.critical);
    if (!ordered) {
        throw ValidationException(
            "Threshold band for " + name +
            " must satisfy recovery inside warning inside critical", ctx);
    }
}

void validate(const ThresholdConfig& config) {
    validate(config.memory.heap_usage, "memory.heapUsage");
    validate(config.memory.cache_utilization, "memory.cacheUtilization");
    validate(config.performance.latency, "performance.latency");
    validate(config.performance.throughput, "performance.throughput");
    validate(config.error.error_rate, "error.errorRate");
    validate(config.resource.utilization, "resource.utilization");
}

void validate(const RecoveryConfig& config) {
    if (config.min_healthy_samples == 0) {
        throw ValidationException("min_healthy_samples must be at least 1");
    }
    if (config.required_success_rate < 0.0 || config.required_success_rate > 1.0) {
        throw ValidationException("required_success_rate must be within [0, 1]",
                                  {{"requiredSuccessRate", fmt(config.required_success_rate)}});
    }
    if (config.required_success_rate > 0.0 && config.validation_window == 0) {
        throw ValidationException("validation_window must be positive when a success rate is required");
    }
    if (config.cooldown_period < Duration::zero()) {
        throw ValidationException("cooldown_period must be non-negative");
    }
}

void validate(const DetectorConfig& config) {
    if (config.update_interval <= Duration::zero()) {
        throw ValidationException("Detector update_interval must be positive");
    }
    const std::pair<const char*, const CategoryThresholds*> categories[] = {
        {"memory", &config.memory}, {"cpu", &config.cpu}, {"disk", &config.disk}};
    for (const auto& [name, t] : categories) {
        if (!(t->warning >= 0.0 && t->warning <= t->critical && t->critical <= 100.0)) {
            throw ValidationException(std::string("Detector thresholds for ") + name +
                                      " must satisfy 0 <= warning <= critical <= 100",
                                      {{"warning", fmt(t->warning)},
                                       {"critical", fmt(t->critical)}});
        }
    }
}

void validate(const PoolConfig& config) {
    if (config.max_pool_size == 0) {
        throw ValidationException("max_pool_size must be at least 1");
    }
    if (config.min_pool_size > config.max_pool_size) {
        throw ValidationException("min_pool_size exceeds max_pool_size",
                                  {{"minPoolSize", std::to_string(config.min_pool_size)},
                                   {"maxPoolSize", std::to_string(config.max_pool_size)}});
    }
    if (config.cleanup_interval <= Duration::zero() ||
        config.health_check_interval <= Duration::zero()) {
        throw ValidationException("Timer intervals must be positive");
    }
    if (config.resource_timeout <= Duration::zero()) {
        throw ValidationException("resource_timeout must be positive");
    }
    if (!(config.recovery_threshold < config.warning_threshold &&
          config.warning_threshold <= config.critical_threshold &&
          config.recovery_threshold >= 0.0)) {
        throw ValidationException(
            "Utilization thresholds must satisfy 0 <= recovery < warning <= critical",
            {{"recoveryThreshold", fmt(config.recovery_threshold)},
             {"warningThreshold", fmt(config.warning_threshold)},
             {"criticalThreshold", fmt(config.critical_threshold)}});
    }
    if (config.memory_quantum <= 0.0 || config.cpu_quantum <= 0.0) {
        throw ValidationException("Fingerprint quanta must be positive");
    }
    validate(config.thresholds);
    validate(config.recovery);
}

} // namespace leaseguard
