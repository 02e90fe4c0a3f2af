#include "leaseguard/recovery_validator.hpp"

#include <algorithm>
#include <array>
#include <exception>
#include <utility>

namespace leaseguard {

namespace {

using Reading = std::pair<std::optional<double>, const MetricThresholds*>;

std::array<Reading, 4> readings(const HealthMetrics& m, const ThresholdConfig& t) {
    return {{
        {m.response_time_ms, &t.performance.latency},
        {m.throughput, &t.performance.throughput},
        {m.error_rate, &t.error.error_rate},
        {m.utilization, &t.resource.utilization},
    }};
}

bool is_adjacent(HealthStatus from, HealthStatus to) {
    int gap = severity(from) - severity(to);
    return gap >= -1 && gap <= 1;
}

} // anonymous namespace

RecoveryValidator::RecoveryValidator(ThresholdConfig thresholds, RecoveryConfig recovery)
    : thresholds_(std::move(thresholds))
    , recovery_(recovery) {
    leaseguard::validate(thresholds_);
    leaseguard::validate(recovery_);
    install_built_in_guards();
}

void RecoveryValidator::install_built_in_guards() {
    built_in_.push_back({"Direct transition between healthy and unhealthy is forbidden",
        [](HealthStatus from, HealthStatus to) {
            return is_adjacent(from, to);
        }});

    built_in_.push_back({"No metric crosses its warning bound",
        [this](HealthStatus from, HealthStatus to) {
            if (from != HealthStatus::Healthy || to != HealthStatus::Degraded) return true;
            if (!context_ || context_->bypass_evidence) return true;
            return context_->candidate.has_value() &&
                   crosses_warning(context_->candidate->indicators.metrics);
        }});

    built_in_.push_back({"No metric crosses its critical bound after a degraded sample",
        [this](HealthStatus from, HealthStatus to) {
            if (from != HealthStatus::Degraded || to != HealthStatus::Unhealthy) return true;
            if (!context_ || context_->bypass_evidence) return true;
            return context_->candidate.has_value() &&
                   crosses_critical(context_->candidate->indicators.metrics) &&
                   !context_->recent.empty() &&
                   context_->recent.back().status == HealthStatus::Degraded;
        }});

    built_in_.push_back({"Improvement not sustained over enough consecutive samples",
        [this](HealthStatus from, HealthStatus to) {
            if (from != HealthStatus::Unhealthy || to != HealthStatus::Degraded) return true;
            if (!context_ || context_->bypass_evidence) return true;
            return sustained_improvement();
        }});

    built_in_.push_back({"Metrics not within recovery bounds or not improving over the previous sample",
        [this](HealthStatus from, HealthStatus to) {
            if (from != HealthStatus::Degraded || to != HealthStatus::Healthy) return true;
            if (!context_ || context_->bypass_evidence) return true;
            return recovered_to_healthy();
        }});

    built_in_.push_back({"Cooldown period has not elapsed",
        [this](HealthStatus from, HealthStatus to) {
            if (from != HealthStatus::Degraded || to != HealthStatus::Healthy) return true;
            if (!context_ || context_->bypass_evidence) return true;
            return cooldown_elapsed();
        }});

    built_in_.push_back({"Success rate over the validation window is too low",
        [this](HealthStatus from, HealthStatus to) {
            if (from != HealthStatus::Degraded || to != HealthStatus::Healthy) return true;
            if (!context_ || context_->bypass_evidence) return true;
            return success_rate_met();
        }});
}

std::vector<std::string> RecoveryValidator::validate(HealthStatus from, HealthStatus to,
                                                     const TransitionContext& context,
                                                     const std::vector<GuardCondition>& user_guards) {
    struct ContextScope {
        const TransitionContext*& slot;
        ~ContextScope() { slot = nullptr; }
    } scope{context_};
    context_ = &context;

    std::vector<std::string> failed;
    for (const auto& guard : built_in_) {
        if (!guard.evaluate(from, to)) {
            failed.push_back(guard.reason);
        }
    }

    for (const auto& guard : user_guards) {
        try {
            if (!guard.evaluate(from, to)) {
                failed.push_back(guard.reason);
            }
        } catch (const std::exception& e) {
            // A throwing guard counts as a rejection
            failed.push_back(guard.reason + " (guard failed: " + e.what() + ")");
        }
    }

    return failed;
}

HealthStatus RecoveryValidator::classify(const HealthMetrics& metrics) const {
    if (crosses_critical(metrics)) return HealthStatus::Unhealthy;
    if (crosses_warning(metrics)) return HealthStatus::Degraded;
    return HealthStatus::Healthy;
}

bool RecoveryValidator::crosses_warning(const HealthMetrics& metrics) const {
    for (const auto& [value, band] : readings(metrics, thresholds_)) {
        if (value && band->breaches_warning(*value)) return true;
    }
    return false;
}

bool RecoveryValidator::crosses_critical(const HealthMetrics& metrics) const {
    for (const auto& [value, band] : readings(metrics, thresholds_)) {
        if (value && band->breaches_critical(*value)) return true;
    }
    return false;
}

bool RecoveryValidator::meets_recovery_thresholds(const HealthMetrics& metrics) const {
    bool any = false;
    for (const auto& [value, band] : readings(metrics, thresholds_)) {
        if (!value) continue;
        any = true;
        if (!band->within_recovery(*value)) return false;
    }
    return any;
}

bool RecoveryValidator::is_improving(const HealthMetrics& previous,
                                     const HealthMetrics& current) const {
    auto prev = readings(previous, thresholds_);
    auto cur = readings(current, thresholds_);

    bool compared = false;
    bool better = false;
    for (std::size_t i = 0; i < cur.size(); ++i) {
        if (!prev[i].first || !cur[i].first) continue;
        const auto* band = cur[i].second;
        compared = true;
        if (band->worsened(*cur[i].first, *prev[i].first)) return false;
        if (band->improved(*cur[i].first, *prev[i].first)) better = true;
    }
    return compared && better;
}

bool RecoveryValidator::performance_improved(const HealthMetrics& previous,
                                             const HealthMetrics& current) const {
    if (!previous.response_time_ms || !current.response_time_ms ||
        !previous.throughput || !current.throughput) {
        return false;
    }
    return *current.response_time_ms < *previous.response_time_ms &&
           *current.throughput > *previous.throughput;
}

bool RecoveryValidator::error_rate_stable(const HealthMetrics& previous,
                                          const HealthMetrics& current) const {
    if (!previous.error_rate || !current.error_rate) {
        return false;
    }
    return *current.error_rate <= *previous.error_rate;
}

std::size_t RecoveryValidator::required_history() const {
    return std::max<std::size_t>({recovery_.min_healthy_samples,
                                  recovery_.validation_window, 1});
}

bool RecoveryValidator::sustained_improvement() const {
    const auto& recent = context_->recent;
    std::size_t k = recovery_.min_healthy_samples;
    if (!context_->candidate || recent.size() < k) {
        return false;
    }

    // The last k recorded samples plus the candidate must improve step by step
    std::vector<const HealthState*> chain;
    for (std::size_t i = recent.size() - k; i < recent.size(); ++i) {
        chain.push_back(&recent[i]);
    }
    chain.push_back(&*context_->candidate);

    for (std::size_t i = 1; i < chain.size(); ++i) {
        if (!is_improving(chain[i - 1]->indicators.metrics, chain[i]->indicators.metrics)) {
            return false;
        }
    }
    return true;
}

bool RecoveryValidator::recovered_to_healthy() const {
    if (!context_->candidate || context_->recent.empty()) {
        return false;
    }
    const auto& current = context_->candidate->indicators.metrics;
    const auto& previous = context_->recent.back().indicators.metrics;

    // Literal OR-gate: absolute recovery AND (performance up OR errors steady)
    return meets_recovery_thresholds(current) &&
           (performance_improved(previous, current) || error_rate_stable(previous, current));
}

bool RecoveryValidator::cooldown_elapsed() const {
    if (recovery_.cooldown_period <= Duration::zero() || !context_->last_transition_at) {
        return true;
    }
    return context_->now - *context_->last_transition_at >= recovery_.cooldown_period;
}

bool RecoveryValidator::success_rate_met() const {
    if (recovery_.required_success_rate <= 0.0) {
        return true;
    }

    std::vector<const HealthState*> window;
    const auto& recent = context_->recent;
    std::size_t from_history = recovery_.validation_window - 1;
    std::size_t start = recent.size() > from_history ? recent.size() - from_history : 0;
    for (std::size_t i = start; i < recent.size(); ++i) {
        window.push_back(&recent[i]);
    }
    if (context_->candidate) {
        window.push_back(&*context_->candidate);
    }
    if (window.empty()) {
        return false;
    }

    auto good = std::count_if(window.begin(), window.end(), [this](const HealthState* s) {
        return !crosses_warning(s->indicators.metrics);
    });
    double rate = static_cast<double>(good) / static_cast<double>(recovery_.validation_window);
    return rate >= recovery_.required_success_rate;
}

} // namespace leaseguard
