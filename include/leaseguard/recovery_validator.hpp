#pragma once

#include "leaseguard/config.hpp"
#include "leaseguard/state_history.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace leaseguard {

// Named predicate over a proposed transition. Built-in rules and
// user-registered rules share this type.
struct GuardCondition {
    std::string reason;
    std::function<bool(HealthStatus from, HealthStatus to)> evaluate;
};

// Evidence visible to guards while one transition is being judged
struct TransitionContext {
    // Sample proposing the transition (absent for explicit calls with no history)
    std::optional<HealthState> candidate;

    // Samples recorded before the candidate, most recent last
    std::vector<HealthState> recent;

    std::optional<Timestamp> last_transition_at;
    Timestamp now{};

    // Explicit reset: evidence guards are skipped, adjacency and user guards are not
    bool bypass_evidence{false};
};

// Decides whether a proposed health transition is admissible
class RecoveryValidator {
public:
    RecoveryValidator(ThresholdConfig thresholds, RecoveryConfig recovery);

    // Built-in guards capture this instance
    RecoveryValidator(const RecoveryValidator&) = delete;
    RecoveryValidator& operator=(const RecoveryValidator&) = delete;

    // Reasons of every failed guard; empty means accepted
    std::vector<std::string> validate(HealthStatus from, HealthStatus to,
                                      const TransitionContext& context,
                                      const std::vector<GuardCondition>& user_guards);

    const std::vector<GuardCondition>& built_in_guards() const { return built_in_; }

    // Worst band any present metric falls into
    HealthStatus classify(const HealthMetrics& metrics) const;

    bool crosses_warning(const HealthMetrics& metrics) const;
    bool crosses_critical(const HealthMetrics& metrics) const;

    // Every present metric within recovery; false when no metric is present
    bool meets_recovery_thresholds(const HealthMetrics& metrics) const;

    // Every metric present in both is no worse and at least one is better
    bool is_improving(const HealthMetrics& previous, const HealthMetrics& current) const;

    // Response time down and throughput up
    bool performance_improved(const HealthMetrics& previous, const HealthMetrics& current) const;

    // Error rate no worse than the previous sample
    bool error_rate_stable(const HealthMetrics& previous, const HealthMetrics& current) const;

    // Samples guards may look back on
    std::size_t required_history() const;

    const ThresholdConfig& thresholds() const { return thresholds_; }
    const RecoveryConfig& recovery_config() const { return recovery_; }

private:
    void install_built_in_guards();

    bool sustained_improvement() const;
    bool recovered_to_healthy() const;
    bool cooldown_elapsed() const;
    bool success_rate_met() const;

    ThresholdConfig thresholds_;
    RecoveryConfig recovery_;
    std::vector<GuardCondition> built_in_;

    // Set only for the duration of validate()
    const TransitionContext* context_{nullptr};
};

} // namespace leaseguard
