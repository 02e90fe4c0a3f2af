#pragma once

#include "leaseguard/config.hpp"
#include "leaseguard/monitor.hpp"
#include "leaseguard/recovery_validator.hpp"
#include "leaseguard/state_history.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace leaseguard {

// Outcome of feeding one sample into the state machine
struct TransitionResult {
    HealthStatus from{HealthStatus::Healthy};

    // Status the sample asked for, after two-level jumps were redirected
    HealthStatus proposed{HealthStatus::Healthy};

    // Status after guards ran
    HealthStatus status{HealthStatus::Healthy};

    bool changed{false};
    bool redirected{false};

    // Failed guard reasons when the proposal was rejected
    std::vector<std::string> rejections;

    bool rejected() const { return !rejections.empty(); }
};

// Guarded health FSM: healthy <-> degraded <-> unhealthy.
//
// Every sample is recorded in a bounded history with the status that was in
// effect after it was judged. Rejected proposals leave the state untouched.
class HealthStateManager {
public:
    using TimeSource = std::function<Timestamp()>;

    explicit HealthStateManager(ThresholdConfig thresholds = {},
                                RecoveryConfig recovery = {},
                                std::size_t history_capacity = 64,
                                TimeSource clock = {});

    // Record a sample and try to move to its status
    TransitionResult evaluate(HealthState sample);

    // Explicit transition judged on the latest recorded sample.
    // Throws GuardRejectedException when any guard fails.
    void transition(HealthStatus to, const std::string& reason = "manual");

    // Dry run of every guard against the latest recorded sample
    bool can_transition(HealthStatus from, HealthStatus to) const;

    // Step one level towards healthy without evidence guards.
    // User guards still apply; a rejection throws GuardRejectedException.
    TransitionResult reset(const std::string& reason);

    // Throws ValidationException when the guard has no predicate
    void add_guard_condition(GuardCondition guard);

    HealthStatus current_status() const;

    // Current status with the indicators of the latest sample
    HealthState current_state() const;

    StateHistory history() const;
    std::vector<HealthState> recent_samples(std::size_t window) const;
    std::vector<StateTransition> transitions() const;

    HealthStatus classify(const HealthMetrics& metrics) const;

    const ThresholdConfig& thresholds() const { return validator_.thresholds(); }
    const RecoveryConfig& recovery_config() const { return validator_.recovery_config(); }

    void set_monitor(std::shared_ptr<Monitor> monitor);

private:
    // Context built from the latest sample as candidate; caller holds mutex_
    TransitionContext explicit_context(bool bypass) const;

    // Apply an accepted move; caller holds mutex_
    void commit(HealthStatus to, Timestamp at, const std::string& reason);

    void emit_transition(EventType type, HealthStatus from, HealthStatus to,
                         const std::string& message);

    TimeSource clock_;

    mutable std::mutex mutex_;
    // validate() binds its context for the call; always used under mutex_
    mutable RecoveryValidator validator_;
    std::vector<GuardCondition> user_guards_;
    StateHistory history_;
    HealthStatus current_{HealthStatus::Healthy};
    std::optional<Timestamp> last_change_;

    std::mutex monitor_mutex_;
    std::shared_ptr<Monitor> monitor_;
};

} // namespace leaseguard
