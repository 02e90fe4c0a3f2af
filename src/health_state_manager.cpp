#include "leaseguard/health_state_manager.hpp"
#include "leaseguard/exceptions.hpp"

#include <algorithm>
#include <cstdlib>

namespace leaseguard {

namespace {

std::string join(const std::vector<std::string>& parts, const char* sep) {
    std::string out;
    for (const auto& p : parts) {
        if (!out.empty()) out += sep;
        out += p;
    }
    return out;
}

MonitorEvent make_event(EventType type, Timestamp at, HealthStatus from, HealthStatus to,
                        std::string message) {
    MonitorEvent event;
    event.type = type;
    event.timestamp = at;
    event.from_status = from;
    event.to_status = to;
    event.message = std::move(message);
    return event;
}

} // anonymous namespace

HealthStateManager::HealthStateManager(ThresholdConfig thresholds,
                                       RecoveryConfig recovery,
                                       std::size_t history_capacity,
                                       TimeSource clock)
    : clock_(clock ? std::move(clock) : TimeSource([] { return Clock::now(); }))
    , validator_(std::move(thresholds), recovery)
    , history_(std::max<std::size_t>({history_capacity, 2,
                                      recovery.min_healthy_samples + 1,
                                      recovery.validation_window}),
               history_capacity == 0 ? 1 : history_capacity) {}

TransitionResult HealthStateManager::evaluate(HealthState sample) {
    TransitionResult result;
    std::vector<MonitorEvent> events;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (auto latest = history_.latest(); latest && sample.timestamp < latest->timestamp) {
            sample.timestamp = latest->timestamp;
        }

        HealthStatus requested = sample.status;
        result.from = current_;
        result.proposed = requested;

        // Two-level jumps must pass through degraded first
        if (std::abs(severity(requested) - severity(current_)) > 1) {
            result.proposed = HealthStatus::Degraded;
            result.redirected = true;
        }

        if (result.proposed != current_) {
            TransitionContext context;
            context.candidate = sample;
            context.recent = history_.last_n(validator_.required_history());
            context.last_transition_at = last_change_;
            context.now = sample.timestamp;

            result.rejections = validator_.validate(current_, result.proposed, context, user_guards_);

            if (result.rejections.empty()) {
                std::string reason = std::string("sample proposed ") + to_string(requested);
                if (result.redirected) {
                    reason += ", stepped through degraded";
                }
                commit(result.proposed, sample.timestamp, reason);
                result.changed = true;
                events.push_back(make_event(EventType::HealthTransitionAccepted, sample.timestamp,
                                            result.from, result.proposed, reason));
            } else {
                events.push_back(make_event(EventType::HealthTransitionRejected, sample.timestamp,
                                            result.from, result.proposed,
                                            join(result.rejections, "; ")));
            }
        }

        result.status = current_;
        sample.status = current_;

        MonitorEvent recorded;
        recorded.type = EventType::HealthSampleRecorded;
        recorded.timestamp = sample.timestamp;
        recorded.to_status = current_;
        recorded.utilization = sample.indicators.metrics.utilization;
        events.insert(events.begin(), recorded);

        history_.record_sample(std::move(sample));
    }

    // Outside the lock: notify monitor
    std::shared_ptr<Monitor> monitor;
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        monitor = monitor_;
    }
    if (monitor) {
        for (const auto& e : events) {
            monitor->on_event(e);
        }
    }

    return result;
}

void HealthStateManager::transition(HealthStatus to, const std::string& reason) {
    HealthStatus from;
    std::vector<std::string> failed;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        from = current_;
        if (to == from) {
            return;
        }

        auto context = explicit_context(false);
        failed = validator_.validate(from, to, context, user_guards_);
        if (failed.empty()) {
            commit(to, context.now, reason);
        }
    }

    if (!failed.empty()) {
        std::string why = join(failed, "; ");
        emit_transition(EventType::HealthTransitionRejected, from, to, why);
        throw GuardRejectedException(from, to, why);
    }
    emit_transition(EventType::HealthTransitionAccepted, from, to, reason);
}

bool HealthStateManager::can_transition(HealthStatus from, HealthStatus to) const {
    if (from == to) {
        return true;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto context = explicit_context(false);
    return validator_.validate(from, to, context, user_guards_).empty();
}

TransitionResult HealthStateManager::reset(const std::string& reason) {
    TransitionResult result;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.from = current_;
        result.status = current_;
        if (current_ == HealthStatus::Healthy) {
            result.proposed = current_;
            return result;
        }

        result.proposed = current_ == HealthStatus::Unhealthy ? HealthStatus::Degraded
                                                              : HealthStatus::Healthy;
        auto context = explicit_context(true);
        result.rejections = validator_.validate(current_, result.proposed, context, user_guards_);
        if (result.rejections.empty()) {
            commit(result.proposed, context.now, "reset: " + reason);
            result.changed = true;
            result.status = current_;
        }
    }

    if (result.rejected()) {
        std::string why = join(result.rejections, "; ");
        emit_transition(EventType::HealthTransitionRejected, result.from, result.proposed, why);
        throw GuardRejectedException(result.from, result.proposed, why);
    }
    emit_transition(EventType::HealthTransitionAccepted, result.from, result.status,
                    "reset: " + reason);
    return result;
}

void HealthStateManager::add_guard_condition(GuardCondition guard) {
    if (!guard.evaluate) {
        throw ValidationException("Guard condition needs a predicate",
                                  {{"reason", guard.reason}});
    }
    std::lock_guard<std::mutex> lock(mutex_);
    user_guards_.push_back(std::move(guard));
}

HealthStatus HealthStateManager::current_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

HealthState HealthStateManager::current_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    HealthState state;
    if (auto latest = history_.latest()) {
        state = *latest;
    } else {
        state.timestamp = last_change_.value_or(Timestamp{});
    }
    state.status = current_;
    return state;
}

StateHistory HealthStateManager::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_;
}

std::vector<HealthState> HealthStateManager::recent_samples(std::size_t window) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.last_n(window);
}

std::vector<StateTransition> HealthStateManager::transitions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.transitions();
}

HealthStatus HealthStateManager::classify(const HealthMetrics& metrics) const {
    return validator_.classify(metrics);
}

void HealthStateManager::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(monitor_mutex_);
    monitor_ = std::move(monitor);
}

TransitionContext HealthStateManager::explicit_context(bool bypass) const {
    TransitionContext context;
    auto samples = history_.last_n(validator_.required_history() + 1);
    if (!samples.empty()) {
        context.candidate = samples.back();
        samples.pop_back();
    }
    context.recent = std::move(samples);
    context.last_transition_at = last_change_;
    context.now = clock_();
    context.bypass_evidence = bypass;
    return context;
}

void HealthStateManager::commit(HealthStatus to, Timestamp at, const std::string& reason) {
    history_.record_transition(StateTransition{current_, to, at, reason});
    current_ = to;
    last_change_ = at;
}

void HealthStateManager::emit_transition(EventType type, HealthStatus from, HealthStatus to,
                                         const std::string& message) {
    std::shared_ptr<Monitor> monitor;
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        monitor = monitor_;
    }
    if (monitor) {
        monitor->on_event(make_event(type, clock_(), from, to, message));
    }
}

} // namespace leaseguard
