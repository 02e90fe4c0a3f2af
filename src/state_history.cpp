#include "leaseguard/state_history.hpp"

namespace leaseguard {

StateHistory::StateHistory(std::size_t sample_capacity, std::size_t transition_capacity)
    : samples_(sample_capacity < 2 ? 2 : sample_capacity)
    , transitions_(transition_capacity) {}

void StateHistory::record_sample(HealthState sample) {
    if (const HealthState* prev = samples_.back()) {
        if (sample.timestamp < prev->timestamp) {
            sample.timestamp = prev->timestamp;
        }
    }
    samples_.push(std::move(sample));
}

void StateHistory::record_transition(StateTransition transition) {
    transitions_.push(std::move(transition));
}

std::vector<HealthState> StateHistory::last_n(std::size_t k) const {
    return samples_.last_n(k);
}

std::optional<HealthState> StateHistory::latest() const {
    if (const HealthState* s = samples_.back()) {
        return *s;
    }
    return std::nullopt;
}

std::vector<StateTransition> StateHistory::transitions() const {
    return transitions_.last_n(transitions_.size());
}

std::optional<StateTransition> StateHistory::last_transition() const {
    if (const StateTransition* t = transitions_.back()) {
        return *t;
    }
    return std::nullopt;
}

void StateHistory::clear() {
    samples_.clear();
    transitions_.clear();
}

} // namespace leaseguard
