#include "leaseguard/circuit_breaker.hpp"
#include "leaseguard/exceptions.hpp"

namespace leaseguard {

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config)
    : config_(config) {
    if (config_.enabled) {
        if (config_.failure_threshold == 0 || config_.half_open_max_attempts == 0) {
            throw ValidationException("Circuit breaker thresholds must be at least 1");
        }
        if (config_.reset_timeout < Duration::zero()) {
            throw ValidationException("Circuit breaker reset_timeout must be non-negative");
        }
    }
}

bool CircuitBreaker::allow(Timestamp now) {
    if (!config_.enabled) {
        return true;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    switch (state_) {
        case CircuitState::Closed:
            return true;

        case CircuitState::Open:
            if (now - opened_at_ < config_.reset_timeout) {
                return false;
            }
            state_ = CircuitState::HalfOpen;
            half_open_attempts_ = 1;
            return true;

        case CircuitState::HalfOpen:
            if (half_open_attempts_ >= config_.half_open_max_attempts) {
                return false;
            }
            half_open_attempts_++;
            return true;
    }
    return true;
}

bool CircuitBreaker::record_success() {
    if (!config_.enabled) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    failures_ = 0;
    if (state_ == CircuitState::HalfOpen) {
        state_ = CircuitState::Closed;
        half_open_attempts_ = 0;
        return true;
    }
    return false;
}

bool CircuitBreaker::record_failure(Timestamp now) {
    if (!config_.enabled) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    failures_++;

    if (state_ == CircuitState::HalfOpen ||
        (state_ == CircuitState::Closed && failures_ >= config_.failure_threshold)) {
        state_ = CircuitState::Open;
        opened_at_ = now;
        half_open_attempts_ = 0;
        return true;
    }
    return false;
}

CircuitState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::size_t CircuitBreaker::consecutive_failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_;
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = CircuitState::Closed;
    failures_ = 0;
    half_open_attempts_ = 0;
}

} // namespace leaseguard
