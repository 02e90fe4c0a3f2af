#pragma once

#include "leaseguard/config.hpp"
#include "leaseguard/types.hpp"

#include <mutex>

namespace leaseguard {

enum class CircuitState {
    Closed,
    Open,
    HalfOpen
};

inline const char* to_string(CircuitState s) {
    switch (s) {
        case CircuitState::Closed:   return "Closed";
        case CircuitState::Open:     return "Open";
        case CircuitState::HalfOpen: return "HalfOpen";
    }
    return "Unknown";
}

// Fails allocation fast after repeated capacity failures.
// Closed -> Open after failure_threshold consecutive failures; Open -> HalfOpen
// once reset_timeout has passed; HalfOpen admits up to half_open_max_attempts
// trial calls, closing on the first success and re-opening on any failure.
class CircuitBreaker {
public:
    explicit CircuitBreaker(CircuitBreakerConfig config);

    // False when the call must be rejected without trying
    bool allow(Timestamp now);

    // Returns true when this success closed the circuit
    bool record_success();

    // Returns true when this failure opened the circuit
    bool record_failure(Timestamp now);

    CircuitState state() const;
    std::size_t consecutive_failures() const;
    bool enabled() const { return config_.enabled; }

    void reset();

private:
    CircuitBreakerConfig config_;

    mutable std::mutex mutex_;
    CircuitState state_{CircuitState::Closed};
    std::size_t failures_{0};
    std::size_t half_open_attempts_{0};
    Timestamp opened_at_{};
};

} // namespace leaseguard
