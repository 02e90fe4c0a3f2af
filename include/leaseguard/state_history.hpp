#pragma once

#include "leaseguard/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace leaseguard {

// Raw readings attached to one health sample. Absent metrics are skipped by
// every guard.
struct HealthMetrics {
    std::optional<double> response_time_ms;
    std::optional<double> throughput;
    std::optional<double> error_rate;
    std::optional<double> utilization;
};

struct HealthIndicators {
    HealthMetrics metrics;
    double score{1.0};
    std::vector<std::string> violations;
    std::vector<std::string> recommendations;
};

struct HealthState {
    HealthStatus status{HealthStatus::Healthy};
    HealthIndicators indicators;
    Timestamp timestamp{};
};

struct StateTransition {
    HealthStatus from{HealthStatus::Healthy};
    HealthStatus to{HealthStatus::Healthy};
    Timestamp timestamp{};
    std::string reason;
};

// Fixed-capacity ring buffer. Pushing into a full buffer overwrites the
// oldest element.
template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(std::size_t capacity)
        : slots_(capacity == 0 ? 1 : capacity) {}

    void push(T value) {
        slots_[(head_ + size_) % slots_.size()] = std::move(value);
        if (size_ < slots_.size()) {
            size_++;
        } else {
            head_ = (head_ + 1) % slots_.size();
        }
    }

    // Up to k most recent elements, oldest first
    std::vector<T> last_n(std::size_t k) const {
        std::size_t n = k < size_ ? k : size_;
        std::vector<T> out;
        out.reserve(n);
        for (std::size_t i = size_ - n; i < size_; ++i) {
            out.push_back(slots_[(head_ + i) % slots_.size()]);
        }
        return out;
    }

    const T* back() const {
        if (size_ == 0) return nullptr;
        return &slots_[(head_ + size_ - 1) % slots_.size()];
    }

    void clear() {
        head_ = 0;
        size_ = 0;
    }

    std::size_t size() const { return size_; }
    std::size_t capacity() const { return slots_.size(); }
    bool empty() const { return size_ == 0; }

private:
    std::vector<T> slots_;
    std::size_t head_{0};
    std::size_t size_{0};
};

// Bounded record of health samples and accepted transitions
class StateHistory {
public:
    StateHistory(std::size_t sample_capacity, std::size_t transition_capacity);

    // Timestamps older than the latest sample are clamped to it
    void record_sample(HealthState sample);
    void record_transition(StateTransition transition);

    // Most recent last
    std::vector<HealthState> last_n(std::size_t k) const;
    std::optional<HealthState> latest() const;

    std::vector<StateTransition> transitions() const;
    std::optional<StateTransition> last_transition() const;

    std::size_t sample_count() const { return samples_.size(); }
    std::size_t sample_capacity() const { return samples_.capacity(); }

    void clear();

private:
    RingBuffer<HealthState> samples_;
    RingBuffer<StateTransition> transitions_;
};

} // namespace leaseguard
