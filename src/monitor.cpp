#include "leaseguard/monitor.hpp"

#include <iostream>
#include <iomanip>

namespace leaseguard {

const char* to_string(EventType t) {
    switch (t) {
        case EventType::PoolStarted:              return "PoolStarted";
        case EventType::PoolDisposed:             return "PoolDisposed";
        case EventType::LeaseGranted:             return "LeaseGranted";
        case EventType::LeaseReleased:            return "LeaseReleased";
        case EventType::LeaseExpired:             return "LeaseExpired";
        case EventType::AllocationRejected:       return "AllocationRejected";
        case EventType::ReleaseRejected:          return "ReleaseRejected";
        case EventType::CacheHit:                 return "CacheHit";
        case EventType::CacheMiss:                return "CacheMiss";
        case EventType::CacheEvicted:             return "CacheEvicted";
        case EventType::CleanupCompleted:         return "CleanupCompleted";
        case EventType::HealthSampleRecorded:     return "HealthSampleRecorded";
        case EventType::HealthTransitionAccepted: return "HealthTransitionAccepted";
        case EventType::HealthTransitionRejected: return "HealthTransitionRejected";
        case EventType::DetectorAlert:            return "DetectorAlert";
        case EventType::DetectorFailure:          return "DetectorFailure";
        case EventType::CircuitOpened:            return "CircuitOpened";
        case EventType::CircuitClosed:            return "CircuitClosed";
    }
    return "Unknown";
}

namespace {

bool is_important_event(EventType t) {
    switch (t) {
        case EventType::PoolStarted:
        case EventType::PoolDisposed:
        case EventType::LeaseExpired:
        case EventType::AllocationRejected:
        case EventType::ReleaseRejected:
        case EventType::HealthTransitionAccepted:
        case EventType::HealthTransitionRejected:
        case EventType::DetectorAlert:
        case EventType::DetectorFailure:
        case EventType::CircuitOpened:
        case EventType::CircuitClosed:
            return true;
        default:
            return false;
    }
}

// High-frequency events only shown at Debug
bool is_chatty_event(EventType t) {
    return t == EventType::CacheHit || t == EventType::CacheMiss ||
           t == EventType::HealthSampleRecorded;
}

} // anonymous namespace

// ========== ConsoleMonitor ==========

ConsoleMonitor::ConsoleMonitor(Verbosity v) : verbosity_(v) {}

void ConsoleMonitor::on_event(const MonitorEvent& event) {
    if (verbosity_ == Verbosity::Quiet) return;
    if (verbosity_ == Verbosity::Normal && !is_important_event(event.type)) return;
    if (verbosity_ == Verbosity::Verbose && is_chatty_event(event.type)) return;

    std::lock_guard<std::mutex> lock(output_mutex_);

    std::cout << "[LeaseGuard] " << to_string(event.type);

    if (event.lease_id.has_value()) {
        std::cout << " lease=" << event.lease_id.value();
    }
    if (event.request_id.has_value()) {
        std::cout << " request=" << event.request_id.value();
    }
    if (event.from_status.has_value() && event.to_status.has_value()) {
        std::cout << " " << to_string(event.from_status.value())
                  << "->" << to_string(event.to_status.value());
    }
    if (event.utilization.has_value()) {
        std::cout << " util=" << std::fixed << std::setprecision(1)
                  << event.utilization.value() * 100.0 << "%";
    }
    if (event.count.has_value()) {
        std::cout << " count=" << event.count.value();
    }
    if (event.duration_us.has_value()) {
        std::cout << " took=" << std::fixed << std::setprecision(1)
                  << event.duration_us.value() << "us";
    }

    if (!event.message.empty()) {
        std::cout << " | " << event.message;
    }

    std::cout << "\n";
}

void ConsoleMonitor::on_snapshot(const PoolSnapshot& snapshot) {
    if (verbosity_ < Verbosity::Verbose) return;

    std::lock_guard<std::mutex> lock(output_mutex_);

    std::cout << "\n[LeaseGuard] === Pool Snapshot ===\n";
    std::cout << "  Health: " << to_pool_label(snapshot.health) << "\n";
    std::cout << "  Active leases: " << snapshot.active_leases
              << " / " << snapshot.max_pool_size << "\n";
    std::cout << "  Utilization: " << std::fixed << std::setprecision(1)
              << snapshot.utilization * 100.0 << "%\n";
    std::cout << "  Cached shapes: " << snapshot.cached_shapes << "\n";
    if (snapshot.availability.has_value()) {
        const auto& a = snapshot.availability.value();
        std::cout << "  System (" << to_pool_label(a.status) << "):"
                  << " mem=" << a.memory.utilization_percent << "%"
                  << " cpu=" << a.cpu.utilization_percent << "%"
                  << " disk=" << a.disk.utilization_percent << "%\n";
    }
    std::cout << "  ========================\n\n";
}

// ========== MetricsMonitor ==========

MetricsMonitor::MetricsMonitor() = default;

void MetricsMonitor::on_event(const MonitorEvent& event) {
    AlertCallback alert;
    std::string alert_message;

    std::unique_lock<std::mutex> lock(metrics_mutex_);

    switch (event.type) {
        case EventType::LeaseGranted:
            metrics_.granted_leases++;
            if (event.duration_us.has_value()) {
                latency_sample_count_++;
                latency_sum_us_ += event.duration_us.value();
                metrics_.average_allocation_latency_us =
                    latency_sum_us_ / static_cast<double>(latency_sample_count_);
            }
            break;
        case EventType::AllocationRejected:
            metrics_.rejected_allocations++;
            break;
        case EventType::LeaseReleased:
            metrics_.released_leases++;
            break;
        case EventType::ReleaseRejected:
            metrics_.rejected_releases++;
            break;
        case EventType::LeaseExpired:
            metrics_.expired_leases += event.count.value_or(1);
            if (expired_cb_ && metrics_.expired_leases > expired_threshold_) {
                alert = expired_cb_;
                alert_message = "Expired leases " + std::to_string(metrics_.expired_leases) +
                                " exceed threshold " + std::to_string(expired_threshold_);
            }
            break;
        case EventType::CacheHit:
            metrics_.cache_hits++;
            break;
        case EventType::CacheMiss:
            metrics_.cache_misses++;
            break;
        case EventType::HealthTransitionAccepted:
            metrics_.accepted_transitions++;
            if (event.to_status.has_value()) {
                metrics_.last_health = event.to_status.value();
            }
            break;
        case EventType::HealthTransitionRejected:
            metrics_.rejected_transitions++;
            break;
        case EventType::DetectorAlert:
            metrics_.detector_alerts++;
            break;
        case EventType::DetectorFailure:
            metrics_.detector_failures++;
            break;
        default:
            break;
    }

    // Callbacks may read metrics back
    lock.unlock();
    if (alert) {
        alert(alert_message);
    }
}

void MetricsMonitor::on_snapshot(const PoolSnapshot& snapshot) {
    AlertCallback alert;
    std::string alert_message;
    {
        std::lock_guard<std::mutex> lock(metrics_mutex_);

        metrics_.utilization_percent = snapshot.utilization * 100.0;
        metrics_.last_health = snapshot.health;

        if (utilization_cb_ && snapshot.utilization > utilization_threshold_) {
            alert = utilization_cb_;
            alert_message = "Pool utilization " + std::to_string(metrics_.utilization_percent) +
                            "% exceeds threshold";
        }
    }

    if (alert) {
        alert(alert_message);
    }
}

MetricsMonitor::Metrics MetricsMonitor::get_metrics() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return metrics_;
}

void MetricsMonitor::reset_metrics() {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_ = Metrics{};
    latency_sample_count_ = 0;
    latency_sum_us_ = 0.0;
}

void MetricsMonitor::set_utilization_alert_threshold(double threshold, AlertCallback cb) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    utilization_threshold_ = threshold;
    utilization_cb_ = std::move(cb);
}

void MetricsMonitor::set_expired_lease_alert_threshold(std::uint64_t threshold, AlertCallback cb) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    expired_threshold_ = threshold;
    expired_cb_ = std::move(cb);
}

// ========== CompositeMonitor ==========

void CompositeMonitor::add_monitor(std::shared_ptr<Monitor> monitor) {
    monitors_.push_back(std::move(monitor));
}

void CompositeMonitor::on_event(const MonitorEvent& event) {
    for (auto& m : monitors_) {
        m->on_event(event);
    }
}

void CompositeMonitor::on_snapshot(const PoolSnapshot& snapshot) {
    for (auto& m : monitors_) {
        m->on_snapshot(snapshot);
    }
}

} // namespace leaseguard
