#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace leaseguard {

// Unique identifiers
using LeaseId = std::uint64_t;
using RequestId = std::string;

// Time types
using Clock = std::chrono::steady_clock;
using Timestamp = Clock::time_point;
using Duration = Clock::duration;

// Kind of capacity a caller asks for
enum class ResourceKind {
    Memory,
    Cpu,
    Disk,
    Generic
};

enum class Priority {
    Low,
    Medium,
    High
};

// Lease lifecycle. Active -> Released and Active -> Stale are the only moves.
enum class LeaseState {
    Active,
    Released,
    Stale
};

enum class HealthStatus {
    Healthy,
    Degraded,
    Unhealthy
};

// Optional sizing hints attached to a request
struct ResourceRequirements {
    std::optional<double> memory;
    std::optional<double> cpu;
    std::optional<Duration> timeout;
};

// Caller-side request descriptor
struct ResourceRequest {
    RequestId            id;
    ResourceKind         kind{ResourceKind::Generic};
    Priority             priority{Priority::Medium};
    ResourceRequirements requirements;
};

// Handle returned to callers. State is owned by the pool.
struct Lease {
    LeaseId              id{0};
    RequestId            request_id;
    ResourceKind         kind{ResourceKind::Generic};
    Priority             priority{Priority::Medium};
    ResourceRequirements requirements;
    Timestamp            allocated_at{};
    Timestamp            expires_at{};
    bool                 from_cache{false};

    // Reuses of the cached shape this lease was issued from, 0 when fresh
    std::uint64_t        reuse_count{0};
};

// Result of ResourcePoolManager::monitor()
struct PoolStatus {
    HealthStatus health{HealthStatus::Healthy};
    double       utilization{0.0};
    std::size_t  active_leases{0};
    std::size_t  max_pool_size{0};
    Timestamp    last_updated{};
};

// Per-category availability reported by a detector
struct CategoryAvailability {
    bool   is_available{true};
    double utilization_percent{0.0};
    double available_amount{0.0};   // bytes, cores or bytes of disk
};

struct ResourceAvailability {
    HealthStatus         status{HealthStatus::Healthy};
    CategoryAvailability memory;
    CategoryAvailability cpu;
    CategoryAvailability disk;
    Timestamp            timestamp{};
};

// Threshold crossing raised by a detector
struct ResourceAlert {
    std::string  category;      // "memory", "cpu" or "disk"
    HealthStatus severity{HealthStatus::Degraded};
    std::string  message;
    double       current{0.0};
    double       threshold{0.0};
    Timestamp    timestamp{};
};

// Snapshot pushed to monitors after every health update
struct PoolSnapshot {
    Timestamp    timestamp{};
    HealthStatus health{HealthStatus::Healthy};
    std::size_t  active_leases{0};
    std::size_t  max_pool_size{0};
    std::size_t  cached_shapes{0};
    double       utilization{0.0};
    std::optional<ResourceAvailability> availability;
};

inline const char* to_string(ResourceKind k) {
    switch (k) {
        case ResourceKind::Memory:  return "memory";
        case ResourceKind::Cpu:     return "cpu";
        case ResourceKind::Disk:    return "disk";
        case ResourceKind::Generic: return "generic";
    }
    return "unknown";
}

inline const char* to_string(Priority p) {
    switch (p) {
        case Priority::Low:    return "low";
        case Priority::Medium: return "medium";
        case Priority::High:   return "high";
    }
    return "unknown";
}

inline const char* to_string(LeaseState s) {
    switch (s) {
        case LeaseState::Active:   return "Active";
        case LeaseState::Released: return "Released";
        case LeaseState::Stale:    return "Stale";
    }
    return "Unknown";
}

inline const char* to_string(HealthStatus s) {
    switch (s) {
        case HealthStatus::Healthy:   return "healthy";
        case HealthStatus::Degraded:  return "degraded";
        case HealthStatus::Unhealthy: return "unhealthy";
    }
    return "unknown";
}

// Pool-facing vocabulary: healthy / warning / critical
inline const char* to_pool_label(HealthStatus s) {
    switch (s) {
        case HealthStatus::Healthy:   return "healthy";
        case HealthStatus::Degraded:  return "warning";
        case HealthStatus::Unhealthy: return "critical";
    }
    return "unknown";
}

inline int severity(HealthStatus s) {
    return static_cast<int>(s);
}

inline double to_milliseconds(Duration d) {
    return std::chrono::duration<double, std::milli>(d).count();
}

} // namespace leaseguard
