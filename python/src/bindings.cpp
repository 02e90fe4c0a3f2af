#include "bind_forward.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

#include <leaseguard/leaseguard.hpp>

using namespace leaseguard;

// ---------------------------------------------------------------------------
// Module entry point
// ---------------------------------------------------------------------------
PYBIND11_MODULE(_leaseguard, m) {
    m.doc() = "LeaseGuard: resource pool with a guarded health state machine";

    bind_enums_and_structs(m);
    bind_exceptions(m);
    bind_monitors(m);
    bind_detectors(m);
    bind_health(m);
    bind_core(m);
}

// ---------------------------------------------------------------------------
// Enums & structs
// ---------------------------------------------------------------------------
void bind_enums_and_structs(py::module_& m) {

    // ---- Enums ------------------------------------------------------------

    py::enum_<ResourceKind>(m, "ResourceKind")
        .value("Memory",  ResourceKind::Memory)
        .value("Cpu",     ResourceKind::Cpu)
        .value("Disk",    ResourceKind::Disk)
        .value("Generic", ResourceKind::Generic)
        .export_values();

    py::enum_<Priority>(m, "Priority")
        .value("Low",    Priority::Low)
        .value("Medium", Priority::Medium)
        .value("High",   Priority::High)
        .export_values();

    py::enum_<LeaseState>(m, "LeaseState")
        .value("Active",   LeaseState::Active)
        .value("Released", LeaseState::Released)
        .value("Stale",    LeaseState::Stale)
        .export_values();

    py::enum_<HealthStatus>(m, "HealthStatus")
        .value("Healthy",   HealthStatus::Healthy)
        .value("Degraded",  HealthStatus::Degraded)
        .value("Unhealthy", HealthStatus::Unhealthy)
        .export_values();

    py::enum_<MetricDirection>(m, "MetricDirection")
        .value("HigherIsWorse", MetricDirection::HigherIsWorse)
        .value("LowerIsWorse",  MetricDirection::LowerIsWorse)
        .export_values();

    py::enum_<CircuitState>(m, "CircuitState")
        .value("Closed",   CircuitState::Closed)
        .value("Open",     CircuitState::Open)
        .value("HalfOpen", CircuitState::HalfOpen)
        .export_values();

    py::enum_<EventType>(m, "EventType")
        .value("PoolStarted",              EventType::PoolStarted)
        .value("PoolDisposed",             EventType::PoolDisposed)
        .value("LeaseGranted",             EventType::LeaseGranted)
        .value("LeaseReleased",            EventType::LeaseReleased)
        .value("LeaseExpired",             EventType::LeaseExpired)
        .value("AllocationRejected",       EventType::AllocationRejected)
        .value("ReleaseRejected",          EventType::ReleaseRejected)
        .value("CacheHit",                 EventType::CacheHit)
        .value("CacheMiss",                EventType::CacheMiss)
        .value("CacheEvicted",             EventType::CacheEvicted)
        .value("CleanupCompleted",         EventType::CleanupCompleted)
        .value("HealthSampleRecorded",     EventType::HealthSampleRecorded)
        .value("HealthTransitionAccepted", EventType::HealthTransitionAccepted)
        .value("HealthTransitionRejected", EventType::HealthTransitionRejected)
        .value("DetectorAlert",            EventType::DetectorAlert)
        .value("DetectorFailure",          EventType::DetectorFailure)
        .value("CircuitOpened",            EventType::CircuitOpened)
        .value("CircuitClosed",            EventType::CircuitClosed)
        .export_values();

    py::enum_<ConsoleMonitor::Verbosity>(m, "Verbosity")
        .value("Quiet",   ConsoleMonitor::Verbosity::Quiet)
        .value("Normal",  ConsoleMonitor::Verbosity::Normal)
        .value("Verbose", ConsoleMonitor::Verbosity::Verbose)
        .value("Debug",   ConsoleMonitor::Verbosity::Debug)
        .export_values();

    m.def("pool_label", [](HealthStatus s) { return std::string(to_pool_label(s)); },
          py::arg("status"));

    // ---- Requests & leases ------------------------------------------------

    py::class_<ResourceRequirements>(m, "ResourceRequirements")
        .def(py::init<>())
        .def_readwrite("memory",  &ResourceRequirements::memory)
        .def_readwrite("cpu",     &ResourceRequirements::cpu)
        .def_readwrite("timeout", &ResourceRequirements::timeout);

    py::class_<ResourceRequest>(m, "ResourceRequest")
        .def(py::init<>())
        .def(py::init([](RequestId id, ResourceKind kind, Priority priority,
                         ResourceRequirements requirements) {
                 return ResourceRequest{std::move(id), kind, priority, std::move(requirements)};
             }),
             py::arg("id"), py::arg("kind") = ResourceKind::Generic,
             py::arg("priority") = Priority::Medium,
             py::arg("requirements") = ResourceRequirements{})
        .def_readwrite("id",           &ResourceRequest::id)
        .def_readwrite("kind",         &ResourceRequest::kind)
        .def_readwrite("priority",     &ResourceRequest::priority)
        .def_readwrite("requirements", &ResourceRequest::requirements);

    py::class_<Lease>(m, "Lease")
        .def(py::init<>())
        .def_readwrite("id",           &Lease::id)
        .def_readwrite("request_id",   &Lease::request_id)
        .def_readwrite("kind",         &Lease::kind)
        .def_readwrite("priority",     &Lease::priority)
        .def_readwrite("requirements", &Lease::requirements)
        .def_readwrite("allocated_at", &Lease::allocated_at)
        .def_readwrite("expires_at",   &Lease::expires_at)
        .def_readwrite("from_cache",   &Lease::from_cache)
        .def_readwrite("reuse_count",  &Lease::reuse_count)
        .def("__repr__", [](const Lease& l) {
            return "<Lease id=" + std::to_string(l.id)
                 + " request='" + l.request_id
                 + "' kind=" + std::string(to_string(l.kind)) + ">";
        });

    py::class_<PoolStatus>(m, "PoolStatus")
        .def(py::init<>())
        .def_readwrite("health",        &PoolStatus::health)
        .def_readwrite("utilization",   &PoolStatus::utilization)
        .def_readwrite("active_leases", &PoolStatus::active_leases)
        .def_readwrite("max_pool_size", &PoolStatus::max_pool_size)
        .def_readwrite("last_updated",  &PoolStatus::last_updated);

    // ---- Availability -----------------------------------------------------

    py::class_<CategoryAvailability>(m, "CategoryAvailability")
        .def(py::init<>())
        .def_readwrite("is_available",        &CategoryAvailability::is_available)
        .def_readwrite("utilization_percent", &CategoryAvailability::utilization_percent)
        .def_readwrite("available_amount",    &CategoryAvailability::available_amount);

    py::class_<ResourceAvailability>(m, "ResourceAvailability")
        .def(py::init<>())
        .def_readwrite("status",    &ResourceAvailability::status)
        .def_readwrite("memory",    &ResourceAvailability::memory)
        .def_readwrite("cpu",       &ResourceAvailability::cpu)
        .def_readwrite("disk",      &ResourceAvailability::disk)
        .def_readwrite("timestamp", &ResourceAvailability::timestamp);

    py::class_<ResourceAlert>(m, "ResourceAlert")
        .def(py::init<>())
        .def_readwrite("category",  &ResourceAlert::category)
        .def_readwrite("severity",  &ResourceAlert::severity)
        .def_readwrite("message",   &ResourceAlert::message)
        .def_readwrite("current",   &ResourceAlert::current)
        .def_readwrite("threshold", &ResourceAlert::threshold)
        .def_readwrite("timestamp", &ResourceAlert::timestamp);

    py::class_<PoolSnapshot>(m, "PoolSnapshot")
        .def(py::init<>())
        .def_readwrite("timestamp",     &PoolSnapshot::timestamp)
        .def_readwrite("health",        &PoolSnapshot::health)
        .def_readwrite("active_leases", &PoolSnapshot::active_leases)
        .def_readwrite("max_pool_size", &PoolSnapshot::max_pool_size)
        .def_readwrite("cached_shapes", &PoolSnapshot::cached_shapes)
        .def_readwrite("utilization",   &PoolSnapshot::utilization)
        .def_readwrite("availability",  &PoolSnapshot::availability);

    // ---- Configuration ----------------------------------------------------

    py::class_<MetricThresholds>(m, "MetricThresholds")
        .def(py::init<>())
        .def(py::init([](double warning, double critical, double recovery, MetricDirection dir) {
                 return MetricThresholds{warning, critical, recovery, dir};
             }),
             py::arg("warning"), py::arg("critical"), py::arg("recovery"),
             py::arg("direction") = MetricDirection::HigherIsWorse)
        .def_readwrite("warning",   &MetricThresholds::warning)
        .def_readwrite("critical",  &MetricThresholds::critical)
        .def_readwrite("recovery",  &MetricThresholds::recovery)
        .def_readwrite("direction", &MetricThresholds::direction);

    py::class_<ThresholdConfig::Memory>(m, "MemoryThresholds")
        .def(py::init<>())
        .def_readwrite("heap_usage",        &ThresholdConfig::Memory::heap_usage)
        .def_readwrite("cache_utilization", &ThresholdConfig::Memory::cache_utilization);

    py::class_<ThresholdConfig::Performance>(m, "PerformanceThresholds")
        .def(py::init<>())
        .def_readwrite("latency",    &ThresholdConfig::Performance::latency)
        .def_readwrite("throughput", &ThresholdConfig::Performance::throughput);

    py::class_<ThresholdConfig::Error>(m, "ErrorThresholds")
        .def(py::init<>())
        .def_readwrite("error_rate", &ThresholdConfig::Error::error_rate);

    py::class_<ThresholdConfig::Resource>(m, "ResourceThresholds")
        .def(py::init<>())
        .def_readwrite("utilization", &ThresholdConfig::Resource::utilization);

    py::class_<ThresholdConfig>(m, "ThresholdConfig")
        .def(py::init<>())
        .def_readwrite("memory",      &ThresholdConfig::memory)
        .def_readwrite("performance", &ThresholdConfig::performance)
        .def_readwrite("error",       &ThresholdConfig::error)
        .def_readwrite("resource",    &ThresholdConfig::resource);

    py::class_<RecoveryConfig>(m, "RecoveryConfig")
        .def(py::init<>())
        .def_readwrite("min_healthy_samples",   &RecoveryConfig::min_healthy_samples)
        .def_readwrite("validation_window",     &RecoveryConfig::validation_window)
        .def_readwrite("required_success_rate", &RecoveryConfig::required_success_rate)
        .def_readwrite("cooldown_period",       &RecoveryConfig::cooldown_period);

    py::class_<CircuitBreakerConfig>(m, "CircuitBreakerConfig")
        .def(py::init<>())
        .def_readwrite("enabled",                &CircuitBreakerConfig::enabled)
        .def_readwrite("failure_threshold",      &CircuitBreakerConfig::failure_threshold)
        .def_readwrite("reset_timeout",          &CircuitBreakerConfig::reset_timeout)
        .def_readwrite("half_open_max_attempts", &CircuitBreakerConfig::half_open_max_attempts);

    py::class_<CategoryThresholds>(m, "CategoryThresholds")
        .def(py::init<>())
        .def_readwrite("warning",  &CategoryThresholds::warning)
        .def_readwrite("critical", &CategoryThresholds::critical);

    py::class_<DetectorConfig>(m, "DetectorConfig")
        .def(py::init<>())
        .def_readwrite("update_interval", &DetectorConfig::update_interval)
        .def_readwrite("memory",          &DetectorConfig::memory)
        .def_readwrite("cpu",             &DetectorConfig::cpu)
        .def_readwrite("disk",            &DetectorConfig::disk);

    py::class_<PoolConfig>(m, "PoolConfig")
        .def(py::init<>())
        .def_readwrite("min_pool_size",           &PoolConfig::min_pool_size)
        .def_readwrite("max_pool_size",           &PoolConfig::max_pool_size)
        .def_readwrite("cache_max_size",          &PoolConfig::cache_max_size)
        .def_readwrite("cleanup_interval",        &PoolConfig::cleanup_interval)
        .def_readwrite("resource_timeout",        &PoolConfig::resource_timeout)
        .def_readwrite("health_check_interval",   &PoolConfig::health_check_interval)
        .def_readwrite("warning_threshold",       &PoolConfig::warning_threshold)
        .def_readwrite("critical_threshold",      &PoolConfig::critical_threshold)
        .def_readwrite("recovery_threshold",      &PoolConfig::recovery_threshold)
        .def_readwrite("memory_quantum",          &PoolConfig::memory_quantum)
        .def_readwrite("cpu_quantum",             &PoolConfig::cpu_quantum)
        .def_readwrite("retired_lease_retention", &PoolConfig::retired_lease_retention)
        .def_readwrite("history_capacity",        &PoolConfig::history_capacity)
        .def_readwrite("thresholds",              &PoolConfig::thresholds)
        .def_readwrite("recovery",                &PoolConfig::recovery)
        .def_readwrite("circuit_breaker",         &PoolConfig::circuit_breaker)
        .def("validate", [](const PoolConfig& c) { leaseguard::validate(c); });

    // ---- Events & metrics -------------------------------------------------

    py::class_<MonitorEvent>(m, "MonitorEvent")
        .def(py::init<>())
        .def_readwrite("type",        &MonitorEvent::type)
        .def_readwrite("timestamp",   &MonitorEvent::timestamp)
        .def_readwrite("message",     &MonitorEvent::message)
        .def_readwrite("lease_id",    &MonitorEvent::lease_id)
        .def_readwrite("request_id",  &MonitorEvent::request_id)
        .def_readwrite("from_status", &MonitorEvent::from_status)
        .def_readwrite("to_status",   &MonitorEvent::to_status)
        .def_readwrite("utilization", &MonitorEvent::utilization)
        .def_readwrite("count",       &MonitorEvent::count)
        .def_readwrite("duration_us", &MonitorEvent::duration_us);

    // MetricsMonitor::Metrics (bound as module-level "Metrics")
    py::class_<MetricsMonitor::Metrics>(m, "Metrics")
        .def(py::init<>())
        .def_readwrite("granted_leases",                &MetricsMonitor::Metrics::granted_leases)
        .def_readwrite("rejected_allocations",          &MetricsMonitor::Metrics::rejected_allocations)
        .def_readwrite("released_leases",               &MetricsMonitor::Metrics::released_leases)
        .def_readwrite("rejected_releases",             &MetricsMonitor::Metrics::rejected_releases)
        .def_readwrite("expired_leases",                &MetricsMonitor::Metrics::expired_leases)
        .def_readwrite("cache_hits",                    &MetricsMonitor::Metrics::cache_hits)
        .def_readwrite("cache_misses",                  &MetricsMonitor::Metrics::cache_misses)
        .def_readwrite("accepted_transitions",          &MetricsMonitor::Metrics::accepted_transitions)
        .def_readwrite("rejected_transitions",          &MetricsMonitor::Metrics::rejected_transitions)
        .def_readwrite("detector_alerts",               &MetricsMonitor::Metrics::detector_alerts)
        .def_readwrite("detector_failures",             &MetricsMonitor::Metrics::detector_failures)
        .def_readwrite("average_allocation_latency_us", &MetricsMonitor::Metrics::average_allocation_latency_us)
        .def_readwrite("utilization_percent",           &MetricsMonitor::Metrics::utilization_percent)
        .def_readwrite("last_health",                   &MetricsMonitor::Metrics::last_health);

    py::class_<PoolMetrics>(m, "PoolMetrics")
        .def(py::init<>())
        .def_readwrite("allocations",                   &PoolMetrics::allocations)
        .def_readwrite("releases",                      &PoolMetrics::releases)
        .def_readwrite("allocation_failures",           &PoolMetrics::allocation_failures)
        .def_readwrite("validation_failures",           &PoolMetrics::validation_failures)
        .def_readwrite("stale_leases",                  &PoolMetrics::stale_leases)
        .def_readwrite("cache_hits",                    &PoolMetrics::cache_hits)
        .def_readwrite("cache_misses",                  &PoolMetrics::cache_misses)
        .def_readwrite("cache_evictions",               &PoolMetrics::cache_evictions)
        .def_readwrite("active_leases",                 &PoolMetrics::active_leases)
        .def_readwrite("peak_active_leases",            &PoolMetrics::peak_active_leases)
        .def_readwrite("cached_shapes",                 &PoolMetrics::cached_shapes)
        .def_readwrite("average_allocation_latency_us", &PoolMetrics::average_allocation_latency_us)
        .def_readwrite("circuit_state",                 &PoolMetrics::circuit_state)
        .def("cache_hit_rate", &PoolMetrics::cache_hit_rate);

    py::class_<ErrorEnvelope>(m, "ErrorEnvelope")
        .def(py::init<>())
        .def_readwrite("status_code", &ErrorEnvelope::status_code)
        .def_readwrite("code",        &ErrorEnvelope::code)
        .def_readwrite("message",     &ErrorEnvelope::message)
        .def_readwrite("retryable",   &ErrorEnvelope::retryable);
}

// ---------------------------------------------------------------------------
// Exceptions
// ---------------------------------------------------------------------------
void bind_exceptions(py::module_& m) {
    // Base exception -> RuntimeError
    static auto py_LeaseGuardError =
        py::register_exception<LeaseGuardException>(m, "LeaseGuardError", PyExc_RuntimeError);

    // Derived from LeaseGuardError
    static auto py_ValidationError =
        py::register_exception<ValidationException>(m, "ValidationError", py_LeaseGuardError.ptr());
    static auto py_PoolExhaustedError =
        py::register_exception<PoolExhaustedException>(m, "PoolExhaustedError", py_LeaseGuardError.ptr());
    static auto py_StaleResourceError =
        py::register_exception<StaleResourceException>(m, "StaleResourceError", py_LeaseGuardError.ptr());
    static auto py_GuardRejectedError =
        py::register_exception<GuardRejectedException>(m, "GuardRejectedError", py_LeaseGuardError.ptr());
    static auto py_DetectorError =
        py::register_exception<DetectorException>(m, "DetectorError", py_LeaseGuardError.ptr());
}
