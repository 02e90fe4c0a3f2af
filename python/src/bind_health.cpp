#include "bind_forward.hpp"
#include <leaseguard/leaseguard.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

using namespace leaseguard;

// ---------------------------------------------------------------------------
// bind_health  --  metric scoring and the guarded health state machine
// ---------------------------------------------------------------------------
void bind_health(py::module_& m) {

    // ===================================================================
    // MetricEvaluator
    // ===================================================================
    py::class_<MetricValidationResult>(m, "MetricValidationResult")
        .def(py::init<>())
        .def_readwrite("is_valid",        &MetricValidationResult::is_valid)
        .def_readwrite("score",           &MetricValidationResult::score)
        .def_readwrite("violations",      &MetricValidationResult::violations)
        .def_readwrite("recommendations", &MetricValidationResult::recommendations);

    py::class_<MemoryMetrics>(m, "MemoryMetrics")
        .def(py::init<>())
        .def_readwrite("heap_usage",        &MemoryMetrics::heap_usage)
        .def_readwrite("heap_limit",        &MemoryMetrics::heap_limit)
        .def_readwrite("cache_utilization", &MemoryMetrics::cache_utilization);

    py::class_<PerformanceMetrics>(m, "PerformanceMetrics")
        .def(py::init<>())
        .def_readwrite("latencies_ms", &PerformanceMetrics::latencies_ms)
        .def_readwrite("throughput",   &PerformanceMetrics::throughput);

    py::class_<ErrorMetrics>(m, "ErrorMetrics")
        .def(py::init<>())
        .def_readwrite("error_count",      &ErrorMetrics::error_count)
        .def_readwrite("total_operations", &ErrorMetrics::total_operations);

    py::class_<MetricEvaluator>(m, "MetricEvaluator")
        .def(py::init<ThresholdConfig>(), py::arg("thresholds") = ThresholdConfig{})
        .def_static("evaluate", &MetricEvaluator::evaluate,
                    py::arg("value"), py::arg("band"), py::arg("metric_name"))
        .def("evaluate_memory_health",      &MetricEvaluator::evaluate_memory_health,
             py::arg("metrics"))
        .def("evaluate_performance_health", &MetricEvaluator::evaluate_performance_health,
             py::arg("metrics"))
        .def("evaluate_error_health",       &MetricEvaluator::evaluate_error_health,
             py::arg("metrics"))
        .def("evaluate_utilization_health", &MetricEvaluator::evaluate_utilization_health,
             py::arg("utilization"))
        .def_static("aggregate_score",     &MetricEvaluator::aggregate_score,
                    py::arg("results"))
        .def_static("latency_spike_score", &MetricEvaluator::latency_spike_score,
                    py::arg("latencies"));

    // ===================================================================
    // Samples & transitions
    // ===================================================================
    py::class_<HealthMetrics>(m, "HealthMetrics")
        .def(py::init<>())
        .def_readwrite("response_time_ms", &HealthMetrics::response_time_ms)
        .def_readwrite("throughput",       &HealthMetrics::throughput)
        .def_readwrite("error_rate",       &HealthMetrics::error_rate)
        .def_readwrite("utilization",      &HealthMetrics::utilization);

    py::class_<HealthIndicators>(m, "HealthIndicators")
        .def(py::init<>())
        .def_readwrite("metrics",         &HealthIndicators::metrics)
        .def_readwrite("score",           &HealthIndicators::score)
        .def_readwrite("violations",      &HealthIndicators::violations)
        .def_readwrite("recommendations", &HealthIndicators::recommendations);

    py::class_<HealthState>(m, "HealthState")
        .def(py::init<>())
        .def_readwrite("status",     &HealthState::status)
        .def_readwrite("indicators", &HealthState::indicators)
        .def_readwrite("timestamp",  &HealthState::timestamp);

    py::class_<StateTransition>(m, "StateTransition")
        .def(py::init<>())
        .def_readwrite("from_status", &StateTransition::from)
        .def_readwrite("to_status",   &StateTransition::to)
        .def_readwrite("timestamp",   &StateTransition::timestamp)
        .def_readwrite("reason",      &StateTransition::reason);

    py::class_<StateHistory>(m, "StateHistory")
        .def("last_n",          &StateHistory::last_n, py::arg("k"))
        .def("latest",          &StateHistory::latest)
        .def("transitions",     &StateHistory::transitions)
        .def("last_transition", &StateHistory::last_transition)
        .def("sample_count",    &StateHistory::sample_count)
        .def("sample_capacity", &StateHistory::sample_capacity);

    py::class_<TransitionResult>(m, "TransitionResult")
        .def(py::init<>())
        .def_readwrite("from_status", &TransitionResult::from)
        .def_readwrite("proposed",    &TransitionResult::proposed)
        .def_readwrite("status",      &TransitionResult::status)
        .def_readwrite("changed",     &TransitionResult::changed)
        .def_readwrite("redirected",  &TransitionResult::redirected)
        .def_readwrite("rejections",  &TransitionResult::rejections)
        .def("rejected", &TransitionResult::rejected);

    py::class_<GuardCondition>(m, "GuardCondition")
        .def(py::init<>())
        .def(py::init([](std::string reason,
                         std::function<bool(HealthStatus, HealthStatus)> evaluate) {
                 return GuardCondition{std::move(reason), std::move(evaluate)};
             }),
             py::arg("reason"), py::arg("evaluate"))
        .def_readwrite("reason",   &GuardCondition::reason)
        .def_readwrite("evaluate", &GuardCondition::evaluate);

    // ===================================================================
    // HealthStateManager
    // ===================================================================
    py::class_<HealthStateManager>(m, "HealthStateManager")
        .def(py::init([](ThresholdConfig thresholds, RecoveryConfig recovery,
                         std::size_t history_capacity) {
                 return std::make_unique<HealthStateManager>(
                     std::move(thresholds), recovery, history_capacity);
             }),
             py::arg("thresholds") = ThresholdConfig{},
             py::arg("recovery") = RecoveryConfig{},
             py::arg("history_capacity") = 64)
        .def("evaluate",       &HealthStateManager::evaluate,
             py::arg("sample"),
             py::call_guard<py::gil_scoped_release>())
        .def("transition",     &HealthStateManager::transition,
             py::arg("to"), py::arg("reason") = "manual",
             py::call_guard<py::gil_scoped_release>())
        .def("can_transition", &HealthStateManager::can_transition,
             py::arg("from_status"), py::arg("to"),
             py::call_guard<py::gil_scoped_release>())
        .def("reset",          &HealthStateManager::reset,
             py::arg("reason"),
             py::call_guard<py::gil_scoped_release>())
        .def("add_guard_condition", &HealthStateManager::add_guard_condition,
             py::arg("guard"))
        .def("current_status", &HealthStateManager::current_status)
        .def("current_state",  &HealthStateManager::current_state)
        .def("history",        &HealthStateManager::history)
        .def("recent_samples", &HealthStateManager::recent_samples,
             py::arg("window"))
        .def("transitions",    &HealthStateManager::transitions)
        .def("classify",       &HealthStateManager::classify,
             py::arg("metrics"))
        .def("set_monitor",    &HealthStateManager::set_monitor,
             py::arg("monitor"));
}
