#include "bind_forward.hpp"
#include <leaseguard/leaseguard.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

#include <optional>
#include <utility>

using namespace leaseguard;

// ---------------------------------------------------------------------------
// bind_core  --  ErrorKind, envelopes, ResourcePoolManager
// ---------------------------------------------------------------------------
void bind_core(py::module_& m) {

    // ===================================================================
    // Error envelopes
    // ===================================================================
    py::enum_<ErrorKind>(m, "ErrorKind")
        .value("Validation",    ErrorKind::Validation)
        .value("PoolExhausted", ErrorKind::PoolExhausted)
        .value("ResourceStale", ErrorKind::ResourceStale)
        .value("GuardRejected", ErrorKind::GuardRejected)
        .value("Detector",      ErrorKind::Detector)
        .export_values();

    m.def("error_code", [](ErrorKind k) { return std::string(error_code(k)); },
          py::arg("kind"));
    m.def("status_code_for", &status_code_for, py::arg("kind"));

    // ===================================================================
    // ResourcePoolManager
    // ===================================================================
    py::class_<ResourcePoolManager>(m, "ResourcePoolManager")
        .def(py::init<std::shared_ptr<ResourceDetector>, PoolConfig, std::shared_ptr<Scheduler>>(),
             py::arg("detector"), py::arg("config") = PoolConfig{},
             py::arg("scheduler") = nullptr)

        // ------------- Leases -------------
        .def("allocate", &ResourcePoolManager::allocate,
             py::arg("request"),
             py::call_guard<py::gil_scoped_release>())
        .def("release", &ResourcePoolManager::release,
             py::arg("lease"),
             py::call_guard<py::gil_scoped_release>())
        .def("lease_state", &ResourcePoolManager::lease_state,
             py::arg("id"))

        // Envelope-returning variants for service edges
        .def("try_allocate",
             [](ResourcePoolManager& self, const ResourceRequest& request)
                 -> std::pair<std::optional<Lease>, std::optional<ErrorEnvelope>> {
                 py::gil_scoped_release release;
                 try {
                     return {self.allocate(request), std::nullopt};
                 } catch (const LeaseGuardException& e) {
                     return {std::nullopt, to_error_envelope(e)};
                 }
             },
             py::arg("request"))
        .def("try_release",
             [](ResourcePoolManager& self, const Lease& lease) -> std::optional<ErrorEnvelope> {
                 py::gil_scoped_release release;
                 try {
                     self.release(lease);
                     return std::nullopt;
                 } catch (const LeaseGuardException& e) {
                     return to_error_envelope(e);
                 }
             },
             py::arg("lease"))

        // ------------- Health -------------
        .def("monitor", &ResourcePoolManager::monitor)
        .def("force_update", &ResourcePoolManager::force_update,
             py::call_guard<py::gil_scoped_release>())
        .def("reset_health", &ResourcePoolManager::reset_health,
             py::arg("reason"),
             py::call_guard<py::gil_scoped_release>())
        .def("transition_health", &ResourcePoolManager::transition_health,
             py::arg("to"), py::arg("reason") = "manual",
             py::call_guard<py::gil_scoped_release>())
        .def("add_health_guard", &ResourcePoolManager::add_health_guard,
             py::arg("guard"))
        // Read-only views of the state machine
        .def("health_state",
             [](const ResourcePoolManager& self) { return self.health_manager().current_state(); })
        .def("health_history",
             [](const ResourcePoolManager& self) { return self.health_manager().history(); })
        .def("health_transitions",
             [](const ResourcePoolManager& self) { return self.health_manager().transitions(); })
        .def("last_availability", &ResourcePoolManager::last_availability)

        // ------------- Maintenance -------------
        .def("run_cleanup", &ResourcePoolManager::run_cleanup,
             py::call_guard<py::gil_scoped_release>())
        .def("get_metrics",   &ResourcePoolManager::get_metrics)
        .def("circuit_state", &ResourcePoolManager::circuit_state)

        // ------------- Lifecycle -------------
        .def("set_monitor", &ResourcePoolManager::set_monitor,
             py::arg("monitor"))
        .def("start", &ResourcePoolManager::start,
             py::call_guard<py::gil_scoped_release>())
        .def("dispose", &ResourcePoolManager::dispose,
             py::call_guard<py::gil_scoped_release>())
        .def("is_running",  &ResourcePoolManager::is_running)
        .def("is_disposed", &ResourcePoolManager::is_disposed)
        .def("config", &ResourcePoolManager::config,
             py::return_value_policy::copy);
}
