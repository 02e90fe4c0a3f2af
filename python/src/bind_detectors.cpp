#include "bind_forward.hpp"
#include <leaseguard/leaseguard.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

using namespace leaseguard;

// ---------------------------------------------------------------------------
// bind_detectors  --  schedulers and host resource detectors
// ---------------------------------------------------------------------------
void bind_detectors(py::module_& m) {

    // ===================================================================
    // Schedulers
    // ===================================================================
    py::class_<Scheduler, std::shared_ptr<Scheduler>>(m, "Scheduler")
        .def("now",           &Scheduler::now)
        .def("active_timers", &Scheduler::active_timers)
        .def("cancel",        &Scheduler::cancel, py::arg("id"));

    py::class_<ThreadScheduler, Scheduler, std::shared_ptr<ThreadScheduler>>(m, "ThreadScheduler")
        .def(py::init<>());

    py::class_<ManualScheduler, Scheduler, std::shared_ptr<ManualScheduler>>(m, "ManualScheduler")
        .def(py::init<>())
        .def("advance", &ManualScheduler::advance, py::arg("duration"),
             py::call_guard<py::gil_scoped_release>())
        .def("fired_count", &ManualScheduler::fired_count);

    // ===================================================================
    // Detectors
    // ===================================================================
    py::class_<MemoryUsage>(m, "MemoryUsage")
        .def(py::init<>())
        .def_readwrite("total",     &MemoryUsage::total)
        .def_readwrite("available", &MemoryUsage::available)
        .def_readwrite("used",      &MemoryUsage::used);

    py::class_<CpuUsage>(m, "CpuUsage")
        .def(py::init<>())
        .def_readwrite("cores",        &CpuUsage::cores)
        .def_readwrite("utilization",  &CpuUsage::utilization)
        .def_readwrite("load_average", &CpuUsage::load_average);

    py::class_<DiskUsage>(m, "DiskUsage")
        .def(py::init<>())
        .def_readwrite("total",     &DiskUsage::total)
        .def_readwrite("available", &DiskUsage::available)
        .def_readwrite("used",      &DiskUsage::used);

    py::class_<ResourceUsage>(m, "ResourceUsage")
        .def(py::init<>())
        .def_readwrite("memory", &ResourceUsage::memory)
        .def_readwrite("cpu",    &ResourceUsage::cpu)
        .def_readwrite("disk",   &ResourceUsage::disk);

    py::class_<ResourceDetector, std::shared_ptr<ResourceDetector>>(m, "ResourceDetector")
        .def("start",   &ResourceDetector::start,
             py::call_guard<py::gil_scoped_release>())
        .def("stop",    &ResourceDetector::stop,
             py::call_guard<py::gil_scoped_release>())
        .def("dispose", &ResourceDetector::dispose,
             py::call_guard<py::gil_scoped_release>())
        .def("is_running",       &ResourceDetector::is_running)
        .def("get_availability", &ResourceDetector::get_availability,
             py::call_guard<py::gil_scoped_release>())
        .def("refresh",          &ResourceDetector::refresh,
             py::call_guard<py::gil_scoped_release>())
        .def("last_availability", &ResourceDetector::last_availability)
        .def("failed_ticks",      &ResourceDetector::failed_ticks)
        .def("on_update", [](ResourceDetector& self, py::function cb) {
                 self.on_update([cb = py::object(std::move(cb))](const ResourceAvailability& a) {
                     py::gil_scoped_acquire acquire;
                     cb(a);
                 });
             },
             py::arg("callback"))
        .def("on_alert", [](ResourceDetector& self, py::function cb) {
                 self.on_alert([cb = py::object(std::move(cb))](const ResourceAlert& a) {
                     py::gil_scoped_acquire acquire;
                     cb(a);
                 });
             },
             py::arg("callback"))
        .def("classify", &ResourceDetector::classify, py::arg("usage"));

    py::class_<ManualResourceDetector, ResourceDetector,
               std::shared_ptr<ManualResourceDetector>>(m, "ManualResourceDetector")
        .def(py::init<DetectorConfig, std::shared_ptr<Scheduler>>(),
             py::arg("config") = DetectorConfig{}, py::arg("scheduler") = nullptr)
        .def("set_usage", &ManualResourceDetector::set_usage, py::arg("usage"))
        .def("set_utilization", &ManualResourceDetector::set_utilization,
             py::arg("memory_percent"), py::arg("cpu_percent"),
             py::arg("disk_percent") = 50.0)
        .def("set_failure", &ManualResourceDetector::set_failure, py::arg("message"))
        .def("detect_count", &ManualResourceDetector::detect_count);

    py::class_<SystemResourceDetector, ResourceDetector,
               std::shared_ptr<SystemResourceDetector>>(m, "SystemResourceDetector")
        .def(py::init<DetectorConfig, std::shared_ptr<Scheduler>, std::string>(),
             py::arg("config") = DetectorConfig{}, py::arg("scheduler") = nullptr,
             py::arg("disk_path") = "/");
}
