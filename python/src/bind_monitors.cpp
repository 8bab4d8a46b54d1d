#include "bind_forward.hpp"
#include <coordguard/coordguard.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

using namespace coordguard;

namespace {

// Monitors are called from service and sweep threads that do not hold the
// GIL. The service never holds its own locks while a monitor runs, so a
// Python monitor may issue requests from on_event.
class PyMonitor : public Monitor {
public:
    using Monitor::Monitor;

    void on_event(const MonitorEvent& event) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(void, Monitor, on_event, event);
    }

    void on_status(const SystemStatus& status) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(void, Monitor, on_status, status);
    }
};

MetricsMonitor::AlertCallback with_gil(py::function fn) {
    return [fn = py::object(std::move(fn))](const std::string& message) {
        py::gil_scoped_acquire acquire;
        fn(message);
    };
}

} // anonymous namespace

void bind_monitors(py::module_& m) {
    m.def("event_type_name", [](EventType t) { return std::string(to_string(t)); },
          py::arg("event_type"));

    py::class_<Monitor, PyMonitor, std::shared_ptr<Monitor>>(m, "Monitor",
            "Subclass and override on_event / on_status to observe a CoordinationService.")
        .def(py::init<>())
        .def("on_event",  &Monitor::on_event,  py::arg("event"))
        .def("on_status", &Monitor::on_status, py::arg("status"));

    // Verbosity is bound with the other enums in bindings.cpp
    py::class_<ConsoleMonitor, Monitor, std::shared_ptr<ConsoleMonitor>>(m, "ConsoleMonitor")
        .def(py::init<ConsoleMonitor::Verbosity>(),
             py::arg("verbosity") = ConsoleMonitor::Verbosity::Normal);

    py::class_<MetricsMonitor, Monitor, std::shared_ptr<MetricsMonitor>>(m, "MetricsMonitor")
        .def(py::init<>())
        .def_property_readonly("metrics", &MetricsMonitor::get_metrics)
        .def("get_metrics",   &MetricsMonitor::get_metrics)
        .def("reset_metrics", &MetricsMonitor::reset_metrics)
        .def("set_violation_alert_threshold",
             [](MetricsMonitor& self, std::uint64_t threshold, py::function callback) {
                 self.set_violation_alert_threshold(threshold, with_gil(std::move(callback)));
             },
             py::arg("threshold"), py::arg("callback"),
             "callback(message) fires on every violation past the threshold.");

    py::class_<CompositeMonitor, Monitor, std::shared_ptr<CompositeMonitor>>(m, "CompositeMonitor")
        .def(py::init([](const std::vector<std::shared_ptr<Monitor>>& monitors) {
                 auto composite = std::make_shared<CompositeMonitor>();
                 for (const auto& monitor : monitors) {
                     composite->add_monitor(monitor);
                 }
                 return composite;
             }),
             py::arg("monitors") = std::vector<std::shared_ptr<Monitor>>{})
        .def("add_monitor", &CompositeMonitor::add_monitor, py::arg("monitor"));
}
