#include "bind_forward.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

#include <coordguard/coordguard.hpp>

using namespace coordguard;

// ---------------------------------------------------------------------------
// Module entry point
// ---------------------------------------------------------------------------
PYBIND11_MODULE(_coordguard, m) {
    m.doc() = "CoordGuard: Safety-checked coordination for multi-agent systems";

    bind_enums_and_structs(m);
    bind_exceptions(m);
    bind_requests(m);
    bind_core(m);
    bind_monitors(m);
}

// ---------------------------------------------------------------------------
// Enums & structs
// ---------------------------------------------------------------------------
void bind_enums_and_structs(py::module_& m) {

    // ---- Enums ------------------------------------------------------------

    py::enum_<AgentState>(m, "AgentState")
        .value("Idle",      AgentState::Idle)
        .value("Working",   AgentState::Working)
        .value("Blocked",   AgentState::Blocked)
        .value("Completed", AgentState::Completed)
        .export_values();

    py::enum_<SyncStatus>(m, "SyncStatus")
        .value("Idle",      SyncStatus::Idle)
        .value("Syncing",   SyncStatus::Syncing)
        .value("Completed", SyncStatus::Completed)
        .value("Failed",    SyncStatus::Failed);

    py::enum_<ViolationKind>(m, "ViolationKind")
        .value("ContextConsistency",  ViolationKind::ContextConsistency)
        .value("DependencyIntegrity", ViolationKind::DependencyIntegrity)
        .value("AgentCoordination",   ViolationKind::AgentCoordination)
        .value("LockConsistency",     ViolationKind::LockConsistency)
        .export_values();

    py::enum_<AgentError>(m, "AgentError")
        .value("AlreadyJoined",     AgentError::AlreadyJoined)
        .value("UnknownAgent",      AgentError::UnknownAgent)
        .value("InvalidTransition", AgentError::InvalidTransition)
        .value("AgentLimitReached", AgentError::AgentLimitReached);

    py::enum_<LockError>(m, "LockError")
        .value("NotHolder",         LockError::NotHolder)
        .value("LockLimitExceeded", LockError::LockLimitExceeded)
        .value("UnknownAgent",      LockError::UnknownAgent);

    py::enum_<SyncError>(m, "SyncError")
        .value("UnknownScope",        SyncError::UnknownScope)
        .value("AlreadySyncing",      SyncError::AlreadySyncing)
        .value("DependencyNotReady",  SyncError::DependencyNotReady)
        .value("InvalidTransition",   SyncError::InvalidTransition)
        .value("SelfDependency",      SyncError::SelfDependency)
        .value("CyclicDependency",    SyncError::CyclicDependency)
        .value("TooManyDependencies", SyncError::TooManyDependencies)
        .value("DependentSyncing",    SyncError::DependentSyncing);

    py::enum_<SafetyError>(m, "SafetyError")
        .value("ViolationRejected", SafetyError::ViolationRejected);

    py::enum_<DependencyProblem>(m, "DependencyProblem")
        .value("Cycle",                     DependencyProblem::Cycle)
        .value("SelfDependency",            DependencyProblem::SelfDependency)
        .value("TooManyDependencies",       DependencyProblem::TooManyDependencies)
        .value("CompletedBeforeDependency", DependencyProblem::CompletedBeforeDependency);

    py::enum_<CoordinationProblem>(m, "CoordinationProblem")
        .value("BlockedTooLong",       CoordinationProblem::BlockedTooLong)
        .value("TooManyWorkingAgents", CoordinationProblem::TooManyWorkingAgents);

    py::enum_<LockProblem>(m, "LockProblem")
        .value("LockLimitExceeded", LockProblem::LockLimitExceeded)
        .value("OrphanedLock",      LockProblem::OrphanedLock)
        .value("ExpiredLock",       LockProblem::ExpiredLock)
        .value("HolderMismatch",    LockProblem::HolderMismatch);

    py::enum_<LockEventKind>(m, "LockEventKind")
        .value("Acquired",      LockEventKind::Acquired)
        .value("Renewed",       LockEventKind::Renewed)
        .value("Released",      LockEventKind::Released)
        .value("Expired",       LockEventKind::Expired)
        .value("ForceReleased", LockEventKind::ForceReleased)
        .value("RolledBack",    LockEventKind::RolledBack);

    py::enum_<EventType>(m, "EventType")
        .value("AgentJoined",             EventType::AgentJoined)
        .value("AgentLeft",               EventType::AgentLeft)
        .value("AgentStateChanged",       EventType::AgentStateChanged)
        .value("TransitionRejected",      EventType::TransitionRejected)
        .value("LockAcquired",            EventType::LockAcquired)
        .value("LockDenied",              EventType::LockDenied)
        .value("LockReleased",            EventType::LockReleased)
        .value("LockExpired",             EventType::LockExpired)
        .value("LockForceReleased",       EventType::LockForceReleased)
        .value("ScopeDeclared",           EventType::ScopeDeclared)
        .value("ScopeRemoved",            EventType::ScopeRemoved)
        .value("SyncStarted",             EventType::SyncStarted)
        .value("SyncCompleted",           EventType::SyncCompleted)
        .value("SyncFailed",              EventType::SyncFailed)
        .value("SyncRejected",            EventType::SyncRejected)
        .value("SyncInvalidated",         EventType::SyncInvalidated)
        .value("SafetyViolationDetected", EventType::SafetyViolationDetected)
        .value("OperationRolledBack",     EventType::OperationRolledBack)
        .value("AgentStalled",            EventType::AgentStalled)
        .value("AgentStallResolved",      EventType::AgentStallResolved)
        .value("SweepCompleted",          EventType::SweepCompleted)
        .export_values();

    py::enum_<ConsoleMonitor::Verbosity>(m, "Verbosity")
        .value("Quiet",   ConsoleMonitor::Verbosity::Quiet)
        .value("Normal",  ConsoleMonitor::Verbosity::Normal)
        .value("Verbose", ConsoleMonitor::Verbosity::Verbose)
        .value("Debug",   ConsoleMonitor::Verbosity::Debug)
        .export_values();

    // ---- Structs ----------------------------------------------------------

    py::class_<Config>(m, "Config")
        .def(py::init<>())
        .def_readwrite("max_agents",                  &Config::max_agents)
        .def_readwrite("max_concurrent_agents",       &Config::max_concurrent_agents)
        .def_readwrite("max_block_time",              &Config::max_block_time)
        .def_readwrite("lock_timeout",                &Config::lock_timeout)
        .def_readwrite("strict_validation",           &Config::strict_validation)
        .def_readwrite("validation_enabled",          &Config::validation_enabled)
        .def_readwrite("max_locks_per_agent",         &Config::max_locks_per_agent)
        .def_readwrite("max_dependencies_per_scope",  &Config::max_dependencies_per_scope)
        .def_readwrite("sweep_interval",              &Config::sweep_interval)
        .def_readwrite("lock_history_capacity",       &Config::lock_history_capacity)
        .def_readwrite("violation_history_capacity",  &Config::violation_history_capacity)
        .def_readwrite("transition_history_capacity", &Config::transition_history_capacity)
        .def_readwrite("sync_history_capacity",       &Config::sync_history_capacity);

    m.def("validate_config", &validate, py::arg("config"));
    m.def("effective_sweep_interval", &effective_sweep_interval, py::arg("config"));

    py::class_<AgentResult>(m, "AgentResult")
        .def(py::init<>())
        .def_readwrite("error",          &AgentResult::error)
        .def_readwrite("previous",       &AgentResult::previous)
        .def_readwrite("released_locks", &AgentResult::released_locks)
        .def("ok", &AgentResult::ok);

    py::class_<LockResult>(m, "LockResult")
        .def(py::init<>())
        .def_readwrite("acquired", &LockResult::acquired)
        .def_readwrite("error",    &LockResult::error)
        .def("ok", &LockResult::ok);

    py::class_<SyncResult>(m, "SyncResult")
        .def(py::init<>())
        .def_readwrite("error",  &SyncResult::error)
        .def_readwrite("scopes", &SyncResult::scopes)
        .def("ok", &SyncResult::ok);

    py::class_<DependencyCheck>(m, "DependencyCheck")
        .def(py::init<>())
        .def_readwrite("ready", &DependencyCheck::ready)
        .def_readwrite("unmet", &DependencyCheck::unmet);

    py::class_<AgentStatistics>(m, "AgentStatistics")
        .def(py::init<>())
        .def_readwrite("total",     &AgentStatistics::total)
        .def_readwrite("idle",      &AgentStatistics::idle)
        .def_readwrite("working",   &AgentStatistics::working)
        .def_readwrite("blocked",   &AgentStatistics::blocked)
        .def_readwrite("completed", &AgentStatistics::completed);

    py::class_<SyncStatistics>(m, "SyncStatistics")
        .def(py::init<>())
        .def_readwrite("total_scopes", &SyncStatistics::total_scopes)
        .def_readwrite("idle",         &SyncStatistics::idle)
        .def_readwrite("syncing",      &SyncStatistics::syncing)
        .def_readwrite("completed",    &SyncStatistics::completed)
        .def_readwrite("failed",       &SyncStatistics::failed);

    py::class_<SystemStatus>(m, "SystemStatus")
        .def(py::init<>())
        .def_readwrite("timestamp",           &SystemStatus::timestamp)
        .def_readwrite("total_agents",        &SystemStatus::total_agents)
        .def_readwrite("active_agents",       &SystemStatus::active_agents)
        .def_readwrite("held_locks",          &SystemStatus::held_locks)
        .def_readwrite("syncing_scopes",      &SystemStatus::syncing_scopes)
        .def_readwrite("completed_scopes",    &SystemStatus::completed_scopes)
        .def_readwrite("failed_scopes",       &SystemStatus::failed_scopes)
        .def_readwrite("violations_recorded", &SystemStatus::violations_recorded)
        .def_readwrite("rollbacks",           &SystemStatus::rollbacks);

    // ---- Violations -------------------------------------------------------

    py::class_<ContextConsistencyDetail>(m, "ContextConsistencyDetail")
        .def(py::init<>())
        .def_readwrite("scope",         &ContextConsistencyDetail::scope)
        .def_readwrite("referenced_by", &ContextConsistencyDetail::referenced_by);

    py::class_<DependencyIntegrityDetail>(m, "DependencyIntegrityDetail")
        .def(py::init<>())
        .def_readwrite("problem", &DependencyIntegrityDetail::problem)
        .def_readwrite("scope",   &DependencyIntegrityDetail::scope)
        .def_readwrite("path",    &DependencyIntegrityDetail::path)
        .def_readwrite("limit",   &DependencyIntegrityDetail::limit);

    py::class_<AgentCoordinationDetail>(m, "AgentCoordinationDetail")
        .def(py::init<>())
        .def_readwrite("problem",        &AgentCoordinationDetail::problem)
        .def_readwrite("agents",         &AgentCoordinationDetail::agents)
        .def_readwrite("blocked_for",    &AgentCoordinationDetail::blocked_for)
        .def_readwrite("working_agents", &AgentCoordinationDetail::working_agents)
        .def_readwrite("limit",          &AgentCoordinationDetail::limit);

    py::class_<LockConsistencyDetail>(m, "LockConsistencyDetail")
        .def(py::init<>())
        .def_readwrite("problem", &LockConsistencyDetail::problem)
        .def_readwrite("scope",   &LockConsistencyDetail::scope)
        .def_readwrite("holder",  &LockConsistencyDetail::holder)
        .def_readwrite("held",    &LockConsistencyDetail::held)
        .def_readwrite("limit",   &LockConsistencyDetail::limit);

    py::class_<SafetyViolation>(m, "SafetyViolation")
        .def(py::init<>())
        .def_readwrite("detail",      &SafetyViolation::detail)
        .def_readwrite("message",     &SafetyViolation::message)
        .def_readwrite("subject",     &SafetyViolation::subject)
        .def_readwrite("detected_at", &SafetyViolation::detected_at)
        .def("kind",           &SafetyViolation::kind)
        .def("same_condition", &SafetyViolation::same_condition, py::arg("other"))
        .def("__repr__", [](const SafetyViolation& v) {
            return "<SafetyViolation " + std::string(to_string(v.kind()))
                 + " '" + v.message + "'>";
        });

    // ---- Events -----------------------------------------------------------

    py::class_<MonitorEvent>(m, "MonitorEvent")
        .def(py::init<>())
        .def_readwrite("type",           &MonitorEvent::type)
        .def_readwrite("timestamp",      &MonitorEvent::timestamp)
        .def_readwrite("message",        &MonitorEvent::message)
        .def_readwrite("agent_id",       &MonitorEvent::agent_id)
        .def_readwrite("scope_path",     &MonitorEvent::scope_path)
        .def_readwrite("agent_state",    &MonitorEvent::agent_state)
        .def_readwrite("sync_status",    &MonitorEvent::sync_status)
        .def_readwrite("violation_kind", &MonitorEvent::violation_kind);

    // MetricsMonitor::Metrics (bound as module-level "Metrics")
    py::class_<MetricsMonitor::Metrics>(m, "Metrics")
        .def(py::init<>())
        .def_readwrite("joins",                &MetricsMonitor::Metrics::joins)
        .def_readwrite("leaves",               &MetricsMonitor::Metrics::leaves)
        .def_readwrite("state_changes",        &MetricsMonitor::Metrics::state_changes)
        .def_readwrite("rejected_transitions", &MetricsMonitor::Metrics::rejected_transitions)
        .def_readwrite("locks_granted",        &MetricsMonitor::Metrics::locks_granted)
        .def_readwrite("locks_denied",         &MetricsMonitor::Metrics::locks_denied)
        .def_readwrite("locks_released",       &MetricsMonitor::Metrics::locks_released)
        .def_readwrite("locks_expired",        &MetricsMonitor::Metrics::locks_expired)
        .def_readwrite("locks_force_released", &MetricsMonitor::Metrics::locks_force_released)
        .def_readwrite("syncs_started",        &MetricsMonitor::Metrics::syncs_started)
        .def_readwrite("syncs_completed",      &MetricsMonitor::Metrics::syncs_completed)
        .def_readwrite("syncs_failed",         &MetricsMonitor::Metrics::syncs_failed)
        .def_readwrite("violations",           &MetricsMonitor::Metrics::violations)
        .def_readwrite("rollbacks",            &MetricsMonitor::Metrics::rollbacks)
        .def_readwrite("stalls",               &MetricsMonitor::Metrics::stalls)
        .def_readwrite("sweeps",               &MetricsMonitor::Metrics::sweeps)
        .def_readwrite("violations_by_kind",   &MetricsMonitor::Metrics::violations_by_kind)
        .def_readwrite("last_held_locks",      &MetricsMonitor::Metrics::last_held_locks)
        .def_readwrite("last_active_agents",   &MetricsMonitor::Metrics::last_active_agents);
}

// ---------------------------------------------------------------------------
// Exceptions
// ---------------------------------------------------------------------------
void bind_exceptions(py::module_& m) {
    // Base exception -> RuntimeError
    static auto py_CoordGuardError =
        py::register_exception<CoordGuardException>(m, "CoordGuardError", PyExc_RuntimeError);

    static auto py_InvalidConfigError =
        py::register_exception<InvalidConfigException>(m, "InvalidConfigError", py_CoordGuardError.ptr());
}
