#include "bind_forward.hpp"
#include <coordguard/coordguard.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

using namespace coordguard;

// ---------------------------------------------------------------------------
// bind_requests  --  request structs and Response
// ---------------------------------------------------------------------------
void bind_requests(py::module_& m) {

    py::class_<AgentJoin>(m, "AgentJoin")
        .def(py::init<AgentId>(), py::arg("agent_id"))
        .def_readwrite("agent_id", &AgentJoin::agent_id);

    py::class_<AgentLeave>(m, "AgentLeave")
        .def(py::init<AgentId>(), py::arg("agent_id"))
        .def_readwrite("agent_id", &AgentLeave::agent_id);

    py::class_<SetState>(m, "SetState")
        .def(py::init<AgentId, AgentState>(), py::arg("agent_id"), py::arg("state"))
        .def_readwrite("agent_id", &SetState::agent_id)
        .def_readwrite("state",    &SetState::state);

    py::class_<AcquireLock>(m, "AcquireLock")
        .def(py::init<ScopePath, AgentId>(), py::arg("scope_path"), py::arg("agent_id"))
        .def_readwrite("scope_path", &AcquireLock::scope_path)
        .def_readwrite("agent_id",   &AcquireLock::agent_id);

    py::class_<ReleaseLock>(m, "ReleaseLock")
        .def(py::init<ScopePath, AgentId>(), py::arg("scope_path"), py::arg("agent_id"))
        .def_readwrite("scope_path", &ReleaseLock::scope_path)
        .def_readwrite("agent_id",   &ReleaseLock::agent_id);

    py::class_<DeclareScope>(m, "DeclareScope")
        .def(py::init<ScopePath, std::vector<ScopePath>>(),
             py::arg("scope_path"), py::arg("dependencies") = std::vector<ScopePath>{})
        .def_readwrite("scope_path",   &DeclareScope::scope_path)
        .def_readwrite("dependencies", &DeclareScope::dependencies);

    py::class_<RemoveScope>(m, "RemoveScope")
        .def(py::init<ScopePath>(), py::arg("scope_path"))
        .def_readwrite("scope_path", &RemoveScope::scope_path);

    py::class_<StartSync>(m, "StartSync")
        .def(py::init<ScopePath>(), py::arg("scope_path"))
        .def_readwrite("scope_path", &StartSync::scope_path);

    py::class_<CompleteSync>(m, "CompleteSync")
        .def(py::init<ScopePath>(), py::arg("scope_path"))
        .def_readwrite("scope_path", &CompleteSync::scope_path);

    py::class_<FailSync>(m, "FailSync")
        .def(py::init<ScopePath, std::string>(), py::arg("scope_path"), py::arg("error"))
        .def_readwrite("scope_path", &FailSync::scope_path)
        .def_readwrite("error",      &FailSync::error);

    py::class_<Response>(m, "Response")
        .def(py::init<>())
        .def_readwrite("error",       &Response::error)
        .def_readwrite("acquired",    &Response::acquired)
        .def_readwrite("scopes",      &Response::scopes)
        .def_readwrite("violations",  &Response::violations)
        .def_readwrite("rolled_back", &Response::rolled_back)
        .def("ok", &Response::ok)
        .def("__repr__", [](const Response& r) {
            std::string s = "<Response ";
            s += r.ok() ? "ok" : "error=" + to_string(*r.error);
            if (r.acquired) s += " acquired";
            if (r.rolled_back) s += " rolled_back";
            return s + ">";
        });
}

// ---------------------------------------------------------------------------
// bind_core  --  records, managers, validator, CoordinationService
// ---------------------------------------------------------------------------
void bind_core(py::module_& m) {

    // ===================================================================
    // Records
    // ===================================================================
    py::class_<Agent>(m, "Agent")
        .def("id",               &Agent::id)
        .def("state",            &Agent::state)
        .def("joined_at",        &Agent::joined_at)
        .def("last_progress_at", &Agent::last_progress_at)
        .def("state_changed_at", &Agent::state_changed_at)
        .def("blocked_since",    &Agent::blocked_since)
        .def("operations_count", &Agent::operations_count)
        .def("held_locks",       &Agent::held_locks)
        .def("holds",            &Agent::holds, py::arg("scope_path"))
        .def("blocked_for",      &Agent::blocked_for, py::arg("now"))
        .def("__repr__", [](const Agent& a) {
            return "<Agent id='" + a.id()
                 + "' state=" + std::string(to_string(a.state())) + ">";
        });

    m.def("make_agent_record", &make_agent_record,
          py::arg("id"), py::arg("state"), py::arg("since"),
          py::arg("held_locks") = std::set<ScopePath>{});
    m.def("is_valid_transition", &is_valid_transition, py::arg("from_state"), py::arg("to_state"));

    py::class_<Lock>(m, "Lock")
        .def(py::init<>())
        .def_readwrite("scope_path",  &Lock::scope_path)
        .def_readwrite("holder",      &Lock::holder)
        .def_readwrite("acquired_at", &Lock::acquired_at)
        .def_readwrite("expires_at",  &Lock::expires_at)
        .def("is_held",    &Lock::is_held)
        .def("is_expired", &Lock::is_expired, py::arg("now"));

    py::class_<LockEvent>(m, "LockEvent")
        .def(py::init<>())
        .def_readwrite("kind",       &LockEvent::kind)
        .def_readwrite("scope_path", &LockEvent::scope_path)
        .def_readwrite("agent_id",   &LockEvent::agent_id)
        .def_readwrite("timestamp",  &LockEvent::timestamp);

    py::class_<SyncOperation>(m, "SyncOperation")
        .def(py::init<>())
        .def_readwrite("scope_path",   &SyncOperation::scope_path)
        .def_readwrite("status",       &SyncOperation::status)
        .def_readwrite("dependencies", &SyncOperation::dependencies)
        .def_readwrite("started_at",   &SyncOperation::started_at)
        .def_readwrite("completed_at", &SyncOperation::completed_at)
        .def_readwrite("error",        &SyncOperation::error)
        .def_readwrite("retry_count",  &SyncOperation::retry_count);

    py::class_<SyncEvent>(m, "SyncEvent")
        .def(py::init<>())
        .def_readwrite("scope_path", &SyncEvent::scope_path)
        .def_readwrite("from_status", &SyncEvent::from)
        .def_readwrite("to_status",   &SyncEvent::to)
        .def_readwrite("reason",     &SyncEvent::reason)
        .def_readwrite("error",      &SyncEvent::error)
        .def_readwrite("timestamp",  &SyncEvent::timestamp);

    py::class_<StateTransition>(m, "StateTransition")
        .def(py::init<>())
        .def_readwrite("agent_id",   &StateTransition::agent_id)
        .def_readwrite("from_state", &StateTransition::from)
        .def_readwrite("to_state",   &StateTransition::to)
        .def_readwrite("reason",     &StateTransition::reason)
        .def_readwrite("timestamp",  &StateTransition::timestamp);

    py::class_<CoordinationSnapshot>(m, "CoordinationSnapshot")
        .def(py::init<>())
        .def_readwrite("taken_at", &CoordinationSnapshot::taken_at)
        .def_readwrite("agents",   &CoordinationSnapshot::agents)
        .def_readwrite("locks",    &CoordinationSnapshot::locks)
        .def_readwrite("scopes",   &CoordinationSnapshot::scopes);

    py::class_<SweepReport>(m, "SweepReport")
        .def(py::init<>())
        .def_readwrite("ran_at",        &SweepReport::ran_at)
        .def_readwrite("expired_locks", &SweepReport::expired_locks)
        .def_readwrite("stalled",       &SweepReport::stalled)
        .def_readwrite("newly_stalled", &SweepReport::newly_stalled)
        .def_readwrite("recovered",     &SweepReport::recovered);

    // ===================================================================
    // Read-only component views (owned by CoordinationService)
    // ===================================================================
    py::class_<AgentManager>(m, "AgentManager")
        .def("contains",           &AgentManager::contains, py::arg("agent_id"))
        .def("get_agent",          &AgentManager::get_agent, py::arg("agent_id"))
        .def("list_agents",        &AgentManager::list_agents)
        .def("agent_ids",          &AgentManager::agent_ids)
        .def("agents_in",          &AgentManager::agents_in, py::arg("state"))
        .def("agent_count",        &AgentManager::agent_count)
        .def("statistics",         &AgentManager::statistics)
        .def("check_progress",     &AgentManager::check_progress)
        .def("transition_history", &AgentManager::transition_history);

    py::class_<LockManager>(m, "LockManager")
        .def("get",           &LockManager::get, py::arg("scope_path"))
        .def("holder",        &LockManager::holder, py::arg("scope_path"))
        .def("locks_held_by", &LockManager::locks_held_by, py::arg("agent_id"))
        .def("active_locks",  &LockManager::active_locks)
        .def("lock_count",    &LockManager::lock_count)
        .def("history",       &LockManager::history);

    py::class_<SyncCoordinator>(m, "SyncCoordinator")
        .def("check_dependencies",    &SyncCoordinator::check_dependencies, py::arg("scope_path"))
        .def("contains",              &SyncCoordinator::contains, py::arg("scope_path"))
        .def("status",                &SyncCoordinator::status, py::arg("scope_path"))
        .def("get",                   &SyncCoordinator::get, py::arg("scope_path"))
        .def("dependencies",          &SyncCoordinator::dependencies, py::arg("scope_path"))
        .def("dependents",            &SyncCoordinator::dependents, py::arg("scope_path"))
        .def("transitive_dependents", &SyncCoordinator::transitive_dependents, py::arg("scope_path"))
        .def("scopes",                &SyncCoordinator::scopes)
        .def("scopes_in",             &SyncCoordinator::scopes_in, py::arg("status"))
        .def("statistics",            &SyncCoordinator::statistics)
        .def("history",               &SyncCoordinator::history);

    // ===================================================================
    // SafetyValidator
    // ===================================================================
    py::class_<SafetyValidator>(m, "SafetyValidator")
        .def(py::init<const Config&>(), py::arg("config") = Config{})
        .def("validate",                   &SafetyValidator::validate, py::arg("snapshot"))
        .def("check_context_consistency",  &SafetyValidator::check_context_consistency, py::arg("snapshot"))
        .def("check_dependency_integrity", &SafetyValidator::check_dependency_integrity, py::arg("snapshot"))
        .def("check_agent_coordination",   &SafetyValidator::check_agent_coordination, py::arg("snapshot"))
        .def("check_lock_consistency",     &SafetyValidator::check_lock_consistency, py::arg("snapshot"));

    // ===================================================================
    // CoordinationService
    // ===================================================================
    py::class_<CoordinationService>(m, "CoordinationService")
        .def(py::init([](Config config) {
                 return std::make_unique<CoordinationService>(std::move(config));
             }),
             py::arg("config") = Config{})

        // ------------- Request Surface -------------
        .def("handle", &CoordinationService::handle, py::arg("request"),
             py::call_guard<py::gil_scoped_release>())
        .def("agent_join",   &CoordinationService::agent_join, py::arg("agent_id"),
             py::call_guard<py::gil_scoped_release>())
        .def("agent_leave",  &CoordinationService::agent_leave, py::arg("agent_id"),
             py::call_guard<py::gil_scoped_release>())
        .def("set_state",    &CoordinationService::set_state,
             py::arg("agent_id"), py::arg("state"),
             py::call_guard<py::gil_scoped_release>())
        .def("acquire_lock", &CoordinationService::acquire_lock,
             py::arg("scope_path"), py::arg("agent_id"),
             py::call_guard<py::gil_scoped_release>())
        .def("release_lock", &CoordinationService::release_lock,
             py::arg("scope_path"), py::arg("agent_id"),
             py::call_guard<py::gil_scoped_release>())
        .def("declare_scope", &CoordinationService::declare_scope,
             py::arg("scope_path"), py::arg("dependencies") = std::vector<ScopePath>{},
             py::call_guard<py::gil_scoped_release>())
        .def("remove_scope",  &CoordinationService::remove_scope, py::arg("scope_path"),
             py::call_guard<py::gil_scoped_release>())
        .def("start_sync",    &CoordinationService::start_sync, py::arg("scope_path"),
             py::call_guard<py::gil_scoped_release>())
        .def("complete_sync", &CoordinationService::complete_sync, py::arg("scope_path"),
             py::call_guard<py::gil_scoped_release>())
        .def("fail_sync",     &CoordinationService::fail_sync,
             py::arg("scope_path"), py::arg("error"),
             py::call_guard<py::gil_scoped_release>())

        // ------------- Validation & Sweep -------------
        .def("snapshot",  &CoordinationService::snapshot)
        .def("validate",  &CoordinationService::validate)
        .def("run_sweep", &CoordinationService::run_sweep,
             py::call_guard<py::gil_scoped_release>())

        // ------------- Queries -------------
        .def("status",            &CoordinationService::status)
        .def("violation_history", &CoordinationService::violation_history)
        .def("agents", &CoordinationService::agents, py::return_value_policy::reference_internal)
        .def("locks",  &CoordinationService::locks,  py::return_value_policy::reference_internal)
        .def("sync",   &CoordinationService::sync,   py::return_value_policy::reference_internal)
        .def("config", &CoordinationService::config, py::return_value_policy::reference_internal)

        // ------------- Configuration -------------
        .def("set_monitor", &CoordinationService::set_monitor, py::arg("monitor"))
        .def("start", &CoordinationService::start)
        .def("stop",  &CoordinationService::stop,
             py::call_guard<py::gil_scoped_release>())
        .def("is_running", &CoordinationService::is_running);
}
