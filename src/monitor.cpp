#include "coordguard/monitor.hpp"

#include <iostream>

namespace coordguard {

const char* to_string(EventType t) {
    switch (t) {
        case EventType::AgentJoined:             return "AgentJoined";
        case EventType::AgentLeft:               return "AgentLeft";
        case EventType::AgentStateChanged:       return "AgentStateChanged";
        case EventType::TransitionRejected:      return "TransitionRejected";
        case EventType::LockAcquired:            return "LockAcquired";
        case EventType::LockDenied:              return "LockDenied";
        case EventType::LockReleased:            return "LockReleased";
        case EventType::LockExpired:             return "LockExpired";
        case EventType::LockForceReleased:       return "LockForceReleased";
        case EventType::ScopeDeclared:           return "ScopeDeclared";
        case EventType::ScopeRemoved:            return "ScopeRemoved";
        case EventType::SyncStarted:             return "SyncStarted";
        case EventType::SyncCompleted:           return "SyncCompleted";
        case EventType::SyncFailed:              return "SyncFailed";
        case EventType::SyncRejected:            return "SyncRejected";
        case EventType::SyncInvalidated:         return "SyncInvalidated";
        case EventType::SafetyViolationDetected: return "SafetyViolationDetected";
        case EventType::OperationRolledBack:     return "OperationRolledBack";
        case EventType::AgentStalled:            return "AgentStalled";
        case EventType::AgentStallResolved:      return "AgentStallResolved";
        case EventType::SweepCompleted:          return "SweepCompleted";
    }
    return "Unknown";
}

namespace {

bool is_important_event(EventType t) {
    switch (t) {
        case EventType::AgentJoined:
        case EventType::AgentLeft:
        case EventType::LockExpired:
        case EventType::LockForceReleased:
        case EventType::SyncFailed:
        case EventType::SyncInvalidated:
        case EventType::SafetyViolationDetected:
        case EventType::OperationRolledBack:
        case EventType::AgentStalled:
        case EventType::AgentStallResolved:
            return true;
        default:
            return false;
    }
}

} // anonymous namespace

// ========== ConsoleMonitor ==========

ConsoleMonitor::ConsoleMonitor(Verbosity v) : verbosity_(v) {}

void ConsoleMonitor::on_event(const MonitorEvent& event) {
    if (verbosity_ == Verbosity::Quiet) return;
    if (verbosity_ == Verbosity::Normal && !is_important_event(event.type)) return;
    if (verbosity_ == Verbosity::Verbose && event.type == EventType::SweepCompleted) return;

    std::lock_guard<std::mutex> lock(output_mutex_);

    std::cout << "[CoordGuard] " << to_string(event.type);

    if (event.agent_id.has_value()) {
        std::cout << " agent=" << event.agent_id.value();
    }
    if (event.scope_path.has_value()) {
        std::cout << " scope=" << event.scope_path.value();
    }
    if (event.agent_state.has_value()) {
        std::cout << " state=" << to_string(event.agent_state.value());
    }
    if (event.sync_status.has_value()) {
        std::cout << " sync=" << to_string(event.sync_status.value());
    }
    if (event.violation_kind.has_value()) {
        std::cout << " violation=" << to_string(event.violation_kind.value());
    }

    if (!event.message.empty()) {
        std::cout << " | " << event.message;
    }

    std::cout << "\n";
}

void ConsoleMonitor::on_status(const SystemStatus& status) {
    if (verbosity_ < Verbosity::Verbose) return;

    std::lock_guard<std::mutex> lock(output_mutex_);

    std::cout << "\n[CoordGuard] === System Status ===\n";
    std::cout << "  Agents: " << status.total_agents
              << " (active " << status.active_agents << ")\n";
    std::cout << "  Held locks: " << status.held_locks << "\n";
    std::cout << "  Scopes: syncing=" << status.syncing_scopes
              << " completed=" << status.completed_scopes
              << " failed=" << status.failed_scopes << "\n";
    std::cout << "  Violations recorded: " << status.violations_recorded << "\n";
    std::cout << "  Rollbacks: " << status.rollbacks << "\n";
    std::cout << "  ======================\n\n";
}

// ========== MetricsMonitor ==========

MetricsMonitor::MetricsMonitor() = default;

void MetricsMonitor::on_event(const MonitorEvent& event) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);

    switch (event.type) {
        case EventType::AgentJoined:        metrics_.joins++; break;
        case EventType::AgentLeft:          metrics_.leaves++; break;
        case EventType::AgentStateChanged:  metrics_.state_changes++; break;
        case EventType::TransitionRejected: metrics_.rejected_transitions++; break;
        case EventType::LockAcquired:       metrics_.locks_granted++; break;
        case EventType::LockDenied:         metrics_.locks_denied++; break;
        case EventType::LockReleased:       metrics_.locks_released++; break;
        case EventType::LockExpired:        metrics_.locks_expired++; break;
        case EventType::LockForceReleased:  metrics_.locks_force_released++; break;
        case EventType::SyncStarted:        metrics_.syncs_started++; break;
        case EventType::SyncCompleted:      metrics_.syncs_completed++; break;
        case EventType::SyncFailed:         metrics_.syncs_failed++; break;
        case EventType::OperationRolledBack: metrics_.rollbacks++; break;
        case EventType::AgentStalled:       metrics_.stalls++; break;
        case EventType::SweepCompleted:     metrics_.sweeps++; break;
        case EventType::SafetyViolationDetected:
            metrics_.violations++;
            if (event.violation_kind.has_value()) {
                metrics_.violations_by_kind[event.violation_kind.value()]++;
            }
            if (violation_cb_ && metrics_.violations > violation_threshold_) {
                violation_cb_("Violation count " + std::to_string(metrics_.violations) +
                              " exceeds threshold " + std::to_string(violation_threshold_) +
                              ": " + event.message);
            }
            break;
        default:
            break;
    }
}

void MetricsMonitor::on_status(const SystemStatus& status) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_.last_held_locks = status.held_locks;
    metrics_.last_active_agents = status.active_agents;
}

MetricsMonitor::Metrics MetricsMonitor::get_metrics() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return metrics_;
}

void MetricsMonitor::reset_metrics() {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_ = Metrics{};
}

void MetricsMonitor::set_violation_alert_threshold(std::uint64_t threshold, AlertCallback cb) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    violation_threshold_ = threshold;
    violation_cb_ = std::move(cb);
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

void CompositeMonitor::on_status(const SystemStatus& status) {
    for (auto& m : monitors_) {
        m->on_status(status);
    }
}

} // namespace coordguard
