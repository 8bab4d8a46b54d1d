#pragma once

#include "coordguard/types.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace coordguard {

enum class EventType {
    AgentJoined,
    AgentLeft,
    AgentStateChanged,
    TransitionRejected,
    LockAcquired,
    LockDenied,
    LockReleased,
    LockExpired,
    LockForceReleased,
    ScopeDeclared,
    ScopeRemoved,
    SyncStarted,
    SyncCompleted,
    SyncFailed,
    SyncRejected,
    SyncInvalidated,
    SafetyViolationDetected,
    OperationRolledBack,
    AgentStalled,
    AgentStallResolved,
    SweepCompleted
};

const char* to_string(EventType t);

struct MonitorEvent {
    EventType type{EventType::AgentJoined};
    Timestamp timestamp{};
    std::string message;

    std::optional<AgentId> agent_id;
    std::optional<ScopePath> scope_path;
    std::optional<AgentState> agent_state;
    std::optional<SyncStatus> sync_status;
    std::optional<ViolationKind> violation_kind;
};

// Abstract monitor interface
class Monitor {
public:
    virtual ~Monitor() = default;
    virtual void on_event(const MonitorEvent& event) = 0;
    virtual void on_status(const SystemStatus& status) = 0;
};

// Console logger
class ConsoleMonitor : public Monitor {
public:
    enum class Verbosity { Quiet, Normal, Verbose, Debug };

    explicit ConsoleMonitor(Verbosity v = Verbosity::Normal);

    void on_event(const MonitorEvent& event) override;
    void on_status(const SystemStatus& status) override;

private:
    Verbosity verbosity_;
    mutable std::mutex output_mutex_;
};

// Metrics collector
class MetricsMonitor : public Monitor {
public:
    struct Metrics {
        std::uint64_t joins{0};
        std::uint64_t leaves{0};
        std::uint64_t state_changes{0};
        std::uint64_t rejected_transitions{0};
        std::uint64_t locks_granted{0};
        std::uint64_t locks_denied{0};
        std::uint64_t locks_released{0};
        std::uint64_t locks_expired{0};
        std::uint64_t locks_force_released{0};
        std::uint64_t syncs_started{0};
        std::uint64_t syncs_completed{0};
        std::uint64_t syncs_failed{0};
        std::uint64_t violations{0};
        std::uint64_t rollbacks{0};
        std::uint64_t stalls{0};
        std::uint64_t sweeps{0};
        std::unordered_map<ViolationKind, std::uint64_t> violations_by_kind;
        std::size_t last_held_locks{0};
        std::size_t last_active_agents{0};
    };

    MetricsMonitor();

    void on_event(const MonitorEvent& event) override;
    void on_status(const SystemStatus& status) override;

    Metrics get_metrics() const;
    void reset_metrics();

    using AlertCallback = std::function<void(const std::string&)>;
    // Fires on each violation once the running count exceeds threshold.
    void set_violation_alert_threshold(std::uint64_t threshold, AlertCallback cb);

private:
    mutable std::mutex metrics_mutex_;
    Metrics metrics_;

    std::uint64_t violation_threshold_{0};
    AlertCallback violation_cb_;
};

// Fan-out to multiple monitors
class CompositeMonitor : public Monitor {
public:
    void add_monitor(std::shared_ptr<Monitor> monitor);

    void on_event(const MonitorEvent& event) override;
    void on_status(const SystemStatus& status) override;

private:
    std::vector<std::shared_ptr<Monitor>> monitors_;
};

} // namespace coordguard
