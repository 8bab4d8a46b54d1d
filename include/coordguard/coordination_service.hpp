#pragma once

#include "coordguard/types.hpp"
#include "coordguard/config.hpp"
#include "coordguard/history.hpp"
#include "coordguard/agent_manager.hpp"
#include "coordguard/lock_manager.hpp"
#include "coordguard/sync_coordinator.hpp"
#include "coordguard/safety_validator.hpp"
#include "coordguard/monitor.hpp"
#include "coordguard/request.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace coordguard {

struct SweepReport {
    Timestamp ran_at{};
    std::vector<LockEvent> expired_locks;
    std::vector<SafetyViolation> stalled;      // every agent over max_block_time
    std::vector<AgentId> newly_stalled;        // first flagged by this sweep
    std::vector<AgentId> recovered;            // flagged before, no longer stalled
};

class CoordinationService {
public:
    explicit CoordinationService(Config config = Config{}, TimeSource now = system_now);
    ~CoordinationService();

    CoordinationService(const CoordinationService&) = delete;
    CoordinationService& operator=(const CoordinationService&) = delete;

    // ==================== Request Surface ====================

    Response handle(const Request& request);

    Response agent_join(const AgentId& agent_id);
    Response agent_leave(const AgentId& agent_id);
    Response set_state(const AgentId& agent_id, AgentState state);
    Response acquire_lock(const ScopePath& scope_path, const AgentId& agent_id);
    Response release_lock(const ScopePath& scope_path, const AgentId& agent_id);
    Response declare_scope(const ScopePath& scope_path,
                           std::vector<ScopePath> dependencies = {});
    Response remove_scope(const ScopePath& scope_path);
    Response start_sync(const ScopePath& scope_path);
    Response complete_sync(const ScopePath& scope_path);
    Response fail_sync(const ScopePath& scope_path, std::string error);

    // ==================== Validation & Sweep ====================

    CoordinationSnapshot snapshot() const;
    std::vector<SafetyViolation> validate() const;

    // One sweep, synchronously. Empty if another sweep is in flight.
    std::optional<SweepReport> run_sweep();

    // ==================== Queries ====================

    SystemStatus status() const;
    std::vector<SafetyViolation> violation_history() const;

    const AgentManager& agents() const noexcept { return agents_; }
    const LockManager& locks() const noexcept { return locks_; }
    const SyncCoordinator& sync() const noexcept { return sync_; }
    const Config& config() const noexcept { return config_; }

    // ==================== Configuration ====================

    void set_monitor(std::shared_ptr<Monitor> monitor);

    // Background sweep every effective_sweep_interval(config)
    void start();
    void stop();
    bool is_running() const noexcept;

private:
    Config config_;
    TimeSource now_;

    // Declaration order is construction order: AgentManager keeps a
    // reference to the LockManager.
    LockManager locks_;
    AgentManager agents_;
    SyncCoordinator sync_;
    SafetyValidator validator_;

    mutable std::mutex monitor_mutex_;
    std::shared_ptr<Monitor> monitor_;

    // Violations currently standing, and the audit trail of first detections
    mutable std::mutex violations_mutex_;
    std::vector<SafetyViolation> active_violations_;
    BoundedHistory<SafetyViolation> violation_history_;
    std::atomic<std::size_t> rollbacks_{0};

    // Strict mode serializes check, mutation and compensation
    std::mutex strict_mutex_;

    // Single-flight sweep
    std::mutex sweep_mutex_;
    std::set<AgentId> flagged_stalled_;

    std::thread sweep_thread_;
    std::atomic<bool> running_{false};
    std::mutex cv_mutex_;
    std::condition_variable cv_;

    // Events an operation raises. They are published only after the
    // operation is known to stand, and never while strict_mutex_ is held.
    using EventBatch = std::vector<MonitorEvent>;

    // compensate returns false when apply left nothing to undo
    Response execute(const std::function<Response(EventBatch&)>& apply,
                     const std::function<bool()>& compensate);

    // Replaces the standing set and returns the first detections
    std::vector<SafetyViolation> record_violations(const std::vector<SafetyViolation>& current);
    void publish_violations(const std::vector<SafetyViolation>& fresh);
    void note_violations(const std::vector<SafetyViolation>& current);

    void sweep_loop();
    std::shared_ptr<Monitor> current_monitor() const;
    MonitorEvent make_event(EventType type, const std::string& message,
                            std::optional<AgentId> agent_id = std::nullopt,
                            std::optional<ScopePath> scope_path = std::nullopt,
                            std::optional<AgentState> agent_state = std::nullopt,
                            std::optional<SyncStatus> sync_status = std::nullopt,
                            std::optional<ViolationKind> violation_kind = std::nullopt) const;
    void publish(const EventBatch& events);
    void emit_event(EventType type, const std::string& message,
                    std::optional<AgentId> agent_id = std::nullopt,
                    std::optional<ScopePath> scope_path = std::nullopt,
                    std::optional<AgentState> agent_state = std::nullopt,
                    std::optional<SyncStatus> sync_status = std::nullopt,
                    std::optional<ViolationKind> violation_kind = std::nullopt);
};

} // namespace coordguard
