#pragma once

#include "coordguard/types.hpp"
#include "coordguard/config.hpp"
#include "coordguard/agent.hpp"
#include "coordguard/lock_manager.hpp"
#include "coordguard/sync_coordinator.hpp"
#include "coordguard/safety_violation.hpp"

#include <map>
#include <vector>

namespace coordguard {

// Read-only view of the whole coordination state at one instant.
struct CoordinationSnapshot {
    Timestamp taken_at{};
    std::vector<Agent> agents;
    std::map<ScopePath, Lock> locks;
    std::map<ScopePath, SyncOperation> scopes;   // declared scopes
};

// Pure, stateless invariant checks over a snapshot. Each check runs
// independently; one finding never suppresses another.
class SafetyValidator {
public:
    explicit SafetyValidator(const Config& config);

    // All four checks, concatenated in the order below.
    std::vector<SafetyViolation> validate(const CoordinationSnapshot& snapshot) const;

    // Locks and dependency lists only name declared scopes.
    std::vector<SafetyViolation> check_context_consistency(
        const CoordinationSnapshot& snapshot) const;

    // Acyclic, no self-dependencies, bounded fan-out, and no scope Completed
    // ahead of its dependencies.
    std::vector<SafetyViolation> check_dependency_integrity(
        const CoordinationSnapshot& snapshot) const;

    // Blocked agents past max_block_time, and the number of agents Working
    // while holding a lock against max_concurrent_agents.
    std::vector<SafetyViolation> check_agent_coordination(
        const CoordinationSnapshot& snapshot) const;

    // Per-agent lock limit, orphaned locks, unreaped expired locks, and
    // agent/lock-table agreement.
    std::vector<SafetyViolation> check_lock_consistency(
        const CoordinationSnapshot& snapshot) const;

private:
    std::size_t max_concurrent_agents_;
    Duration    max_block_time_;
    std::size_t max_locks_per_agent_;
    std::size_t max_dependencies_per_scope_;
};

} // namespace coordguard
