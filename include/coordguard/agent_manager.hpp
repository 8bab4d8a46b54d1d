#pragma once

#include "coordguard/types.hpp"
#include "coordguard/agent.hpp"
#include "coordguard/config.hpp"
#include "coordguard/history.hpp"
#include "coordguard/lock_manager.hpp"
#include "coordguard/safety_validator.hpp"
#include "coordguard/safety_violation.hpp"

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace coordguard {

class SyncCoordinator;

struct StateTransition {
    AgentId agent_id;
    std::optional<AgentState> from;   // empty on join
    std::optional<AgentState> to;     // empty on leave
    std::string reason;
    Timestamp timestamp{};
};

// One AgentCoordination violation per agent Blocked for longer than
// max_block_time at `now`.
std::vector<SafetyViolation> check_blocked_agents(const std::vector<Agent>& agents,
                                                  Duration max_block_time,
                                                  Timestamp now);

// Agent registry. Lock operations are routed through the registry so that
// the lock table only ever names registered agents; cross-component work
// takes the registry lock first, then the LockManager lock.
class AgentManager {
public:
    AgentManager(const Config& config, LockManager& locks, TimeSource now = system_now);

    AgentManager(const AgentManager&) = delete;
    AgentManager& operator=(const AgentManager&) = delete;

    // ==================== Agent Lifecycle ====================

    AgentResult join(const AgentId& agent_id);
    // Force-releases every lock the agent holds, then removes it.
    AgentResult leave(const AgentId& agent_id);
    AgentResult set_state(const AgentId& agent_id, AgentState new_state);

    // Read-only; does not change any agent.
    std::vector<SafetyViolation> check_progress() const;

    // ==================== Lock Ownership ====================

    LockResult acquire_lock(const AgentId& agent_id, const ScopePath& scope_path);
    LockResult release_lock(const AgentId& agent_id, const ScopePath& scope_path);
    std::vector<LockEvent> reap_expired_locks();

    // ==================== Queries ====================

    bool contains(const AgentId& agent_id) const;
    std::optional<Agent> get_agent(const AgentId& agent_id) const;
    std::vector<Agent> list_agents() const;           // sorted by id
    std::vector<AgentId> agent_ids() const;           // sorted
    std::vector<AgentId> agents_in(AgentState state) const;
    std::size_t agent_count() const;
    AgentStatistics statistics() const;

    std::vector<StateTransition> transition_history() const;

    // Registry, lock table and sync table read under the global lock order.
    CoordinationSnapshot snapshot(const SyncCoordinator& sync) const;

    // ==================== Compensation ====================

    // Reinstate a previously captured agent record and the locks it held.
    void restore(const Agent& agent, const std::vector<Lock>& locks = {});
    // Remove an agent record without the leave bookkeeping.
    void discard(const AgentId& agent_id);

private:
    std::size_t max_agents_;
    Duration max_block_time_;
    LockManager& locks_;
    TimeSource now_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<AgentId, Agent> agents_;
    BoundedHistory<StateTransition> transitions_;

    // Caller must hold mutex_ (shared or exclusive)
    Agent with_locks(const Agent& agent) const;
    std::vector<Agent> list_agents_locked() const;

    // Caller must hold mutex_ exclusively
    void record(const AgentId& agent_id, std::optional<AgentState> from,
                std::optional<AgentState> to, std::string reason, Timestamp at);
};

} // namespace coordguard
