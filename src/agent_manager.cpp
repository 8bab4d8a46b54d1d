#include "coordguard/agent_manager.hpp"
#include "coordguard/sync_coordinator.hpp"

#include <algorithm>
#include <mutex>

namespace coordguard {

std::vector<SafetyViolation> check_blocked_agents(const std::vector<Agent>& agents,
                                                  Duration max_block_time,
                                                  Timestamp now) {
    std::vector<SafetyViolation> violations;
    for (const auto& agent : agents) {
        if (agent.state() != AgentState::Blocked) {
            continue;
        }
        Duration blocked = agent.blocked_for(now);
        if (blocked <= max_block_time) {
            continue;
        }
        AgentCoordinationDetail detail;
        detail.problem = CoordinationProblem::BlockedTooLong;
        detail.agents = {agent.id()};
        detail.blocked_for = blocked;
        violations.push_back(make_violation(std::move(detail), max_block_time, now));
    }
    return violations;
}

AgentManager::AgentManager(const Config& config, LockManager& locks, TimeSource now)
    : max_agents_(config.max_agents)
    , max_block_time_(config.max_block_time)
    , locks_(locks)
    , now_(std::move(now))
    , transitions_(config.transition_history_capacity)
{}

// ---------------------------------------------------------------------------
// Agent lifecycle
// ---------------------------------------------------------------------------

AgentResult AgentManager::join(const AgentId& agent_id) {
    std::unique_lock lock(mutex_);

    if (agents_.count(agent_id)) {
        return {AgentError::AlreadyJoined};
    }
    if (agents_.size() >= max_agents_) {
        return {AgentError::AgentLimitReached};
    }

    Timestamp now = now_();
    agents_.emplace(agent_id, Agent(agent_id, now));
    record(agent_id, std::nullopt, AgentState::Idle, "Agent joined", now);
    return {};
}

AgentResult AgentManager::leave(const AgentId& agent_id) {
    std::unique_lock lock(mutex_);

    auto it = agents_.find(agent_id);
    if (it == agents_.end()) {
        return {AgentError::UnknownAgent};
    }

    auto released = locks_.release_all(agent_id);
    AgentState last = it->second.state();
    agents_.erase(it);

    std::string reason = "Agent left";
    if (!released.empty()) {
        reason += " (" + std::to_string(released.size()) + " locks released)";
    }
    record(agent_id, last, std::nullopt, std::move(reason), now_());
    return {std::nullopt, last, std::move(released)};
}

AgentResult AgentManager::set_state(const AgentId& agent_id, AgentState new_state) {
    std::unique_lock lock(mutex_);

    auto it = agents_.find(agent_id);
    if (it == agents_.end()) {
        return {AgentError::UnknownAgent};
    }

    AgentState from = it->second.state();
    if (!is_valid_transition(from, new_state)) {
        return {AgentError::InvalidTransition, from};
    }

    Timestamp now = now_();
    it->second.transition(new_state, now);
    record(agent_id, from, new_state, "State change", now);
    return {std::nullopt, from};
}

std::vector<SafetyViolation> AgentManager::check_progress() const {
    std::shared_lock lock(mutex_);
    std::vector<Agent> agents;
    agents.reserve(agents_.size());
    for (const auto& [id, agent] : agents_) {
        agents.push_back(agent);
    }
    std::sort(agents.begin(), agents.end(),
              [](const Agent& a, const Agent& b) { return a.id() < b.id(); });
    return check_blocked_agents(agents, max_block_time_, now_());
}

// ---------------------------------------------------------------------------
// Lock ownership
// ---------------------------------------------------------------------------

LockResult AgentManager::acquire_lock(const AgentId& agent_id, const ScopePath& scope_path) {
    // Shared: holding off leave() is enough, the lock table has its own mutex
    std::shared_lock lock(mutex_);
    if (!agents_.count(agent_id)) {
        return {false, LockError::UnknownAgent};
    }
    return locks_.acquire(scope_path, agent_id);
}

LockResult AgentManager::release_lock(const AgentId& agent_id, const ScopePath& scope_path) {
    std::shared_lock lock(mutex_);
    if (!agents_.count(agent_id)) {
        return {false, LockError::UnknownAgent};
    }
    return locks_.release(scope_path, agent_id);
}

std::vector<LockEvent> AgentManager::reap_expired_locks() {
    std::shared_lock lock(mutex_);
    return locks_.cleanup_expired();
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

bool AgentManager::contains(const AgentId& agent_id) const {
    std::shared_lock lock(mutex_);
    return agents_.count(agent_id) > 0;
}

std::optional<Agent> AgentManager::get_agent(const AgentId& agent_id) const {
    std::shared_lock lock(mutex_);
    auto it = agents_.find(agent_id);
    if (it == agents_.end()) {
        return std::nullopt;
    }
    return with_locks(it->second);
}

std::vector<Agent> AgentManager::list_agents() const {
    std::shared_lock lock(mutex_);
    return list_agents_locked();
}

std::vector<AgentId> AgentManager::agent_ids() const {
    std::shared_lock lock(mutex_);
    std::vector<AgentId> ids;
    ids.reserve(agents_.size());
    for (const auto& [id, agent] : agents_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::vector<AgentId> AgentManager::agents_in(AgentState state) const {
    std::shared_lock lock(mutex_);
    std::vector<AgentId> ids;
    for (const auto& [id, agent] : agents_) {
        if (agent.state() == state) {
            ids.push_back(id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::size_t AgentManager::agent_count() const {
    std::shared_lock lock(mutex_);
    return agents_.size();
}

AgentStatistics AgentManager::statistics() const {
    std::shared_lock lock(mutex_);
    AgentStatistics stats;
    stats.total = agents_.size();
    for (const auto& [id, agent] : agents_) {
        switch (agent.state()) {
            case AgentState::Idle:      ++stats.idle; break;
            case AgentState::Working:   ++stats.working; break;
            case AgentState::Blocked:   ++stats.blocked; break;
            case AgentState::Completed: ++stats.completed; break;
        }
    }
    return stats;
}

std::vector<StateTransition> AgentManager::transition_history() const {
    std::shared_lock lock(mutex_);
    return transitions_.snapshot();
}

CoordinationSnapshot AgentManager::snapshot(const SyncCoordinator& sync) const {
    // Lock order: registry, then lock table, then sync table
    std::shared_lock lock(mutex_);

    CoordinationSnapshot snap;
    snap.taken_at = now_();
    snap.locks = locks_.table();

    std::unordered_map<AgentId, std::set<ScopePath>> held;
    for (const auto& [scope, entry] : snap.locks) {
        if (entry.holder) {
            held[*entry.holder].insert(scope);
        }
    }

    snap.agents.reserve(agents_.size());
    for (const auto& [id, agent] : agents_) {
        Agent copy = agent;
        if (auto it = held.find(id); it != held.end()) {
            copy.set_held_locks(it->second);
        }
        snap.agents.push_back(std::move(copy));
    }
    std::sort(snap.agents.begin(), snap.agents.end(),
              [](const Agent& a, const Agent& b) { return a.id() < b.id(); });

    snap.scopes = sync.table();
    return snap;
}

// ---------------------------------------------------------------------------
// Compensation
// ---------------------------------------------------------------------------

void AgentManager::restore(const Agent& agent, const std::vector<Lock>& locks) {
    std::unique_lock lock(mutex_);

    Agent record_copy = agent;
    record_copy.set_held_locks({});
    std::optional<AgentState> from;
    if (auto it = agents_.find(agent.id()); it != agents_.end()) {
        from = it->second.state();
    }
    agents_.insert_or_assign(agent.id(), record_copy);

    for (const auto& entry : locks) {
        locks_.restore(entry);
    }
    record(agent.id(), from, agent.state(), "Rolled back", now_());
}

void AgentManager::discard(const AgentId& agent_id) {
    std::unique_lock lock(mutex_);
    auto it = agents_.find(agent_id);
    if (it == agents_.end()) {
        return;
    }
    AgentState last = it->second.state();
    agents_.erase(it);
    record(agent_id, last, std::nullopt, "Rolled back", now_());
}

// ---------------------------------------------------------------------------
// Internal helpers
// ---------------------------------------------------------------------------

Agent AgentManager::with_locks(const Agent& agent) const {
    Agent copy = agent;
    copy.set_held_locks(locks_.locks_held_by(agent.id()));
    return copy;
}

std::vector<Agent> AgentManager::list_agents_locked() const {
    std::vector<Agent> result;
    result.reserve(agents_.size());
    for (const auto& [id, agent] : agents_) {
        result.push_back(with_locks(agent));
    }
    std::sort(result.begin(), result.end(),
              [](const Agent& a, const Agent& b) { return a.id() < b.id(); });
    return result;
}

void AgentManager::record(const AgentId& agent_id, std::optional<AgentState> from,
                          std::optional<AgentState> to, std::string reason, Timestamp at) {
    transitions_.push(StateTransition{agent_id, from, to, std::move(reason), at});
}

} // namespace coordguard
