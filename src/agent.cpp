#include "coordguard/agent.hpp"

#include <algorithm>

namespace coordguard {

Agent::Agent(AgentId id, Timestamp joined_at)
    : id_(std::move(id))
    , joined_at_(joined_at)
    , last_progress_at_(joined_at)
    , state_changed_at_(joined_at)
{}

const AgentId& Agent::id() const noexcept { return id_; }
AgentState Agent::state() const noexcept { return state_; }
Timestamp Agent::joined_at() const noexcept { return joined_at_; }
Timestamp Agent::last_progress_at() const noexcept { return last_progress_at_; }
Timestamp Agent::state_changed_at() const noexcept { return state_changed_at_; }
std::optional<Timestamp> Agent::blocked_since() const noexcept { return blocked_since_; }
std::size_t Agent::operations_count() const noexcept { return operations_count_; }

const std::set<ScopePath>& Agent::held_locks() const noexcept {
    return held_locks_;
}

bool Agent::holds(const ScopePath& scope_path) const {
    return held_locks_.count(scope_path) > 0;
}

Duration Agent::blocked_for(Timestamp now) const {
    if (state_ != AgentState::Blocked || !blocked_since_.has_value()) {
        return Duration::zero();
    }
    return std::max(now - *blocked_since_, Duration::zero());
}

void Agent::transition(AgentState to, Timestamp now) {
    if (state_ == AgentState::Blocked && to != AgentState::Blocked) {
        last_progress_at_ = now;
        blocked_since_.reset();
    }
    if (to == AgentState::Blocked) {
        blocked_since_ = now;
    }
    if (to == AgentState::Working) {
        ++operations_count_;
    }
    state_ = to;
    state_changed_at_ = now;
}

void Agent::set_held_locks(std::set<ScopePath> scopes) {
    held_locks_ = std::move(scopes);
}

const std::vector<std::pair<AgentState, AgentState>>& agent_transition_table() {
    static const std::vector<std::pair<AgentState, AgentState>> table = {
        {AgentState::Idle,      AgentState::Working},
        {AgentState::Working,   AgentState::Blocked},
        {AgentState::Working,   AgentState::Completed},
        {AgentState::Blocked,   AgentState::Working},
        {AgentState::Completed, AgentState::Idle},
    };
    return table;
}

bool is_valid_transition(AgentState from, AgentState to) noexcept {
    const auto& table = agent_transition_table();
    return std::find(table.begin(), table.end(), std::make_pair(from, to)) != table.end();
}

Agent make_agent_record(AgentId id, AgentState state, Timestamp since,
                        std::set<ScopePath> held_locks) {
    Agent agent(std::move(id), since);
    agent.state_ = state;
    if (state == AgentState::Blocked) {
        agent.blocked_since_ = since;
    }
    if (state == AgentState::Working) {
        agent.operations_count_ = 1;
    }
    agent.held_locks_ = std::move(held_locks);
    return agent;
}

} // namespace coordguard
