#pragma once

#include "coordguard/types.hpp"

#include <optional>
#include <set>
#include <utility>
#include <vector>

namespace coordguard {

class Agent;
class AgentManager;

// Builds a detached agent record in a given state, e.g. for validator input.
// `since` is used as join time and as the time the state was entered.
Agent make_agent_record(AgentId id, AgentState state, Timestamp since,
                        std::set<ScopePath> held_locks = {});

class Agent {
public:
    Agent(AgentId id, Timestamp joined_at);

    const AgentId& id() const noexcept;
    AgentState state() const noexcept;

    Timestamp joined_at() const noexcept;
    Timestamp last_progress_at() const noexcept;
    Timestamp state_changed_at() const noexcept;
    std::optional<Timestamp> blocked_since() const noexcept;

    // Number of times the agent entered Working
    std::size_t operations_count() const noexcept;

    // Populated from the lock table whenever the agent is read through
    // AgentManager.
    const std::set<ScopePath>& held_locks() const noexcept;
    bool holds(const ScopePath& scope_path) const;

    // Zero unless Blocked
    Duration blocked_for(Timestamp now) const;

private:
    AgentId     id_;
    AgentState  state_{AgentState::Idle};
    Timestamp   joined_at_;
    Timestamp   last_progress_at_;
    Timestamp   state_changed_at_;
    std::optional<Timestamp> blocked_since_;
    std::size_t operations_count_{0};
    std::set<ScopePath> held_locks_;

    void transition(AgentState to, Timestamp now);
    void set_held_locks(std::set<ScopePath> scopes);

    friend class AgentManager;
    friend Agent make_agent_record(AgentId, AgentState, Timestamp, std::set<ScopePath>);
};

// Legal agent transitions:
//   Idle -> Working, Working -> Blocked, Working -> Completed,
//   Blocked -> Working, Completed -> Idle
const std::vector<std::pair<AgentState, AgentState>>& agent_transition_table();
bool is_valid_transition(AgentState from, AgentState to) noexcept;

} // namespace coordguard
