#include "coordguard/safety_validator.hpp"
#include "coordguard/agent_manager.hpp"

#include <algorithm>
#include <iterator>
#include <unordered_map>
#include <unordered_set>

namespace coordguard {

namespace {

// Every elementary cycle reachable through a back edge, each reported once
// as [n0, n1, ..., n0]. Edges to undeclared scopes and self-loops are
// skipped; both are reported by other checks.
std::vector<std::vector<ScopePath>> find_cycles(
    const std::map<ScopePath, SyncOperation>& scopes) {
    enum Color { White = 0, Gray = 1, Black = 2 };

    struct DfsFrame {
        ScopePath node;
        std::vector<ScopePath> neighbors;
        std::size_t next_idx;
    };

    auto neighbors_of = [&scopes](const ScopePath& node) {
        std::vector<ScopePath> out;
        auto it = scopes.find(node);
        if (it == scopes.end()) return out;
        for (const auto& dep : it->second.dependencies) {
            if (dep != node && scopes.count(dep)) {
                out.push_back(dep);
            }
        }
        return out;
    };

    std::unordered_map<ScopePath, Color> color;
    std::vector<std::vector<ScopePath>> cycles;

    for (const auto& [start, op] : scopes) {
        if (color[start] != White) {
            continue;
        }

        std::vector<DfsFrame> stk;
        color[start] = Gray;
        stk.push_back(DfsFrame{start, neighbors_of(start), 0});

        while (!stk.empty()) {
            auto& frame = stk.back();

            if (frame.next_idx < frame.neighbors.size()) {
                ScopePath neighbor = frame.neighbors[frame.next_idx];
                frame.next_idx++;

                if (color[neighbor] == Gray) {
                    // Back edge: the cycle is the stack suffix starting at neighbor
                    std::vector<ScopePath> cycle;
                    bool in_cycle = false;
                    for (const auto& f : stk) {
                        if (f.node == neighbor) in_cycle = true;
                        if (in_cycle) cycle.push_back(f.node);
                    }
                    cycle.push_back(neighbor);
                    cycles.push_back(std::move(cycle));
                } else if (color[neighbor] == White) {
                    color[neighbor] = Gray;
                    stk.push_back(DfsFrame{neighbor, neighbors_of(neighbor), 0});
                }
            } else {
                color[frame.node] = Black;
                stk.pop_back();
            }
        }
    }
    return cycles;
}

} // anonymous namespace

SafetyValidator::SafetyValidator(const Config& config)
    : max_concurrent_agents_(config.max_concurrent_agents)
    , max_block_time_(config.max_block_time)
    , max_locks_per_agent_(config.max_locks_per_agent)
    , max_dependencies_per_scope_(config.max_dependencies_per_scope)
{}

std::vector<SafetyViolation> SafetyValidator::validate(
    const CoordinationSnapshot& snapshot) const {
    std::vector<SafetyViolation> all;
    auto append = [&all](std::vector<SafetyViolation> found) {
        all.insert(all.end(), std::make_move_iterator(found.begin()),
                   std::make_move_iterator(found.end()));
    };
    append(check_context_consistency(snapshot));
    append(check_dependency_integrity(snapshot));
    append(check_agent_coordination(snapshot));
    append(check_lock_consistency(snapshot));
    return all;
}

// ---------------------------------------------------------------------------
// Context consistency
// ---------------------------------------------------------------------------

std::vector<SafetyViolation> SafetyValidator::check_context_consistency(
    const CoordinationSnapshot& snapshot) const {
    std::vector<SafetyViolation> violations;

    for (const auto& [scope, lock] : snapshot.locks) {
        if (!snapshot.scopes.count(scope)) {
            violations.push_back(make_violation(
                ContextConsistencyDetail{scope, "lock"}, snapshot.taken_at));
        }
    }

    for (const auto& [scope, op] : snapshot.scopes) {
        for (const auto& dep : op.dependencies) {
            if (!snapshot.scopes.count(dep)) {
                violations.push_back(make_violation(
                    ContextConsistencyDetail{dep, scope}, snapshot.taken_at));
            }
        }
    }
    return violations;
}

// ---------------------------------------------------------------------------
// Dependency integrity
// ---------------------------------------------------------------------------

std::vector<SafetyViolation> SafetyValidator::check_dependency_integrity(
    const CoordinationSnapshot& snapshot) const {
    std::vector<SafetyViolation> violations;

    for (const auto& [scope, op] : snapshot.scopes) {
        const auto& deps = op.dependencies;

        if (std::find(deps.begin(), deps.end(), scope) != deps.end()) {
            DependencyIntegrityDetail detail;
            detail.problem = DependencyProblem::SelfDependency;
            detail.scope = scope;
            detail.path = {scope, scope};
            violations.push_back(make_violation(std::move(detail), snapshot.taken_at));
        }

        if (deps.size() > max_dependencies_per_scope_) {
            DependencyIntegrityDetail detail;
            detail.problem = DependencyProblem::TooManyDependencies;
            detail.scope = scope;
            detail.path = deps;
            detail.limit = max_dependencies_per_scope_;
            violations.push_back(make_violation(std::move(detail), snapshot.taken_at));
        }

        if (op.status == SyncStatus::Completed) {
            std::vector<ScopePath> unmet;
            for (const auto& dep : deps) {
                auto it = snapshot.scopes.find(dep);
                if (it == snapshot.scopes.end() || it->second.status != SyncStatus::Completed) {
                    unmet.push_back(dep);
                }
            }
            if (!unmet.empty()) {
                DependencyIntegrityDetail detail;
                detail.problem = DependencyProblem::CompletedBeforeDependency;
                detail.scope = scope;
                detail.path = std::move(unmet);
                violations.push_back(make_violation(std::move(detail), snapshot.taken_at));
            }
        }
    }

    for (auto& cycle : find_cycles(snapshot.scopes)) {
        DependencyIntegrityDetail detail;
        detail.problem = DependencyProblem::Cycle;
        detail.scope = cycle.front();
        detail.path = std::move(cycle);
        violations.push_back(make_violation(std::move(detail), snapshot.taken_at));
    }
    return violations;
}

// ---------------------------------------------------------------------------
// Agent coordination
// ---------------------------------------------------------------------------

std::vector<SafetyViolation> SafetyValidator::check_agent_coordination(
    const CoordinationSnapshot& snapshot) const {
    auto violations = check_blocked_agents(snapshot.agents, max_block_time_, snapshot.taken_at);

    std::unordered_set<AgentId> holders;
    for (const auto& [scope, lock] : snapshot.locks) {
        if (lock.holder) {
            holders.insert(*lock.holder);
        }
    }

    std::vector<AgentId> working;
    for (const auto& agent : snapshot.agents) {
        if (agent.state() == AgentState::Working && holders.count(agent.id())) {
            working.push_back(agent.id());
        }
    }

    if (working.size() > max_concurrent_agents_) {
        std::sort(working.begin(), working.end());
        AgentCoordinationDetail detail;
        detail.problem = CoordinationProblem::TooManyWorkingAgents;
        detail.working_agents = working.size();
        detail.limit = max_concurrent_agents_;
        detail.agents = std::move(working);
        violations.push_back(make_violation(std::move(detail), max_block_time_,
                                            snapshot.taken_at));
    }
    return violations;
}

// ---------------------------------------------------------------------------
// Lock consistency
// ---------------------------------------------------------------------------

std::vector<SafetyViolation> SafetyValidator::check_lock_consistency(
    const CoordinationSnapshot& snapshot) const {
    std::vector<AgentId> live;
    live.reserve(snapshot.agents.size());
    for (const auto& agent : snapshot.agents) {
        live.push_back(agent.id());
    }

    std::vector<SafetyViolation> violations;

    std::map<AgentId, std::size_t> held_counts;
    for (const auto& [scope, lock] : snapshot.locks) {
        if (lock.holder) {
            ++held_counts[*lock.holder];
        }
    }
    for (const auto& [holder, held] : held_counts) {
        if (held > max_locks_per_agent_) {
            LockConsistencyDetail detail;
            detail.problem = LockProblem::LockLimitExceeded;
            detail.holder = holder;
            detail.held = held;
            detail.limit = max_locks_per_agent_;
            violations.push_back(make_violation(std::move(detail), snapshot.taken_at));
        }
    }

    auto orphaned = find_orphaned_locks(snapshot.locks, live, snapshot.taken_at);
    violations.insert(violations.end(), orphaned.begin(), orphaned.end());

    for (const auto& [scope, lock] : snapshot.locks) {
        if (lock.is_expired(snapshot.taken_at)) {
            LockConsistencyDetail detail;
            detail.problem = LockProblem::ExpiredLock;
            detail.scope = scope;
            detail.holder = *lock.holder;
            violations.push_back(make_violation(std::move(detail), snapshot.taken_at));
        }
    }

    // Both directions: an agent claiming a lock the table gives to someone
    // else (or nobody), and a live holder that does not list its lock.
    for (const auto& agent : snapshot.agents) {
        for (const auto& scope : agent.held_locks()) {
            auto it = snapshot.locks.find(scope);
            if (it == snapshot.locks.end() || it->second.holder != agent.id()) {
                LockConsistencyDetail detail;
                detail.problem = LockProblem::HolderMismatch;
                detail.scope = scope;
                detail.holder = agent.id();
                violations.push_back(make_violation(std::move(detail), snapshot.taken_at));
            }
        }
    }
    for (const auto& [scope, lock] : snapshot.locks) {
        if (!lock.holder) {
            continue;
        }
        auto agent = std::find_if(snapshot.agents.begin(), snapshot.agents.end(),
            [&lock](const Agent& a) { return a.id() == *lock.holder; });
        if (agent != snapshot.agents.end() && !agent->holds(scope)) {
            LockConsistencyDetail detail;
            detail.problem = LockProblem::HolderMismatch;
            detail.scope = scope;
            detail.holder = *lock.holder;
            violations.push_back(make_violation(std::move(detail), snapshot.taken_at));
        }
    }
    return violations;
}

} // namespace coordguard
