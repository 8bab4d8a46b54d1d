#pragma once

#include "coordguard/types.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace coordguard {

enum class DependencyProblem {
    Cycle,
    SelfDependency,
    TooManyDependencies,
    CompletedBeforeDependency
};

enum class CoordinationProblem {
    BlockedTooLong,
    TooManyWorkingAgents
};

enum class LockProblem {
    LockLimitExceeded,
    OrphanedLock,
    ExpiredLock,
    HolderMismatch
};

// A lock or a dependency list names a scope that is not declared.
struct ContextConsistencyDetail {
    ScopePath scope;
    std::string referenced_by;   // "lock" or the dependent scope
};

struct DependencyIntegrityDetail {
    DependencyProblem problem{DependencyProblem::Cycle};
    ScopePath scope;
    std::vector<ScopePath> path;  // cycle path, or the offending dependencies
    std::size_t limit{0};
};

struct AgentCoordinationDetail {
    CoordinationProblem problem{CoordinationProblem::BlockedTooLong};
    std::vector<AgentId> agents;
    Duration blocked_for{};
    std::size_t working_agents{0};
    std::size_t limit{0};
};

struct LockConsistencyDetail {
    LockProblem problem{LockProblem::OrphanedLock};
    ScopePath scope;
    AgentId holder;
    std::size_t held{0};
    std::size_t limit{0};
};

using ViolationDetail = std::variant<ContextConsistencyDetail,
                                     DependencyIntegrityDetail,
                                     AgentCoordinationDetail,
                                     LockConsistencyDetail>;

// A reportable breach of a safety invariant. The detail alternative
// determines the kind.
struct SafetyViolation {
    ViolationDetail detail;
    std::string message;
    std::string subject;       // agent id or scope path
    Timestamp detected_at{};

    ViolationKind kind() const noexcept;

    // Same invariant, same subject, same description (ignores detected_at)
    bool same_condition(const SafetyViolation& other) const;
};

inline const char* to_string(DependencyProblem p) {
    switch (p) {
        case DependencyProblem::Cycle:                     return "Cycle";
        case DependencyProblem::SelfDependency:            return "SelfDependency";
        case DependencyProblem::TooManyDependencies:       return "TooManyDependencies";
        case DependencyProblem::CompletedBeforeDependency: return "CompletedBeforeDependency";
    }
    return "Unknown";
}

inline const char* to_string(CoordinationProblem p) {
    switch (p) {
        case CoordinationProblem::BlockedTooLong:       return "BlockedTooLong";
        case CoordinationProblem::TooManyWorkingAgents: return "TooManyWorkingAgents";
    }
    return "Unknown";
}

inline const char* to_string(LockProblem p) {
    switch (p) {
        case LockProblem::LockLimitExceeded: return "LockLimitExceeded";
        case LockProblem::OrphanedLock:      return "OrphanedLock";
        case LockProblem::ExpiredLock:       return "ExpiredLock";
        case LockProblem::HolderMismatch:    return "HolderMismatch";
    }
    return "Unknown";
}

// Factories keep kind, subject and message consistent with the payload.
SafetyViolation make_violation(ContextConsistencyDetail detail, Timestamp at);
SafetyViolation make_violation(DependencyIntegrityDetail detail, Timestamp at);
SafetyViolation make_violation(AgentCoordinationDetail detail, Duration max_block_time, Timestamp at);
SafetyViolation make_violation(LockConsistencyDetail detail, Timestamp at);

// Violations in `after` that have no matching condition in `before`.
std::vector<SafetyViolation> introduced_violations(
    const std::vector<SafetyViolation>& before,
    const std::vector<SafetyViolation>& after);

} // namespace coordguard
