#include "coordguard/safety_violation.hpp"

#include <algorithm>
#include <chrono>

namespace coordguard {

namespace {

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

std::string format_duration(Duration d) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
    if (ms % 1000 == 0) {
        return std::to_string(ms / 1000) + "s";
    }
    return std::to_string(ms) + "ms";
}

} // anonymous namespace

ViolationKind SafetyViolation::kind() const noexcept {
    if (std::holds_alternative<ContextConsistencyDetail>(detail)) {
        return ViolationKind::ContextConsistency;
    }
    if (std::holds_alternative<DependencyIntegrityDetail>(detail)) {
        return ViolationKind::DependencyIntegrity;
    }
    if (std::holds_alternative<AgentCoordinationDetail>(detail)) {
        return ViolationKind::AgentCoordination;
    }
    return ViolationKind::LockConsistency;
}

bool SafetyViolation::same_condition(const SafetyViolation& other) const {
    return kind() == other.kind() &&
           subject == other.subject &&
           message == other.message;
}

SafetyViolation make_violation(ContextConsistencyDetail detail, Timestamp at) {
    SafetyViolation v;
    v.subject = detail.scope;
    if (detail.referenced_by == "lock") {
        v.message = "Lock references undeclared scope " + detail.scope;
    } else {
        v.message = "Scope " + detail.referenced_by +
                    " depends on undeclared scope " + detail.scope;
    }
    v.detected_at = at;
    v.detail = std::move(detail);
    return v;
}

SafetyViolation make_violation(DependencyIntegrityDetail detail, Timestamp at) {
    SafetyViolation v;
    v.subject = detail.scope;
    switch (detail.problem) {
        case DependencyProblem::Cycle:
            v.message = "Dependency cycle: " + join(detail.path, " -> ");
            break;
        case DependencyProblem::SelfDependency:
            v.message = "Scope " + detail.scope + " depends on itself";
            break;
        case DependencyProblem::TooManyDependencies:
            v.message = "Scope " + detail.scope + " declares " +
                        std::to_string(detail.path.size()) +
                        " dependencies (max " + std::to_string(detail.limit) + ")";
            break;
        case DependencyProblem::CompletedBeforeDependency:
            v.message = "Scope " + detail.scope +
                        " is Completed while dependencies are not: " +
                        join(detail.path, ", ");
            break;
    }
    v.detected_at = at;
    v.detail = std::move(detail);
    return v;
}

SafetyViolation make_violation(AgentCoordinationDetail detail, Duration max_block_time,
                               Timestamp at) {
    SafetyViolation v;
    v.subject = join(detail.agents, ",");
    switch (detail.problem) {
        case CoordinationProblem::BlockedTooLong:
            v.message = "Agent " + v.subject + " blocked longer than " +
                        format_duration(max_block_time);
            break;
        case CoordinationProblem::TooManyWorkingAgents:
            v.message = std::to_string(detail.working_agents) +
                        " agents working while holding locks (max " +
                        std::to_string(detail.limit) + "): " + v.subject;
            break;
    }
    v.detected_at = at;
    v.detail = std::move(detail);
    return v;
}

SafetyViolation make_violation(LockConsistencyDetail detail, Timestamp at) {
    SafetyViolation v;
    switch (detail.problem) {
        case LockProblem::LockLimitExceeded:
            v.subject = detail.holder;
            v.message = "Agent " + detail.holder + " holds " + std::to_string(detail.held) +
                        " locks (max " + std::to_string(detail.limit) + ")";
            break;
        case LockProblem::OrphanedLock:
            v.subject = detail.scope;
            v.message = "Lock on " + detail.scope + " held by unregistered agent " +
                        detail.holder;
            break;
        case LockProblem::ExpiredLock:
            v.subject = detail.scope;
            v.message = "Lock on " + detail.scope + " held by " + detail.holder +
                        " expired and was not reclaimed";
            break;
        case LockProblem::HolderMismatch:
            v.subject = detail.scope;
            v.message = "Agent " + detail.holder + " and the lock table disagree on " +
                        detail.scope;
            break;
    }
    v.detected_at = at;
    v.detail = std::move(detail);
    return v;
}

std::vector<SafetyViolation> introduced_violations(
    const std::vector<SafetyViolation>& before,
    const std::vector<SafetyViolation>& after)
{
    std::vector<SafetyViolation> introduced;
    for (const auto& v : after) {
        bool existed = std::any_of(before.begin(), before.end(),
            [&v](const SafetyViolation& b) { return b.same_condition(v); });
        if (!existed) {
            introduced.push_back(v);
        }
    }
    return introduced;
}

} // namespace coordguard
