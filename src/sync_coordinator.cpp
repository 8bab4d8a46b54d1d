#include "coordguard/sync_coordinator.hpp"

#include <algorithm>
#include <mutex>
#include <queue>
#include <unordered_set>

namespace coordguard {

SyncCoordinator::SyncCoordinator(const Config& config, TimeSource now)
    : max_dependencies_(config.max_dependencies_per_scope)
    , now_(std::move(now))
    , history_(config.sync_history_capacity)
{}

// ---------------------------------------------------------------------------
// Scope declaration
// ---------------------------------------------------------------------------

SyncResult SyncCoordinator::declare_scope(const ScopePath& scope_path,
                                          std::vector<ScopePath> dependencies) {
    // Collapse duplicates, keeping the first occurrence
    std::vector<ScopePath> deps;
    std::unordered_set<ScopePath> seen;
    for (auto& dep : dependencies) {
        if (seen.insert(dep).second) {
            deps.push_back(std::move(dep));
        }
    }

    std::unique_lock lock(mutex_);

    if (seen.count(scope_path)) {
        return {SyncError::SelfDependency, {scope_path}};
    }
    if (deps.size() > max_dependencies_) {
        return {SyncError::TooManyDependencies, deps};
    }

    std::vector<ScopePath> unknown;
    for (const auto& dep : deps) {
        if (operations_.find(dep) == operations_.end()) {
            unknown.push_back(dep);
        }
    }
    if (!unknown.empty()) {
        return {SyncError::UnknownScope, unknown};
    }

    auto existing = operations_.find(scope_path);
    if (existing != operations_.end() && existing->second.status == SyncStatus::Syncing) {
        return {SyncError::AlreadySyncing, {}};
    }

    if (auto cycle = find_cycle_with(scope_path, deps); !cycle.empty()) {
        return {SyncError::CyclicDependency, cycle};
    }

    Timestamp now = now_();

    if (existing == operations_.end()) {
        SyncOperation op;
        op.scope_path = scope_path;
        op.dependencies = std::move(deps);
        operations_.emplace(scope_path, std::move(op));
        record(scope_path, std::nullopt, SyncStatus::Idle, "Scope declared", std::nullopt, now);
        return {};
    }

    SyncOperation& op = existing->second;
    SyncOperation candidate = op;
    candidate.dependencies = deps;

    // A Completed scope whose new dependencies are not all Completed falls
    // back to Idle, along with everything Completed downstream of it.
    std::vector<ScopePath> invalidated;
    if (op.status == SyncStatus::Completed && !check_dependencies_locked(candidate).ready) {
        auto downstream = transitive_dependents_locked(scope_path);
        std::vector<ScopePath> syncing;
        for (const auto& d : downstream) {
            if (operations_.at(d).status == SyncStatus::Syncing) {
                syncing.push_back(d);
            }
        }
        if (!syncing.empty()) {
            return {SyncError::DependentSyncing, syncing};
        }

        invalidated.push_back(scope_path);
        for (const auto& d : downstream) {
            if (operations_.at(d).status == SyncStatus::Completed) {
                invalidated.push_back(d);
            }
        }
    }

    op.dependencies = std::move(deps);
    record(scope_path, op.status, op.status, "Dependencies redeclared", std::nullopt, now);

    for (const auto& s : invalidated) {
        SyncOperation& target = operations_.at(s);
        target.status = SyncStatus::Idle;
        target.completed_at.reset();
        record(s, SyncStatus::Completed, SyncStatus::Idle,
               "Invalidated by redeclaration of " + scope_path, std::nullopt, now);
    }

    return {std::nullopt, invalidated};
}

SyncResult SyncCoordinator::remove_scope(const ScopePath& scope_path) {
    std::unique_lock lock(mutex_);

    auto it = operations_.find(scope_path);
    if (it == operations_.end()) {
        return {SyncError::UnknownScope, {}};
    }
    if (it->second.status == SyncStatus::Syncing) {
        return {SyncError::AlreadySyncing, {}};
    }

    std::vector<ScopePath> affected = dependents_locked(scope_path);
    for (const auto& dependent : affected) {
        auto& deps = operations_.at(dependent).dependencies;
        deps.erase(std::remove(deps.begin(), deps.end(), scope_path), deps.end());
    }

    SyncStatus last = it->second.status;
    operations_.erase(it);
    record(scope_path, last, std::nullopt, "Scope removed", std::nullopt, now_());
    return {std::nullopt, affected};
}

// ---------------------------------------------------------------------------
// Sync state machine
// ---------------------------------------------------------------------------

SyncResult SyncCoordinator::start_sync(const ScopePath& scope_path) {
    std::unique_lock lock(mutex_);

    auto it = operations_.find(scope_path);
    if (it == operations_.end()) {
        return {SyncError::UnknownScope, {}};
    }
    SyncOperation& op = it->second;

    if (op.status == SyncStatus::Syncing) {
        return {SyncError::AlreadySyncing, {}};
    }

    auto check = check_dependencies_locked(op);
    if (!check.ready) {
        return {SyncError::DependencyNotReady, check.unmet};
    }

    Timestamp now = now_();

    // Re-syncing a Completed scope invalidates whatever was built on it
    std::vector<ScopePath> invalidated;
    if (op.status == SyncStatus::Completed) {
        auto downstream = transitive_dependents_locked(scope_path);
        std::vector<ScopePath> syncing;
        for (const auto& d : downstream) {
            if (operations_.at(d).status == SyncStatus::Syncing) {
                syncing.push_back(d);
            }
        }
        if (!syncing.empty()) {
            return {SyncError::DependentSyncing, syncing};
        }

        for (const auto& d : downstream) {
            SyncOperation& target = operations_.at(d);
            if (target.status != SyncStatus::Completed) {
                continue;
            }
            target.status = SyncStatus::Idle;
            target.completed_at.reset();
            invalidated.push_back(d);
            record(d, SyncStatus::Completed, SyncStatus::Idle,
                   "Invalidated by re-sync of " + scope_path, std::nullopt, now);
        }
    }

    SyncStatus from = op.status;
    if (from == SyncStatus::Failed) {
        op.error.reset();
        ++op.retry_count;
    }
    op.status = SyncStatus::Syncing;
    op.started_at = now;
    op.completed_at.reset();

    record(scope_path, from, SyncStatus::Syncing,
           from == SyncStatus::Failed ? "Sync retried" : "Sync started", std::nullopt, now);
    return {std::nullopt, invalidated};
}

SyncResult SyncCoordinator::complete_sync(const ScopePath& scope_path) {
    std::unique_lock lock(mutex_);

    auto it = operations_.find(scope_path);
    if (it == operations_.end()) {
        return {SyncError::UnknownScope, {}};
    }
    SyncOperation& op = it->second;
    if (op.status != SyncStatus::Syncing) {
        return {SyncError::InvalidTransition, {}};
    }

    Timestamp now = now_();
    op.status = SyncStatus::Completed;
    op.completed_at = now;
    record(scope_path, SyncStatus::Syncing, SyncStatus::Completed, "Sync completed",
           std::nullopt, now);

    std::vector<ScopePath> ready;
    for (const auto& dependent : dependents_locked(scope_path)) {
        const SyncOperation& d = operations_.at(dependent);
        if ((d.status == SyncStatus::Idle || d.status == SyncStatus::Failed) &&
            check_dependencies_locked(d).ready) {
            ready.push_back(dependent);
        }
    }
    return {std::nullopt, ready};
}

SyncResult SyncCoordinator::fail_sync(const ScopePath& scope_path, std::string error) {
    std::unique_lock lock(mutex_);

    auto it = operations_.find(scope_path);
    if (it == operations_.end()) {
        return {SyncError::UnknownScope, {}};
    }
    SyncOperation& op = it->second;
    if (op.status != SyncStatus::Syncing) {
        return {SyncError::InvalidTransition, {}};
    }

    Timestamp now = now_();
    op.status = SyncStatus::Failed;
    op.error = error;
    record(scope_path, SyncStatus::Syncing, SyncStatus::Failed, "Sync failed",
           std::move(error), now);
    return {};
}

DependencyCheck SyncCoordinator::check_dependencies(const ScopePath& scope_path) const {
    std::shared_lock lock(mutex_);
    auto it = operations_.find(scope_path);
    if (it == operations_.end()) {
        // Undeclared scopes are never ready
        return {false, {}};
    }
    return check_dependencies_locked(it->second);
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

bool SyncCoordinator::contains(const ScopePath& scope_path) const {
    std::shared_lock lock(mutex_);
    return operations_.count(scope_path) > 0;
}

std::optional<SyncStatus> SyncCoordinator::status(const ScopePath& scope_path) const {
    std::shared_lock lock(mutex_);
    auto it = operations_.find(scope_path);
    if (it == operations_.end()) {
        return std::nullopt;
    }
    return it->second.status;
}

std::optional<SyncOperation> SyncCoordinator::get(const ScopePath& scope_path) const {
    std::shared_lock lock(mutex_);
    auto it = operations_.find(scope_path);
    if (it == operations_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ScopePath> SyncCoordinator::dependencies(const ScopePath& scope_path) const {
    std::shared_lock lock(mutex_);
    auto it = operations_.find(scope_path);
    if (it == operations_.end()) {
        return {};
    }
    return it->second.dependencies;
}

std::vector<ScopePath> SyncCoordinator::dependents(const ScopePath& scope_path) const {
    std::shared_lock lock(mutex_);
    return dependents_locked(scope_path);
}

std::vector<ScopePath> SyncCoordinator::transitive_dependents(
    const ScopePath& scope_path) const {
    std::shared_lock lock(mutex_);
    return transitive_dependents_locked(scope_path);
}

std::vector<ScopePath> SyncCoordinator::scopes() const {
    std::shared_lock lock(mutex_);
    std::vector<ScopePath> result;
    result.reserve(operations_.size());
    for (const auto& [scope, op] : operations_) {
        result.push_back(scope);
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<ScopePath> SyncCoordinator::scopes_in(SyncStatus status) const {
    std::shared_lock lock(mutex_);
    std::vector<ScopePath> result;
    for (const auto& [scope, op] : operations_) {
        if (op.status == status) {
            result.push_back(scope);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::map<ScopePath, SyncOperation> SyncCoordinator::table() const {
    std::shared_lock lock(mutex_);
    return std::map<ScopePath, SyncOperation>(operations_.begin(), operations_.end());
}

SyncStatistics SyncCoordinator::statistics() const {
    std::shared_lock lock(mutex_);
    SyncStatistics stats;
    stats.total_scopes = operations_.size();
    for (const auto& [scope, op] : operations_) {
        switch (op.status) {
            case SyncStatus::Idle:      ++stats.idle; break;
            case SyncStatus::Syncing:   ++stats.syncing; break;
            case SyncStatus::Completed: ++stats.completed; break;
            case SyncStatus::Failed:    ++stats.failed; break;
        }
    }
    return stats;
}

std::vector<SyncEvent> SyncCoordinator::history() const {
    std::shared_lock lock(mutex_);
    return history_.snapshot();
}

// ---------------------------------------------------------------------------
// Compensation
// ---------------------------------------------------------------------------

void SyncCoordinator::restore(const std::vector<SyncOperation>& operations) {
    std::unique_lock lock(mutex_);
    Timestamp now = now_();
    for (const auto& op : operations) {
        std::optional<SyncStatus> from;
        if (auto it = operations_.find(op.scope_path); it != operations_.end()) {
            from = it->second.status;
        }
        operations_[op.scope_path] = op;
        record(op.scope_path, from, op.status, "Rolled back", std::nullopt, now);
    }
}

void SyncCoordinator::erase(const ScopePath& scope_path) {
    std::unique_lock lock(mutex_);
    auto it = operations_.find(scope_path);
    if (it == operations_.end()) {
        return;
    }
    SyncStatus last = it->second.status;
    operations_.erase(it);
    record(scope_path, last, std::nullopt, "Rolled back", std::nullopt, now_());
}

// ---------------------------------------------------------------------------
// Graph helpers
// ---------------------------------------------------------------------------

DependencyCheck SyncCoordinator::check_dependencies_locked(const SyncOperation& op) const {
    DependencyCheck check;
    for (const auto& dep : op.dependencies) {
        auto it = operations_.find(dep);
        if (it == operations_.end() || it->second.status != SyncStatus::Completed) {
            check.unmet.push_back(dep);
        }
    }
    check.ready = check.unmet.empty();
    return check;
}

std::vector<ScopePath> SyncCoordinator::dependents_locked(const ScopePath& scope_path) const {
    std::vector<ScopePath> result;
    for (const auto& [scope, op] : operations_) {
        if (std::find(op.dependencies.begin(), op.dependencies.end(), scope_path) !=
            op.dependencies.end()) {
            result.push_back(scope);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<ScopePath> SyncCoordinator::transitive_dependents_locked(
    const ScopePath& scope_path) const {
    std::unordered_set<ScopePath> visited;
    std::queue<ScopePath> queue;
    queue.push(scope_path);

    while (!queue.empty()) {
        ScopePath current = queue.front();
        queue.pop();
        for (auto& dependent : dependents_locked(current)) {
            if (dependent != scope_path && visited.insert(dependent).second) {
                queue.push(std::move(dependent));
            }
        }
    }

    std::vector<ScopePath> result(visited.begin(), visited.end());
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<ScopePath> SyncCoordinator::find_cycle_with(
    const ScopePath& scope_path, const std::vector<ScopePath>& dependencies) const {
    // With edges scope_path -> dependencies in place, a cycle exists iff some
    // dependency reaches scope_path again. BFS from each dependency.
    for (const auto& start : dependencies) {
        std::queue<ScopePath> queue;
        std::unordered_set<ScopePath> visited;
        std::unordered_map<ScopePath, ScopePath> parent;

        queue.push(start);
        visited.insert(start);

        while (!queue.empty()) {
            ScopePath current = queue.front();
            queue.pop();

            auto it = operations_.find(current);
            if (it == operations_.end()) {
                continue;
            }

            for (const auto& next : it->second.dependencies) {
                if (next == scope_path) {
                    // Path: scope_path -> start -> ... -> current -> scope_path
                    std::vector<ScopePath> segment;
                    ScopePath node = current;
                    while (node != start) {
                        segment.push_back(node);
                        node = parent.at(node);
                    }
                    segment.push_back(start);
                    std::reverse(segment.begin(), segment.end());

                    std::vector<ScopePath> path;
                    path.push_back(scope_path);
                    path.insert(path.end(), segment.begin(), segment.end());
                    path.push_back(scope_path);
                    return path;
                }
                if (visited.insert(next).second) {
                    parent[next] = current;
                    queue.push(next);
                }
            }
        }
    }
    return {};
}

void SyncCoordinator::record(const ScopePath& scope_path, std::optional<SyncStatus> from,
                             std::optional<SyncStatus> to, std::string reason,
                             std::optional<std::string> error, Timestamp at) {
    history_.push(SyncEvent{scope_path, from, to, std::move(reason), std::move(error), at});
}

} // namespace coordguard
