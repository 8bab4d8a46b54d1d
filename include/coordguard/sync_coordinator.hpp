#pragma once

#include "coordguard/types.hpp"
#include "coordguard/config.hpp"
#include "coordguard/history.hpp"

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace coordguard {

struct SyncOperation {
    ScopePath scope_path;
    SyncStatus status{SyncStatus::Idle};
    std::vector<ScopePath> dependencies;
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> completed_at;
    std::optional<std::string> error;      // set only when Failed
    std::size_t retry_count{0};            // restarts after Failed
};

struct SyncEvent {
    ScopePath scope_path;
    std::optional<SyncStatus> from;        // empty when the scope was declared
    std::optional<SyncStatus> to;          // empty when the scope was removed
    std::string reason;
    std::optional<std::string> error;
    Timestamp timestamp{};
};

// Per-scope sync status and the dependency graph between scopes.
// Dependencies are declared through declare_scope(), which rejects
// self-dependencies and cycles, so the graph is acyclic at all times.
// complete_sync() reports newly ready dependents but never starts them.
class SyncCoordinator {
public:
    explicit SyncCoordinator(const Config& config, TimeSource now = system_now);

    SyncCoordinator(const SyncCoordinator&) = delete;
    SyncCoordinator& operator=(const SyncCoordinator&) = delete;

    // ==================== Scope Declaration ====================

    SyncResult declare_scope(const ScopePath& scope_path,
                             std::vector<ScopePath> dependencies = {});
    SyncResult remove_scope(const ScopePath& scope_path);

    // ==================== Sync State Machine ====================

    SyncResult start_sync(const ScopePath& scope_path);
    SyncResult complete_sync(const ScopePath& scope_path);
    SyncResult fail_sync(const ScopePath& scope_path, std::string error);

    DependencyCheck check_dependencies(const ScopePath& scope_path) const;

    // ==================== Queries ====================

    bool contains(const ScopePath& scope_path) const;
    std::optional<SyncStatus> status(const ScopePath& scope_path) const;
    std::optional<SyncOperation> get(const ScopePath& scope_path) const;
    std::vector<ScopePath> dependencies(const ScopePath& scope_path) const;
    std::vector<ScopePath> dependents(const ScopePath& scope_path) const;
    // Every scope that depends on scope_path directly or indirectly
    std::vector<ScopePath> transitive_dependents(const ScopePath& scope_path) const;
    std::vector<ScopePath> scopes() const;
    std::vector<ScopePath> scopes_in(SyncStatus status) const;
    std::map<ScopePath, SyncOperation> table() const;
    SyncStatistics statistics() const;

    std::vector<SyncEvent> history() const;

    // ==================== Compensation ====================

    // Reinstate previously captured entries, replacing the current ones.
    void restore(const std::vector<SyncOperation>& operations);
    void erase(const ScopePath& scope_path);

private:
    std::size_t max_dependencies_;
    TimeSource now_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<ScopePath, SyncOperation> operations_;
    BoundedHistory<SyncEvent> history_;

    // Callers must hold mutex_ (shared or exclusive)
    DependencyCheck check_dependencies_locked(const SyncOperation& op) const;
    std::vector<ScopePath> dependents_locked(const ScopePath& scope_path) const;
    std::vector<ScopePath> transitive_dependents_locked(const ScopePath& scope_path) const;
    std::vector<ScopePath> find_cycle_with(const ScopePath& scope_path,
                                           const std::vector<ScopePath>& dependencies) const;

    // Caller must hold mutex_ exclusively
    void record(const ScopePath& scope_path, std::optional<SyncStatus> from,
                std::optional<SyncStatus> to, std::string reason,
                std::optional<std::string> error, Timestamp at);
};

} // namespace coordguard
