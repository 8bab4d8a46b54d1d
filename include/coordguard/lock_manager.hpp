#pragma once

#include "coordguard/types.hpp"
#include "coordguard/config.hpp"
#include "coordguard/history.hpp"
#include "coordguard/safety_violation.hpp"

#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace coordguard {

struct Lock {
    ScopePath scope_path;
    std::optional<AgentId> holder;
    Timestamp acquired_at{};
    Timestamp expires_at{};

    bool is_held() const noexcept { return holder.has_value(); }
    bool is_expired(Timestamp now) const noexcept { return holder.has_value() && now > expires_at; }
};

enum class LockEventKind {
    Acquired,
    Renewed,
    Released,
    Expired,
    ForceReleased,
    RolledBack
};

struct LockEvent {
    LockEventKind kind{LockEventKind::Acquired};
    ScopePath scope_path;
    AgentId agent_id;
    Timestamp timestamp{};
};

inline const char* to_string(LockEventKind k) {
    switch (k) {
        case LockEventKind::Acquired:      return "Acquired";
        case LockEventKind::Renewed:       return "Renewed";
        case LockEventKind::Released:      return "Released";
        case LockEventKind::Expired:       return "Expired";
        case LockEventKind::ForceReleased: return "ForceReleased";
        case LockEventKind::RolledBack:    return "RolledBack";
    }
    return "Unknown";
}

// One OrphanedLock violation per held lock whose holder is not in live_agents.
std::vector<SafetyViolation> find_orphaned_locks(const std::map<ScopePath, Lock>& locks,
                                                 const std::vector<AgentId>& live_agents,
                                                 Timestamp now);

// Per-scope exclusive locks. Never blocks: acquire() answers immediately and
// leaves retry/backoff to the caller. Expiry is evaluated lazily by
// cleanup_expired(), which only the periodic sweep calls.
class LockManager {
public:
    explicit LockManager(const Config& config, TimeSource now = system_now);

    LockManager(const LockManager&) = delete;
    LockManager& operator=(const LockManager&) = delete;

    // ==================== Lock Operations ====================

    // false (no error) if another agent holds the scope. Re-acquiring a scope
    // the agent already holds extends its expiry.
    LockResult acquire(const ScopePath& scope_path, const AgentId& agent_id);
    LockResult release(const ScopePath& scope_path, const AgentId& agent_id);

    // Force-release everything the agent holds. Returns the released scopes.
    std::vector<ScopePath> release_all(const AgentId& agent_id);

    // Reclaims every lock past its expiry and returns the Expired events.
    std::vector<LockEvent> cleanup_expired();

    // One LockConsistency violation per lock whose holder is not live.
    std::vector<SafetyViolation> check_consistency(
        const std::vector<AgentId>& live_agents) const;

    // ==================== Queries ====================

    std::optional<Lock> get(const ScopePath& scope_path) const;
    std::optional<AgentId> holder(const ScopePath& scope_path) const;
    std::set<ScopePath> locks_held_by(const AgentId& agent_id) const;
    std::vector<Lock> active_locks() const;
    std::map<ScopePath, Lock> table() const;
    std::size_t lock_count() const;

    std::vector<LockEvent> history() const;

    // ==================== Compensation ====================

    // Reinstate a previously captured lock entry, replacing the current one.
    void restore(const Lock& lock);
    // Drop a lock entry without a release.
    void erase(const ScopePath& scope_path);

private:
    std::size_t max_locks_per_agent_;
    Duration lock_timeout_;
    TimeSource now_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<ScopePath, Lock> locks_;
    std::unordered_map<AgentId, std::set<ScopePath>> by_agent_;
    BoundedHistory<LockEvent> history_;

    // Caller must hold mutex_ exclusively
    void remove_entry(const ScopePath& scope_path, const AgentId& holder);
    void record(LockEventKind kind, const ScopePath& scope_path,
                const AgentId& agent_id, Timestamp at);
};

} // namespace coordguard
