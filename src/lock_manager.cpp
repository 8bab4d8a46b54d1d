#include "coordguard/lock_manager.hpp"

#include <algorithm>
#include <mutex>
#include <unordered_set>

namespace coordguard {

std::vector<SafetyViolation> find_orphaned_locks(const std::map<ScopePath, Lock>& locks,
                                                 const std::vector<AgentId>& live_agents,
                                                 Timestamp now) {
    std::unordered_set<AgentId> live(live_agents.begin(), live_agents.end());
    std::vector<SafetyViolation> violations;
    for (const auto& [scope, lock] : locks) {
        if (!lock.holder.has_value() || live.count(*lock.holder)) {
            continue;
        }
        LockConsistencyDetail detail;
        detail.problem = LockProblem::OrphanedLock;
        detail.scope = scope;
        detail.holder = *lock.holder;
        violations.push_back(make_violation(std::move(detail), now));
    }
    return violations;
}

LockManager::LockManager(const Config& config, TimeSource now)
    : max_locks_per_agent_(config.max_locks_per_agent)
    , lock_timeout_(config.lock_timeout)
    , now_(std::move(now))
    , history_(config.lock_history_capacity)
{}

// ---------------------------------------------------------------------------
// Lock operations
// ---------------------------------------------------------------------------

LockResult LockManager::acquire(const ScopePath& scope_path, const AgentId& agent_id) {
    std::unique_lock lock(mutex_);
    Timestamp now = now_();

    if (auto it = locks_.find(scope_path); it != locks_.end()) {
        if (it->second.holder != agent_id) {
            return {false, std::nullopt};
        }
        it->second.expires_at = now + lock_timeout_;
        record(LockEventKind::Renewed, scope_path, agent_id, now);
        return {true, std::nullopt};
    }

    std::size_t held = 0;
    if (auto it = by_agent_.find(agent_id); it != by_agent_.end()) {
        held = it->second.size();
    }
    if (held >= max_locks_per_agent_) {
        return {false, LockError::LockLimitExceeded};
    }

    locks_.emplace(scope_path, Lock{scope_path, agent_id, now, now + lock_timeout_});
    by_agent_[agent_id].insert(scope_path);
    record(LockEventKind::Acquired, scope_path, agent_id, now);
    return {true, std::nullopt};
}

LockResult LockManager::release(const ScopePath& scope_path, const AgentId& agent_id) {
    std::unique_lock lock(mutex_);

    auto it = locks_.find(scope_path);
    if (it == locks_.end() || it->second.holder != agent_id) {
        return {false, LockError::NotHolder};
    }

    remove_entry(scope_path, agent_id);
    record(LockEventKind::Released, scope_path, agent_id, now_());
    return {false, std::nullopt};
}

std::vector<ScopePath> LockManager::release_all(const AgentId& agent_id) {
    std::unique_lock lock(mutex_);

    auto it = by_agent_.find(agent_id);
    if (it == by_agent_.end()) {
        return {};
    }

    std::vector<ScopePath> released(it->second.begin(), it->second.end());
    by_agent_.erase(it);

    Timestamp now = now_();
    for (const auto& scope : released) {
        locks_.erase(scope);
        record(LockEventKind::ForceReleased, scope, agent_id, now);
    }
    return released;
}

std::vector<LockEvent> LockManager::cleanup_expired() {
    std::unique_lock lock(mutex_);
    Timestamp now = now_();

    std::vector<std::pair<ScopePath, AgentId>> expired;
    for (const auto& [scope, entry] : locks_) {
        if (entry.is_expired(now)) {
            expired.emplace_back(scope, *entry.holder);
        }
    }
    std::sort(expired.begin(), expired.end());

    std::vector<LockEvent> events;
    events.reserve(expired.size());
    for (const auto& [scope, holder] : expired) {
        remove_entry(scope, holder);
        record(LockEventKind::Expired, scope, holder, now);
        events.push_back(LockEvent{LockEventKind::Expired, scope, holder, now});
    }
    return events;
}

std::vector<SafetyViolation> LockManager::check_consistency(
    const std::vector<AgentId>& live_agents) const {
    return find_orphaned_locks(table(), live_agents, now_());
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

std::optional<Lock> LockManager::get(const ScopePath& scope_path) const {
    std::shared_lock lock(mutex_);
    auto it = locks_.find(scope_path);
    if (it == locks_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<AgentId> LockManager::holder(const ScopePath& scope_path) const {
    std::shared_lock lock(mutex_);
    auto it = locks_.find(scope_path);
    if (it == locks_.end()) {
        return std::nullopt;
    }
    return it->second.holder;
}

std::set<ScopePath> LockManager::locks_held_by(const AgentId& agent_id) const {
    std::shared_lock lock(mutex_);
    auto it = by_agent_.find(agent_id);
    if (it == by_agent_.end()) {
        return {};
    }
    return it->second;
}

std::vector<Lock> LockManager::active_locks() const {
    std::vector<Lock> result;
    for (auto& [scope, entry] : table()) {
        result.push_back(std::move(entry));
    }
    return result;
}

std::map<ScopePath, Lock> LockManager::table() const {
    std::shared_lock lock(mutex_);
    return std::map<ScopePath, Lock>(locks_.begin(), locks_.end());
}

std::size_t LockManager::lock_count() const {
    std::shared_lock lock(mutex_);
    return locks_.size();
}

std::vector<LockEvent> LockManager::history() const {
    std::shared_lock lock(mutex_);
    return history_.snapshot();
}

// ---------------------------------------------------------------------------
// Compensation
// ---------------------------------------------------------------------------

void LockManager::restore(const Lock& entry) {
    std::unique_lock lock(mutex_);

    if (auto it = locks_.find(entry.scope_path); it != locks_.end() && it->second.holder) {
        remove_entry(entry.scope_path, *it->second.holder);
    }
    if (!entry.holder.has_value()) {
        locks_.erase(entry.scope_path);
        return;
    }

    locks_[entry.scope_path] = entry;
    by_agent_[*entry.holder].insert(entry.scope_path);
    record(LockEventKind::RolledBack, entry.scope_path, *entry.holder, now_());
}

void LockManager::erase(const ScopePath& scope_path) {
    std::unique_lock lock(mutex_);

    auto it = locks_.find(scope_path);
    if (it == locks_.end()) {
        return;
    }
    AgentId holder = it->second.holder.value_or(AgentId{});
    remove_entry(scope_path, holder);
    record(LockEventKind::RolledBack, scope_path, holder, now_());
}

// ---------------------------------------------------------------------------
// Internal helpers
// ---------------------------------------------------------------------------

void LockManager::remove_entry(const ScopePath& scope_path, const AgentId& holder) {
    locks_.erase(scope_path);
    if (auto it = by_agent_.find(holder); it != by_agent_.end()) {
        it->second.erase(scope_path);
        if (it->second.empty()) {
            by_agent_.erase(it);
        }
    }
}

void LockManager::record(LockEventKind kind, const ScopePath& scope_path,
                         const AgentId& agent_id, Timestamp at) {
    history_.push(LockEvent{kind, scope_path, agent_id, at});
}

} // namespace coordguard
