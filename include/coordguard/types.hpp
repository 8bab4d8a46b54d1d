#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace coordguard {

// Identifiers
using AgentId = std::string;
using ScopePath = std::string;

// Time types (wall clock; injectable through TimeSource)
using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;
using Duration = Clock::duration;
using TimeSource = std::function<Timestamp()>;

inline Timestamp system_now() { return Clock::now(); }

// Agent lifecycle state
enum class AgentState {
    Idle,
    Working,
    Blocked,
    Completed
};

// Per-scope sync status
enum class SyncStatus {
    Idle,
    Syncing,
    Completed,
    Failed
};

// Safety invariant families
enum class ViolationKind {
    ContextConsistency,
    DependencyIntegrity,
    AgentCoordination,
    LockConsistency
};

// Operation errors
enum class AgentError {
    AlreadyJoined,
    UnknownAgent,
    InvalidTransition,
    AgentLimitReached
};

enum class LockError {
    NotHolder,
    LockLimitExceeded,
    UnknownAgent
};

enum class SyncError {
    UnknownScope,
    AlreadySyncing,
    DependencyNotReady,
    InvalidTransition,
    SelfDependency,
    CyclicDependency,
    TooManyDependencies,
    DependentSyncing
};

enum class SafetyError {
    ViolationRejected
};

// Outcome of an agent registry operation; error is empty on success.
// `previous` and `released_locks` are read under the registry lock, so they
// describe exactly the state the operation acted on.
struct AgentResult {
    std::optional<AgentError> error;
    std::optional<AgentState> previous;      // set_state and leave
    std::vector<ScopePath> released_locks;   // leave only

    bool ok() const noexcept { return !error.has_value(); }
};

// Outcome of a lock operation. `acquired` is false without an error when the
// scope is held by a different agent.
struct LockResult {
    bool acquired{false};
    std::optional<LockError> error;

    bool ok() const noexcept { return !error.has_value(); }
};

// Outcome of a sync operation.
//   DependencyNotReady -> scopes holds the unmet dependencies
//   CyclicDependency   -> scopes holds the cycle path
//   DependentSyncing   -> scopes holds the dependents still syncing
//   complete_sync ok   -> scopes holds dependents that are now ready to start
//   start_sync ok      -> scopes holds dependents reset from Completed to Idle
//   declare_scope ok   -> scopes holds scopes reset from Completed to Idle
//   remove_scope ok    -> scopes holds the former dependents
struct SyncResult {
    std::optional<SyncError> error;
    std::vector<ScopePath> scopes;

    bool ok() const noexcept { return !error.has_value(); }
};

struct DependencyCheck {
    bool ready{true};
    std::vector<ScopePath> unmet;
};

struct AgentStatistics {
    std::size_t total{0};
    std::size_t idle{0};
    std::size_t working{0};
    std::size_t blocked{0};
    std::size_t completed{0};
};

struct SyncStatistics {
    std::size_t total_scopes{0};
    std::size_t idle{0};
    std::size_t syncing{0};
    std::size_t completed{0};
    std::size_t failed{0};
};

// System-wide status for monitoring
struct SystemStatus {
    Timestamp timestamp{};
    std::size_t total_agents{0};
    std::size_t active_agents{0};   // Working or Blocked
    std::size_t held_locks{0};
    std::size_t syncing_scopes{0};
    std::size_t completed_scopes{0};
    std::size_t failed_scopes{0};
    std::size_t violations_recorded{0};
    std::size_t rollbacks{0};
};

inline const char* to_string(AgentState s) {
    switch (s) {
        case AgentState::Idle:      return "Idle";
        case AgentState::Working:   return "Working";
        case AgentState::Blocked:   return "Blocked";
        case AgentState::Completed: return "Completed";
    }
    return "Unknown";
}

inline const char* to_string(SyncStatus s) {
    switch (s) {
        case SyncStatus::Idle:      return "Idle";
        case SyncStatus::Syncing:   return "Syncing";
        case SyncStatus::Completed: return "Completed";
        case SyncStatus::Failed:    return "Failed";
    }
    return "Unknown";
}

inline const char* to_string(ViolationKind k) {
    switch (k) {
        case ViolationKind::ContextConsistency:  return "ContextConsistency";
        case ViolationKind::DependencyIntegrity: return "DependencyIntegrity";
        case ViolationKind::AgentCoordination:   return "AgentCoordination";
        case ViolationKind::LockConsistency:     return "LockConsistency";
    }
    return "Unknown";
}

inline const char* to_string(AgentError e) {
    switch (e) {
        case AgentError::AlreadyJoined:     return "AlreadyJoined";
        case AgentError::UnknownAgent:      return "UnknownAgent";
        case AgentError::InvalidTransition: return "InvalidTransition";
        case AgentError::AgentLimitReached: return "AgentLimitReached";
    }
    return "Unknown";
}

inline const char* to_string(LockError e) {
    switch (e) {
        case LockError::NotHolder:         return "NotHolder";
        case LockError::LockLimitExceeded: return "LockLimitExceeded";
        case LockError::UnknownAgent:      return "UnknownAgent";
    }
    return "Unknown";
}

inline const char* to_string(SyncError e) {
    switch (e) {
        case SyncError::UnknownScope:        return "UnknownScope";
        case SyncError::AlreadySyncing:      return "AlreadySyncing";
        case SyncError::DependencyNotReady:  return "DependencyNotReady";
        case SyncError::InvalidTransition:   return "InvalidTransition";
        case SyncError::SelfDependency:      return "SelfDependency";
        case SyncError::CyclicDependency:    return "CyclicDependency";
        case SyncError::TooManyDependencies: return "TooManyDependencies";
        case SyncError::DependentSyncing:    return "DependentSyncing";
    }
    return "Unknown";
}

inline const char* to_string(SafetyError e) {
    switch (e) {
        case SafetyError::ViolationRejected: return "ViolationRejected";
    }
    return "Unknown";
}

} // namespace coordguard
