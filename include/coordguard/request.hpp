#pragma once

#include "coordguard/types.hpp"
#include "coordguard/safety_violation.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace coordguard {

// ==================== Requests ====================

struct AgentJoin {
    AgentId agent_id;
};

struct AgentLeave {
    AgentId agent_id;
};

struct SetState {
    AgentId agent_id;
    AgentState state{AgentState::Idle};
};

struct AcquireLock {
    ScopePath scope_path;
    AgentId agent_id;
};

struct ReleaseLock {
    ScopePath scope_path;
    AgentId agent_id;
};

struct DeclareScope {
    ScopePath scope_path;
    std::vector<ScopePath> dependencies;
};

struct RemoveScope {
    ScopePath scope_path;
};

struct StartSync {
    ScopePath scope_path;
};

struct CompleteSync {
    ScopePath scope_path;
};

struct FailSync {
    ScopePath scope_path;
    std::string error;
};

using Request = std::variant<AgentJoin, AgentLeave, SetState,
                             AcquireLock, ReleaseLock,
                             DeclareScope, RemoveScope,
                             StartSync, CompleteSync, FailSync>;

const char* request_name(const Request& request);

// ==================== Responses ====================

using OperationError = std::variant<AgentError, LockError, SyncError, SafetyError>;

std::string to_string(const OperationError& error);

struct Response {
    std::optional<OperationError> error;     // empty on success
    bool acquired{false};                    // AcquireLock only
    std::vector<ScopePath> scopes;           // see SyncResult
    std::vector<SafetyViolation> violations; // post-operation findings
    bool rolled_back{false};                 // strict mode compensation ran

    bool ok() const noexcept { return !error.has_value(); }
};

} // namespace coordguard
