#include "coordguard/coordination_service.hpp"
#include "coordguard/exceptions.hpp"

#include <algorithm>
#include <iterator>
#include <type_traits>

namespace coordguard {

namespace {

const Config& validated(const Config& config) {
    validate(config);
    return config;
}

std::string join_scopes(const std::vector<ScopePath>& scopes) {
    std::string out;
    for (std::size_t i = 0; i < scopes.size(); ++i) {
        if (i > 0) out += ", ";
        out += scopes[i];
    }
    return out;
}

} // anonymous namespace

CoordinationService::CoordinationService(Config config, TimeSource now)
    : config_(validated(config))
    , now_(now ? std::move(now) : TimeSource(system_now))
    , locks_(config_, now_)
    , agents_(config_, locks_, now_)
    , sync_(config_, now_)
    , validator_(config_)
    , violation_history_(config_.violation_history_capacity)
{}

CoordinationService::~CoordinationService() {
    if (running_.load()) {
        stop();
    }
}

// ---------------------------------------------------------------------------
// Request surface
// ---------------------------------------------------------------------------

Response CoordinationService::handle(const Request& request) {
    return std::visit([this](const auto& r) -> Response {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, AgentJoin>) {
            return agent_join(r.agent_id);
        } else if constexpr (std::is_same_v<T, AgentLeave>) {
            return agent_leave(r.agent_id);
        } else if constexpr (std::is_same_v<T, SetState>) {
            return set_state(r.agent_id, r.state);
        } else if constexpr (std::is_same_v<T, AcquireLock>) {
            return acquire_lock(r.scope_path, r.agent_id);
        } else if constexpr (std::is_same_v<T, ReleaseLock>) {
            return release_lock(r.scope_path, r.agent_id);
        } else if constexpr (std::is_same_v<T, DeclareScope>) {
            return declare_scope(r.scope_path, r.dependencies);
        } else if constexpr (std::is_same_v<T, RemoveScope>) {
            return remove_scope(r.scope_path);
        } else if constexpr (std::is_same_v<T, StartSync>) {
            return start_sync(r.scope_path);
        } else if constexpr (std::is_same_v<T, CompleteSync>) {
            return complete_sync(r.scope_path);
        } else {
            return fail_sync(r.scope_path, r.error);
        }
    }, request);
}

Response CoordinationService::agent_join(const AgentId& agent_id) {
    return execute(
        [&](EventBatch& events) {
            Response response;
            auto result = agents_.join(agent_id);
            if (!result.ok()) {
                response.error = *result.error;
                return response;
            }
            events.push_back(make_event(EventType::AgentJoined, "Agent " + agent_id + " joined",
                                        agent_id, std::nullopt, AgentState::Idle));
            return response;
        },
        [&] {
            agents_.discard(agent_id);
            return true;
        });
}

Response CoordinationService::agent_leave(const AgentId& agent_id) {
    // Captured for compensation only; strict mode serializes it with the leave
    std::optional<Agent> prior;
    std::vector<Lock> held;

    return execute(
        [&](EventBatch& events) {
            Response response;
            prior = agents_.get_agent(agent_id);
            if (prior) {
                for (const auto& scope : prior->held_locks()) {
                    if (auto lock = locks_.get(scope)) {
                        held.push_back(std::move(*lock));
                    }
                }
            }

            auto result = agents_.leave(agent_id);
            if (!result.ok()) {
                response.error = *result.error;
                return response;
            }

            for (const auto& scope : result.released_locks) {
                events.push_back(make_event(EventType::LockForceReleased,
                                            "Lock on " + scope + " released on leave",
                                            agent_id, scope));
            }
            events.push_back(make_event(EventType::AgentLeft, "Agent " + agent_id + " left",
                                        agent_id));
            return response;
        },
        [&] {
            if (!prior) return false;
            agents_.restore(*prior, held);
            return true;
        });
}

Response CoordinationService::set_state(const AgentId& agent_id, AgentState state) {
    std::optional<Agent> prior;

    return execute(
        [&](EventBatch& events) {
            Response response;
            prior = agents_.get_agent(agent_id);

            // result.previous is the state set_state acted on; prior may be
            // stale when a join or leave races this call outside strict mode
            auto result = agents_.set_state(agent_id, state);
            if (!result.ok()) {
                response.error = *result.error;
                if (*result.error == AgentError::InvalidTransition && result.previous) {
                    events.push_back(make_event(EventType::TransitionRejected,
                                                std::string("Rejected transition ") +
                                                to_string(*result.previous) + " -> " + to_string(state),
                                                agent_id, std::nullopt, *result.previous));
                }
                return response;
            }

            std::string message = to_string(state);
            if (result.previous) {
                message = std::string(to_string(*result.previous)) + " -> " + message;
            }
            events.push_back(make_event(EventType::AgentStateChanged, message,
                                        agent_id, std::nullopt, state));
            return response;
        },
        [&] {
            if (!prior) return false;
            agents_.restore(*prior);
            return true;
        });
}

Response CoordinationService::acquire_lock(const ScopePath& scope_path, const AgentId& agent_id) {
    std::optional<Lock> prior;
    bool changed = false;

    return execute(
        [&](EventBatch& events) {
            Response response;
            prior = locks_.get(scope_path);

            auto result = agents_.acquire_lock(agent_id, scope_path);
            if (!result.ok()) {
                response.error = *result.error;
                events.push_back(make_event(EventType::LockDenied,
                                            std::string("Lock denied: ") + to_string(*result.error),
                                            agent_id, scope_path));
                return response;
            }

            response.acquired = result.acquired;
            changed = result.acquired;
            if (result.acquired) {
                events.push_back(make_event(EventType::LockAcquired,
                                            prior ? "Lock renewed" : "Lock acquired",
                                            agent_id, scope_path));
            } else {
                std::string holder = prior && prior->holder ? *prior->holder : "another agent";
                events.push_back(make_event(EventType::LockDenied, "Lock held by " + holder,
                                            agent_id, scope_path));
            }
            return response;
        },
        [&] {
            if (!changed) return false;
            if (prior) {
                locks_.restore(*prior);
            } else {
                locks_.erase(scope_path);
            }
            return true;
        });
}

Response CoordinationService::release_lock(const ScopePath& scope_path, const AgentId& agent_id) {
    std::optional<Lock> prior;

    return execute(
        [&](EventBatch& events) {
            Response response;
            prior = locks_.get(scope_path);

            auto result = agents_.release_lock(agent_id, scope_path);
            if (!result.ok()) {
                response.error = *result.error;
                return response;
            }
            events.push_back(make_event(EventType::LockReleased, "Lock released", agent_id, scope_path));
            return response;
        },
        [&] {
            if (!prior) return false;
            locks_.restore(*prior);
            return true;
        });
}

Response CoordinationService::declare_scope(const ScopePath& scope_path,
                                            std::vector<ScopePath> dependencies) {
    std::vector<SyncOperation> prior;
    bool existed = false;

    return execute(
        [&](EventBatch& events) {
            Response response;
            if (auto op = sync_.get(scope_path)) {
                existed = true;
                prior.push_back(std::move(*op));
                for (const auto& d : sync_.transitive_dependents(scope_path)) {
                    if (auto dep = sync_.get(d)) prior.push_back(std::move(*dep));
                }
            }

            auto result = sync_.declare_scope(scope_path, dependencies);
            response.scopes = result.scopes;
            if (!result.ok()) {
                response.error = *result.error;
                events.push_back(make_event(EventType::SyncRejected,
                                            std::string("Declaration rejected: ") + to_string(*result.error),
                                            std::nullopt, scope_path));
                return response;
            }

            events.push_back(make_event(EventType::ScopeDeclared,
                                        dependencies.empty() ? "Scope declared"
                                                             : "Scope declared, depends on " +
                                                               join_scopes(sync_.dependencies(scope_path)),
                                        std::nullopt, scope_path, std::nullopt,
                                        sync_.status(scope_path)));
            for (const auto& invalidated : result.scopes) {
                events.push_back(make_event(EventType::SyncInvalidated,
                                            "Completed result invalidated by redeclaration of " + scope_path,
                                            std::nullopt, invalidated, std::nullopt, SyncStatus::Idle));
            }
            return response;
        },
        [&] {
            if (existed) {
                sync_.restore(prior);
            } else {
                sync_.erase(scope_path);
            }
            return true;
        });
}

Response CoordinationService::remove_scope(const ScopePath& scope_path) {
    std::vector<SyncOperation> prior;

    return execute(
        [&](EventBatch& events) {
            Response response;
            if (auto op = sync_.get(scope_path)) {
                prior.push_back(std::move(*op));
                for (const auto& d : sync_.dependents(scope_path)) {
                    if (auto dep = sync_.get(d)) prior.push_back(std::move(*dep));
                }
            }

            auto result = sync_.remove_scope(scope_path);
            response.scopes = result.scopes;
            if (!result.ok()) {
                response.error = *result.error;
                events.push_back(make_event(EventType::SyncRejected,
                                            std::string("Removal rejected: ") + to_string(*result.error),
                                            std::nullopt, scope_path));
                return response;
            }
            events.push_back(make_event(EventType::ScopeRemoved, "Scope removed", std::nullopt, scope_path));
            return response;
        },
        [&] {
            if (prior.empty()) return false;
            sync_.restore(prior);
            return true;
        });
}

Response CoordinationService::start_sync(const ScopePath& scope_path) {
    std::vector<SyncOperation> prior;

    return execute(
        [&](EventBatch& events) {
            Response response;
            if (auto op = sync_.get(scope_path)) {
                prior.push_back(std::move(*op));
                for (const auto& d : sync_.transitive_dependents(scope_path)) {
                    if (auto dep = sync_.get(d)) prior.push_back(std::move(*dep));
                }
            }

            auto result = sync_.start_sync(scope_path);
            response.scopes = result.scopes;
            if (!result.ok()) {
                response.error = *result.error;
                std::string message = std::string("Sync rejected: ") + to_string(*result.error);
                if (!result.scopes.empty()) {
                    message += " (" + join_scopes(result.scopes) + ")";
                }
                events.push_back(make_event(EventType::SyncRejected, message, std::nullopt, scope_path));
                return response;
            }

            for (const auto& invalidated : result.scopes) {
                events.push_back(make_event(EventType::SyncInvalidated,
                                            "Completed result invalidated by re-sync of " + scope_path,
                                            std::nullopt, invalidated, std::nullopt, SyncStatus::Idle));
            }
            events.push_back(make_event(EventType::SyncStarted, "Sync started", std::nullopt, scope_path,
                                        std::nullopt, SyncStatus::Syncing));
            return response;
        },
        [&] {
            if (prior.empty()) return false;
            sync_.restore(prior);
            return true;
        });
}

Response CoordinationService::complete_sync(const ScopePath& scope_path) {
    std::optional<SyncOperation> prior;

    return execute(
        [&](EventBatch& events) {
            Response response;
            prior = sync_.get(scope_path);

            auto result = sync_.complete_sync(scope_path);
            response.scopes = result.scopes;
            if (!result.ok()) {
                response.error = *result.error;
                events.push_back(make_event(EventType::SyncRejected,
                                            std::string("Completion rejected: ") + to_string(*result.error),
                                            std::nullopt, scope_path));
                return response;
            }

            std::string message = "Sync completed";
            if (!result.scopes.empty()) {
                message += ", ready: " + join_scopes(result.scopes);
            }
            events.push_back(make_event(EventType::SyncCompleted, message, std::nullopt, scope_path,
                                        std::nullopt, SyncStatus::Completed));
            return response;
        },
        [&] {
            if (!prior) return false;
            sync_.restore({*prior});
            return true;
        });
}

Response CoordinationService::fail_sync(const ScopePath& scope_path, std::string error) {
    std::optional<SyncOperation> prior;

    return execute(
        [&](EventBatch& events) {
            Response response;
            prior = sync_.get(scope_path);

            auto result = sync_.fail_sync(scope_path, error);
            if (!result.ok()) {
                response.error = *result.error;
                events.push_back(make_event(EventType::SyncRejected,
                                            std::string("Failure rejected: ") + to_string(*result.error),
                                            std::nullopt, scope_path));
                return response;
            }
            events.push_back(make_event(EventType::SyncFailed, "Sync failed: " + error, std::nullopt,
                                        scope_path, std::nullopt, SyncStatus::Failed));
            return response;
        },
        [&] {
            if (!prior) return false;
            sync_.restore({*prior});
            return true;
        });
}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

CoordinationSnapshot CoordinationService::snapshot() const {
    return agents_.snapshot(sync_);
}

std::vector<SafetyViolation> CoordinationService::validate() const {
    return validator_.validate(snapshot());
}

Response CoordinationService::execute(const std::function<Response(EventBatch&)>& apply,
                                      const std::function<bool()>& compensate) {
    EventBatch events;

    if (!config_.validation_enabled) {
        Response response = apply(events);
        publish(events);
        return response;
    }

    if (!config_.strict_validation) {
        // Advisory: report what is standing after the operation, never undo
        Response response = apply(events);
        response.violations = validate();
        publish(events);
        note_violations(response.violations);
        return response;
    }

    Response response;
    std::vector<SafetyViolation> fresh;
    {
        std::lock_guard<std::mutex> strict(strict_mutex_);

        auto before = validate();
        response = apply(events);
        auto after = validate();
        fresh = record_violations(after);

        std::vector<SafetyViolation> introduced;
        if (response.ok()) {
            introduced = introduced_violations(before, after);
        }

        if (introduced.empty() || !compensate()) {
            response.violations = std::move(after);
        } else {
            rollbacks_++;
            auto restored = record_violations(validate());
            fresh.insert(fresh.end(), restored.begin(), restored.end());

            // The mutation never stood: drop its events
            events.clear();
            events.push_back(make_event(EventType::OperationRolledBack,
                                        "Rolled back: " + introduced.front().message,
                                        std::nullopt, std::nullopt, std::nullopt, std::nullopt,
                                        introduced.front().kind()));

            response = Response{};
            response.error = SafetyError::ViolationRejected;
            response.rolled_back = true;
            response.violations = std::move(introduced);
        }
    }

    // Outside the strict lock: a monitor may call back into the service
    publish(events);
    publish_violations(fresh);
    return response;
}

std::vector<SafetyViolation> CoordinationService::record_violations(
    const std::vector<SafetyViolation>& current) {
    std::lock_guard<std::mutex> lock(violations_mutex_);

    std::vector<SafetyViolation> fresh;
    for (const auto& v : current) {
        bool standing = std::any_of(active_violations_.begin(), active_violations_.end(),
            [&v](const SafetyViolation& a) { return a.same_condition(v); });
        if (!standing) {
            fresh.push_back(v);
            violation_history_.push(v);
        }
    }
    active_violations_ = current;
    return fresh;
}

void CoordinationService::publish_violations(const std::vector<SafetyViolation>& fresh) {
    EventBatch events;
    events.reserve(fresh.size());
    for (const auto& v : fresh) {
        events.push_back(make_event(EventType::SafetyViolationDetected, v.message,
                                    std::nullopt, std::nullopt, std::nullopt, std::nullopt,
                                    v.kind()));
    }
    publish(events);
}

void CoordinationService::note_violations(const std::vector<SafetyViolation>& current) {
    publish_violations(record_violations(current));
}

// ---------------------------------------------------------------------------
// Sweep
// ---------------------------------------------------------------------------

std::optional<SweepReport> CoordinationService::run_sweep() {
    std::unique_lock<std::mutex> flight(sweep_mutex_, std::try_to_lock);
    if (!flight.owns_lock()) {
        return std::nullopt;
    }

    SweepReport report;
    {
        std::unique_lock<std::mutex> strict(strict_mutex_, std::defer_lock);
        if (config_.strict_validation) {
            strict.lock();
        }

        report.ran_at = now_();
        report.expired_locks = agents_.reap_expired_locks();
        report.stalled = agents_.check_progress();
    }

    std::set<AgentId> stalled_now;
    for (const auto& v : report.stalled) {
        stalled_now.insert(v.subject);
    }
    std::set_difference(stalled_now.begin(), stalled_now.end(),
                        flagged_stalled_.begin(), flagged_stalled_.end(),
                        std::back_inserter(report.newly_stalled));
    std::set_difference(flagged_stalled_.begin(), flagged_stalled_.end(),
                        stalled_now.begin(), stalled_now.end(),
                        std::back_inserter(report.recovered));
    flagged_stalled_ = std::move(stalled_now);

    // Outside the component locks: emit events
    for (const auto& event : report.expired_locks) {
        emit_event(EventType::LockExpired, "Lock expired and was reclaimed",
                   event.agent_id, event.scope_path);
    }
    for (const auto& id : report.newly_stalled) {
        emit_event(EventType::AgentStalled,
                   "Agent " + id + " blocked longer than max_block_time", id,
                   std::nullopt, AgentState::Blocked);
    }
    for (const auto& id : report.recovered) {
        emit_event(EventType::AgentStallResolved, "Agent " + id + " no longer stalled", id);
    }

    if (config_.validation_enabled) {
        note_violations(validate());
    }

    emit_event(EventType::SweepCompleted,
               std::to_string(report.expired_locks.size()) + " locks reclaimed, " +
               std::to_string(report.stalled.size()) + " agents stalled");

    if (auto monitor = current_monitor()) {
        monitor->on_status(status());
    }
    return report;
}

void CoordinationService::sweep_loop() {
    while (running_.load()) {
        run_sweep();

        std::unique_lock<std::mutex> lock(cv_mutex_);
        cv_.wait_for(lock, effective_sweep_interval(config_), [this] {
            return !running_.load();
        });
    }
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

SystemStatus CoordinationService::status() const {
    SystemStatus status;
    status.timestamp = now_();

    auto agent_stats = agents_.statistics();
    status.total_agents = agent_stats.total;
    status.active_agents = agent_stats.working + agent_stats.blocked;

    status.held_locks = locks_.lock_count();

    auto sync_stats = sync_.statistics();
    status.syncing_scopes = sync_stats.syncing;
    status.completed_scopes = sync_stats.completed;
    status.failed_scopes = sync_stats.failed;

    {
        std::lock_guard<std::mutex> lock(violations_mutex_);
        status.violations_recorded = violation_history_.total_recorded();
    }
    status.rollbacks = rollbacks_.load();
    return status;
}

std::vector<SafetyViolation> CoordinationService::violation_history() const {
    std::lock_guard<std::mutex> lock(violations_mutex_);
    return violation_history_.snapshot();
}

// ---------------------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------------------

void CoordinationService::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(monitor_mutex_);
    monitor_ = std::move(monitor);
}

void CoordinationService::start() {
    if (running_.exchange(true)) {
        return;
    }
    sweep_thread_ = std::thread(&CoordinationService::sweep_loop, this);
}

void CoordinationService::stop() {
    running_.store(false);
    {
        std::lock_guard<std::mutex> lock(cv_mutex_);
        cv_.notify_all();
    }
    if (sweep_thread_.joinable()) {
        sweep_thread_.join();
    }
}

bool CoordinationService::is_running() const noexcept {
    return running_.load();
}

std::shared_ptr<Monitor> CoordinationService::current_monitor() const {
    std::lock_guard<std::mutex> lock(monitor_mutex_);
    return monitor_;
}

MonitorEvent CoordinationService::make_event(EventType type, const std::string& message,
                                             std::optional<AgentId> agent_id,
                                             std::optional<ScopePath> scope_path,
                                             std::optional<AgentState> agent_state,
                                             std::optional<SyncStatus> sync_status,
                                             std::optional<ViolationKind> violation_kind) const {
    MonitorEvent event;
    event.type = type;
    event.timestamp = now_();
    event.message = message;
    event.agent_id = std::move(agent_id);
    event.scope_path = std::move(scope_path);
    event.agent_state = agent_state;
    event.sync_status = sync_status;
    event.violation_kind = violation_kind;
    return event;
}

void CoordinationService::publish(const EventBatch& events) {
    if (events.empty()) return;
    auto monitor = current_monitor();
    if (!monitor) return;

    for (const auto& event : events) {
        monitor->on_event(event);
    }
}

void CoordinationService::emit_event(EventType type, const std::string& message,
                                     std::optional<AgentId> agent_id,
                                     std::optional<ScopePath> scope_path,
                                     std::optional<AgentState> agent_state,
                                     std::optional<SyncStatus> sync_status,
                                     std::optional<ViolationKind> violation_kind) {
    publish({make_event(type, message, std::move(agent_id), std::move(scope_path),
                        agent_state, sync_status, violation_kind)});
}

} // namespace coordguard
