#include <gtest/gtest.h>
#include <coordguard/coordguard.hpp>

#include "test_support.hpp"

using namespace coordguard;
using namespace coordguard::testing;
using namespace std::chrono_literals;

class StrictModeTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.strict_validation = true;
        config_.max_concurrent_agents = 2;
        config_.max_block_time = 300s;
        monitor_ = std::make_shared<TestMonitor>();
        service_ = std::make_unique<CoordinationService>(config_, clock_.source());
        service_->set_monitor(monitor_);
    }

    // Joined, Working, holding `scope`
    void working_holder(const AgentId& agent, const ScopePath& scope) {
        ASSERT_TRUE(service_->agent_join(agent).ok());
        ASSERT_TRUE(service_->set_state(agent, AgentState::Working).ok());
        ASSERT_TRUE(service_->acquire_lock(scope, agent).acquired);
    }

    Config config_;
    ManualClock clock_;
    std::shared_ptr<TestMonitor> monitor_;
    std::unique_ptr<CoordinationService> service_;
};

// ===========================================================================
// Rollback
// ===========================================================================

TEST_F(StrictModeTest, LockOnUndeclaredScopeIsRolledBack) {
    service_->agent_join("a1");

    auto response = service_->acquire_lock("svc/undeclared", "a1");
    ASSERT_FALSE(response.ok());
    EXPECT_EQ(std::get<SafetyError>(*response.error), SafetyError::ViolationRejected);
    EXPECT_TRUE(response.rolled_back);
    EXPECT_FALSE(response.acquired);
    ASSERT_EQ(response.violations.size(), 1u);
    EXPECT_EQ(response.violations[0].kind(), ViolationKind::ContextConsistency);

    EXPECT_FALSE(service_->locks().get("svc/undeclared").has_value());
    EXPECT_EQ(service_->status().rollbacks, 1u);
    EXPECT_EQ(monitor_->count(EventType::OperationRolledBack), 1u);
    EXPECT_EQ(monitor_->count(EventType::LockAcquired), 0u);
    EXPECT_TRUE(service_->validate().empty());

    // Triggering finding is kept for audit
    EXPECT_EQ(service_->violation_history().size(), 1u);
}

TEST_F(StrictModeTest, ConcurrencyLimitEnforcedOnAcquire) {
    service_->declare_scope("s1");
    service_->declare_scope("s2");
    service_->declare_scope("s3");
    working_holder("a1", "s1");
    working_holder("a2", "s2");

    service_->agent_join("a3");
    service_->set_state("a3", AgentState::Working);
    auto response = service_->acquire_lock("s3", "a3");
    ASSERT_FALSE(response.ok());
    EXPECT_TRUE(response.rolled_back);
    EXPECT_EQ(response.violations[0].kind(), ViolationKind::AgentCoordination);
    EXPECT_FALSE(service_->locks().get("s3").has_value());
}

TEST_F(StrictModeTest, ConcurrencyLimitEnforcedOnStateChange) {
    service_->declare_scope("s1");
    service_->declare_scope("s2");
    service_->declare_scope("s3");
    working_holder("a1", "s1");
    working_holder("a2", "s2");

    // Idle holders do not count
    service_->agent_join("a3");
    ASSERT_TRUE(service_->acquire_lock("s3", "a3").acquired);

    auto response = service_->set_state("a3", AgentState::Working);
    ASSERT_FALSE(response.ok());
    EXPECT_TRUE(response.rolled_back);
    EXPECT_EQ(service_->agents().get_agent("a3")->state(), AgentState::Idle);
    EXPECT_EQ(service_->agents().get_agent("a3")->operations_count(), 0u);
}

TEST_F(StrictModeTest, RenewalIsAccepted) {
    service_->declare_scope("s1");
    service_->agent_join("a1");
    service_->acquire_lock("s1", "a1");
    auto before = *service_->locks().get("s1");

    clock_.advance(10s);
    auto response = service_->acquire_lock("s1", "a1");
    EXPECT_TRUE(response.ok());
    EXPECT_EQ(service_->locks().get("s1")->expires_at, before.expires_at + 10s);
}

TEST_F(StrictModeTest, RemovingLockedScopeIsRolledBack) {
    service_->declare_scope("base");
    service_->declare_scope("top", {"base"});
    service_->agent_join("a1");
    service_->acquire_lock("base", "a1");

    auto response = service_->remove_scope("base");
    ASSERT_FALSE(response.ok());
    EXPECT_TRUE(response.rolled_back);
    EXPECT_TRUE(service_->sync().contains("base"));
    EXPECT_EQ(service_->sync().dependencies("top"), std::vector<ScopePath>{"base"});
}

TEST_F(StrictModeTest, RejoinAfterRollbackSucceeds) {
    service_->agent_join("a1");
    service_->acquire_lock("nowhere", "a1");  // rolled back
    EXPECT_TRUE(service_->agent_leave("a1").ok());
    EXPECT_TRUE(service_->agent_join("a1").ok());
}

TEST_F(StrictModeTest, RolledBackStateChangeIsNotReported) {
    service_->declare_scope("s1");
    service_->declare_scope("s2");
    service_->declare_scope("s3");
    working_holder("a1", "s1");
    working_holder("a2", "s2");
    service_->agent_join("a3");
    ASSERT_TRUE(service_->acquire_lock("s3", "a3").acquired);
    monitor_->clear();

    auto response = service_->set_state("a3", AgentState::Working);
    ASSERT_TRUE(response.rolled_back);
    EXPECT_EQ(monitor_->count(EventType::AgentStateChanged), 0u);
    EXPECT_EQ(monitor_->count(EventType::OperationRolledBack), 1u);
}

TEST(StrictModeMetricsTest, RolledBackAcquireIsNotCountedAsGranted) {
    Config config;
    config.strict_validation = true;
    CoordinationService service(config);
    auto metrics = std::make_shared<MetricsMonitor>();
    service.set_monitor(metrics);

    service.agent_join("a1");
    auto response = service.acquire_lock("svc/undeclared", "a1");
    ASSERT_TRUE(response.rolled_back);

    auto m = metrics->get_metrics();
    EXPECT_EQ(m.locks_granted, 0u);
    EXPECT_EQ(m.rollbacks, 1u);
    EXPECT_EQ(service.locks().lock_count(), 0u);
}

// ===========================================================================
// Monitors calling back into the service
// ===========================================================================

// Puts every agent to work as soon as it joins
class AutoStartMonitor : public Monitor {
public:
    void attach(CoordinationService* service) { service_ = service; }

    void on_event(const MonitorEvent& event) override {
        if (event.type == EventType::AgentJoined && service_ && event.agent_id) {
            last_ = service_->set_state(*event.agent_id, AgentState::Working);
        }
    }

    void on_status(const SystemStatus&) override {}

    Response last_;

private:
    CoordinationService* service_{nullptr};
};

TEST(StrictModeReentryTest, MonitorMayIssueRequestsFromEvents) {
    Config config;
    config.strict_validation = true;
    CoordinationService service(config);
    auto monitor = std::make_shared<AutoStartMonitor>();
    monitor->attach(&service);
    service.set_monitor(monitor);

    auto join = service.agent_join("a1");
    ASSERT_TRUE(join.ok());
    EXPECT_TRUE(monitor->last_.ok());
    EXPECT_EQ(service.agents().get_agent("a1")->state(), AgentState::Working);
}

// ===========================================================================
// What strict mode does not roll back
// ===========================================================================

TEST_F(StrictModeTest, OperationErrorsPassThrough) {
    service_->agent_join("a1");
    auto response = service_->agent_join("a1");
    ASSERT_FALSE(response.ok());
    EXPECT_EQ(std::get<AgentError>(*response.error), AgentError::AlreadyJoined);
    EXPECT_FALSE(response.rolled_back);
    EXPECT_EQ(service_->status().rollbacks, 0u);
}

TEST_F(StrictModeTest, PreexistingViolationDoesNotBlockUnrelatedWork) {
    service_->agent_join("stuck");
    service_->set_state("stuck", AgentState::Working);
    service_->set_state("stuck", AgentState::Blocked);
    clock_.advance(301s);

    auto sweep = service_->run_sweep();
    ASSERT_TRUE(sweep.has_value());
    ASSERT_EQ(sweep->stalled.size(), 1u);

    service_->declare_scope("s1");
    auto join = service_->agent_join("a1");
    EXPECT_TRUE(join.ok());
    EXPECT_FALSE(join.rolled_back);
    EXPECT_EQ(count_violations(join.violations, ViolationKind::AgentCoordination), 1u);
    EXPECT_TRUE(service_->acquire_lock("s1", "a1").acquired);
}

TEST_F(StrictModeTest, DeniedAcquireIsNotRolledBack) {
    service_->declare_scope("s1");
    service_->agent_join("a1");
    service_->agent_join("a2");
    service_->acquire_lock("s1", "a1");

    auto response = service_->acquire_lock("s1", "a2");
    EXPECT_TRUE(response.ok());
    EXPECT_FALSE(response.acquired);
    EXPECT_FALSE(response.rolled_back);
}

TEST_F(StrictModeTest, CleanOperationsReturnNoViolations) {
    service_->declare_scope("s1");
    service_->declare_scope("s2", {"s1"});
    working_holder("a1", "s1");
    EXPECT_TRUE(service_->start_sync("s1").ok());
    auto done = service_->complete_sync("s1");
    EXPECT_TRUE(done.ok());
    EXPECT_TRUE(done.violations.empty());
    EXPECT_EQ(done.scopes, std::vector<ScopePath>{"s2"});
    EXPECT_TRUE(service_->release_lock("s1", "a1").ok());
    EXPECT_TRUE(service_->agent_leave("a1").ok());
    EXPECT_EQ(service_->status().rollbacks, 0u);
}
