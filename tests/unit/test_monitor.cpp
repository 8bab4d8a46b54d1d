#include <gtest/gtest.h>
#include <coordguard/coordguard.hpp>

#include <string>
#include <vector>

#include "test_support.hpp"

using namespace coordguard;
using namespace coordguard::testing;

namespace {

MonitorEvent make_event(EventType type, std::optional<ViolationKind> kind = std::nullopt) {
    MonitorEvent event;
    event.type = type;
    event.message = "test";
    event.violation_kind = kind;
    return event;
}

} // anonymous namespace

// ===========================================================================
// MetricsMonitor
// ===========================================================================

TEST(MetricsMonitorTest, CountsEventsByType) {
    MetricsMonitor metrics;
    metrics.on_event(make_event(EventType::AgentJoined));
    metrics.on_event(make_event(EventType::AgentJoined));
    metrics.on_event(make_event(EventType::LockAcquired));
    metrics.on_event(make_event(EventType::LockDenied));
    metrics.on_event(make_event(EventType::LockExpired));
    metrics.on_event(make_event(EventType::SyncCompleted));
    metrics.on_event(make_event(EventType::OperationRolledBack));
    metrics.on_event(make_event(EventType::SweepCompleted));

    auto m = metrics.get_metrics();
    EXPECT_EQ(m.joins, 2u);
    EXPECT_EQ(m.locks_granted, 1u);
    EXPECT_EQ(m.locks_denied, 1u);
    EXPECT_EQ(m.locks_expired, 1u);
    EXPECT_EQ(m.syncs_completed, 1u);
    EXPECT_EQ(m.rollbacks, 1u);
    EXPECT_EQ(m.sweeps, 1u);
}

TEST(MetricsMonitorTest, ViolationsByKind) {
    MetricsMonitor metrics;
    metrics.on_event(make_event(EventType::SafetyViolationDetected,
                                ViolationKind::LockConsistency));
    metrics.on_event(make_event(EventType::SafetyViolationDetected,
                                ViolationKind::LockConsistency));
    metrics.on_event(make_event(EventType::SafetyViolationDetected,
                                ViolationKind::AgentCoordination));

    auto m = metrics.get_metrics();
    EXPECT_EQ(m.violations, 3u);
    EXPECT_EQ(m.violations_by_kind[ViolationKind::LockConsistency], 2u);
    EXPECT_EQ(m.violations_by_kind[ViolationKind::AgentCoordination], 1u);
}

TEST(MetricsMonitorTest, ViolationAlertFiresAboveThreshold) {
    MetricsMonitor metrics;
    std::vector<std::string> alerts;
    metrics.set_violation_alert_threshold(1, [&alerts](const std::string& msg) {
        alerts.push_back(msg);
    });

    metrics.on_event(make_event(EventType::SafetyViolationDetected));
    EXPECT_TRUE(alerts.empty());
    metrics.on_event(make_event(EventType::SafetyViolationDetected));
    EXPECT_EQ(alerts.size(), 1u);
}

TEST(MetricsMonitorTest, StatusAndReset) {
    MetricsMonitor metrics;
    SystemStatus status;
    status.held_locks = 4;
    status.active_agents = 2;
    metrics.on_status(status);
    metrics.on_event(make_event(EventType::AgentLeft));

    auto m = metrics.get_metrics();
    EXPECT_EQ(m.last_held_locks, 4u);
    EXPECT_EQ(m.last_active_agents, 2u);

    metrics.reset_metrics();
    m = metrics.get_metrics();
    EXPECT_EQ(m.leaves, 0u);
    EXPECT_EQ(m.last_held_locks, 0u);
}

// ===========================================================================
// CompositeMonitor and ConsoleMonitor
// ===========================================================================

TEST(CompositeMonitorTest, FansOutToAll) {
    auto first = std::make_shared<TestMonitor>();
    auto second = std::make_shared<TestMonitor>();
    CompositeMonitor composite;
    composite.add_monitor(first);
    composite.add_monitor(second);

    composite.on_event(make_event(EventType::ScopeDeclared));
    composite.on_status(SystemStatus{});

    EXPECT_EQ(first->count(EventType::ScopeDeclared), 1u);
    EXPECT_EQ(second->count(EventType::ScopeDeclared), 1u);
    EXPECT_EQ(second->get_statuses().size(), 1u);
}

TEST(ConsoleMonitorTest, WritesPrefixedLine) {
    ConsoleMonitor console(ConsoleMonitor::Verbosity::Normal);

    auto event = make_event(EventType::AgentJoined);
    event.agent_id = "a1";

    ::testing::internal::CaptureStdout();
    console.on_event(event);
    console.on_event(make_event(EventType::LockAcquired));  // not important at Normal
    std::string out = ::testing::internal::GetCapturedStdout();

    EXPECT_EQ(out, "[CoordGuard] AgentJoined agent=a1 | test\n");
}

TEST(ConsoleMonitorTest, QuietPrintsNothing) {
    ConsoleMonitor console(ConsoleMonitor::Verbosity::Quiet);
    ::testing::internal::CaptureStdout();
    console.on_event(make_event(EventType::SafetyViolationDetected));
    console.on_status(SystemStatus{});
    EXPECT_TRUE(::testing::internal::GetCapturedStdout().empty());
}

TEST(EventTypeTest, ToStringNamesEveryType) {
    EXPECT_STREQ(to_string(EventType::LockForceReleased), "LockForceReleased");
    EXPECT_STREQ(to_string(EventType::SyncInvalidated), "SyncInvalidated");
    EXPECT_STREQ(to_string(EventType::SweepCompleted), "SweepCompleted");
}
