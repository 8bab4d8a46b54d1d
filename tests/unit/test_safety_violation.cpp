#include <gtest/gtest.h>
#include <coordguard/coordguard.hpp>

using namespace coordguard;
using namespace std::chrono_literals;

namespace {

const Timestamp kT0 = Timestamp(std::chrono::seconds(1700000000));

SafetyViolation orphan(const ScopePath& scope, const AgentId& holder, Timestamp at = kT0) {
    LockConsistencyDetail detail;
    detail.problem = LockProblem::OrphanedLock;
    detail.scope = scope;
    detail.holder = holder;
    return make_violation(detail, at);
}

} // anonymous namespace

// ===========================================================================
// Factories
// ===========================================================================

TEST(SafetyViolationTest, KindFollowsDetail) {
    EXPECT_EQ(make_violation(ContextConsistencyDetail{"s", "lock"}, kT0).kind(),
              ViolationKind::ContextConsistency);

    DependencyIntegrityDetail dep;
    dep.scope = "s";
    dep.path = {"s", "t", "s"};
    EXPECT_EQ(make_violation(dep, kT0).kind(), ViolationKind::DependencyIntegrity);

    AgentCoordinationDetail coord;
    coord.agents = {"a1"};
    EXPECT_EQ(make_violation(coord, 300s, kT0).kind(), ViolationKind::AgentCoordination);

    EXPECT_EQ(orphan("s", "a1").kind(), ViolationKind::LockConsistency);
}

TEST(SafetyViolationTest, MessagesNameTheSubject) {
    DependencyIntegrityDetail cycle;
    cycle.problem = DependencyProblem::Cycle;
    cycle.scope = "a";
    cycle.path = {"a", "b", "a"};
    auto v = make_violation(cycle, kT0);
    EXPECT_EQ(v.subject, "a");
    EXPECT_EQ(v.message, "Dependency cycle: a -> b -> a");

    AgentCoordinationDetail blocked;
    blocked.problem = CoordinationProblem::BlockedTooLong;
    blocked.agents = {"a1"};
    blocked.blocked_for = 400s;
    auto b = make_violation(blocked, 300s, kT0);
    EXPECT_EQ(b.subject, "a1");
    EXPECT_EQ(b.message, "Agent a1 blocked longer than 300s");
    EXPECT_EQ(b.detected_at, kT0);
}

TEST(SafetyViolationTest, BlockedMessageDoesNotDependOnElapsedTime) {
    AgentCoordinationDetail first;
    first.agents = {"a1"};
    first.blocked_for = 301s;
    AgentCoordinationDetail later = first;
    later.blocked_for = 900s;

    EXPECT_TRUE(make_violation(first, 300s, kT0)
                    .same_condition(make_violation(later, 300s, kT0 + 10min)));
}

// ===========================================================================
// Condition matching
// ===========================================================================

TEST(SafetyViolationTest, SameConditionIgnoresTimestamp) {
    EXPECT_TRUE(orphan("s", "a1").same_condition(orphan("s", "a1", kT0 + 1h)));
    EXPECT_FALSE(orphan("s", "a1").same_condition(orphan("t", "a1")));
    EXPECT_FALSE(orphan("s", "a1").same_condition(orphan("s", "a2")));
}

TEST(SafetyViolationTest, IntroducedViolations) {
    std::vector<SafetyViolation> before = {orphan("s", "a1")};
    std::vector<SafetyViolation> after = {orphan("s", "a1", kT0 + 1s), orphan("t", "a2")};

    auto introduced = introduced_violations(before, after);
    ASSERT_EQ(introduced.size(), 1u);
    EXPECT_EQ(introduced[0].subject, "t");

    EXPECT_TRUE(introduced_violations(after, before).empty());
    EXPECT_EQ(introduced_violations({}, after).size(), 2u);
}

// ===========================================================================
// BoundedHistory
// ===========================================================================

TEST(BoundedHistoryTest, EvictsOldestFirst) {
    BoundedHistory<int> history(3);
    for (int i = 1; i <= 5; ++i) {
        history.push(i);
    }
    EXPECT_EQ(history.size(), 3u);
    EXPECT_EQ(history.snapshot(), (std::vector<int>{3, 4, 5}));
    EXPECT_EQ(history.total_recorded(), 5u);
}

TEST(BoundedHistoryTest, ZeroCapacityStoresNothing) {
    BoundedHistory<int> history(0);
    history.push(1);
    EXPECT_TRUE(history.empty());
    EXPECT_EQ(history.total_recorded(), 1u);
}

TEST(BoundedHistoryTest, ClearKeepsTotal) {
    BoundedHistory<std::string> history(4);
    history.push("a");
    history.push("b");
    history.clear();
    EXPECT_TRUE(history.empty());
    EXPECT_EQ(history.capacity(), 4u);
    EXPECT_EQ(history.total_recorded(), 2u);
}
