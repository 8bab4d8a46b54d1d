#include <gtest/gtest.h>
#include <coordguard/coordguard.hpp>

#include "test_support.hpp"

using namespace coordguard;
using namespace coordguard::testing;
using namespace std::chrono_literals;

class SyncCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        create();
    }

    void create() {
        sync_ = std::make_unique<SyncCoordinator>(config_, clock_.source());
    }

    // a <- b <- c  (c depends on b, b depends on a)
    void declare_chain() {
        ASSERT_TRUE(sync_->declare_scope("a").ok());
        ASSERT_TRUE(sync_->declare_scope("b", {"a"}).ok());
        ASSERT_TRUE(sync_->declare_scope("c", {"b"}).ok());
    }

    void run_to_completion(const ScopePath& scope) {
        ASSERT_TRUE(sync_->start_sync(scope).ok());
        ASSERT_TRUE(sync_->complete_sync(scope).ok());
    }

    Config config_;
    ManualClock clock_;
    std::unique_ptr<SyncCoordinator> sync_;
};

// ===========================================================================
// 1. Declaration
// ===========================================================================

TEST_F(SyncCoordinatorTest, DeclareRegistersIdleScope) {
    EXPECT_TRUE(sync_->declare_scope("a").ok());
    EXPECT_TRUE(sync_->contains("a"));
    EXPECT_EQ(sync_->status("a"), SyncStatus::Idle);
    EXPECT_FALSE(sync_->status("zz").has_value());
}

TEST_F(SyncCoordinatorTest, DeclareRejectsSelfDependency) {
    auto result = sync_->declare_scope("a", {"a"});
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(*result.error, SyncError::SelfDependency);
    EXPECT_FALSE(sync_->contains("a"));
}

TEST_F(SyncCoordinatorTest, DeclareRejectsUnknownDependency) {
    auto result = sync_->declare_scope("b", {"a"});
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(*result.error, SyncError::UnknownScope);
    EXPECT_EQ(result.scopes, std::vector<ScopePath>{"a"});
}

TEST_F(SyncCoordinatorTest, DeclareRejectsTooManyDependencies) {
    config_.max_dependencies_per_scope = 2;
    create();
    sync_->declare_scope("a");
    sync_->declare_scope("b");
    sync_->declare_scope("c");

    auto result = sync_->declare_scope("d", {"a", "b", "c"});
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(*result.error, SyncError::TooManyDependencies);
}

TEST_F(SyncCoordinatorTest, DuplicateDependenciesCollapse) {
    sync_->declare_scope("a");
    EXPECT_TRUE(sync_->declare_scope("b", {"a", "a", "a"}).ok());
    EXPECT_EQ(sync_->dependencies("b"), std::vector<ScopePath>{"a"});
}

TEST_F(SyncCoordinatorTest, RedeclarationRejectsCycle) {
    declare_chain();

    auto result = sync_->declare_scope("a", {"c"});
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(*result.error, SyncError::CyclicDependency);
    EXPECT_EQ(result.scopes, (std::vector<ScopePath>{"a", "c", "b", "a"}));
    EXPECT_TRUE(sync_->dependencies("a").empty());
}

TEST_F(SyncCoordinatorTest, RedeclarationReplacesDependencies) {
    declare_chain();
    sync_->declare_scope("x");
    EXPECT_TRUE(sync_->declare_scope("c", {"x"}).ok());
    EXPECT_EQ(sync_->dependencies("c"), std::vector<ScopePath>{"x"});
    EXPECT_TRUE(sync_->dependents("b").empty());
}

TEST_F(SyncCoordinatorTest, RedeclarationOfSyncingScopeRejected) {
    sync_->declare_scope("a");
    sync_->declare_scope("x");
    sync_->start_sync("a");
    auto result = sync_->declare_scope("a", {"x"});
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(*result.error, SyncError::AlreadySyncing);
}

TEST_F(SyncCoordinatorTest, RedeclaringCompletedScopeWithUnreadyDependencyDemotesIt) {
    declare_chain();
    run_to_completion("a");
    run_to_completion("b");
    sync_->declare_scope("x");

    auto result = sync_->declare_scope("a", {"x"});
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.scopes, (std::vector<ScopePath>{"a", "b"}));
    EXPECT_EQ(sync_->status("a"), SyncStatus::Idle);
    EXPECT_EQ(sync_->status("b"), SyncStatus::Idle);
}

// ===========================================================================
// 2. Removal
// ===========================================================================

TEST_F(SyncCoordinatorTest, RemoveDropsScopeFromDependencyLists) {
    declare_chain();
    auto result = sync_->remove_scope("b");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.scopes, std::vector<ScopePath>{"c"});
    EXPECT_FALSE(sync_->contains("b"));
    EXPECT_TRUE(sync_->dependencies("c").empty());
    EXPECT_TRUE(sync_->check_dependencies("c").ready);
}

TEST_F(SyncCoordinatorTest, RemoveUnknownOrSyncingFails) {
    EXPECT_EQ(*sync_->remove_scope("zz").error, SyncError::UnknownScope);

    sync_->declare_scope("a");
    sync_->start_sync("a");
    EXPECT_EQ(*sync_->remove_scope("a").error, SyncError::AlreadySyncing);
    EXPECT_TRUE(sync_->contains("a"));
}

// ===========================================================================
// 3. Sync state machine
// ===========================================================================

TEST_F(SyncCoordinatorTest, StartUnknownScopeFails) {
    EXPECT_EQ(*sync_->start_sync("zz").error, SyncError::UnknownScope);
}

TEST_F(SyncCoordinatorTest, StartWithUnmetDependencies) {
    declare_chain();
    auto result = sync_->start_sync("b");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(*result.error, SyncError::DependencyNotReady);
    EXPECT_EQ(result.scopes, std::vector<ScopePath>{"a"});
    EXPECT_EQ(sync_->status("b"), SyncStatus::Idle);
}

TEST_F(SyncCoordinatorTest, StartTwiceFails) {
    sync_->declare_scope("a");
    EXPECT_TRUE(sync_->start_sync("a").ok());
    EXPECT_EQ(*sync_->start_sync("a").error, SyncError::AlreadySyncing);
}

TEST_F(SyncCoordinatorTest, CompleteReportsReadyDependents) {
    sync_->declare_scope("a");
    sync_->declare_scope("x");
    sync_->declare_scope("b", {"a"});
    sync_->declare_scope("c", {"a", "x"});

    sync_->start_sync("a");
    auto result = sync_->complete_sync("a");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.scopes, std::vector<ScopePath>{"b"});

    // Reported, not started
    EXPECT_EQ(sync_->status("b"), SyncStatus::Idle);
}

TEST_F(SyncCoordinatorTest, CompleteRequiresSyncing) {
    sync_->declare_scope("a");
    EXPECT_EQ(*sync_->complete_sync("a").error, SyncError::InvalidTransition);
    EXPECT_EQ(*sync_->fail_sync("a", "boom").error, SyncError::InvalidTransition);
    EXPECT_EQ(*sync_->complete_sync("zz").error, SyncError::UnknownScope);
}

TEST_F(SyncCoordinatorTest, TimestampsFollowTransitions) {
    sync_->declare_scope("a");
    Timestamp started = clock_.now();
    sync_->start_sync("a");
    clock_.advance(5s);
    sync_->complete_sync("a");

    auto op = sync_->get("a");
    ASSERT_TRUE(op.has_value());
    EXPECT_EQ(op->started_at, started);
    EXPECT_EQ(op->completed_at, clock_.now());
}

TEST_F(SyncCoordinatorTest, FailThenRetry) {
    sync_->declare_scope("a");
    sync_->start_sync("a");
    EXPECT_TRUE(sync_->fail_sync("a", "network error").ok());

    auto failed = sync_->get("a");
    EXPECT_EQ(failed->status, SyncStatus::Failed);
    EXPECT_EQ(failed->error, std::string("network error"));

    EXPECT_TRUE(sync_->start_sync("a").ok());
    auto retried = sync_->get("a");
    EXPECT_EQ(retried->status, SyncStatus::Syncing);
    EXPECT_FALSE(retried->error.has_value());
    EXPECT_EQ(retried->retry_count, 1u);
}

TEST_F(SyncCoordinatorTest, FailedDependencyBlocksDependents) {
    declare_chain();
    sync_->start_sync("a");
    sync_->fail_sync("a", "boom");
    auto check = sync_->check_dependencies("b");
    EXPECT_FALSE(check.ready);
    EXPECT_EQ(check.unmet, std::vector<ScopePath>{"a"});
}

TEST_F(SyncCoordinatorTest, CheckDependenciesOnUnknownScope) {
    auto check = sync_->check_dependencies("zz");
    EXPECT_FALSE(check.ready);
    EXPECT_TRUE(check.unmet.empty());
}

// ===========================================================================
// 4. Re-sync invalidation
// ===========================================================================

TEST_F(SyncCoordinatorTest, ResyncInvalidatesCompletedDependents) {
    declare_chain();
    run_to_completion("a");
    run_to_completion("b");
    run_to_completion("c");

    auto result = sync_->start_sync("a");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.scopes, (std::vector<ScopePath>{"b", "c"}));
    EXPECT_EQ(sync_->status("a"), SyncStatus::Syncing);
    EXPECT_EQ(sync_->status("b"), SyncStatus::Idle);
    EXPECT_EQ(sync_->status("c"), SyncStatus::Idle);
    EXPECT_FALSE(sync_->get("b")->completed_at.has_value());
}

TEST_F(SyncCoordinatorTest, ResyncRejectedWhileDependentSyncing) {
    declare_chain();
    run_to_completion("a");
    sync_->start_sync("b");

    auto result = sync_->start_sync("a");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(*result.error, SyncError::DependentSyncing);
    EXPECT_EQ(result.scopes, std::vector<ScopePath>{"b"});
    EXPECT_EQ(sync_->status("a"), SyncStatus::Completed);
}

// ===========================================================================
// 5. Queries and compensation
// ===========================================================================

TEST_F(SyncCoordinatorTest, GraphQueries) {
    declare_chain();
    sync_->declare_scope("d", {"a"});

    EXPECT_EQ(sync_->dependents("a"), (std::vector<ScopePath>{"b", "d"}));
    EXPECT_EQ(sync_->transitive_dependents("a"), (std::vector<ScopePath>{"b", "c", "d"}));
    EXPECT_EQ(sync_->scopes(), (std::vector<ScopePath>{"a", "b", "c", "d"}));

    run_to_completion("a");
    EXPECT_EQ(sync_->scopes_in(SyncStatus::Completed), std::vector<ScopePath>{"a"});

    auto stats = sync_->statistics();
    EXPECT_EQ(stats.total_scopes, 4u);
    EXPECT_EQ(stats.completed, 1u);
    EXPECT_EQ(stats.idle, 3u);
}

TEST_F(SyncCoordinatorTest, HistoryRecordsTransitions) {
    sync_->declare_scope("a");
    sync_->start_sync("a");
    sync_->fail_sync("a", "boom");

    auto history = sync_->history();
    ASSERT_EQ(history.size(), 3u);
    EXPECT_FALSE(history[0].from.has_value());
    EXPECT_EQ(history[1].to, SyncStatus::Syncing);
    EXPECT_EQ(history[2].to, SyncStatus::Failed);
    EXPECT_EQ(history[2].error, std::string("boom"));
}

TEST_F(SyncCoordinatorTest, RestoreAndErase) {
    sync_->declare_scope("a");
    auto before = *sync_->get("a");
    sync_->start_sync("a");

    sync_->restore({before});
    EXPECT_EQ(sync_->status("a"), SyncStatus::Idle);

    sync_->erase("a");
    EXPECT_FALSE(sync_->contains("a"));
}
