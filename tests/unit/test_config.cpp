#include <gtest/gtest.h>
#include <coordguard/coordguard.hpp>

using namespace coordguard;
using namespace std::chrono_literals;

TEST(ConfigTest, Defaults) {
    Config config;
    EXPECT_EQ(config.max_agents, 1024u);
    EXPECT_EQ(config.max_concurrent_agents, 3u);
    EXPECT_EQ(config.max_block_time, Duration(300s));
    EXPECT_EQ(config.lock_timeout, Duration(60s));
    EXPECT_FALSE(config.strict_validation);
    EXPECT_TRUE(config.validation_enabled);
    EXPECT_EQ(config.max_locks_per_agent, 1u);
    EXPECT_FALSE(config.sweep_interval.has_value());
    EXPECT_NO_THROW(validate(config));
}

TEST(ConfigTest, SweepIntervalDefaultsToHalfLockTimeout) {
    Config config;
    EXPECT_EQ(effective_sweep_interval(config), Duration(30s));

    config.sweep_interval = 5s;
    EXPECT_EQ(effective_sweep_interval(config), Duration(5s));
}

TEST(ConfigTest, RejectsZeroLockTimeout) {
    Config config;
    config.lock_timeout = Duration::zero();
    try {
        validate(config);
        FAIL() << "expected InvalidConfigException";
    } catch (const InvalidConfigException& e) {
        EXPECT_EQ(e.setting(), "lock_timeout");
    }
}

TEST(ConfigTest, RejectsZeroLimits) {
    Config agents;
    agents.max_agents = 0;
    EXPECT_THROW(validate(agents), InvalidConfigException);

    Config locks;
    locks.max_locks_per_agent = 0;
    EXPECT_THROW(validate(locks), InvalidConfigException);

    Config concurrent;
    concurrent.max_concurrent_agents = 0;
    EXPECT_THROW(validate(concurrent), InvalidConfigException);
}

TEST(ConfigTest, RejectsNonPositiveDurations) {
    Config block;
    block.max_block_time = -1s;
    EXPECT_THROW(validate(block), InvalidConfigException);

    Config sweep;
    sweep.sweep_interval = Duration::zero();
    EXPECT_THROW(validate(sweep), CoordGuardException);
}

TEST(ConfigTest, ServiceConstructorValidates) {
    Config config;
    config.lock_timeout = Duration::zero();
    EXPECT_THROW(CoordinationService service(config), InvalidConfigException);
}
