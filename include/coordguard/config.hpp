#pragma once

#include "coordguard/types.hpp"
#include <cstddef>
#include <optional>

namespace coordguard {

struct Config {
    // Maximum number of agents that can be registered simultaneously
    std::size_t max_agents = 1024;

    // Maximum number of agents that may be Working while holding a lock
    std::size_t max_concurrent_agents = 3;

    // Blocked agents are flagged once they exceed this
    Duration max_block_time = std::chrono::seconds(300);

    // Lifetime of an acquired lock before the sweep reclaims it
    Duration lock_timeout = std::chrono::seconds(60);

    // Roll back mutations that introduce a safety violation
    bool strict_validation = false;

    // If false, operations skip the post-mutation safety validation
    bool validation_enabled = true;

    std::size_t max_locks_per_agent = 1;
    std::size_t max_dependencies_per_scope = 16;

    // Background sweep period (defaults to lock_timeout / 2)
    std::optional<Duration> sweep_interval;

    // Bounded audit histories (oldest evicted first)
    std::size_t lock_history_capacity = 1024;
    std::size_t violation_history_capacity = 1024;
    std::size_t transition_history_capacity = 1024;
    std::size_t sync_history_capacity = 1024;
};

// Throws InvalidConfigException describing the first invalid setting.
void validate(const Config& config);

Duration effective_sweep_interval(const Config& config);

} // namespace coordguard
