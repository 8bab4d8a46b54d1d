#include "coordguard/config.hpp"
#include "coordguard/exceptions.hpp"

#include <algorithm>

namespace coordguard {

void validate(const Config& config) {
    if (config.max_agents == 0) {
        throw InvalidConfigException("max_agents", "must be greater than zero");
    }
    if (config.max_concurrent_agents == 0) {
        throw InvalidConfigException("max_concurrent_agents", "must be greater than zero");
    }
    if (config.max_block_time <= Duration::zero()) {
        throw InvalidConfigException("max_block_time", "must be positive");
    }
    if (config.lock_timeout <= Duration::zero()) {
        throw InvalidConfigException("lock_timeout", "must be positive");
    }
    if (config.max_locks_per_agent == 0) {
        throw InvalidConfigException("max_locks_per_agent", "must be greater than zero");
    }
    if (config.sweep_interval.has_value() && *config.sweep_interval <= Duration::zero()) {
        throw InvalidConfigException("sweep_interval", "must be positive when set");
    }
}

Duration effective_sweep_interval(const Config& config) {
    if (config.sweep_interval.has_value()) {
        return *config.sweep_interval;
    }
    return std::max(config.lock_timeout / 2, Duration(1));
}

} // namespace coordguard
