// 03_concurrent_agents.cpp
//
// Several agent threads sharing a handful of scopes under strict
// validation, with the background sweep reclaiming abandoned locks.
//
// Scenario:
//   - Six agents, four scopes, at most three agents Working on locks.
//   - Strict mode rolls back any acquire that would exceed that limit.
//   - One agent "crashes" while holding a lock; the sweep reclaims it
//     after lock_timeout.

#include <coordguard/coordguard.hpp>

#include <atomic>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <vector>

using namespace coordguard;
using namespace std::chrono_literals;

int main() {
    std::cout << "=== CoordGuard: Concurrent Agents Example ===\n\n";

    Config config;
    config.strict_validation = true;
    config.max_concurrent_agents = 3;
    config.lock_timeout = 200ms;
    config.sweep_interval = 50ms;

    CoordinationService service(config);

    auto metrics = std::make_shared<MetricsMonitor>();
    auto composite = std::make_shared<CompositeMonitor>();
    composite->add_monitor(std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Normal));
    composite->add_monitor(metrics);
    service.set_monitor(composite);

    const std::vector<ScopePath> scopes = {"src/a", "src/b", "src/c", "src/d"};
    for (const auto& s : scopes) {
        service.declare_scope(s);
    }

    service.start();

    // ----------------------------------------------------------------
    // 1. A crashed agent: takes a lock and never releases it.
    // ----------------------------------------------------------------
    service.agent_join("crashy");
    service.set_state("crashy", AgentState::Working);
    service.acquire_lock("src/d", "crashy");

    // ----------------------------------------------------------------
    // 2. Worker agents.
    // ----------------------------------------------------------------
    constexpr int NUM_AGENTS = 6;
    std::atomic<int> done_ops{0};
    std::atomic<int> rollbacks{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < NUM_AGENTS; ++i) {
        threads.emplace_back([&, i]() {
            AgentId id = "worker-" + std::to_string(i);
            std::mt19937 rng(static_cast<unsigned>(i + 1));
            std::uniform_int_distribution<std::size_t> pick(0, scopes.size() - 1);

            service.agent_join(id);
            service.set_state(id, AgentState::Working);

            for (int op = 0; op < 20; ++op) {
                const auto& scope = scopes[pick(rng)];
                auto r = service.acquire_lock(scope, id);
                if (r.rolled_back) {
                    rollbacks.fetch_add(1);
                }
                if (r.acquired) {
                    std::this_thread::sleep_for(5ms);
                    service.release_lock(scope, id);
                    done_ops.fetch_add(1);
                } else {
                    std::this_thread::sleep_for(2ms);
                }
            }

            service.set_state(id, AgentState::Completed);
            service.agent_leave(id);
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    // Give the sweep time to reclaim crashy's lock
    std::this_thread::sleep_for(300ms);
    service.stop();

    auto m = metrics->get_metrics();
    std::cout << "\nCompleted lock sessions: " << done_ops.load() << "\n";
    std::cout << "Strict-mode rollbacks:   " << rollbacks.load() << "\n";
    std::cout << "Locks granted/denied:    " << m.locks_granted << "/" << m.locks_denied << "\n";
    std::cout << "Locks expired:           " << m.locks_expired << "\n";
    std::cout << "Sweeps run:              " << m.sweeps << "\n";
    std::cout << "src/d holder:            "
              << service.locks().holder("src/d").value_or("<none>") << "\n";

    std::cout << "\n=== Done ===\n";
    return 0;
}
