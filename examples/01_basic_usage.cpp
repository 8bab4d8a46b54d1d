// 01_basic_usage.cpp
//
// Minimal CoordGuard example: two agents, one scope.
// Demonstrates the agent lifecycle and exclusive scope locks.
//
// Scenario:
//   - Two agents join and start working.
//   - Both want to edit the same scope; only one gets the lock.
//   - The holder finishes and releases, the second agent retries and wins.
//   - Leaving force-releases anything an agent still holds.

#include <coordguard/coordguard.hpp>

#include <iostream>
#include <memory>
#include <string>

using namespace coordguard;
using namespace std::chrono_literals;

namespace {

void print_response(const std::string& what, const Response& r) {
    std::cout << "  " << what << ": ";
    if (r.ok()) {
        std::cout << "ok";
    } else {
        std::cout << "error " << to_string(*r.error);
    }
    if (r.acquired) std::cout << " (acquired)";
    std::cout << "\n";
}

} // anonymous namespace

int main() {
    std::cout << "=== CoordGuard: Basic Usage Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. Create the service with default configuration.
    // ----------------------------------------------------------------
    Config config;
    config.lock_timeout = 30s;
    CoordinationService service(config);

    // Attach a console monitor so we can see what happens internally.
    service.set_monitor(
        std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Verbose));

    // ----------------------------------------------------------------
    // 2. Declare the scope the agents will contend for.
    // ----------------------------------------------------------------
    service.declare_scope("src/parser");

    // ----------------------------------------------------------------
    // 3. Two agents join and begin working.
    // ----------------------------------------------------------------
    print_response("alpha joins", service.agent_join("alpha"));
    print_response("beta joins", service.agent_join("beta"));
    service.set_state("alpha", AgentState::Working);
    service.set_state("beta", AgentState::Working);

    // Working -> Idle is not a legal transition.
    print_response("beta Working -> Idle", service.set_state("beta", AgentState::Idle));

    // ----------------------------------------------------------------
    // 4. Contend for the scope.
    // ----------------------------------------------------------------
    std::cout << "\n--- Lock contention ---\n";
    print_response("alpha acquires src/parser", service.acquire_lock("src/parser", "alpha"));
    print_response("beta acquires src/parser", service.acquire_lock("src/parser", "beta"));
    print_response("beta releases src/parser", service.release_lock("src/parser", "beta"));

    print_response("alpha releases src/parser", service.release_lock("src/parser", "alpha"));
    print_response("beta retries src/parser", service.acquire_lock("src/parser", "beta"));

    // ----------------------------------------------------------------
    // 5. Leaving releases whatever the agent still holds.
    // ----------------------------------------------------------------
    std::cout << "\n--- Leave ---\n";
    print_response("beta leaves", service.agent_leave("beta"));
    auto holder = service.locks().holder("src/parser");
    std::cout << "  src/parser holder after leave: "
              << (holder ? *holder : std::string("<none>")) << "\n";

    // ----------------------------------------------------------------
    // 6. Final status.
    // ----------------------------------------------------------------
    auto status = service.status();
    std::cout << "\nAgents: " << status.total_agents
              << ", held locks: " << status.held_locks
              << ", violations: " << service.validate().size() << "\n";

    std::cout << "\n=== Done ===\n";
    return 0;
}
