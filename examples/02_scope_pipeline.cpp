// 02_scope_pipeline.cpp
//
// Dependency-ordered sync across a small pipeline of scopes.
//
// Scenario:
//   - schema <- models <- api <- docs
//   - A scope may only start syncing once every dependency is Completed.
//   - Completing a scope reports which dependents are now ready.
//   - A failed sync is retried; a cycle is rejected at declaration time.
//   - Re-syncing a Completed scope resets its Completed dependents.

#include <coordguard/coordguard.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace coordguard;

namespace {

std::string join(const std::vector<ScopePath>& scopes) {
    std::string out;
    for (const auto& s : scopes) {
        if (!out.empty()) out += ", ";
        out += s;
    }
    return out.empty() ? "-" : out;
}

void report(const std::string& what, const Response& r) {
    std::cout << "  " << what << ": "
              << (r.ok() ? std::string("ok") : "error " + to_string(*r.error))
              << " [" << join(r.scopes) << "]\n";
}

} // anonymous namespace

int main() {
    std::cout << "=== CoordGuard: Scope Pipeline Example ===\n\n";

    CoordinationService service;
    service.set_monitor(
        std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Normal));

    // ----------------------------------------------------------------
    // 1. Declare the pipeline.
    // ----------------------------------------------------------------
    report("declare schema", service.declare_scope("schema"));
    report("declare models", service.declare_scope("models", {"schema"}));
    report("declare api", service.declare_scope("api", {"models"}));
    report("declare docs", service.declare_scope("docs", {"api", "models"}));

    // schema -> docs would close a loop.
    report("redeclare schema on docs", service.declare_scope("schema", {"docs"}));

    // ----------------------------------------------------------------
    // 2. Sync in dependency order.
    // ----------------------------------------------------------------
    std::cout << "\n--- Ordered sync ---\n";
    report("start api (too early)", service.start_sync("api"));
    report("start schema", service.start_sync("schema"));
    report("complete schema", service.complete_sync("schema"));
    report("start models", service.start_sync("models"));
    report("fail models", service.fail_sync("models", "migration conflict"));
    report("retry models", service.start_sync("models"));
    report("complete models", service.complete_sync("models"));
    report("start api", service.start_sync("api"));
    report("complete api", service.complete_sync("api"));

    // ----------------------------------------------------------------
    // 3. Re-sync the root: Completed dependents drop back to Idle.
    // ----------------------------------------------------------------
    std::cout << "\n--- Re-sync ---\n";
    report("start schema again", service.start_sync("schema"));
    for (const auto& scope : service.sync().scopes()) {
        auto st = service.sync().status(scope);
        std::cout << "  " << scope << ": " << to_string(*st) << "\n";
    }

    auto stats = service.sync().statistics();
    std::cout << "\nScopes: " << stats.total_scopes
              << " (syncing " << stats.syncing
              << ", completed " << stats.completed
              << ", idle " << stats.idle << ")\n";

    std::cout << "\n=== Done ===\n";
    return 0;
}
