#pragma once

#include <coordguard/coordguard.hpp>

#include <algorithm>
#include <chrono>
#include <mutex>
#include <vector>

namespace coordguard::testing {

// Manually advanced wall clock. Starts at a fixed instant so timestamps in
// assertions are reproducible.
class ManualClock {
public:
    ManualClock() : now_(Timestamp(std::chrono::seconds(1700000000))) {}

    Timestamp now() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void advance(Duration d) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += d;
    }

    TimeSource source() {
        return [this] { return now(); };
    }

private:
    mutable std::mutex mutex_;
    Timestamp now_;
};

// Monitor that records all events for verification
class TestMonitor : public Monitor {
public:
    void on_event(const MonitorEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    void on_status(const SystemStatus& status) override {
        std::lock_guard<std::mutex> lock(mutex_);
        statuses_.push_back(status);
    }

    std::vector<MonitorEvent> get_events() {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    std::vector<MonitorEvent> get_events_of_type(EventType type) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<MonitorEvent> filtered;
        for (const auto& e : events_) {
            if (e.type == type) {
                filtered.push_back(e);
            }
        }
        return filtered;
    }

    std::size_t count(EventType type) {
        return get_events_of_type(type).size();
    }

    std::vector<SystemStatus> get_statuses() {
        std::lock_guard<std::mutex> lock(mutex_);
        return statuses_;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.clear();
        statuses_.clear();
    }

private:
    std::mutex mutex_;
    std::vector<MonitorEvent> events_;
    std::vector<SystemStatus> statuses_;
};

inline bool has_violation(const std::vector<SafetyViolation>& violations, ViolationKind kind) {
    return std::any_of(violations.begin(), violations.end(),
        [kind](const SafetyViolation& v) { return v.kind() == kind; });
}

inline std::size_t count_violations(const std::vector<SafetyViolation>& violations,
                                    ViolationKind kind) {
    return static_cast<std::size_t>(std::count_if(violations.begin(), violations.end(),
        [kind](const SafetyViolation& v) { return v.kind() == kind; }));
}

} // namespace coordguard::testing
