#pragma once

#include <cstddef>
#include <deque>
#include <utility>
#include <vector>

namespace coordguard {

// Fixed-capacity audit buffer. Oldest entries are evicted first.
// Not synchronized: the owning component guards it with its own mutex.
template <typename T>
class BoundedHistory {
public:
    explicit BoundedHistory(std::size_t capacity) : capacity_(capacity) {}

    void push(T item) {
        ++total_recorded_;
        if (capacity_ == 0) return;
        if (items_.size() == capacity_) {
            items_.pop_front();
        }
        items_.push_back(std::move(item));
    }

    // Oldest first
    std::vector<T> snapshot() const {
        return std::vector<T>(items_.begin(), items_.end());
    }

    std::size_t size() const noexcept { return items_.size(); }
    std::size_t capacity() const noexcept { return capacity_; }
    bool empty() const noexcept { return items_.empty(); }

    // Everything ever pushed, including evicted entries
    std::size_t total_recorded() const noexcept { return total_recorded_; }

    void clear() { items_.clear(); }

private:
    std::size_t capacity_;
    std::size_t total_recorded_{0};
    std::deque<T> items_;
};

} // namespace coordguard
