#pragma once

#include <algorithm>
#include <cstddef>
#include <deque>

namespace cryguard {

// Fixed-capacity history; pushing at capacity evicts the oldest entry.
// Not thread-safe: owned by a single evaluator.
template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity) : capacity_(std::max<size_t>(1, capacity)) {}

    void push(const T& item) {
        if (items_.size() >= capacity_) items_.pop_front();
        items_.push_back(item);
    }

    // Shrinking keeps the most recent entries.
    void set_capacity(size_t capacity) {
        capacity_ = std::max<size_t>(1, capacity);
        while (items_.size() > capacity_) items_.pop_front();
    }

    size_t count(const T& value) const {
        return static_cast<size_t>(std::count(items_.begin(), items_.end(), value));
    }

    template <typename Pred>
    bool all_of(Pred pred) const {
        return std::all_of(items_.begin(), items_.end(), pred);
    }

    size_t size() const { return items_.size(); }
    size_t capacity() const { return capacity_; }
    bool full() const { return items_.size() == capacity_; }

    typename std::deque<T>::const_iterator begin() const { return items_.begin(); }
    typename std::deque<T>::const_iterator end() const { return items_.end(); }

private:
    size_t capacity_;
    std::deque<T> items_;
};

}  // namespace cryguard
