#pragma once
#include "../common.hpp"
#include <cstddef>
#include <deque>

namespace tictac::search {

constexpr size_t kDefaultKillerCapacity = 4;

// Bounded FIFO of move masks that recently caused a beta cut-off.
// Only biases move ordering; a stale entry never changes a search value.
class KillerTable {
public:
    explicit KillerTable(size_t capacity = kDefaultKillerCapacity);

    // Append a killer, evicting the oldest entry beyond capacity
    void push(MoveMask mask);
    bool contains(MoveMask mask) const;

    size_t size() const { return masks_.size(); }
    size_t capacity() const { return capacity_; }
    const std::deque<MoveMask>& entries() const { return masks_; }
    void clear() { masks_.clear(); }

private:
    size_t capacity_;
    std::deque<MoveMask> masks_;
};

} // namespace tictac::search
