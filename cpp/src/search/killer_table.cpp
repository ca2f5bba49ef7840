#include "../../include/search/killer_table.hpp"
#include <algorithm>

namespace tictac::search {

KillerTable::KillerTable(size_t capacity)
    : capacity_(capacity) {}

void KillerTable::push(MoveMask mask) {
    if (capacity_ == 0) {
        return;
    }
    masks_.push_back(mask);
    if (masks_.size() > capacity_) {
        masks_.pop_front();
    }
}

bool KillerTable::contains(MoveMask mask) const {
    return std::find(masks_.begin(), masks_.end(), mask) != masks_.end();
}

} // namespace tictac::search
