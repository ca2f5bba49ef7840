#pragma once
#include "../game/board.hpp"
#include <cstddef>
#include <optional>
#include <unordered_map>

namespace tictac::search {

// Memo of exact minimax values keyed by (board, side to move).
// Entries are write-once: the first value stored for a key is kept.
class TranspositionCache {
public:
    std::optional<Score> lookup(const game::Board& board, Side to_move) const;

    // Returns false when the key was already present (value left unchanged)
    bool store(const game::Board& board, Side to_move, Score value);

    bool contains(const game::Board& board, Side to_move) const;
    size_t size() const { return entries_.size(); }
    void clear() { entries_.clear(); }

private:
    static uint32_t key(const game::Board& board, Side to_move);

    std::unordered_map<uint32_t, Score> entries_;
};

} // namespace tictac::search
