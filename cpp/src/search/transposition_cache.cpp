#include "../../include/search/transposition_cache.hpp"

namespace tictac::search {

uint32_t TranspositionCache::key(const game::Board& board, Side to_move) {
    // 18 board bits, side in the lowest bit
    uint32_t side_bit = validate(to_move) == Side::Maximizer ? 1u : 0u;
    return (board.bits() << 1) | side_bit;
}

std::optional<Score> TranspositionCache::lookup(const game::Board& board, Side to_move) const {
    auto it = entries_.find(key(board, to_move));
    if (it != entries_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool TranspositionCache::store(const game::Board& board, Side to_move, Score value) {
    return entries_.emplace(key(board, to_move), value).second;
}

bool TranspositionCache::contains(const game::Board& board, Side to_move) const {
    return entries_.count(key(board, to_move)) > 0;
}

} // namespace tictac::search
