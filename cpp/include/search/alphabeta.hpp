#pragma once
#include "../game/board.hpp"
#include "killer_table.hpp"
#include "transposition_cache.hpp"
#include <cstdint>

namespace tictac::search {

// Engine switches. Every combination yields the same search values; they
// only change how many nodes are visited.
struct SearchConfig {
    bool enable_cache = false;
    bool enable_heuristic_ordering = false;
    bool enable_killer_ordering = true;
    size_t killer_capacity = kDefaultKillerCapacity;
};

struct SearchStats {
    uint64_t nodes = 0;       // nodes expanded or evaluated, cache hits excluded
    uint64_t cache_hits = 0;
    uint64_t cutoffs = 0;
};

/**
 * Alpha-beta minimax over tic-tac-toe boards.
 *
 * The transposition cache and killer table are owned by the caller so they
 * can be scoped to a single search or shared across a whole game.
 */
class AlphaBetaSearch {
public:
    // Throws std::invalid_argument when killers.capacity() differs from
    // config.killer_capacity
    AlphaBetaSearch(const SearchConfig& config, TranspositionCache& cache, KillerTable& killers);

    /**
     * Exact minimax value of `state` with `to_move` about to play.
     *
     * @param alpha Value the maximizer can already guarantee elsewhere
     * @param beta Value the minimizer can already guarantee elsewhere
     */
    Score search(const game::Board& state, Side to_move,
                 Score alpha = -kInfinity, Score beta = kInfinity);

    const SearchConfig& config() const { return config_; }
    const SearchStats& stats() const { return stats_; }
    void reset_stats() { stats_ = SearchStats{}; }

private:
    struct Child {
        MoveMask mask;
        game::Board board;
    };

    std::vector<Child> ordered_children(const game::Board& state, Side to_move) const;

    SearchConfig config_;
    TranspositionCache& cache_;
    KillerTable& killers_;
    SearchStats stats_;
};

// Plain exhaustive minimax without pruning. Memoizes into `cache` when one
// is given; `nodes` (optional) accumulates the number of visited nodes.
Score minimax(const game::Board& state, Side to_move,
              TranspositionCache* cache = nullptr, uint64_t* nodes = nullptr);

} // namespace tictac::search
