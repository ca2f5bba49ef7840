#include "../../include/search/alphabeta.hpp"
#include "../../include/game/evaluator.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace tictac::search {

AlphaBetaSearch::AlphaBetaSearch(const SearchConfig& config, TranspositionCache& cache, KillerTable& killers)
    : config_(config), cache_(cache), killers_(killers) {
    if (killers_.capacity() != config_.killer_capacity) {
        throw std::invalid_argument("Killer table capacity " + std::to_string(killers_.capacity()) +
                                    " does not match config " + std::to_string(config_.killer_capacity));
    }
}

std::vector<AlphaBetaSearch::Child> AlphaBetaSearch::ordered_children(const game::Board& state,
                                                                      Side to_move) const {
    std::vector<Child> children;
    for (const game::Move& move : state.legal_moves(to_move)) {
        children.push_back(Child{move.mask, state.place(move.mask)});
    }

    if (config_.enable_heuristic_ordering) {
        std::stable_sort(children.begin(), children.end(), [](const Child& a, const Child& b) {
            return game::heuristic_score(a.board) > game::heuristic_score(b.board);
        });
    }

    // Killer moves first, row-major (or heuristic) order otherwise preserved
    if (config_.enable_killer_ordering) {
        std::stable_partition(children.begin(), children.end(), [this](const Child& c) {
            return killers_.contains(c.mask);
        });
    }

    return children;
}

Score AlphaBetaSearch::search(const game::Board& state, Side to_move, Score alpha, Score beta) {
    validate(to_move);

    if (config_.enable_cache) {
        if (auto cached = cache_.lookup(state, to_move)) {
            stats_.cache_hits++;
            return *cached;
        }
    }

    stats_.nodes++;

    if (auto exact = game::terminal_score(state)) {
        return *exact;
    }

    std::vector<Child> children = ordered_children(state, to_move);
    if (children.empty()) {
        throw std::logic_error("Non-terminal board without legal moves: " +
                               std::to_string(state.bits()));
    }

    const Score alpha_in = alpha;
    const Score beta_in = beta;
    const Side next = opponent(to_move);
    Score value;

    if (to_move == Side::Maximizer) {
        value = -kInfinity;
        for (const Child& child : children) {
            value = std::max(value, search(child.board, next, alpha, beta));
            alpha = std::max(alpha, value);
            if (alpha >= beta) {
                stats_.cutoffs++;
                killers_.push(child.mask);
                break;  // beta cut-off
            }
        }
    } else {
        value = kInfinity;
        for (const Child& child : children) {
            value = std::min(value, search(child.board, next, alpha, beta));
            beta = std::min(beta, value);
            if (alpha >= beta) {
                stats_.cutoffs++;
                break;  // alpha cut-off
            }
        }
    }

    // Fail-high and fail-low results are only bounds; cache exact values only
    if (config_.enable_cache && alpha_in < value && value < beta_in) {
        cache_.store(state, to_move, value);
    }

    return value;
}

Score minimax(const game::Board& state, Side to_move, TranspositionCache* cache, uint64_t* nodes) {
    validate(to_move);

    if (cache) {
        if (auto cached = cache->lookup(state, to_move)) {
            return *cached;
        }
    }
    if (nodes) {
        (*nodes)++;
    }

    if (auto exact = game::terminal_score(state)) {
        return *exact;
    }

    Side next = opponent(to_move);
    bool maximizing = to_move == Side::Maximizer;
    Score value = maximizing ? -kInfinity : kInfinity;

    for (const game::Board& child : game::legal_successors(state, to_move)) {
        Score child_value = minimax(child, next, cache, nodes);
        value = maximizing ? std::max(value, child_value) : std::min(value, child_value);
    }

    if (cache) {
        cache->store(state, to_move, value);
    }
    return value;
}

} // namespace tictac::search
