#include "../../include/engine/scorer.hpp"

namespace tictac {

AlphaBetaScorer::AlphaBetaScorer(const search::SearchConfig& config)
    : killers_(config.killer_capacity), search_(config, cache_, killers_) {}

double AlphaBetaScorer::score(const game::Board& successor, Side mover) {
    return search_.search(successor, opponent(mover));
}

bool AlphaBetaScorer::maximizes(Side mover) const {
    return validate(mover) == Side::Maximizer;
}

MinimaxScorer::MinimaxScorer(bool memoize)
    : memoize_(memoize), nodes_(0) {}

double MinimaxScorer::score(const game::Board& successor, Side mover) {
    return search::minimax(successor, opponent(mover), memoize_ ? &cache_ : nullptr, &nodes_);
}

bool MinimaxScorer::maximizes(Side mover) const {
    return validate(mover) == Side::Maximizer;
}

RolloutScorer::RolloutScorer(std::mt19937& rng, int num_playouts)
    : evaluator_(rng, num_playouts) {}

double RolloutScorer::score(const game::Board& successor, Side mover) {
    return evaluator_.estimate(successor, opponent(mover));
}

bool RolloutScorer::maximizes(Side mover) const {
    validate(mover);
    return false;  // minimize the opponent's estimate for either side
}

} // namespace tictac
