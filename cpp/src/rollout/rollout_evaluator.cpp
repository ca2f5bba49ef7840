#include "../../include/rollout/rollout_evaluator.hpp"
#include <stdexcept>

namespace tictac::rollout {

RolloutEvaluator::RolloutEvaluator(std::mt19937& rng, int num_playouts)
    : rng_(rng), num_playouts_(num_playouts), playouts_run_(0) {
    if (num_playouts_ <= 0) {
        throw std::invalid_argument("Playout count must be positive");
    }
}

std::optional<Side> RolloutEvaluator::playout(const game::Board& state, Side to_move) {
    game::Board step = state;
    Side who = validate(to_move);
    playouts_run_++;

    auto won = step.winner();
    while (!won.has_value() && !step.is_full()) {
        std::vector<game::Move> moves = step.legal_moves(who);
        std::uniform_int_distribution<size_t> pick(0, moves.size() - 1);
        step = step.place(moves[pick(rng_)].mask);
        who = opponent(who);
        won = step.winner();
    }
    return won;
}

double RolloutEvaluator::estimate(const game::Board& state, Side side) {
    validate(side);

    // Settled games need no sampling
    if (auto won = state.winner()) {
        return won.value() == side ? 1.0 : 0.0;
    }

    int wins = 0;
    for (int i = 0; i < num_playouts_; i++) {
        auto result = playout(state, side);
        if (result.has_value() && result.value() == side) {
            wins++;
        }
    }
    return static_cast<double>(wins) / num_playouts_;
}

} // namespace tictac::rollout
