#pragma once
#include "../game/board.hpp"
#include <cstdint>
#include <random>

namespace tictac::rollout {

constexpr int kDefaultPlayouts = 500;

// Flat Monte Carlo estimate of a side's winning chances.
class RolloutEvaluator {
public:
    RolloutEvaluator(std::mt19937& rng, int num_playouts = kDefaultPlayouts);

    // Fraction of random playouts from `state` won by `side`, with `side`
    // making the first move. Exactly 1.0 / 0.0 for an already won state.
    double estimate(const game::Board& state, Side side);

    // One uniformly random playout; returns the winner, nullopt on a draw
    std::optional<Side> playout(const game::Board& state, Side to_move);

    int num_playouts() const { return num_playouts_; }

    // Playouts actually sampled since construction or the last reset
    uint64_t playouts_run() const { return playouts_run_; }
    void reset_playouts_run() { playouts_run_ = 0; }

private:
    std::mt19937& rng_;
    int num_playouts_;
    uint64_t playouts_run_;
};

} // namespace tictac::rollout
