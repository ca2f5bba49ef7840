#pragma once
#include "../game/board.hpp"
#include "../rollout/rollout_evaluator.hpp"
#include "../search/alphabeta.hpp"
#include <cstdint>
#include <random>
#include <string>

namespace tictac {

// Interface through which the game driver rates candidate moves
class MoveScorer {
public:
    virtual ~MoveScorer() = default;

    // Rate the board reached after `mover` played; the opponent moves next
    virtual double score(const game::Board& successor, Side mover) = 0;

    // True when `mover` should take the highest-scored successor
    virtual bool maximizes(Side mover) const = 0;

    // Search work done since the last reset_nodes()
    virtual uint64_t nodes() const = 0;
    virtual void reset_nodes() = 0;

    virtual std::string name() const = 0;
};

// Alpha-beta search with its own cache and killer table for a whole game
class AlphaBetaScorer : public MoveScorer {
public:
    explicit AlphaBetaScorer(const search::SearchConfig& config = search::SearchConfig{});

    double score(const game::Board& successor, Side mover) override;
    bool maximizes(Side mover) const override;
    uint64_t nodes() const override { return search_.stats().nodes; }
    void reset_nodes() override { search_.reset_stats(); }
    std::string name() const override { return "alphabeta"; }

    const search::TranspositionCache& cache() const { return cache_; }
    const search::KillerTable& killers() const { return killers_; }

private:
    search::TranspositionCache cache_;
    search::KillerTable killers_;
    search::AlphaBetaSearch search_;
};

// Exhaustive minimax without pruning, optionally memoized
class MinimaxScorer : public MoveScorer {
public:
    explicit MinimaxScorer(bool memoize = false);

    double score(const game::Board& successor, Side mover) override;
    bool maximizes(Side mover) const override;
    uint64_t nodes() const override { return nodes_; }
    void reset_nodes() override { nodes_ = 0; }
    std::string name() const override { return "minimax"; }

private:
    bool memoize_;
    search::TranspositionCache cache_;
    uint64_t nodes_;
};

// Random playouts: rates a successor by the opponent's estimated win rate,
// so every mover picks the lowest score.
class RolloutScorer : public MoveScorer {
public:
    explicit RolloutScorer(std::mt19937& rng, int num_playouts = rollout::kDefaultPlayouts);

    double score(const game::Board& successor, Side mover) override;
    bool maximizes(Side mover) const override;
    // Playouts sampled; settled successors cost none
    uint64_t nodes() const override { return evaluator_.playouts_run(); }
    void reset_nodes() override { evaluator_.reset_playouts_run(); }
    std::string name() const override { return "rollout"; }

private:
    rollout::RolloutEvaluator evaluator_;
};

} // namespace tictac
