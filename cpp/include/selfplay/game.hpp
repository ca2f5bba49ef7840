#pragma once
#include "../engine/scorer.hpp"
#include "../game/board.hpp"
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace tictac::selfplay {

// One move of a finished game
struct Ply {
    Side mover;
    game::Board board;  // position after the move
    double score;       // scorer's rating of the chosen successor
    uint64_t nodes;     // scorer work spent choosing it
};

/**
 * Automated self-play: both sides use the same scorer.
 *
 * Each turn every legal successor is scored, the candidates are shuffled
 * with the shared generator and the first extremal one is played.
 */
class SelfPlayGame {
public:
    SelfPlayGame(std::shared_ptr<MoveScorer> scorer,
                 std::mt19937& rng,
                 Side first_mover = Side::Minimizer);

    // Play one full game from the empty board and return its moves
    std::vector<Ply> play_game();

    // Pick the next position for `mover`
    Ply choose_move(const game::Board& state, Side mover);

    // Winner of the last game, nullopt for a tie
    std::optional<Side> result() const { return result_; }
    const game::Board& final_board() const { return board_; }

private:
    std::shared_ptr<MoveScorer> scorer_;
    std::mt19937& rng_;
    Side first_mover_;
    game::Board board_;
    std::optional<Side> result_;
};

// Decimal seed for the shared generator. Throws std::invalid_argument for
// signs or trailing characters and std::out_of_range above 2^32 - 1.
uint32_t parse_seed(const std::string& text);

} // namespace tictac::selfplay
