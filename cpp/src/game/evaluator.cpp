#include "../../include/game/evaluator.hpp"

namespace tictac::game {

namespace {

constexpr int kLineWeights[] = {0, 1, 10, 100};

} // namespace

std::optional<Score> terminal_score(const Board& board) {
    auto won = board.winner();
    if (won.has_value()) {
        return won.value() == Side::Maximizer ? kWinScore : -kWinScore;
    }
    if (board.is_full()) {
        return 0;  // Draw
    }
    return std::nullopt;  // Game ongoing
}

int heuristic_score(const Board& board) {
    BoardBits x = board.maximizer_cells();
    BoardBits o = board.minimizer_cells();

    int score = 0;
    for (BoardBits line : kLines) {
        int count_x = bitcount(x & line);
        int count_o = bitcount(o & line);
        if (count_x > 0 && count_o == 0) {
            score += kLineWeights[count_x];
        } else if (count_o > 0 && count_x == 0) {
            score -= kLineWeights[count_o];
        }
    }
    return score;
}

} // namespace tictac::game
