#pragma once
#include "board.hpp"
#include <optional>

namespace tictac::game {

// Exact value of a finished game: +kWinScore, -kWinScore or 0 for a draw.
// nullopt while the game is still open.
std::optional<Score> terminal_score(const Board& board);

// Line-count heuristic, maximizer positive. A line held by one side only
// scores 1, 10 or 100 for 1, 2 or 3 cells; mixed and empty lines score 0.
// Only meaningful for ordering sibling moves.
int heuristic_score(const Board& board);

} // namespace tictac::game
