#pragma once
#include <array>
#include <cstdint>
#include <limits>
#include <string>

namespace tictac {

// Scores are small integers; terminal values are +kWinScore, -kWinScore or 0
using Score = int;

constexpr Score kWinScore = 10;
constexpr Score kInfinity = std::numeric_limits<Score>::max();

// Raw 18-bit board encoding: bits 9-17 maximizer (X), bits 0-8 minimizer (O)
using BoardBits = uint32_t;

// Single-bit mask of a move on the mover's half of the board
using MoveMask = uint32_t;

constexpr int kBoardSize = 3;
constexpr int kNumCells = kBoardSize * kBoardSize;
constexpr BoardBits kHalfMask = 0x1FF;
constexpr BoardBits kBoardMask = 0x3FFFF;

// Maximizer plays X, minimizer plays O
enum class Side : int8_t {
    Maximizer = 1,
    Minimizer = -1,
};

// Throws std::invalid_argument for a tag outside the two sides
Side validate(Side side);
Side opponent(Side side);
char symbol(Side side);

// The 8 winning lines on one 9-bit half: rows, columns, diagonals
constexpr std::array<BoardBits, 8> kLines = {
    0b000000111, 0b000111000, 0b111000000,  // rows
    0b001001001, 0b010010010, 0b100100100,  // cols
    0b100010001, 0b001010100                // diags
};

} // namespace tictac
