#pragma once
#include "../common.hpp"
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace tictac::game {

struct Move {
    int row;
    int col;
    MoveMask mask;  // bit on the mover's half
};

// Immutable 18-bit tic-tac-toe board. Cell (0,0) is the most significant
// bit of each half; the maximizer owns the upper half.
class Board {
public:
    constexpr Board() : bits_(0) {}
    // Throws std::invalid_argument for bits above bit 17 or a cell held by both sides
    explicit Board(BoardBits bits);

    // Bit of (row, col) on the half owned by side
    static MoveMask mask(int row, int col, Side side);

    // Mover's mask when (row, col) is free, nullopt otherwise
    std::optional<MoveMask> check(int row, int col, Side side) const;

    // New board with the cell taken, nullopt when it is already occupied
    std::optional<Board> place(int row, int col, Side side) const;

    // Unchecked placement of a mask returned by check()
    Board place(MoveMask mask) const { return Board(bits_ | mask, Unchecked{}); }

    // Free cells in row-major order
    std::vector<Move> legal_moves(Side side) const;

    int empty_count() const;
    bool is_full() const { return empty_count() == 0; }
    std::optional<Side> winner() const;

    // Occupant of a cell, nullopt when empty
    std::optional<Side> at(int row, int col) const;

    BoardBits bits() const { return bits_; }
    BoardBits maximizer_cells() const { return (bits_ >> kNumCells) & kHalfMask; }
    BoardBits minimizer_cells() const { return bits_ & kHalfMask; }

    std::string to_string() const;
    static Board parse(const std::string& text);

    bool operator==(const Board& other) const { return bits_ == other.bits_; }
    bool operator!=(const Board& other) const { return bits_ != other.bits_; }

private:
    struct Unchecked {};
    constexpr Board(BoardBits bits, Unchecked) : bits_(bits) {}

    BoardBits bits_;
};

std::ostream& operator<<(std::ostream& os, const Board& board);

// Population count of a 32-bit word
int bitcount(uint32_t v);

// Driver-facing helpers
Board new_game();
std::vector<Board> legal_successors(const Board& state, Side side);
std::optional<Side> winner(const Board& state);
bool is_full(const Board& state);

} // namespace tictac::game
