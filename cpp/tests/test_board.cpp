#include <gtest/gtest.h>
#include "game/board.hpp"
#include <set>
#include <stdexcept>

using tictac::Side;
using tictac::game::Board;

namespace {

// Every position reachable by alternating play, stopping at finished games
void collect_reachable(const Board& board, Side to_move, std::set<tictac::BoardBits>& seen) {
    if (!seen.insert(board.bits()).second) {
        return;
    }
    if (board.winner() || board.is_full()) {
        return;
    }
    for (const Board& next : tictac::game::legal_successors(board, to_move)) {
        collect_reachable(next, tictac::opponent(to_move), seen);
    }
}

bool holds_line(tictac::BoardBits half) {
    for (tictac::BoardBits line : tictac::kLines) {
        if ((half & line) == line) {
            return true;
        }
    }
    return false;
}

} // namespace

TEST(BoardTest, EmptyBoard) {
    Board board = tictac::game::new_game();
    EXPECT_EQ(board.bits(), 0u);
    EXPECT_EQ(board.empty_count(), 9);
    EXPECT_FALSE(board.is_full());
    EXPECT_FALSE(board.winner().has_value());
}

TEST(BoardTest, MaskLayout) {
    EXPECT_EQ(Board::mask(0, 0, Side::Maximizer), 1u << 17);
    EXPECT_EQ(Board::mask(0, 0, Side::Minimizer), 1u << 8);
    EXPECT_EQ(Board::mask(2, 2, Side::Maximizer), 1u << 9);
    EXPECT_EQ(Board::mask(2, 2, Side::Minimizer), 1u);
    EXPECT_EQ(Board::mask(1, 0, Side::Minimizer), 1u << 5);
}

TEST(BoardTest, PlaceSetsExactlyOneBit) {
    Board board;
    auto next = board.place(1, 2, Side::Maximizer);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->bits(), Board::mask(1, 2, Side::Maximizer));
    EXPECT_EQ(board.bits(), 0u);  // source board untouched
    EXPECT_EQ(next->empty_count(), 8);
    EXPECT_EQ(next->at(1, 2), Side::Maximizer);
    EXPECT_FALSE(next->at(0, 0).has_value());
}

TEST(BoardTest, PlacingOnOccupiedCellIsRejected) {
    for (Side first : {Side::Maximizer, Side::Minimizer}) {
        auto taken = Board().place(2, 1, first);
        ASSERT_TRUE(taken.has_value());
        EXPECT_FALSE(taken->place(2, 1, Side::Maximizer).has_value());
        EXPECT_FALSE(taken->place(2, 1, Side::Minimizer).has_value());
        EXPECT_FALSE(taken->check(2, 1, first).has_value());
    }
}

TEST(BoardTest, OutOfRangeCellThrows) {
    Board board;
    EXPECT_THROW(board.place(3, 0, Side::Maximizer), std::out_of_range);
    EXPECT_THROW(board.place(0, -1, Side::Minimizer), std::out_of_range);
}

TEST(BoardTest, InvalidSideThrows) {
    Side bogus = static_cast<Side>(5);
    EXPECT_THROW(tictac::validate(bogus), std::invalid_argument);
    EXPECT_THROW(tictac::opponent(bogus), std::invalid_argument);
    EXPECT_THROW(Board().place(0, 0, bogus), std::invalid_argument);
}

TEST(BoardTest, SideHelpers) {
    EXPECT_EQ(tictac::opponent(Side::Maximizer), Side::Minimizer);
    EXPECT_EQ(tictac::opponent(Side::Minimizer), Side::Maximizer);
    EXPECT_EQ(tictac::symbol(Side::Maximizer), 'X');
    EXPECT_EQ(tictac::symbol(Side::Minimizer), 'O');
}

TEST(BoardTest, LegalMovesAreRowMajor) {
    Board board = *Board().place(0, 1, Side::Maximizer);
    board = *board.place(2, 0, Side::Minimizer);

    auto moves = board.legal_moves(Side::Maximizer);
    ASSERT_EQ(moves.size(), 7u);
    int expected[][2] = {{0, 0}, {0, 2}, {1, 0}, {1, 1}, {1, 2}, {2, 1}, {2, 2}};
    for (size_t i = 0; i < moves.size(); i++) {
        EXPECT_EQ(moves[i].row, expected[i][0]);
        EXPECT_EQ(moves[i].col, expected[i][1]);
        EXPECT_EQ(moves[i].mask, Board::mask(expected[i][0], expected[i][1], Side::Maximizer));
    }

    auto successors = tictac::game::legal_successors(board, Side::Minimizer);
    ASSERT_EQ(successors.size(), 7u);
    EXPECT_EQ(successors.front(), *board.place(0, 0, Side::Minimizer));
    EXPECT_EQ(successors.back(), *board.place(2, 2, Side::Minimizer));
}

TEST(BoardTest, DetectsEveryLine) {
    for (tictac::BoardBits line : tictac::kLines) {
        EXPECT_EQ(Board(line).winner(), Side::Minimizer);
        EXPECT_EQ(Board(line << 9).winner(), Side::Maximizer);
    }
}

TEST(BoardTest, FullBoardWithoutLineIsDraw) {
    Board board = Board::parse(" X | O | X\n"
                               "---+---+---\n"
                               " X | O | O\n"
                               "---+---+---\n"
                               " O | X | X");
    EXPECT_TRUE(tictac::game::is_full(board));
    EXPECT_FALSE(tictac::game::winner(board).has_value());
    EXPECT_TRUE(board.legal_moves(Side::Maximizer).empty());
}

TEST(BoardTest, RendersGrid) {
    Board board = *Board().place(0, 0, Side::Maximizer);
    board = *board.place(1, 1, Side::Minimizer);
    EXPECT_EQ(board.to_string(),
              " X |   |  \n"
              "---+---+---\n"
              "   | O |  \n"
              "---+---+---\n"
              "   |   |  ");
}

TEST(BoardTest, ParseRejectsMalformedText) {
    EXPECT_THROW(Board::parse(" X | O | Q\n---+---+---\n   |   |  \n---+---+---\n   |   |  "),
                 std::invalid_argument);
    EXPECT_THROW(Board::parse(" X | O |  \n===========\n   |   |  \n---+---+---\n   |   |  "),
                 std::invalid_argument);
    EXPECT_THROW(Board::parse(" X | O |  "), std::invalid_argument);
}

TEST(BoardTest, ReachablePositionsRoundTripAndHaveOneWinner) {
    std::set<tictac::BoardBits> seen;
    std::set<tictac::BoardBits> o_first;
    collect_reachable(Board(), Side::Maximizer, seen);
    collect_reachable(Board(), Side::Minimizer, o_first);
    ASSERT_EQ(seen.size(), 5478u);
    seen.insert(o_first.begin(), o_first.end());

    for (tictac::BoardBits bits : seen) {
        Board board(bits);
        EXPECT_EQ(Board::parse(board.to_string()), board);
        EXPECT_EQ(board.maximizer_cells() & board.minimizer_cells(), 0u);

        bool x_line = holds_line(board.maximizer_cells());
        bool o_line = holds_line(board.minimizer_cells());
        EXPECT_FALSE(x_line && o_line);
        if (!x_line && !o_line) {
            EXPECT_FALSE(board.winner().has_value());
        } else {
            EXPECT_EQ(board.winner(), x_line ? Side::Maximizer : Side::Minimizer);
        }
    }
}

TEST(BoardTest, BitcountMatchesEmptyCount) {
    EXPECT_EQ(tictac::game::bitcount(0), 0);
    EXPECT_EQ(tictac::game::bitcount(0x3FFFF), 18);
    EXPECT_EQ(tictac::game::bitcount(0x20101), 3);
}

TEST(BoardTest, RawBitsMustFitTheLayout) {
    EXPECT_NO_THROW(Board(0x3FE00));
    EXPECT_NO_THROW(Board(0x001FF));
    EXPECT_THROW(Board(1u << 18), std::invalid_argument);
    EXPECT_THROW(Board(1u << 20), std::invalid_argument);
    EXPECT_THROW(Board(1u << 31), std::invalid_argument);

    // (0,0) claimed by both halves
    EXPECT_THROW(Board((1u << 17) | (1u << 8)), std::invalid_argument);
    EXPECT_THROW(Board(0x3FFFF), std::invalid_argument);
}
