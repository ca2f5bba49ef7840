#include "../../include/game/board.hpp"
#include <sstream>
#include <stdexcept>

namespace tictac {

Side validate(Side side) {
    if (side != Side::Maximizer && side != Side::Minimizer) {
        throw std::invalid_argument("Invalid side tag: " +
                                    std::to_string(static_cast<int>(side)));
    }
    return side;
}

Side opponent(Side side) {
    return validate(side) == Side::Maximizer ? Side::Minimizer : Side::Maximizer;
}

char symbol(Side side) {
    return validate(side) == Side::Maximizer ? 'X' : 'O';
}

} // namespace tictac

namespace tictac::game {

namespace {

const char* const kSeparator = "---+---+---";

void check_cell(int row, int col) {
    if (row < 0 || row >= kBoardSize || col < 0 || col >= kBoardSize) {
        throw std::out_of_range("Cell out of range: (" + std::to_string(row) +
                                ", " + std::to_string(col) + ")");
    }
}

} // namespace

int bitcount(uint32_t v) {
    v = v - ((v >> 1) & 0x55555555);
    v = (v & 0x33333333) + ((v >> 2) & 0x33333333);
    return static_cast<int>((((v + (v >> 4)) & 0x0F0F0F0F) * 0x01010101) >> 24);
}

Board::Board(BoardBits bits)
    : bits_(bits) {
    if (bits & ~kBoardMask) {
        throw std::invalid_argument("Board bits outside the 18-bit layout: " + std::to_string(bits));
    }
    if (maximizer_cells() & minimizer_cells()) {
        throw std::invalid_argument("Cell held by both sides: " + std::to_string(bits));
    }
}

MoveMask Board::mask(int row, int col, Side side) {
    check_cell(row, col);
    int offset = kBoardSize * (2 - row) + (2 - col);
    if (validate(side) == Side::Maximizer) {
        offset += kNumCells;
    }
    return MoveMask{1} << offset;
}

std::optional<MoveMask> Board::check(int row, int col, Side side) const {
    MoveMask own = mask(row, col, side);
    MoveMask other = mask(row, col, opponent(side));
    if ((own | other) & bits_) {
        return std::nullopt;  // cell already taken
    }
    return own;
}

std::optional<Board> Board::place(int row, int col, Side side) const {
    auto slot = check(row, col, side);
    if (!slot) {
        return std::nullopt;
    }
    return Board(bits_ | *slot, Unchecked{});
}

std::vector<Move> Board::legal_moves(Side side) const {
    std::vector<Move> moves;
    moves.reserve(kNumCells);
    for (int row = 0; row < kBoardSize; row++) {
        for (int col = 0; col < kBoardSize; col++) {
            if (auto slot = check(row, col, side)) {
                moves.push_back(Move{row, col, *slot});
            }
        }
    }
    return moves;
}

int Board::empty_count() const {
    return kNumCells - bitcount(bits_);
}

std::optional<Side> Board::winner() const {
    BoardBits o = minimizer_cells();
    BoardBits x = maximizer_cells();
    for (BoardBits line : kLines) {
        if ((o & line) == line) {
            return Side::Minimizer;
        }
        if ((x & line) == line) {
            return Side::Maximizer;
        }
    }
    return std::nullopt;
}

std::optional<Side> Board::at(int row, int col) const {
    if (bits_ & mask(row, col, Side::Maximizer)) {
        return Side::Maximizer;
    }
    if (bits_ & mask(row, col, Side::Minimizer)) {
        return Side::Minimizer;
    }
    return std::nullopt;
}

std::string Board::to_string() const {
    std::ostringstream out;
    for (int row = 0; row < kBoardSize; row++) {
        if (row > 0) {
            out << '\n' << kSeparator << '\n';
        }
        for (int col = 0; col < kBoardSize; col++) {
            auto who = at(row, col);
            out << (col == 0 ? " " : " | ") << (who ? symbol(*who) : ' ');
        }
    }
    return out.str();
}

Board Board::parse(const std::string& text) {
    /*
     * Inverse of to_string(): three cell rows separated by "---+---+---".
     * Cell symbols sit at columns 1, 5 and 9 of a row line; a missing
     * trailing blank is read as an empty cell.
     */
    std::istringstream in(text);
    std::string line;
    BoardBits bits = 0;
    int row = 0;
    int line_no = 0;

    while (std::getline(in, line)) {
        if (line_no % 2 == 1) {
            if (line != kSeparator) {
                throw std::invalid_argument("Malformed board separator: '" + line + "'");
            }
        } else {
            if (row >= kBoardSize) {
                throw std::invalid_argument("Too many board rows");
            }
            for (int col = 0; col < kBoardSize; col++) {
                size_t pos = 1 + 4 * static_cast<size_t>(col);
                char c = pos < line.size() ? line[pos] : ' ';
                if (c == 'X') {
                    bits |= mask(row, col, Side::Maximizer);
                } else if (c == 'O') {
                    bits |= mask(row, col, Side::Minimizer);
                } else if (c != ' ') {
                    throw std::invalid_argument(std::string("Unknown cell symbol '") + c + "'");
                }
            }
            row++;
        }
        line_no++;
    }

    if (row != kBoardSize) {
        throw std::invalid_argument("Board text must contain 3 rows");
    }
    return Board(bits, Unchecked{});
}

std::ostream& operator<<(std::ostream& os, const Board& board) {
    return os << board.to_string();
}

Board new_game() {
    return Board();
}

std::vector<Board> legal_successors(const Board& state, Side side) {
    std::vector<Board> successors;
    for (const Move& move : state.legal_moves(side)) {
        successors.push_back(state.place(move.mask));
    }
    return successors;
}

std::optional<Side> winner(const Board& state) {
    return state.winner();
}

bool is_full(const Board& state) {
    return state.is_full();
}

} // namespace tictac::game
