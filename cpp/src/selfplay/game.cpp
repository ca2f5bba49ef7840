#include "../../include/selfplay/game.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

namespace tictac::selfplay {

SelfPlayGame::SelfPlayGame(std::shared_ptr<MoveScorer> scorer,
                           std::mt19937& rng,
                           Side first_mover)
    : scorer_(std::move(scorer)),
      rng_(rng),
      first_mover_(validate(first_mover)) {
    if (!scorer_) {
        throw std::invalid_argument("SelfPlayGame requires a scorer");
    }
}

Ply SelfPlayGame::choose_move(const game::Board& state, Side mover) {
    std::vector<game::Board> successors = game::legal_successors(state, mover);
    if (successors.empty()) {
        throw std::logic_error("No legal move on a full board");
    }

    scorer_->reset_nodes();
    std::vector<std::pair<game::Board, double>> candidates;
    for (const game::Board& next : successors) {
        candidates.emplace_back(next, scorer_->score(next, mover));
    }

    // Shuffle so equal scores are broken at random
    std::shuffle(candidates.begin(), candidates.end(), rng_);

    auto by_score = [](const auto& a, const auto& b) { return a.second < b.second; };
    auto best = scorer_->maximizes(mover)
        ? std::max_element(candidates.begin(), candidates.end(), by_score)
        : std::min_element(candidates.begin(), candidates.end(), by_score);

    return Ply{mover, best->first, best->second, scorer_->nodes()};
}

std::vector<Ply> SelfPlayGame::play_game() {
    board_ = game::new_game();
    result_.reset();

    std::vector<Ply> history;
    Side mover = first_mover_;

    while (!board_.winner().has_value() && !board_.is_full()) {
        Ply ply = choose_move(board_, mover);
        board_ = ply.board;
        history.push_back(ply);
        mover = opponent(mover);
    }

    result_ = board_.winner();
    return history;
}

uint32_t parse_seed(const std::string& text) {
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) {
        throw std::invalid_argument("seed must be a non-negative integer");
    }
    size_t used = 0;
    unsigned long long value = std::stoull(text, &used);
    if (used != text.size()) {
        throw std::invalid_argument("trailing characters after seed");
    }
    if (value > std::numeric_limits<uint32_t>::max()) {
        throw std::out_of_range("seed exceeds 32 bits");
    }
    return static_cast<uint32_t>(value);
}

} // namespace tictac::selfplay
