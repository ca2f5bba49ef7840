#include <cstdio>
#include <exception>
#include <iostream>
#include <memory>
#include <random>
#include <string>

#include "../include/engine/scorer.hpp"
#include "../include/selfplay/game.hpp"

namespace {

void usage(const char* prog) {
    std::cerr << "usage: " << prog << " <seed> [minimax|alphabeta|rollout]\n";
}

std::shared_ptr<tictac::MoveScorer> make_scorer(const std::string& engine, std::mt19937& prng) {
    if (engine == "minimax") {
        return std::make_shared<tictac::MinimaxScorer>();
    }
    if (engine == "alphabeta") {
        return std::make_shared<tictac::AlphaBetaScorer>();
    }
    if (engine == "rollout") {
        return std::make_shared<tictac::RolloutScorer>(prng);
    }
    return nullptr;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2 || argc > 3) {
        usage(argv[0]);
        return 1;
    }

    // deterministic seeding from command line is mandatory.
    uint32_t seed;
    try {
        seed = tictac::selfplay::parse_seed(argv[1]);
    } catch (const std::exception& e) {
        std::cerr << "invalid seed '" << argv[1] << "': " << e.what() << "\n";
        usage(argv[0]);
        return 1;
    }

    std::string engine = argc > 2 ? argv[2] : "alphabeta";
    std::mt19937 prng(seed);
    auto scorer = make_scorer(engine, prng);
    if (!scorer) {
        std::cerr << "unknown engine '" << engine << "'\n";
        usage(argv[0]);
        return 1;
    }

    try {
        tictac::selfplay::SelfPlayGame game(scorer, prng);
        for (const auto& ply : game.play_game()) {
            char mover = tictac::symbol(ply.mover);
            std::cout << "\n";
            if (engine == "rollout") {
                char buf[64];
                std::snprintf(buf, sizeof(buf), "%c move on score %f:", mover, ply.score);
                std::cout << buf << "\n";
            } else {
                std::cout << mover << " move after " << ply.nodes << " search steps:\n";
            }
            std::cout << ply.board << "\n";
        }

        auto winner = game.result();
        std::cout << "\n";
        if (!winner) {
            std::cout << "Tied\n";
        } else {
            std::cout << tictac::symbol(*winner) << " has won\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "fatal: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
