#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <random>
#include "../include/common.hpp"
#include "../include/game/board.hpp"
#include "../include/game/evaluator.hpp"
#include "../include/search/transposition_cache.hpp"
#include "../include/search/killer_table.hpp"
#include "../include/search/alphabeta.hpp"
#include "../include/rollout/rollout_evaluator.hpp"
#include "../include/engine/scorer.hpp"
#include "../include/selfplay/game.hpp"

namespace py = pybind11;

PYBIND11_MODULE(tictac_cpp, m) {
    m.doc() = "C++ alpha-beta and rollout engine for Tic-Tac-Toe";

    py::enum_<tictac::Side>(m, "Side")
        .value("MAXIMIZER", tictac::Side::Maximizer)
        .value("MINIMIZER", tictac::Side::Minimizer);

    m.attr("WIN_SCORE") = tictac::kWinScore;
    m.def("opponent", &tictac::opponent, "The other side");
    m.def("symbol", [](tictac::Side side) { return std::string(1, tictac::symbol(side)); },
          "Display symbol of a side");

    // Board value type
    py::class_<tictac::game::Move>(m, "Move")
        .def_readonly("row", &tictac::game::Move::row)
        .def_readonly("col", &tictac::game::Move::col)
        .def_readonly("mask", &tictac::game::Move::mask);

    py::class_<tictac::game::Board>(m, "Board")
        .def(py::init<>())
        .def(py::init<tictac::BoardBits>(), py::arg("bits"))
        .def("place",
             py::overload_cast<int, int, tictac::Side>(&tictac::game::Board::place, py::const_),
             py::arg("row"), py::arg("col"), py::arg("side"),
             "New board with the cell taken, None if occupied")
        .def("legal_moves", &tictac::game::Board::legal_moves, py::arg("side"))
        .def("empty_count", &tictac::game::Board::empty_count)
        .def("is_full", &tictac::game::Board::is_full)
        .def("winner", &tictac::game::Board::winner)
        .def("at", &tictac::game::Board::at, py::arg("row"), py::arg("col"))
        .def_property_readonly("bits", &tictac::game::Board::bits)
        .def_static("parse", &tictac::game::Board::parse, py::arg("text"))
        .def("__str__", &tictac::game::Board::to_string)
        .def("__eq__", &tictac::game::Board::operator==)
        .def("__hash__", [](const tictac::game::Board& b) { return b.bits(); });

    m.def("new_game", &tictac::game::new_game);
    m.def("legal_successors", &tictac::game::legal_successors, py::arg("state"), py::arg("side"));
    m.def("terminal_score", &tictac::game::terminal_score, py::arg("board"));
    m.def("heuristic_score", &tictac::game::heuristic_score, py::arg("board"));

    // Search state
    py::class_<tictac::search::TranspositionCache>(m, "TranspositionCache")
        .def(py::init<>())
        .def("lookup", &tictac::search::TranspositionCache::lookup)
        .def("__len__", &tictac::search::TranspositionCache::size)
        .def("clear", &tictac::search::TranspositionCache::clear);

    py::class_<tictac::search::KillerTable>(m, "KillerTable")
        .def(py::init<size_t>(), py::arg("capacity") = tictac::search::kDefaultKillerCapacity)
        .def("entries", [](const tictac::search::KillerTable& k) {
            return std::vector<tictac::MoveMask>(k.entries().begin(), k.entries().end());
        })
        .def("__len__", &tictac::search::KillerTable::size)
        .def("clear", &tictac::search::KillerTable::clear);

    py::class_<tictac::search::SearchConfig>(m, "SearchConfig")
        .def(py::init<>())
        .def_readwrite("enable_cache", &tictac::search::SearchConfig::enable_cache)
        .def_readwrite("enable_heuristic_ordering", &tictac::search::SearchConfig::enable_heuristic_ordering)
        .def_readwrite("enable_killer_ordering", &tictac::search::SearchConfig::enable_killer_ordering)
        .def_readwrite("killer_capacity", &tictac::search::SearchConfig::killer_capacity);

    py::class_<tictac::search::SearchStats>(m, "SearchStats")
        .def_readonly("nodes", &tictac::search::SearchStats::nodes)
        .def_readonly("cache_hits", &tictac::search::SearchStats::cache_hits)
        .def_readonly("cutoffs", &tictac::search::SearchStats::cutoffs);

    // The search keeps references to the cache and killer table
    py::class_<tictac::search::AlphaBetaSearch>(m, "AlphaBetaSearch")
        .def(py::init<const tictac::search::SearchConfig&,
                      tictac::search::TranspositionCache&,
                      tictac::search::KillerTable&>(),
             py::arg("config"), py::arg("cache"), py::arg("killers"),
             py::keep_alive<1, 3>(), py::keep_alive<1, 4>())
        .def("search", &tictac::search::AlphaBetaSearch::search,
             py::arg("state"), py::arg("to_move"),
             py::arg("alpha") = -tictac::kInfinity, py::arg("beta") = tictac::kInfinity)
        .def("stats", &tictac::search::AlphaBetaSearch::stats)
        .def("reset_stats", &tictac::search::AlphaBetaSearch::reset_stats);

    m.def("minimax",
          [](const tictac::game::Board& state, tictac::Side to_move) {
              return tictac::search::minimax(state, to_move);
          },
          py::arg("state"), py::arg("to_move"), "Exhaustive minimax without pruning");

    // Random generator shared by rollouts and self-play
    py::class_<std::mt19937>(m, "Rng")
        .def(py::init<std::mt19937::result_type>(), py::arg("seed"));

    py::class_<tictac::rollout::RolloutEvaluator>(m, "RolloutEvaluator")
        .def(py::init<std::mt19937&, int>(),
             py::arg("rng"), py::arg("num_playouts") = tictac::rollout::kDefaultPlayouts,
             py::keep_alive<1, 2>())
        .def("estimate", &tictac::rollout::RolloutEvaluator::estimate,
             py::arg("state"), py::arg("side"));

    // Move scorers
    py::class_<tictac::MoveScorer, std::shared_ptr<tictac::MoveScorer>>(m, "MoveScorer")
        .def("score", &tictac::MoveScorer::score, py::arg("successor"), py::arg("mover"))
        .def("maximizes", &tictac::MoveScorer::maximizes, py::arg("mover"))
        .def("nodes", &tictac::MoveScorer::nodes)
        .def("name", &tictac::MoveScorer::name);

    py::class_<tictac::AlphaBetaScorer, tictac::MoveScorer, std::shared_ptr<tictac::AlphaBetaScorer>>(m, "AlphaBetaScorer")
        .def(py::init<const tictac::search::SearchConfig&>(),
             py::arg("config") = tictac::search::SearchConfig{});

    py::class_<tictac::MinimaxScorer, tictac::MoveScorer, std::shared_ptr<tictac::MinimaxScorer>>(m, "MinimaxScorer")
        .def(py::init<bool>(), py::arg("memoize") = false);

    py::class_<tictac::RolloutScorer, tictac::MoveScorer, std::shared_ptr<tictac::RolloutScorer>>(m, "RolloutScorer")
        .def(py::init<std::mt19937&, int>(),
             py::arg("rng"), py::arg("num_playouts") = tictac::rollout::kDefaultPlayouts,
             py::keep_alive<1, 2>());

    // Self-play driver
    py::class_<tictac::selfplay::Ply>(m, "Ply")
        .def_readonly("mover", &tictac::selfplay::Ply::mover)
        .def_readonly("board", &tictac::selfplay::Ply::board)
        .def_readonly("score", &tictac::selfplay::Ply::score)
        .def_readonly("nodes", &tictac::selfplay::Ply::nodes);

    py::class_<tictac::selfplay::SelfPlayGame>(m, "SelfPlayGame")
        .def(py::init<std::shared_ptr<tictac::MoveScorer>, std::mt19937&, tictac::Side>(),
             py::arg("scorer"),
             py::arg("rng"),
             py::arg("first_mover") = tictac::Side::Minimizer,
             py::keep_alive<1, 3>(),
             "Create a self-play game")
        .def("play_game", &tictac::selfplay::SelfPlayGame::play_game, "Play a full game")
        .def("result", &tictac::selfplay::SelfPlayGame::result, "Winner, None for a tie");

    m.attr("__version__") = "0.1.0";
}
