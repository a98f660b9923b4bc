#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <memory>
#include "cribbage/config.hpp"
#include "cribbage/game.hpp"
#include "cribbage/rules.hpp"
#include "cribbage/scoring.hpp"
#include "cribbage/simulator.hpp"

namespace py = pybind11;

namespace {

cribbage::Game make_random_game(const cribbage::GameConfig& config,
                                cribbage::RandomStrategy::PlayOrder order) {
    return cribbage::Game(config,
        std::unique_ptr<cribbage::Strategy>(new cribbage::RandomStrategy(order)),
        std::unique_ptr<cribbage::Strategy>(new cribbage::RandomStrategy(order)));
}

} // namespace

PYBIND11_MODULE(_cribbage_core, m) {
    m.doc() = "Two-player cribbage scoring engine and game simulator";

    // Expose constants
    m.attr("NUM_RANKS") = cribbage::NUM_RANKS;
    m.attr("NUM_SUITS") = cribbage::NUM_SUITS;
    m.attr("DECK_SIZE") = cribbage::DECK_SIZE;
    m.attr("WINNING_SCORE") = cribbage::WINNING_SCORE;
    m.attr("MAX_PLAY_COUNT") = cribbage::MAX_PLAY_COUNT;

    py::register_exception<cribbage::PolicyError>(m, "PolicyError");

    // Card helpers (cards are ints 0-51, rank * 4 + suit)
    m.def("make_card", &cribbage::make_card, py::arg("rank"), py::arg("suit"));
    m.def("get_rank", &cribbage::get_rank, py::arg("card"));
    m.def("get_suit", &cribbage::get_suit, py::arg("card"));
    m.def("count_value", &cribbage::count_value, py::arg("card"));
    m.def("card_to_string", &cribbage::card_to_string, py::arg("card"));
    m.def("parse_card", &cribbage::parse_card, py::arg("text"));
    m.def("parse_cards", &cribbage::parse_cards, py::arg("text"));

    py::enum_<cribbage::ScoreCategory>(m, "ScoreCategory")
        .value("FIFTEENS", cribbage::ScoreCategory::FIFTEENS)
        .value("PAIRS", cribbage::ScoreCategory::PAIRS)
        .value("RUNS", cribbage::ScoreCategory::RUNS)
        .value("FLUSH", cribbage::ScoreCategory::FLUSH)
        .value("NOBS", cribbage::ScoreCategory::NOBS)
        .value("PLAY_FIFTEEN", cribbage::ScoreCategory::PLAY_FIFTEEN)
        .value("PLAY_PAIR", cribbage::ScoreCategory::PLAY_PAIR)
        .value("PLAY_RUN", cribbage::ScoreCategory::PLAY_RUN)
        .value("PLAY_GO", cribbage::ScoreCategory::PLAY_GO)
        .value("PLAY_THIRTY_ONE", cribbage::ScoreCategory::PLAY_THIRTY_ONE)
        .value("HEELS", cribbage::ScoreCategory::HEELS)
        .export_values();

    py::class_<cribbage::ScoreBreakdown>(m, "ScoreBreakdown")
        .def(py::init<>())
        .def("get", &cribbage::ScoreBreakdown::get, py::arg("category"))
        .def("total", &cribbage::ScoreBreakdown::total)
        .def("to_map", &cribbage::ScoreBreakdown::to_map,
             "Nonzero categories keyed by name")
        .def("__repr__", [](const cribbage::ScoreBreakdown& b) {
            return "<ScoreBreakdown total=" + std::to_string(b.total()) +
                   " " + b.describe() + ">";
        });

    m.def("score_hand", &cribbage::score_hand,
          py::arg("hand"), py::arg("starter"), py::arg("is_crib") = false,
          "Score a 4-card hand or crib with its starter");
    m.def("score_play", &cribbage::score_play,
          py::arg("sequence"), py::arg("card"),
          "Score one pegging play onto the current sequence");

    py::enum_<cribbage::Phase>(m, "Phase")
        .value("DEAL", cribbage::Phase::DEAL)
        .value("DISCARD", cribbage::Phase::DISCARD)
        .value("CUT", cribbage::Phase::CUT)
        .value("PLAY", cribbage::Phase::PLAY)
        .value("COUNT", cribbage::Phase::COUNT)
        .value("GAME_OVER", cribbage::Phase::GAME_OVER)
        .export_values();

    py::enum_<cribbage::TurnAction>(m, "TurnAction")
        .value("PLAYED", cribbage::TurnAction::PLAYED)
        .value("GO", cribbage::TurnAction::GO)
        .value("EXHAUSTED", cribbage::TurnAction::EXHAUSTED)
        .export_values();

    py::enum_<cribbage::RandomStrategy::PlayOrder>(m, "PlayOrder")
        .value("FIRST_LEGAL", cribbage::RandomStrategy::FIRST_LEGAL)
        .value("RANDOM_LEGAL", cribbage::RandomStrategy::RANDOM_LEGAL)
        .export_values();

    py::class_<cribbage::PeggingEvent>(m, "PeggingEvent")
        .def_readonly("player", &cribbage::PeggingEvent::player)
        .def_readonly("action", &cribbage::PeggingEvent::action)
        .def_readonly("card", &cribbage::PeggingEvent::card)
        .def_readonly("count", &cribbage::PeggingEvent::count)
        .def_readonly("scorer", &cribbage::PeggingEvent::scorer)
        .def_readonly("breakdown", &cribbage::PeggingEvent::breakdown)
        .def_readonly("cycle_reset", &cribbage::PeggingEvent::cycle_reset);

    py::class_<cribbage::PlayerDealRecord>(m, "PlayerDealRecord")
        .def_readonly("name", &cribbage::PlayerDealRecord::name)
        .def_readonly("dealt", &cribbage::PlayerDealRecord::dealt)
        .def_readonly("kept", &cribbage::PlayerDealRecord::kept)
        .def_readonly("discards", &cribbage::PlayerDealRecord::discards)
        .def_readonly("hand_breakdown", &cribbage::PlayerDealRecord::hand_breakdown)
        .def_readonly("hand_counted", &cribbage::PlayerDealRecord::hand_counted)
        .def_readonly("score_before", &cribbage::PlayerDealRecord::score_before)
        .def_readonly("score_after", &cribbage::PlayerDealRecord::score_after);

    py::class_<cribbage::DealRecord>(m, "DealRecord")
        .def_readonly("game_id", &cribbage::DealRecord::game_id)
        .def_readonly("hand_id", &cribbage::DealRecord::hand_id)
        .def_readonly("dealer", &cribbage::DealRecord::dealer)
        .def_readonly("players", &cribbage::DealRecord::players)
        .def_readonly("crib", &cribbage::DealRecord::crib)
        .def_readonly("crib_breakdown", &cribbage::DealRecord::crib_breakdown)
        .def_readonly("crib_counted", &cribbage::DealRecord::crib_counted)
        .def_readonly("starter", &cribbage::DealRecord::starter)
        .def_readonly("his_heels", &cribbage::DealRecord::his_heels)
        .def_readonly("pegging", &cribbage::DealRecord::pegging)
        .def_readonly("game_over", &cribbage::DealRecord::game_over)
        .def_readonly("winner", &cribbage::DealRecord::winner);

    py::class_<cribbage::GameSummary>(m, "GameSummary")
        .def_readonly("game_id", &cribbage::GameSummary::game_id)
        .def_readonly("winner", &cribbage::GameSummary::winner)
        .def_readonly("names", &cribbage::GameSummary::names)
        .def_readonly("final_scores", &cribbage::GameSummary::final_scores)
        .def_readonly("play_points", &cribbage::GameSummary::play_points)
        .def_readonly("count_points", &cribbage::GameSummary::count_points)
        .def_readonly("heels_points", &cribbage::GameSummary::heels_points)
        .def_readonly("hands_played", &cribbage::GameSummary::hands_played)
        .def_readonly("seed", &cribbage::GameSummary::seed)
        .def("winner_name", &cribbage::GameSummary::winner_name)
        .def("__repr__", [](const cribbage::GameSummary& s) {
            return "<GameSummary game=" + std::to_string(s.game_id) +
                   " winner=" + s.winner_name() +
                   " score=" + std::to_string(s.final_scores[0]) + "-" +
                   std::to_string(s.final_scores[1]) + ">";
        });

    py::class_<cribbage::GameConfig>(m, "GameConfig")
        .def(py::init<>())
        .def_readwrite("player1_name", &cribbage::GameConfig::player1_name)
        .def_readwrite("player2_name", &cribbage::GameConfig::player2_name)
        .def_readwrite("seed", &cribbage::GameConfig::seed)
        .def_readwrite("game_id", &cribbage::GameConfig::game_id)
        .def_readwrite("track_seed", &cribbage::GameConfig::track_seed)
        .def_readwrite("first_dealer", &cribbage::GameConfig::first_dealer);

    // Game with the default strategy on both seats
    py::class_<cribbage::Game>(m, "Game")
        .def(py::init(&make_random_game),
             py::arg("config"),
             py::arg("play_order") = cribbage::RandomStrategy::FIRST_LEGAL)
        .def("step", &cribbage::Game::step, "Execute the current phase")
        .def("play_deal", [](cribbage::Game& game) { return game.play_deal(); },
             "Play until the current deal ends")
        .def("play_game", [](cribbage::Game& game) { return game.play_game(); },
             "Play to 121")
        .def_property_readonly("phase", &cribbage::Game::phase)
        .def_property_readonly("is_over", &cribbage::Game::is_over)
        .def_property_readonly("winner", &cribbage::Game::winner)
        .def_property_readonly("dealer", &cribbage::Game::dealer)
        .def_property_readonly("hands_played", &cribbage::Game::hands_played)
        .def_property_readonly("starter", &cribbage::Game::starter)
        .def_property_readonly("pegging_count", &cribbage::Game::pegging_count)
        .def("score", [](const cribbage::Game& game, int seat) {
            return game.player(seat).score;
        }, py::arg("seat"))
        .def("hand", [](const cribbage::Game& game, int seat) {
            return game.player(seat).hand;
        }, py::arg("seat"))
        .def("crib", [](const cribbage::Game& game) { return game.crib(); })
        .def("pegging_sequence", [](const cribbage::Game& game) {
            return game.pegging_sequence();
        })
        .def("last_deal", [](const cribbage::Game& game) { return game.last_deal(); })
        .def("summary", [](const cribbage::Game& game) { return game.summary(); })
        .def("__repr__", [](const cribbage::Game& game) {
            return std::string("<Game phase=") + cribbage::phase_name(game.phase()) +
                   " score=" + std::to_string(game.player(0).score) + "-" +
                   std::to_string(game.player(1).score) + ">";
        });

    py::class_<cribbage::SimulationConfig>(m, "SimulationConfig")
        .def(py::init<>())
        .def_readwrite("n_games", &cribbage::SimulationConfig::n_games)
        .def_readwrite("verbosity", &cribbage::SimulationConfig::verbosity)
        .def_readwrite("track_states", &cribbage::SimulationConfig::track_states)
        .def_readwrite("debug", &cribbage::SimulationConfig::debug)
        .def_readwrite("n_threads", &cribbage::SimulationConfig::n_threads)
        .def_readwrite("play_order", &cribbage::SimulationConfig::play_order)
        .def_property("base_seed",
            [](const cribbage::SimulationConfig& c) -> py::object {
                if (!c.has_base_seed) return py::none();
                return py::int_(c.base_seed);
            },
            [](cribbage::SimulationConfig& c, py::object seed) {
                c.has_base_seed = !seed.is_none();
                c.base_seed = c.has_base_seed ? seed.cast<uint64_t>() : 0;
            });

    py::class_<cribbage::SimulationResult>(m, "SimulationResult")
        .def_readonly("games", &cribbage::SimulationResult::games)
        .def_readonly("wins", &cribbage::SimulationResult::wins)
        .def_readonly("total_hands", &cribbage::SimulationResult::total_hands)
        .def("average_hands", &cribbage::SimulationResult::average_hands)
        .def("win_rate", &cribbage::SimulationResult::win_rate, py::arg("seat"));

    py::class_<cribbage::Simulator>(m, "Simulator")
        .def(py::init<const cribbage::SimulationConfig&>(), py::arg("config"))
        .def("run", &cribbage::Simulator::run,
             py::call_guard<py::gil_scoped_release>(),
             "Play the whole batch")
        .def("replay", &cribbage::Simulator::replay,
             py::arg("seed"), py::arg("game_id") = 1,
             "Replay one game from its seed")
        .def_property_readonly("seeds", &cribbage::Simulator::seeds)
        .def_property_readonly("base_seed", &cribbage::Simulator::base_seed)
        .def("__repr__", [](const cribbage::Simulator& sim) {
            return "<Simulator n_games=" + std::to_string(sim.config().n_games) + ">";
        });
}
