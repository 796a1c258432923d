#include <pybind11/pybind11.h>
#include <pybind11/functional.h> // board observer callbacks
#include <pybind11/stl.h> // std::array, std::optional
#include "mancala/board.h"
#include "mancala/engine.h"
#include "mancala/render.h"

namespace py = pybind11;

// ===================================================================
// PYBIND11 MODULE BINDINGS
// ===================================================================

PYBIND11_MODULE(mancala_engine, m) {
    m.doc() = "pybind11 module for the Mancala (Kalah) rules engine";

    m.attr("PITS_PER_SIDE") = mancala::PITS_PER_SIDE;
    m.attr("SLOT_COUNT") = mancala::SLOT_COUNT;
    m.attr("TOTAL_SEEDS") = mancala::TOTAL_SEEDS;
    m.attr("STORES") = py::make_tuple(mancala::STORES[0], mancala::STORES[1]);

    py::enum_<mancala::MoveError>(m, "MoveError")
        .value("STORE_NOT_SELECTABLE", mancala::MoveError::STORE_NOT_SELECTABLE)
        .value("NOT_YOUR_PIT", mancala::MoveError::NOT_YOUR_PIT)
        .value("EMPTY_PIT", mancala::MoveError::EMPTY_PIT)
        .export_values();

    py::enum_<mancala::RoundState>(m, "RoundState")
        .value("IN_PROGRESS", mancala::RoundState::IN_PROGRESS)
        .value("OVER", mancala::RoundState::OVER);

    py::enum_<mancala::Winner>(m, "Winner")
        .value("PLAYER_0", mancala::Winner::PLAYER_0)
        .value("PLAYER_1", mancala::Winner::PLAYER_1)
        .value("TIE", mancala::Winner::TIE);

    py::class_<mancala::Capture>(m, "Capture")
        .def_readonly("player", &mancala::Capture::player)
        .def_readonly("pit", &mancala::Capture::pit)
        .def_readonly("opposite_pit", &mancala::Capture::opposite_pit)
        .def_readonly("seeds", &mancala::Capture::seeds);

    py::class_<mancala::MoveResult>(m, "MoveResult")
        .def_readonly("error", &mancala::MoveResult::error)
        .def_readonly("player", &mancala::MoveResult::player)
        .def_readonly("pit", &mancala::MoveResult::pit)
        .def_readonly("last_index", &mancala::MoveResult::last_index)
        .def_readonly("capture", &mancala::MoveResult::capture)
        .def_readonly("extra_turn", &mancala::MoveResult::extra_turn)
        .def("ok", &mancala::MoveResult::ok);

    py::class_<mancala::MancalaEngine>(m, "MancalaEngine")
        .def(py::init<>())
        .def("new_round", &mancala::MancalaEngine::new_round)
        .def("set_position", &mancala::MancalaEngine::set_position, py::arg("board"), py::arg("active_player"))
        .def_property_readonly("board", &mancala::MancalaEngine::board)
        .def_property_readonly("active_player", &mancala::MancalaEngine::active_player)
        .def_property_readonly("state", &mancala::MancalaEngine::state)
        .def("game_over", &mancala::MancalaEngine::game_over)
        .def("validate_move", &mancala::MancalaEngine::validate_move, py::arg("pit"), py::arg("player"))
        .def("distribute_seeds", &mancala::MancalaEngine::distribute_seeds, py::arg("pit"), py::arg("player"))
        .def("check_capture", &mancala::MancalaEngine::check_capture, py::arg("last_index"), py::arg("player"))
        .def("play_move", &mancala::MancalaEngine::play_move, py::arg("pit"))
        .def("score", &mancala::MancalaEngine::score, py::arg("player"))
        .def("winner", &mancala::MancalaEngine::winner)
        .def("set_board_observer", &mancala::MancalaEngine::set_board_observer, py::arg("observer"));

    m.def("pit_label", &mancala::pit_label, py::arg("pit"));
    m.def("parse_pit_label", &mancala::parse_pit_label, py::arg("label"));
    m.def("error_message", &mancala::error_message, py::arg("error"));
    m.def("render_frame",
          [](const mancala::Board& board, const std::array<std::string, 2>& names, int active_player,
             bool round_over) {
              return mancala::render_frame(mancala::BoardSnapshot{board, names, active_player, round_over});
          },
          py::arg("board"), py::arg("names"), py::arg("active_player"), py::arg("round_over") = false);
    m.def("winner_message", &mancala::winner_message, py::arg("names"), py::arg("score0"), py::arg("score1"));
}
