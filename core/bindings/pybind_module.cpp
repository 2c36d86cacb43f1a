// PyBind11 bindings for the minelogic C++ core.
// Exposes the inference engine, board and game loop so a Python
// front end can drive or inspect an agent.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/operators.h>

#include "board/cell.hpp"
#include "board/grid.hpp"
#include "board/minefield.hpp"
#include "knowledge/constraint.hpp"
#include "knowledge/inference_engine.hpp"
#include "agent/game_state.hpp"
#include "agent/game_session.hpp"
#include "agent/self_play.hpp"

#include <sstream>

namespace py = pybind11;

PYBIND11_MODULE(minelogic_bindings, m) {
    m.doc() = "minelogic C++ Core Bindings";

    // ── Cell ──
    py::class_<minelogic::Cell>(m, "Cell")
        .def(py::init<>())
        .def(py::init<int, int>(), py::arg("row"), py::arg("col"))
        .def_readonly("row", &minelogic::Cell::row)
        .def_readonly("col", &minelogic::Cell::col)
        .def(py::self == py::self)
        .def(py::self != py::self)
        .def(py::self < py::self)
        .def("__hash__", [](const minelogic::Cell& c) { return minelogic::CellHash()(c); })
        .def("__repr__", &minelogic::Cell::toString);

    // ── GridSize ──
    py::class_<minelogic::GridSize>(m, "GridSize")
        .def(py::init<>())
        .def_readwrite("height", &minelogic::GridSize::height)
        .def_readwrite("width", &minelogic::GridSize::width)
        .def("contains", &minelogic::GridSize::contains)
        .def("cell_count", &minelogic::GridSize::cellCount)
        .def("neighbors", &minelogic::GridSize::neighbors)
        .def("all_cells", &minelogic::GridSize::allCells);

    // ── Constraint ──
    py::class_<minelogic::Constraint>(m, "Constraint")
        .def(py::init<std::set<minelogic::Cell>, int>(), py::arg("cells"), py::arg("count"))
        .def_property_readonly("cells", &minelogic::Constraint::cells)
        .def_property_readonly("count", &minelogic::Constraint::count)
        .def("known_mines", &minelogic::Constraint::knownMines)
        .def("known_safes", &minelogic::Constraint::knownSafes)
        .def("is_subset_of", &minelogic::Constraint::isSubsetOf)
        .def("difference", &minelogic::Constraint::difference)
        .def(py::self == py::self)
        .def("__repr__", &minelogic::Constraint::toString);

    // ── PropagationStats ──
    py::class_<minelogic::PropagationStats>(m, "PropagationStats")
        .def(py::init<>())
        .def_readwrite("passes", &minelogic::PropagationStats::passes)
        .def_readwrite("cells_marked_safe", &minelogic::PropagationStats::cells_marked_safe)
        .def_readwrite("cells_marked_mine", &minelogic::PropagationStats::cells_marked_mine)
        .def_readwrite("constraints_derived", &minelogic::PropagationStats::constraints_derived)
        .def("changed", &minelogic::PropagationStats::changed);

    // ── InferenceEngine ──
    py::class_<minelogic::InferenceEngine>(m, "InferenceEngine")
        .def(py::init<int, int, uint32_t>(),
             py::arg("height") = 8, py::arg("width") = 8, py::arg("seed") = 42)
        .def("mark_mine", &minelogic::InferenceEngine::markMine)
        .def("mark_safe", &minelogic::InferenceEngine::markSafe)
        .def("record_observation", &minelogic::InferenceEngine::recordObservation,
             py::arg("cell"), py::arg("adjacent_mines"))
        .def("add_constraint", &minelogic::InferenceEngine::addConstraint)
        .def("propagate", &minelogic::InferenceEngine::propagate)
        .def("choose_safe_move", &minelogic::InferenceEngine::chooseSafeMove)
        .def("choose_random_move", &minelogic::InferenceEngine::chooseRandomMove)
        .def_property_readonly("moves_made", &minelogic::InferenceEngine::movesMade)
        .def_property_readonly("known_safes", &minelogic::InferenceEngine::knownSafes)
        .def_property_readonly("known_mines", &minelogic::InferenceEngine::knownMines)
        .def_property_readonly("constraints", &minelogic::InferenceEngine::constraints)
        .def("neighbors", &minelogic::InferenceEngine::neighbors)
        .def_property_readonly("grid", &minelogic::InferenceEngine::grid)
        .def_property_readonly("height", &minelogic::InferenceEngine::height)
        .def_property_readonly("width", &minelogic::InferenceEngine::width);

    // ── Minefield ──
    py::class_<minelogic::Minefield>(m, "Minefield")
        .def(py::init<int, int, int, uint32_t>(),
             py::arg("height"), py::arg("width"), py::arg("mines"), py::arg("seed"))
        .def(py::init<int, int, const std::set<minelogic::Cell>&>(),
             py::arg("height"), py::arg("width"), py::arg("mines"))
        .def("is_mine", &minelogic::Minefield::isMine)
        .def("nearby_mines", &minelogic::Minefield::nearbyMines)
        .def("won", &minelogic::Minefield::won)
        .def_property_readonly("mines", &minelogic::Minefield::mines)
        .def_property_readonly("grid", &minelogic::Minefield::grid)
        .def_property_readonly("height", &minelogic::Minefield::height)
        .def_property_readonly("width", &minelogic::Minefield::width)
        .def("render", [](const minelogic::Minefield& self) {
            std::ostringstream oss;
            self.render(oss);
            return oss.str();
        });

    // ── GameConfig ──
    py::class_<minelogic::GameConfig>(m, "GameConfig")
        .def(py::init<>())
        .def_readwrite("height", &minelogic::GameConfig::height)
        .def_readwrite("width", &minelogic::GameConfig::width)
        .def_readwrite("mines", &minelogic::GameConfig::mines)
        .def_readwrite("seed", &minelogic::GameConfig::seed)
        .def_readwrite("max_moves", &minelogic::GameConfig::max_moves)
        .def("validate", &minelogic::GameConfig::validate);

    py::enum_<minelogic::GameOutcome>(m, "GameOutcome")
        .value("IN_PROGRESS", minelogic::GameOutcome::InProgress)
        .value("WON", minelogic::GameOutcome::Won)
        .value("LOST", minelogic::GameOutcome::Lost)
        .value("EXHAUSTED", minelogic::GameOutcome::Exhausted);

    // ── MoveRecord ──
    py::class_<minelogic::MoveRecord>(m, "MoveRecord")
        .def(py::init<>())
        .def_readwrite("cell", &minelogic::MoveRecord::cell)
        .def_readwrite("inferred", &minelogic::MoveRecord::inferred)
        .def_readwrite("hit_mine", &minelogic::MoveRecord::hit_mine)
        .def_readwrite("adjacent_mines", &minelogic::MoveRecord::adjacent_mines)
        .def_readwrite("stats", &minelogic::MoveRecord::stats);

    // ── GameResult ──
    py::class_<minelogic::GameResult>(m, "GameResult")
        .def(py::init<>())
        .def_readwrite("outcome", &minelogic::GameResult::outcome)
        .def_readwrite("moves", &minelogic::GameResult::moves)
        .def_readwrite("guesses", &minelogic::GameResult::guesses)
        .def_readwrite("inferred_moves", &minelogic::GameResult::inferred_moves)
        .def_readwrite("mines_found", &minelogic::GameResult::mines_found)
        .def_readwrite("mines_total", &minelogic::GameResult::mines_total);

    // ── GameSession ──
    py::class_<minelogic::GameSession>(m, "GameSession")
        .def(py::init<const minelogic::GameConfig&>())
        .def(py::init<minelogic::Minefield, uint32_t, int>(),
             py::arg("field"), py::arg("seed") = 42, py::arg("max_moves") = 0)
        .def("step", &minelogic::GameSession::step)
        .def("play", &minelogic::GameSession::play)
        .def("result", &minelogic::GameSession::result)
        .def_property_readonly("outcome", &minelogic::GameSession::outcome)
        .def_property_readonly("history", &minelogic::GameSession::history)
        .def_property_readonly("engine", &minelogic::GameSession::engine,
                               py::return_value_policy::reference_internal)
        .def_property_readonly("minefield", &minelogic::GameSession::minefield,
                               py::return_value_policy::reference_internal);

    // ── SelfPlaySummary ──
    py::class_<minelogic::SelfPlaySummary>(m, "SelfPlaySummary")
        .def(py::init<>())
        .def_readwrite("games", &minelogic::SelfPlaySummary::games)
        .def_readwrite("wins", &minelogic::SelfPlaySummary::wins)
        .def_readwrite("losses", &minelogic::SelfPlaySummary::losses)
        .def_readwrite("exhausted", &minelogic::SelfPlaySummary::exhausted)
        .def_readwrite("guesses", &minelogic::SelfPlaySummary::guesses)
        .def_readwrite("inferred_moves", &minelogic::SelfPlaySummary::inferred_moves)
        .def("win_rate", &minelogic::SelfPlaySummary::winRate)
        .def("inference_rate", &minelogic::SelfPlaySummary::inferenceRate);

    m.def("default_game_config", []() {
        return minelogic::GameConfig{};
    });

    m.def("run_self_play", &minelogic::runSelfPlay,
          py::arg("config"), py::arg("games"));
}
