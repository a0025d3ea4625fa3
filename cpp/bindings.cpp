#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "game.hpp"
#include "game_defs.hpp"
#include "errors.hpp"
#include "utils.hpp"

namespace py = pybind11;

namespace {
py::object findFreeOrNone(const Game& game, int row, int col, Direction direction) {
    Coord out{0, 0};
    if (!game.find_free(Coord{row, col}, direction, out)) return py::none();
    return py::make_tuple(out.row, out.col);
}
}

PYBIND11_MODULE(_summing_engine, m) {
    m.doc() = "Pybind11 bindings for the C++ summing puzzle engine";

    m.attr("ROWS") = py::int_(ROWS);
    m.attr("COLS") = py::int_(COLS);
    m.attr("LOOKAHEAD") = py::int_(LOOKAHEAD);
    m.attr("NO_DIGIT") = py::int_(NO_DIGIT);

    py::register_exception<GameError>(m, "GameError");
    m.def("set_debug_logging", &setDebugLogging, "Turns the [..._DEBUG] trace lines on or off.",
          py::arg("enabled"));

    py::enum_<Adjacency>(m, "Adjacency")
        .value("ORTHOGONAL", Adjacency::Orthogonal)
        .value("MOORE", Adjacency::Moore);
    py::enum_<Origin>(m, "Origin")
        .value("FIXED", Origin::Fixed)
        .value("PLACED", Origin::Placed);
    py::enum_<TerminalKind>(m, "TerminalKind")
        .value("ONGOING", TerminalKind::Ongoing)
        .value("WON", TerminalKind::Won)
        .value("STUCK", TerminalKind::Stuck);
    py::enum_<Direction>(m, "Direction")
        .value("ANY", Direction::Any)
        .value("NORTH", Direction::North)
        .value("SOUTH", Direction::South)
        .value("EAST", Direction::East)
        .value("WEST", Direction::West);

    py::class_<Rules>(m, "Rules")
        .def(py::init<>())
        .def(py::init<Adjacency>(), py::arg("adjacency"))
        .def_readwrite("adjacency", &Rules::adjacency);

    py::class_<TerminalState>(m, "TerminalState")
        .def_readonly("kind", &TerminalState::kind)
        .def_readonly("placements", &TerminalState::placements)
        .def("is_over", &TerminalState::is_over);

    py::class_<PlacementResult>(m, "PlacementResult")
        .def_readonly("matched", &PlacementResult::matched)
        .def_property_readonly("cleared_tiles", [](const PlacementResult& r) -> py::list {
            py::list tiles;
            for (const Coord& c : r.cleared_tiles) tiles.append(py::make_tuple(c.row, c.col));
            return tiles;
        })
        .def_readonly("terminal", &PlacementResult::terminal);

    py::class_<DigitStream>(m, "DigitStream")
        .def(py::init<std::uint64_t>(), py::arg("seed"))
        .def("peek", &DigitStream::peek, "n-th upcoming digit (1-indexed).", py::arg("n"))
        .def("next", &DigitStream::next, "Consumes and returns the head digit.")
        .def("window", &DigitStream::window);

    py::class_<Board>(m, "Board")
        .def("value_at", &Board::valueAt, py::arg("row"), py::arg("col"))
        .def("free_tiles", [](const Board& b) -> py::list {
            py::list tiles;
            for (const Coord& c : b.freeTiles()) tiles.append(py::make_tuple(c.row, c.col));
            return tiles;
        })
        .def("is_terminal", &Board::isTerminal)
        .def("terminal_state", &Board::terminalState)
        .def("placements_made", &Board::placementsMade)
        .def("occupied_count", &Board::occupiedCount);

    py::class_<Game>(m, "Game")
        .def(py::init<>())
        .def(py::init<std::uint64_t, Rules>(), py::arg("seed"), py::arg("rules") = Rules())
        .def("reset", &Game::reset, "Starts a new round on a fresh random board.")
        .def("place_next", &Game::place_next, "Places the next digit from the stream on (row, col).",
             py::arg("row"), py::arg("col"))
        .def("get_nexts", &Game::get_nexts, "Returns the upcoming digits, head first.")
        .def("get_flat_state", &Game::get_flat_state,
             "Returns the board as a flat row-major list (NO_DIGIT for free tiles).")
        .def("load_flat_state", &Game::load_flat_state,
             "Starts a new round from a flat row-major list of starting values.",
             py::arg("flat_board_data"))
        .def("is_game_over", &Game::is_game_over, "Checks if the game is over.")
        .def("num_placed", &Game::num_placed, "Number of placements made this round.")
        .def("terminal_state", &Game::terminal_state)
        .def("find_free", &findFreeOrNone, "Next free tile from (row, col) in a direction, or None.",
             py::arg("row"), py::arg("col"), py::arg("direction") = Direction::Any)
        .def("board", &Game::board, py::return_value_policy::reference_internal)
        .def_property_readonly("seed", &Game::seed);
}
