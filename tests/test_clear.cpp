#include <doctest/doctest.h>

#include "board.hpp"
#include "clear.hpp"
#include "digit_stream.hpp"
#include "test_support.hpp"

#include <random>
#include <sstream>
#include <string>
#include <vector>

TEST_CASE("neighborsOf stays inside the board") {
    CHECK(neighborsOf(4, 4, Adjacency::Orthogonal).size() == 4u);
    CHECK(neighborsOf(4, 4, Adjacency::Moore).size() == 8u);

    CHECK(neighborsOf(0, 0, Adjacency::Orthogonal).size() == 2u);
    CHECK(neighborsOf(0, 0, Adjacency::Moore).size() == 3u);
    CHECK(neighborsOf(0, 4, Adjacency::Orthogonal).size() == 3u);
    CHECK(neighborsOf(ROWS - 1, 4, Adjacency::Moore).size() == 5u);

    std::vector<Coord> corner = neighborsOf(ROWS - 1, COLS - 1, Adjacency::Orthogonal);
    REQUIRE(corner.size() == 2u);
    CHECK(corner[0] == Coord{ROWS - 2, COLS - 1});
    CHECK(corner[1] == Coord{ROWS - 1, COLS - 2});
}

TEST_CASE("evaluatePlacement reports the neighbour sum without touching the board") {
    DigitStream stream(scriptedSource({1, 1, 1, 1}));
    Board board(gridWith({{2, 2, 6}, {2, 4, 7}, {1, 3, 9}}), stream);

    ClearPlan plan = evaluatePlacement(board, 2, 3, 1);
    CHECK(plan.neighbor_sum == 2); // 6 + 7 + 9 = 22
    CHECK_FALSE(plan.matched);
    CHECK(plan.to_clear.empty());

    ClearPlan hit = evaluatePlacement(board, 2, 3, 2);
    CHECK(hit.matched);
    REQUIRE(hit.to_clear.size() == 4u);
    CHECK(hit.to_clear[0] == Coord{1, 3});
    CHECK(hit.to_clear[3] == Coord{2, 4});

    CHECK(board.occupiedCount() == 3);
    CHECK(board.valueAt(2, 3) == NO_DIGIT);
}

TEST_CASE("printBoard shows digits, free tiles and the upcoming digits") {
    DigitStream stream(scriptedSource({1, 2, 3, 4}));
    Board board(gridWith({{0, 0, 7}}), stream);

    std::ostringstream out;
    printBoard(out, board);
    std::string text = out.str();

    CHECK(text.find(" 0  7 .") != std::string::npos);
    CHECK(text.find("next: 1 2 3 4") != std::string::npos);
    CHECK(text.find("placed: 0") != std::string::npos);
}

TEST_CASE("findFree scans row-major from the tile after the cursor") {
    DigitStream stream(1u);
    Board board(gridWith({{0, 1, 5}, {0, 2, 5}}), stream);

    Coord out{-1, -1};
    REQUIRE(board.findFree(Coord{0, 0}, Direction::Any, out));
    CHECK(out == Coord{0, 3});

    REQUIRE(board.findFree(Coord{ROWS - 1, COLS - 1}, Direction::Any, out));
    CHECK(out == Coord{0, 0});
}

TEST_CASE("findFree follows compass directions with wrap-around") {
    std::mt19937_64 rng(3u);
    DigitStream stream(3u);
    Board board(makeStartingGrid(rng), stream); // only the outer ring is free

    Coord out{-1, -1};
    REQUIRE(board.findFree(Coord{4, 4}, Direction::North, out));
    CHECK(out == Coord{0, 4});
    REQUIRE(board.findFree(Coord{4, 4}, Direction::South, out));
    CHECK(out == Coord{ROWS - 1, 4});
    REQUIRE(board.findFree(Coord{4, 4}, Direction::East, out));
    CHECK(out == Coord{4, COLS - 1});
    REQUIRE(board.findFree(Coord{4, 4}, Direction::West, out));
    CHECK(out == Coord{4, 0});

    // From the ring the scan wraps past the far edge.
    REQUIRE(board.findFree(Coord{0, 4}, Direction::North, out));
    CHECK(out == Coord{ROWS - 1, 4});
    REQUIRE(board.findFree(Coord{4, COLS - 1}, Direction::East, out));
    CHECK(out == Coord{4, 0});
    REQUIRE(board.findFree(Coord{0, 0}, Direction::West, out));
    CHECK(out == Coord{0, COLS - 1});
    REQUIRE(board.findFree(Coord{ROWS - 1, 0}, Direction::South, out));
    CHECK(out == Coord{0, 0});
}

TEST_CASE("findFree reports a full line or board") {
    Grid grid = makeEmptyGrid();
    for (int col = 0; col < COLS; ++col) grid[4 * COLS + col] = 1;
    DigitStream stream(8u);
    Board board(grid, stream);

    Coord out{-1, -1};
    CHECK_FALSE(board.findFree(Coord{4, 4}, Direction::East, out));
    CHECK_FALSE(board.findFree(Coord{4, 4}, Direction::West, out));
    CHECK(board.findFree(Coord{4, 4}, Direction::North, out));
    CHECK(out == Coord{3, 4});

    Grid full;
    full.fill(2);
    Board full_board(full, stream);
    CHECK_FALSE(full_board.findFree(Coord{0, 0}, Direction::Any, out));
    CHECK_THROWS_AS(full_board.findFree(Coord{ROWS, 0}, Direction::Any, out), GameError);
}
